#include "core/frame_slot.h"

#include <utility>

namespace core {

    void FrameSlot::publish(Frame&& frame) {
        // Allocation happens outside the lock.
        std::shared_ptr<const Frame> next = std::make_shared<const Frame>(std::move(frame));
        {
            std::lock_guard<std::mutex> lk(m_);
            last_.swap(next);
            ++seq_;
        }
        // `next` now holds the superseded frame; it is released here unless a
        // reader still holds it.
    }

    bool FrameSlot::latest(std::shared_ptr<const Frame>& out, std::uint64_t& seq) const {
        std::lock_guard<std::mutex> lk(m_);
        if (!last_) {
            return false;
        }
        out = last_;
        seq = seq_;
        return true;
    }

    std::uint64_t FrameSlot::sequence() const {
        std::lock_guard<std::mutex> lk(m_);
        return seq_;
    }

} // namespace core
