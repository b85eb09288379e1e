#pragma once
#include <cstdint>
#include <memory>
#include <mutex>

#include "core/frame.h"

namespace core {

// FrameSlot: "latest wins" handoff between the capture thread and the
// detection thread. No queue: publish() replaces the previous frame, readers
// may skip frames. Both sides hold the lock only for a pointer swap/copy.
    class FrameSlot {
    public:
        FrameSlot() = default;

        FrameSlot(const FrameSlot&) = delete;
        FrameSlot& operator=(const FrameSlot&) = delete;

        void publish(Frame&& frame);

        // false while nothing has been published yet.
        bool latest(std::shared_ptr<const Frame>& out, std::uint64_t& seq) const;

        // 0 = empty.
        std::uint64_t sequence() const;

    private:
        mutable std::mutex m_;
        std::shared_ptr<const Frame> last_;
        std::uint64_t seq_ = 0;
    };

} // namespace core
