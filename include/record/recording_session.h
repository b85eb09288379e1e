#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

#include "core/frame.h"
#include "core/motion_event.h"
#include "record/footage_writer.h"

namespace record {

    enum class SessionState {
        IDLE,
        RECORDING
    };

    const char* to_string(SessionState state);

    struct SessionInfo {
        long long start_ms = 0;       // steady time of the triggering event
        long long start_wall_ms = 0;
        long long deadline_ms = 0;    // Recording ends at the first quiet tick at/after this
        long long end_ms = 0;
        DestinationHandle handle = kInvalidDestination;
        int frames_written = 0;
        std::uint64_t last_seq = 0;   // last frame sequence written
        bool aborted = false;         // ended by a write failure
    };

// RecordingSessionManager: Idle/Recording state machine driven by MotionEvents.
//
//   IDLE      + detected               -> open destination, write frame, RECORDING
//   RECORDING + detected               -> deadline = now + window
//   RECORDING + !detected, now < dl    -> stay (grace period)
//   RECORDING + !detected, now >= dl   -> close destination, IDLE
//
// Any open/write failure (WriteFailed) closes the destination and returns to
// IDLE; it is counted and logged, never propagated.
    class RecordingSessionManager {
    public:
        struct Config {
            long long window_ms = 15000;
            bool verbose = true;
        };

        using Listener = std::function<void(const SessionInfo&)>;

        RecordingSessionManager(FootageWriter& writer, const Config& cfg);
        ~RecordingSessionManager();

        RecordingSessionManager(const RecordingSessionManager&) = delete;
        RecordingSessionManager& operator=(const RecordingSessionManager&) = delete;

        // `frame` is the frame the event was computed from, `seq` its FrameSlot sequence.
        void on_motion_event(const core::MotionEvent& event, const core::Frame& frame, std::uint64_t seq);

        // Frame sampled between ticks; written only while RECORDING, once per seq.
        void forward_frame(const core::Frame& frame, std::uint64_t seq);

        // Closes any open destination, whatever the state.
        void shutdown(long long now_ms = 0);

        SessionState state() const { return state_; }
        bool recording() const { return state_ == SessionState::RECORDING; }
        const SessionInfo& session() const { return session_; }

        int sessions_started() const { return sessions_started_; }
        int write_failures() const { return write_failures_; }

        void set_on_session_started(Listener cb) { on_started_ = std::move(cb); }
        void set_on_session_ended(Listener cb) { on_ended_ = std::move(cb); }

    private:
        bool open_session(const core::Frame& frame, long long now_ms);
        void close_session(long long now_ms, const char* why);
        void abort_session(long long now_ms, const std::string& err);
        bool write(const core::Frame& frame, std::uint64_t seq);

        FootageWriter& writer_;
        Config cfg_;

        SessionState state_ = SessionState::IDLE;
        SessionInfo session_;

        int sessions_started_ = 0;
        int write_failures_ = 0;

        Listener on_started_;
        Listener on_ended_;
    };

} // namespace record
