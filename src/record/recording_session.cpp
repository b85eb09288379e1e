#include "record/recording_session.h"

#include <algorithm>
#include <iostream>

namespace record {

    const char* to_string(SessionState state) {
        return state == SessionState::RECORDING ? "RECORDING" : "IDLE";
    }

    RecordingSessionManager::RecordingSessionManager(FootageWriter& writer, const Config& cfg)
            : writer_(writer), cfg_(cfg) {
        cfg_.window_ms = std::max(1LL, cfg_.window_ms);
        if (cfg_.verbose) {
            std::cout << "[SESSION] config: window_ms=" << cfg_.window_ms << std::endl;
        }
    }

    RecordingSessionManager::~RecordingSessionManager() {
        shutdown();
    }

    void RecordingSessionManager::on_motion_event(const core::MotionEvent& event,
                                                  const core::Frame& frame,
                                                  std::uint64_t seq) {
        const long long now_ms = event.ts_ms;

        if (state_ == SessionState::IDLE) {
            if (!event.detected) return;

            if (!open_session(frame, now_ms)) return;
            write(frame, seq);
            return;
        }

        // RECORDING: every sampled frame goes to the destination.
        if (!write(frame, seq)) return;

        if (event.detected) {
            session_.deadline_ms = now_ms + cfg_.window_ms;
            return;
        }

        if (now_ms >= session_.deadline_ms) {
            close_session(now_ms, "no motion for the recording window");
        }
    }

    void RecordingSessionManager::forward_frame(const core::Frame& frame, std::uint64_t seq) {
        if (state_ != SessionState::RECORDING) return;
        write(frame, seq);
    }

    void RecordingSessionManager::shutdown(long long now_ms) {
        if (state_ != SessionState::RECORDING) return;
        close_session(now_ms, "shutdown");
    }

    bool RecordingSessionManager::open_session(const core::Frame& frame, long long now_ms) {
        DestinationHandle handle = kInvalidDestination;
        std::string err;
        if (!writer_.open_destination(frame.wall_ms, handle, err)) {
            ++write_failures_;
            std::cerr << "[SESSION] WriteFailed: cannot open destination: " << err << std::endl;
            return false;
        }

        session_ = SessionInfo{};
        session_.start_ms = now_ms;
        session_.start_wall_ms = frame.wall_ms;
        session_.deadline_ms = now_ms + cfg_.window_ms;
        session_.handle = handle;
        state_ = SessionState::RECORDING;
        ++sessions_started_;

        if (cfg_.verbose) {
            std::cout << "[SESSION] IDLE -> RECORDING, destination " << handle
                      << ", deadline in " << cfg_.window_ms << " ms" << std::endl;
        }
        if (on_started_) on_started_(session_);
        return true;
    }

    void RecordingSessionManager::close_session(long long now_ms, const char* why) {
        writer_.close(session_.handle);
        session_.end_ms = now_ms;
        state_ = SessionState::IDLE;

        if (cfg_.verbose) {
            std::cout << "[SESSION] RECORDING -> IDLE (" << why << "), "
                      << session_.frames_written << " frames written" << std::endl;
        }
        if (on_ended_) on_ended_(session_);
        session_.handle = kInvalidDestination;
    }

    void RecordingSessionManager::abort_session(long long now_ms, const std::string& err) {
        ++write_failures_;
        std::cerr << "[SESSION] WriteFailed: " << err << std::endl;
        session_.aborted = true;
        close_session(now_ms, "write failed");
    }

    bool RecordingSessionManager::write(const core::Frame& frame, std::uint64_t seq) {
        if (seq != 0 && seq == session_.last_seq) {
            return true; // already written
        }

        std::string err;
        if (!writer_.write_frame(session_.handle, frame, err)) {
            abort_session(frame.ts_ms, err);
            return false;
        }
        session_.last_seq = seq;
        ++session_.frames_written;
        return true;
    }

} // namespace record
