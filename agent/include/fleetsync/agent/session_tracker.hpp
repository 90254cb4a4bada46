/**
 * fleetsync - Per-job sync session statistics.
 *
 * A session opens on the first scanning/syncing transition of a job folder and
 * completes on idle. Scan and transfer windows are opened and closed by the
 * state transitions in between; each edge emits a session_event.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "fleetsync/agent/message_sink.hpp"
#include "fleetsync/protocol.hpp"

namespace fleetsync::agent
{

    class SessionTracker
    {
    public:
        using Clock = std::function<std::chrono::system_clock::time_point()>;

        SessionTracker(MessageSink &sink, std::string agent_id, Clock clock = {});

        // Opens a session for job_id. A session that is already active is updated to
        // state instead.
        protocol::SyncSessionStats start_session(const std::string &job_id, const std::string &state);

        // Applies a state transition; starts a session when none is active.
        void update_session(const std::string &job_id, const std::string &state);

        // Closes open windows, computes totals and emits session_completed. Returns false
        // when no session was active.
        bool finalize_session(const std::string &job_id);

        bool record_file_transfer(const std::string &job_id, std::int64_t delta_bytes, std::int64_t full_size,
                                  double transfer_rate);

        std::optional<protocol::SyncSessionStats> active_session(const std::string &job_id) const;
        std::size_t active_count() const;

    private:
        std::chrono::system_clock::time_point now() const;
        std::string generate_session_id(const std::string &job_id, std::chrono::system_clock::time_point time);
        void emit(protocol::SessionEventType type, const protocol::SyncSessionStats &session);

        MessageSink &sink_;
        std::string agent_id_;
        Clock clock_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, protocol::SyncSessionStats> sessions_;
        std::uint32_t sequence_{};
    };

} // namespace fleetsync::agent
