#include "fleetsync/agent/session_tracker.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace fleetsync::agent
{

    namespace
    {

        using protocol::SessionEventType;
        using protocol::SyncPhase;
        using TimePoint = std::chrono::system_clock::time_point;

        double seconds_between(TimePoint from, TimePoint to)
        {
            return std::chrono::duration<double>(to - from).count();
        }

        using PendingEvents = std::vector<std::pair<SessionEventType, protocol::SyncSessionStats>>;

        // Applies one transition to an open session and collects the events it causes.
        void apply_transition(protocol::SyncSessionStats &session, const std::string &state, TimePoint now,
                              PendingEvents &events)
        {
            const auto previous = session.current_state;
            session.current_state = state;
            session.updated_at = now;

            const auto phase = protocol::sync_phase_from_string(state);
            if (phase == SyncPhase::Scanning)
            {
                if (!session.scan_start)
                {
                    session.scan_start = now;
                    events.emplace_back(SessionEventType::ScanStarted, session);
                }
            }
            else if (phase == SyncPhase::Syncing)
            {
                if (session.scan_start && !session.scan_end)
                {
                    session.scan_end = now;
                    session.scan_duration_seconds = seconds_between(*session.scan_start, now);
                    events.emplace_back(SessionEventType::ScanCompleted, session);
                }
                if (!session.transfer_start)
                {
                    session.transfer_start = now;
                    events.emplace_back(SessionEventType::TransferStarted, session);
                }
            }
            spdlog::debug("Session {} for job {}: {} -> {}", session.session_id, session.job_id, previous, state);
        }

    } // namespace

    SessionTracker::SessionTracker(MessageSink &sink, std::string agent_id, Clock clock)
        : sink_(sink), agent_id_(std::move(agent_id)), clock_(std::move(clock)) {}

    protocol::SyncSessionStats SessionTracker::start_session(const std::string &job_id, const std::string &state)
    {
        PendingEvents events;
        protocol::SyncSessionStats result;
        {
            std::lock_guard lock(mutex_);
            const auto time = now();
            auto it = sessions_.find(job_id);
            if (it != sessions_.end())
            {
                spdlog::warn("Session already active for job {}, updating state to {}", job_id, state);
                apply_transition(it->second, state, time, events);
                result = it->second;
            }
            else
            {
                protocol::SyncSessionStats session{
                    .session_id = generate_session_id(job_id, time),
                    .job_id = job_id,
                    .agent_id = agent_id_,
                    .current_state = state,
                    .session_start = time,
                    .updated_at = time,
                };
                if (protocol::sync_phase_from_string(state) == SyncPhase::Scanning)
                {
                    session.scan_start = time;
                }
                else if (protocol::sync_phase_from_string(state) == SyncPhase::Syncing)
                {
                    session.transfer_start = time;
                }
                events.emplace_back(SessionEventType::SessionStarted, session);
                spdlog::info("Started sync session {} for job {} ({})", session.session_id, job_id, state);
                result = session;
                sessions_.emplace(job_id, std::move(session));
            }
        }
        for (const auto &[type, session] : events)
        {
            emit(type, session);
        }
        return result;
    }

    void SessionTracker::update_session(const std::string &job_id, const std::string &state)
    {
        PendingEvents events;
        bool found = false;
        {
            std::lock_guard lock(mutex_);
            auto it = sessions_.find(job_id);
            if (it != sessions_.end())
            {
                found = true;
                apply_transition(it->second, state, now(), events);
            }
        }
        if (!found)
        {
            spdlog::debug("No active session for job {}, starting one", job_id);
            start_session(job_id, state);
            return;
        }
        for (const auto &[type, session] : events)
        {
            emit(type, session);
        }
    }

    bool SessionTracker::finalize_session(const std::string &job_id)
    {
        protocol::SyncSessionStats session;
        {
            std::lock_guard lock(mutex_);
            auto it = sessions_.find(job_id);
            if (it == sessions_.end())
            {
                spdlog::debug("No active session to finalize for job {}", job_id);
                return false;
            }
            session = std::move(it->second);
            sessions_.erase(it);
        }

        const auto time = now();
        session.session_end = time;
        session.status = "completed";
        session.current_state = std::string(protocol::to_string(SyncPhase::Idle));
        session.updated_at = time;
        session.total_duration_seconds = seconds_between(session.session_start, time);

        if (session.scan_start && !session.scan_end)
        {
            session.scan_end = time;
            session.scan_duration_seconds = seconds_between(*session.scan_start, time);
        }
        if (session.transfer_start && !session.transfer_end)
        {
            session.transfer_end = time;
            session.transfer_duration_seconds = seconds_between(*session.transfer_start, time);
        }
        if (session.transfer_duration_seconds > 0 && session.total_delta_bytes > 0)
        {
            session.average_transfer_rate =
                static_cast<double>(session.total_delta_bytes) / session.transfer_duration_seconds;
        }
        if (session.total_full_size > 0)
        {
            session.compression_ratio =
                static_cast<double>(session.total_delta_bytes) / static_cast<double>(session.total_full_size);
        }

        spdlog::info("Completed sync session {}: files={} delta_bytes={} full_size={} ratio={:.2f}% duration={:.1f}s",
                     session.session_id, session.files_transferred, session.total_delta_bytes,
                     session.total_full_size, session.compression_ratio * 100.0, session.total_duration_seconds);
        emit(SessionEventType::SessionCompleted, session);
        return true;
    }

    bool SessionTracker::record_file_transfer(const std::string &job_id, std::int64_t delta_bytes,
                                              std::int64_t full_size, double transfer_rate)
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(job_id);
        if (it == sessions_.end())
        {
            spdlog::debug("No active session for job {} to record a file transfer", job_id);
            return false;
        }
        auto &session = it->second;
        ++session.files_transferred;
        session.total_delta_bytes += delta_bytes;
        session.total_full_size += full_size;
        if (transfer_rate > session.peak_transfer_rate)
        {
            session.peak_transfer_rate = transfer_rate;
        }
        if (session.total_full_size > 0)
        {
            session.compression_ratio =
                static_cast<double>(session.total_delta_bytes) / static_cast<double>(session.total_full_size);
        }
        session.updated_at = now();
        return true;
    }

    std::optional<protocol::SyncSessionStats> SessionTracker::active_session(const std::string &job_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(job_id);
        if (it == sessions_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t SessionTracker::active_count() const
    {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

    std::chrono::system_clock::time_point SessionTracker::now() const
    {
        return clock_ ? clock_() : std::chrono::system_clock::now();
    }

    std::string SessionTracker::generate_session_id(const std::string &job_id,
                                                    std::chrono::system_clock::time_point time)
    {
        const auto seconds = std::chrono::system_clock::to_time_t(time);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        std::ostringstream out;
        out << job_id << "-session-" << std::put_time(&utc, "%Y%m%d-%H%M%S") << '-' << std::setw(4)
            << std::setfill('0') << (sequence_++ % 10000);
        return out.str();
    }

    void SessionTracker::emit(protocol::SessionEventType type, const protocol::SyncSessionStats &session)
    {
        sink_.send(protocol::SessionEvent{.type = type, .session = session});
    }

} // namespace fleetsync::agent
