#pragma once

#include <atomic>
#include <string>

#include "fleetsync/agent/job_monitor.hpp"
#include "fleetsync/agent/message_sink.hpp"
#include "fleetsync/agent/progress_tracker.hpp"
#include "fleetsync/agent/session_tracker.hpp"
#include "fleetsync/agent/sync_engine.hpp"

namespace fleetsync::agent
{

    // Forwards engine events to the coordinator and drives progress, sessions and
    // the per-job monitors from them.
    class EventProcessor
    {
    public:
        EventProcessor(MessageSink &sink, ProgressTracker &progress, SessionTracker &sessions, JobMonitor &jobs,
                       std::string agent_id);

        void process(const EngineEvent &event);

        void set_event_debug(bool enabled) noexcept { event_debug_.store(enabled); }
        bool event_debug() const noexcept { return event_debug_.load(); }

    private:
        void on_state_changed(const nlohmann::json &data);
        void on_scan_progress(const nlohmann::json &data);
        void on_transfer_progress(const nlohmann::json &data);
        void on_transfer_completed(const nlohmann::json &data);

        MessageSink &sink_;
        ProgressTracker &progress_;
        SessionTracker &sessions_;
        JobMonitor &jobs_;
        std::string agent_id_;
        std::atomic<bool> event_debug_{false};
    };

} // namespace fleetsync::agent
