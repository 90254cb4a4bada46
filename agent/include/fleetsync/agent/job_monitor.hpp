#pragma once

#include <mutex>
#include <set>
#include <string>

#include "fleetsync/agent/auto_resync.hpp"
#include "fleetsync/agent/config.hpp"
#include "fleetsync/agent/message_sink.hpp"
#include "fleetsync/agent/progress_tracker.hpp"
#include "fleetsync/agent/scheduler.hpp"
#include "fleetsync/agent/sync_engine.hpp"

namespace fleetsync::agent
{

    // Per-job periodic work: folder stats while the job syncs and the auto-resync
    // check for as long as the job exists.
    class JobMonitor
    {
    public:
        JobMonitor(Scheduler &scheduler, SyncEngine &engine, ProgressTracker &progress, AutoResyncMonitor &resync,
                   MessageSink &sink, std::string agent_id, MonitoringSettings settings);

        void start(const std::string &job_id);
        void pause_stats(const std::string &job_id);
        void stop(const std::string &job_id);

        // Sends one folder_stats_periodic. Returns false when the status could not be read.
        bool emit_stats(const std::string &job_id);
        void log_final_stats(const std::string &job_id);

        bool stats_active(const std::string &job_id) const;
        bool resync_active(const std::string &job_id) const;

        static std::string stats_key(const std::string &job_id);
        static std::string resync_key(const std::string &job_id);

    private:
        Scheduler &scheduler_;
        SyncEngine &engine_;
        ProgressTracker &progress_;
        AutoResyncMonitor &resync_;
        MessageSink &sink_;
        std::string agent_id_;
        MonitoringSettings settings_;

        mutable std::mutex mutex_;
        std::set<std::string> active_jobs_;
    };

} // namespace fleetsync::agent
