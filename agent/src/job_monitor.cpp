#include "fleetsync/agent/job_monitor.hpp"

#include <spdlog/spdlog.h>

namespace fleetsync::agent
{

    JobMonitor::JobMonitor(Scheduler &scheduler, SyncEngine &engine, ProgressTracker &progress,
                           AutoResyncMonitor &resync, MessageSink &sink, std::string agent_id,
                           MonitoringSettings settings)
        : scheduler_(scheduler),
          engine_(engine),
          progress_(progress),
          resync_(resync),
          sink_(sink),
          agent_id_(std::move(agent_id)),
          settings_(settings) {}

    std::string JobMonitor::stats_key(const std::string &job_id)
    {
        return "stats:" + job_id;
    }

    std::string JobMonitor::resync_key(const std::string &job_id)
    {
        return "resync:" + job_id;
    }

    void JobMonitor::start(const std::string &job_id)
    {
        {
            std::lock_guard lock(mutex_);
            active_jobs_.insert(job_id);
        }

        scheduler_.schedule_periodic(stats_key(job_id), settings_.stats_interval, [this, job_id]
                                     { emit_stats(job_id); });

        if (settings_.auto_resync_enabled && !scheduler_.contains(resync_key(job_id)))
        {
            scheduler_.schedule_periodic(resync_key(job_id), settings_.auto_resync_interval, [this, job_id]
                                         { resync_.check(job_id); });
            spdlog::info("Started auto-resync monitoring for job {} every {}s", job_id,
                         std::chrono::duration_cast<std::chrono::seconds>(settings_.auto_resync_interval).count());
        }
        spdlog::debug("Started periodic stats for job {}", job_id);
    }

    void JobMonitor::pause_stats(const std::string &job_id)
    {
        {
            std::lock_guard lock(mutex_);
            active_jobs_.erase(job_id);
        }
        scheduler_.cancel(stats_key(job_id));
        spdlog::debug("Stopped periodic stats for job {}{}", job_id,
                      scheduler_.contains(resync_key(job_id)) ? ", auto-resync stays active" : "");
    }

    void JobMonitor::stop(const std::string &job_id)
    {
        {
            std::lock_guard lock(mutex_);
            active_jobs_.erase(job_id);
        }
        scheduler_.cancel(stats_key(job_id));
        if (scheduler_.cancel(resync_key(job_id)))
        {
            spdlog::info("Stopped auto-resync monitoring for job {}", job_id);
        }
    }

    bool JobMonitor::emit_stats(const std::string &job_id)
    {
        if (!stats_active(job_id))
        {
            return false;
        }
        const auto folder_id = protocol::job_folder_id(job_id);
        protocol::FolderStatus status;
        try
        {
            status = engine_.folder_status(folder_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Failed to read periodic stats for job {}: {}", job_id, ex.what());
            return false;
        }

        sink_.send(protocol::FolderStatsPeriodic{
            .job_id = job_id,
            .folder_id = folder_id,
            .agent_id = agent_id_,
            .stats = status,
            .progress = progress_.get(folder_id),
        });
        spdlog::debug("Sent periodic stats for job {}: {} files, {} bytes, state {}", job_id, status.global_files,
                      status.global_bytes, status.state);
        return true;
    }

    void JobMonitor::log_final_stats(const std::string &job_id)
    {
        const auto folder_id = protocol::job_folder_id(job_id);
        try
        {
            const auto status = engine_.folder_status(folder_id);
            spdlog::info("Final stats for job {}: global={} local={} state={}", job_id, status.global_files,
                         status.local_files, status.state);
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Failed to read final stats for job {}: {}", job_id, ex.what());
        }
    }

    bool JobMonitor::stats_active(const std::string &job_id) const
    {
        std::lock_guard lock(mutex_);
        return active_jobs_.count(job_id) > 0;
    }

    bool JobMonitor::resync_active(const std::string &job_id) const
    {
        return scheduler_.contains(resync_key(job_id));
    }

} // namespace fleetsync::agent
