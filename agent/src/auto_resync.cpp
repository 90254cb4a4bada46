#include "fleetsync/agent/auto_resync.hpp"

#include <array>
#include <chrono>
#include <functional>
#include <utility>

#include <spdlog/spdlog.h>

namespace fleetsync::agent
{

    std::optional<Drift> detect_drift(const protocol::FolderStatus &status)
    {
        if (status.need_files > 0 && status.need_bytes > 0)
        {
            return Drift{.missing_files = status.need_files, .missing_bytes = status.need_bytes, .inferred = false};
        }
        // Receive-only folders report no need after local deletions; the file count gap shows it.
        if (status.local_files < status.global_files)
        {
            return Drift{.missing_files = status.global_files - status.local_files, .missing_bytes = 0, .inferred = true};
        }
        return std::nullopt;
    }

    AutoResyncMonitor::AutoResyncMonitor(SyncEngine &engine, MessageSink &sink)
        : engine_(engine), sink_(sink) {}

    ResyncOutcome AutoResyncMonitor::check(const std::string &job_id)
    {
        const auto folder_id = protocol::job_folder_id(job_id);
        protocol::FolderStatus status;
        try
        {
            status = engine_.folder_status(folder_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Auto-resync: cannot read status of {}: {}", folder_id, ex.what());
            return {};
        }

        spdlog::debug("Auto-resync check for job {}: global={} local={} need={} state={}", job_id,
                      status.global_files, status.local_files, status.need_files, status.state);

        const auto drift = detect_drift(status);
        if (!drift)
        {
            spdlog::debug("Job {} is in sync", job_id);
            return {};
        }

        spdlog::warn("Detected {} missing files ({} bytes) in job {}{}", drift->missing_files, drift->missing_bytes,
                     job_id, drift->inferred ? " from local/global file counts" : "");
        return repair(job_id, folder_id, *drift);
    }

    ResyncOutcome AutoResyncMonitor::repair(const std::string &job_id, const std::string &folder_id,
                                            const Drift &drift)
    {
        using protocol::RepairAction;

        const std::array<std::pair<RepairAction, std::function<void()>>, 3> steps{{
            {RepairAction::Revert, [&]
             { engine_.revert_folder(folder_id); }},
            {RepairAction::Override, [&]
             { engine_.override_folder(folder_id); }},
            {RepairAction::ResetDatabase, [&]
             { engine_.reset_folder_database(folder_id); }},
        }};

        ResyncOutcome outcome{.drift = drift};
        for (const auto &[action, run] : steps)
        {
            outcome.action = action;
            try
            {
                run();
                outcome.success = true;
                spdlog::info("Auto-resync of {} succeeded with {}", folder_id, protocol::to_string(action));
                break;
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Auto-resync {} of {} failed: {}", protocol::to_string(action), folder_id, ex.what());
            }
        }
        if (!outcome.success)
        {
            spdlog::error("All repair actions failed for {}, leaving job {} for operator follow-up", folder_id, job_id);
        }

        sink_.send(protocol::AutomaticResyncTriggered{
            .job_id = job_id,
            .folder_id = folder_id,
            .missing_files = drift.missing_files,
            .missing_bytes = drift.missing_bytes,
            .repair_action = outcome.action,
            .success = outcome.success,
            .timestamp = std::chrono::system_clock::now(),
        });
        return outcome;
    }

} // namespace fleetsync::agent
