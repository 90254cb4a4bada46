#include "fleetsync/agent/progress_tracker.hpp"

#include <algorithm>
#include <chrono>

#include <spdlog/spdlog.h>

namespace fleetsync::agent
{

    namespace
    {

        double clamp_percent(double value)
        {
            return std::clamp(value, 0.0, 100.0);
        }

    } // namespace

    void ProgressTracker::update_folder_progress(const std::string &folder_id, const std::string &state,
                                                 double scan_progress, double pull_progress)
    {
        protocol::ProgressSnapshot snapshot{
            .folder_id = folder_id,
            .state = state,
            .scan_progress = clamp_percent(scan_progress),
            .pull_progress = clamp_percent(pull_progress),
            .last_updated = std::chrono::system_clock::now(),
        };
        {
            std::lock_guard lock(mutex_);
            progress_[folder_id] = snapshot;
        }
        spdlog::debug("Progress for {}: state={} scan={:.1f}% pull={:.1f}%", folder_id, state,
                      snapshot.scan_progress, snapshot.pull_progress);
    }

    void ProgressTracker::apply_state_change(const std::string &folder_id, const std::string &state)
    {
        const auto phase = protocol::sync_phase_from_string(state);
        if (phase == protocol::SyncPhase::Idle)
        {
            update_folder_progress(folder_id, state, 100.0, 100.0);
        }
        else
        {
            update_folder_progress(folder_id, state, 0.0, 0.0);
        }
    }

    void ProgressTracker::update_scan_progress(const std::string &folder_id, double scan_progress)
    {
        std::lock_guard lock(mutex_);
        auto &entry = progress_[folder_id];
        entry.folder_id = folder_id;
        if (entry.state.empty())
        {
            entry.state = std::string(protocol::to_string(protocol::SyncPhase::Scanning));
        }
        entry.scan_progress = clamp_percent(scan_progress);
        entry.last_updated = std::chrono::system_clock::now();
    }

    void ProgressTracker::update_pull_progress(const std::string &folder_id, double pull_progress)
    {
        std::lock_guard lock(mutex_);
        auto &entry = progress_[folder_id];
        entry.folder_id = folder_id;
        if (entry.state.empty())
        {
            entry.state = std::string(protocol::to_string(protocol::SyncPhase::Syncing));
        }
        entry.pull_progress = clamp_percent(pull_progress);
        entry.last_updated = std::chrono::system_clock::now();
    }

    std::optional<protocol::ProgressSnapshot> ProgressTracker::get(const std::string &folder_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = progress_.find(folder_id);
        if (it == progress_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<protocol::ProgressSnapshot> ProgressTracker::snapshot() const
    {
        std::lock_guard lock(mutex_);
        std::vector<protocol::ProgressSnapshot> result;
        result.reserve(progress_.size());
        for (const auto &[folder_id, progress] : progress_)
        {
            result.push_back(progress);
        }
        return result;
    }

} // namespace fleetsync::agent
