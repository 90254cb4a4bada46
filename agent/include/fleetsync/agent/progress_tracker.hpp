#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "fleetsync/protocol.hpp"

namespace fleetsync::agent
{

    // Latest scan/pull progress per folder. Snapshots are overwritten, never removed.
    class ProgressTracker
    {
    public:
        void update_folder_progress(const std::string &folder_id, const std::string &state, double scan_progress,
                                    double pull_progress);

        // Resets the percentages the way a state transition implies: entering scanning
        // restarts the scan, idle means both phases are complete.
        void apply_state_change(const std::string &folder_id, const std::string &state);

        void update_scan_progress(const std::string &folder_id, double scan_progress);
        void update_pull_progress(const std::string &folder_id, double pull_progress);

        std::optional<protocol::ProgressSnapshot> get(const std::string &folder_id) const;
        std::vector<protocol::ProgressSnapshot> snapshot() const;

    private:
        mutable std::mutex mutex_;
        std::unordered_map<std::string, protocol::ProgressSnapshot> progress_;
    };

} // namespace fleetsync::agent
