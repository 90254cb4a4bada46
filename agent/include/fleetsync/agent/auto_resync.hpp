#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "fleetsync/agent/message_sink.hpp"
#include "fleetsync/agent/sync_engine.hpp"
#include "fleetsync/protocol.hpp"

namespace fleetsync::agent
{

    struct Drift
    {
        std::int64_t missing_files{};
        std::int64_t missing_bytes{};
        // True when derived from local < global rather than the need counters.
        bool inferred{};
    };

    std::optional<Drift> detect_drift(const protocol::FolderStatus &status);

    struct ResyncOutcome
    {
        std::optional<Drift> drift{};
        protocol::RepairAction action{protocol::RepairAction::None};
        bool success{};
    };

    // Detects missing files in a job folder and repairs them by escalating through
    // revert, override and a database reset, stopping at the first that succeeds.
    class AutoResyncMonitor
    {
    public:
        AutoResyncMonitor(SyncEngine &engine, MessageSink &sink);

        ResyncOutcome check(const std::string &job_id);

    private:
        ResyncOutcome repair(const std::string &job_id, const std::string &folder_id, const Drift &drift);

        SyncEngine &engine_;
        MessageSink &sink_;
    };

} // namespace fleetsync::agent
