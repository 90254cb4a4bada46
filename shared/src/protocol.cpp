#include "fleetsync/protocol.hpp"

#include <array>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace fleetsync::protocol
{

    namespace
    {

        struct MessageTypeMapping
        {
            MessageType type;
            std::string_view label;
        };

        constexpr std::array<MessageTypeMapping, 18> kMessageTypeMappings{{
            {MessageType::Ping, "ping"},
            {MessageType::Pong, "pong"},
            {MessageType::Command, "command"},
            {MessageType::AddDevice, "add-device"},
            {MessageType::AddFolder, "add-folder"},
            {MessageType::RemoveFolder, "remove-folder"},
            {MessageType::ListDevices, "list-devices"},
            {MessageType::ListFolders, "list-folders"},
            {MessageType::GetDeviceId, "get-device-id"},
            {MessageType::ReloadConfig, "reload-config"},
            {MessageType::ScanFolder, "scan-folder"},
            {MessageType::GetStatus, "get-status"},
            {MessageType::DeployJob, "deploy_job"},
            {MessageType::PauseJob, "pause_job"},
            {MessageType::ResumeJob, "resume_job"},
            {MessageType::DeleteJob, "delete_job"},
            {MessageType::BrowseFolders, "browse_folders"},
            {MessageType::GetFolderStats, "get_folder_stats"},
        }};

        struct FolderTypeMapping
        {
            FolderType type;
            std::string_view label;
        };

        constexpr std::array<FolderTypeMapping, 3> kFolderTypeMappings{{
            {FolderType::SendReceive, "sendreceive"},
            {FolderType::SendOnly, "sendonly"},
            {FolderType::ReceiveOnly, "receiveonly"},
        }};

        struct SyncPhaseMapping
        {
            SyncPhase phase;
            std::string_view label;
        };

        constexpr std::array<SyncPhaseMapping, 3> kSyncPhaseMappings{{
            {SyncPhase::Idle, "idle"},
            {SyncPhase::Scanning, "scanning"},
            {SyncPhase::Syncing, "syncing"},
        }};

        struct RepairActionMapping
        {
            RepairAction action;
            std::string_view label;
        };

        constexpr std::array<RepairActionMapping, 4> kRepairActionMappings{{
            {RepairAction::None, "none"},
            {RepairAction::Revert, "revert"},
            {RepairAction::Override, "override"},
            {RepairAction::ResetDatabase, "reset_database"},
        }};

        constexpr std::string_view kJobFolderPrefix = "job-";

        void put_timestamp(nlohmann::json &json, const char *key,
                           const std::optional<std::chrono::system_clock::time_point> &time)
        {
            if (time)
            {
                json[key] = format_timestamp(*time);
            }
        }

    } // namespace

    std::string_view to_string(MessageType type) noexcept
    {
        for (const auto &mapping : kMessageTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<MessageType> message_type_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kMessageTypeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    void from_json(const nlohmann::json &json, InboundEnvelope &envelope)
    {
        if (!json.is_object())
        {
            throw std::runtime_error("Inbound message is not a JSON object");
        }
        auto type_it = json.find("type");
        if (type_it == json.end() || !type_it->is_string())
        {
            throw std::runtime_error("Inbound message has no type");
        }
        envelope.type = type_it->get<std::string>();
        envelope.kind = message_type_from_string(envelope.type);
        if (auto it = json.find("cli_id"); it != json.end() && it->is_string() && !it->get_ref<const std::string &>().empty())
        {
            envelope.cli_id = it->get<std::string>();
        }
        else
        {
            envelope.cli_id.reset();
        }
        envelope.fields = json;
    }

    std::string_view to_string(FolderType type) noexcept
    {
        for (const auto &mapping : kFolderTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "sendreceive";
    }

    std::optional<FolderType> folder_type_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kFolderTypeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(SyncPhase phase) noexcept
    {
        for (const auto &mapping : kSyncPhaseMappings)
        {
            if (mapping.phase == phase)
            {
                return mapping.label;
            }
        }
        return "idle";
    }

    std::optional<SyncPhase> sync_phase_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kSyncPhaseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.phase;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(RepairAction action) noexcept
    {
        for (const auto &mapping : kRepairActionMappings)
        {
            if (mapping.action == action)
            {
                return mapping.label;
            }
        }
        return "none";
    }

    std::string format_timestamp(std::chrono::system_clock::time_point time)
    {
        using namespace std::chrono;
        const auto millis = duration_cast<milliseconds>(time.time_since_epoch()).count();
        auto seconds_part = static_cast<std::time_t>(millis / 1000);
        auto millis_part = static_cast<int>(millis % 1000);
        if (millis_part < 0)
        {
            millis_part += 1000;
            --seconds_part;
        }
        std::tm utc{};
        gmtime_r(&seconds_part, &utc);
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900, utc.tm_mon + 1,
                      utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, millis_part);
        return buffer;
    }

    std::string job_folder_id(std::string_view job_id)
    {
        std::string folder(kJobFolderPrefix);
        folder.append(job_id);
        return folder;
    }

    std::optional<std::string> job_id_from_folder(std::string_view folder_id)
    {
        if (folder_id.size() <= kJobFolderPrefix.size() || folder_id.substr(0, kJobFolderPrefix.size()) != kJobFolderPrefix)
        {
            return std::nullopt;
        }
        return std::string(folder_id.substr(kJobFolderPrefix.size()));
    }

    void to_json(nlohmann::json &json, const FolderConfig &config)
    {
        json = {
            {"id", config.id},
            {"label", config.label},
            {"path", config.path},
            {"type", to_string(config.type)},
            {"devices", config.devices},
            {"rescan_interval_s", config.rescan_interval_s},
            {"ignore_perms", config.ignore_perms},
            {"fs_watcher_enabled", config.fs_watcher_enabled},
            {"fs_watcher_delay_s", config.fs_watcher_delay_s},
            {"ignore_patterns", config.ignore_patterns},
            {"paused", config.paused},
        };
    }

    void from_json(const nlohmann::json &json, FolderConfig &config)
    {
        config.id = json.at("id").get<std::string>();
        config.label = json.value("label", config.id);
        config.path = json.value("path", std::string{});
        const auto type_label = json.value("type", std::string{"sendreceive"});
        auto type = folder_type_from_string(type_label);
        if (!type)
        {
            throw std::runtime_error("Unknown folder type: " + type_label);
        }
        config.type = *type;
        config.devices = json.value("devices", std::vector<std::string>{});
        config.rescan_interval_s = json.value("rescan_interval_s", std::int64_t{60});
        config.ignore_perms = json.value("ignore_perms", false);
        config.fs_watcher_enabled = json.value("fs_watcher_enabled", true);
        config.fs_watcher_delay_s = json.value("fs_watcher_delay_s", std::int64_t{10});
        config.ignore_patterns = json.value("ignore_patterns", std::vector<std::string>{});
        config.paused = json.value("paused", false);
    }

    void to_json(nlohmann::json &json, const FolderStatus &status)
    {
        json = {
            {"id", status.id},
            {"label", status.label},
            {"path", status.path},
            {"type", to_string(status.type)},
            {"state", status.state},
            {"globalFiles", status.global_files},
            {"globalBytes", status.global_bytes},
            {"localFiles", status.local_files},
            {"localBytes", status.local_bytes},
            {"needFiles", status.need_files},
            {"needBytes", status.need_bytes},
            {"inSyncFiles", status.in_sync_files},
            {"inSyncBytes", status.in_sync_bytes},
            {"errors", status.errors},
            {"version", status.version},
        };
    }

    void from_json(const nlohmann::json &json, FolderStatus &status)
    {
        status.id = json.at("id").get<std::string>();
        status.label = json.value("label", std::string{});
        status.path = json.value("path", std::string{});
        status.type = folder_type_from_string(json.value("type", std::string{})).value_or(FolderType::SendReceive);
        status.state = json.value("state", std::string{"idle"});
        status.global_files = json.value("globalFiles", std::int64_t{});
        status.global_bytes = json.value("globalBytes", std::int64_t{});
        status.local_files = json.value("localFiles", std::int64_t{});
        status.local_bytes = json.value("localBytes", std::int64_t{});
        status.need_files = json.value("needFiles", std::int64_t{});
        status.need_bytes = json.value("needBytes", std::int64_t{});
        status.in_sync_files = json.value("inSyncFiles", std::int64_t{});
        status.in_sync_bytes = json.value("inSyncBytes", std::int64_t{});
        status.errors = json.value("errors", std::vector<std::string>{});
        status.version = json.value("version", std::int64_t{});
    }

    void to_json(nlohmann::json &json, const DeviceConfig &device)
    {
        json = {
            {"device_id", device.device_id},
            {"name", device.name},
            {"address", device.address},
        };
    }

    void from_json(const nlohmann::json &json, DeviceConfig &device)
    {
        device.device_id = json.at("device_id").get<std::string>();
        device.name = json.value("name", std::string{});
        device.address = json.value("address", std::string{});
    }

    void to_json(nlohmann::json &json, const ConnectionInfo &info)
    {
        json = {
            {"deviceID", info.device_id},
            {"name", info.name},
            {"address", info.address},
            {"connected", info.connected},
            {"paused", info.paused},
            {"bytesSent", info.bytes_sent},
            {"bytesRecv", info.bytes_received},
        };
    }

    void to_json(nlohmann::json &json, const ProgressSnapshot &progress)
    {
        json = {
            {"scan_progress", progress.scan_progress},
            {"pull_progress", progress.pull_progress},
            {"last_updated", format_timestamp(progress.last_updated)},
        };
    }

    void to_json(nlohmann::json &json, const SyncSessionStats &session)
    {
        json = {
            {"session_id", session.session_id},
            {"job_id", session.job_id},
            {"agent_id", session.agent_id},
            {"current_state", session.current_state},
            {"status", session.status},
            {"session_start_time", format_timestamp(session.session_start)},
            {"total_duration_seconds", session.total_duration_seconds},
            {"scan_duration_seconds", session.scan_duration_seconds},
            {"transfer_duration_seconds", session.transfer_duration_seconds},
            {"files_transferred", session.files_transferred},
            {"total_delta_bytes", session.total_delta_bytes},
            {"total_full_file_size", session.total_full_size},
            {"compression_ratio", session.compression_ratio},
            {"average_transfer_rate", session.average_transfer_rate},
            {"peak_transfer_rate", session.peak_transfer_rate},
            {"timestamp", format_timestamp(session.updated_at)},
        };
        put_timestamp(json, "session_end_time", session.session_end);
        put_timestamp(json, "scan_start_time", session.scan_start);
        put_timestamp(json, "scan_end_time", session.scan_end);
        put_timestamp(json, "transfer_start_time", session.transfer_start);
        put_timestamp(json, "transfer_end_time", session.transfer_end);
    }

    void to_json(nlohmann::json &json, const SystemInfo &info)
    {
        json = {
            {"hostname", info.hostname},
            {"os", info.os},
            {"cpu_usage", info.cpu_usage},
            {"memory_usage", info.memory_usage},
            {"disk_usage", info.disk_usage},
            {"uptime", info.uptime},
        };
    }

    void from_json(const nlohmann::json &json, SystemInfo &info)
    {
        info.hostname = json.value("hostname", std::string{});
        info.os = json.value("os", std::string{});
        info.cpu_usage = json.value("cpu_usage", 0.0);
        info.memory_usage = json.value("memory_usage", std::uint64_t{});
        info.disk_usage = json.value("disk_usage", std::uint64_t{});
        info.uptime = json.value("uptime", std::uint64_t{});
    }

    void to_json(nlohmann::json &json, const BrowseEntry &entry)
    {
        json = {
            {"name", entry.name},
            {"path", entry.path},
            {"is_directory", entry.is_directory},
        };
        if (entry.expanded)
        {
            auto children = nlohmann::json::array();
            for (const auto &child : entry.children)
            {
                children.push_back(nlohmann::json(child));
            }
            json["children"] = std::move(children);
        }
    }

    void to_json(nlohmann::json &json, const AgentStatus &status)
    {
        json = {
            {"agent_id", status.agent_id},
            {"device_id", status.device_id},
            {"version", status.version},
            {"running", status.running},
            {"engine_running", status.engine_running},
            {"connection_state", status.connection_state},
            {"pending_events", status.pending_events},
            {"folders", status.folders},
            {"connections", status.connections},
        };
    }

} // namespace fleetsync::protocol
