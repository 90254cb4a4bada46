/**
 * fleetsync - Coordinator protocol vocabulary and the data models carried in messages.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "fleetsync/error_codes.hpp"

namespace fleetsync::protocol
{

    // Inbound message kinds understood by the agent. Outbound kinds are the
    // alternatives of OutboundMessage (messages.hpp).
    enum class MessageType : std::uint8_t
    {
        Ping,
        Pong,
        Command,
        AddDevice,
        AddFolder,
        RemoveFolder,
        ListDevices,
        ListFolders,
        GetDeviceId,
        ReloadConfig,
        ScanFolder,
        GetStatus,
        DeployJob,
        PauseJob,
        ResumeJob,
        DeleteJob,
        BrowseFolders,
        GetFolderStats
    };

    std::string_view to_string(MessageType type) noexcept;
    std::optional<MessageType> message_type_from_string(std::string_view value) noexcept;

    struct InboundEnvelope
    {
        std::string type;
        std::optional<MessageType> kind{};
        std::optional<std::string> cli_id{};
        nlohmann::json fields{nlohmann::json::object()};
    };

    // Throws std::runtime_error when the message is not an object or has no string "type".
    void from_json(const nlohmann::json &json, InboundEnvelope &envelope);

    enum class FolderType : std::uint8_t
    {
        SendReceive,
        SendOnly,
        ReceiveOnly
    };

    std::string_view to_string(FolderType type) noexcept;
    std::optional<FolderType> folder_type_from_string(std::string_view value) noexcept;

    enum class SyncPhase : std::uint8_t
    {
        Idle,
        Scanning,
        Syncing
    };

    std::string_view to_string(SyncPhase phase) noexcept;
    std::optional<SyncPhase> sync_phase_from_string(std::string_view value) noexcept;

    enum class RepairAction : std::uint8_t
    {
        None,
        Revert,
        Override,
        ResetDatabase
    };

    std::string_view to_string(RepairAction action) noexcept;

    // ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T10:20:30.123Z.
    std::string format_timestamp(std::chrono::system_clock::time_point time);

    std::string job_folder_id(std::string_view job_id);
    std::optional<std::string> job_id_from_folder(std::string_view folder_id);

    struct FolderConfig
    {
        std::string id;
        std::string label;
        std::string path;
        FolderType type{FolderType::SendReceive};
        std::vector<std::string> devices;
        std::int64_t rescan_interval_s{60};
        bool ignore_perms{};
        bool fs_watcher_enabled{true};
        std::int64_t fs_watcher_delay_s{10};
        std::vector<std::string> ignore_patterns;
        bool paused{};
    };

    void to_json(nlohmann::json &json, const FolderConfig &config);
    void from_json(const nlohmann::json &json, FolderConfig &config);

    struct FolderStatus
    {
        std::string id;
        std::string label;
        std::string path;
        FolderType type{FolderType::SendReceive};
        std::string state{"idle"};
        std::int64_t global_files{};
        std::int64_t global_bytes{};
        std::int64_t local_files{};
        std::int64_t local_bytes{};
        std::int64_t need_files{};
        std::int64_t need_bytes{};
        std::int64_t in_sync_files{};
        std::int64_t in_sync_bytes{};
        std::vector<std::string> errors;
        std::int64_t version{};
    };

    void to_json(nlohmann::json &json, const FolderStatus &status);
    void from_json(const nlohmann::json &json, FolderStatus &status);

    struct DeviceConfig
    {
        std::string device_id;
        std::string name;
        std::string address;
    };

    void to_json(nlohmann::json &json, const DeviceConfig &device);
    void from_json(const nlohmann::json &json, DeviceConfig &device);

    struct ConnectionInfo
    {
        std::string device_id;
        std::string name;
        std::string address;
        bool connected{};
        bool paused{};
        std::int64_t bytes_sent{};
        std::int64_t bytes_received{};
    };

    void to_json(nlohmann::json &json, const ConnectionInfo &info);

    struct ProgressSnapshot
    {
        std::string folder_id;
        std::string state;
        double scan_progress{};
        double pull_progress{};
        std::chrono::system_clock::time_point last_updated{};
    };

    void to_json(nlohmann::json &json, const ProgressSnapshot &progress);

    struct SyncSessionStats
    {
        std::string session_id;
        std::string job_id;
        std::string agent_id;
        std::string current_state;
        std::string status{"active"};

        std::chrono::system_clock::time_point session_start{};
        std::optional<std::chrono::system_clock::time_point> session_end{};
        double total_duration_seconds{};

        std::optional<std::chrono::system_clock::time_point> scan_start{};
        std::optional<std::chrono::system_clock::time_point> scan_end{};
        double scan_duration_seconds{};

        std::optional<std::chrono::system_clock::time_point> transfer_start{};
        std::optional<std::chrono::system_clock::time_point> transfer_end{};
        double transfer_duration_seconds{};

        std::int64_t files_transferred{};
        std::int64_t total_delta_bytes{};
        std::int64_t total_full_size{};
        double compression_ratio{};
        double average_transfer_rate{};
        double peak_transfer_rate{};

        std::chrono::system_clock::time_point updated_at{};
    };

    void to_json(nlohmann::json &json, const SyncSessionStats &session);

    struct SystemInfo
    {
        std::string hostname;
        std::string os;
        double cpu_usage{};
        std::uint64_t memory_usage{};
        std::uint64_t disk_usage{};
        std::uint64_t uptime{};
    };

    void to_json(nlohmann::json &json, const SystemInfo &info);
    void from_json(const nlohmann::json &json, SystemInfo &info);

    struct BrowseEntry
    {
        std::string name;
        std::string path;
        bool is_directory{};
        bool expanded{};
        std::vector<BrowseEntry> children;
    };

    void to_json(nlohmann::json &json, const BrowseEntry &entry);

    struct AgentStatus
    {
        std::string agent_id;
        std::string device_id;
        std::string version;
        bool running{};
        bool engine_running{};
        std::string connection_state;
        std::size_t pending_events{};
        std::vector<FolderStatus> folders;
        std::vector<ConnectionInfo> connections;
    };

    void to_json(nlohmann::json &json, const AgentStatus &status);

} // namespace fleetsync::protocol
