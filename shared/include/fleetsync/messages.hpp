/**
 * fleetsync - Typed outbound messages and their wire serialization.
 *
 * Every message the agent emits is one alternative of OutboundMessage. The
 * only place a message turns into a JSON object is serialize(); components
 * never assemble wire maps by hand.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "fleetsync/error_codes.hpp"
#include "fleetsync/protocol.hpp"

namespace fleetsync::protocol
{

    struct RegisterMessage
    {
        std::string agent_id;
        std::string device_id;
        std::string data_dir;
        std::string version;
        std::string hostname;
    };

    struct PingMessage
    {
    };

    struct PongMessage
    {
    };

    struct EventMessage
    {
        std::string agent_id;
        std::string event_type;
        std::chrono::system_clock::time_point event_time{};
        nlohmann::json data{nlohmann::json::object()};
        std::chrono::system_clock::time_point timestamp{};
    };

    struct HealthMessage
    {
        std::string agent_id;
        SystemInfo system_info;
        std::string data_dir;
        std::chrono::system_clock::time_point timestamp{};
    };

    // Success reply to a device/folder/config request. Requests relayed from the
    // CLI carry a cli_id and are answered with type "response"; direct requests
    // from the coordinator get reply_type (e.g. "folder_added").
    struct CommandReply
    {
        std::string reply_type;
        std::string command;
        std::optional<std::string> cli_id{};
        std::string message;
        nlohmann::json payload{nlohmann::json::object()};
    };

    struct ErrorReply
    {
        std::optional<std::string> cli_id{};
        std::string command;
        ErrorCode code{ErrorCode::InternalError};
        std::string message;
    };

    enum class JobEvent : std::uint8_t
    {
        Deployed,
        DeployError,
        Paused,
        PauseError,
        Resumed,
        ResumeError,
        Deleted,
        DeleteError
    };

    std::string_view to_string(JobEvent event) noexcept;

    struct JobReply
    {
        JobEvent event{JobEvent::Deployed};
        std::string job_id;
        std::optional<std::string> folder_id{};
        std::vector<std::string> folders;
        std::string message;
        ErrorCode code{ErrorCode::Ok};
        std::optional<std::string> cli_id{};
    };

    struct BrowseResponse
    {
        std::string path;
        BrowseEntry data;
        std::optional<std::string> cli_id{};
    };

    struct BrowseError
    {
        std::string path;
        std::string error;
        std::optional<std::string> cli_id{};
    };

    struct FolderStatsResponse
    {
        std::string folder_id;
        std::string agent_id;
        FolderStatus stats;
        std::optional<ProgressSnapshot> progress{};
        std::optional<std::string> cli_id{};
    };

    struct FolderStatsError
    {
        std::optional<std::string> folder_id{};
        std::string message;
        ErrorCode code{ErrorCode::InternalError};
        std::optional<std::string> cli_id{};
    };

    struct FolderStatsPeriodic
    {
        std::string job_id;
        std::string folder_id;
        std::string agent_id;
        FolderStatus stats;
        std::optional<ProgressSnapshot> progress{};
    };

    enum class SessionEventType : std::uint8_t
    {
        SessionStarted,
        ScanStarted,
        ScanCompleted,
        TransferStarted,
        SessionCompleted
    };

    std::string_view to_string(SessionEventType type) noexcept;

    struct SessionEvent
    {
        SessionEventType type{SessionEventType::SessionStarted};
        SyncSessionStats session;
    };

    struct AutomaticResyncTriggered
    {
        std::string job_id;
        std::string folder_id;
        std::int64_t missing_files{};
        std::int64_t missing_bytes{};
        RepairAction repair_action{RepairAction::None};
        bool success{};
        std::chrono::system_clock::time_point timestamp{};
    };

    using OutboundMessage = std::variant<RegisterMessage,
                                         PingMessage,
                                         PongMessage,
                                         EventMessage,
                                         HealthMessage,
                                         CommandReply,
                                         ErrorReply,
                                         JobReply,
                                         BrowseResponse,
                                         BrowseError,
                                         FolderStatsResponse,
                                         FolderStatsError,
                                         FolderStatsPeriodic,
                                         SessionEvent,
                                         AutomaticResyncTriggered>;

    void to_json(nlohmann::json &json, const RegisterMessage &message);
    void to_json(nlohmann::json &json, const PingMessage &message);
    void to_json(nlohmann::json &json, const PongMessage &message);
    void to_json(nlohmann::json &json, const EventMessage &message);
    void to_json(nlohmann::json &json, const HealthMessage &message);
    void to_json(nlohmann::json &json, const CommandReply &message);
    void to_json(nlohmann::json &json, const ErrorReply &message);
    void to_json(nlohmann::json &json, const JobReply &message);
    void to_json(nlohmann::json &json, const BrowseResponse &message);
    void to_json(nlohmann::json &json, const BrowseError &message);
    void to_json(nlohmann::json &json, const FolderStatsResponse &message);
    void to_json(nlohmann::json &json, const FolderStatsError &message);
    void to_json(nlohmann::json &json, const FolderStatsPeriodic &message);
    void to_json(nlohmann::json &json, const SessionEvent &message);
    void to_json(nlohmann::json &json, const AutomaticResyncTriggered &message);

    nlohmann::json serialize(const OutboundMessage &message);

    // The wire "type" of a message, without serializing it.
    std::string_view message_type(const OutboundMessage &message) noexcept;

} // namespace fleetsync::protocol
