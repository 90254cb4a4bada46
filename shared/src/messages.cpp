#include "fleetsync/messages.hpp"

#include <array>
#include <type_traits>

namespace fleetsync::protocol
{

    namespace
    {

        struct JobEventMapping
        {
            JobEvent event;
            std::string_view label;
            std::string_view folders_key;
        };

        constexpr std::array<JobEventMapping, 8> kJobEventMappings{{
            {JobEvent::Deployed, "job_deployed", ""},
            {JobEvent::DeployError, "job_deploy_error", ""},
            {JobEvent::Paused, "job_paused", "paused_folders"},
            {JobEvent::PauseError, "job_pause_error", ""},
            {JobEvent::Resumed, "job_resumed", "resumed_folders"},
            {JobEvent::ResumeError, "job_resume_error", ""},
            {JobEvent::Deleted, "job_deleted", "deleted_folders"},
            {JobEvent::DeleteError, "job_delete_error", ""},
        }};

        struct SessionEventMapping
        {
            SessionEventType type;
            std::string_view label;
        };

        constexpr std::array<SessionEventMapping, 5> kSessionEventMappings{{
            {SessionEventType::SessionStarted, "session_started"},
            {SessionEventType::ScanStarted, "scan_started"},
            {SessionEventType::ScanCompleted, "scan_completed"},
            {SessionEventType::TransferStarted, "transfer_started"},
            {SessionEventType::SessionCompleted, "session_completed"},
        }};

        constexpr std::string_view kResyncTrigger = "file_deletion_detection";

        void put_cli_id(nlohmann::json &json, const std::optional<std::string> &cli_id)
        {
            if (cli_id)
            {
                json["cli_id"] = *cli_id;
            }
        }

        bool is_error_event(JobEvent event) noexcept
        {
            return event == JobEvent::DeployError || event == JobEvent::PauseError ||
                   event == JobEvent::ResumeError || event == JobEvent::DeleteError;
        }

        std::string_view folders_key(JobEvent event) noexcept
        {
            for (const auto &mapping : kJobEventMappings)
            {
                if (mapping.event == event)
                {
                    return mapping.folders_key;
                }
            }
            return {};
        }

    } // namespace

    std::string_view to_string(JobEvent event) noexcept
    {
        for (const auto &mapping : kJobEventMappings)
        {
            if (mapping.event == event)
            {
                return mapping.label;
            }
        }
        return "job_unknown";
    }

    std::string_view to_string(SessionEventType type) noexcept
    {
        for (const auto &mapping : kSessionEventMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "session_unknown";
    }

    void to_json(nlohmann::json &json, const RegisterMessage &message)
    {
        json = {
            {"type", "register"},
            {"agent_id", message.agent_id},
            {"device_id", message.device_id},
            {"data_dir", message.data_dir},
            {"version", message.version},
            {"hostname", message.hostname},
        };
    }

    void to_json(nlohmann::json &json, const PingMessage &)
    {
        json = {{"type", "ping"}};
    }

    void to_json(nlohmann::json &json, const PongMessage &)
    {
        json = {{"type", "pong"}};
    }

    void to_json(nlohmann::json &json, const EventMessage &message)
    {
        json = {
            {"type", "event"},
            {"agent_id", message.agent_id},
            {"event",
             {
                 {"type", message.event_type},
                 {"time", format_timestamp(message.event_time)},
                 {"data", message.data},
             }},
            {"timestamp", format_timestamp(message.timestamp)},
        };
    }

    void to_json(nlohmann::json &json, const HealthMessage &message)
    {
        json = {
            {"type", "health"},
            {"agent_id", message.agent_id},
            {"system_info", message.system_info},
            {"data_dir", message.data_dir},
            {"timestamp", format_timestamp(message.timestamp)},
        };
    }

    void to_json(nlohmann::json &json, const CommandReply &message)
    {
        json = message.payload.is_object() ? message.payload : nlohmann::json::object();
        json["type"] = message.cli_id ? std::string("response") : message.reply_type;
        json["command"] = message.command;
        json["success"] = true;
        if (!message.message.empty())
        {
            json["message"] = message.message;
        }
        put_cli_id(json, message.cli_id);
    }

    void to_json(nlohmann::json &json, const ErrorReply &message)
    {
        json = {
            {"type", "error"},
            {"error", to_string(message.code)},
            {"message", message.message},
        };
        if (!message.command.empty())
        {
            json["command"] = message.command;
        }
        put_cli_id(json, message.cli_id);
    }

    void to_json(nlohmann::json &json, const JobReply &message)
    {
        json = {
            {"type", to_string(message.event)},
            {"job_id", message.job_id},
            {"message", message.message},
        };
        if (message.folder_id)
        {
            json["folder_id"] = *message.folder_id;
        }
        if (const auto key = folders_key(message.event); !key.empty())
        {
            json[std::string(key)] = message.folders;
        }
        if (is_error_event(message.event))
        {
            json["error"] = to_string(message.code);
        }
        put_cli_id(json, message.cli_id);
    }

    void to_json(nlohmann::json &json, const BrowseResponse &message)
    {
        json = {
            {"type", "browse_response"},
            {"path", message.path},
            {"data", message.data},
        };
        put_cli_id(json, message.cli_id);
    }

    void to_json(nlohmann::json &json, const BrowseError &message)
    {
        json = {
            {"type", "browse_error"},
            {"path", message.path},
            {"error", message.error},
        };
        put_cli_id(json, message.cli_id);
    }

    void to_json(nlohmann::json &json, const FolderStatsResponse &message)
    {
        json = {
            {"type", "folder_stats_response"},
            {"folder_id", message.folder_id},
            {"agent_id", message.agent_id},
            {"stats", message.stats},
        };
        if (message.progress)
        {
            json["progress"] = *message.progress;
        }
        put_cli_id(json, message.cli_id);
    }

    void to_json(nlohmann::json &json, const FolderStatsError &message)
    {
        json = {
            {"type", "folder_stats_error"},
            {"error", to_string(message.code)},
            {"message", message.message},
        };
        if (message.folder_id)
        {
            json["folder_id"] = *message.folder_id;
        }
        put_cli_id(json, message.cli_id);
    }

    void to_json(nlohmann::json &json, const FolderStatsPeriodic &message)
    {
        json = {
            {"type", "folder_stats_periodic"},
            {"job_id", message.job_id},
            {"folder_id", message.folder_id},
            {"agent_id", message.agent_id},
            {"stats", message.stats},
            {"is_periodic", true},
        };
        if (message.progress)
        {
            json["progress"] = *message.progress;
        }
    }

    void to_json(nlohmann::json &json, const SessionEvent &message)
    {
        json = {
            {"type", "session_event"},
            {"event",
             {
                 {"type", to_string(message.type)},
                 {"data", message.session},
             }},
        };
    }

    void to_json(nlohmann::json &json, const AutomaticResyncTriggered &message)
    {
        json = {
            {"type", "automatic_resync_triggered"},
            {"job_id", message.job_id},
            {"folder_id", message.folder_id},
            {"missing_files", message.missing_files},
            {"missing_bytes", message.missing_bytes},
            {"repair_action", to_string(message.repair_action)},
            {"success", message.success},
            {"timestamp", format_timestamp(message.timestamp)},
            {"trigger", kResyncTrigger},
        };
    }

    nlohmann::json serialize(const OutboundMessage &message)
    {
        return std::visit([](const auto &alternative)
                          { return nlohmann::json(alternative); },
                          message);
    }

    std::string_view message_type(const OutboundMessage &message) noexcept
    {
        return std::visit([](const auto &alternative) -> std::string_view
                          {
                              using T = std::decay_t<decltype(alternative)>;
                              if constexpr (std::is_same_v<T, RegisterMessage>)
                                  return "register";
                              else if constexpr (std::is_same_v<T, PingMessage>)
                                  return "ping";
                              else if constexpr (std::is_same_v<T, PongMessage>)
                                  return "pong";
                              else if constexpr (std::is_same_v<T, EventMessage>)
                                  return "event";
                              else if constexpr (std::is_same_v<T, HealthMessage>)
                                  return "health";
                              else if constexpr (std::is_same_v<T, CommandReply>)
                                  return alternative.cli_id ? std::string_view("response") : std::string_view(alternative.reply_type);
                              else if constexpr (std::is_same_v<T, ErrorReply>)
                                  return "error";
                              else if constexpr (std::is_same_v<T, JobReply>)
                                  return to_string(alternative.event);
                              else if constexpr (std::is_same_v<T, BrowseResponse>)
                                  return "browse_response";
                              else if constexpr (std::is_same_v<T, BrowseError>)
                                  return "browse_error";
                              else if constexpr (std::is_same_v<T, FolderStatsResponse>)
                                  return "folder_stats_response";
                              else if constexpr (std::is_same_v<T, FolderStatsError>)
                                  return "folder_stats_error";
                              else if constexpr (std::is_same_v<T, FolderStatsPeriodic>)
                                  return "folder_stats_periodic";
                              else if constexpr (std::is_same_v<T, SessionEvent>)
                                  return "session_event";
                              else
                                  return "automatic_resync_triggered"; },
                          message);
    }

} // namespace fleetsync::protocol
