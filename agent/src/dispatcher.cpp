#include "fleetsync/agent/dispatcher.hpp"

#include <algorithm>
#include <vector>

#include <spdlog/spdlog.h>

#include "dispatcher_common.hpp"
#include "fleetsync/agent/folder_browser.hpp"
#include "fleetsync/messages.hpp"

namespace fleetsync::agent
{

    using dispatcher_common::bool_field;
    using dispatcher_common::integer_field;
    using dispatcher_common::string_field;
    using dispatcher_common::string_list;
    using protocol::MessageType;

    namespace
    {

        constexpr std::int64_t kDefaultFolderRescanSeconds = 60;
        constexpr std::int64_t kMaxBrowseDepth = 16;

    } // namespace

    Dispatcher::Dispatcher(DispatcherServices services)
        : services_(std::move(services)) {}

    void Dispatcher::handle(const nlohmann::json &message)
    {
        protocol::InboundEnvelope envelope;
        try
        {
            envelope = message.get<protocol::InboundEnvelope>();
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Discarding malformed coordinator message: {}", ex.what());
            if (auto cli_id = string_field(message, "cli_id"))
            {
                services_.sink.send(protocol::ErrorReply{
                    .cli_id = std::move(cli_id),
                    .code = ErrorCode::InvalidPayload,
                    .message = ex.what(),
                });
            }
            return;
        }
        handle(envelope);
    }

    void Dispatcher::handle(const protocol::InboundEnvelope &envelope)
    {
        if (!envelope.kind)
        {
            reject_unknown(envelope.type, envelope.cli_id);
            return;
        }
        spdlog::debug("Coordinator -> {}", envelope.type);

        const Request request{envelope.fields, envelope.cli_id, envelope.type};
        try
        {
            if (*envelope.kind == MessageType::Command)
            {
                handle_command(envelope);
                return;
            }
            route(*envelope.kind, request);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Handler for {} failed: {}", envelope.type, ex.what());
            send_error(request, ErrorCode::InternalError, ex.what());
        }
    }

    void Dispatcher::handle_command(const protocol::InboundEnvelope &envelope)
    {
        const auto command = string_field(envelope.fields, "command");
        if (!command)
        {
            const Request request{envelope.fields, envelope.cli_id, "command"};
            send_error(request, ErrorCode::InvalidCommand, "Missing command field");
            return;
        }
        spdlog::info("Handling command {} from CLI {}", *command, envelope.cli_id.value_or("-"));

        const auto kind = protocol::message_type_from_string(*command);
        if (!kind || *kind == MessageType::Command)
        {
            reject_unknown(*command, envelope.cli_id);
            return;
        }
        route(*kind, Request{envelope.fields, envelope.cli_id, *command});
    }

    void Dispatcher::route(MessageType kind, const Request &request)
    {
        switch (kind)
        {
        case MessageType::Ping:
            services_.sink.send(protocol::PongMessage{});
            break;
        case MessageType::Pong:
            spdlog::debug("Pong from coordinator");
            break;
        case MessageType::Command:
            reject_unknown(request.command, request.cli_id);
            break;
        case MessageType::AddDevice:
            handle_add_device(request);
            break;
        case MessageType::AddFolder:
            handle_add_folder(request);
            break;
        case MessageType::RemoveFolder:
            handle_remove_folder(request);
            break;
        case MessageType::ListDevices:
            handle_list_devices(request);
            break;
        case MessageType::ListFolders:
            handle_list_folders(request);
            break;
        case MessageType::GetDeviceId:
            handle_get_device_id(request);
            break;
        case MessageType::ReloadConfig:
            handle_reload_config(request);
            break;
        case MessageType::ScanFolder:
            handle_scan_folder(request);
            break;
        case MessageType::GetStatus:
            handle_get_status(request);
            break;
        case MessageType::DeployJob:
            handle_deploy_job(request);
            break;
        case MessageType::PauseJob:
            handle_pause_job(request);
            break;
        case MessageType::ResumeJob:
            handle_resume_job(request);
            break;
        case MessageType::DeleteJob:
            handle_delete_job(request);
            break;
        case MessageType::BrowseFolders:
            handle_browse_folders(request);
            break;
        case MessageType::GetFolderStats:
            handle_get_folder_stats(request);
            break;
        }
    }

    void Dispatcher::reject_unknown(const std::string &kind, const std::optional<std::string> &cli_id)
    {
        spdlog::warn("Unknown message kind: {}", kind);
        if (!cli_id)
        {
            return;
        }
        services_.sink.send(protocol::ErrorReply{
            .cli_id = cli_id,
            .command = kind,
            .code = ErrorCode::UnknownCommand,
            .message = "Unknown command: " + kind,
        });
    }

    void Dispatcher::handle_add_device(const Request &request)
    {
        const auto device_id = string_field(request.fields, "device_id");
        const auto name = string_field(request.fields, "name");
        const auto address = string_field(request.fields, "address");
        if (!device_id || !name || !address)
        {
            send_error(request, ErrorCode::InvalidPayload, "Missing required fields: device_id, name, address");
            return;
        }

        std::string message = "Device " + *name + " added successfully";
        try
        {
            services_.engine.add_device(protocol::DeviceConfig{
                .device_id = *device_id,
                .name = *name,
                .address = *address,
            });
        }
        catch (const EngineError &ex)
        {
            if (ex.code() != ErrorCode::AlreadyExists)
            {
                send_error(request, ex.code(), std::string("Failed to add device: ") + ex.what());
                return;
            }
            message = "Device " + *name + " already exists";
        }
        reply(request, "device_added", std::move(message), {{"device_id", *device_id}});
    }

    void Dispatcher::handle_add_folder(const Request &request)
    {
        const auto folder_id = string_field(request.fields, "folder_id");
        const auto path = string_field(request.fields, "path");
        if (!folder_id || !path)
        {
            send_error(request, ErrorCode::InvalidPayload, "Missing required fields: folder_id, path");
            return;
        }

        const auto type_name = string_field(request.fields, "folder_type").value_or("sendreceive");
        const auto type = protocol::folder_type_from_string(type_name);
        if (!type)
        {
            send_error(request, ErrorCode::InvalidPayload,
                       "Invalid folder type: " + type_name + ". Valid types: sendreceive, sendonly, receiveonly");
            return;
        }

        const auto rescan = integer_field(request.fields, "rescan_interval_s").value_or(kDefaultFolderRescanSeconds);
        protocol::FolderConfig config{
            .id = *folder_id,
            .label = string_field(request.fields, "label").value_or(*folder_id),
            .path = *path,
            .type = *type,
            .devices = string_list(request.fields, "devices"),
            .rescan_interval_s = rescan,
            .fs_watcher_enabled = rescan != 0,
            .ignore_patterns = string_list(request.fields, "ignore_patterns"),
        };

        try
        {
            if (services_.engine.has_folder(*folder_id))
            {
                services_.engine.update_folder(config);
                services_.engine.scan_folder(*folder_id);
                reply(request, "folder_added", "Folder " + *folder_id + " updated successfully",
                      {{"folder_id", *folder_id}});
                return;
            }
            services_.engine.add_folder(config);
        }
        catch (const EngineError &ex)
        {
            send_error(request, ex.code(), std::string("Failed to add folder: ") + ex.what());
            return;
        }
        reply(request, "folder_added", "Folder " + *folder_id + " added successfully", {{"folder_id", *folder_id}});
    }

    void Dispatcher::handle_remove_folder(const Request &request)
    {
        const auto folder_id = string_field(request.fields, "folder_id");
        if (!folder_id)
        {
            send_error(request, ErrorCode::InvalidPayload, "Missing folder_id");
            return;
        }
        try
        {
            services_.engine.remove_folder(*folder_id);
        }
        catch (const EngineError &ex)
        {
            send_error(request, ex.code(), std::string("Failed to remove folder: ") + ex.what());
            return;
        }
        if (const auto job_id = protocol::job_id_from_folder(*folder_id))
        {
            services_.jobs.stop(*job_id);
        }
        reply(request, "folder_removed", "Folder " + *folder_id + " removed successfully",
              {{"folder_id", *folder_id}});
    }

    void Dispatcher::handle_list_devices(const Request &request)
    {
        std::vector<protocol::ConnectionInfo> connections;
        try
        {
            connections = services_.engine.connections();
        }
        catch (const EngineError &ex)
        {
            send_error(request, ex.code(), std::string("Failed to get devices: ") + ex.what());
            return;
        }
        reply(request, "devices_list", "", {{"devices", connections}});
    }

    void Dispatcher::handle_list_folders(const Request &request)
    {
        std::vector<protocol::FolderStatus> statuses;
        try
        {
            for (const auto &folder : services_.engine.folders())
            {
                try
                {
                    statuses.push_back(services_.engine.folder_status(folder.id));
                }
                catch (const EngineError &ex)
                {
                    spdlog::warn("Skipping folder {} in listing: {}", folder.id, ex.what());
                }
            }
        }
        catch (const EngineError &ex)
        {
            send_error(request, ex.code(), std::string("Failed to get folders: ") + ex.what());
            return;
        }
        reply(request, "folders_list", "", {{"folders", statuses}});
    }

    void Dispatcher::handle_get_device_id(const Request &request)
    {
        reply(request, "device_id", "", {{"device_id", services_.engine.device_id()}});
    }

    void Dispatcher::handle_reload_config(const Request &request)
    {
        const auto event_debug = bool_field(request.fields, "event_debug");
        spdlog::info("Reloading configuration on coordinator request");
        if (services_.reload)
        {
            services_.reload(event_debug);
        }
        else if (event_debug)
        {
            services_.engine.set_event_debug(*event_debug);
        }

        nlohmann::json payload = nlohmann::json::object();
        if (event_debug)
        {
            payload["event_debug"] = *event_debug;
        }
        reply(request, "config_reloaded", "Configuration reloaded successfully", std::move(payload));
    }

    void Dispatcher::handle_scan_folder(const Request &request)
    {
        const auto folder_id = string_field(request.fields, "folder_id");
        if (!folder_id)
        {
            send_error(request, ErrorCode::InvalidPayload, "Missing folder_id parameter");
            return;
        }
        try
        {
            services_.engine.scan_folder(*folder_id);
        }
        catch (const EngineError &ex)
        {
            send_error(request, ex.code(), std::string("Failed to scan folder: ") + ex.what());
            return;
        }
        reply(request, "scan_triggered", "Folder scan triggered for: " + *folder_id, {{"folder_id", *folder_id}});
    }

    void Dispatcher::handle_get_status(const Request &request)
    {
        if (!services_.status_provider)
        {
            send_error(request, ErrorCode::Unsupported, "Status is not available");
            return;
        }
        const auto status = services_.status_provider();
        reply(request, "status", "", {{request.cli_id ? "status" : "data", status}});
    }

    void Dispatcher::handle_browse_folders(const Request &request)
    {
        const auto path = string_field(request.fields, "path").value_or("/");
        const auto depth = std::clamp<std::int64_t>(integer_field(request.fields, "depth").value_or(kDefaultBrowseDepth),
                                                    0, kMaxBrowseDepth);
        spdlog::info("Browsing {} with depth {}", path, depth);
        try
        {
            services_.sink.send(protocol::BrowseResponse{
                .path = path,
                .data = browse_path(path, static_cast<int>(depth)),
                .cli_id = request.cli_id,
            });
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Failed to browse {}: {}", path, ex.what());
            services_.sink.send(protocol::BrowseError{
                .path = path,
                .error = std::string("Failed to browse path: ") + ex.what(),
                .cli_id = request.cli_id,
            });
        }
    }

    void Dispatcher::handle_get_folder_stats(const Request &request)
    {
        const auto folder_id = string_field(request.fields, "folder_id");
        if (!folder_id)
        {
            services_.sink.send(protocol::FolderStatsError{
                .message = "Missing folder_id field",
                .code = ErrorCode::InvalidPayload,
                .cli_id = request.cli_id,
            });
            return;
        }

        protocol::FolderStatus status;
        try
        {
            status = services_.engine.folder_status(*folder_id);
        }
        catch (const EngineError &ex)
        {
            spdlog::warn("Failed to get folder stats for {}: {}", *folder_id, ex.what());
            services_.sink.send(protocol::FolderStatsError{
                .folder_id = *folder_id,
                .message = std::string("Failed to get folder stats: ") + ex.what(),
                .code = ex.code(),
                .cli_id = request.cli_id,
            });
            return;
        }

        services_.sink.send(protocol::FolderStatsResponse{
            .folder_id = *folder_id,
            .agent_id = services_.agent_id,
            .stats = status,
            .progress = services_.progress.get(*folder_id),
            .cli_id = request.cli_id,
        });
    }

    void Dispatcher::reply(const Request &request, std::string direct_type, std::string message,
                           nlohmann::json payload)
    {
        services_.sink.send(protocol::CommandReply{
            .reply_type = std::move(direct_type),
            .command = request.command,
            .cli_id = request.cli_id,
            .message = std::move(message),
            .payload = std::move(payload),
        });
    }

    void Dispatcher::send_error(const Request &request, ErrorCode code, std::string message)
    {
        spdlog::warn("{} failed: {}", request.command, message);
        services_.sink.send(protocol::ErrorReply{
            .cli_id = request.cli_id,
            .command = request.command,
            .code = code,
            .message = std::move(message),
        });
    }

} // namespace fleetsync::agent
