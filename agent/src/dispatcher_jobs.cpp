#include "fleetsync/agent/dispatcher.hpp"

#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

#include "dispatcher_common.hpp"
#include "fleetsync/messages.hpp"

namespace fleetsync::agent
{

    using dispatcher_common::bool_field;
    using dispatcher_common::host_of;
    using dispatcher_common::integer_field;
    using dispatcher_common::string_field;
    using dispatcher_common::string_list;
    using protocol::JobEvent;

    namespace
    {

        constexpr std::int64_t kDefaultJobRescanSeconds = 3600;

        struct PeerRef
        {
            std::string device_id;
            std::string agent_id;
            std::optional<std::string> host;
        };

        std::vector<std::string> raw_string_list(const nlohmann::json &fields, const char *key)
        {
            std::vector<std::string> result;
            auto it = fields.find(key);
            if (it == fields.end() || !it->is_array())
            {
                return result;
            }
            for (const auto &item : *it)
            {
                result.push_back(item.is_string() ? item.get<std::string>() : std::string{});
            }
            return result;
        }

    } // namespace

    void Dispatcher::handle_deploy_job(const Request &request)
    {
        const auto &fields = request.fields;
        const auto job_id = string_field(fields, "job_id");
        const auto name = string_field(fields, "name");
        const auto sync_type = string_field(fields, "sync_type");

        auto deploy_error = [&](ErrorCode code, std::string message)
        {
            spdlog::warn("Deploy of job {} rejected: {}", job_id.value_or("<none>"), message);
            services_.sink.send(protocol::JobReply{
                .event = JobEvent::DeployError,
                .job_id = job_id.value_or(""),
                .message = std::move(message),
                .code = code,
                .cli_id = request.cli_id,
            });
        };

        if (!job_id || !name || !sync_type)
        {
            deploy_error(ErrorCode::InvalidPayload, "Missing required fields for job deployment");
            return;
        }
        const auto source_agent_id = string_field(fields, "source_agent_id");
        if (!source_agent_id)
        {
            deploy_error(ErrorCode::InvalidPayload, "Missing source_agent_id field");
            return;
        }

        const auto destination_agent_id = string_field(fields, "destination_agent_id");
        const bool is_source = *source_agent_id == services_.agent_id;
        const bool is_destination = destination_agent_id && *destination_agent_id == services_.agent_id;
        if (!is_source && !is_destination)
        {
            deploy_error(ErrorCode::NotParticipant,
                         "Agent " + services_.agent_id + " is neither source nor destination of job " + *job_id);
            return;
        }

        const auto source_path = string_field(fields, "source_path");
        const auto destination_path = string_field(fields, "destination_path");
        if (is_source && !source_path)
        {
            deploy_error(ErrorCode::InvalidPayload, "Missing source_path field for source agent");
            return;
        }
        if (is_destination && !destination_path)
        {
            deploy_error(ErrorCode::InvalidPayload, "Missing destination_path field for destination agent");
            return;
        }

        // Teach the directory every peer address the coordinator told us about.
        if (auto ip = string_field(fields, "source_ip_address"))
        {
            services_.peers.learn(*source_agent_id, *ip);
        }
        if (destination_agent_id)
        {
            if (auto ip = string_field(fields, "destination_ip_address"))
            {
                services_.peers.learn(*destination_agent_id, *ip);
            }
        }

        const auto rescan = integer_field(fields, "rescan_interval_s").value_or(kDefaultJobRescanSeconds);
        const bool send_receive = *sync_type == "sendreceive";
        protocol::FolderConfig config{
            .id = protocol::job_folder_id(*job_id),
            .label = *name,
            .rescan_interval_s = rescan,
            .fs_watcher_enabled = rescan != 0,
            .ignore_patterns = string_list(fields, "ignore_patterns"),
        };

        std::vector<PeerRef> peers;
        if (is_source)
        {
            config.path = *source_path;
            config.type = send_receive ? protocol::FolderType::SendReceive : protocol::FolderType::SendOnly;

            if (bool_field(fields, "is_multi_destination").value_or(false))
            {
                const auto device_ids = raw_string_list(fields, "destination_device_ids");
                const auto agent_ids = raw_string_list(fields, "destination_agent_ids");
                const auto addresses = raw_string_list(fields, "destination_ip_addresses");
                for (std::size_t i = 0; i < device_ids.size(); ++i)
                {
                    if (device_ids[i].empty())
                    {
                        continue;
                    }
                    config.devices.push_back(device_ids[i]);
                    PeerRef peer{.device_id = device_ids[i], .agent_id = i < agent_ids.size() ? agent_ids[i] : ""};
                    if (i < addresses.size() && !addresses[i].empty())
                    {
                        peer.host = addresses[i];
                        services_.peers.learn(peer.agent_id, addresses[i]);
                    }
                    peers.push_back(std::move(peer));
                }
                if (config.devices.empty())
                {
                    deploy_error(ErrorCode::InvalidPayload, "Missing destination_device_ids for multi-destination job");
                    return;
                }
                spdlog::info("Job {} syncs to {} destinations", *job_id, config.devices.size());
            }
            else
            {
                const auto destination_device_id = string_field(fields, "destination_device_id");
                if (!destination_device_id)
                {
                    deploy_error(ErrorCode::InvalidPayload, "Missing destination_device_id field");
                    return;
                }
                config.devices.push_back(*destination_device_id);
                peers.push_back(PeerRef{
                    .device_id = *destination_device_id,
                    .agent_id = destination_agent_id.value_or(""),
                    .host = string_field(fields, "destination_ip_address"),
                });
            }
        }
        else
        {
            const auto source_device_id = string_field(fields, "source_device_id");
            if (!source_device_id)
            {
                deploy_error(ErrorCode::InvalidPayload, "Missing source_device_id field");
                return;
            }
            config.path = *destination_path;
            config.type = send_receive ? protocol::FolderType::SendReceive : protocol::FolderType::ReceiveOnly;
            config.devices.push_back(*source_device_id);
            peers.push_back(PeerRef{
                .device_id = *source_device_id,
                .agent_id = *source_agent_id,
                .host = string_field(fields, "source_ip_address"),
            });
        }

        for (const auto &peer : peers)
        {
            if (peer.agent_id.empty())
            {
                spdlog::warn("Missing pairing info for a peer of job {} (device {})", *job_id, peer.device_id);
                continue;
            }
            if (const auto host = resolve_peer_host(peer.agent_id, peer.host))
            {
                pair_device(*job_id, peer.device_id, peer.agent_id, *host);
            }
            else
            {
                spdlog::warn("Could not resolve an address for peer {} of job {}", peer.agent_id, *job_id);
            }
        }

        bool exists = false;
        try
        {
            exists = services_.engine.has_folder(config.id);
            if (exists)
            {
                spdlog::info("Updating existing job {} as folder {}", *job_id, config.id);
                services_.engine.update_folder(config);
                try
                {
                    services_.engine.scan_folder(config.id);
                }
                catch (const EngineError &ex)
                {
                    spdlog::warn("Rescan after updating {} failed: {}", config.id, ex.what());
                }
            }
            else
            {
                spdlog::info("Adding new job {} as folder {} ({})", *job_id, config.id,
                             protocol::to_string(config.type));
                services_.engine.add_folder(config);
            }
        }
        catch (const EngineError &ex)
        {
            deploy_error(ex.code(), std::string("Failed to deploy job: ") + ex.what());
            return;
        }
        catch (const std::exception &ex)
        {
            deploy_error(ErrorCode::InternalError, std::string("Failed to deploy job: ") + ex.what());
            return;
        }

        services_.sink.send(protocol::JobReply{
            .event = JobEvent::Deployed,
            .job_id = *job_id,
            .folder_id = config.id,
            .message = "Job " + *name + (exists ? " updated" : " deployed") + " successfully",
            .cli_id = request.cli_id,
        });
    }

    void Dispatcher::handle_pause_job(const Request &request)
    {
        const auto job_id = string_field(request.fields, "job_id");
        if (!job_id)
        {
            services_.sink.send(protocol::JobReply{
                .event = JobEvent::PauseError,
                .message = "Missing job_id field",
                .code = ErrorCode::InvalidPayload,
                .cli_id = request.cli_id,
            });
            return;
        }

        const auto folder_id = protocol::job_folder_id(*job_id);
        try
        {
            services_.engine.pause_folder(folder_id);
        }
        catch (const EngineError &ex)
        {
            spdlog::warn("Failed to pause folder {} for job {}: {}", folder_id, *job_id, ex.what());
            services_.sink.send(protocol::JobReply{
                .event = JobEvent::PauseError,
                .job_id = *job_id,
                .message = "No folders found to pause for job " + *job_id + ": " + ex.what(),
                .code = ex.code(),
                .cli_id = request.cli_id,
            });
            return;
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to pause folder {} for job {}: {}", folder_id, *job_id, ex.what());
            services_.sink.send(protocol::JobReply{
                .event = JobEvent::PauseError,
                .job_id = *job_id,
                .message = "Failed to pause job " + *job_id + ": " + ex.what(),
                .code = ErrorCode::InternalError,
                .cli_id = request.cli_id,
            });
            return;
        }
        services_.jobs.pause_stats(*job_id);
        spdlog::info("Paused job {}", *job_id);
        services_.sink.send(protocol::JobReply{
            .event = JobEvent::Paused,
            .job_id = *job_id,
            .folders = {folder_id},
            .message = "Job " + *job_id + " paused successfully",
            .cli_id = request.cli_id,
        });
    }

    void Dispatcher::handle_resume_job(const Request &request)
    {
        const auto job_id = string_field(request.fields, "job_id");
        if (!job_id)
        {
            services_.sink.send(protocol::JobReply{
                .event = JobEvent::ResumeError,
                .message = "Missing job_id field",
                .code = ErrorCode::InvalidPayload,
                .cli_id = request.cli_id,
            });
            return;
        }

        const auto folder_id = protocol::job_folder_id(*job_id);
        try
        {
            services_.engine.resume_folder(folder_id);
        }
        catch (const EngineError &ex)
        {
            spdlog::warn("Failed to resume folder {} for job {}: {}", folder_id, *job_id, ex.what());
            services_.sink.send(protocol::JobReply{
                .event = JobEvent::ResumeError,
                .job_id = *job_id,
                .message = "No folders found to resume for job " + *job_id + ": " + ex.what(),
                .code = ex.code(),
                .cli_id = request.cli_id,
            });
            return;
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to resume folder {} for job {}: {}", folder_id, *job_id, ex.what());
            services_.sink.send(protocol::JobReply{
                .event = JobEvent::ResumeError,
                .job_id = *job_id,
                .message = "Failed to resume job " + *job_id + ": " + ex.what(),
                .code = ErrorCode::InternalError,
                .cli_id = request.cli_id,
            });
            return;
        }
        spdlog::info("Resumed job {}", *job_id);
        services_.sink.send(protocol::JobReply{
            .event = JobEvent::Resumed,
            .job_id = *job_id,
            .folders = {folder_id},
            .message = "Job " + *job_id + " resumed successfully",
            .cli_id = request.cli_id,
        });
    }

    void Dispatcher::handle_delete_job(const Request &request)
    {
        const auto job_id = string_field(request.fields, "job_id");
        if (!job_id)
        {
            services_.sink.send(protocol::JobReply{
                .event = JobEvent::DeleteError,
                .message = "Missing job_id field",
                .code = ErrorCode::InvalidPayload,
                .cli_id = request.cli_id,
            });
            return;
        }

        // Timers go first so no stats or resync run against a folder being removed.
        services_.jobs.stop(*job_id);

        const auto folder_id = protocol::job_folder_id(*job_id);
        try
        {
            services_.engine.remove_folder(folder_id);
        }
        catch (const EngineError &ex)
        {
            spdlog::warn("Failed to delete folder {} for job {}: {}", folder_id, *job_id, ex.what());
            services_.sink.send(protocol::JobReply{
                .event = JobEvent::DeleteError,
                .job_id = *job_id,
                .message = "No folders found to delete for job " + *job_id + ": " + ex.what(),
                .code = ex.code(),
                .cli_id = request.cli_id,
            });
            return;
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to delete folder {} for job {}: {}", folder_id, *job_id, ex.what());
            services_.sink.send(protocol::JobReply{
                .event = JobEvent::DeleteError,
                .job_id = *job_id,
                .message = "Failed to delete job " + *job_id + ": " + ex.what(),
                .code = ErrorCode::InternalError,
                .cli_id = request.cli_id,
            });
            return;
        }
        spdlog::info("Deleted job {}", *job_id);
        services_.sink.send(protocol::JobReply{
            .event = JobEvent::Deleted,
            .job_id = *job_id,
            .folders = {folder_id},
            .message = "Job " + *job_id + " deleted successfully",
            .cli_id = request.cli_id,
        });
    }

    std::optional<std::string> Dispatcher::resolve_peer_host(const std::string &agent_id,
                                                             const std::optional<std::string> &from_message)
    {
        if (from_message)
        {
            return from_message;
        }
        if (auto known = services_.peers.lookup(agent_id))
        {
            return known;
        }
        if (services_.advertise_address)
        {
            const auto host = host_of(*services_.advertise_address);
            if (!host.empty())
            {
                spdlog::warn("No address known for peer {}, guessing {} from the advertise address", agent_id, host);
                return host;
            }
        }
        if (!services_.coordinator_host.empty())
        {
            spdlog::warn("No address known for peer {}, guessing the coordinator host {}", agent_id,
                         services_.coordinator_host);
            return services_.coordinator_host;
        }
        return std::nullopt;
    }

    void Dispatcher::pair_device(const std::string &job_id, const std::string &device_id,
                                 const std::string &agent_id, const std::string &host)
    {
        const auto address = dispatcher_common::peer_address(host);
        try
        {
            services_.engine.add_device(protocol::DeviceConfig{
                .device_id = device_id,
                .name = agent_id,
                .address = address,
            });
            spdlog::info("Paired device {} ({}) at {} for job {}", agent_id, device_id, address, job_id);
        }
        catch (const EngineError &ex)
        {
            if (ex.code() == ErrorCode::AlreadyExists)
            {
                spdlog::debug("Device {} already paired", device_id);
                return;
            }
            spdlog::warn("Failed to pair device {} for job {}: {} (continuing)", agent_id, job_id, ex.what());
        }
    }

} // namespace fleetsync::agent
