/**
 * fleetsync - Routes coordinator requests to their handlers.
 *
 * Every handled request yields exactly one success or one error message; error
 * messages carry the request's cli_id when it had one.
 */
#pragma once

#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "fleetsync/agent/job_monitor.hpp"
#include "fleetsync/agent/message_sink.hpp"
#include "fleetsync/agent/peer_directory.hpp"
#include "fleetsync/agent/progress_tracker.hpp"
#include "fleetsync/agent/sync_engine.hpp"
#include "fleetsync/error_codes.hpp"
#include "fleetsync/protocol.hpp"

namespace fleetsync::agent
{

    struct DispatcherServices
    {
        SyncEngine &engine;
        MessageSink &sink;
        ProgressTracker &progress;
        JobMonitor &jobs;
        PeerDirectory &peers;
        std::string agent_id;
        std::optional<std::string> advertise_address;
        std::string coordinator_host;
        std::function<protocol::AgentStatus()> status_provider;
        std::function<void(std::optional<bool>)> reload;
    };

    class Dispatcher
    {
    public:
        explicit Dispatcher(DispatcherServices services);

        // Never throws; malformed messages are logged.
        void handle(const nlohmann::json &message);
        void handle(const protocol::InboundEnvelope &envelope);

    private:
        struct Request
        {
            const nlohmann::json &fields;
            std::optional<std::string> cli_id;
            std::string command;
        };

        void route(protocol::MessageType kind, const Request &request);
        void handle_command(const protocol::InboundEnvelope &envelope);
        void reject_unknown(const std::string &kind, const std::optional<std::string> &cli_id);

        // Device and folder management
        void handle_add_device(const Request &request);
        void handle_add_folder(const Request &request);
        void handle_remove_folder(const Request &request);
        void handle_list_devices(const Request &request);
        void handle_list_folders(const Request &request);
        void handle_get_device_id(const Request &request);
        void handle_reload_config(const Request &request);
        void handle_scan_folder(const Request &request);
        void handle_get_status(const Request &request);

        // Jobs
        void handle_deploy_job(const Request &request);
        void handle_pause_job(const Request &request);
        void handle_resume_job(const Request &request);
        void handle_delete_job(const Request &request);

        void handle_browse_folders(const Request &request);
        void handle_get_folder_stats(const Request &request);

        std::optional<std::string> resolve_peer_host(const std::string &agent_id,
                                                     const std::optional<std::string> &from_message);
        void pair_device(const std::string &job_id, const std::string &device_id, const std::string &agent_id,
                         const std::string &host);

        void reply(const Request &request, std::string direct_type, std::string message,
                   nlohmann::json payload = nlohmann::json::object());
        void send_error(const Request &request, ErrorCode code, std::string message);

        DispatcherServices services_;
    };

} // namespace fleetsync::agent
