#include <asio/io_context.hpp>

#include <cassert>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fleetsync/agent/auto_resync.hpp"
#include "fleetsync/agent/dispatcher.hpp"
#include "fleetsync/agent/job_monitor.hpp"
#include "fleetsync/agent/peer_directory.hpp"
#include "fleetsync/agent/progress_tracker.hpp"
#include "fleetsync/agent/scheduler.hpp"
#include "test_support.hpp"

using namespace fleetsync;
using namespace fleetsync::agent;
using namespace fleetsync::test;
using nlohmann::json;

namespace
{

    // Dispatcher for agent "a1" wired to a fake engine. The scheduler's io_context
    // is never run, so periodic job tasks only register.
    struct Harness
    {
        explicit Harness(std::map<std::string, std::string> peer_map = {},
                         std::optional<std::string> advertise_address = std::nullopt,
                         std::string coordinator_host = "coord.example.com")
            : scheduler(io),
              resync(engine, sink),
              jobs(scheduler, engine, progress, resync, sink, "a1", MonitoringSettings{}),
              peers(std::move(peer_map)),
              dispatcher(DispatcherServices{
                  .engine = engine,
                  .sink = sink,
                  .progress = progress,
                  .jobs = jobs,
                  .peers = peers,
                  .agent_id = "a1",
                  .advertise_address = std::move(advertise_address),
                  .coordinator_host = std::move(coordinator_host),
                  .status_provider = [this]
                  { return protocol::AgentStatus{.agent_id = "a1", .device_id = engine.device_id(), .running = true}; },
                  .reload = [this](std::optional<bool> event_debug)
                  { reloads.push_back(event_debug); },
              }) {}

        ~Harness() { scheduler.cancel_all(); }

        json handle(const json &message)
        {
            const auto before = sink.size();
            dispatcher.handle(message);
            assert(sink.size() == before + 1);
            return sink.last();
        }

        void handle_silently(const json &message)
        {
            const auto before = sink.size();
            dispatcher.handle(message);
            assert(sink.size() == before);
        }

        asio::io_context io;
        Scheduler scheduler;
        FakeSyncEngine engine;
        RecordingSink sink;
        ProgressTracker progress;
        AutoResyncMonitor resync;
        JobMonitor jobs;
        PeerDirectory peers;
        std::vector<std::optional<bool>> reloads;
        Dispatcher dispatcher;
    };

    json source_deploy(const std::string &job_id)
    {
        return {
            {"type", "deploy_job"},
            {"job_id", job_id},
            {"name", "Backup"},
            {"sync_type", "sendonly"},
            {"source_agent_id", "a1"},
            {"destination_agent_id", "a2"},
            {"source_path", "/srv/source"},
            {"destination_path", "/srv/destination"},
            {"destination_device_id", "DEV-2"},
            {"destination_ip_address", "10.0.0.2"},
        };
    }

    json destination_deploy(const std::string &job_id)
    {
        return {
            {"type", "deploy_job"},
            {"job_id", job_id},
            {"name", "Backup"},
            {"sync_type", "sendonly"},
            {"source_agent_id", "a0"},
            {"destination_agent_id", "a1"},
            {"source_path", "/srv/source"},
            {"destination_path", "/srv/destination"},
            {"source_device_id", "DEV-0"},
        };
    }

    void test_add_folder()
    {
        Harness harness;
        auto reply = harness.handle({
            {"type", "add-folder"},
            {"folder_id", "f1"},
            {"path", "/srv/f1"},
            {"folder_type", "receiveonly"},
            {"devices", {" DEV-1 ", ""}},
            {"ignore_patterns", {"*.tmp"}},
        });
        assert(reply.at("type") == "folder_added");
        assert(reply.at("success") == true);
        assert(reply.at("folder_id") == "f1");
        assert(reply.at("message") == "Folder f1 added successfully");
        assert(!reply.contains("cli_id"));

        const auto &config = harness.engine.configs.at("f1");
        assert(config.label == "f1");
        assert(config.type == protocol::FolderType::ReceiveOnly);
        assert(config.devices == std::vector<std::string>{"DEV-1"});
        assert(config.ignore_patterns == std::vector<std::string>{"*.tmp"});
        assert(config.rescan_interval_s == 60);

        reply = harness.handle({{"type", "add-folder"}, {"folder_id", "f1"}, {"path", "/srv/f1-new"}});
        assert(reply.at("type") == "folder_added");
        assert(reply.at("message") == "Folder f1 updated successfully");
        assert(harness.engine.called("update_folder:f1"));
        assert(harness.engine.called("scan_folder:f1"));
        assert(harness.engine.configs.at("f1").path == "/srv/f1-new");

        reply = harness.handle({{"type", "add-folder"}, {"folder_id", "f2"}, {"path", "/x"}, {"folder_type", "mirror"}});
        assert(reply.at("type") == "error");
        assert(reply.at("error") == "invalid_payload");
        assert(reply.at("command") == "add-folder");

        reply = harness.handle({{"type", "add-folder"}, {"folder_id", "f3"}});
        assert(reply.at("error") == "invalid_payload");
        assert(harness.engine.configs.size() == 1);
    }

    void test_command_envelope()
    {
        Harness harness;
        harness.engine.configs["f1"] = protocol::FolderConfig{.id = "f1", .label = "f1", .path = "/srv/f1"};

        auto reply = harness.handle({{"type", "command"}, {"command", "list-folders"}, {"cli_id", "cli-1"}});
        assert(reply.at("type") == "response");
        assert(reply.at("cli_id") == "cli-1");
        assert(reply.at("command") == "list-folders");
        assert(reply.at("folders").size() == 1);

        reply = harness.handle({{"type", "list-folders"}});
        assert(reply.at("type") == "folders_list");

        reply = harness.handle({{"type", "command"}, {"cli_id", "cli-2"}});
        assert(reply.at("type") == "error");
        assert(reply.at("error") == "invalid_command");
        assert(reply.at("cli_id") == "cli-2");
    }

    void test_unknown_commands()
    {
        Harness harness;
        auto reply = harness.handle({{"type", "command"}, {"command", "frobnicate"}, {"cli_id", "cli-3"}});
        assert(reply.at("type") == "error");
        assert(reply.at("error") == "unknown_command");
        assert(reply.at("cli_id") == "cli-3");
        assert(reply.at("command") == "frobnicate");

        reply = harness.handle({{"type", "frobnicate"}, {"cli_id", "cli-4"}});
        assert(reply.at("error") == "unknown_command");

        harness.handle_silently({{"type", "frobnicate"}});
        harness.handle_silently({{"type", "command"}, {"command", "frobnicate"}});
    }

    void test_malformed_messages()
    {
        Harness harness;
        const auto reply = harness.handle({{"cli_id", "cli-5"}, {"command", "list-folders"}});
        assert(reply.at("type") == "error");
        assert(reply.at("error") == "invalid_payload");
        assert(reply.at("cli_id") == "cli-5");

        harness.handle_silently({{"command", "list-folders"}});
        harness.handle_silently(json::array({1, 2, 3}));
        harness.handle_silently({{"type", 7}});
    }

    void test_ping_and_pong()
    {
        Harness harness;
        const auto reply = harness.handle({{"type", "ping"}});
        assert(reply == json({{"type", "pong"}}));
        harness.handle_silently({{"type", "pong"}});
    }

    void test_device_commands()
    {
        Harness harness;
        auto reply = harness.handle({{"type", "add-device"}, {"device_id", "DEV-9"}, {"name", "peer"}, {"address", "dynamic"}});
        assert(reply.at("type") == "device_added");
        assert(reply.at("device_id") == "DEV-9");
        assert(harness.engine.called("add_device:DEV-9@dynamic"));

        reply = harness.handle({{"type", "add-device"}, {"device_id", "DEV-9"}, {"name", "peer"}, {"address", "dynamic"}});
        assert(reply.at("type") == "device_added");
        assert(reply.at("message") == "Device peer already exists");

        reply = harness.handle({{"type", "add-device"}, {"device_id", "DEV-10"}});
        assert(reply.at("error") == "invalid_payload");

        reply = harness.handle({{"type", "list-devices"}});
        assert(reply.at("type") == "devices_list");
        assert(reply.at("devices").size() == 1);

        reply = harness.handle({{"type", "get-device-id"}, {"cli_id", "cli-6"}});
        assert(reply.at("type") == "response");
        assert(reply.at("device_id") == "LOCAL-DEVICE");
    }

    void test_folder_commands()
    {
        Harness harness;
        harness.engine.configs["job-j1"] = protocol::FolderConfig{.id = "job-j1", .path = "/srv/j1"};
        harness.jobs.start("j1");

        auto reply = harness.handle({{"type", "scan-folder"}, {"folder_id", "job-j1"}});
        assert(reply.at("type") == "scan_triggered");
        assert(reply.at("message") == "Folder scan triggered for: job-j1");

        reply = harness.handle({{"type", "scan-folder"}, {"folder_id", "nope"}});
        assert(reply.at("error") == "not_found");

        reply = harness.handle({{"type", "scan-folder"}});
        assert(reply.at("error") == "invalid_payload");

        reply = harness.handle({{"type", "remove-folder"}, {"folder_id", "job-j1"}});
        assert(reply.at("type") == "folder_removed");
        assert(!harness.engine.has_folder("job-j1"));
        assert(!harness.jobs.resync_active("j1"));

        reply = harness.handle({{"type", "remove-folder"}, {"folder_id", "job-j1"}, {"cli_id", "cli-7"}});
        assert(reply.at("error") == "not_found");
        assert(reply.at("cli_id") == "cli-7");
    }

    void test_reload_and_status()
    {
        Harness harness;
        auto reply = harness.handle({{"type", "reload-config"}, {"event_debug", true}});
        assert(reply.at("type") == "config_reloaded");
        assert(reply.at("event_debug") == true);

        reply = harness.handle({{"type", "reload-config"}});
        assert(!reply.contains("event_debug"));
        assert(harness.reloads.size() == 2);
        assert(harness.reloads[0] == std::optional<bool>(true));
        assert(!harness.reloads[1].has_value());

        reply = harness.handle({{"type", "get-status"}});
        assert(reply.at("type") == "status");
        assert(reply.at("data").at("agent_id") == "a1");

        reply = harness.handle({{"type", "command"}, {"command", "get-status"}, {"cli_id", "cli-8"}});
        assert(reply.at("type") == "response");
        assert(reply.at("status").at("device_id") == "LOCAL-DEVICE");
    }

    void test_deploy_as_source()
    {
        Harness harness;
        auto message = source_deploy("j1");
        message["cli_id"] = "cli-9";
        message["ignore_patterns"] = {"*.log"};
        auto reply = harness.handle(message);
        assert(reply.at("type") == "job_deployed");
        assert(reply.at("job_id") == "j1");
        assert(reply.at("folder_id") == "job-j1");
        assert(reply.at("message") == "Job Backup deployed successfully");
        assert(reply.at("cli_id") == "cli-9");
        assert(!reply.contains("error"));

        const auto &config = harness.engine.configs.at("job-j1");
        assert(config.type == protocol::FolderType::SendOnly);
        assert(config.path == "/srv/source");
        assert(config.label == "Backup");
        assert(config.devices == std::vector<std::string>{"DEV-2"});
        assert(config.rescan_interval_s == 3600);
        assert(config.ignore_patterns == std::vector<std::string>{"*.log"});
        assert(harness.engine.called("add_device:DEV-2@tcp://10.0.0.2:22101"));
        assert(harness.peers.lookup("a2") == std::string("10.0.0.2"));

        reply = harness.handle(source_deploy("j1"));
        assert(reply.at("type") == "job_deployed");
        assert(reply.at("message") == "Job Backup updated successfully");
        assert(harness.engine.called("update_folder:job-j1"));
        assert(harness.engine.called("scan_folder:job-j1"));
        assert(harness.engine.devices.size() == 1);

        message = source_deploy("j2");
        message["sync_type"] = "sendreceive";
        harness.handle(message);
        assert(harness.engine.configs.at("job-j2").type == protocol::FolderType::SendReceive);
    }

    void test_deploy_as_destination()
    {
        Harness harness(std::map<std::string, std::string>{{"a0", "10.0.0.9"}});
        const auto reply = harness.handle(destination_deploy("j1"));
        assert(reply.at("type") == "job_deployed");

        const auto &config = harness.engine.configs.at("job-j1");
        assert(config.type == protocol::FolderType::ReceiveOnly);
        assert(config.path == "/srv/destination");
        assert(config.devices == std::vector<std::string>{"DEV-0"});
        assert(harness.engine.called("add_device:DEV-0@tcp://10.0.0.9:22101"));

        auto message = destination_deploy("j2");
        message["source_ip_address"] = "fd00::7";
        harness.handle(message);
        assert(harness.engine.devices.size() == 1);
        assert(harness.peers.lookup("a0") == std::string("fd00::7"));
    }

    void test_peer_address_fallbacks()
    {
        Harness advertised({}, std::string("tcp://192.168.1.5:8090"));
        advertised.handle(destination_deploy("j1"));
        assert(advertised.engine.called("add_device:DEV-0@tcp://192.168.1.5:22101"));

        Harness coordinator;
        coordinator.handle(destination_deploy("j1"));
        assert(coordinator.engine.called("add_device:DEV-0@tcp://coord.example.com:22101"));

        Harness unresolved({}, std::nullopt, "");
        const auto reply = unresolved.handle(destination_deploy("j1"));
        assert(reply.at("type") == "job_deployed");
        assert(unresolved.engine.devices.empty());
    }

    void test_deploy_multi_destination()
    {
        Harness harness;
        auto message = source_deploy("j1");
        message.erase("destination_device_id");
        message["is_multi_destination"] = true;
        message["destination_device_ids"] = {"DEV-2", "", "DEV-3"};
        message["destination_agent_ids"] = {"a2", "a9", "a3"};
        message["destination_ip_addresses"] = {"10.0.0.2", "", "10.0.0.3"};
        const auto reply = harness.handle(message);
        assert(reply.at("type") == "job_deployed");
        assert((harness.engine.configs.at("job-j1").devices == std::vector<std::string>{"DEV-2", "DEV-3"}));
        assert(harness.engine.called("add_device:DEV-2@tcp://10.0.0.2:22101"));
        assert(harness.engine.called("add_device:DEV-3@tcp://10.0.0.3:22101"));
        assert(harness.peers.lookup("a3") == std::string("10.0.0.3"));

        message["destination_device_ids"] = json::array();
        const auto error = harness.handle(message);
        assert(error.at("type") == "job_deploy_error");
        assert(error.at("error") == "invalid_payload");
    }

    void test_deploy_rejections()
    {
        Harness harness;
        auto message = source_deploy("j1");
        message["source_agent_id"] = "a7";
        message["destination_agent_id"] = "a8";
        message["cli_id"] = "cli-10";
        auto reply = harness.handle(message);
        assert(reply.at("type") == "job_deploy_error");
        assert(reply.at("error") == "not_participant");
        assert(reply.at("cli_id") == "cli-10");
        assert(harness.engine.configs.empty());

        message = source_deploy("j1");
        message.erase("sync_type");
        reply = harness.handle(message);
        assert(reply.at("error") == "invalid_payload");

        message = source_deploy("j1");
        message.erase("source_path");
        reply = harness.handle(message);
        assert(reply.at("error") == "invalid_payload");

        message = destination_deploy("j1");
        message.erase("source_device_id");
        reply = harness.handle(message);
        assert(reply.at("error") == "invalid_payload");
        assert(harness.engine.calls().empty());
    }

    void test_job_lifecycle()
    {
        Harness harness;
        harness.handle(source_deploy("j1"));
        harness.jobs.start("j1");

        auto reply = harness.handle({{"type", "pause_job"}, {"job_id", "j1"}});
        assert(reply.at("type") == "job_paused");
        assert(reply.at("paused_folders") == json::array({"job-j1"}));
        assert(harness.engine.configs.at("job-j1").paused);
        assert(!harness.jobs.stats_active("j1"));
        assert(harness.jobs.resync_active("j1"));

        reply = harness.handle({{"type", "resume_job"}, {"job_id", "j1"}, {"cli_id", "cli-11"}});
        assert(reply.at("type") == "job_resumed");
        assert(reply.at("resumed_folders") == json::array({"job-j1"}));
        assert(reply.at("cli_id") == "cli-11");
        assert(!harness.engine.configs.at("job-j1").paused);

        reply = harness.handle({{"type", "delete_job"}, {"job_id", "j1"}});
        assert(reply.at("type") == "job_deleted");
        assert(reply.at("deleted_folders") == json::array({"job-j1"}));
        assert(!harness.engine.has_folder("job-j1"));
        assert(!harness.jobs.resync_active("j1"));

        reply = harness.handle({{"type", "pause_job"}, {"job_id", "j1"}});
        assert(reply.at("type") == "job_pause_error");
        assert(reply.at("error") == "not_found");

        reply = harness.handle({{"type", "resume_job"}, {"job_id", "j1"}});
        assert(reply.at("type") == "job_resume_error");

        reply = harness.handle({{"type", "delete_job"}, {"job_id", "j1"}});
        assert(reply.at("type") == "job_delete_error");

        reply = harness.handle({{"type", "delete_job"}});
        assert(reply.at("type") == "job_delete_error");
        assert(reply.at("error") == "invalid_payload");
    }

    void test_job_handlers_report_unexpected_failures()
    {
        Harness harness;
        harness.engine.fail_unexpectedly = true;

        auto deploy = source_deploy("j2");
        deploy["cli_id"] = "cli-14";
        auto reply = harness.handle(deploy);
        assert(reply.at("type") == "job_deploy_error");
        assert(reply.at("error") == "internal_error");
        assert(reply.at("job_id") == "j2");
        assert(reply.at("cli_id") == "cli-14");
        assert(!harness.engine.configs.contains("job-j2"));

        reply = harness.handle({{"type", "pause_job"}, {"job_id", "j2"}});
        assert(reply.at("type") == "job_pause_error");
        assert(reply.at("error") == "internal_error");

        reply = harness.handle({{"type", "resume_job"}, {"job_id", "j2"}});
        assert(reply.at("type") == "job_resume_error");
        assert(reply.at("error") == "internal_error");

        reply = harness.handle({{"type", "delete_job"}, {"job_id", "j2"}, {"cli_id", "cli-15"}});
        assert(reply.at("type") == "job_delete_error");
        assert(reply.at("error") == "internal_error");
        assert(reply.at("cli_id") == "cli-15");
    }

    void test_folder_stats()
    {
        Harness harness;
        protocol::FolderStatus status;
        status.id = "job-j1";
        status.global_files = 12;
        status.local_files = 12;
        harness.engine.set_status(status);
        harness.progress.update_folder_progress("job-j1", "syncing", 100.0, 40.0);

        auto reply = harness.handle({{"type", "get_folder_stats"}, {"folder_id", "job-j1"}, {"cli_id", "cli-12"}});
        assert(reply.at("type") == "folder_stats_response");
        assert(reply.at("agent_id") == "a1");
        assert(reply.at("stats").at("globalFiles") == 12);
        assert(reply.contains("progress"));
        assert(reply.at("cli_id") == "cli-12");

        reply = harness.handle({{"type", "get_folder_stats"}, {"folder_id", "job-j9"}});
        assert(reply.at("type") == "folder_stats_error");
        assert(reply.at("error") == "not_found");
        assert(reply.at("folder_id") == "job-j9");

        reply = harness.handle({{"type", "get_folder_stats"}});
        assert(reply.at("type") == "folder_stats_error");
        assert(reply.at("error") == "invalid_payload");
    }

    void test_browse_folders()
    {
        const auto root = fresh_directory("dispatch_browse");
        std::filesystem::create_directories(root / "child" / "grandchild");

        Harness harness;
        auto reply = harness.handle({{"type", "browse_folders"}, {"path", root.string()}, {"depth", 1}, {"cli_id", "cli-13"}});
        assert(reply.at("type") == "browse_response");
        assert(reply.at("path") == root.string());
        assert(reply.at("cli_id") == "cli-13");
        const auto &children = reply.at("data").at("children");
        assert(children.size() == 1);
        assert(children[0].at("name") == "child");
        assert(!children[0].contains("children"));

        reply = harness.handle({{"type", "browse_folders"}, {"path", (root / "missing").string()}});
        assert(reply.at("type") == "browse_error");
        assert(!reply.contains("cli_id"));
        cleanup_path(root);
    }

} // namespace

void run_agent_dispatcher_tests()
{
    test_add_folder();
    test_command_envelope();
    test_unknown_commands();
    test_malformed_messages();
    test_ping_and_pong();
    test_device_commands();
    test_folder_commands();
    test_reload_and_status();
    test_deploy_as_source();
    test_deploy_as_destination();
    test_peer_address_fallbacks();
    test_deploy_multi_destination();
    test_deploy_rejections();
    test_job_lifecycle();
    test_job_handlers_report_unexpected_failures();
    test_folder_stats();
    test_browse_folders();
}
