#include <array>
#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fleetsync/error_codes.hpp"
#include "fleetsync/framing.hpp"
#include "fleetsync/messages.hpp"
#include "fleetsync/protocol.hpp"

using namespace fleetsync;
using namespace fleetsync::protocol;

void run_agent_component_tests();
void run_agent_dispatcher_tests();
void run_agent_connection_tests();

namespace
{

    void test_error_codes()
    {
        assert(to_string(ErrorCode::UnknownCommand) == "unknown_command");
        assert(to_string(ErrorCode::NotParticipant) == "not_participant");
        assert(to_string(ErrorCode::AlreadyExists) == "already_exists");
        assert(to_string(ErrorCode::EngineUnavailable) == "engine_unavailable");
    }

    void test_inbound_envelope()
    {
        const auto envelope = nlohmann::json{{"type", "deploy_job"}, {"cli_id", "cli-7"}, {"job_id", "j1"}}
                                  .get<InboundEnvelope>();
        assert(envelope.kind == MessageType::DeployJob);
        assert(envelope.cli_id == std::string("cli-7"));
        assert(envelope.fields.at("job_id") == "j1");

        const auto unknown = nlohmann::json{{"type", "make-coffee"}, {"cli_id", ""}}.get<InboundEnvelope>();
        assert(unknown.type == "make-coffee");
        assert(!unknown.kind.has_value());
        assert(!unknown.cli_id.has_value());

        bool threw = false;
        try
        {
            (void)nlohmann::json{{"command", "list-folders"}}.get<InboundEnvelope>();
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_job_folder_mapping()
    {
        assert(job_folder_id("j1") == "job-j1");
        assert(job_id_from_folder("job-j1") == std::string("j1"));
        assert(!job_id_from_folder("documents").has_value());
        assert(!job_id_from_folder("job-").has_value());
    }

    void test_timestamp_format()
    {
        const auto time = std::chrono::system_clock::time_point(std::chrono::milliseconds{1714558830123});
        assert(format_timestamp(time) == "2024-05-01T10:20:30.123Z");
    }

    void test_folder_config_json()
    {
        const auto config = nlohmann::json{{"id", "job-j1"}, {"path", "/srv/data"}, {"type", "receiveonly"}}
                                .get<FolderConfig>();
        assert(config.label == "job-j1");
        assert(config.type == FolderType::ReceiveOnly);
        assert(config.rescan_interval_s == 60);
        assert(config.fs_watcher_enabled);

        const auto json = nlohmann::json(config);
        assert(json.at("type") == "receiveonly");
        assert(json.at("path") == "/srv/data");

        bool threw = false;
        try
        {
            (void)nlohmann::json{{"id", "x"}, {"type", "mirror"}}.get<FolderConfig>();
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_command_reply_shapes()
    {
        const CommandReply direct{
            .reply_type = "folder_added",
            .command = "add-folder",
            .message = "Folder f1 added successfully",
            .payload = {{"folder_id", "f1"}},
        };
        const auto direct_json = serialize(direct);
        assert(direct_json.at("type") == "folder_added");
        assert(direct_json.at("success") == true);
        assert(direct_json.at("folder_id") == "f1");
        assert(!direct_json.contains("cli_id"));
        assert(message_type(direct) == "folder_added");

        CommandReply relayed = direct;
        relayed.cli_id = "cli-1";
        const auto relayed_json = serialize(relayed);
        assert(relayed_json.at("type") == "response");
        assert(relayed_json.at("cli_id") == "cli-1");
        assert(relayed_json.at("command") == "add-folder");
    }

    void test_error_and_job_replies()
    {
        const auto error = serialize(ErrorReply{
            .cli_id = "cli-2",
            .command = "frobnicate",
            .code = ErrorCode::UnknownCommand,
            .message = "Unknown command: frobnicate",
        });
        assert(error.at("type") == "error");
        assert(error.at("error") == "unknown_command");
        assert(error.at("cli_id") == "cli-2");

        const auto paused = serialize(JobReply{
            .event = JobEvent::Paused,
            .job_id = "j1",
            .folders = {"job-j1"},
            .message = "Job j1 paused successfully",
        });
        assert(paused.at("type") == "job_paused");
        assert(paused.at("paused_folders") == nlohmann::json::array({"job-j1"}));
        assert(!paused.contains("error"));

        const auto failed = serialize(JobReply{
            .event = JobEvent::DeleteError,
            .job_id = "j1",
            .message = "No folders found",
            .code = ErrorCode::NotFound,
            .cli_id = "cli-3",
        });
        assert(failed.at("type") == "job_delete_error");
        assert(failed.at("error") == "not_found");
        assert(failed.at("cli_id") == "cli-3");
    }

    void test_session_event_shape()
    {
        SyncSessionStats session{
            .session_id = "j1-session-20240501-102030-0000",
            .job_id = "j1",
            .agent_id = "a1",
            .current_state = "scanning",
            .session_start = std::chrono::system_clock::time_point(std::chrono::seconds{1714558830}),
        };
        session.scan_start = session.session_start;
        const auto json = serialize(SessionEvent{.type = SessionEventType::ScanStarted, .session = session});
        assert(json.at("type") == "session_event");
        assert(json.at("event").at("type") == "scan_started");
        const auto &data = json.at("event").at("data");
        assert(data.at("status") == "active");
        assert(data.at("scan_start_time") == "2024-05-01T10:20:30.000Z");
        assert(!data.contains("session_end_time"));
    }

    void test_resync_message_shape()
    {
        const auto json = serialize(AutomaticResyncTriggered{
            .job_id = "j1",
            .folder_id = "job-j1",
            .missing_files = 2,
            .missing_bytes = 0,
            .repair_action = RepairAction::ResetDatabase,
            .success = true,
        });
        assert(json.at("type") == "automatic_resync_triggered");
        assert(json.at("repair_action") == "reset_database");
        assert(json.at("trigger") == "file_deletion_detection");
        assert(json.at("missing_files") == 2);
    }

    void test_framing()
    {
        const nlohmann::json message{{"type", "event"}, {"agent_id", "a1"}};
        const auto frame = encode_frame(message);
        assert(frame.size() > kFrameHeaderSize);
        assert(frame[0] == 0 && frame[1] == 0);

        const auto length = decode_frame_length(std::span<const std::uint8_t, kFrameHeaderSize>(frame.data(), kFrameHeaderSize));
        assert(length == frame.size() - kFrameHeaderSize);
        const auto payload_begin = frame.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize);
        assert(nlohmann::json::parse(payload_begin, frame.end()) == message);

        const std::array<std::uint8_t, kFrameHeaderSize> oversized{0x7F, 0xFF, 0xFF, 0xFF};
        assert(decode_frame_length(oversized) > kMaxFramePayload);

        const nlohmann::json too_big{{"blob", std::string(kMaxFramePayload, 'x')}};
        bool threw = false;
        try
        {
            (void)encode_frame(too_big);
        }
        catch (const std::length_error &)
        {
            threw = true;
        }
        assert(threw);
    }

} // namespace

int main()
{
    try
    {
        test_error_codes();
        test_inbound_envelope();
        test_job_folder_mapping();
        test_timestamp_format();
        test_folder_config_json();
        test_command_reply_shapes();
        test_error_and_job_replies();
        test_session_event_shape();
        test_resync_message_shape();
        test_framing();
        run_agent_component_tests();
        run_agent_dispatcher_tests();
        run_agent_connection_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
