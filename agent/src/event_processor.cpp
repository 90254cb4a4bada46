#include "fleetsync/agent/event_processor.hpp"

#include <chrono>

#include <spdlog/spdlog.h>

namespace fleetsync::agent
{

    namespace
    {

        std::string string_field(const nlohmann::json &data, const char *key)
        {
            if (data.is_object())
            {
                auto it = data.find(key);
                if (it != data.end() && it->is_string())
                {
                    return it->get<std::string>();
                }
            }
            return {};
        }

        // Transfer events name the folder either as folder_id or, from older engines, as job_id.
        std::string transfer_folder(const nlohmann::json &data)
        {
            auto folder = string_field(data, "folder_id");
            return folder.empty() ? string_field(data, "job_id") : folder;
        }

        template <typename T>
        T number_field(const nlohmann::json &data, const char *key, T fallback)
        {
            if (data.is_object())
            {
                auto it = data.find(key);
                if (it != data.end() && it->is_number())
                {
                    return it->get<T>();
                }
            }
            return fallback;
        }

    } // namespace

    EventProcessor::EventProcessor(MessageSink &sink, ProgressTracker &progress, SessionTracker &sessions,
                                   JobMonitor &jobs, std::string agent_id)
        : sink_(sink), progress_(progress), sessions_(sessions), jobs_(jobs), agent_id_(std::move(agent_id)) {}

    void EventProcessor::process(const EngineEvent &event)
    {
        if (event_debug())
        {
            spdlog::info("Engine event {}: {}", event.type, event.data.dump());
        }

        sink_.send(protocol::EventMessage{
            .agent_id = agent_id_,
            .event_type = event.type,
            .event_time = event.time,
            .data = event.data,
            .timestamp = std::chrono::system_clock::now(),
        });

        try
        {
            if (event.type == "state_changed")
            {
                on_state_changed(event.data);
            }
            else if (event.type == "folder_scan_progress")
            {
                on_scan_progress(event.data);
            }
            else if (event.type == "file_transfer_progress")
            {
                on_transfer_progress(event.data);
            }
            else if (event.type == "file_transfer_completed")
            {
                on_transfer_completed(event.data);
            }
            else if (event.type == "sync_error")
            {
                spdlog::warn("Sync error in folder {}: {}", string_field(event.data, "folder_id"),
                             event.data.is_object() && event.data.contains("errors") ? event.data.at("errors").dump()
                                                                                     : std::string("unknown"));
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to process engine event {}: {}", event.type, ex.what());
        }
    }

    void EventProcessor::on_state_changed(const nlohmann::json &data)
    {
        const auto folder_id = string_field(data, "folder");
        const auto to = string_field(data, "to");
        if (folder_id.empty() || to.empty())
        {
            spdlog::debug("state_changed without folder or target state: {}", data.dump());
            return;
        }

        progress_.apply_state_change(folder_id, to);

        const auto job_id = protocol::job_id_from_folder(folder_id);
        if (!job_id)
        {
            return;
        }
        const auto phase = protocol::sync_phase_from_string(to);
        if (phase == protocol::SyncPhase::Scanning || phase == protocol::SyncPhase::Syncing)
        {
            sessions_.update_session(*job_id, to);
            jobs_.start(*job_id);
        }
        else if (phase == protocol::SyncPhase::Idle)
        {
            sessions_.finalize_session(*job_id);
            jobs_.log_final_stats(*job_id);
            jobs_.pause_stats(*job_id);
        }
    }

    void EventProcessor::on_scan_progress(const nlohmann::json &data)
    {
        const auto folder_id = string_field(data, "folder_id");
        if (folder_id.empty())
        {
            return;
        }
        progress_.update_scan_progress(folder_id, number_field(data, "progress", 0.0));
    }

    void EventProcessor::on_transfer_progress(const nlohmann::json &data)
    {
        const auto folder_id = transfer_folder(data);
        if (folder_id.empty())
        {
            return;
        }
        progress_.update_pull_progress(folder_id, number_field(data, "progress", 0.0));
    }

    void EventProcessor::on_transfer_completed(const nlohmann::json &data)
    {
        const auto folder_id = transfer_folder(data);
        const auto job_id = protocol::job_id_from_folder(folder_id);
        if (!job_id)
        {
            return;
        }
        const auto full_size = number_field<std::int64_t>(data, "full_file_size",
                                                          number_field<std::int64_t>(data, "file_size", 0));
        spdlog::debug("File transfer completed in {}: {} ({} bytes)", folder_id, string_field(data, "file_name"),
                      full_size);
        sessions_.record_file_transfer(*job_id, number_field<std::int64_t>(data, "delta_bytes_transferred", 0),
                                       full_size, number_field(data, "transfer_rate", 0.0));
    }

} // namespace fleetsync::agent
