/**
 * fleetsync - In-process SyncEngine without a peer transport.
 *
 * Keeps folder and device configuration in memory, persisted under the data
 * directory, and derives folder status from the local filesystem. Scans emit
 * the same state_changed/folder_scan_progress events the full engine does.
 */
#pragma once

#include <atomic>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>

#include "fleetsync/agent/sync_engine.hpp"

namespace fleetsync::agent
{

    class StandaloneEngine : public SyncEngine
    {
    public:
        explicit StandaloneEngine(std::filesystem::path data_dir);

        void start() override;
        void stop() override;
        bool running() const override;

        void set_event_handler(EventHandler handler) override;
        void set_event_debug(bool enabled) override;

        std::string device_id() const override;

        void add_folder(const protocol::FolderConfig &config) override;
        void update_folder(const protocol::FolderConfig &config) override;
        void remove_folder(const std::string &folder_id) override;
        bool has_folder(const std::string &folder_id) const override;
        std::vector<protocol::FolderConfig> folders() const override;

        void pause_folder(const std::string &folder_id) override;
        void resume_folder(const std::string &folder_id) override;
        void scan_folder(const std::string &folder_id) override;
        protocol::FolderStatus folder_status(const std::string &folder_id) const override;

        // Revert applies to receive-only folders and override to send-only ones, as in the full engine.
        void revert_folder(const std::string &folder_id) override;
        void override_folder(const std::string &folder_id) override;
        void reset_folder_database(const std::string &folder_id) override;

        void add_device(const protocol::DeviceConfig &device) override;
        std::vector<protocol::ConnectionInfo> connections() const override;

        static std::string generate_device_id();

    private:
        protocol::FolderConfig &require_folder(const std::string &folder_id);
        const protocol::FolderConfig &require_folder(const std::string &folder_id) const;
        void load_state();
        void save_state() const;
        void load_device_id();
        void emit(std::string type, nlohmann::json data);

        std::filesystem::path data_dir_;
        std::filesystem::path state_path_;

        mutable std::mutex mutex_;
        std::map<std::string, protocol::FolderConfig> folders_;
        std::map<std::string, protocol::DeviceConfig> devices_;
        std::map<std::string, std::int64_t> versions_;
        std::string device_id_;
        bool running_{false};

        std::mutex handler_mutex_;
        EventHandler handler_;
        std::atomic<bool> event_debug_{false};
    };

} // namespace fleetsync::agent
