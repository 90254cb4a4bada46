/**
 * fleetsync - Interface to the embedded file-synchronization engine.
 */
#pragma once

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fleetsync/error_codes.hpp"
#include "fleetsync/protocol.hpp"

namespace fleetsync::agent
{

    class EngineError : public std::runtime_error
    {
    public:
        EngineError(fleetsync::ErrorCode code, std::string message);

        fleetsync::ErrorCode code() const noexcept { return code_; }

    private:
        fleetsync::ErrorCode code_;
    };

    struct EngineEvent
    {
        std::string type;
        std::chrono::system_clock::time_point time{};
        nlohmann::json data{nlohmann::json::object()};
    };

    // Operations throw EngineError on failure. Implementations must be safe to
    // call from several threads.
    class SyncEngine
    {
    public:
        using EventHandler = std::function<void(EngineEvent)>;

        virtual ~SyncEngine() = default;

        virtual void start() = 0;
        virtual void stop() = 0;
        virtual bool running() const = 0;

        // Must be installed before start().
        virtual void set_event_handler(EventHandler handler) = 0;
        virtual void set_event_debug(bool enabled) = 0;

        virtual std::string device_id() const = 0;

        virtual void add_folder(const protocol::FolderConfig &config) = 0;
        virtual void update_folder(const protocol::FolderConfig &config) = 0;
        virtual void remove_folder(const std::string &folder_id) = 0;
        virtual bool has_folder(const std::string &folder_id) const = 0;
        virtual std::vector<protocol::FolderConfig> folders() const = 0;

        virtual void pause_folder(const std::string &folder_id) = 0;
        virtual void resume_folder(const std::string &folder_id) = 0;
        virtual void scan_folder(const std::string &folder_id) = 0;
        virtual protocol::FolderStatus folder_status(const std::string &folder_id) const = 0;

        virtual void revert_folder(const std::string &folder_id) = 0;
        virtual void override_folder(const std::string &folder_id) = 0;
        virtual void reset_folder_database(const std::string &folder_id) = 0;

        virtual void add_device(const protocol::DeviceConfig &device) = 0;
        virtual std::vector<protocol::ConnectionInfo> connections() const = 0;
    };

} // namespace fleetsync::agent
