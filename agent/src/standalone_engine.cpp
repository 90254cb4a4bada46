#include "fleetsync/agent/standalone_engine.hpp"

#include <fnmatch.h>

#include <array>
#include <chrono>
#include <fstream>
#include <random>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fleetsync::agent
{

    namespace
    {

        constexpr std::string_view kDeviceIdAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
        constexpr std::size_t kDeviceIdGroups = 8;
        constexpr std::size_t kDeviceIdGroupSize = 7;

        bool is_ignored(const std::vector<std::string> &patterns, const std::string &relative,
                        const std::string &name)
        {
            for (const auto &pattern : patterns)
            {
                if (::fnmatch(pattern.c_str(), relative.c_str(), 0) == 0 ||
                    ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0)
                {
                    return true;
                }
            }
            return false;
        }

        struct Tally
        {
            std::int64_t files{};
            std::int64_t bytes{};
            std::vector<std::string> errors;
        };

        Tally count_files(const protocol::FolderConfig &config)
        {
            Tally tally;
            const std::filesystem::path root(config.path);
            std::error_code ec;
            if (!std::filesystem::is_directory(root, ec))
            {
                tally.errors.push_back("folder path missing: " + config.path);
                return tally;
            }

            std::filesystem::recursive_directory_iterator it(
                root, std::filesystem::directory_options::skip_permission_denied, ec);
            if (ec)
            {
                tally.errors.push_back(ec.message());
                return tally;
            }
            for (const std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec))
            {
                if (ec)
                {
                    tally.errors.push_back(ec.message());
                    break;
                }
                const auto relative = it->path().lexically_relative(root).generic_string();
                const auto name = it->path().filename().string();
                if (is_ignored(config.ignore_patterns, relative, name))
                {
                    if (it->is_directory(ec))
                    {
                        it.disable_recursion_pending();
                    }
                    continue;
                }
                std::error_code file_ec;
                if (it->is_regular_file(file_ec))
                {
                    ++tally.files;
                    const auto size = it->file_size(file_ec);
                    if (!file_ec)
                    {
                        tally.bytes += static_cast<std::int64_t>(size);
                    }
                }
            }
            return tally;
        }

    } // namespace

    StandaloneEngine::StandaloneEngine(std::filesystem::path data_dir)
        : data_dir_(std::move(data_dir)), state_path_(data_dir_ / "engine_state.json") {}

    void StandaloneEngine::start()
    {
        std::lock_guard lock(mutex_);
        if (running_)
        {
            return;
        }
        std::error_code ec;
        std::filesystem::create_directories(data_dir_, ec);
        if (ec)
        {
            throw EngineError(ErrorCode::InternalError,
                              "Cannot create data directory " + data_dir_.string() + ": " + ec.message());
        }
        load_device_id();
        load_state();
        running_ = true;
        spdlog::info("Standalone engine started with device id {} and {} folders", device_id_, folders_.size());
    }

    void StandaloneEngine::stop()
    {
        std::lock_guard lock(mutex_);
        if (!running_)
        {
            return;
        }
        running_ = false;
        save_state();
        spdlog::info("Standalone engine stopped");
    }

    bool StandaloneEngine::running() const
    {
        std::lock_guard lock(mutex_);
        return running_;
    }

    void StandaloneEngine::set_event_handler(EventHandler handler)
    {
        std::lock_guard lock(handler_mutex_);
        handler_ = std::move(handler);
    }

    void StandaloneEngine::set_event_debug(bool enabled)
    {
        event_debug_.store(enabled);
        spdlog::info("Engine event debug {}", enabled ? "enabled" : "disabled");
    }

    std::string StandaloneEngine::device_id() const
    {
        std::lock_guard lock(mutex_);
        return device_id_;
    }

    void StandaloneEngine::add_folder(const protocol::FolderConfig &config)
    {
        if (config.id.empty() || config.path.empty())
        {
            throw EngineError(ErrorCode::InvalidPayload, "Folder id and path are required");
        }
        {
            std::lock_guard lock(mutex_);
            if (folders_.count(config.id) > 0)
            {
                throw EngineError(ErrorCode::AlreadyExists, "Folder " + config.id + " already exists");
            }
            std::error_code ec;
            std::filesystem::create_directories(config.path, ec);
            if (ec)
            {
                spdlog::warn("Cannot create folder path {}: {}", config.path, ec.message());
            }
            folders_.emplace(config.id, config);
            versions_[config.id] = 1;
            save_state();
        }
        spdlog::info("Added folder {} at {} ({})", config.id, config.path, protocol::to_string(config.type));
    }

    void StandaloneEngine::update_folder(const protocol::FolderConfig &config)
    {
        std::lock_guard lock(mutex_);
        auto &folder = require_folder(config.id);
        const bool paused = folder.paused;
        folder = config;
        folder.paused = paused;
        ++versions_[config.id];
        save_state();
        spdlog::info("Updated folder {}", config.id);
    }

    void StandaloneEngine::remove_folder(const std::string &folder_id)
    {
        std::lock_guard lock(mutex_);
        require_folder(folder_id);
        folders_.erase(folder_id);
        versions_.erase(folder_id);
        save_state();
        spdlog::info("Removed folder {}", folder_id);
    }

    bool StandaloneEngine::has_folder(const std::string &folder_id) const
    {
        std::lock_guard lock(mutex_);
        return folders_.count(folder_id) > 0;
    }

    std::vector<protocol::FolderConfig> StandaloneEngine::folders() const
    {
        std::lock_guard lock(mutex_);
        std::vector<protocol::FolderConfig> result;
        result.reserve(folders_.size());
        for (const auto &[id, folder] : folders_)
        {
            result.push_back(folder);
        }
        return result;
    }

    void StandaloneEngine::pause_folder(const std::string &folder_id)
    {
        {
            std::lock_guard lock(mutex_);
            require_folder(folder_id).paused = true;
            save_state();
        }
        emit("folder_paused", {{"folder", folder_id}});
    }

    void StandaloneEngine::resume_folder(const std::string &folder_id)
    {
        {
            std::lock_guard lock(mutex_);
            require_folder(folder_id).paused = false;
            save_state();
        }
        emit("folder_resumed", {{"folder", folder_id}});
    }

    void StandaloneEngine::scan_folder(const std::string &folder_id)
    {
        {
            std::lock_guard lock(mutex_);
            if (!running_)
            {
                throw EngineError(ErrorCode::EngineUnavailable, "Engine is not running");
            }
            if (require_folder(folder_id).paused)
            {
                throw EngineError(ErrorCode::Conflict, "Folder " + folder_id + " is paused");
            }
        }
        emit("state_changed", {{"folder", folder_id}, {"from", "idle"}, {"to", "scanning"}});
        emit("folder_scan_progress", {{"folder_id", folder_id}, {"progress", 100.0}});
        emit("state_changed", {{"folder", folder_id}, {"from", "scanning"}, {"to", "idle"}});
    }

    protocol::FolderStatus StandaloneEngine::folder_status(const std::string &folder_id) const
    {
        protocol::FolderConfig config;
        std::int64_t version = 0;
        {
            std::lock_guard lock(mutex_);
            config = require_folder(folder_id);
            auto it = versions_.find(folder_id);
            version = it == versions_.end() ? 0 : it->second;
        }

        // Filesystem walk happens without the lock.
        auto tally = count_files(config);
        protocol::FolderStatus status{
            .id = config.id,
            .label = config.label,
            .path = config.path,
            .type = config.type,
            .state = config.paused ? "paused" : (tally.errors.empty() ? "idle" : "error"),
            .global_files = tally.files,
            .global_bytes = tally.bytes,
            .local_files = tally.files,
            .local_bytes = tally.bytes,
            .in_sync_files = tally.files,
            .in_sync_bytes = tally.bytes,
            .errors = std::move(tally.errors),
            .version = version,
        };
        return status;
    }

    void StandaloneEngine::revert_folder(const std::string &folder_id)
    {
        std::lock_guard lock(mutex_);
        if (require_folder(folder_id).type != protocol::FolderType::ReceiveOnly)
        {
            throw EngineError(ErrorCode::Unsupported, "Revert applies to receive-only folders only");
        }
        ++versions_[folder_id];
        spdlog::info("Reverted local changes in {}", folder_id);
    }

    void StandaloneEngine::override_folder(const std::string &folder_id)
    {
        std::lock_guard lock(mutex_);
        if (require_folder(folder_id).type != protocol::FolderType::SendOnly)
        {
            throw EngineError(ErrorCode::Unsupported, "Override applies to send-only folders only");
        }
        ++versions_[folder_id];
        spdlog::info("Overrode remote changes in {}", folder_id);
    }

    void StandaloneEngine::reset_folder_database(const std::string &folder_id)
    {
        std::lock_guard lock(mutex_);
        require_folder(folder_id);
        versions_[folder_id] = 1;
        spdlog::info("Reset index database of {}", folder_id);
    }

    void StandaloneEngine::add_device(const protocol::DeviceConfig &device)
    {
        if (device.device_id.empty())
        {
            throw EngineError(ErrorCode::InvalidPayload, "Device id is required");
        }
        std::lock_guard lock(mutex_);
        if (device.device_id == device_id_ || devices_.count(device.device_id) > 0)
        {
            throw EngineError(ErrorCode::AlreadyExists, "Device " + device.device_id + " already exists");
        }
        devices_.emplace(device.device_id, device);
        save_state();
        spdlog::info("Added device {} ({}) at {}", device.name, device.device_id, device.address);
    }

    std::vector<protocol::ConnectionInfo> StandaloneEngine::connections() const
    {
        std::lock_guard lock(mutex_);
        std::vector<protocol::ConnectionInfo> result;
        result.reserve(devices_.size());
        for (const auto &[id, device] : devices_)
        {
            result.push_back(protocol::ConnectionInfo{
                .device_id = device.device_id,
                .name = device.name,
                .address = device.address,
            });
        }
        return result;
    }

    std::string StandaloneEngine::generate_device_id()
    {
        std::random_device random;
        std::uniform_int_distribution<std::size_t> pick(0, kDeviceIdAlphabet.size() - 1);
        std::string id;
        id.reserve(kDeviceIdGroups * (kDeviceIdGroupSize + 1));
        for (std::size_t group = 0; group < kDeviceIdGroups; ++group)
        {
            if (group > 0)
            {
                id.push_back('-');
            }
            for (std::size_t i = 0; i < kDeviceIdGroupSize; ++i)
            {
                id.push_back(kDeviceIdAlphabet[pick(random)]);
            }
        }
        return id;
    }

    protocol::FolderConfig &StandaloneEngine::require_folder(const std::string &folder_id)
    {
        auto it = folders_.find(folder_id);
        if (it == folders_.end())
        {
            throw EngineError(ErrorCode::NotFound, "Folder " + folder_id + " not found");
        }
        return it->second;
    }

    const protocol::FolderConfig &StandaloneEngine::require_folder(const std::string &folder_id) const
    {
        auto it = folders_.find(folder_id);
        if (it == folders_.end())
        {
            throw EngineError(ErrorCode::NotFound, "Folder " + folder_id + " not found");
        }
        return it->second;
    }

    void StandaloneEngine::load_state()
    {
        std::ifstream input(state_path_);
        if (!input)
        {
            return;
        }
        const auto json = nlohmann::json::parse(input, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            spdlog::warn("Engine state {} is corrupt, starting empty", state_path_.string());
            return;
        }
        try
        {
            for (const auto &item : json.value("folders", nlohmann::json::array()))
            {
                auto folder = item.get<protocol::FolderConfig>();
                versions_[folder.id] = 1;
                folders_[folder.id] = std::move(folder);
            }
            for (const auto &item : json.value("devices", nlohmann::json::array()))
            {
                auto device = item.get<protocol::DeviceConfig>();
                devices_[device.device_id] = std::move(device);
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Ignoring unreadable entries in {}: {}", state_path_.string(), ex.what());
        }
    }

    void StandaloneEngine::save_state() const
    {
        nlohmann::json folders = nlohmann::json::array();
        for (const auto &[id, folder] : folders_)
        {
            folders.push_back(folder);
        }
        nlohmann::json devices = nlohmann::json::array();
        for (const auto &[id, device] : devices_)
        {
            devices.push_back(device);
        }
        const nlohmann::json state{{"folders", folders}, {"devices", devices}};

        std::error_code ec;
        std::filesystem::create_directories(data_dir_, ec);
        auto temp_path = state_path_;
        temp_path += ".tmp";
        {
            std::ofstream output(temp_path, std::ios::trunc);
            if (!(output << state.dump(2)))
            {
                spdlog::error("Failed to write engine state {}", temp_path.string());
                return;
            }
        }
        std::filesystem::rename(temp_path, state_path_, ec);
        if (ec)
        {
            spdlog::error("Failed to replace engine state {}: {}", state_path_.string(), ec.message());
        }
    }

    void StandaloneEngine::load_device_id()
    {
        const auto path = data_dir_ / "device_id";
        std::ifstream input(path);
        std::string id;
        if (input && std::getline(input, id) && !id.empty())
        {
            device_id_ = id;
            return;
        }
        device_id_ = generate_device_id();
        std::ofstream output(path, std::ios::trunc);
        if (!(output << device_id_ << '\n'))
        {
            spdlog::warn("Cannot persist device id to {}", path.string());
        }
    }

    void StandaloneEngine::emit(std::string type, nlohmann::json data)
    {
        if (event_debug_.load())
        {
            spdlog::debug("Engine event {} {}", type, data.dump());
        }
        EventHandler handler;
        {
            std::lock_guard lock(handler_mutex_);
            handler = handler_;
        }
        if (handler)
        {
            handler(EngineEvent{
                .type = std::move(type),
                .time = std::chrono::system_clock::now(),
                .data = std::move(data),
            });
        }
    }

} // namespace fleetsync::agent
