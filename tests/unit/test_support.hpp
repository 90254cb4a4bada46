#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "fleetsync/agent/message_sink.hpp"
#include "fleetsync/agent/sync_engine.hpp"
#include "fleetsync/framing.hpp"
#include "fleetsync/messages.hpp"

namespace fleetsync::test
{

    inline std::filesystem::path fresh_directory(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / ("fleetsync_" + name);
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path);
        return path;
    }

    inline void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    template <typename Predicate>
    bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds{5})
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
        return predicate();
    }

    // Keeps every message in its wire form.
    class RecordingSink : public agent::MessageSink
    {
    public:
        void send(const protocol::OutboundMessage &message) override
        {
            std::lock_guard lock(mutex_);
            messages_.push_back(protocol::serialize(message));
        }

        std::vector<nlohmann::json> messages() const
        {
            std::lock_guard lock(mutex_);
            return messages_;
        }

        std::vector<nlohmann::json> of_type(const std::string &type) const
        {
            std::lock_guard lock(mutex_);
            std::vector<nlohmann::json> result;
            for (const auto &message : messages_)
            {
                if (message.value("type", std::string{}) == type)
                {
                    result.push_back(message);
                }
            }
            return result;
        }

        nlohmann::json last() const
        {
            std::lock_guard lock(mutex_);
            return messages_.empty() ? nlohmann::json() : messages_.back();
        }

        std::size_t size() const
        {
            std::lock_guard lock(mutex_);
            return messages_.size();
        }

        void clear()
        {
            std::lock_guard lock(mutex_);
            messages_.clear();
        }

    private:
        mutable std::mutex mutex_;
        std::vector<nlohmann::json> messages_;
    };

    struct ManualClock
    {
        std::chrono::system_clock::time_point now{std::chrono::system_clock::time_point(std::chrono::seconds{1700000000})};

        void advance(std::chrono::milliseconds by) { now += by; }
    };

    // Scripted engine: folders and statuses live in maps, repairs can be told to fail.
    class FakeSyncEngine : public agent::SyncEngine
    {
    public:
        void start() override { running_ = true; }
        void stop() override { running_ = false; }
        bool running() const override { return running_; }

        void set_event_handler(EventHandler handler) override { handler_ = std::move(handler); }
        void set_event_debug(bool enabled) override { event_debug = enabled; }

        std::string device_id() const override { return "LOCAL-DEVICE"; }

        void add_folder(const protocol::FolderConfig &config) override
        {
            std::lock_guard lock(mutex_);
            record("add_folder:" + config.id);
            if (configs.count(config.id) > 0)
            {
                throw agent::EngineError(ErrorCode::AlreadyExists, "folder exists");
            }
            configs[config.id] = config;
        }

        void update_folder(const protocol::FolderConfig &config) override
        {
            std::lock_guard lock(mutex_);
            record("update_folder:" + config.id);
            require(config.id);
            configs[config.id] = config;
        }

        void remove_folder(const std::string &folder_id) override
        {
            std::lock_guard lock(mutex_);
            record("remove_folder:" + folder_id);
            if (fail_unexpectedly)
            {
                throw std::runtime_error("engine call failed");
            }
            require(folder_id);
            configs.erase(folder_id);
            statuses.erase(folder_id);
        }

        bool has_folder(const std::string &folder_id) const override
        {
            std::lock_guard lock(mutex_);
            if (fail_unexpectedly)
            {
                throw std::runtime_error("engine lookup failed");
            }
            return configs.count(folder_id) > 0;
        }

        std::vector<protocol::FolderConfig> folders() const override
        {
            std::lock_guard lock(mutex_);
            std::vector<protocol::FolderConfig> result;
            for (const auto &[id, folder] : configs)
            {
                result.push_back(folder);
            }
            return result;
        }

        void pause_folder(const std::string &folder_id) override
        {
            std::lock_guard lock(mutex_);
            record("pause_folder:" + folder_id);
            if (fail_unexpectedly)
            {
                throw std::runtime_error("engine call failed");
            }
            require(folder_id).paused = true;
        }

        void resume_folder(const std::string &folder_id) override
        {
            std::lock_guard lock(mutex_);
            record("resume_folder:" + folder_id);
            if (fail_unexpectedly)
            {
                throw std::runtime_error("engine call failed");
            }
            require(folder_id).paused = false;
        }

        void scan_folder(const std::string &folder_id) override
        {
            std::lock_guard lock(mutex_);
            record("scan_folder:" + folder_id);
            require(folder_id);
        }

        protocol::FolderStatus folder_status(const std::string &folder_id) const override
        {
            std::lock_guard lock(mutex_);
            if (auto it = statuses.find(folder_id); it != statuses.end())
            {
                return it->second;
            }
            auto it = configs.find(folder_id);
            if (it == configs.end())
            {
                throw agent::EngineError(ErrorCode::NotFound, "no folder " + folder_id);
            }
            protocol::FolderStatus status;
            status.id = it->second.id;
            status.label = it->second.label;
            status.path = it->second.path;
            status.type = it->second.type;
            return status;
        }

        void revert_folder(const std::string &folder_id) override
        {
            repair("revert", folder_id, fail_revert);
        }

        void override_folder(const std::string &folder_id) override
        {
            repair("override", folder_id, fail_override);
        }

        void reset_folder_database(const std::string &folder_id) override
        {
            repair("reset", folder_id, fail_reset);
        }

        void add_device(const protocol::DeviceConfig &device) override
        {
            std::lock_guard lock(mutex_);
            record("add_device:" + device.device_id + "@" + device.address);
            for (const auto &known : devices)
            {
                if (known.device_id == device.device_id)
                {
                    throw agent::EngineError(ErrorCode::AlreadyExists, "device exists");
                }
            }
            devices.push_back(device);
        }

        std::vector<protocol::ConnectionInfo> connections() const override
        {
            std::lock_guard lock(mutex_);
            std::vector<protocol::ConnectionInfo> result;
            for (const auto &device : devices)
            {
                result.push_back(protocol::ConnectionInfo{
                    .device_id = device.device_id,
                    .name = device.name,
                    .address = device.address,
                    .connected = true,
                });
            }
            return result;
        }

        void set_status(const protocol::FolderStatus &status)
        {
            std::lock_guard lock(mutex_);
            statuses[status.id] = status;
        }

        std::vector<std::string> calls() const
        {
            std::lock_guard lock(mutex_);
            return calls_;
        }

        bool called(const std::string &call) const
        {
            std::lock_guard lock(mutex_);
            for (const auto &entry : calls_)
            {
                if (entry == call)
                {
                    return true;
                }
            }
            return false;
        }

        void emit(agent::EngineEvent event)
        {
            if (handler_)
            {
                handler_(std::move(event));
            }
        }

        std::map<std::string, protocol::FolderConfig> configs;
        std::map<std::string, protocol::FolderStatus> statuses;
        std::vector<protocol::DeviceConfig> devices;
        bool fail_revert{false};
        bool fail_override{false};
        bool fail_reset{false};
        bool fail_unexpectedly{false};
        bool event_debug{false};

    private:
        void record(std::string call) { calls_.push_back(std::move(call)); }

        protocol::FolderConfig &require(const std::string &folder_id)
        {
            auto it = configs.find(folder_id);
            if (it == configs.end())
            {
                throw agent::EngineError(ErrorCode::NotFound, "no folder " + folder_id);
            }
            return it->second;
        }

        void repair(const std::string &action, const std::string &folder_id, bool fail)
        {
            std::lock_guard lock(mutex_);
            record(action + ":" + folder_id);
            if (fail)
            {
                throw agent::EngineError(ErrorCode::Unsupported, action + " not possible");
            }
        }

        mutable std::mutex mutex_;
        std::vector<std::string> calls_;
        EventHandler handler_;
        bool running_{false};
    };

    // Loopback coordinator with blocking I/O, one client at a time.
    class FakeCoordinator
    {
    public:
        FakeCoordinator()
            : acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {}

        std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

        void accept()
        {
            socket_ = std::make_unique<asio::ip::tcp::socket>(io_);
            acceptor_.accept(*socket_);
        }

        nlohmann::json read_message()
        {
            std::array<std::uint8_t, protocol::kFrameHeaderSize> header{};
            asio::read(*socket_, asio::buffer(header));
            const auto size = protocol::decode_frame_length(
                std::span<const std::uint8_t, protocol::kFrameHeaderSize>(header));
            std::vector<std::uint8_t> payload(size);
            asio::read(*socket_, asio::buffer(payload));
            return nlohmann::json::parse(payload.begin(), payload.end());
        }

        void write_message(const nlohmann::json &message)
        {
            const auto frame = protocol::encode_frame(message);
            asio::write(*socket_, asio::buffer(frame));
        }

        void write_raw(std::span<const std::uint8_t> bytes)
        {
            asio::write(*socket_, asio::buffer(bytes.data(), bytes.size()));
        }

        // True when the peer closed its end.
        bool at_eof()
        {
            std::array<std::uint8_t, 1> byte{};
            std::error_code ec;
            asio::read(*socket_, asio::buffer(byte), ec);
            return ec == asio::error::eof || ec == asio::error::connection_reset;
        }

        // Empty once the peer has gone away; a trailing partial frame is discarded.
        std::optional<nlohmann::json> try_read_message()
        {
            try
            {
                return read_message();
            }
            catch (const std::system_error &)
            {
                return std::nullopt;
            }
        }

        std::vector<nlohmann::json> read_until_closed()
        {
            std::vector<nlohmann::json> messages;
            while (auto message = try_read_message())
            {
                messages.push_back(std::move(*message));
            }
            return messages;
        }

        void drop()
        {
            std::error_code ec;
            socket_->shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            socket_->close(ec);
        }

    private:
        asio::io_context io_;
        asio::ip::tcp::acceptor acceptor_;
        std::unique_ptr<asio::ip::tcp::socket> socket_;
    };

} // namespace fleetsync::test
