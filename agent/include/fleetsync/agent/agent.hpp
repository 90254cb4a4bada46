/**
 * fleetsync - The agent process: owns the engine, the coordinator link and
 * every tracker and monitor, and wires them together.
 */
#pragma once

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "fleetsync/agent/auto_resync.hpp"
#include "fleetsync/agent/config.hpp"
#include "fleetsync/agent/connection_manager.hpp"
#include "fleetsync/agent/dispatcher.hpp"
#include "fleetsync/agent/endpoint.hpp"
#include "fleetsync/agent/event_processor.hpp"
#include "fleetsync/agent/job_monitor.hpp"
#include "fleetsync/agent/outbox.hpp"
#include "fleetsync/agent/peer_directory.hpp"
#include "fleetsync/agent/progress_tracker.hpp"
#include "fleetsync/agent/scheduler.hpp"
#include "fleetsync/agent/session_tracker.hpp"
#include "fleetsync/agent/sync_engine.hpp"
#include "fleetsync/protocol.hpp"

namespace fleetsync::agent
{

    class Agent
    {
    public:
        // Without an engine the agent runs a StandaloneEngine under <data_dir>/engine.
        // Throws std::invalid_argument for an unusable server URL.
        explicit Agent(AgentConfig config, std::unique_ptr<SyncEngine> engine = nullptr);
        ~Agent();

        Agent(const Agent &) = delete;
        Agent &operator=(const Agent &) = delete;

        void start();
        void stop();

        // start(), then block until SIGINT or SIGTERM. SIGHUP reloads the configuration.
        void run();

        // Re-reads the configuration file when there is one and applies event_debug and
        // log_level. An explicit event_debug wins over the file.
        void reload(std::optional<bool> event_debug = std::nullopt);

        protocol::AgentStatus status() const;
        void send_health();

        bool running() const noexcept { return running_.load(); }
        const AgentConfig &config() const noexcept { return config_; }
        SyncEngine &engine() noexcept { return *engine_; }
        ConnectionManager &connection() noexcept { return connection_; }
        Outbox &outbox() noexcept { return outbox_; }

    private:
        void on_inbound(nlohmann::json message);
        void on_engine_event(EngineEvent event);
        void wait_for_signal();

        AgentConfig config_;
        Endpoint endpoint_;

        asio::io_context pool_;
        std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
        std::vector<std::thread> workers_;
        asio::strand<asio::io_context::executor_type> inbound_strand_;
        asio::strand<asio::io_context::executor_type> event_strand_;

        std::unique_ptr<SyncEngine> engine_;
        Outbox outbox_;
        ConnectionManager connection_;
        ProgressTracker progress_;
        SessionTracker sessions_;
        Scheduler scheduler_;
        AutoResyncMonitor resync_;
        JobMonitor jobs_;
        EventProcessor events_;
        PeerDirectory peers_;
        Dispatcher dispatcher_;

        asio::io_context signal_io_;
        asio::signal_set signals_;

        mutable std::mutex reload_mutex_;
        std::atomic<bool> running_{false};
    };

} // namespace fleetsync::agent
