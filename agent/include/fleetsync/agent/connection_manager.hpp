/**
 * fleetsync - Owner of the single coordinator connection.
 *
 * All socket work happens on one private I/O thread. Producers on any thread
 * call send(); frames are queued and written by a single drain loop. When the
 * link is down or the queue is full the message goes to the Outbox instead.
 */
#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ssl/context.hpp>
#include <asio/ssl/stream.hpp>
#include <asio/steady_timer.hpp>

#include <nlohmann/json.hpp>

#include "fleetsync/agent/config.hpp"
#include "fleetsync/agent/endpoint.hpp"
#include "fleetsync/agent/message_sink.hpp"
#include "fleetsync/agent/outbox.hpp"
#include "fleetsync/framing.hpp"
#include "fleetsync/messages.hpp"

namespace fleetsync::agent
{

    enum class ConnectionState : std::uint8_t
    {
        Disconnected,
        Connecting,
        Connected
    };

    std::string_view to_string(ConnectionState state) noexcept;

    class ConnectionManager : public MessageSink
    {
    public:
        using InboundHandler = std::function<void(nlohmann::json)>;
        using RegistrationProvider = std::function<protocol::RegisterMessage()>;
        using Executor = std::function<void(std::function<void()>)>;

        struct Options
        {
            Endpoint endpoint;
            ConnectionSettings settings;
            bool tls_verify{true};
            std::optional<std::filesystem::path> tls_ca_file;
            // Called on every (re)connect; its message is the first frame written.
            RegistrationProvider registration;
            // Runs outbox replay. Defaults to running it on the I/O thread.
            Executor replay_executor;
        };

        // Inbound frames other than pong are handed to on_message on the I/O thread.
        ConnectionManager(Options options, Outbox &outbox, InboundHandler on_message);
        ~ConnectionManager() override;

        ConnectionManager(const ConnectionManager &) = delete;
        ConnectionManager &operator=(const ConnectionManager &) = delete;

        void start();

        // Cancels every timer, closes the link, moves queued frames to the outbox and flushes it.
        void stop();

        void send(const protocol::OutboundMessage &message) override;

        // Enqueue without outbox fallback. False when disconnected, full, or unframeable.
        bool try_send(const nlohmann::json &message);

        ConnectionState state() const noexcept { return state_.load(); }
        std::size_t queued_count() const;

    private:
        using TcpSocket = asio::ip::tcp::socket;
        using TlsStream = asio::ssl::stream<TcpSocket>;
        using Frame = std::vector<std::uint8_t>;

        struct QueuedFrame
        {
            nlohmann::json message;
            std::shared_ptr<const Frame> bytes;
        };

        bool enqueue(QueuedFrame frame);
        void schedule_drain();

        // I/O thread only from here on.
        void connect();
        void on_resolved(std::uint64_t generation, const asio::ip::tcp::resolver::results_type &results);
        void on_connected(std::uint64_t generation);
        void read_header(std::uint64_t generation);
        void read_payload(std::uint64_t generation, std::uint32_t size);
        void handle_frame(const nlohmann::json &message);
        void arm_read_deadline(std::uint64_t generation);
        void arm_ping(std::uint64_t generation);
        void arm_watchdog();
        void schedule_replay(std::uint64_t generation);
        void drain();
        void teardown(std::uint64_t generation, std::string_view reason);
        void close_transport();
        void schedule_reconnect();
        std::vector<QueuedFrame> take_pending();
        void spill(std::vector<QueuedFrame> frames);
        void shutdown_on_io();
        TcpSocket &tcp_socket();

        template <typename Buffers, typename Handler>
        void async_write_frame(const Buffers &buffers, Handler &&handler);
        template <typename Buffers, typename Handler>
        void async_read_exact(const Buffers &buffers, Handler &&handler);

        Options options_;
        Outbox &outbox_;
        InboundHandler on_message_;

        asio::io_context io_;
        std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
        std::thread io_thread_;
        asio::ssl::context tls_context_;
        asio::ip::tcp::resolver resolver_;
        std::unique_ptr<TcpSocket> socket_;
        std::unique_ptr<TlsStream> tls_;

        asio::steady_timer handshake_timer_;
        asio::steady_timer read_timer_;
        asio::steady_timer write_timer_;
        asio::steady_timer ping_timer_;
        asio::steady_timer watchdog_timer_;
        asio::steady_timer reconnect_timer_;
        asio::steady_timer replay_timer_;

        std::array<std::uint8_t, protocol::kFrameHeaderSize> header_{};
        Frame payload_;
        std::uint64_t generation_{};
        bool writing_{false};
        bool reconnect_pending_{false};
        std::optional<QueuedFrame> in_flight_;

        std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
        std::atomic<bool> running_{false};

        // Guards queue_ and the transition into and out of Connected.
        mutable std::mutex queue_mutex_;
        std::deque<QueuedFrame> queue_;
    };

} // namespace fleetsync::agent
