#include "fleetsync/agent/connection_manager.hpp"

#include <asio/connect.hpp>
#include <asio/post.hpp>
#include <asio/read.hpp>
#include <asio/ssl/host_name_verification.hpp>
#include <asio/write.hpp>

#include <openssl/ssl.h>

#include <future>
#include <span>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace fleetsync::agent
{

    namespace
    {

        constexpr std::array<std::string_view, 3> kStateNames = {"disconnected", "connecting", "connected"};

        // Link-level messages that are meaningless after a reconnect.
        bool is_transient(const nlohmann::json &message)
        {
            if (!message.is_object())
            {
                return false;
            }
            const auto type = message.value("type", std::string{});
            return type == "register" || type == "ping" || type == "pong";
        }

    } // namespace

    std::string_view to_string(ConnectionState state) noexcept
    {
        return kStateNames[static_cast<std::size_t>(state)];
    }

    ConnectionManager::ConnectionManager(Options options, Outbox &outbox, InboundHandler on_message)
        : options_(std::move(options)),
          outbox_(outbox),
          on_message_(std::move(on_message)),
          tls_context_(asio::ssl::context::tls_client),
          resolver_(io_),
          handshake_timer_(io_),
          read_timer_(io_),
          write_timer_(io_),
          ping_timer_(io_),
          watchdog_timer_(io_),
          reconnect_timer_(io_),
          replay_timer_(io_)
    {
        if (options_.endpoint.tls && options_.tls_verify)
        {
            if (options_.tls_ca_file)
            {
                tls_context_.load_verify_file(options_.tls_ca_file->string());
            }
            else
            {
                tls_context_.set_default_verify_paths();
            }
        }
    }

    ConnectionManager::~ConnectionManager()
    {
        stop();
    }

    void ConnectionManager::start()
    {
        if (running_.exchange(true))
        {
            return;
        }
        work_.emplace(asio::make_work_guard(io_));
        io_thread_ = std::thread([this]
                                 {
            for (;;)
            {
                try
                {
                    io_.run();
                    break;
                }
                catch (const std::exception &ex)
                {
                    spdlog::error("Connection I/O loop error: {}", ex.what());
                }
            } });
        asio::post(io_, [this]
                   {
            connect();
            arm_watchdog(); });
    }

    void ConnectionManager::stop()
    {
        if (!running_.exchange(false))
        {
            return;
        }
        std::promise<void> done;
        auto finished = done.get_future();
        asio::post(io_, [this, &done]
                   {
            shutdown_on_io();
            done.set_value(); });
        finished.wait();

        work_.reset();
        io_.stop();
        if (io_thread_.joinable())
        {
            io_thread_.join();
        }
        if (!outbox_.flush())
        {
            spdlog::error("Outbox could not be flushed on shutdown; {} events remain in memory",
                          outbox_.buffered_count());
        }
    }

    void ConnectionManager::send(const protocol::OutboundMessage &message)
    {
        auto json = protocol::serialize(message);
        std::shared_ptr<const Frame> bytes;
        try
        {
            bytes = std::make_shared<const Frame>(protocol::encode_frame(json));
        }
        catch (const std::length_error &ex)
        {
            spdlog::error("Dropping {} message: {}", protocol::message_type(message), ex.what());
            return;
        }
        if (enqueue(QueuedFrame{.message = json, .bytes = std::move(bytes)}))
        {
            return;
        }
        if (!is_transient(json))
        {
            spdlog::debug("Link unavailable, storing {} in outbox", protocol::message_type(message));
            outbox_.append(std::move(json));
        }
    }

    bool ConnectionManager::try_send(const nlohmann::json &message)
    {
        std::shared_ptr<const Frame> bytes;
        try
        {
            bytes = std::make_shared<const Frame>(protocol::encode_frame(message));
        }
        catch (const std::length_error &ex)
        {
            spdlog::error("Cannot frame message: {}", ex.what());
            return false;
        }
        return enqueue(QueuedFrame{.message = message, .bytes = std::move(bytes)});
    }

    std::size_t ConnectionManager::queued_count() const
    {
        std::lock_guard lock(queue_mutex_);
        return queue_.size();
    }

    bool ConnectionManager::enqueue(QueuedFrame frame)
    {
        {
            std::lock_guard lock(queue_mutex_);
            if (state_.load() != ConnectionState::Connected ||
                queue_.size() >= options_.settings.queue_capacity)
            {
                return false;
            }
            queue_.push_back(std::move(frame));
        }
        schedule_drain();
        return true;
    }

    void ConnectionManager::schedule_drain()
    {
        asio::post(io_, [this]
                   { drain(); });
    }

    void ConnectionManager::connect()
    {
        if (!running_.load())
        {
            return;
        }
        reconnect_pending_ = false;
        close_transport();

        const auto generation = ++generation_;
        const auto &endpoint = options_.endpoint;
        state_.store(ConnectionState::Connecting);
        spdlog::info("Connecting to coordinator at {}", to_string(endpoint));

        if (endpoint.tls)
        {
            socket_.reset();
            tls_ = std::make_unique<TlsStream>(io_, tls_context_);
        }
        else
        {
            tls_.reset();
            socket_ = std::make_unique<TcpSocket>(io_);
        }

        // Covers resolve, connect and the TLS handshake.
        handshake_timer_.expires_after(options_.settings.handshake_timeout);
        handshake_timer_.async_wait([this, generation](const std::error_code &ec)
                                    {
            if (!ec && generation == generation_ && state_.load() == ConnectionState::Connecting)
            {
                teardown(generation, "handshake timed out");
            } });

        resolver_.async_resolve(endpoint.host, std::to_string(endpoint.port),
                                [this, generation](const std::error_code &ec,
                                                   const asio::ip::tcp::resolver::results_type &results)
                                {
                                    if (generation != generation_)
                                    {
                                        return;
                                    }
                                    if (ec)
                                    {
                                        teardown(generation, "resolve failed: " + ec.message());
                                        return;
                                    }
                                    on_resolved(generation, results);
                                });
    }

    void ConnectionManager::on_resolved(std::uint64_t generation, const asio::ip::tcp::resolver::results_type &results)
    {
        asio::async_connect(tcp_socket(), results,
                            [this, generation](const std::error_code &ec, const asio::ip::tcp::endpoint &)
                            {
                                if (generation != generation_)
                                {
                                    return;
                                }
                                if (ec)
                                {
                                    teardown(generation, "connect failed: " + ec.message());
                                    return;
                                }
                                std::error_code option_ec;
                                tcp_socket().set_option(asio::ip::tcp::no_delay(true), option_ec);
                                if (!tls_)
                                {
                                    on_connected(generation);
                                    return;
                                }

                                const auto &host = options_.endpoint.host;
                                if (!SSL_set_tlsext_host_name(tls_->native_handle(), host.c_str()))
                                {
                                    spdlog::warn("Could not set TLS server name {}", host);
                                }
                                if (options_.tls_verify)
                                {
                                    tls_->set_verify_mode(asio::ssl::verify_peer);
                                    tls_->set_verify_callback(asio::ssl::host_name_verification(host));
                                }
                                else
                                {
                                    tls_->set_verify_mode(asio::ssl::verify_none);
                                }
                                tls_->async_handshake(asio::ssl::stream_base::client,
                                                      [this, generation](const std::error_code &handshake_ec)
                                                      {
                                                          if (generation != generation_)
                                                          {
                                                              return;
                                                          }
                                                          if (handshake_ec)
                                                          {
                                                              teardown(generation, "TLS handshake failed: " + handshake_ec.message());
                                                              return;
                                                          }
                                                          on_connected(generation);
                                                      });
                            });
    }

    void ConnectionManager::on_connected(std::uint64_t generation)
    {
        handshake_timer_.cancel();

        std::optional<QueuedFrame> registration;
        if (options_.registration)
        {
            try
            {
                auto json = protocol::serialize(options_.registration());
                auto bytes = std::make_shared<const Frame>(protocol::encode_frame(json));
                registration = QueuedFrame{.message = std::move(json), .bytes = std::move(bytes)};
            }
            catch (const std::exception &ex)
            {
                teardown(generation, std::string("cannot build registration: ") + ex.what());
                return;
            }
        }

        {
            std::lock_guard lock(queue_mutex_);
            state_.store(ConnectionState::Connected);
            if (registration)
            {
                queue_.push_front(std::move(*registration));
            }
        }
        spdlog::info("Connected to coordinator at {}", to_string(options_.endpoint));

        read_header(generation);
        arm_read_deadline(generation);
        arm_ping(generation);
        schedule_replay(generation);
        drain();
    }

    void ConnectionManager::read_header(std::uint64_t generation)
    {
        async_read_exact(asio::buffer(header_),
                         [this, generation](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (generation != generation_)
                             {
                                 return;
                             }
                             if (ec)
                             {
                                 teardown(generation, "read failed: " + ec.message());
                                 return;
                             }
                             const auto size = protocol::decode_frame_length(
                                 std::span<const std::uint8_t, protocol::kFrameHeaderSize>(header_));
                             if (size > protocol::kMaxFramePayload)
                             {
                                 teardown(generation, "inbound frame of " + std::to_string(size) + " bytes exceeds limit");
                                 return;
                             }
                             if (size == 0)
                             {
                                 arm_read_deadline(generation);
                                 read_header(generation);
                                 return;
                             }
                             read_payload(generation, size);
                         });
    }

    void ConnectionManager::read_payload(std::uint64_t generation, std::uint32_t size)
    {
        payload_.resize(size);
        async_read_exact(asio::buffer(payload_),
                         [this, generation](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (generation != generation_)
                             {
                                 return;
                             }
                             if (ec)
                             {
                                 teardown(generation, "read failed: " + ec.message());
                                 return;
                             }
                             arm_read_deadline(generation);

                             const auto message = nlohmann::json::parse(payload_.begin(), payload_.end(), nullptr, false);
                             if (message.is_discarded())
                             {
                                 spdlog::warn("Ignoring malformed frame of {} bytes from coordinator", payload_.size());
                             }
                             else
                             {
                                 handle_frame(message);
                             }
                             if (generation == generation_)
                             {
                                 read_header(generation);
                             }
                         });
    }

    void ConnectionManager::handle_frame(const nlohmann::json &message)
    {
        if (message.is_object() && message.value("type", std::string{}) == "pong")
        {
            spdlog::debug("Pong received");
            return;
        }
        if (!on_message_)
        {
            return;
        }
        try
        {
            on_message_(message);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Inbound handler failed: {}", ex.what());
        }
    }

    void ConnectionManager::arm_read_deadline(std::uint64_t generation)
    {
        read_timer_.expires_after(options_.settings.read_timeout);
        read_timer_.async_wait([this, generation](const std::error_code &ec)
                               {
            if (!ec && generation == generation_)
            {
                teardown(generation, "read deadline exceeded");
            } });
    }

    void ConnectionManager::arm_ping(std::uint64_t generation)
    {
        ping_timer_.expires_after(options_.settings.ping_interval);
        ping_timer_.async_wait([this, generation](const std::error_code &ec)
                               {
            if (ec || generation != generation_ || state_.load() != ConnectionState::Connected)
            {
                return;
            }
            if (!try_send(protocol::serialize(protocol::PingMessage{})))
            {
                spdlog::debug("Ping skipped, send queue full");
            }
            arm_ping(generation); });
    }

    void ConnectionManager::arm_watchdog()
    {
        watchdog_timer_.expires_after(options_.settings.watchdog_interval);
        watchdog_timer_.async_wait([this](const std::error_code &ec)
                                   {
            if (ec || !running_.load())
            {
                return;
            }
            if (state_.load() == ConnectionState::Disconnected && !reconnect_pending_)
            {
                spdlog::info("Watchdog found the coordinator link down, reconnecting");
                connect();
            }
            arm_watchdog(); });
    }

    void ConnectionManager::schedule_replay(std::uint64_t generation)
    {
        replay_timer_.expires_after(options_.settings.replay_grace);
        replay_timer_.async_wait([this, generation](const std::error_code &ec)
                                 {
            if (ec || generation != generation_ || state_.load() != ConnectionState::Connected)
            {
                return;
            }
            auto replay = [this]
            {
                const auto result = outbox_.replay([this](const nlohmann::json &message)
                                                   { return try_send(message); });
                if (result.attempted > 0)
                {
                    spdlog::info("Outbox replay: {} attempted, {} delivered, {} failed, {} dropped",
                                 result.attempted, result.delivered, result.failed, result.dropped);
                }
            };
            if (options_.replay_executor)
            {
                options_.replay_executor(std::move(replay));
            }
            else
            {
                replay();
            } });
    }

    void ConnectionManager::drain()
    {
        if (writing_ || state_.load() != ConnectionState::Connected)
        {
            return;
        }
        {
            std::lock_guard lock(queue_mutex_);
            if (queue_.empty())
            {
                return;
            }
            in_flight_ = std::move(queue_.front());
            queue_.pop_front();
        }
        writing_ = true;

        const auto generation = generation_;
        write_timer_.expires_after(options_.settings.write_timeout);
        write_timer_.async_wait([this, generation](const std::error_code &ec)
                                {
            if (!ec && generation == generation_ && writing_)
            {
                teardown(generation, "write deadline exceeded");
            } });

        auto bytes = in_flight_->bytes;
        async_write_frame(asio::buffer(*bytes),
                          [this, generation, bytes](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (generation != generation_)
                              {
                                  return;
                              }
                              write_timer_.cancel();
                              if (ec)
                              {
                                  teardown(generation, "write failed: " + ec.message());
                                  return;
                              }
                              writing_ = false;
                              in_flight_.reset();
                              drain();
                          });
    }

    void ConnectionManager::teardown(std::uint64_t generation, std::string_view reason)
    {
        if (generation != generation_)
        {
            return;
        }
        ++generation_;
        spdlog::warn("Coordinator link down: {}", reason);

        close_transport();
        spill(take_pending());
        schedule_reconnect();
    }

    void ConnectionManager::close_transport()
    {
        handshake_timer_.cancel();
        read_timer_.cancel();
        write_timer_.cancel();
        ping_timer_.cancel();
        replay_timer_.cancel();
        resolver_.cancel();
        writing_ = false;

        if (!socket_ && !tls_)
        {
            return;
        }
        auto &socket = tcp_socket();
        std::error_code ec;
        socket.shutdown(TcpSocket::shutdown_both, ec);
        socket.close(ec);
    }

    void ConnectionManager::schedule_reconnect()
    {
        if (!running_.load())
        {
            return;
        }
        reconnect_pending_ = true;
        spdlog::info("Reconnecting in {} ms", options_.settings.retry_delay.count());
        reconnect_timer_.expires_after(options_.settings.retry_delay);
        reconnect_timer_.async_wait([this](const std::error_code &ec)
                                    {
            if (ec)
            {
                return;
            }
            connect(); });
    }

    std::vector<ConnectionManager::QueuedFrame> ConnectionManager::take_pending()
    {
        std::vector<QueuedFrame> pending;
        std::lock_guard lock(queue_mutex_);
        state_.store(ConnectionState::Disconnected);
        if (in_flight_)
        {
            pending.push_back(std::move(*in_flight_));
            in_flight_.reset();
        }
        while (!queue_.empty())
        {
            pending.push_back(std::move(queue_.front()));
            queue_.pop_front();
        }
        return pending;
    }

    void ConnectionManager::spill(std::vector<QueuedFrame> frames)
    {
        std::size_t stored = 0;
        for (auto &frame : frames)
        {
            if (is_transient(frame.message))
            {
                continue;
            }
            outbox_.append(std::move(frame.message));
            ++stored;
        }
        if (stored > 0)
        {
            spdlog::info("Moved {} unsent messages to the outbox", stored);
        }
    }

    void ConnectionManager::shutdown_on_io()
    {
        ++generation_;
        watchdog_timer_.cancel();
        reconnect_timer_.cancel();
        reconnect_pending_ = false;
        close_transport();
        spill(take_pending());
        spdlog::info("Coordinator connection closed");
    }

    ConnectionManager::TcpSocket &ConnectionManager::tcp_socket()
    {
        if (tls_)
        {
            return tls_->next_layer();
        }
        return *socket_;
    }

    template <typename Buffers, typename Handler>
    void ConnectionManager::async_write_frame(const Buffers &buffers, Handler &&handler)
    {
        if (tls_)
        {
            asio::async_write(*tls_, buffers, std::forward<Handler>(handler));
        }
        else
        {
            asio::async_write(*socket_, buffers, std::forward<Handler>(handler));
        }
    }

    template <typename Buffers, typename Handler>
    void ConnectionManager::async_read_exact(const Buffers &buffers, Handler &&handler)
    {
        if (tls_)
        {
            asio::async_read(*tls_, buffers, std::forward<Handler>(handler));
        }
        else
        {
            asio::async_read(*socket_, buffers, std::forward<Handler>(handler));
        }
    }

} // namespace fleetsync::agent
