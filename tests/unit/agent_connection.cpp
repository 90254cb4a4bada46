#include <atomic>
#include <cassert>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "fleetsync/agent/connection_manager.hpp"
#include "fleetsync/agent/endpoint.hpp"
#include "fleetsync/agent/outbox.hpp"
#include "test_support.hpp"

using namespace fleetsync;
using namespace fleetsync::agent;
using namespace fleetsync::test;

namespace
{

    using namespace std::chrono_literals;

    ConnectionSettings fast_settings()
    {
        ConnectionSettings settings;
        settings.retry_delay = 500ms;
        settings.replay_grace = 50ms;
        settings.handshake_timeout = 2s;
        settings.read_timeout = 30s;
        settings.write_timeout = 2s;
        return settings;
    }

    protocol::EventMessage marker_event(const std::string &marker, nlohmann::json data = nlohmann::json::object())
    {
        data["marker"] = marker;
        return protocol::EventMessage{
            .agent_id = "a1",
            .event_type = "test_marker",
            .event_time = std::chrono::system_clock::now(),
            .data = std::move(data),
            .timestamp = std::chrono::system_clock::now(),
        };
    }

    std::string marker_of(const nlohmann::json &message)
    {
        return message.at("event").at("data").at("marker").get<std::string>();
    }

    // Client side of one test: outbox, connection manager and the inbound messages it delivered.
    class Client
    {
    public:
        Client(const std::string &name, std::uint16_t port, ConnectionSettings settings = fast_settings())
            : root_(fresh_directory(name)),
              outbox_(Outbox::default_store_path(root_, "a1"), "a1"),
              connection_(ConnectionManager::Options{
                              .endpoint = parse_endpoint("tcp://127.0.0.1:" + std::to_string(port)),
                              .settings = settings,
                              .registration = []
                              {
                                  return protocol::RegisterMessage{
                                      .agent_id = "a1",
                                      .device_id = "LOCAL-DEVICE",
                                      .data_dir = "/tmp",
                                      .version = "test",
                                      .hostname = "localhost",
                                  };
                              },
                              .replay_executor = [this](std::function<void()> job)
                              {
                                  ++replays_;
                                  job();
                              },
                          },
                          outbox_, [this](nlohmann::json message)
                          {
                              std::lock_guard lock(mutex_);
                              inbound_.push_back(std::move(message)); }) {}

        ~Client()
        {
            connection_.stop();
            cleanup_path(root_);
        }

        ConnectionManager &connection() { return connection_; }
        Outbox &outbox() { return outbox_; }
        int replays() const { return replays_.load(); }

        std::vector<nlohmann::json> inbound() const
        {
            std::lock_guard lock(mutex_);
            return inbound_;
        }

        bool connected() const { return connection_.state() == ConnectionState::Connected; }

    private:
        std::filesystem::path root_;
        Outbox outbox_;
        std::atomic<int> replays_{0};
        mutable std::mutex mutex_;
        std::vector<nlohmann::json> inbound_;
        ConnectionManager connection_;
    };

    void test_send_without_link_goes_to_outbox()
    {
        FakeCoordinator coordinator;
        Client client("conn_offline", coordinator.port());
        assert(client.connection().state() == ConnectionState::Disconnected);

        client.connection().send(marker_event("offline-1"));
        client.connection().send(protocol::PingMessage{});
        client.connection().send(protocol::PongMessage{});
        assert(!client.connection().try_send(nlohmann::json{{"type", "event"}}));

        const auto stored = client.outbox().load();
        assert(stored.size() == 1);
        assert(marker_of(stored[0].payload) == "offline-1");
        assert(client.connection().queued_count() == 0);
    }

    void test_register_first_and_inbound_routing()
    {
        FakeCoordinator coordinator;
        Client client("conn_register", coordinator.port());
        client.connection().start();

        coordinator.accept();
        const auto registration = coordinator.read_message();
        assert(registration.at("type") == "register");
        assert(registration.at("agent_id") == "a1");
        assert(registration.at("device_id") == "LOCAL-DEVICE");
        assert(wait_until([&]
                          { return client.connected(); }));

        client.connection().send(marker_event("online-1"));
        const auto event = coordinator.read_message();
        assert(event.at("type") == "event");
        assert(marker_of(event) == "online-1");

        coordinator.write_message({{"type", "pong"}});
        coordinator.write_message({{"type", "ping"}});
        coordinator.write_message({{"type", "list-folders"}, {"cli_id", "cli-1"}});
        assert(wait_until([&]
                          { return client.inbound().size() == 2; }));
        const auto inbound = client.inbound();
        assert(inbound[0].at("type") == "ping");
        assert(inbound[1].at("type") == "list-folders");
        assert(client.outbox().load().empty());

        client.connection().stop();
        assert(client.connection().state() == ConnectionState::Disconnected);
        assert(coordinator.at_eof());
    }

    void test_drop_store_and_replay()
    {
        FakeCoordinator coordinator;
        Client client("conn_replay", coordinator.port());
        client.connection().start();

        coordinator.accept();
        assert(coordinator.read_message().at("type") == "register");
        assert(wait_until([&]
                          { return client.connected(); }));

        coordinator.drop();
        assert(wait_until([&]
                          { return !client.connected(); }));

        client.connection().send(marker_event("while-down"));
        assert(client.outbox().pending_count() == 1);

        coordinator.accept();
        assert(coordinator.read_message().at("type") == "register");
        const auto replayed = coordinator.read_message();
        assert(replayed.at("type") == "event");
        assert(marker_of(replayed) == "while-down");

        assert(wait_until([&]
                          { return client.outbox().load().empty(); }));
        assert(client.replays() >= 1);
        assert(client.connected());
    }

    nlohmann::json bulky(int seq)
    {
        return {{"seq", seq}, {"blob", std::string(256 * 1024, 'x')}};
    }

    void test_stalled_link_spills_unsent_frames()
    {
        constexpr int kMessages = 96;

        FakeCoordinator coordinator;
        auto settings = fast_settings();
        settings.retry_delay = 2s;
        Client client("conn_stalled", coordinator.port(), settings);
        client.connection().start();

        coordinator.accept();
        assert(coordinator.read_message().at("type") == "register");
        assert(wait_until([&]
                          { return client.connected(); }));

        // The coordinator stops reading: socket buffers fill, one frame stays in flight and the
        // rest wait in the queue until the write deadline closes the link.
        for (int seq = 0; seq < kMessages; ++seq)
        {
            client.connection().send(marker_event("m" + std::to_string(seq), bulky(seq)));
        }
        assert(wait_until([&]
                          { return !client.connected(); },
                          10s));
        assert(client.connection().queued_count() == 0);
        assert(client.outbox().pending_count() > 0);

        std::set<std::string> seen;
        for (const auto &message : coordinator.read_until_closed())
        {
            if (message.at("type") == "event")
            {
                seen.insert(marker_of(message));
            }
        }
        assert(seen.size() < static_cast<std::size_t>(kMessages));

        // Everything the old link did not carry arrives after the reconnect.
        while (seen.size() < static_cast<std::size_t>(kMessages))
        {
            coordinator.accept();
            while (seen.size() < static_cast<std::size_t>(kMessages))
            {
                const auto message = coordinator.try_read_message();
                if (!message)
                {
                    break;
                }
                if (message->at("type") == "event")
                {
                    seen.insert(marker_of(*message));
                }
            }
        }
        for (int seq = 0; seq < kMessages; ++seq)
        {
            assert(seen.count("m" + std::to_string(seq)) == 1);
        }
        assert(wait_until([&]
                          { return client.outbox().pending_count() == 0; },
                          10s));
        assert(client.replays() >= 1);
    }

    void test_full_queue_falls_back_to_outbox()
    {
        FakeCoordinator coordinator;
        auto settings = fast_settings();
        settings.queue_capacity = 1;
        settings.write_timeout = 60s;
        Client client("conn_full_queue", coordinator.port(), settings);
        client.connection().start();

        coordinator.accept();
        assert(coordinator.read_message().at("type") == "register");
        assert(wait_until([&]
                          { return client.connected(); }));

        // Nothing is read from here on, so the writer stalls once the socket buffers are full.
        int sent = 0;
        while (client.outbox().pending_count() == 0 && sent < 400)
        {
            client.connection().send(marker_event("q" + std::to_string(sent), bulky(sent)));
            ++sent;
        }
        assert(client.outbox().pending_count() > 0);
        assert(client.connected());
        assert(client.connection().queued_count() <= 1);

        assert(client.outbox().flush());
        const auto stored = client.outbox().load();
        assert(!stored.empty());
        assert(marker_of(stored.front().payload).rfind("q", 0) == 0);
    }

    void test_oversized_frame_closes_link()
    {
        FakeCoordinator coordinator;
        Client client("conn_oversized", coordinator.port());
        client.connection().start();

        coordinator.accept();
        assert(coordinator.read_message().at("type") == "register");
        assert(wait_until([&]
                          { return client.connected(); }));

        // A malformed payload is skipped, the link stays up.
        const std::vector<std::uint8_t> garbage{0, 0, 0, 3, '{', '{', '{'};
        coordinator.write_raw(garbage);
        coordinator.write_message({{"type", "ping"}});
        assert(wait_until([&]
                          { return client.inbound().size() == 1; }));
        assert(client.connected());

        const std::vector<std::uint8_t> oversized{0x7F, 0xFF, 0xFF, 0xFF};
        coordinator.write_raw(oversized);
        assert(coordinator.at_eof());

        coordinator.accept();
        assert(coordinator.read_message().at("type") == "register");
        assert(wait_until([&]
                          { return client.connected(); }));
    }

    void test_concurrent_producers_keep_frame_order()
    {
        constexpr int kProducers = 4;
        constexpr int kMessagesEach = 50;

        FakeCoordinator coordinator;
        Client client("conn_concurrent", coordinator.port());
        client.connection().start();

        coordinator.accept();
        assert(coordinator.read_message().at("type") == "register");
        assert(wait_until([&]
                          { return client.connected(); }));

        std::vector<std::thread> producers;
        for (int producer = 0; producer < kProducers; ++producer)
        {
            producers.emplace_back([&client, producer]
                                   {
                for (int seq = 0; seq < kMessagesEach; ++seq)
                {
                    client.connection().send(marker_event("p" + std::to_string(producer),
                                                          {{"producer", producer}, {"seq", seq}}));
                } });
        }

        std::map<int, int> next_seq;
        for (int i = 0; i < kProducers * kMessagesEach; ++i)
        {
            const auto message = coordinator.read_message();
            assert(message.at("type") == "event");
            const auto &data = message.at("event").at("data");
            const auto producer = data.at("producer").get<int>();
            assert(data.at("seq").get<int>() == next_seq[producer]);
            ++next_seq[producer];
        }
        for (auto &thread : producers)
        {
            thread.join();
        }
        for (int producer = 0; producer < kProducers; ++producer)
        {
            assert(next_seq[producer] == kMessagesEach);
        }
        assert(client.outbox().pending_count() == 0);
    }

} // namespace

void run_agent_connection_tests()
{
    test_send_without_link_goes_to_outbox();
    test_register_first_and_inbound_routing();
    test_drop_store_and_replay();
    test_stalled_link_spills_unsent_frames();
    test_full_queue_falls_back_to_outbox();
    test_oversized_frame_closes_link();
    test_concurrent_producers_keep_frame_order();
}
