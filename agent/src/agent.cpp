#include "fleetsync/agent/agent.hpp"

#include <asio/post.hpp>

#include <chrono>
#include <csignal>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "fleetsync/agent/standalone_engine.hpp"
#include "fleetsync/agent/system_info.hpp"
#include "fleetsync/version.hpp"

namespace fleetsync::agent
{

    namespace
    {

        constexpr const char *kHealthTask = "agent:health";
        constexpr const char *kOutboxFlushTask = "agent:outbox-flush";

        std::unique_ptr<SyncEngine> default_engine(const AgentConfig &config, std::unique_ptr<SyncEngine> engine)
        {
            if (engine)
            {
                return engine;
            }
            return std::make_unique<StandaloneEngine>(config.data_dir / "engine");
        }

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            return requested > 0 ? requested : 2;
        }

    } // namespace

    Agent::Agent(AgentConfig config, std::unique_ptr<SyncEngine> engine)
        : config_(std::move(config)),
          endpoint_(parse_endpoint(config_.server_url)),
          pool_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          inbound_strand_(asio::make_strand(pool_)),
          event_strand_(asio::make_strand(pool_)),
          engine_(default_engine(config_, std::move(engine))),
          outbox_(Outbox::default_store_path(config_.data_dir, config_.agent_id), config_.agent_id),
          connection_(ConnectionManager::Options{
                          .endpoint = endpoint_,
                          .settings = config_.connection,
                          .tls_verify = config_.tls_verify,
                          .tls_ca_file = config_.tls_ca_file,
                          .registration = [this]
                          {
                              return protocol::RegisterMessage{
                                  .agent_id = config_.agent_id,
                                  .device_id = engine_->device_id(),
                                  .data_dir = config_.data_dir.string(),
                                  .version = std::string(fleetsync::version()),
                                  .hostname = local_hostname(),
                              };
                          },
                          .replay_executor = [this](std::function<void()> job)
                          { asio::post(pool_, std::move(job)); },
                      },
                      outbox_, [this](nlohmann::json message)
                      { on_inbound(std::move(message)); }),
          sessions_(connection_, config_.agent_id),
          scheduler_(pool_),
          resync_(*engine_, connection_),
          jobs_(scheduler_, *engine_, progress_, resync_, connection_, config_.agent_id, config_.monitoring),
          events_(connection_, progress_, sessions_, jobs_, config_.agent_id),
          peers_(config_.peers),
          dispatcher_(DispatcherServices{
              .engine = *engine_,
              .sink = connection_,
              .progress = progress_,
              .jobs = jobs_,
              .peers = peers_,
              .agent_id = config_.agent_id,
              .advertise_address = config_.advertise_address,
              .coordinator_host = endpoint_.host,
              .status_provider = [this]
              { return status(); },
              .reload = [this](std::optional<bool> event_debug)
              { reload(event_debug); },
          }),
          signals_(signal_io_)
    {
        events_.set_event_debug(config_.event_debug);
        engine_->set_event_handler([this](EngineEvent event)
                                   { on_engine_event(std::move(event)); });
    }

    Agent::~Agent()
    {
        stop();
    }

    void Agent::start()
    {
        if (running_.exchange(true))
        {
            return;
        }

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        work_.emplace(asio::make_work_guard(pool_));
        workers_.reserve(worker_count);
        for (std::size_t i = 0; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  {
                for (;;)
                {
                    try
                    {
                        pool_.run();
                        break;
                    }
                    catch (const std::exception &ex)
                    {
                        spdlog::error("Worker task failed: {}", ex.what());
                    }
                } });
        }

        engine_->set_event_debug(config_.event_debug);
        engine_->start();
        spdlog::info("Agent {} started (device {}, {} worker threads)", config_.agent_id, engine_->device_id(),
                     worker_count);

        connection_.start();

        if (config_.monitoring.enabled)
        {
            scheduler_.schedule_periodic(kHealthTask, config_.monitoring.report_interval, [this]
                                         { send_health(); });
        }
        scheduler_.schedule_periodic(kOutboxFlushTask, OutboxSettings{}.flush_after, [this]
                                     {
            if (outbox_.buffered_count() > 0 && !outbox_.flush())
            {
                spdlog::warn("Periodic outbox flush failed, {} events still buffered", outbox_.buffered_count());
            } });
    }

    void Agent::stop()
    {
        if (!running_.exchange(false))
        {
            return;
        }
        spdlog::info("Agent {} stopping", config_.agent_id);

        scheduler_.cancel_all();
        connection_.stop();
        try
        {
            engine_->stop();
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Engine stop failed: {}", ex.what());
        }

        work_.reset();
        pool_.stop();
        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();

        // Messages produced by tasks that were still running go to the outbox.
        if (!outbox_.flush())
        {
            spdlog::error("Final outbox flush failed");
        }
        spdlog::info("Agent {} stopped", config_.agent_id);
    }

    void Agent::run()
    {
        start();
        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.add(SIGHUP);
        wait_for_signal();
        signal_io_.run();
        stop();
    }

    void Agent::wait_for_signal()
    {
        signals_.async_wait([this](const std::error_code &ec, int signal)
                            {
            if (ec)
            {
                return;
            }
            if (signal == SIGHUP)
            {
                spdlog::info("SIGHUP received, reloading configuration");
                try
                {
                    reload();
                }
                catch (const std::exception &ex)
                {
                    spdlog::error("Configuration reload failed: {}", ex.what());
                }
                wait_for_signal();
                return;
            }
            spdlog::info("Signal {} received, shutting down", signal);
            signal_io_.stop(); });
    }

    void Agent::reload(std::optional<bool> event_debug)
    {
        std::lock_guard lock(reload_mutex_);

        auto debug = config_.event_debug;
        auto level = config_.log_level;
        if (config_.config_file)
        {
            const auto reloaded = load_config_file(*config_.config_file);
            debug = reloaded.event_debug;
            level = reloaded.log_level;
        }
        if (event_debug)
        {
            debug = *event_debug;
        }

        const auto parsed_level = spdlog::level::from_str(level);
        if (parsed_level == spdlog::level::off && level != "off")
        {
            throw std::runtime_error("Unknown log level: " + level);
        }
        spdlog::set_level(parsed_level);
        config_.log_level = level;

        config_.event_debug = debug;
        events_.set_event_debug(debug);
        engine_->set_event_debug(debug);
        spdlog::info("Configuration reloaded (event_debug={}, log_level={})", debug, level);
    }

    protocol::AgentStatus Agent::status() const
    {
        protocol::AgentStatus status{
            .agent_id = config_.agent_id,
            .device_id = engine_->device_id(),
            .version = std::string(fleetsync::version()),
            .running = running_.load(),
            .engine_running = engine_->running(),
            .connection_state = std::string(to_string(connection_.state())),
            .pending_events = outbox_.pending_count(),
        };
        for (const auto &folder : engine_->folders())
        {
            try
            {
                status.folders.push_back(engine_->folder_status(folder.id));
            }
            catch (const EngineError &ex)
            {
                spdlog::warn("Status of folder {} unavailable: {}", folder.id, ex.what());
            }
        }
        status.connections = engine_->connections();
        return status;
    }

    void Agent::send_health()
    {
        connection_.send(protocol::HealthMessage{
            .agent_id = config_.agent_id,
            .system_info = collect_system_info(config_.data_dir),
            .data_dir = config_.data_dir.string(),
            .timestamp = std::chrono::system_clock::now(),
        });
    }

    void Agent::on_inbound(nlohmann::json message)
    {
        asio::post(inbound_strand_, [this, message = std::move(message)]
                   { dispatcher_.handle(message); });
    }

    void Agent::on_engine_event(EngineEvent event)
    {
        asio::post(event_strand_, [this, event = std::move(event)]
                   { events_.process(event); });
    }

} // namespace fleetsync::agent
