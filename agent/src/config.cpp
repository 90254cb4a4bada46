#include "fleetsync/agent/config.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "fleetsync/agent/system_info.hpp"
#include "fleetsync/version.hpp"

namespace fleetsync::agent
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index + 1 >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            ++index;
            return std::string(argv[index]);
        }

        std::size_t parse_count(const std::string &value, const std::string &flag)
        {
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stoull(value, &consumed);
                if (consumed != value.size() || parsed == 0)
                {
                    throw std::invalid_argument(value);
                }
                return static_cast<std::size_t>(parsed);
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error(flag + " expects a positive integer, got '" + value + "'");
            }
        }

        std::chrono::milliseconds read_seconds(const nlohmann::json &json, const char *key,
                                               std::chrono::milliseconds fallback)
        {
            if (!json.contains(key))
            {
                return fallback;
            }
            const auto seconds = json.at(key).get<double>();
            if (seconds <= 0)
            {
                throw std::runtime_error(std::string(key) + " must be positive");
            }
            return std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
        }

        void apply_connection(const nlohmann::json &json, ConnectionSettings &settings)
        {
            settings.read_timeout = read_seconds(json, "read_timeout_s", settings.read_timeout);
            settings.write_timeout = read_seconds(json, "write_timeout_s", settings.write_timeout);
            settings.handshake_timeout = read_seconds(json, "handshake_timeout_s", settings.handshake_timeout);
            settings.retry_delay = read_seconds(json, "retry_delay_s", settings.retry_delay);
            settings.watchdog_interval = read_seconds(json, "watchdog_interval_s", settings.watchdog_interval);
            settings.ping_interval = read_seconds(json, "ping_interval_s", settings.ping_interval);
            if (json.contains("replay_grace_ms"))
            {
                settings.replay_grace = std::chrono::milliseconds(json.at("replay_grace_ms").get<std::int64_t>());
            }
            if (json.contains("queue_capacity"))
            {
                settings.queue_capacity = json.at("queue_capacity").get<std::size_t>();
                if (settings.queue_capacity == 0)
                {
                    throw std::runtime_error("queue_capacity must be positive");
                }
            }
        }

        void apply_monitoring(const nlohmann::json &json, MonitoringSettings &settings)
        {
            settings.enabled = json.value("enabled", settings.enabled);
            settings.auto_resync_enabled = json.value("auto_resync_enabled", settings.auto_resync_enabled);
            settings.report_interval = read_seconds(json, "report_interval_s", settings.report_interval);
            settings.auto_resync_interval = read_seconds(json, "auto_resync_interval_s", settings.auto_resync_interval);
            settings.stats_interval = read_seconds(json, "stats_interval_s", settings.stats_interval);
        }

        std::string sanitize_hostname(const std::string &hostname)
        {
            std::string result;
            result.reserve(hostname.size());
            for (const unsigned char ch : hostname)
            {
                if (std::isspace(ch))
                {
                    result.push_back('-');
                }
                else
                {
                    result.push_back(static_cast<char>(std::tolower(ch)));
                }
            }
            return result.empty() ? std::string("unknown") : result;
        }

    } // namespace

    std::string usage(const char *program_name)
    {
        std::ostringstream out;
        out << "fleetsync agent " << fleetsync::version() << "\n"
            << "Usage: " << program_name
            << " [--config <FILE>] [--server <URL>] [--agent-id <ID>] [--data-dir <DIR>]"
               " [--advertise-address <HOST>] [--log <FILE>] [--log-level <LEVEL>] [--threads <N>]"
               " [--tls-insecure] [--tls-ca <FILE>] [--event-debug]\n";
        return out.str();
    }

    CommandLine parse_arguments(int argc, char *argv[])
    {
        CommandLine result;

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--config")
            {
                const auto path = std::filesystem::path(require_value(i, argc, argv, arg));
                result.config = load_config_file(path, result.config);
                result.config.config_file = path;
            }
        }

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--config")
            {
                ++i;
            }
            else if (arg == "--server")
            {
                result.config.server_url = require_value(i, argc, argv, arg);
            }
            else if (arg == "--agent-id")
            {
                result.config.agent_id = require_value(i, argc, argv, arg);
            }
            else if (arg == "--data-dir")
            {
                result.config.data_dir = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--advertise-address")
            {
                result.config.advertise_address = require_value(i, argc, argv, arg);
            }
            else if (arg == "--log")
            {
                result.config.log_file = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--log-level")
            {
                result.config.log_level = require_value(i, argc, argv, arg);
            }
            else if (arg == "--threads")
            {
                result.config.worker_threads = parse_count(require_value(i, argc, argv, arg), arg);
            }
            else if (arg == "--tls-insecure")
            {
                result.config.tls_verify = false;
            }
            else if (arg == "--tls-ca")
            {
                result.config.tls_ca_file = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--event-debug")
            {
                result.config.event_debug = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                result.show_help = true;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return result;
    }

    void apply_config_json(const nlohmann::json &json, AgentConfig &config)
    {
        if (!json.is_object())
        {
            throw std::runtime_error("Configuration must be a JSON object");
        }
        try
        {
            config.agent_id = json.value("agent_id", config.agent_id);
            config.agent_id_prefix = json.value("agent_id_prefix", config.agent_id_prefix);
            config.agent_id_suffix = json.value("agent_id_suffix", config.agent_id_suffix);
            config.server_url = json.value("server_url", config.server_url);
            config.tls_verify = json.value("tls_verify", config.tls_verify);
            if (json.contains("tls_ca_file"))
            {
                config.tls_ca_file = std::filesystem::path(json.at("tls_ca_file").get<std::string>());
            }
            if (json.contains("data_dir"))
            {
                config.data_dir = std::filesystem::path(json.at("data_dir").get<std::string>());
            }
            if (json.contains("advertise_address"))
            {
                config.advertise_address = json.at("advertise_address").get<std::string>();
            }
            if (json.contains("peers"))
            {
                for (const auto &[agent, host] : json.at("peers").items())
                {
                    config.peers[agent] = host.get<std::string>();
                }
            }
            config.event_debug = json.value("event_debug", config.event_debug);
            config.log_level = json.value("log_level", config.log_level);
            if (json.contains("log_file"))
            {
                config.log_file = std::filesystem::path(json.at("log_file").get<std::string>());
            }
            if (json.contains("worker_threads"))
            {
                config.worker_threads = json.at("worker_threads").get<std::size_t>();
                if (config.worker_threads == 0)
                {
                    throw std::runtime_error("worker_threads must be positive");
                }
            }
            if (json.contains("connection"))
            {
                apply_connection(json.at("connection"), config.connection);
            }
            if (json.contains("monitoring"))
            {
                apply_monitoring(json.at("monitoring"), config.monitoring);
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error(std::string("Invalid configuration value: ") + ex.what());
        }
    }

    AgentConfig load_config_file(const std::filesystem::path &path, AgentConfig base)
    {
        std::ifstream input(path);
        if (!input)
        {
            throw std::runtime_error("Cannot open configuration file " + path.string());
        }
        const auto json = nlohmann::json::parse(input, nullptr, false);
        if (json.is_discarded())
        {
            throw std::runtime_error("Configuration file " + path.string() + " is not valid JSON");
        }
        apply_config_json(json, base);
        return base;
    }

    std::string generate_agent_id(const std::string &hostname, const std::string &prefix, const std::string &suffix)
    {
        const auto host = sanitize_hostname(hostname);
        if (prefix.empty() && suffix.empty())
        {
            return "agent-" + host;
        }

        std::vector<std::string> parts;
        if (!prefix.empty())
        {
            parts.push_back(prefix);
        }
        parts.push_back(host);
        if (!suffix.empty())
        {
            parts.push_back(suffix);
        }

        std::string id;
        for (const auto &part : parts)
        {
            if (!id.empty())
            {
                id.push_back('-');
            }
            id += part;
        }
        return id;
    }

    void finalize_config(AgentConfig &config)
    {
        if (config.agent_id.empty())
        {
            config.agent_id = generate_agent_id(local_hostname(), config.agent_id_prefix, config.agent_id_suffix);
        }
    }

} // namespace fleetsync::agent
