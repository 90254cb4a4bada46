#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace fleetsync::agent
{

    struct ConnectionSettings
    {
        std::chrono::milliseconds read_timeout{std::chrono::seconds{300}};
        std::chrono::milliseconds write_timeout{std::chrono::seconds{10}};
        std::chrono::milliseconds handshake_timeout{std::chrono::seconds{30}};
        std::chrono::milliseconds retry_delay{std::chrono::seconds{10}};
        std::chrono::milliseconds watchdog_interval{std::chrono::seconds{30}};
        std::chrono::milliseconds replay_grace{std::chrono::seconds{1}};
        std::chrono::milliseconds ping_interval{std::chrono::seconds{60}};
        std::size_t queue_capacity{10000};
    };

    struct MonitoringSettings
    {
        bool enabled{true};
        std::chrono::milliseconds report_interval{std::chrono::seconds{30}};
        bool auto_resync_enabled{true};
        std::chrono::milliseconds auto_resync_interval{std::chrono::seconds{30}};
        std::chrono::milliseconds stats_interval{std::chrono::seconds{5}};
    };

    struct AgentConfig
    {
        std::string agent_id;
        std::string agent_id_prefix;
        std::string agent_id_suffix;
        std::string server_url{"tcp://localhost:8090"};
        bool tls_verify{true};
        std::optional<std::filesystem::path> tls_ca_file;
        std::filesystem::path data_dir{"data"};
        std::optional<std::string> advertise_address;
        std::map<std::string, std::string> peers;
        bool event_debug{false};
        std::string log_level{"info"};
        std::optional<std::filesystem::path> log_file;
        std::size_t worker_threads{2};
        ConnectionSettings connection;
        MonitoringSettings monitoring;
        std::optional<std::filesystem::path> config_file;
    };

    struct CommandLine
    {
        AgentConfig config;
        bool show_help{};
    };

    std::string usage(const char *program_name);

    // --config is applied first, the remaining flags override it. Throws std::runtime_error.
    CommandLine parse_arguments(int argc, char *argv[]);

    // Overlays the keys present in json onto config. Throws std::runtime_error on invalid values.
    void apply_config_json(const nlohmann::json &json, AgentConfig &config);

    AgentConfig load_config_file(const std::filesystem::path &path, AgentConfig base = {});

    std::string generate_agent_id(const std::string &hostname, const std::string &prefix, const std::string &suffix);

    // Fills the agent id from the host name when none was configured.
    void finalize_config(AgentConfig &config);

} // namespace fleetsync::agent
