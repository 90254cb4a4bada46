#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "fleetsync/agent/agent.hpp"
#include "fleetsync/agent/config.hpp"
#include "fleetsync/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void configure_logging(const fleetsync::agent::AgentConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), false));
        }
        auto logger = std::make_shared<spdlog::logger>("agent", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace

int main(int argc, char *argv[])
{
    using fleetsync::agent::Agent;

    fleetsync::agent::CommandLine command_line;
    try
    {
        command_line = fleetsync::agent::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        std::cerr << fleetsync::agent::usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (command_line.show_help)
    {
        std::cout << fleetsync::agent::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    auto config = std::move(command_line.config);
    try
    {
        fleetsync::agent::finalize_config(config);
        configure_logging(config);
        spdlog::info("Starting fleetsync agent {} as {} against {}", fleetsync::version(), config.agent_id,
                     config.server_url);

        Agent agent(std::move(config));
        agent.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Agent failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
