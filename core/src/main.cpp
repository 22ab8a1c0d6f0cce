// mup1-gateway
// HTTP front-end for `dr mup1cc` with config-based startup

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "gateway/command_gateway.hpp"
#include "http/server.hpp"
#include "logging/logger.hpp"
#include "process/command_runner.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv)
{
    // Parse CLI arguments
    const std::string default_config_path = "mup1-gateway.yaml";
    std::string config_path = default_config_path;
    bool config_explicit = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
            config_explicit = true;
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
            config_explicit = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: mup1-gateway [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: mup1-gateway.yaml, optional)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    LOG_INFO("mup1-gateway starting...");

    mup1gw::runtime::GatewayConfig config;
    std::string error;

    if (std::filesystem::exists(config_path))
    {
        LOG_INFO("Loading config: " << config_path);
        if (!mup1gw::runtime::load_config(config_path, config, error))
        {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    }
    else if (config_explicit)
    {
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        return 1;
    }
    else
    {
        LOG_INFO("No " << default_config_path << " found, using built-in defaults");
        if (!mup1gw::runtime::validate_config(config, error))
        {
            LOG_ERROR("Invalid default config: " << error);
            return 1;
        }
    }

    mup1gw::logging::Logger::set_level(mup1gw::logging::string_to_level(config.logging.level));

    mup1gw::process::CommandRunner runner;
    mup1gw::gateway::CommandGateway gateway(config.tool, runner);
    mup1gw::http::HttpServer server(config.http, gateway);

    if (!server.start(error))
    {
        LOG_ERROR("HTTP server failed to start: " << error);
        return 1;
    }

    // Install signal handler for graceful shutdown
    mup1gw::runtime::SignalHandler::install();

    LOG_INFO("Gateway Ready");
    LOG_INFO("  Listening: " << config.http.bind << ":" << server.get_port());
    LOG_INFO("  Tool: " << config.tool.command << " " << config.tool.subcommand << " (timeout "
                        << config.tool.timeout_ms << "ms)");
    LOG_INFO("  Log level: " << mup1gw::logging::level_to_string(mup1gw::logging::Logger::level()));
    LOG_INFO("Press Ctrl+C to exit");

    while (server.is_running() && !mup1gw::runtime::SignalHandler::is_shutdown_requested())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (!mup1gw::runtime::SignalHandler::is_shutdown_requested())
    {
        LOG_ERROR("HTTP server stopped unexpectedly");
        server.stop();
        return 1;
    }

    LOG_INFO("Signal received, stopping...");
    server.stop();

    LOG_INFO("Shutdown complete");
    return 0;
}
