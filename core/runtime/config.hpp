#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace mup1gw {
namespace runtime {

struct HttpConfig {
    std::string bind = "0.0.0.0";                        // Bind address
    int port = 8000;                                     // HTTP port (0 = pick a free port)
    int thread_pool_size = 8;                            // Worker thread pool size
    int read_timeout_s = 60;                             // Socket read timeout
    int write_timeout_s = 60;                            // Socket write timeout
    size_t max_upload_bytes = 16 * 1024 * 1024;          // Request body cap
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
};

struct ToolConfig {
    std::string command = "dr";           // Executable, resolved through PATH
    std::string subcommand = "mup1cc";    // First argument, also used in error literals
    int timeout_ms = 30000;               // Hard cap on one invocation
    std::string temp_dir;                 // Upload staging directory (empty = system temp)
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct GatewayConfig {
    HttpConfig http;
    ToolConfig tool;
    LoggingConfig logging;
};

// Loads configuration from a YAML file on top of the defaults already in config
bool load_config(const std::string &config_path, GatewayConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const GatewayConfig &config, std::string &error);

}  // namespace runtime
}  // namespace mup1gw
