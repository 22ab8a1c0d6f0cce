#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>

#include "../logging/logger.hpp"

namespace mup1gw {
namespace runtime {

namespace {
constexpr int kMinToolTimeoutMs = 100;
constexpr int kMaxPort = 65535;

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid_keys) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        const std::string key = key_node.first.as<std::string>();
        if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
            if (section.empty()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            } else {
                LOG_WARN("[Config] Unknown key '" << section << "." << key << "' (will be ignored)");
            }
        }
    }
}
}  // namespace

bool validate_config(const GatewayConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.bind.empty()) {
        error = "http.bind must not be empty";
        return false;
    }
    if (config.http.port < 0 || config.http.port > kMaxPort) {
        error = "HTTP port must be between 0 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }
    if (config.http.read_timeout_s < 1 || config.http.write_timeout_s < 1) {
        error = "HTTP read/write timeouts must be >= 1s";
        return false;
    }
    if (config.http.max_upload_bytes == 0) {
        error = "http.max_upload_bytes must be greater than 0";
        return false;
    }
    if (config.http.cors_allowed_origins.empty()) {
        error = "http.cors_allowed_origins must not be empty";
        return false;
    }

    // Validate tool settings
    if (config.tool.command.empty()) {
        error = "tool.command must not be empty";
        return false;
    }
    if (config.tool.subcommand.empty()) {
        error = "tool.subcommand must not be empty";
        return false;
    }
    if (config.tool.timeout_ms < kMinToolTimeoutMs) {
        error = "tool.timeout_ms must be >= " + std::to_string(kMinToolTimeoutMs) + "ms";
        return false;
    }

    // Validate Logging settings
    if (logging::string_to_level(config.logging.level) == logging::Level::LVL_NONE) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, GatewayConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        if (yaml.IsNull()) {
            LOG_WARN("[Config] " << config_path << " is empty, using defaults");
            return validate_config(config, error);
        }
        if (!yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        warn_unknown_keys(yaml, "", {"http", "tool", "logging"});

        // Load HTTP config
        if (yaml["http"]) {
            const YAML::Node http = yaml["http"];
            warn_unknown_keys(http, "http",
                              {"bind", "port", "thread_pool_size", "read_timeout_s", "write_timeout_s",
                               "max_upload_bytes", "cors_allowed_origins"});

            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
            if (http["read_timeout_s"]) {
                config.http.read_timeout_s = http["read_timeout_s"].as<int>();
            }
            if (http["write_timeout_s"]) {
                config.http.write_timeout_s = http["write_timeout_s"].as<int>();
            }
            if (http["max_upload_bytes"]) {
                config.http.max_upload_bytes = http["max_upload_bytes"].as<size_t>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (http["cors_allowed_origins"]) {
                const auto &origins_node = http["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }
            }
        }

        // Load tool config
        if (yaml["tool"]) {
            const YAML::Node tool = yaml["tool"];
            warn_unknown_keys(tool, "tool", {"command", "subcommand", "timeout_ms", "temp_dir"});

            if (tool["command"]) {
                config.tool.command = tool["command"].as<std::string>();
            }
            if (tool["subcommand"]) {
                config.tool.subcommand = tool["subcommand"].as<std::string>();
            }
            if (tool["timeout_ms"]) {
                config.tool.timeout_ms = tool["timeout_ms"].as<int>();
            }
            if (tool["temp_dir"]) {
                config.tool.temp_dir = tool["temp_dir"].as<std::string>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] HTTP: " << config.http.bind << ":" << config.http.port << " (" << config.http.thread_pool_size
                                   << " workers)");
        LOG_INFO("[Config] Tool: " << config.tool.command << " " << config.tool.subcommand << " (timeout "
                                   << config.tool.timeout_ms << "ms)");
        return true;

    } catch (const YAML::Exception &e) {
        error = "YAML parsing error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace mup1gw
