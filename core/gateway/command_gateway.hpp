#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "http/errors.hpp"
#include "process/i_command_runner.hpp"
#include "runtime/config.hpp"

namespace mup1gw {
namespace gateway {

struct Upload {
    std::string content;
    std::string filename;  // As sent by the client; may be empty
};

struct InvocationRequest {
    std::string method;  // Forwarded verbatim (get, fetch, ipatch, post, put, delete, ...)
    std::string device;  // Forwarded verbatim (/dev/ttyACM0, termhub://host:port, ...)
    std::optional<Upload> upload;
};

struct GatewayResponse {
    http::StatusCode status = http::StatusCode::OK;
    nlohmann::ordered_json body;
};

/**
 * @brief Translates one invocation request into one run of the device tool
 *
 * handle() stages the optional upload in a TempArtifact, runs
 * `<command> <subcommand> -d <device> -m <method> [-i <file>]` through the
 * runner, and maps the outcome:
 * - exit 0 -> 200 {"output": value} or {"output_raw": text}
 * - exit != 0 -> 500 {"error": stderr or "<subcommand> failed"}
 * - timeout -> 504 {"error": "<subcommand> timeout"}
 * - staging/spawn failure or exception -> 500 {"error": message}
 * The staged file is gone before handle() returns.
 *
 * Holds no per-request state; safe to call from concurrent HTTP workers as
 * long as the runner is.
 */
class CommandGateway {
public:
    CommandGateway(const runtime::ToolConfig &config, process::ICommandRunner &runner);

    GatewayResponse handle(const InvocationRequest &request);

    // Argument vector for one run; input_path empty means no -i flag
    std::vector<std::string> build_command(const std::string &device, const std::string &method,
                                           const std::string &input_path) const;

private:
    GatewayResponse execute(const InvocationRequest &request);

    runtime::ToolConfig config_;
    process::ICommandRunner &runner_;
};

}  // namespace gateway
}  // namespace mup1gw
