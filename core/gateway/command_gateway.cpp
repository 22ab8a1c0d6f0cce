#include "command_gateway.hpp"

#include <memory>
#include <sstream>
#include <variant>

#include "logging/logger.hpp"
#include "output_decoder.hpp"
#include "temp_artifact.hpp"

namespace mup1gw {
namespace gateway {

namespace {
constexpr const char *kWhitespace = " \t\n\r\v\f";

std::string trim(const std::string &text) {
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::string join_command(const std::vector<std::string> &argv) {
    std::ostringstream out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            out << ' ';
        }
        out << argv[i];
    }
    return out.str();
}

GatewayResponse error_response(http::StatusCode status, const std::string &message) {
    return {status, http::make_error_response(message)};
}
}  // namespace

CommandGateway::CommandGateway(const runtime::ToolConfig &config, process::ICommandRunner &runner)
    : config_(config), runner_(runner) {}

std::vector<std::string> CommandGateway::build_command(const std::string &device, const std::string &method,
                                                       const std::string &input_path) const {
    std::vector<std::string> argv = {config_.command, config_.subcommand, "-d", device, "-m", method};
    if (!input_path.empty()) {
        argv.push_back("-i");
        argv.push_back(input_path);
    }
    return argv;
}

GatewayResponse CommandGateway::handle(const InvocationRequest &request) {
    try {
        return execute(request);
    } catch (const std::exception &e) {
        // The artifact has already been released by unwinding
        LOG_ERROR("[Gateway] Unexpected error: " << e.what());
        return error_response(http::StatusCode::INTERNAL, e.what());
    }
}

GatewayResponse CommandGateway::execute(const InvocationRequest &request) {
    std::unique_ptr<TempArtifact> artifact;
    if (request.upload.has_value()) {
        std::string error;
        artifact = TempArtifact::create(config_.temp_dir, upload_suffix(request.upload->filename),
                                        request.upload->content, error);
        if (!artifact) {
            LOG_ERROR("[Gateway] Could not stage upload: " << error);
            return error_response(http::StatusCode::INTERNAL, error);
        }
    }

    const auto argv = build_command(request.device, request.method, artifact ? artifact->path() : std::string());
    LOG_INFO("[Gateway] Running: " << join_command(argv));

    const process::RunResult result = runner_.run(argv, std::chrono::milliseconds(config_.timeout_ms));

    switch (result.status) {
        case process::RunStatus::TIMED_OUT:
            LOG_WARN("[Gateway] " << config_.subcommand << " timed out after " << config_.timeout_ms << "ms");
            return error_response(http::StatusCode::DEADLINE_EXCEEDED, config_.subcommand + " timeout");

        case process::RunStatus::SPAWN_FAILED: {
            const std::string message = result.error.empty() ? config_.subcommand + " failed" : result.error;
            LOG_ERROR("[Gateway] " << message);
            return error_response(http::StatusCode::INTERNAL, message);
        }

        case process::RunStatus::EXITED:
            break;
    }

    if (result.exit_code != 0) {
        std::string message = trim(result.stderr_text);
        if (message.empty()) {
            message = config_.subcommand + " failed";
        }
        LOG_WARN("[Gateway] " << config_.subcommand << " exited with " << result.exit_code << ": " << message);
        return error_response(http::StatusCode::INTERNAL, message);
    }

    const std::string output = trim(result.stdout_text);
    DecodedOutput decoded = decode_output(output);

    GatewayResponse response;
    response.status = http::StatusCode::OK;
    response.body = nlohmann::ordered_json::object();
    if (auto *structured = std::get_if<StructuredOutput>(&decoded)) {
        response.body["output"] = std::move(structured->value);
    } else {
        response.body["output_raw"] = std::get<RawOutput>(decoded).text;
    }

    LOG_INFO("[Gateway] " << config_.subcommand << " succeeded in " << result.duration.count() << "ms ("
                          << (response.body.contains("output") ? "structured" : "raw") << " output, "
                          << output.size() << " bytes)");
    return response;
}

}  // namespace gateway
}  // namespace mup1gw
