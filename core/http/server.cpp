#include "server.hpp"

#include <algorithm>

#include "errors.hpp"
#include "handlers/utils.hpp"
#include "logging/logger.hpp"

namespace mup1gw {
namespace http {

namespace {
constexpr int kStatusNoContent = 204;
constexpr const char *kAllowedMethods = "GET, POST, OPTIONS";
constexpr const char *kDefaultAllowedHeaders = "Content-Type";

bool origin_allowed(const std::string &allowed, const std::string &origin) {
    if (allowed == "*") {
        return true;
    }

    const auto wildcard_pos = allowed.find('*');
    if (wildcard_pos == std::string::npos) {
        return allowed == origin;
    }

    const std::string prefix = allowed.substr(0, wildcard_pos);
    const std::string suffix = allowed.substr(wildcard_pos + 1);
    if (origin.size() < prefix.size() + suffix.size()) {
        return false;
    }

    const bool prefix_ok = origin.compare(0, prefix.size(), prefix) == 0;
    const bool suffix_ok = origin.compare(origin.size() - suffix.size(), suffix.size(), suffix) == 0;
    return prefix_ok && suffix_ok;
}
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, gateway::CommandGateway &gateway)
    : config_(config), gateway_(gateway) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }
    if (server_thread_) {
        stop();
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(config_.read_timeout_s, 0);
    server_->set_write_timeout(config_.write_timeout_s, 0);
    server_->set_payload_max_length(config_.max_upload_bytes);

    // One task per request; a tool run blocks its worker for up to tool.timeout_ms
    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // Add CORS headers to all responses (allowlist with wildcard support)
    server_->set_post_routing_handler([origins = config_.cors_allowed_origins](const httplib::Request &req,
                                                                               httplib::Response &res) {
        const auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        const std::string origin = origin_it->second;
        auto matched = std::find_if(origins.begin(), origins.end(),
                                    [&origin](const std::string &allowed) { return origin_allowed(allowed, origin); });
        if (matched == origins.end()) {
            return;
        }

        const std::string response_origin = *matched == "*" ? "*" : origin;
        res.set_header("Access-Control-Allow-Origin", response_origin.c_str());
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);

        // Preflights may ask for arbitrary headers; grant what was asked
        const auto requested = req.headers.find("Access-Control-Request-Headers");
        if (requested != req.headers.end() && !requested->second.empty()) {
            res.set_header("Access-Control-Allow-Headers", requested->second.c_str());
        } else {
            res.set_header("Access-Control-Allow-Headers", kDefaultAllowedHeaders);
        }
    });

    setup_routes();

    // JSON bodies for errors httplib raises itself (404, 413, 400)
    // Only override content if the handler did not set any
    const size_t max_upload_bytes = config_.max_upload_bytes;
    server_->set_error_handler([max_upload_bytes](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        std::string message = "Internal server error";
        if (res.status == status_code_to_http(StatusCode::NOT_FOUND)) {
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == status_code_to_http(StatusCode::PAYLOAD_TOO_LARGE)) {
            message = "Request body exceeds " + std::to_string(max_upload_bytes) + " bytes";
        } else if (res.status == status_code_to_http(StatusCode::INVALID_ARGUMENT)) {
            message = "Bad request";
        }

        res.set_content(make_error_response(message).dump(), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request &, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception: " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception");
        }

        send_json(res, StatusCode::INTERNAL, make_error_response(msg));
    });

    server_->set_logger([](const httplib::Request &req, const httplib::Response &res) {
        LOG_DEBUG("[HTTP] " << req.method << " " << req.path << " -> " << res.status);
    });

    // Bind first so errors surface here rather than in the server thread
    if (config_.port == 0) {
        port_ = server_->bind_to_any_port(config_.bind.c_str());
        if (port_ < 0) {
            error = "Failed to bind to " + config_.bind + " on any port";
            server_.reset();
            return false;
        }
    } else {
        if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
            error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
            server_.reset();
            return false;
        }
        port_ = config_.port;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        // stop() clears the flag first; still set here means the accept loop failed
        if (running_.exchange(false)) {
            LOG_ERROR("[HTTP] Server loop exited unexpectedly");
        }
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << port_);
    return true;
}

void HttpServer::stop() {
    // A failed server loop leaves the flag cleared but the thread still to join
    running_.store(false);
    if (!server_ && !server_thread_) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    // GET / - Static invocation form
    server_->Get("/", [this](const httplib::Request &req, httplib::Response &res) { handle_get_index(req, res); });

    // POST /api/run-mup1cc - Run the device tool
    server_->Post("/api/run-mup1cc",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_run(req, res); });

    // OPTIONS catch-all for CORS preflight
    server_->Options(R"(.*)", [](const httplib::Request &, httplib::Response &res) { res.status = kStatusNoContent; });
}

}  // namespace http
}  // namespace mup1gw
