#pragma once

#include <httplib.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "runtime/config.hpp"

namespace mup1gw {
namespace gateway {
class CommandGateway;
}

namespace http {

/**
 * @brief HTTP front-end for the command gateway
 *
 * Routes:
 * - GET  /                 -> static page with the invocation form
 * - POST /api/run-mup1cc   -> CommandGateway::handle
 * - OPTIONS *              -> CORS preflight
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool, one request per task
 * - Handlers share no mutable state; each owns its process and temp file
 *
 * Lifecycle:
 * - start() binds to the configured address/port and spawns the server thread
 * - stop() signals shutdown and joins the server thread
 */
class HttpServer {
public:
    /**
     * @brief Construct HTTP server
     *
     * @param config HTTP configuration (bind address, port, pool, CORS)
     * @param gateway Gateway that executes form submissions; must outlive the server
     */
    HttpServer(const runtime::HttpConfig &config, gateway::CommandGateway &gateway);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * Binds to the configured address/port (port 0 picks a free port) and
     * starts the server thread.
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    /**
     * @brief Stop HTTP server
     *
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * @brief Get the port server is listening on (resolved when config asked for 0)
     */
    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int port_ = 0;

    gateway::CommandGateway &gateway_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Route handlers (implemented in handlers/)
    void handle_get_index(const httplib::Request &req, httplib::Response &res);
    void handle_post_run(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace mup1gw
