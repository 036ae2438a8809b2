#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <httplib.h>

#include "runtime/config.hpp"

namespace firetv {
namespace registry {
class DeviceRegistry;
}
}  // namespace firetv

namespace firetv {
namespace http {

/**
 * @brief HTTP server exposing the device registry over REST
 *
 * A thin adapter: every route maps one request onto one DeviceRegistry
 * operation and encodes the result as JSON.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - The registry serializes requests per device
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, registry::DeviceRegistry &registry);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * Binds to configured address/port and starts server thread.
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

    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int port_ = 0;

    registry::DeviceRegistry &registry_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Device handlers (handlers/device_handlers.cpp)
    void handle_list_devices(const httplib::Request &req, httplib::Response &res);
    void handle_add_device(const httplib::Request &req, httplib::Response &res);
    void handle_connect_device(const httplib::Request &req, httplib::Response &res);
    void handle_get_device_state(const httplib::Request &req, httplib::Response &res);
    void handle_device_action(const httplib::Request &req, httplib::Response &res);

    // App handlers (handlers/app_handlers.cpp)
    void handle_apps_running(const httplib::Request &req, httplib::Response &res);
    void handle_app_start(const httplib::Request &req, httplib::Response &res);
    void handle_app_stop(const httplib::Request &req, httplib::Response &res);
    void handle_app_state(const httplib::Request &req, httplib::Response &res);
    void handle_app_state_deprecated(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace firetv
