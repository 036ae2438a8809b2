#include "server.hpp"

#include <algorithm>

#include "errors.hpp"
#include "logging/logger.hpp"

namespace firetv {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;

bool origin_matches(const std::string &origin, const std::string &allowed) {
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

HttpServer::HttpServer(const runtime::HttpConfig &config, registry::DeviceRegistry &registry)
    : config_(config), registry_(registry) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    // Requests for one device block for up to the busy timeout, so the pool
    // bounds how many devices can be worked on at once
    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    const bool allow_credentials = config_.cors_allow_credentials;
    server_->set_post_routing_handler([allow_credentials, origins = config_.cors_allowed_origins](
                                          const httplib::Request &req, httplib::Response &res) {
        const auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        const std::string origin = origin_it->second;
        auto matched = std::find_if(origins.begin(), origins.end(),
                                    [&origin](const std::string &allowed) { return origin_matches(origin, allowed); });
        if (matched == origins.end()) {
            return;
        }

        const std::string response_origin = *matched == "*" ? "*" : origin;

        res.set_header("Access-Control-Allow-Origin", response_origin.c_str());
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });

    setup_routes();

    // JSON bodies for HTTP errors that no handler filled in (unmatched routes)
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        StatusCode code = StatusCode::INTERNAL;
        std::string message = "Internal server error";

        if (res.status == kStatusNotFound) {
            code = StatusCode::NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Bad request";
        }

        res.set_content(make_error_response(code, message).dump(), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception in " << req.method << " " << req.path << ": " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception in " << req.method << " " << req.path);
        }

        res.status = kStatusInternal;
        res.set_content(make_error_response(StatusCode::INTERNAL, msg).dump(), "application/json");
    });

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }
    port_ = config_.port;

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_DEBUG("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_DEBUG("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << config_.port);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

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
    // GET /devices/list - All devices with best-effort state
    server_->Get("/devices/list",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_list_devices(req, res); });

    // POST /devices/add - Register or replace a device
    server_->Post("/devices/add",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_add_device(req, res); });

    // GET /devices/connect/:device_id - Force a reconnect
    server_->Get(R"(/devices/connect/([^/]+))",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_connect_device(req, res); });

    // GET /devices/state/:device_id
    server_->Get(R"(/devices/state/([^/]+))",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_device_state(req, res); });

    // GET /devices/action/:device_id/:action_id - Remote-control action
    server_->Get(R"(/devices/action/([^/]+)/([^/]+))",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_device_action(req, res); });

    // GET /devices/:device_id/apps/running
    server_->Get(R"(/devices/([^/]+)/apps/running)",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_apps_running(req, res); });

    // GET /devices/:device_id/apps/:app_id/start
    server_->Get(R"(/devices/([^/]+)/apps/([^/]+)/start)",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_app_start(req, res); });

    // GET /devices/:device_id/apps/:app_id/stop
    server_->Get(R"(/devices/([^/]+)/apps/([^/]+)/stop)",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_app_stop(req, res); });

    // GET /devices/:device_id/apps/:app_id/state
    // Must be registered before the deprecated form below: "state/x/state" matches both
    server_->Get(R"(/devices/([^/]+)/apps/([^/]+)/state)",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_app_state(req, res); });

    // GET /devices/:device_id/apps/state/:app_id - Deprecated alias
    server_->Get(R"(/devices/([^/]+)/apps/state/([^/]+))", [this](const httplib::Request &req, httplib::Response &res) {
        handle_app_state_deprecated(req, res);
    });

    // OPTIONS catch-all for CORS preflight
    server_->Options(R"(/devices/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   GET  /devices/list");
    LOG_INFO("[HTTP]   POST /devices/add");
    LOG_INFO("[HTTP]   GET  /devices/connect/{device_id}");
    LOG_INFO("[HTTP]   GET  /devices/state/{device_id}");
    LOG_INFO("[HTTP]   GET  /devices/action/{device_id}/{action_id}");
    LOG_INFO("[HTTP]   GET  /devices/{device_id}/apps/running");
    LOG_INFO("[HTTP]   GET  /devices/{device_id}/apps/{app_id}/start");
    LOG_INFO("[HTTP]   GET  /devices/{device_id}/apps/{app_id}/stop");
    LOG_INFO("[HTTP]   GET  /devices/{device_id}/apps/{app_id}/state");
}

}  // namespace http
}  // namespace firetv
