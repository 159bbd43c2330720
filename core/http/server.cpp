#include "server.hpp"

#include <algorithm>

#include "errors.hpp"
#include "logging/logger.hpp"

namespace itemstore {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;
constexpr const char *kAllowedMethods = "GET, POST, PUT, DELETE, OPTIONS";
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, store::IItemStore &store) : config_(config), store_(store) {}

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

    const auto pool_size = static_cast<size_t>(config_.thread_pool_size);
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    setup_cors();
    setup_routes();

    server_->set_logger([](const httplib::Request &req, const httplib::Response &res) {
        LOG_DEBUG("[HTTP] " << req.method << " " << req.path << " -> " << res.status);
    });

    // JSON bodies for errors httplib raises itself (unknown route, malformed request).
    // Handlers that already wrote a body keep it.
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

        nlohmann::json response = make_error_response(code, message);
        res.set_content(response.dump(), "application/json");
    });

    // Store failures and lifecycle errors end up here as 500s
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

        nlohmann::json response = make_error_response(StatusCode::INTERNAL, msg);
        res.status = kStatusInternal;
        res.set_content(response.dump(), "application/json");
    });

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
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

void HttpServer::setup_cors() {
    // Add CORS headers to all responses (allowlist with wildcard support)
    const bool allow_credentials = config_.cors_allow_credentials;
    server_->set_post_routing_handler([allow_credentials, origins = config_.cors_allowed_origins](
                                          const httplib::Request &req, httplib::Response &res) {
        const auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        const std::string origin = origin_it->second;
        auto origin_matches = [&origin](const std::string &allowed) {
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
        };

        auto matched = std::find_if(origins.begin(), origins.end(), origin_matches);
        if (matched == origins.end()) {
            return;
        }

        // Browsers reject "*" together with credentials, so echo the origin then
        const bool wildcard = *matched == "*" && !allow_credentials;
        res.set_header("Access-Control-Allow-Origin", wildcard ? "*" : origin.c_str());
        if (!wildcard) {
            res.set_header("Vary", "Origin");
        }
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);

        const std::string requested_headers = req.get_header_value("Access-Control-Request-Headers");
        res.set_header("Access-Control-Allow-Headers", requested_headers.empty() ? "*" : requested_headers.c_str());
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });
}

void HttpServer::setup_routes() {
    // GET / - Basic liveness, no store access
    server_->Get("/", [this](const httplib::Request &req, httplib::Response &res) { handle_get_root(req, res); });

    // GET /health - Liveness plus MongoDB ping
    server_->Get("/health",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_health(req, res); });

    // POST /items - Create item
    server_->Post("/items",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_create_item(req, res); });

    // GET /items - List items, newest first
    server_->Get("/items",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_list_items(req, res); });

    // GET /items/:id - Get item
    server_->Get(R"(/items/([^/]+))",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_item(req, res); });

    // PUT /items/:id - Partial update
    server_->Put(R"(/items/([^/]+))",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_update_item(req, res); });

    // DELETE /items/:id - Delete item
    server_->Delete(R"(/items/([^/]+))",
                    [this](const httplib::Request &req, httplib::Response &res) { handle_delete_item(req, res); });

    // OPTIONS catch-all for CORS preflight; headers come from the post-routing handler
    server_->Options(R"(.*)", [](const httplib::Request &, httplib::Response &res) { res.status = kStatusNoContent; });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   GET    /");
    LOG_INFO("[HTTP]   GET    /health");
    LOG_INFO("[HTTP]   POST   /items");
    LOG_INFO("[HTTP]   GET    /items");
    LOG_INFO("[HTTP]   GET    /items/{id}");
    LOG_INFO("[HTTP]   PUT    /items/{id}");
    LOG_INFO("[HTTP]   DELETE /items/{id}");
}

}  // namespace http
}  // namespace itemstore
