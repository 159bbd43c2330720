#include "service.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace itemstore {
namespace runtime {

namespace {
constexpr std::chrono::milliseconds kShutdownPollInterval{100};
}  // namespace

Service::Service(const ServiceConfig &config) : config_(config) {}

Service::~Service() { stop(); }

bool Service::start(std::string &error) {
    if (running_.load()) {
        error = "Service already running";
        return false;
    }

    LOG_INFO("[Service] Starting");

    if (!init_store(error)) {
        connection_.close();
        return false;
    }

    if (!init_http(error)) {
        item_store_.reset();
        connection_.close();
        return false;
    }

    running_.store(true);
    LOG_INFO("[Service] Started");
    return true;
}

bool Service::init_store(std::string &error) {
    if (!connection_.init(config_.mongodb.uri, config_.mongodb.database, error)) {
        return false;
    }

    item_store_ = std::make_unique<store::MongoItemStore>(connection_);

    if (config_.mongodb.verify_on_startup) {
        std::string ping_error;
        if (!item_store_->ping(ping_error)) {
            error = "MongoDB is not reachable: " + ping_error;
            return false;
        }
        LOG_INFO("[Service] MongoDB ping ok");
    }

    return true;
}

bool Service::init_http(std::string &error) {
    http_server_ = std::make_unique<http::HttpServer>(config_.http, *item_store_);
    if (!http_server_->start(error)) {
        http_server_.reset();
        return false;
    }
    return true;
}

void Service::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("[Service] Stopping");

    if (http_server_) {
        http_server_->stop();
        http_server_.reset();
    }

    item_store_.reset();
    connection_.close();

    LOG_INFO("[Service] Stopped");
}

void Service::run() {
    LOG_INFO("[Service] Press Ctrl+C to exit");

    while (running_.load()) {
        std::this_thread::sleep_for(kShutdownPollInterval);

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Service] Signal received, stopping...");
            break;
        }
    }

    stop();
}

}  // namespace runtime
}  // namespace itemstore
