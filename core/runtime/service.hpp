#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "http/server.hpp"
#include "store/mongo_connection.hpp"
#include "store/mongo_item_store.hpp"

namespace itemstore {
namespace runtime {

/**
 * @brief Owns the store connection and the HTTP server
 *
 * Ordering guarantees:
 * - start(): connection first, HTTP server last, so no request is served
 *   before the store is ready
 * - stop(): HTTP server first (joins the listener and drains workers),
 *   connection last, so no handler outlives the connection
 */
class Service {
public:
    explicit Service(const ServiceConfig &config);
    ~Service();

    Service(const Service &) = delete;
    Service &operator=(const Service &) = delete;

    bool start(std::string &error);
    void stop();

    // Block until SIGINT/SIGTERM, then stop()
    void run();

private:
    bool init_store(std::string &error);
    bool init_http(std::string &error);

    ServiceConfig config_;

    store::MongoConnection connection_;
    std::unique_ptr<store::MongoItemStore> item_store_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace itemstore
