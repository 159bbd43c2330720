#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <httplib.h>
#include "runtime/config.hpp"
#include "store/i_item_store.hpp"

namespace itemstore {
namespace http {

/**
 * @brief HTTP front end for the items collection
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - The item store is shared by all workers; MongoItemStore checks out a
 *   pooled client per call, so no locking happens here
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread; once it returns no
 *   handler is running and the store may be closed
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, store::IItemStore &store);

    ~HttpServer();

    /**
     * @brief Start HTTP server
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

private:
    runtime::HttpConfig config_;

    store::IItemStore &store_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_cors();
    void setup_routes();

    // Item handlers (handlers/item_handlers.cpp)
    void handle_create_item(const httplib::Request &req, httplib::Response &res);
    void handle_list_items(const httplib::Request &req, httplib::Response &res);
    void handle_get_item(const httplib::Request &req, httplib::Response &res);
    void handle_update_item(const httplib::Request &req, httplib::Response &res);
    void handle_delete_item(const httplib::Request &req, httplib::Response &res);

    // Health handlers (handlers/system_handlers.cpp)
    void handle_get_health(const httplib::Request &req, httplib::Response &res);
    void handle_get_root(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace itemstore
