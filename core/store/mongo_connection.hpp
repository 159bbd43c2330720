#pragma once

#include <memory>
#include <string>

#include <mongocxx/pool.hpp>

namespace itemstore {
namespace store {

/**
 * @brief Owner of the MongoDB driver pool for the process lifetime
 *
 * One MongoConnection is created by the Service and handed by reference
 * to whatever needs the database. mongocxx clients are not thread-safe,
 * so callers acquire a pooled client per operation and hold it only for
 * that operation.
 *
 * Lifecycle:
 * - init() must run once before the HTTP server accepts requests
 * - close() runs after the HTTP server has stopped
 * - acquire()/database_name() outside that window throw UninitializedError
 *
 * Pool sizing, connect and server-selection timeouts are the driver
 * defaults unless set through URI options.
 */
class MongoConnection {
public:
    MongoConnection() = default;
    ~MongoConnection();

    MongoConnection(const MongoConnection &) = delete;
    MongoConnection &operator=(const MongoConnection &) = delete;

    /**
     * @brief Create the client pool
     *
     * Validates the URI and builds the pool. The driver connects lazily,
     * so an unreachable server is reported by the first operation (or
     * ping()), not here.
     *
     * @param uri MongoDB connection string
     * @param database Database holding the items collection
     * @param error Populated with error message on failure
     * @return true if the pool was created
     */
    bool init(const std::string &uri, const std::string &database, std::string &error);

    // Release the pool. Safe to call multiple times.
    void close();

    bool is_initialized() const { return pool_ != nullptr; }

    // Check out a client; returned to the pool when the entry is destroyed
    mongocxx::pool::entry acquire();

    const std::string &database_name() const;

    /**
     * @brief Run {ping: 1} against the configured database
     *
     * @throws UninitializedError outside the init()/close() window
     * @throws mongocxx::exception if the server cannot be reached
     */
    void ping();

private:
    std::unique_ptr<mongocxx::pool> pool_;
    std::string database_;
};

}  // namespace store
}  // namespace itemstore
