#include "mongo_connection.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/uri.hpp>

#include "errors.hpp"
#include "logging/logger.hpp"

namespace itemstore {
namespace store {

namespace {
constexpr const char *kUninitializedMessage = "MongoDB client is not initialized. Did startup run?";

// The driver allows exactly one instance per process and it must outlive every pool
void ensure_driver_instance() { static mongocxx::instance instance{}; }
}  // namespace

MongoConnection::~MongoConnection() { close(); }

bool MongoConnection::init(const std::string &uri, const std::string &database, std::string &error) {
    if (pool_) {
        error = "MongoDB connection already initialized";
        return false;
    }
    if (database.empty()) {
        error = "MongoDB database name must not be empty";
        return false;
    }

    ensure_driver_instance();

    try {
        pool_ = std::make_unique<mongocxx::pool>(mongocxx::uri{uri});
    } catch (const mongocxx::exception &e) {
        error = "Invalid MongoDB URI '" + uri + "': " + e.what();
        return false;
    }

    database_ = database;
    LOG_INFO("[Mongo] Client pool created (database: " << database_ << ")");
    return true;
}

void MongoConnection::close() {
    if (!pool_) {
        return;
    }
    pool_.reset();
    database_.clear();
    LOG_INFO("[Mongo] Client pool closed");
}

mongocxx::pool::entry MongoConnection::acquire() {
    if (!pool_) {
        throw UninitializedError(kUninitializedMessage);
    }
    return pool_->acquire();
}

const std::string &MongoConnection::database_name() const {
    if (!pool_) {
        throw UninitializedError(kUninitializedMessage);
    }
    return database_;
}

void MongoConnection::ping() {
    using bsoncxx::builder::basic::kvp;
    using bsoncxx::builder::basic::make_document;

    auto client = acquire();
    (*client)[database_].run_command(make_document(kvp("ping", 1)));
}

}  // namespace store
}  // namespace itemstore
