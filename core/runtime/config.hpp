#pragma once

#include <string>
#include <vector>

namespace itemstore {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct HttpConfig {
    std::string bind = "0.0.0.0";                        // Bind address
    int port = 8000;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 8;                            // Worker thread pool size
};

struct MongoConfig {
    std::string uri = "mongodb://localhost:27017";  // Overridden by MONGODB_URI
    std::string database = "app";                   // Overridden by MONGODB_DB_NAME
    bool verify_on_startup = true;                  // Ping once during start(); failure aborts startup
};

struct ServiceConfig {
    HttpConfig http;
    MongoConfig mongodb;
    LoggingConfig logging;
};

// Loads configuration from a YAML file, then applies environment overrides and validates
bool load_config(const std::string &config_path, ServiceConfig &config, std::string &error);

// MONGODB_URI and MONGODB_DB_NAME replace the corresponding config values when set and non-empty
void apply_env_overrides(ServiceConfig &config);

// Validates the configuration
bool validate_config(const ServiceConfig &config, std::string &error);

}  // namespace runtime
}  // namespace itemstore
