#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>

#include "../logging/logger.hpp"

namespace itemstore {
namespace runtime {

namespace {

std::string env_or_empty(const char *name) {
    const char *value = std::getenv(name);
    return value != nullptr ? std::string(value) : std::string();
}

void load_http(const YAML::Node &node, HttpConfig &http) {
    if (node["bind"]) {
        http.bind = node["bind"].as<std::string>();
    }
    if (node["port"]) {
        http.port = node["port"].as<int>();
    }

    // CORS allowlist (supports scalar or sequence)
    if (node["cors_allowed_origins"]) {
        const auto &origins_node = node["cors_allowed_origins"];
        http.cors_allowed_origins.clear();
        if (origins_node.IsSequence()) {
            for (const auto &origin : origins_node) {
                http.cors_allowed_origins.push_back(origin.as<std::string>());
            }
        } else if (origins_node.IsScalar()) {
            http.cors_allowed_origins.push_back(origins_node.as<std::string>());
        }
    }
    if (node["cors_allow_credentials"]) {
        http.cors_allow_credentials = node["cors_allow_credentials"].as<bool>();
    }
    if (node["thread_pool_size"]) {
        http.thread_pool_size = node["thread_pool_size"].as<int>();
    }
}

void load_mongodb(const YAML::Node &node, MongoConfig &mongodb) {
    if (node["uri"]) {
        mongodb.uri = node["uri"].as<std::string>();
    }
    if (node["database"]) {
        mongodb.database = node["database"].as<std::string>();
    }
    if (node["verify_on_startup"]) {
        mongodb.verify_on_startup = node["verify_on_startup"].as<bool>();
    }
}

}  // namespace

void apply_env_overrides(ServiceConfig &config) {
    const std::string uri = env_or_empty("MONGODB_URI");
    if (!uri.empty()) {
        config.mongodb.uri = uri;
    }

    const std::string database = env_or_empty("MONGODB_DB_NAME");
    if (!database.empty()) {
        config.mongodb.database = database;
    }
}

bool validate_config(const ServiceConfig &config, std::string &error) {
    if (config.http.port < 1 || config.http.port > 65535) {
        error = "HTTP port must be between 1 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }
    if (config.http.cors_allowed_origins.empty()) {
        error = "http.cors_allowed_origins must not be empty";
        return false;
    }

    if (config.mongodb.uri.empty()) {
        error = "mongodb.uri must not be empty";
        return false;
    }
    if (config.mongodb.database.empty()) {
        error = "mongodb.database must not be empty";
        return false;
    }

    if (!logging::is_valid_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, ServiceConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        const std::vector<std::string> valid_keys = {"http", "mongodb", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        if (yaml["http"]) {
            load_http(yaml["http"], config.http);
        }
        if (yaml["mongodb"]) {
            load_mongodb(yaml["mongodb"], config.mongodb);
        }
        if (yaml["logging"] && yaml["logging"]["level"]) {
            config.logging.level = yaml["logging"]["level"].as<std::string>();
        }
    } catch (const YAML::Exception &e) {
        error = "Failed to parse config file '" + config_path + "': " + e.what();
        return false;
    }

    apply_env_overrides(config);

    if (!validate_config(config, error)) {
        return false;
    }

    LOG_INFO("[Config] HTTP: " << config.http.bind << ":" << config.http.port << " (" << config.http.thread_pool_size
                               << " worker threads)");
    LOG_INFO("[Config] MongoDB database: " << config.mongodb.database);
    return true;
}

}  // namespace runtime
}  // namespace itemstore
