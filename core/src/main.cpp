// itemstore server
// Items CRUD over HTTP, backed by MongoDB

#include <filesystem>
#include <iostream>
#include <string>
#include "runtime/config.hpp"
#include "runtime/service.hpp"
#include "runtime/signal_handler.hpp"
#include "logging/logger.hpp"

int main(int argc, char **argv)
{
    const std::string default_config_path = "itemstore.yaml";
    std::string config_path = default_config_path;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: itemstore-server [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: itemstore.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n\n";
            std::cerr << "Environment:\n";
            std::cerr << "  MONGODB_URI      MongoDB connection string (default: mongodb://localhost:27017)\n";
            std::cerr << "  MONGODB_DB_NAME  Database name (default: app)\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    itemstore::runtime::ServiceConfig config;
    std::string error;

    if (std::filesystem::exists(config_path))
    {
        LOG_INFO("Loading config: " + config_path);
        if (!itemstore::runtime::load_config(config_path, config, error))
        {
            LOG_ERROR("Failed to load config: " + error);
            return 1;
        }
    }
    else if (config_path != default_config_path)
    {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        return 1;
    }
    else
    {
        // No config file: defaults plus environment
        itemstore::runtime::apply_env_overrides(config);
        if (!itemstore::runtime::validate_config(config, error))
        {
            LOG_ERROR("Invalid configuration: " + error);
            return 1;
        }
    }

    itemstore::logging::Logger::set_level(itemstore::logging::string_to_level(config.logging.level));

    LOG_INFO("itemstore server starting...");

    // Signals during start() are latched and handled by run()
    itemstore::runtime::SignalHandler::install();

    itemstore::runtime::Service service(config);

    if (!service.start(error))
    {
        LOG_ERROR("Service startup failed: " + error);
        return 1;
    }

    LOG_INFO("Service Ready");
    LOG_INFO("  HTTP: " << config.http.bind << ":" << config.http.port);
    LOG_INFO("  MongoDB database: " << config.mongodb.database);

    // Blocks until SIGINT/SIGTERM
    service.run();

    LOG_INFO("Shutdown complete");
    return 0;
}
