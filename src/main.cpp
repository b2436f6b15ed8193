#include "entrypoint.hpp"
#include "pg_connector.hpp"
#include "signal_sleeper.hpp"
#include "shared/errors.hpp"
#include "shared/logger.hpp"
#include "shared/service_config.hpp"
#include <boost/system/system_error.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--config FILE] [--] COMMAND [ARGS...]\n";
    std::cerr << "  Waits for PostgreSQL, fixes volume ownership, optionally runs\n";
    std::cerr << "  migrations, then executes COMMAND as the application user.\n";
    std::cerr << "  Config file defaults to $PGENTRY_CONFIG or " << pgentry::kDefaultConfigFile << "\n";
}

int main(int argc, char** argv) {
    const pgentry::Environment env = pgentry::capture_environment(environ);

    std::string config_file;
    std::vector<std::string> command;

    int i = 1;
    for (; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (a == "--") {
            ++i;
            break;
        } else if (!a.empty() && a[0] == '-') {
            print_usage(argv[0]);
            return pgentry::kExitFailure;
        } else {
            break;
        }
    }
    for (; i < argc; ++i) {
        command.emplace_back(argv[i]);
    }

    pgentry::log::Logger logger("entrypoint");

    auto& config = pgentry::config::ServiceConfig::instance();
    if (!pgentry::load_config(config, pgentry::resolve_config_source(config_file, env), logger)) {
        return pgentry::kExitFailure;
    }

    pgentry::Settings settings;
    try {
        settings = pgentry::Settings::load(config, env);
    } catch (const pgentry::ConfigurationError& e) {
        logger.fatal("Configuration error (" + e.key() + "): " + e.what());
        return pgentry::kExitFailure;
    }
    logger.set_level(settings.log_level);

    pgentry::db::PqxxConnector connector;
    std::unique_ptr<pgentry::probe::SignalAwareSleeper> sleeper;
    try {
        sleeper = std::make_unique<pgentry::probe::SignalAwareSleeper>();
    } catch (const boost::system::system_error& e) {
        logger.fatal(std::string("Could not install signal handlers: ") + e.what());
        return pgentry::kExitFailure;
    }

    pgentry::Entrypoint entrypoint(settings, env, connector, *sleeper, logger);
    return entrypoint.run(command);
}
