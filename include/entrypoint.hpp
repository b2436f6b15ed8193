#pragma once
#include <string>
#include <vector>
#include <sys/types.h>
#include "db_config.hpp"
#include "readiness_probe.hpp"
#include "shared/environment.hpp"
#include "shared/logger.hpp"
#include "shared/service_config.hpp"

namespace pgentry {

constexpr int kExitFailure = 1;
constexpr const char* kDefaultConfigFile = "/etc/pgentry/entrypoint.yaml";

// Where the configuration comes from. Only the built-in default may be
// absent; a file named on the command line or in PGENTRY_CONFIG must load.
struct ConfigSource {
    std::string path;
    bool required = true;
};

ConfigSource resolve_config_source(const std::string& cli_path, const Environment& env);

// Logs and returns false when a required file cannot be loaded
bool load_config(config::ServiceConfig& config, const ConfigSource& source, log::Logger& logger);

// Everything the startup sequence needs, after the config file and the
// environment overrides have been merged.
struct Settings {
    std::string app_user = "appuser";
    std::string app_group = "appgroup";
    db::EnvKeys env_keys;
    probe::Policy policy;
    std::vector<std::string> owned_paths = {"/logs"};
    std::vector<std::string> optional_owned_paths = {"/app/alembic/versions"};
    bool run_migrations = false;
    std::vector<std::string> migration_command = {"alembic", "upgrade", "head"};
    std::vector<std::string> server_commands = {"uvicorn"};
    log::Level log_level = log::Level::INFO;

    // Throws ConfigurationError naming the offending key
    static Settings load(const config::ServiceConfig& config, const Environment& env);
};

// Wait for the database, prepare the volumes, migrate, then become the
// target command.
class Entrypoint {
public:
    Entrypoint(const Settings& settings, const Environment& env,
               probe::Connector& connector, probe::Sleeper& sleeper, log::Logger& logger);

    // Returns only on failure, with the exit status to use. On success the
    // process image has been replaced by the command.
    int run(const std::vector<std::string>& command);

private:
    bool wait_for_database();
    void fix_ownership(uid_t uid, gid_t gid);
    bool is_migration_command(const std::vector<std::string>& command) const;
    void announce(const std::vector<std::string>& command) const;

    Settings settings_;
    const Environment& env_;
    probe::Connector& connector_;
    probe::Sleeper& sleeper_;
    log::Logger& logger_;
};

} // namespace pgentry
