#include "entrypoint.hpp"
#include "ownership.hpp"
#include "process_launcher.hpp"
#include "shared/errors.hpp"
#include <filesystem>
#include <system_error>

namespace pgentry
{

namespace
{

std::string basename_of(const std::string& path)
    {
    return std::filesystem::path(path).filename().string();
    }

// Wraps a config read so that a wrong type is reported with its key
template <typename Fn>
auto read_key(const std::string& key, Fn&& fn) -> decltype(fn())
    {
    try
        {
        return fn();
        }
        catch (const YAML::Exception& e)
            {
            throw ConfigurationError(key, "invalid value for " + key + ": " + e.msg);
            }
    }

int bounded_int(const config::ServiceConfig& config, const std::string& key, int default_val, int min_val)
    {
    int value = read_key(key, [&] { return config.get_int(key, default_val); });
    if (value < min_val)
        {
        throw ConfigurationError(key, key + " must be at least " + std::to_string(min_val)
                                 + ", got " + std::to_string(value));
        }
    return value;
    }

} // namespace

ConfigSource resolve_config_source(const std::string& cli_path, const Environment& env)
    {
    if (!cli_path.empty())
        {
        return ConfigSource{cli_path, true};
        }
    if (auto v = get_env(env, "PGENTRY_CONFIG"); v && !v->empty())
        {
        return ConfigSource{*v, true};
        }
    return ConfigSource{kDefaultConfigFile, false};
    }

bool load_config(config::ServiceConfig& config, const ConfigSource& source, log::Logger& logger)
    {
    std::error_code ec;
    if (!source.required && !std::filesystem::exists(source.path, ec))
        {
        logger.info("No config file at " + source.path + ", using defaults");
        return true;
        }
    if (!config.load(source.path))
        {
        logger.fatal("Could not load config file: " + config.last_error());
        return false;
        }
    return true;
    }

Settings Settings::load(const config::ServiceConfig& config, const Environment& env)
    {
    Settings s;

    s.app_user = read_key("app.user", [&] { return config.get_string("app.user", s.app_user); });
    s.app_group = read_key("app.group", [&] { return config.get_string("app.group", s.app_group); });

    s.env_keys.prefix = read_key("database.env_prefix",
        [&] { return config.get_string("database.env_prefix", s.env_keys.prefix); });
    s.env_keys.url_variable = read_key("database.url_variable",
        [&] { return config.get_string("database.url_variable", s.env_keys.url_variable); });

    s.policy.max_attempts = bounded_int(config, "probe.max_attempts", s.policy.max_attempts, 1);
    s.policy.attempt_timeout = std::chrono::seconds(bounded_int(
        config, "probe.attempt_timeout_seconds", static_cast<int>(s.policy.attempt_timeout.count()), 1));
    s.policy.retry_delay = std::chrono::seconds(bounded_int(
        config, "probe.retry_delay_seconds", static_cast<int>(s.policy.retry_delay.count()), 0));
    s.policy.fail_fast_on_permanent_errors = read_key("probe.fail_fast_on_permanent_errors",
        [&] { return config.get_bool("probe.fail_fast_on_permanent_errors", false); });

    s.owned_paths = read_key("ownership.paths",
        [&] { return config.get_string_list("ownership.paths", s.owned_paths); });
    s.optional_owned_paths = read_key("ownership.optional_paths",
        [&] { return config.get_string_list("ownership.optional_paths", s.optional_owned_paths); });

    s.run_migrations = read_key("migration.enabled",
        [&] { return config.get_bool("migration.enabled", s.run_migrations); });
    s.migration_command = read_key("migration.command",
        [&] { return config.get_string_list("migration.command", s.migration_command); });

    s.server_commands = read_key("launch.server_commands",
        [&] { return config.get_string_list("launch.server_commands", s.server_commands); });

    std::string level_name = read_key("log.level", [&] { return config.get_string("log.level", "INFO"); });
    std::string level_key = "log.level";

    // Environment overrides
    if (auto v = get_env(env, "APP_USER"); v && !v->empty()) s.app_user = *v;
    if (auto v = get_env(env, "APP_GROUP"); v && !v->empty()) s.app_group = *v;
    if (env.count("RUN_MIGRATIONS")) s.run_migrations = env_flag(env, "RUN_MIGRATIONS");
    if (auto v = get_env(env, "LOG_LEVEL"); v && !v->empty())
        {
        level_name = *v;
        level_key = "LOG_LEVEL";
        }

    try
        {
        s.log_level = log::parse_level(level_name);
        }
        catch (const std::invalid_argument& e)
            {
            throw ConfigurationError(level_key, e.what());
            }

    if (s.run_migrations && s.migration_command.empty())
        {
        throw ConfigurationError("migration.command", "migrations are enabled but migration.command is empty");
        }

    return s;
    }

Entrypoint::Entrypoint(const Settings& settings, const Environment& env,
                       probe::Connector& connector, probe::Sleeper& sleeper, log::Logger& logger)
    : settings_(settings), env_(env), connector_(connector), sleeper_(sleeper), logger_(logger)
    {
    }

int Entrypoint::run(const std::vector<std::string>& command)
    {
    if (command.empty())
        {
        logger_.fatal("No command given to start");
        return kExitFailure;
        }

    try
        {
        if (!wait_for_database())
            {
            return kExitFailure;
            }
        }
        catch (const probe::Interrupted& e)
            {
            logger_.fatal("Stopped while waiting for PostgreSQL: " + std::string(e.what()));
            return 128 + e.signal();
            }
        catch (const std::runtime_error& e)
            {
            logger_.fatal("Error while waiting for PostgreSQL: " + std::string(e.what()));
            return kExitFailure;
            }

    try
        {
        launch::Account account = launch::resolve_account(settings_.app_user, settings_.app_group);

        fix_ownership(account.uid, account.gid);

        if (settings_.run_migrations)
            {
            if (is_migration_command(command))
                {
                logger_.info("Command is the migration tool itself, skipping automatic migration");
                }
            else
                {
                logger_.info("Running migrations: " + launch::join_command(settings_.migration_command));
                int status = launch::run_command(settings_.migration_command, account);
                if (status != 0)
                    {
                    logger_.fatal("Migration command failed with status " + std::to_string(status));
                    return kExitFailure;
                    }
                logger_.info("Migrations complete");
                }
            }

        announce(command);
        launch::exec_command(command, account);
        }
        catch (const LaunchError& e)
            {
            logger_.fatal(e.what());
            }
        catch (const std::system_error& e)
            {
            logger_.fatal(e.what());
            }

    return kExitFailure;
    }

bool Entrypoint::wait_for_database()
    {
    probe::ReadinessProber prober(connector_, sleeper_, logger_);
    probe::Result result = prober.probe(env_, settings_.env_keys, settings_.policy);

    switch (result.outcome)
        {
        case probe::Outcome::Connected:
            return true;
        case probe::Outcome::ConfigurationError:
            logger_.fatal("Configuration error (" + result.key + "): " + result.error);
            return false;
        case probe::Outcome::Exhausted:
            logger_.fatal("Readiness timeout: could not connect to PostgreSQL after "
                          + std::to_string(result.attempts) + " attempts (last error: " + result.error + ")");
            return false;
        case probe::Outcome::Unexpected:
            logger_.fatal("Unexpected error after " + std::to_string(result.attempts)
                          + " attempt(s) while checking PostgreSQL: " + result.error);
            return false;
        }
    return false;
    }

void Entrypoint::fix_ownership(uid_t uid, gid_t gid)
    {
    const std::string owner = settings_.app_user + ":" + settings_.app_group;

    for (const auto& path : settings_.owned_paths)
        {
        logger_.info("Setting owner of " + path + " to " + owner);
        std::size_t n = launch::chown_tree(path, uid, gid);
        logger_.debug(std::to_string(n) + " entries updated under " + path);
        }

    for (const auto& path : settings_.optional_owned_paths)
        {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
            {
            logger_.debug("Skipping " + path + ": not present");
            continue;
            }
        logger_.info("Setting owner of " + path + " to " + owner);
        std::size_t n = launch::chown_tree(path, uid, gid);
        logger_.debug(std::to_string(n) + " entries updated under " + path);
        }

    logger_.info("Ownership set");
    }

bool Entrypoint::is_migration_command(const std::vector<std::string>& command) const
    {
    if (settings_.migration_command.empty()) return false;
    return basename_of(command.front()) == basename_of(settings_.migration_command.front());
    }

void Entrypoint::announce(const std::vector<std::string>& command) const
    {
    const std::string program = basename_of(command.front());

    for (const auto& server : settings_.server_commands)
        {
        if (program == basename_of(server))
            {
            logger_.info("Starting main application: " + launch::join_command(command));
            return;
            }
        }

    if (is_migration_command(command))
        {
        logger_.info("Running migration command: " + launch::join_command(command));
        }
    else
        {
        logger_.info("Running supplied command: " + launch::join_command(command));
        }
    }

} // namespace pgentry
