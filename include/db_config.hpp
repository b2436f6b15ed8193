#pragma once
#include <string>
#include <optional>
#include "shared/environment.hpp"

namespace pgentry {
namespace db {

// Names of the environment variables a ConnectionTarget is read from
struct EnvKeys {
    std::string prefix = "DB_";
    std::string url_variable = "DATABASE_URL";

    std::string host() const     { return prefix + "HOST"; }
    std::string port() const     { return prefix + "PORT"; }
    std::string dbname() const   { return prefix + "NAME"; }
    std::string user() const     { return prefix + "USER"; }
    std::string password() const { return prefix + "PASSWORD"; }
};

// Where to reach PostgreSQL and how to authenticate. Either the five
// components are set, or only a pre-composed descriptor is.
struct ConnectionTarget {
    std::string host;
    int port = 5432;
    std::string dbname;
    std::string user;
    std::string password;
    std::optional<std::string> descriptor;

    // libpq connection string with connect_timeout set
    std::string connection_string(int connect_timeout) const;

    // Credential-free label for log lines
    std::string describe() const;

    // Validate the environment into a complete target.
    // Throws ConfigurationError naming the first missing or invalid key.
    static ConnectionTarget from_env(const Environment& env, const EnvKeys& keys = EnvKeys{});
};

// Quote a conninfo value the way libpq expects
std::string quote_conninfo_value(const std::string& value);

// Strip a "+driver" suffix from the URI scheme, e.g. postgresql+asyncpg://
std::string normalize_descriptor(const std::string& descriptor);

} // namespace db
} // namespace pgentry
