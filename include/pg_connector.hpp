#pragma once
#include <string>
#include "readiness_probe.hpp"

namespace pgentry {
namespace db {

// Readiness check against a real server through libpqxx
class PqxxConnector : public probe::Connector {
public:
    void check(const ConnectionTarget& target, std::chrono::seconds timeout) override;
};

// False for libpq errors that waiting will not fix (bad credentials,
// unknown role or database, malformed options).
bool is_transient_connect_failure(const std::string& message);

} // namespace db
} // namespace pgentry
