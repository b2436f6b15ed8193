#include "pg_connector.hpp"
#include <pqxx/pqxx>
#include <algorithm>
#include <cctype>

namespace pgentry {
namespace db {

namespace {

const char* const kPermanentMarkers[] = {
    "password authentication failed",
    "authentication failed",
    "no pg_hba.conf entry",
    "does not exist",
    "invalid connection option",
    "invalid port number",
    "invalid uri",
    "invalid sslmode",
    "missing \"=\" after",
};

// libpq messages are multi-line and end in a newline
std::string single_line(const std::string& message) {
    std::string out;
    for (char c : message) {
        out += (c == '\n' || c == '\r') ? ' ' : c;
    }
    while (!out.empty() && out.back() == ' ') {
        out.pop_back();
    }
    return out;
}

} // namespace

bool is_transient_connect_failure(const std::string& message) {
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const char* marker : kPermanentMarkers) {
        if (lower.find(marker) != std::string::npos) {
            return false;
        }
    }
    return true;
}

void PqxxConnector::check(const ConnectionTarget& target, std::chrono::seconds timeout) {
    try {
        pqxx::connection conn(target.connection_string(static_cast<int>(timeout.count())));
        if (!conn.is_open()) {
            throw probe::ConnectError("connection not open", true);
        }
        conn.close();
    } catch (const pqxx::broken_connection& e) {
        throw probe::ConnectError(single_line(e.what()), is_transient_connect_failure(e.what()));
    }
}

} // namespace db
} // namespace pgentry
