#pragma once

#include <stdexcept>
#include <string>

namespace pgentry
{

// A required setting is absent or malformed. Never retried.
class ConfigurationError : public std::runtime_error
    {
    public:
        ConfigurationError(const std::string& key, const std::string& message)
            : std::runtime_error(message), key_(key) {}

        // Name of the offending environment variable or config key
        const std::string& key() const { return key_; }

    private:
        std::string key_;
    };

// Failure while preparing or starting the target process:
// account lookup, privilege drop, ownership change, exec.
class LaunchError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

} // namespace pgentry
