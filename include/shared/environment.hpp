#pragma once

#include <cctype>
#include <map>
#include <optional>
#include <string>

namespace pgentry
{

// Snapshot of the process environment, taken once at startup.
using Environment = std::map<std::string, std::string>;

inline Environment capture_environment(char** envp)
    {
    Environment env;
    if (envp == nullptr) return env;

    for (char** entry = envp; *entry != nullptr; ++entry)
        {
        std::string kv = *entry;
        auto eq = kv.find('=');
        if (eq == std::string::npos)
            {
            env.emplace(kv, "");
            }
        else
            {
            env.emplace(kv.substr(0, eq), kv.substr(eq + 1));
            }
        }

    return env;
    }

inline std::optional<std::string> get_env(const Environment& env, const std::string& key)
    {
    auto it = env.find(key);
    if (it == env.end()) return std::nullopt;
    return it->second;
    }

// "1", "true", "yes" and "on" (any case) are true; everything else is false.
inline bool env_flag(const Environment& env, const std::string& key, bool default_val = false)
    {
    auto value = get_env(env, key);
    if (!value) return default_val;

    std::string v;
    for (char c : *value) v += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return v == "1" || v == "true" || v == "yes" || v == "on";
    }

} // namespace pgentry
