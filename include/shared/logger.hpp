#pragma once

#include <string>
#include <sstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unistd.h>

namespace pgentry {
namespace log {

enum class Level {
    FATAL = 0,
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DEBUG = 4,
    VERBOSE = 5
};

inline const char* level_to_string(Level level) {
    switch (level) {
        case Level::FATAL:   return "FATAL";
        case Level::ERROR:   return "ERROR";
        case Level::WARNING: return "WARNING";
        case Level::INFO:    return "INFO";
        case Level::DEBUG:   return "DEBUG";
        case Level::VERBOSE: return "VERBOSE";
        default:             return "UNKNOWN";
    }
}

// Accepts the level names above in any case, plus "WARN" and "CRITICAL".
// Throws std::invalid_argument for anything else.
inline Level parse_level(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "FATAL" || upper == "CRITICAL") return Level::FATAL;
    if (upper == "ERROR")                        return Level::ERROR;
    if (upper == "WARNING" || upper == "WARN")   return Level::WARNING;
    if (upper == "INFO")                         return Level::INFO;
    if (upper == "DEBUG")                        return Level::DEBUG;
    if (upper == "VERBOSE" || upper == "TRACE")  return Level::VERBOSE;

    throw std::invalid_argument("unknown log level '" + name + "'");
}

class Logger {
public:
    Logger(const std::string& service_name, Level max_level = Level::INFO, std::ostream& out = std::cout)
        : service_name_(service_name)
        , max_level_(max_level)
        , pid_(getpid())
        , out_(&out) {}

    void set_level(Level level) {
        max_level_ = level;
    }

    Level get_level() const {
        return max_level_;
    }

    void log(Level level, const std::string& message) {
        if (level > max_level_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::ostringstream oss;
        oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << " [" << service_name_ << "]"
            << " [" << pid_ << "]"
            << " [" << level_to_string(level) << "]"
            << " " << message;

        // Flushed per line: the process image may be replaced right after.
        *out_ << oss.str() << std::endl;
    }

    void fatal(const std::string& message)   { log(Level::FATAL, message); }
    void error(const std::string& message)   { log(Level::ERROR, message); }
    void warning(const std::string& message) { log(Level::WARNING, message); }
    void info(const std::string& message)    { log(Level::INFO, message); }
    void debug(const std::string& message)   { log(Level::DEBUG, message); }
    void verbose(const std::string& message) { log(Level::VERBOSE, message); }

private:
    std::string service_name_;
    Level max_level_;
    pid_t pid_;
    std::ostream* out_;
};

} // namespace log
} // namespace pgentry
