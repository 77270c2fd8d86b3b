#pragma once
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <iostream>
#include <string>
#include <memory>

namespace LogUtils {

enum class Level {
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Accepts debug, info, warn/warning, error, fatal (any case)
Level parse_level(const std::string& name);
const char* level_name(Level level);
spdlog::level::level_enum to_spdlog_level(Level level);

// Console sink on stderr; an empty log_file keeps output on the console only.
// Calling init again replaces the current logger.
void init(Level level = Level::Info, const std::string& log_file = "");

void shutdown();
void set_level(Level level);
bool enabled(Level level);

extern std::shared_ptr<spdlog::logger> logger;

void log(Level level, const std::string& msg);

inline void debug(const std::string& msg) { log(Level::Debug, msg); }
inline void info(const std::string& msg)  { log(Level::Info, msg); }
inline void warn(const std::string& msg)  { log(Level::Warn, msg); }
inline void error(const std::string& msg) { log(Level::Error, msg); }
inline void fatal(const std::string& msg) { log(Level::Fatal, msg); }

// fmt-style; before init() the message goes to std::cerr
template <typename... Args>
inline void log(Level level, fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->log(to_spdlog_level(level), fmt, std::forward<Args>(args)...);
    } else if (enabled(level)) {
        std::cerr << "[" << level_name(level) << "] "
                  << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
    }
}

template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    log<Args...>(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    log<Args...>(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    log<Args...>(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    log<Args...>(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void fatal(fmt::format_string<Args...> fmt, Args&&... args) {
    log<Args...>(Level::Fatal, fmt, std::forward<Args>(args)...);
}

// Scoped init/shutdown, mostly for tests
class LoggerGuard {
public:
    explicit LoggerGuard(Level level = Level::Info, const std::string& log_file = "") {
        LogUtils::init(level, log_file);
    }

    ~LoggerGuard() {
        LogUtils::shutdown();
    }

    LoggerGuard(const LoggerGuard&) = delete;
    LoggerGuard& operator=(const LoggerGuard&) = delete;
};

}
