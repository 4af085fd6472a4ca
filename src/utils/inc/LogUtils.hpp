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

// Console output goes to stderr so samples written to stdout stay clean
void init(Level level = Level::Info,
          const std::string& log_file = "log/sigwave.log",
          size_t max_file_size = 1024 * 1024 * 5,
          size_t max_files = 3);

void shutdown();
void set_level(Level level);

// Logger instance, null until init()
extern std::shared_ptr<spdlog::logger> logger;

spdlog::level::level_enum to_spdlog_level(Level level);

// Used while no logger is installed
void fallback(Level level, const std::string& msg);

// Variadic template version (fmt-style)
template <typename... Args>
inline void log(Level level, fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->log(to_spdlog_level(level), fmt, std::forward<Args>(args)...);
    } else {
        fallback(level, fmt::format(fmt, std::forward<Args>(args)...));
    }
}

// String version
inline void debug(const std::string& msg) { log(Level::Debug, "{}", msg); }
inline void info(const std::string& msg)  { log(Level::Info, "{}", msg); }
inline void warn(const std::string& msg)  { log(Level::Warn, "{}", msg); }
inline void error(const std::string& msg) { log(Level::Error, "{}", msg); }
inline void fatal(const std::string& msg) { log(Level::Fatal, "{}", msg); }

template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void fatal(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Fatal, fmt, std::forward<Args>(args)...);
}

class LoggerGuard {
public:
    LoggerGuard(Level level = Level::Info,
                const std::string& log_file = "log/sigwave.log",
                size_t max_file_size = 1024 * 1024 * 5,
                size_t max_files = 3) {
        LogUtils::init(level, log_file, max_file_size, max_files);
    }

    ~LoggerGuard() {
        LogUtils::shutdown();
    }

    LoggerGuard(const LoggerGuard&) = delete;
    LoggerGuard& operator=(const LoggerGuard&) = delete;

    void set_level(Level level) {
        LogUtils::set_level(level);
    }
};

}
