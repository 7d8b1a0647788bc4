#pragma once

// Windows compatibility - undef macros that conflict with Logger::Level
#ifdef ERROR
#undef ERROR
#endif

#include <string>
#include <memory>

namespace spdlog { class logger; }

namespace multiquery {
namespace utils {

class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    // Empty log_file = nur Konsole
    static void init(const std::string& log_file = "", Level level = Level::INFO);
    static void shutdown();
    static std::shared_ptr<spdlog::logger> get();
    // Helper to convert from string to Level; returns INFO on unknown
    static Level levelFromString(const std::string& lvl);
    static const char* levelToString(Level lvl);

    template<typename FormatString, typename... Args>
    static void trace(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void debug(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void info(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void warn(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void error(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void critical(FormatString&& fmt, Args&&... args);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace multiquery

// Include implementation
#include "utils/logger_impl.h"

// Logging macros
#define MULTIQUERY_TRACE(...) ::multiquery::utils::Logger::trace(__VA_ARGS__)
#define MULTIQUERY_DEBUG(...) ::multiquery::utils::Logger::debug(__VA_ARGS__)
#define MULTIQUERY_INFO(...) ::multiquery::utils::Logger::info(__VA_ARGS__)
#define MULTIQUERY_WARN(...) ::multiquery::utils::Logger::warn(__VA_ARGS__)
#define MULTIQUERY_ERROR(...) ::multiquery::utils::Logger::error(__VA_ARGS__)
#define MULTIQUERY_CRITICAL(...) ::multiquery::utils::Logger::critical(__VA_ARGS__)
