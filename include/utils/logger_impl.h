#pragma once

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <utility>

namespace multiquery {
namespace utils {

namespace detail {

// Format strings are runtime values here (forwarded from macros), so they
// bypass fmt's compile-time check.
template<typename FormatString, typename... Args>
inline void logAt(const std::shared_ptr<spdlog::logger>& logger,
                  spdlog::level::level_enum lvl,
                  FormatString&& fmt,
                  Args&&... args) {
    if (!logger || !logger->should_log(lvl)) return;
    logger->log(lvl, fmt::runtime(std::forward<FormatString>(fmt)), std::forward<Args>(args)...);
}

} // namespace detail

template<typename FormatString, typename... Args>
void Logger::trace(FormatString&& fmt, Args&&... args) {
    detail::logAt(logger_, spdlog::level::trace, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::debug(FormatString&& fmt, Args&&... args) {
    detail::logAt(logger_, spdlog::level::debug, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::info(FormatString&& fmt, Args&&... args) {
    detail::logAt(logger_, spdlog::level::info, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::warn(FormatString&& fmt, Args&&... args) {
    detail::logAt(logger_, spdlog::level::warn, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::error(FormatString&& fmt, Args&&... args) {
    detail::logAt(logger_, spdlog::level::err, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::critical(FormatString&& fmt, Args&&... args) {
    detail::logAt(logger_, spdlog::level::critical, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

} // namespace utils
} // namespace multiquery
