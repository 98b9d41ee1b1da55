#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace slimetrack::log {

enum class LogLevel {
    Debug,
    Info,
    Error
};

const char* toString(LogLevel level);

/**
 * @brief Receives every formatted log line together with its level.
 *
 * Handlers may be called concurrently from the I/O thread and from caller
 * threads; they must be thread-safe themselves.
 */
using LogHandler = std::function<void(LogLevel, std::string_view)>;

/// Install a process-wide handler. An empty handler restores the default sink.
void setLogHandler(LogHandler handler);
void resetLogHandler();

void logDebug(std::string_view message);
void logInfo(std::string_view message);
void logError(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

} // namespace detail

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logDebug(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logDebug(std::string_view(msg));
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logInfo(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logInfo(std::string_view(msg));
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logError(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logError(std::string_view(msg));
}

} // namespace slimetrack::log

namespace slimetrack {
using log::LogLevel;
using log::LogHandler;
using log::setLogHandler;
using log::resetLogHandler;
using log::logDebug;
using log::logInfo;
using log::logError;
} // namespace slimetrack
