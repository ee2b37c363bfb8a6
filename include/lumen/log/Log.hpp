#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace lumen::log {

enum class Level {
    Info = 0,
    Warning,
    Error
};

using LogHandler = std::function<void(std::string_view)>;

void setLogHandler(Level level, LogHandler handler);
void setLogHandlers(LogHandler infoHandler, LogHandler warningHandler, LogHandler errorHandler);
void resetLogHandlers();

void write(Level level, std::string_view message);

inline void logInfo(std::string_view message) { write(Level::Info, message); }
inline void logWarning(std::string_view message) { write(Level::Warning, message); }
inline void logError(std::string_view message) { write(Level::Error, message); }

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename First, typename... Rest>
using EnableIfComposite = std::enable_if_t<(sizeof...(Rest) > 0) ||
    !std::is_convertible<std::decay_t<First>, std::string_view>::value>;

} // namespace detail

template<typename First, typename... Rest, typename = detail::EnableIfComposite<First, Rest...>>
void logInfo(First&& first, Rest&&... rest) {
    write(Level::Info, detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest, typename = detail::EnableIfComposite<First, Rest...>>
void logWarning(First&& first, Rest&&... rest) {
    write(Level::Warning, detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest, typename = detail::EnableIfComposite<First, Rest...>>
void logError(First&& first, Rest&&... rest) {
    write(Level::Error, detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

} // namespace lumen::log

namespace lumen {
using log::LogHandler;
using log::setLogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::logInfo;
using log::logWarning;
using log::logError;
} // namespace lumen
