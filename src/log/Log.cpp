#include "lumen/log/Log.hpp"

#include <array>
#include <cstddef>
#include <iostream>
#include <mutex>

namespace lumen::log {

namespace {

constexpr std::size_t LEVEL_COUNT = 3;

LogHandler makeDefaultHandler(Level level) {
    if (level == Level::Info) {
        return [](std::string_view message) {
            std::cout << message;
            std::cout.flush();
        };
    }
    const char* prefix = (level == Level::Warning) ? "[warning] " : "[error] ";
    return [prefix](std::string_view message) {
        std::cerr << prefix << message;
        std::cerr.flush();
    };
}

std::size_t slot(Level level) {
    return static_cast<std::size_t>(level);
}

std::mutex handlerMutex;
std::array<LogHandler, LEVEL_COUNT> handlers = {
    makeDefaultHandler(Level::Info),
    makeDefaultHandler(Level::Warning),
    makeDefaultHandler(Level::Error)
};

} // namespace

void setLogHandler(Level level, LogHandler handler) {
    std::lock_guard lock(handlerMutex);
    handlers[slot(level)] = handler ? std::move(handler) : makeDefaultHandler(level);
}

void setLogHandlers(LogHandler infoHandler, LogHandler warningHandler, LogHandler errorHandler) {
    std::lock_guard lock(handlerMutex);
    handlers[slot(Level::Info)] = infoHandler ? std::move(infoHandler) : makeDefaultHandler(Level::Info);
    handlers[slot(Level::Warning)] = warningHandler ? std::move(warningHandler) : makeDefaultHandler(Level::Warning);
    handlers[slot(Level::Error)] = errorHandler ? std::move(errorHandler) : makeDefaultHandler(Level::Error);
}

void resetLogHandlers() {
    std::lock_guard lock(handlerMutex);
    for (std::size_t i = 0; i < LEVEL_COUNT; ++i) {
        handlers[i] = makeDefaultHandler(static_cast<Level>(i));
    }
}

void write(Level level, std::string_view message) {
    LogHandler handler;
    {
        // Copy out so a slow handler never holds the lock.
        std::lock_guard lock(handlerMutex);
        handler = handlers[slot(level)];
    }
    if (handler) {
        handler(message);
    }
}

} // namespace lumen::log
