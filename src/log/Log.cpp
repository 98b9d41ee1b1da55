#include "slimetrack/log/Log.hpp"

#include <iostream>
#include <mutex>

namespace slimetrack::log {

namespace {

LogHandler makeDefaultHandler() {
    return [](LogLevel level, std::string_view message) {
        auto& stream = (level == LogLevel::Error) ? std::cerr : std::cout;
        stream << message;
        stream.flush();
    };
}

std::mutex handlerMutex;
LogHandler currentHandler = makeDefaultHandler();

void dispatch(LogLevel level, std::string_view message) {
    LogHandler handler;
    {
        std::lock_guard lock(handlerMutex);
        handler = currentHandler;
    }
    if (handler) {
        handler(level, message);
    }
}

} // namespace

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

void setLogHandler(LogHandler handler) {
    std::lock_guard lock(handlerMutex);
    currentHandler = handler ? std::move(handler) : makeDefaultHandler();
}

void resetLogHandler() {
    std::lock_guard lock(handlerMutex);
    currentHandler = makeDefaultHandler();
}

void logDebug(std::string_view message) {
    dispatch(LogLevel::Debug, message);
}

void logInfo(std::string_view message) {
    dispatch(LogLevel::Info, message);
}

void logError(std::string_view message) {
    dispatch(LogLevel::Error, message);
}

} // namespace slimetrack::log
