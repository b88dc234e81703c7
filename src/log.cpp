#include "log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <utility>

namespace mdns_client
{

namespace
{

std::mutex g_loggerMutex;
LoggerCallback g_logger;
std::atomic<LogLevel> g_logLevel{LogLevel::Info};

}

std::string ToString(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "";
}

void SetLogger(LoggerCallback callback)
{
    std::lock_guard<std::mutex> lock(g_loggerMutex);
    g_logger = std::move(callback);
}

void SetLogLevel(LogLevel level)
{
    g_logLevel.store(level, std::memory_order_relaxed);
}

void Log(LogLevel level, std::string_view string)
{
    if (level < g_logLevel.load(std::memory_order_relaxed)) {
        return;
    }

    LoggerCallback logger;
    {
        std::lock_guard<std::mutex> lock(g_loggerMutex);
        logger = g_logger;
    }
    // Called unlocked, the callback may log or call SetLogger itself
    if (logger) {
        logger(level, std::string(string));
        return;
    }

    std::lock_guard<std::mutex> lock(g_loggerMutex);
    std::cout << "[mdns_client] " << ToString(level) << ": " << string << "\n";
}

}
