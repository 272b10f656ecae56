#include "mdns_session/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

#include <fmt/format.h>

namespace mdns_session
{

namespace
{

std::mutex g_logMutex;
LogCallback g_logCallback;
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

void SetLogCallback(LogCallback callback)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_logCallback = std::move(callback);
}

void SetLogLevel(LogLevel level)
{
    g_logLevel.store(level, std::memory_order_relaxed);
}

LogLevel GetLogLevel()
{
    return g_logLevel.load(std::memory_order_relaxed);
}

void Log(LogLevel level, std::string_view string)
{
    if (level < GetLogLevel()) {
        return;
    }

    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        callback = g_logCallback;
    }
    // Called unlocked, it may log itself
    if (callback) {
        callback(level, string);
        return;
    }
    std::lock_guard<std::mutex> lock(g_logMutex);
    std::cout << fmt::format("[mdns_session] [{}] {}\n", ToString(level), string);
}

}
