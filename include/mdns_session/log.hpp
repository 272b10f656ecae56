#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace mdns_session
{

enum class LogLevel
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

std::string ToString(LogLevel level);

using LogCallback = std::function<void(LogLevel, std::string_view)>;

// Replaces the default stdout sink. Pass an empty callback to restore it.
// The callback may be invoked from the engine worker thread.
void SetLogCallback(LogCallback callback);

// Messages below this level are dropped before reaching the sink.
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

void Log(LogLevel level, std::string_view string);

}
