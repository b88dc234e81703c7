#pragma once

#include <functional>
#include <string>

namespace mdns_client
{

enum class LogLevel
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};
std::string ToString(LogLevel level);

using LoggerCallback = std::function<void(LogLevel, const std::string&)>;

// Replaces the default std::cout logger. Pass nullptr to restore it.
void SetLogger(LoggerCallback callback);

// Messages below this level are dropped. Defaults to Info.
void SetLogLevel(LogLevel level);

}
