#pragma once

#include "mdns_client/log.hpp"

#include <string_view>

namespace mdns_client
{

// Routes to the callback set with SetLogger(), or std::cout
void Log(LogLevel level, std::string_view string);

}
