#pragma once

#include <string_view>

namespace mdns_client
{

// Checks that `name` can be sent as a DNS question: non-empty labels of at
// most 63 bytes, at most 255 bytes encoded, one trailing dot allowed.
// Throws std::invalid_argument otherwise.
void ValidateQueryName(std::string_view name);

}
