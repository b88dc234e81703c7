#pragma once

#include <string>
#include <vector>

#include <netinet/in.h>

namespace mdns_client
{

// Local IPv4 addresses of interfaces that are up, multicast capable and
// neither loopback nor point-to-point. Throws SetupError if getifaddrs() fails.
std::vector<sockaddr_in> EnumerateInterfaces();

// Parses an explicit list of local addresses, loopback entries are dropped.
// Throws SetupError on an address that is not a dotted quad.
std::vector<sockaddr_in> ResolveInterfaces(const std::vector<std::string>& addresses);

}
