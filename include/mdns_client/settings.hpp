#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace mdns_client
{

// Question type sent in each query
enum class QueryType {
    SRV = 33, // Server Selection [RFC2782]
    PTR = 12  // Domain name pointer
};

// How the owner name of a SRV answer is compared against the browsed name
enum class MatchPolicy {
    Exact,   // Case insensitive equality, trailing dot ignored
    Contains // Owner name contains the browsed name, case insensitive
};

// What to do when a multicast socket cannot be set up on one interface
enum class InterfaceFailurePolicy {
    Abort, // Constructor throws SetupError
    Skip   // Log a warning and continue with the other interfaces
};

struct ClientSettings
{
    std::string service_name{"_http._tcp.local."};
    QueryType query_type{QueryType::SRV};
    MatchPolicy match_policy{MatchPolicy::Exact};
    InterfaceFailurePolicy interface_failure_policy{InterfaceFailurePolicy::Abort};

    // When set, these local IPv4 addresses are used instead of enumerating the interfaces
    std::optional<std::vector<std::string>> interface_addresses;

    // Must be positive and shorter than service_ttl
    std::chrono::milliseconds poll_interval{std::chrono::seconds(1)};
    std::chrono::milliseconds service_ttl{std::chrono::seconds(5)};
};

}
