#pragma once

#include "mdns_client/settings.hpp"
#include "mdns_client/types.hpp"
#include "registry.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mdns_client
{

struct SrvAnswer
{
    std::string name;   // Owner name, example: "Printer._http._tcp.local"
    std::string target; // Lowercased, example: "printer1.local"
    std::uint16_t port{0};
};

struct AAnswer
{
    std::string name;    // example: "printer1.local"
    std::string address; // example: "192.168.1.50"
};

// The parts of a DNS packet the client uses. Names have no trailing dot.
struct Response
{
    bool is_query{false};
    std::vector<SrvAnswer> srv_records;
    std::vector<AAnswer> a_records;
};

// Parses a datagram. Returns std::nullopt if it is not a well formed DNS packet.
// SRV and A records are taken from the answer and additional sections.
std::optional<Response> DecodeResponse(const void* data, std::size_t size);

// Registers the services of a response for `service_name` and attaches addresses
// to known hosts. Queries are ignored. Returns true if the registry was touched.
bool ApplyResponse(const Response& response, std::string_view service_name, MatchPolicy policy,
                   Registry& registry, Clock::time_point now);

}
