#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <unordered_set>

namespace mdns_client
{

using Clock = std::chrono::steady_clock;

// Identity of a discovered endpoint, as announced by a SRV record
struct Service
{
    std::string host; // SRV target, lowercase, without the trailing dot. example: "printer1.local"
    std::uint16_t port{0};
};
bool operator==(const Service& lhs, const Service& rhs);
bool operator!=(const Service& lhs, const Service& rhs);
std::string ToString(const Service& service);
std::ostream& operator<<(std::ostream& os, const Service& service);

struct ServiceRecord
{
    Clock::time_point last_seen; // Last response confirming the service
    std::unordered_set<std::string> addresses; // Dotted quad IPv4 addresses from A records
};
std::string ToString(const ServiceRecord& record);
std::ostream& operator<<(std::ostream& os, const ServiceRecord& record);

}

namespace std
{

template <>
struct hash<mdns_client::Service>
{
    std::size_t operator()(const mdns_client::Service& service) const noexcept
    {
        const std::size_t h = std::hash<std::string>{}(service.host);
        return h ^ (std::hash<std::uint16_t>{}(service.port) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

}
