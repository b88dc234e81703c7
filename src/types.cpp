#include "mdns_client/types.hpp"

#include <algorithm>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>


namespace mdns_client
{

bool operator==(const Service& lhs, const Service& rhs)
{
    return lhs.host == rhs.host
        && lhs.port == rhs.port;
}

bool operator!=(const Service& lhs, const Service& rhs)
{
    return !(lhs == rhs);
}

std::string ToString(const Service& service)
{
    return fmt::format("{}:{}", service.host, service.port);
}

std::ostream& operator<<(std::ostream& os, const Service& service)
{
    os << ToString(service);
    return os;
}

std::string ToString(const ServiceRecord& record)
{
    // Sorted so the output is stable between calls
    std::vector<std::string> addresses(record.addresses.begin(), record.addresses.end());
    std::sort(addresses.begin(), addresses.end());

    const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - record.last_seen);
    return fmt::format("addresses [{}] last seen {}ms ago", fmt::join(addresses, ", "), age.count());
}

std::ostream& operator<<(std::ostream& os, const ServiceRecord& record)
{
    os << ToString(record);
    return os;
}

}
