#include "interfaces.hpp"
#include "address_utils.hpp"
#include "log.hpp"

#include "mdns_client/errors.hpp"

#include <cerrno>
#include <cstring>

#include <ifaddrs.h>
#include <net/if.h>

#include <fmt/core.h>

namespace mdns_client
{

std::vector<sockaddr_in> EnumerateInterfaces()
{
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) < 0) {
        const int error = errno;
        Log(LogLevel::Error, fmt::format("Unable to get interface addresses: {}", std::strerror(error)));
        throw SetupError(fmt::format("getifaddrs failed: {}", std::strerror(error)), error);
    }

    std::vector<sockaddr_in> addresses;
    for (struct ifaddrs* ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr)
            continue;
        if (!(ifa->ifa_flags & IFF_UP) || !(ifa->ifa_flags & IFF_MULTICAST))
            continue;
        if ((ifa->ifa_flags & IFF_LOOPBACK) || (ifa->ifa_flags & IFF_POINTOPOINT))
            continue;
        if (ifa->ifa_addr->sa_family != AF_INET)
            continue;

        sockaddr_in saddr;
        std::memcpy(&saddr, ifa->ifa_addr, sizeof(sockaddr_in));
        if (IsLoopback(saddr))
            continue;

        saddr.sin_port = 0;
        Log(LogLevel::Debug, fmt::format("Found interface {} with local IPv4 address {}", ifa->ifa_name, IPV4AddressToString(saddr)));
        addresses.push_back(saddr);
    }

    freeifaddrs(ifaddr);
    return addresses;
}

std::vector<sockaddr_in> ResolveInterfaces(const std::vector<std::string>& addresses)
{
    std::vector<sockaddr_in> resolved;
    for (const auto& address : addresses) {
        const auto saddr = ParseIPV4Address(address);
        if (!saddr) {
            throw SetupError(fmt::format("Invalid interface address \"{}\".", address));
        }
        if (IsLoopback(*saddr)) {
            Log(LogLevel::Info, fmt::format("Ignoring loopback interface address {}", address));
            continue;
        }
        resolved.push_back(*saddr);
    }
    return resolved;
}

}
