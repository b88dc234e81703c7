#pragma once

#include <cstring>
#include <optional>
#include <string>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <fmt/core.h>

namespace mdns_client
{

inline std::string IPV4AddressToString(const sockaddr_in& addr)
{
    char host[NI_MAXHOST] = {0};
    char service[NI_MAXSERV] = {0};
    const int ret = getnameinfo(reinterpret_cast<const sockaddr*>(&addr), sizeof(sockaddr_in), host, NI_MAXHOST,
                                service, NI_MAXSERV, NI_NUMERICSERV | NI_NUMERICHOST);
    if (ret == 0) {
        if (addr.sin_port != 0) {
            return fmt::format("{}:{}", host, service);
        } else {
            return fmt::format("{}", host);
        }
    }
    return "";
}

// Parses a dotted quad, port is left at 0
inline std::optional<sockaddr_in> ParseIPV4Address(const std::string& address)
{
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return std::nullopt;
    }
    return addr;
}

inline bool IsLoopback(const sockaddr_in& addr)
{
    return (ntohl(addr.sin_addr.s_addr) >> 24) == 127;
}

}
