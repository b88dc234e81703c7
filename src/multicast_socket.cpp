#include "multicast_socket.hpp"
#include "address_utils.hpp"
#include "log.hpp"

#include "mdns_client/errors.hpp"

#include "mdns.h"

#include <cerrno>
#include <cstring>
#include <utility>

#include <sys/socket.h>
#include <sys/types.h>

#include <fmt/core.h>

namespace mdns_client
{

MulticastSocket MulticastSocket::Open(const sockaddr_in& interfaceAddress)
{
    // mdns_socket_open_ipv4 sets SO_REUSEADDR/SO_REUSEPORT, multicast loopback,
    // joins 224.0.0.251 on the interface address, binds and sets O_NONBLOCK
    sockaddr_in saddr = interfaceAddress;
    saddr.sin_family = AF_INET;
    saddr.sin_port = htons(MDNS_PORT);

    const int sock = mdns_socket_open_ipv4(&saddr);
    const int error = errno;
    const std::string addr = IPV4AddressToString(interfaceAddress);
    if (sock < 0) {
        throw SetupError(fmt::format("Failed to open mDNS socket for interface {}: {}", addr, std::strerror(error)), error);
    }

    Log(LogLevel::Debug, fmt::format("Socket opened for interface with local IPv4 address: {}", addr));
    return MulticastSocket(sock, interfaceAddress);
}

MulticastSocket::MulticastSocket(int socket, const sockaddr_in& interfaceAddress)
: m_socket(socket)
, m_interfaceAddress(interfaceAddress)
{}

MulticastSocket::~MulticastSocket()
{
    Close();
}

MulticastSocket::MulticastSocket(MulticastSocket&& other) noexcept
: m_socket(std::exchange(other.m_socket, -1))
, m_interfaceAddress(other.m_interfaceAddress)
{}

MulticastSocket& MulticastSocket::operator=(MulticastSocket&& other) noexcept
{
    if (this != &other) {
        Close();
        m_socket = std::exchange(other.m_socket, -1);
        m_interfaceAddress = other.m_interfaceAddress;
    }
    return *this;
}

void MulticastSocket::Close()
{
    if (m_socket >= 0) {
        mdns_socket_close(m_socket);
        m_socket = -1;
    }
}

bool MulticastSocket::SendQuery(QueryType type, std::string_view name, std::uint8_t* buffer, std::size_t capacity)
{
    // The socket is bound to MDNS_PORT, so mdns_query_send leaves the unicast response bit clear
    return mdns_query_send(m_socket, static_cast<mdns_record_type_t>(type), name.data(), name.size(),
                           buffer, capacity, 0) >= 0;
}

bool MulticastSocket::Send(const std::vector<std::uint8_t>& packet)
{
    return mdns_multicast_send(m_socket, packet.data(), packet.size()) == 0;
}

ReceiveStatus MulticastSocket::Receive(std::uint8_t* buffer, std::size_t capacity, std::size_t& received)
{
    received = 0;
    const ssize_t ret = recv(m_socket, buffer, capacity, 0);
    if (ret < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return ReceiveStatus::WouldBlock;
        }
        return ReceiveStatus::Error;
    }
    received = static_cast<std::size_t>(ret);
    return ReceiveStatus::Received;
}

}
