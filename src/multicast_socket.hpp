#pragma once

#include "mdns_client/settings.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include <netinet/in.h>

namespace mdns_client
{

// Largest datagram sent or received
constexpr std::size_t kMaxPacketSize = 2048;

enum class ReceiveStatus
{
    Received,
    WouldBlock, // Nothing pending
    Error
};

// Non-blocking UDP socket bound to the mDNS port and joined to the mDNS
// multicast group on one interface. Closes the socket on destruction.
class MulticastSocket
{
public:
    // Throws SetupError
    static MulticastSocket Open(const sockaddr_in& interfaceAddress);

    ~MulticastSocket();
    MulticastSocket(MulticastSocket&& other) noexcept;
    MulticastSocket& operator=(MulticastSocket&& other) noexcept;
    MulticastSocket(const MulticastSocket&) = delete;
    MulticastSocket& operator=(const MulticastSocket&) = delete;

    // Sends a single question for `name` to 224.0.0.251:5353, with id 0 and
    // class IN. `buffer` is scratch space for building the packet.
    // Returns false on failure, errno is left set.
    bool SendQuery(QueryType type, std::string_view name, std::uint8_t* buffer, std::size_t capacity);

    // Sends a prebuilt datagram to 224.0.0.251:5353
    bool Send(const std::vector<std::uint8_t>& packet);

    ReceiveStatus Receive(std::uint8_t* buffer, std::size_t capacity, std::size_t& received);

    void Close();

    [[nodiscard]] const sockaddr_in& InterfaceAddress() const { return m_interfaceAddress; }

private:
    MulticastSocket(int socket, const sockaddr_in& interfaceAddress);

    int m_socket{-1};
    sockaddr_in m_interfaceAddress;
};

}
