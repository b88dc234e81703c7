#pragma once

#include "mdns_client/settings.hpp"
#include "mdns_client/types.hpp"
#include "multicast_socket.hpp"
#include "registry.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace mdns_client
{

// Periodic query / drain / evict cycle run by the client's background thread.
// The loop is the only writer of the registry.
class DiscoveryLoop
{
public:
    DiscoveryLoop(std::string service_name, const ClientSettings& settings,
                  std::vector<MulticastSocket> sockets, Registry& registry);

    // Blocks until RequestStop() is called. A cycle runs every poll interval.
    void Run();

    // Wakes Run() immediately, safe from any thread
    void RequestStop();

    // One cycle: query on every socket, handle all pending datagrams, then evict
    void RunCycle(Clock::time_point now);

    // Decodes one datagram and applies it to the registry. Returns true if the registry was touched.
    bool HandleDatagram(const std::uint8_t* data, std::size_t size, Clock::time_point now);

    // Removes services not confirmed within the ttl. Returns the number removed.
    std::size_t Evict(Clock::time_point now);

    [[nodiscard]] std::size_t SocketCount() const { return m_sockets.size(); }

    // Closes the sockets, call only once Run() has returned
    void CloseSockets();

private:
    void SendQueries();
    void DrainSocket(MulticastSocket& socket, Clock::time_point now);

    std::string m_serviceName;
    QueryType m_queryType;
    MatchPolicy m_matchPolicy;
    Clock::duration m_pollInterval;
    Clock::duration m_serviceTtl;
    std::vector<MulticastSocket> m_sockets;
    Registry& m_registry;
    std::vector<std::uint8_t> m_buffer;

    std::mutex m_stopMutex;
    std::condition_variable m_stopCondition;
    bool m_stopRequested{false};
};

}
