#include "discovery_loop.hpp"
#include "address_utils.hpp"
#include "log.hpp"
#include "query_name.hpp"
#include "response_decoder.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fmt/core.h>

namespace mdns_client
{

DiscoveryLoop::DiscoveryLoop(std::string service_name, const ClientSettings& settings,
                             std::vector<MulticastSocket> sockets, Registry& registry)
: m_serviceName(std::move(service_name))
, m_queryType(settings.query_type)
, m_matchPolicy(settings.match_policy)
, m_pollInterval(settings.poll_interval)
, m_serviceTtl(settings.service_ttl)
, m_sockets(std::move(sockets))
, m_registry(registry)
, m_buffer(kMaxPacketSize)
{
    ValidateQueryName(m_serviceName);
}

void DiscoveryLoop::Run()
{
    Log(LogLevel::Debug, fmt::format("Discovery loop for {} started.", m_serviceName));
    std::unique_lock<std::mutex> lock(m_stopMutex);
    while (true) {
        if (m_stopCondition.wait_for(lock, m_pollInterval, [this] { return m_stopRequested; })) {
            break;
        }

        lock.unlock();
        RunCycle(Clock::now());
        lock.lock();
    }
    Log(LogLevel::Debug, fmt::format("Discovery loop for {} stopped.", m_serviceName));
}

void DiscoveryLoop::RequestStop()
{
    {
        std::lock_guard<std::mutex> lock(m_stopMutex);
        m_stopRequested = true;
    }
    m_stopCondition.notify_all();
}

void DiscoveryLoop::RunCycle(Clock::time_point now)
{
    SendQueries();
    for (auto& socket : m_sockets) {
        DrainSocket(socket, now);
    }
    Evict(now);
}

void DiscoveryLoop::SendQueries()
{
    for (auto& socket : m_sockets) {
        if (!socket.SendQuery(m_queryType, m_serviceName, m_buffer.data(), m_buffer.size())) {
            const int error = errno;
            Log(LogLevel::Warn, fmt::format("Failed to send mDNS query for {} on {}: {}", m_serviceName,
                                            IPV4AddressToString(socket.InterfaceAddress()), std::strerror(error)));
        }
    }
}

void DiscoveryLoop::DrainSocket(MulticastSocket& socket, Clock::time_point now)
{
    while (true) {
        std::size_t received = 0;
        const ReceiveStatus status = socket.Receive(m_buffer.data(), m_buffer.size(), received);
        if (status == ReceiveStatus::WouldBlock) {
            return;
        }
        if (status == ReceiveStatus::Error) {
            const int error = errno;
            Log(LogLevel::Warn, fmt::format("Failed to receive mDNS response on {}: {}",
                                            IPV4AddressToString(socket.InterfaceAddress()), std::strerror(error)));
            return;
        }
        HandleDatagram(m_buffer.data(), received, now);
    }
}

bool DiscoveryLoop::HandleDatagram(const std::uint8_t* data, std::size_t size, Clock::time_point now)
{
    const auto response = DecodeResponse(data, size);
    if (!response) {
        Log(LogLevel::Debug, fmt::format("Discarding malformed datagram of {} bytes.", size));
        return false;
    }
    return ApplyResponse(*response, m_serviceName, m_matchPolicy, m_registry, now);
}

std::size_t DiscoveryLoop::Evict(Clock::time_point now)
{
    const std::size_t removed = m_registry.EvictExpired(now, m_serviceTtl);
    if (removed > 0) {
        Log(LogLevel::Info, fmt::format("Removed {} expired service{} for {}.", removed, removed > 1 ? "s" : "", m_serviceName));
    }
    return removed;
}

void DiscoveryLoop::CloseSockets()
{
    for (auto& socket : m_sockets) {
        socket.Close();
    }
    m_sockets.clear();
}

}
