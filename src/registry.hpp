#pragma once

#include "mdns_client/types.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mdns_client
{

using ServiceMap = std::unordered_map<Service, ServiceRecord>;

// Services seen on the network, keyed by host and port.
// Every method takes the lock for the duration of the map operation only.
class Registry
{
public:
    // Inserts the service with no addresses, or refreshes last_seen.
    // last_seen never moves backwards.
    void Upsert(const Service& service, Clock::time_point now);

    // Adds the address to every service whose host is `host`. Returns the number of services updated.
    std::size_t AddAddress(std::string_view host, const std::string& address);

    // Removes services with now - last_seen >= ttl. Returns the number removed.
    std::size_t EvictExpired(Clock::time_point now, Clock::duration ttl);

    [[nodiscard]] std::vector<std::pair<Service, ServiceRecord>> Snapshot() const;
    [[nodiscard]] std::size_t Size() const;

    // Runs `fn` on the map under a single lock, for updates that must be applied together
    template <typename Fn>
    void Apply(Fn&& fn)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        fn(m_services);
    }

    // Lock free variants for use inside Apply(). Upsert returns true if the service is new.
    static bool Upsert(ServiceMap& services, const Service& service, Clock::time_point now);
    static std::size_t AddAddress(ServiceMap& services, std::string_view host, const std::string& address);

private:
    mutable std::mutex m_mutex;
    ServiceMap m_services;
};

}
