#include "registry.hpp"
#include "types_utils.hpp"

#include <algorithm>

namespace mdns_client
{

bool Registry::Upsert(ServiceMap& services, const Service& service, Clock::time_point now)
{
    auto it = services.find(service);
    if (it == services.end()) {
        services.emplace(service, ServiceRecord{now, {}});
        return true;
    }
    it->second.last_seen = std::max(it->second.last_seen, now);
    return false;
}

std::size_t Registry::AddAddress(ServiceMap& services, std::string_view host, const std::string& address)
{
    std::size_t updated = 0;
    for (auto& [service, record] : services) {
        if (NamesEqual(service.host, host)) {
            record.addresses.insert(address);
            ++updated;
        }
    }
    return updated;
}

void Registry::Upsert(const Service& service, Clock::time_point now)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Upsert(m_services, service, now);
}

std::size_t Registry::AddAddress(std::string_view host, const std::string& address)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return AddAddress(m_services, host, address);
}

std::size_t Registry::EvictExpired(Clock::time_point now, Clock::duration ttl)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t removed = 0;
    for (auto it = m_services.begin(); it != m_services.end();) {
        if (now - it->second.last_seen >= ttl) {
            it = m_services.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<std::pair<Service, ServiceRecord>> Registry::Snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_services.begin(), m_services.end()};
}

std::size_t Registry::Size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_services.size();
}

}
