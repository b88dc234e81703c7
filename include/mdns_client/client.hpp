#pragma once

#include "mdns_client/settings.hpp"
#include "mdns_client/types.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mdns_client
{

// Browses the local network for one mDNS service name.
// Construction opens the multicast sockets and starts a background thread that
// queries every poll interval and keeps a registry of the services that answered.
// Services not confirmed for service_ttl are dropped.
//
// Throws SetupError if interfaces or sockets cannot be set up, and
// std::invalid_argument for an invalid service name or timing settings.
class Client
{
public:
    explicit Client(std::string service_name);
    explicit Client(ClientSettings settings);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Copy of the registry, does not wait on the background thread
    [[nodiscard]] std::vector<std::pair<Service, ServiceRecord>> GetServices() const;

    // Stops and joins the background thread, then closes the sockets.
    // Safe to call more than once, also called by the destructor.
    void Close();

    [[nodiscard]] bool IsRunning() const;
    [[nodiscard]] const std::string& ServiceName() const;

private:
    class ClientImpl;
    std::unique_ptr<ClientImpl> m_impl;
};

}
