#include "mdns_client/client.hpp"
#include "mdns_client/errors.hpp"
#include "address_utils.hpp"
#include "discovery_loop.hpp"
#include "interfaces.hpp"
#include "log.hpp"
#include "query_name.hpp"
#include "registry.hpp"
#include "types_utils.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <fmt/core.h>

namespace mdns_client
{

class Client::ClientImpl
{
private:
	std::string m_serviceName;
	Registry m_registry;
	std::unique_ptr<DiscoveryLoop> m_loop;

	std::mutex m_closeMutex;
	std::atomic<bool> m_running{false};
	std::thread m_loopThread;

public:
	ClientImpl(ClientSettings settings)
	: m_serviceName(NormalizeName(settings.service_name))
	{
		if (settings.poll_interval.count() <= 0) {
			throw std::invalid_argument("Poll interval must be positive.");
		}
		if (settings.poll_interval >= settings.service_ttl) {
			throw std::invalid_argument("Poll interval must be shorter than the service ttl.");
		}
		// SRV owner names in PTR mode are instance names, which never equal the browsed type
		if (settings.query_type == QueryType::PTR && settings.match_policy == MatchPolicy::Exact) {
			throw std::invalid_argument("PTR queries need MatchPolicy::Contains.");
		}
		// Throws std::invalid_argument before any socket is opened
		ValidateQueryName(m_serviceName);

		std::vector<MulticastSocket> sockets = OpenSockets(settings);
		const auto num_sockets = sockets.size();
		if (num_sockets == 0) {
			Log(LogLevel::Warn, "No usable IPv4 interfaces, no service will be discovered.");
		} else {
			Log(LogLevel::Info, fmt::format("Opened {} socket{} for mDNS discovery.", num_sockets, num_sockets > 1 ? "s" : ""));
		}

		m_loop = std::make_unique<DiscoveryLoop>(m_serviceName, settings, std::move(sockets), m_registry);

		Log(LogLevel::Info, fmt::format("Browsing for {}", m_serviceName));

		// Nothing after this may throw, the destructor does not run for a failed constructor
		m_loopThread = std::thread([this](){
			m_loop->Run();
		});
		m_running.store(true, std::memory_order_release);
	}

	~ClientImpl()
	{
		Close();
	}

	std::vector<std::pair<Service, ServiceRecord>> GetServices() const
	{
		return m_registry.Snapshot();
	}

	void Close()
	{
		std::lock_guard<std::mutex> lock(m_closeMutex);
		if (m_running.exchange(false, std::memory_order_acq_rel) == false) {
			// Already closed
			return;
		}

		m_loop->RequestStop();
		if (m_loopThread.joinable()) {
			m_loopThread.join();
		}
		m_loop->CloseSockets();

		Log(LogLevel::Info, fmt::format("mDNS client for {} stopped.", m_serviceName));
	}

	[[nodiscard]] bool IsRunning() const
	{
		return m_running.load(std::memory_order_acquire);
	}

	const std::string& ServiceName() const
	{
		return m_serviceName;
	}

private:
	static std::vector<MulticastSocket> OpenSockets(const ClientSettings& settings)
	{
		const std::vector<sockaddr_in> interfaces = settings.interface_addresses
			? ResolveInterfaces(*settings.interface_addresses)
			: EnumerateInterfaces();

		std::vector<MulticastSocket> sockets;
		for (const auto& iface : interfaces) {
			try {
				sockets.push_back(MulticastSocket::Open(iface));
			} catch (const SetupError& e) {
				if (settings.interface_failure_policy == InterfaceFailurePolicy::Abort) {
					Log(LogLevel::Error, e.what());
					throw;
				}
				Log(LogLevel::Warn, fmt::format("Skipping interface {}: {}", IPV4AddressToString(iface), e.what()));
			}
		}
		return sockets;
	}
};

namespace
{

ClientSettings SettingsForName(std::string service_name)
{
	ClientSettings settings;
	settings.service_name = std::move(service_name);
	return settings;
}

}

Client::Client(std::string service_name)
: Client(SettingsForName(std::move(service_name)))
{}

Client::Client(ClientSettings settings)
: m_impl(std::make_unique<ClientImpl>(std::move(settings)))
{}

Client::~Client() = default;

std::vector<std::pair<Service, ServiceRecord>> Client::GetServices() const
{
	return m_impl->GetServices();
}

void Client::Close()
{
	m_impl->Close();
}

bool Client::IsRunning() const
{
	return m_impl->IsRunning();
}

const std::string& Client::ServiceName() const
{
	return m_impl->ServiceName();
}

}
