#include "mdns_client/client.hpp"
#include "mdns_client/errors.hpp"

#include <chrono>
#include <iostream>
#include <thread>

int main(int argc, char* argv[])
{
    const std::string service_name = argc > 1 ? argv[1] : "_http._tcp.local.";

    try {
        mdns_client::Client client(service_name);

        while (true) {
            const auto services = client.GetServices();
            std::cout << "Got " << services.size() << " services.\n";
            for (const auto& [service, record] : services) {
                std::cout << "  " << service << " " << record << "\n";
            }
            std::this_thread::sleep_for(std::chrono::seconds(2));
        }
    } catch (const mdns_client::SetupError& e) {
        std::cerr << "Failed to start mDNS client: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
