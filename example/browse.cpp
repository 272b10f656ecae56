#include "mdns_session/mdns.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

int main(int argc, char** argv)
{
    const std::string service_type = argc > 1 ? argv[1] : "_http._tcp.local.";

    mdns_session::SessionRegistry registry(std::make_shared<mdns_session::MdnsEngine>());
    const auto owner = registry.NewOwner();

    mdns_session::BrowseHandle handle;
    try {
        handle = registry.StartBrowse(owner, service_type);
    } catch (const mdns_session::Error& e) {
        std::cerr << e.what() << "\n";
        if (e.code() == mdns_session::ErrorCode::MulticastBlocked) {
            std::cerr << "Inbound multicast looks blocked, check the firewall or acquire a multicast lock.\n";
        }
        return 1;
    }

    // Poll once per frame, like a game loop would
    for (int tick = 0; tick < 60 * 30; ++tick) {
        std::vector<mdns_session::ServiceEvent> events;
        try {
            events = registry.PollBrowse(handle);
        } catch (const mdns_session::Error& e) {
            if (e.code() != mdns_session::ErrorCode::QueueOverflow && e.code() != mdns_session::ErrorCode::EngineUnavailable) {
                throw;
            }
            // Fell behind or lost the worker: start over, services are reported again as Discovered
            std::cerr << e.what() << ", restarting the browse\n";
            try {
                handle = registry.StartBrowse(owner, service_type);
            } catch (const mdns_session::Error& restartError) {
                std::cerr << restartError.what() << "\n";
                return 1;
            }
            continue;
        }

        for (const auto& event : events) {
            const auto& service = event.service;
            std::cout << fmt::format("{} {} -> {}:{} [{}]\n", mdns_session::ToString(event.kind), service.instance_name,
                service.hostname, service.port, fmt::join(service.addresses, ", "));
            for (const auto& [key, value] : service.txt) {
                std::cout << fmt::format("    {}={}\n", key, value);
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(33));
    }

    registry.StopBrowse(handle);
    return 0;
}
