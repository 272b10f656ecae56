#include "mdns_session/mdns.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include <fmt/format.h>

int main()
{
    mdns_session::SessionRegistry registry(std::make_shared<mdns_session::MdnsEngine>());
    const auto owner = registry.NewOwner();

    mdns_session::AdvertiseRequest request;
    request.instance_name = "Game Server A";
    request.service_type = "_mygame._tcp.local.";
    request.port = 7350;
    request.txt = {{"version", "1.0"}};

    mdns_session::AdvertiseHandle handle;
    try {
        handle = registry.Advertise(owner, request);
    } catch (const mdns_session::Error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    auto last = mdns_session::RegistrationState::Pending;
    for (int tick = 0; tick < 60 * 120; ++tick) {
        const auto status = registry.PollAdvertise(handle);
        if (status.state != last) {
            last = status.state;
            std::cout << fmt::format("{} is {}: {}\n", registry.RegisteredFullName(handle), mdns_session::ToString(status.state), status.message);
            if (status.state == mdns_session::RegistrationState::Failed) {
                break;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    registry.Unadvertise(handle);
    return 0;
}
