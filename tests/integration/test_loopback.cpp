#include <catch2/catch.hpp>

#include "mdns_session/mdns.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <thread>

using namespace mdns_session;

namespace {

// Hosts without multicast (containers, CI sandboxes) cannot run these; they are skipped there.
bool NetworkUnavailable(const Error& e)
{
    if (IsEngineUnavailable(e.code())) {
        WARN("skipping, no multicast: " << e.what());
        return true;
    }
    return false;
}

AdvertiseRequest GameServer(const std::string& instance)
{
    AdvertiseRequest request;
    request.instance_name = instance;
    request.service_type = "_mygame._tcp.local.";
    request.port = 7350;
    request.txt = {{"version", "1.0"}};
    return request;
}

template <typename Predicate>
std::optional<ServiceEvent> WaitForEvent(SessionRegistry& registry, const BrowseHandle& handle, Predicate predicate,
                                         std::chrono::seconds timeout = std::chrono::seconds(10))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        for (const auto& event : registry.PollBrowse(handle)) {
            if (predicate(event)) {
                return event;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return std::nullopt;
}

}

TEST_CASE("Loopback: a browse discovers an advertisement of the same process", "[integration][loopback]") {
    SessionRegistry registry(std::make_shared<MdnsEngine>());
    const auto host = registry.NewOwner();
    const auto client = registry.NewOwner();

    AdvertiseHandle advertised;
    BrowseHandle browse;
    try {
        advertised = registry.Advertise(host, GameServer("Game Server A"));
        browse = registry.StartBrowse(client, "_mygame._tcp.local.");
    } catch (const Error& e) {
        if (NetworkUnavailable(e)) {
            return;
        }
        throw;
    }

    const auto discovered = WaitForEvent(registry, browse, [](const ServiceEvent& event) {
        return event.kind == ServiceEventKind::Discovered && event.service.instance_name == "Game Server A";
    });
    if (!discovered) {
        WARN("skipping, multicast loopback delivered nothing within 10 s");
        return;
    }

    REQUIRE(discovered->service.port == 7350);
    REQUIRE(discovered->service.txt == TxtMap{{"version", "1.0"}});
    REQUIRE_FALSE(discovered->service.addresses.empty());
    REQUIRE(registry.PollAdvertise(advertised).state == RegistrationState::Registered);

    registry.Unadvertise(advertised);
    const auto removed = WaitForEvent(registry, browse, [](const ServiceEvent& event) {
        return event.kind == ServiceEventKind::Removed && event.service.instance_name == "Game Server A";
    });
    REQUIRE(removed.has_value());
}

TEST_CASE("Loopback: a second advertisement of a taken name fails", "[integration][loopback]") {
    auto engine = std::make_shared<MdnsEngine>();
    SessionRegistry registry(engine);
    const auto first = registry.NewOwner();
    const auto second = registry.NewOwner();

    AdvertiseHandle handle;
    try {
        handle = registry.Advertise(first, GameServer("Game Server B"));
    } catch (const Error& e) {
        if (NetworkUnavailable(e)) {
            return;
        }
        throw;
    }

    REQUIRE_THROWS_MATCHES(registry.Advertise(second, GameServer("Game Server B")), Error,
                           Catch::Predicate<Error>([](const Error& e) { return e.code() == ErrorCode::NameConflict; }));
    REQUIRE(registry.IsAdvertising(first));
    REQUIRE(registry.RegisteredFullName(handle) == "Game Server B._mygame._tcp.local.");
}

TEST_CASE("Loopback: shutdown is bounded and the engine restarts on demand", "[integration][loopback]") {
    auto engine = std::make_shared<MdnsEngine>();
    SessionRegistry registry(engine);
    const auto owner = registry.NewOwner();

    try {
        registry.StartBrowse(owner, "_mygame._tcp.local.");
    } catch (const Error& e) {
        if (NetworkUnavailable(e)) {
            return;
        }
        throw;
    }
    REQUIRE(engine->Running());
    REQUIRE(engine->QualifiedHostname().size() > std::string(".local.").size());

    const auto started = std::chrono::steady_clock::now();
    registry.StopAll();
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(3));
    REQUIRE_FALSE(engine->Running());

    const auto handle = registry.StartBrowse(owner, "_mygame._tcp.local.");
    REQUIRE(engine->Running());
    REQUIRE(registry.PollBrowse(handle).empty());
}
