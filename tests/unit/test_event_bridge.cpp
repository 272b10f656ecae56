#include <catch2/catch.hpp>

#include "mdns_session/event_bridge.hpp"
#include "record_builders.hpp"

using namespace mdns_session;

namespace {

constexpr std::uint64_t kGeneration = 7;

RecordBatch Batch(std::vector<Record> records, std::uint64_t generation = kGeneration)
{
    return RecordBatch{generation, std::move(records)};
}

EventBridge MakeBridge()
{
    EventBridge bridge;
    bridge.Reset(kGeneration, test::kType);
    return bridge;
}

std::vector<Record> FullAnnouncement(mdns_session::TxtMap txt = {{"version", "1.0"}})
{
    return {
        test::Ptr(test::kType, test::kInstance),
        test::Srv(test::kInstance, test::kHost, 7350),
        test::Txt(test::kInstance, std::move(txt)),
        test::A(test::kHost, "192.168.1.20"),
    };
}

}

TEST_CASE("Event bridge: one datagram resolves to one Discovered", "[unit][bridge]") {
    auto bridge = MakeBridge();
    const auto events = bridge.Fold(Batch(FullAnnouncement()));

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].kind == ServiceEventKind::Discovered);
    const auto& service = events[0].service;
    REQUIRE(service.instance_name == "Game Server A");
    REQUIRE(service.full_name == test::kInstance);
    REQUIRE(service.hostname == test::kHost);
    REQUIRE(service.port == 7350);
    REQUIRE(service.txt == TxtMap{{"version", "1.0"}});
    REQUIRE(service.addresses == std::vector<std::string>{"192.168.1.20"});
    REQUIRE(service.state == ServiceState::Resolved);
}

TEST_CASE("Event bridge: no Discovered until an address is known", "[unit][bridge]") {
    auto bridge = MakeBridge();

    REQUIRE(bridge.Fold(Batch({test::Ptr(test::kType, test::kInstance)})).empty());
    REQUIRE(bridge.Fold(Batch({test::Srv(test::kInstance, test::kHost, 7350)})).empty());
    REQUIRE(bridge.TrackedServices() == 1);
    REQUIRE(bridge.ResolvedServices().empty());

    const auto events = bridge.Fold(Batch({test::A(test::kHost, "192.168.1.20")}));
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].kind == ServiceEventKind::Discovered);
    REQUIRE(events[0].service.port == 7350);
    REQUIRE_FALSE(events[0].service.addresses.empty());
}

TEST_CASE("Event bridge: identical re-announcements are silent", "[unit][bridge]") {
    auto bridge = MakeBridge();
    REQUIRE(bridge.Fold(Batch(FullAnnouncement())).size() == 1);

    REQUIRE(bridge.Fold(Batch(FullAnnouncement())).empty());
    REQUIRE(bridge.Fold(Batch(FullAnnouncement())).empty());
}

TEST_CASE("Event bridge: TXT change emits Updated with the same identity", "[unit][bridge]") {
    auto bridge = MakeBridge();
    bridge.Fold(Batch(FullAnnouncement()));

    const auto events = bridge.Fold(Batch({test::Txt(test::kInstance, {{"version", "1.1"}, {"map", "dust"}})}));
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].kind == ServiceEventKind::Updated);
    REQUIRE(events[0].service.full_name == test::kInstance);
    REQUIRE(events[0].service.txt == TxtMap{{"version", "1.1"}, {"map", "dust"}});
    REQUIRE(events[0].service.addresses == std::vector<std::string>{"192.168.1.20"});
}

TEST_CASE("Event bridge: addresses are sorted IPv4 first", "[unit][bridge]") {
    auto bridge = MakeBridge();
    bridge.Fold(Batch(FullAnnouncement()));

    const auto events = bridge.Fold(Batch({test::Aaaa(test::kHost, "fd00::20"), test::A(test::kHost, "10.0.0.20")}));
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].kind == ServiceEventKind::Updated);
    REQUIRE(events[0].service.addresses == std::vector<std::string>{"10.0.0.20", "192.168.1.20", "fd00::20"});
}

TEST_CASE("Event bridge: goodbye removes once, later records start fresh", "[unit][bridge]") {
    auto bridge = MakeBridge();
    bridge.Fold(Batch(FullAnnouncement()));

    const auto removed = bridge.Fold(Batch({test::Ptr(test::kType, test::kInstance, 0), test::Srv(test::kInstance, test::kHost, 7350, 0)}));
    REQUIRE(removed.size() == 1);
    REQUIRE(removed[0].kind == ServiceEventKind::Removed);
    REQUIRE(removed[0].service.state == ServiceState::Removed);
    REQUIRE(removed[0].service.full_name == test::kInstance);
    REQUIRE(bridge.TrackedServices() == 0);

    REQUIRE(bridge.TrackedHosts() == 0);

    // Back on another address, no address goodbye was ever seen for the old one
    const auto again = bridge.Fold(Batch({
        test::Ptr(test::kType, test::kInstance),
        test::Srv(test::kInstance, test::kHost, 7350),
        test::A(test::kHost, "10.0.0.5"),
    }));
    REQUIRE(again.size() == 1);
    REQUIRE(again[0].kind == ServiceEventKind::Discovered);
    REQUIRE(again[0].service.addresses == std::vector<std::string>{"10.0.0.5"});
}

TEST_CASE("Event bridge: losing the last address removes the service", "[unit][bridge]") {
    auto bridge = MakeBridge();
    bridge.Fold(Batch(FullAnnouncement()));

    const auto events = bridge.Fold(Batch({test::A(test::kHost, "192.168.1.20", 0)}));
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].kind == ServiceEventKind::Removed);
    REQUIRE(bridge.ResolvedServices().empty());
}

TEST_CASE("Event bridge: a partial service disappears silently", "[unit][bridge]") {
    auto bridge = MakeBridge();
    bridge.Fold(Batch({test::Ptr(test::kType, test::kInstance)}));

    REQUIRE(bridge.Fold(Batch({test::Ptr(test::kType, test::kInstance, 0)})).empty());
    REQUIRE(bridge.TrackedServices() == 0);
}

TEST_CASE("Event bridge: earlier records are reported before a removal", "[unit][bridge]") {
    auto bridge = MakeBridge();
    bridge.Fold(Batch(FullAnnouncement()));

    const std::string other = "Game Server B._mygame._tcp.local.";
    const auto events = bridge.Fold(Batch({
        test::Ptr(test::kType, other),
        test::Srv(other, "other-pc.local.", 7351),
        test::A("other-pc.local.", "192.168.1.30"),
        test::Ptr(test::kType, test::kInstance, 0),
    }));

    REQUIRE(events.size() == 2);
    REQUIRE(events[0].kind == ServiceEventKind::Discovered);
    REQUIRE(events[0].service.instance_name == "Game Server B");
    REQUIRE(events[1].kind == ServiceEventKind::Removed);
    REQUIRE(events[1].service.instance_name == "Game Server A");
}

TEST_CASE("Event bridge: batches of another generation are discarded", "[unit][bridge]") {
    auto bridge = MakeBridge();
    REQUIRE(bridge.Fold(Batch(FullAnnouncement(), kGeneration - 1)).empty());
    REQUIRE(bridge.TrackedServices() == 0);

    bridge.Clear();
    REQUIRE(bridge.Fold(Batch(FullAnnouncement(), 0)).empty());
    REQUIRE(bridge.Fold(Batch(FullAnnouncement(), kGeneration)).empty());
}

TEST_CASE("Event bridge: records of other types are ignored", "[unit][bridge]") {
    auto bridge = MakeBridge();
    const std::string foreign = "Printer._ipp._tcp.local.";
    REQUIRE(bridge.Fold(Batch({
        test::Ptr("_ipp._tcp.local.", foreign),
        test::Srv(foreign, test::kHost, 631),
        test::A(test::kHost, "192.168.1.20"),
    })).empty());
    REQUIRE(bridge.TrackedServices() == 0);
}
