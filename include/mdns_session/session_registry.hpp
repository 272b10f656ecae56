#pragma once

#include "mdns_session/event_bridge.hpp"
#include "mdns_session/event_queue.hpp"
#include "mdns_session/protocol_engine.hpp"
#include "mdns_session/service.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mdns_session
{

using OwnerId = std::uint64_t;

// Handles are plain values. Once their session is stopped or replaced they go stale
// and every call taking them becomes a no-op.
struct BrowseHandle
{
    OwnerId owner{0};
    std::uint64_t generation{0};
};
bool operator==(const BrowseHandle& lhs, const BrowseHandle& rhs);

struct AdvertiseHandle
{
    OwnerId owner{0};
    std::uint64_t generation{0};
};
bool operator==(const AdvertiseHandle& lhs, const AdvertiseHandle& rhs);

using AdvertiseStatus = RegistrationStatus;

struct RegistrySettings
{
    // Bound of each browse queue, in record batches
    std::size_t max_pending_batches = 4096;
    std::size_t max_pending_statuses = 64;
};

// One browse and one advertisement per owner, polled from the consumer's tick.
// None of the calls wait on the network.
class SessionRegistry
{
public:
    explicit SessionRegistry(std::shared_ptr<ProtocolEngine> engine, RegistrySettings settings = {});
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    OwnerId NewOwner();

    // Replaces the owner's running browse, if any. An invalid service type throws before the
    // running browse is touched.
    BrowseHandle StartBrowse(OwnerId owner, const std::string& service_type);

    // Events since the last poll. Empty for a stale handle.
    // Throws Error(QueueOverflow) once the browse fell too far behind, and Error(EngineUnavailable)
    // once the engine worker stopped under it. Restart the browse to recover from either.
    std::vector<ServiceEvent> PollBrowse(const BrowseHandle& handle);

    void StopBrowse(const BrowseHandle& handle);

    // Replaces the owner's advertisement, if any, after validating the request
    AdvertiseHandle Advertise(OwnerId owner, const AdvertiseRequest& request);

    AdvertiseStatus PollAdvertise(const AdvertiseHandle& handle);

    void Unadvertise(const AdvertiseHandle& handle);

    // "<instance>.<service type>" while the advertisement is active, empty otherwise
    [[nodiscard]] std::string RegisteredFullName(const AdvertiseHandle& handle) const;

    [[nodiscard]] bool IsBrowsing(OwnerId owner) const;
    [[nodiscard]] bool IsAdvertising(OwnerId owner) const;

    // Stops every session and shuts the engine down
    void StopAll();

private:
    struct BrowseSlot
    {
        bool active{false};
        std::uint64_t generation{0};
        SubscriptionId subscription{0};
        std::string service_type;
        RecordSink queue;
        EventBridge bridge;
    };

    struct AdvertiseSlot
    {
        bool active{false};
        std::uint64_t generation{0};
        RegistrationId registration{0};
        std::string full_name;
        StatusSink queue;
        AdvertiseStatus status;
    };

    struct OwnerSlots
    {
        BrowseSlot browse;
        AdvertiseSlot advertise;
    };

    BrowseSlot* FindBrowse(const BrowseHandle& handle);
    AdvertiseSlot* FindAdvertise(const AdvertiseHandle& handle);
    const AdvertiseSlot* FindAdvertise(const AdvertiseHandle& handle) const;
    void StopBrowse(BrowseSlot& slot);
    void Unadvertise(AdvertiseSlot& slot);

    std::shared_ptr<ProtocolEngine> m_engine;
    RegistrySettings m_settings;

    mutable std::mutex m_mutex;
    OwnerId m_nextOwner{1};
    std::uint64_t m_nextGeneration{1};
    std::map<OwnerId, OwnerSlots> m_owners;
};

}
