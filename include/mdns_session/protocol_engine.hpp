#pragma once

#include "mdns_session/event_queue.hpp"
#include "mdns_session/service.hpp"
#include "mdns_session/types.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace mdns_session
{

using RecordSink = std::shared_ptr<EventQueue<RecordBatch>>;
using StatusSink = std::shared_ptr<EventQueue<RegistrationStatus>>;

using SubscriptionId = std::uint64_t;
using RegistrationId = std::uint64_t;

// The network side of the session manager. Every call returns without waiting on the network;
// results flow back through the sinks handed in.
class ProtocolEngine
{
public:
    virtual ~ProtocolEngine() = default;

    // Starts periodic PTR queries for service_type (canonical form). Batches are tagged with generation.
    // Throws Error(EngineUnavailable) or Error(MulticastBlocked) if the engine cannot start.
    virtual SubscriptionId Subscribe(const std::string& service_type, std::uint64_t generation, RecordSink sink) = 0;

    // Unknown ids are ignored
    virtual void Unsubscribe(SubscriptionId id) = 0;

    // request is already validated. Throws Error(NameConflict) for a full name this engine already serves,
    // and the engine kinds if it cannot start.
    virtual RegistrationId Register(const AdvertiseRequest& request, StatusSink sink) = 0;

    // Sends goodbyes once, best effort. Unknown ids are ignored
    virtual void Unregister(RegistrationId id) = 0;

    // Bounded: never waits longer than the configured teardown timeout
    virtual void Shutdown() = 0;

    [[nodiscard]] virtual bool Running() const = 0;
};

}
