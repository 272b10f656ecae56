#pragma once

#include "mdns_session/protocol_engine.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace mdns_session
{

struct EngineSettings
{
    // Pin the engine to one local IPv4 or IPv6 address. Empty picks the first usable interface.
    std::string interface_address;
    // Host label advertised as "<hostname>.local.". Empty uses the system host name.
    std::string hostname;
    bool enable_ipv6 = true;
    // Receive our own multicast traffic, so a browse sees advertisements of the same process
    bool multicast_loopback = true;
    std::chrono::milliseconds teardown_timeout{2000};
};

// mDNS querier and responder running on one background worker thread.
// The worker starts on the first Subscribe or Register.
class MdnsEngine : public ProtocolEngine
{
public:
    explicit MdnsEngine(EngineSettings settings = {});
    ~MdnsEngine() override;

    SubscriptionId Subscribe(const std::string& service_type, std::uint64_t generation, RecordSink sink) override;
    void Unsubscribe(SubscriptionId id) override;

    RegistrationId Register(const AdvertiseRequest& request, StatusSink sink) override;
    void Unregister(RegistrationId id) override;

    void Shutdown() override;
    [[nodiscard]] bool Running() const override;

    // "<hostname>.local."
    [[nodiscard]] std::string QualifiedHostname() const;

private:
    class EngineImpl;
    std::unique_ptr<EngineImpl> m_impl;
};

}
