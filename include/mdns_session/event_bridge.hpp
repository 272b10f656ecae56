#pragma once

#include "mdns_session/service.hpp"
#include "mdns_session/types.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace mdns_session
{

// Turns the record stream of one browse subscription into Discovered / Updated / Removed events.
// Lives on the consumer thread; the engine only ever hands it RecordBatches through an EventQueue.
class EventBridge
{
public:
    EventBridge() = default;

    // Begins a new subscription. All per-service state of the previous one is dropped.
    void Reset(std::uint64_t generation, std::string service_type);

    // No active subscription: every batch is stale.
    void Clear();

    // Batches tagged with any generation but the current one are discarded.
    std::vector<ServiceEvent> Fold(const RecordBatch& batch);

    [[nodiscard]] std::uint64_t Generation() const { return m_generation; }
    [[nodiscard]] const std::string& ServiceType() const { return m_serviceType; }

    [[nodiscard]] std::vector<DiscoveredService> ResolvedServices() const;
    [[nodiscard]] std::size_t TrackedServices() const { return m_services.size(); }
    [[nodiscard]] std::size_t TrackedHosts() const { return m_hostAddresses.size(); }

private:
    struct ServiceEntry
    {
        std::string instance_name;
        std::string full_name;
        bool has_srv{false};
        std::string hostname;
        std::uint16_t port{0};
        TxtMap txt;
        ServiceState state{ServiceState::Partial};
        DiscoveredService announced; // what the consumer was last told
    };

    void OnPointer(const DomainNamePointerRecord& record, std::vector<ServiceEvent>& events);
    void OnService(const ServiceRecord& record, std::vector<ServiceEvent>& events);
    void OnText(const TXTRecord& record);
    void OnAddress(const RecordHeader& header, const std::string& address);

    ServiceEntry* Touch(const std::string& full_name);
    void MarkPending(const std::string& key);
    void RemoveService(const std::string& key, std::vector<ServiceEvent>& events);
    void ForgetHostIfUnused(const std::string& hostname);
    void EvaluatePending(std::vector<ServiceEvent>& events);
    DiscoveredService Snapshot(const ServiceEntry& entry) const;

    std::uint64_t m_generation{0};
    std::string m_serviceType;
    std::unordered_map<std::string, ServiceEntry> m_services; // keyed by lower-case full name
    std::unordered_map<std::string, std::vector<std::string>> m_hostAddresses; // keyed by lower-case host name
    std::vector<std::string> m_pending; // services touched since the last evaluation, in arrival order
};

}
