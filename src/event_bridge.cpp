#include "mdns_session/event_bridge.hpp"
#include "mdns_session/log.hpp"

#include <algorithm>
#include <type_traits>

#include <fmt/format.h>

namespace mdns_session
{

void EventBridge::Reset(std::uint64_t generation, std::string service_type)
{
    m_generation = generation;
    m_serviceType = std::move(service_type);
    m_services.clear();
    m_hostAddresses.clear();
    m_pending.clear();
}

void EventBridge::Clear()
{
    Reset(0, std::string());
}

std::vector<ServiceEvent> EventBridge::Fold(const RecordBatch& batch)
{
    std::vector<ServiceEvent> events;
    if (m_generation == 0 || batch.generation != m_generation) {
        Log(LogLevel::Debug, fmt::format("Discarding stale batch of generation {} (current {})", batch.generation, m_generation));
        return events;
    }

    for (const auto& record : batch.records) {
        std::visit([this, &events](const auto& rec) {
            using T = std::decay_t<decltype(rec)>;
            if constexpr (std::is_same_v<T, DomainNamePointerRecord>) {
                OnPointer(rec, events);
            } else if constexpr (std::is_same_v<T, ServiceRecord>) {
                OnService(rec, events);
            } else if constexpr (std::is_same_v<T, TXTRecord>) {
                OnText(rec);
            } else if constexpr (std::is_same_v<T, ARecord> || std::is_same_v<T, AAAARecord>) {
                OnAddress(rec.header, rec.address_string);
            }
        }, record);
    }

    EvaluatePending(events);
    return events;
}

std::vector<DiscoveredService> EventBridge::ResolvedServices() const
{
    std::vector<DiscoveredService> services;
    for (const auto& [key, entry] : m_services) {
        if (entry.state == ServiceState::Resolved) {
            services.push_back(entry.announced);
        }
    }
    std::sort(services.begin(), services.end(), [](const DiscoveredService& lhs, const DiscoveredService& rhs) {
        return lhs.full_name < rhs.full_name;
    });
    return services;
}

void EventBridge::OnPointer(const DomainNamePointerRecord& record, std::vector<ServiceEvent>& events)
{
    if (!EqualsIgnoreCase(record.header.entry_string, m_serviceType)) {
        return;
    }
    if (ExtractInstanceName(record.name_string, m_serviceType).empty()) {
        Log(LogLevel::Debug, fmt::format("PTR target \"{}\" is not an instance of {}", record.name_string, m_serviceType));
        return;
    }

    if (record.header.ttl == 0) {
        RemoveService(ToLower(record.name_string), events);
        return;
    }
    Touch(record.name_string);
}

void EventBridge::OnService(const ServiceRecord& record, std::vector<ServiceEvent>& events)
{
    if (ExtractInstanceName(record.header.entry_string, m_serviceType).empty()) {
        return;
    }

    if (record.header.ttl == 0) {
        RemoveService(ToLower(record.header.entry_string), events);
        return;
    }

    auto* entry = Touch(record.header.entry_string);
    entry->has_srv = true;
    entry->hostname = record.target;
    entry->port = record.port;
}

void EventBridge::OnText(const TXTRecord& record)
{
    // A TXT goodbye travels with the PTR goodbye, which is what removes the service
    if (record.header.ttl == 0 || ExtractInstanceName(record.header.entry_string, m_serviceType).empty()) {
        return;
    }
    Touch(record.header.entry_string)->txt = record.txt;
}

void EventBridge::OnAddress(const RecordHeader& header, const std::string& address)
{
    const auto host = ToLower(header.entry_string);
    if (header.ttl == 0) {
        const auto hostIt = m_hostAddresses.find(host);
        if (hostIt == m_hostAddresses.end()) {
            return;
        }
        auto& addresses = hostIt->second;
        const auto it = std::find(addresses.begin(), addresses.end(), address);
        if (it == addresses.end()) {
            return;
        }
        addresses.erase(it);
    } else {
        auto& addresses = m_hostAddresses[host];
        if (std::find(addresses.begin(), addresses.end(), address) != addresses.end()) {
            return;
        }
        addresses.push_back(address);
    }

    for (const auto& [key, entry] : m_services) {
        if (entry.has_srv && EqualsIgnoreCase(entry.hostname, host)) {
            MarkPending(key);
        }
    }
}

EventBridge::ServiceEntry* EventBridge::Touch(const std::string& full_name)
{
    const auto key = ToLower(full_name);
    auto it = m_services.find(key);
    if (it == m_services.end()) {
        ServiceEntry entry;
        entry.instance_name = ExtractInstanceName(full_name, m_serviceType);
        entry.full_name = full_name;
        it = m_services.emplace(key, std::move(entry)).first;
    }
    MarkPending(key);
    return &it->second;
}

void EventBridge::MarkPending(const std::string& key)
{
    if (std::find(m_pending.begin(), m_pending.end(), key) == m_pending.end()) {
        m_pending.push_back(key);
    }
}

void EventBridge::RemoveService(const std::string& key, std::vector<ServiceEvent>& events)
{
    // Keep the order records arrived in: anything touched earlier is reported first
    EvaluatePending(events);

    const auto it = m_services.find(key);
    if (it == m_services.end()) {
        return;
    }
    if (it->second.state == ServiceState::Resolved) {
        ServiceEvent event{ServiceEventKind::Removed, it->second.announced};
        event.service.state = ServiceState::Removed;
        events.push_back(std::move(event));
        Log(LogLevel::Debug, fmt::format("Service removed: {}", it->second.full_name));
    }
    const auto hostname = it->second.hostname;
    m_services.erase(it);
    ForgetHostIfUnused(hostname);
}

// A later identity gets its addresses again from the engine, which appends the cached
// addresses of a host to every SRV it delivers
void EventBridge::ForgetHostIfUnused(const std::string& hostname)
{
    if (hostname.empty()) {
        return;
    }
    for (const auto& [key, entry] : m_services) {
        if (EqualsIgnoreCase(entry.hostname, hostname)) {
            return;
        }
    }
    m_hostAddresses.erase(ToLower(hostname));
}

void EventBridge::EvaluatePending(std::vector<ServiceEvent>& events)
{
    const auto pending = std::move(m_pending);
    m_pending.clear();

    for (const auto& key : pending) {
        const auto it = m_services.find(key);
        if (it == m_services.end()) {
            continue;
        }
        auto& entry = it->second;
        auto snapshot = Snapshot(entry);
        const bool complete = entry.has_srv && !entry.hostname.empty() && !snapshot.addresses.empty();

        if (entry.state == ServiceState::Partial) {
            if (!complete) {
                continue;
            }
            entry.state = ServiceState::Resolved;
            snapshot.state = ServiceState::Resolved;
            entry.announced = snapshot;
            events.push_back(ServiceEvent{ServiceEventKind::Discovered, std::move(snapshot)});
            Log(LogLevel::Debug, fmt::format("Service resolved: {}", entry.full_name));
        } else if (!complete) {
            // Lost its SRV target or its last address: report it gone, start over on new records
            ServiceEvent event{ServiceEventKind::Removed, entry.announced};
            event.service.state = ServiceState::Removed;
            events.push_back(std::move(event));
            const auto hostname = entry.hostname;
            m_services.erase(it);
            ForgetHostIfUnused(hostname);
        } else {
            snapshot.state = ServiceState::Resolved;
            if (snapshot != entry.announced) {
                entry.announced = snapshot;
                events.push_back(ServiceEvent{ServiceEventKind::Updated, std::move(snapshot)});
            }
        }
    }
}

DiscoveredService EventBridge::Snapshot(const ServiceEntry& entry) const
{
    DiscoveredService service;
    service.instance_name = entry.instance_name;
    service.full_name = entry.full_name;
    service.hostname = entry.hostname;
    service.port = entry.port;
    service.txt = entry.txt;
    service.state = entry.state;

    const auto hostIt = m_hostAddresses.find(ToLower(entry.hostname));
    if (hostIt != m_hostAddresses.end()) {
        service.addresses = hostIt->second;
        SortAddresses(service.addresses);
    }
    return service;
}

}
