#include "mdns_session/session_registry.hpp"
#include "mdns_session/errors.hpp"
#include "mdns_session/log.hpp"

#include <fmt/format.h>

namespace mdns_session
{

bool operator==(const BrowseHandle& lhs, const BrowseHandle& rhs)
{
    return lhs.owner == rhs.owner && lhs.generation == rhs.generation;
}

bool operator==(const AdvertiseHandle& lhs, const AdvertiseHandle& rhs)
{
    return lhs.owner == rhs.owner && lhs.generation == rhs.generation;
}

SessionRegistry::SessionRegistry(std::shared_ptr<ProtocolEngine> engine, RegistrySettings settings)
: m_engine(std::move(engine))
, m_settings(settings)
{
    if (!m_engine) {
        throw Error(ErrorCode::EngineUnavailable, "SessionRegistry", "no protocol engine given");
    }
}

SessionRegistry::~SessionRegistry()
{
    StopAll();
}

OwnerId SessionRegistry::NewOwner()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto owner = m_nextOwner++;
    m_owners[owner];
    return owner;
}

BrowseHandle SessionRegistry::StartBrowse(OwnerId owner, const std::string& service_type)
{
    const auto canonical = NormalizeServiceType(service_type);

    std::lock_guard<std::mutex> lock(m_mutex);
    auto& slot = m_owners[owner].browse;
    if (slot.active) {
        StopBrowse(slot);
    }

    const auto generation = m_nextGeneration++;
    if (!slot.queue) {
        slot.queue = std::make_shared<EventQueue<RecordBatch>>(m_settings.max_pending_batches);
    }
    slot.queue->Reset();
    slot.generation = generation;

    slot.subscription = m_engine->Subscribe(canonical, generation, slot.queue);
    slot.active = true;
    slot.service_type = canonical;
    slot.bridge.Reset(generation, canonical);

    Log(LogLevel::Info, fmt::format("Owner {} browsing {} (generation {}).", owner, canonical, generation));
    return BrowseHandle{owner, generation};
}

std::vector<ServiceEvent> SessionRegistry::PollBrowse(const BrowseHandle& handle)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ServiceEvent> events;
    auto* slot = FindBrowse(handle);
    if (!slot) {
        return events;
    }

    if (!m_engine->Running()) {
        throw Error(ErrorCode::EngineUnavailable, fmt::format("PollBrowse({})", slot->service_type),
            "the mDNS engine stopped, restart the browse");
    }
    if (slot->queue->Overflowed()) {
        throw Error(ErrorCode::QueueOverflow, fmt::format("PollBrowse({})", slot->service_type),
            fmt::format("more than {} record batches were pending, restart the browse", slot->queue->Capacity()));
    }

    for (const auto& batch : slot->queue->Drain()) {
        auto folded = slot->bridge.Fold(batch);
        events.insert(events.end(), std::make_move_iterator(folded.begin()), std::make_move_iterator(folded.end()));
    }
    return events;
}

void SessionRegistry::StopBrowse(const BrowseHandle& handle)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (auto* slot = FindBrowse(handle)) {
        StopBrowse(*slot);
        Log(LogLevel::Info, fmt::format("Owner {} stopped browsing.", handle.owner));
    }
}

AdvertiseHandle SessionRegistry::Advertise(OwnerId owner, const AdvertiseRequest& request)
{
    const auto context = fmt::format("Advertise({})", request.instance_name);
    ValidateInstanceName(request.instance_name);
    AdvertiseRequest normalized = request;
    normalized.service_type = NormalizeServiceType(request.service_type);
    if (request.port == 0) {
        throw Error(ErrorCode::InvalidPort, context, "port must be between 1 and 65535");
    }
    ValidateTxt(request.txt);

    std::lock_guard<std::mutex> lock(m_mutex);
    auto& slot = m_owners[owner].advertise;
    if (slot.active) {
        Unadvertise(slot);
    }

    const auto generation = m_nextGeneration++;
    slot.generation = generation;
    slot.queue = std::make_shared<EventQueue<RegistrationStatus>>(m_settings.max_pending_statuses);
    slot.registration = m_engine->Register(normalized, slot.queue);
    slot.active = true;
    slot.full_name = MakeFullName(normalized.instance_name, normalized.service_type);
    slot.status = AdvertiseStatus{RegistrationState::Pending, std::nullopt, "probing"};

    Log(LogLevel::Info, fmt::format("Owner {} advertising {} port {} (generation {}).", owner, slot.full_name, request.port, generation));
    return AdvertiseHandle{owner, generation};
}

AdvertiseStatus SessionRegistry::PollAdvertise(const AdvertiseHandle& handle)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto* slot = FindAdvertise(handle);
    if (!slot) {
        return AdvertiseStatus{RegistrationState::Unregistered, std::nullopt, "not advertising"};
    }
    for (auto& status : slot->queue->Drain()) {
        slot->status = std::move(status);
    }
    return slot->status;
}

void SessionRegistry::Unadvertise(const AdvertiseHandle& handle)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (auto* slot = FindAdvertise(handle)) {
        Log(LogLevel::Info, fmt::format("Owner {} stopped advertising {}.", handle.owner, slot->full_name));
        Unadvertise(*slot);
    }
}

std::string SessionRegistry::RegisteredFullName(const AdvertiseHandle& handle) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto* slot = FindAdvertise(handle);
    return slot ? slot->full_name : std::string();
}

bool SessionRegistry::IsBrowsing(OwnerId owner) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_owners.find(owner);
    return it != m_owners.end() && it->second.browse.active;
}

bool SessionRegistry::IsAdvertising(OwnerId owner) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_owners.find(owner);
    return it != m_owners.end() && it->second.advertise.active;
}

void SessionRegistry::StopAll()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& [owner, slots] : m_owners) {
        if (slots.browse.active) {
            StopBrowse(slots.browse);
        }
        if (slots.advertise.active) {
            Unadvertise(slots.advertise);
        }
    }
    m_engine->Shutdown();
}

SessionRegistry::BrowseSlot* SessionRegistry::FindBrowse(const BrowseHandle& handle)
{
    const auto it = m_owners.find(handle.owner);
    if (it == m_owners.end()) {
        return nullptr;
    }
    auto& slot = it->second.browse;
    if (!slot.active || slot.generation != handle.generation) {
        return nullptr;
    }
    return &slot;
}

SessionRegistry::AdvertiseSlot* SessionRegistry::FindAdvertise(const AdvertiseHandle& handle)
{
    const auto* found = static_cast<const SessionRegistry*>(this)->FindAdvertise(handle);
    return const_cast<AdvertiseSlot*>(found);
}

const SessionRegistry::AdvertiseSlot* SessionRegistry::FindAdvertise(const AdvertiseHandle& handle) const
{
    const auto it = m_owners.find(handle.owner);
    if (it == m_owners.end()) {
        return nullptr;
    }
    const auto& slot = it->second.advertise;
    if (!slot.active || slot.generation != handle.generation) {
        return nullptr;
    }
    return &slot;
}

void SessionRegistry::StopBrowse(BrowseSlot& slot)
{
    m_engine->Unsubscribe(slot.subscription);
    slot.active = false;
    slot.subscription = 0;
    slot.bridge.Clear();
    slot.queue->Reset();
}

void SessionRegistry::Unadvertise(AdvertiseSlot& slot)
{
    m_engine->Unregister(slot.registration);
    slot.active = false;
    slot.registration = 0;
    slot.full_name.clear();
    slot.status = AdvertiseStatus{RegistrationState::Unregistered, std::nullopt, "unregistered"};
}

}
