#include "record_cache.hpp"

#include "mdns_session/service.hpp"

#include <algorithm>
#include <array>
#include <iterator>

#include <fmt/format.h>

namespace mdns_session
{

namespace
{

// RFC 6762 section 5.2
constexpr std::array<double, 4> kRefreshMarks{0.80, 0.85, 0.90, 0.95};

// RFC 6762 section 10.2: only records older than this are flushed
constexpr auto kCacheFlushGrace = std::chrono::seconds(1);

bool IsAddress(const Record& record)
{
    return std::holds_alternative<ARecord>(record) || std::holds_alternative<AAAARecord>(record);
}

}

std::vector<Record> RecordCache::Insert(const Record& record, Clock::time_point now)
{
    std::vector<Record> out;
    if (std::holds_alternative<AnyRecord>(record)) {
        return out;
    }

    const auto& header = GetHeader(record);
    const auto key = KeyOf(record);

    if (header.ttl == 0) {
        const auto it = m_entries.find(key);
        if (it != m_entries.end()) {
            m_entries.erase(it);
            out.push_back(record);
        }
        return out;
    }

    if (IsCacheFlush(header) && IsAddress(record)) {
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            const auto& cached = GetHeader(it->second.record);
            if (it->first != key
                && cached.record_type == header.record_type
                && EqualsIgnoreCase(cached.entry_string, header.entry_string)
                && now - it->second.received > kCacheFlushGrace) {
                out.push_back(WithTtl(it->second.record, 0));
                it = m_entries.erase(it);
            } else {
                ++it;
            }
        }
    }

    m_entries[key] = Entry{record, now, now + std::chrono::seconds(header.ttl), 0};
    out.push_back(record);
    return out;
}

std::vector<Record> RecordCache::Expire(Clock::time_point now)
{
    std::vector<Record> expired;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->second.expires <= now) {
            expired.push_back(WithTtl(it->second.record, 0));
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

std::vector<Record> RecordCache::DueRefreshes(Clock::time_point now)
{
    std::vector<Record> due;
    for (auto& [key, entry] : m_entries) {
        const auto lifetime = entry.expires - entry.received;
        const auto elapsed = now - entry.received;
        bool crossed = false;
        while (entry.refresh_stage < kRefreshMarks.size() && elapsed >= lifetime * kRefreshMarks[entry.refresh_stage]) {
            ++entry.refresh_stage;
            crossed = true;
        }
        if (crossed) {
            due.push_back(entry.record);
        }
    }
    return due;
}

bool RecordCache::IsRelevant(const Record& record, const std::string& service_type) const
{
    const auto& header = GetHeader(record);
    if (std::holds_alternative<DomainNamePointerRecord>(record)) {
        return EqualsIgnoreCase(header.entry_string, service_type);
    }
    if (std::holds_alternative<ServiceRecord>(record) || std::holds_alternative<TXTRecord>(record)) {
        return !ExtractInstanceName(header.entry_string, service_type).empty();
    }
    if (IsAddress(record)) {
        return IsTargetOf(header.entry_string, service_type);
    }
    return false;
}

std::vector<Record> RecordCache::BatchFor(const std::vector<Record>& changed, const std::string& service_type,
                                          Clock::time_point now) const
{
    std::vector<std::string> departedTargets;
    for (const auto& record : changed) {
        const auto* srv = std::get_if<ServiceRecord>(&record);
        if (srv && srv->header.ttl == 0 && IsRelevant(record, service_type)) {
            departedTargets.push_back(srv->target);
        }
    }
    const auto departed = [&departedTargets](const std::string& host) {
        return std::any_of(departedTargets.begin(), departedTargets.end(), [&host](const std::string& target) {
            return EqualsIgnoreCase(target, host);
        });
    };

    std::vector<Record> batch;
    for (const auto& record : changed) {
        const auto& header = GetHeader(record);
        const bool relevant = IsRelevant(record, service_type)
            || (IsAddress(record) && header.ttl == 0 && departed(header.entry_string));
        if (!relevant) {
            continue;
        }
        batch.push_back(record);
        const auto* srv = std::get_if<ServiceRecord>(&record);
        if (srv && srv->header.ttl != 0) {
            auto addresses = AddressesOf(srv->target, now);
            batch.insert(batch.end(), std::make_move_iterator(addresses.begin()), std::make_move_iterator(addresses.end()));
        }
    }
    return batch;
}

std::vector<Record> RecordCache::Snapshot(const std::string& service_type, Clock::time_point now) const
{
    std::vector<Record> pointers;
    std::vector<Record> services;
    std::vector<Record> addresses;
    for (const auto& [key, entry] : m_entries) {
        if (!IsRelevant(entry.record, service_type)) {
            continue;
        }
        auto record = WithTtl(entry.record, Remaining(entry, now));
        if (std::holds_alternative<DomainNamePointerRecord>(record)) {
            pointers.push_back(std::move(record));
        } else if (IsAddress(record)) {
            addresses.push_back(std::move(record));
        } else {
            services.push_back(std::move(record));
        }
    }

    pointers.insert(pointers.end(), services.begin(), services.end());
    pointers.insert(pointers.end(), addresses.begin(), addresses.end());
    return pointers;
}

std::vector<Record> RecordCache::AddressesOf(const std::string& host, Clock::time_point now) const
{
    std::vector<Record> addresses;
    for (const auto& [key, entry] : m_entries) {
        if (IsAddress(entry.record) && EqualsIgnoreCase(GetHeader(entry.record).entry_string, host)) {
            addresses.push_back(WithTtl(entry.record, Remaining(entry, now)));
        }
    }
    return addresses;
}

bool RecordCache::HasService(const std::string& full_name) const
{
    return m_entries.count(fmt::format("{}|{}|", ToLower(full_name), static_cast<int>(RecordType::SRV))) > 0;
}

bool RecordCache::HasAddresses(const std::string& host) const
{
    for (const auto& [key, entry] : m_entries) {
        if (IsAddress(entry.record) && EqualsIgnoreCase(GetHeader(entry.record).entry_string, host)) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> RecordCache::InstancesOf(const std::string& service_type) const
{
    std::vector<std::string> instances;
    for (const auto& [key, entry] : m_entries) {
        if (const auto* ptr = std::get_if<DomainNamePointerRecord>(&entry.record)) {
            if (EqualsIgnoreCase(ptr->header.entry_string, service_type)) {
                instances.push_back(ptr->name_string);
            }
        }
    }
    return instances;
}

std::string RecordCache::KeyOf(const Record& record)
{
    const auto& header = GetHeader(record);
    std::string identity;
    if (const auto* ptr = std::get_if<DomainNamePointerRecord>(&record)) {
        identity = ToLower(ptr->name_string);
    } else if (const auto* a = std::get_if<ARecord>(&record)) {
        identity = a->address_string;
    } else if (const auto* aaaa = std::get_if<AAAARecord>(&record)) {
        identity = aaaa->address_string;
    }
    return fmt::format("{}|{}|{}", ToLower(header.entry_string), header.record_type, identity);
}

Record RecordCache::WithTtl(const Record& record, std::uint32_t ttl)
{
    Record copy = record;
    GetHeader(copy).ttl = ttl;
    return copy;
}

std::uint32_t RecordCache::Remaining(const Entry& entry, Clock::time_point now)
{
    const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(entry.expires - now).count();
    // Zero would read as a goodbye
    return remaining > 0 ? static_cast<std::uint32_t>(remaining) : 1;
}

bool RecordCache::IsTargetOf(const std::string& host, const std::string& service_type) const
{
    for (const auto& [key, entry] : m_entries) {
        if (const auto* srv = std::get_if<ServiceRecord>(&entry.record)) {
            if (EqualsIgnoreCase(srv->target, host)
                && !ExtractInstanceName(srv->header.entry_string, service_type).empty()) {
                return true;
            }
        }
    }
    return false;
}

}
