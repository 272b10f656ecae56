#pragma once

#include "mdns_session/types.hpp"

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace mdns_session
{

// Record cache of the engine worker. Not thread safe: only the worker touches it.
class RecordCache
{
public:
    using Clock = std::chrono::steady_clock;

    // Stores or refreshes a record. A TTL of zero removes it.
    // Returns what consumers need to see: records evicted by a cache flush (TTL 0)
    // followed by the record itself. A goodbye for an unknown record returns nothing.
    std::vector<Record> Insert(const Record& record, Clock::time_point now);

    // Drops expired records and returns them with TTL 0
    std::vector<Record> Expire(Clock::time_point now);

    // Records that crossed one of the 80/85/90/95% TTL marks since the last call
    std::vector<Record> DueRefreshes(Clock::time_point now);

    // Whether a browse for service_type cares about this record
    [[nodiscard]] bool IsRelevant(const Record& record, const std::string& service_type) const;

    // The part of changed (as returned by Insert or Expire) a browse for service_type has to see.
    // Cached addresses of the target follow each live SRV. An address goodbye stays relevant when
    // the SRV that targeted its host left in the same change set.
    [[nodiscard]] std::vector<Record> BatchFor(const std::vector<Record>& changed, const std::string& service_type,
                                               Clock::time_point now) const;

    // Everything cached for service_type, TTLs set to the remaining lifetime
    [[nodiscard]] std::vector<Record> Snapshot(const std::string& service_type, Clock::time_point now) const;

    [[nodiscard]] std::vector<Record> AddressesOf(const std::string& host, Clock::time_point now) const;
    [[nodiscard]] bool HasService(const std::string& full_name) const;
    [[nodiscard]] bool HasAddresses(const std::string& host) const;
    [[nodiscard]] std::vector<std::string> InstancesOf(const std::string& service_type) const;
    [[nodiscard]] std::size_t Size() const { return m_entries.size(); }

private:
    struct Entry
    {
        Record record;
        Clock::time_point received;
        Clock::time_point expires;
        std::size_t refresh_stage{0};
    };

    static std::string KeyOf(const Record& record);
    static Record WithTtl(const Record& record, std::uint32_t ttl);
    static std::uint32_t Remaining(const Entry& entry, Clock::time_point now);
    [[nodiscard]] bool IsTargetOf(const std::string& host, const std::string& service_type) const;

    std::map<std::string, Entry> m_entries;
};

}
