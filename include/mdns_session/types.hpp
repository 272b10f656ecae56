#pragma once

#include "mdns_session/txt_codec.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

namespace mdns_session
{

// Values match mdns.h mdns_record_type
enum class RecordType : std::uint16_t {
    A = 1, // Address
    PTR = 12, // Domain name pointer
    TXT = 16, // Arbitrary text string
    AAAA = 28, // IP6 Address [Thomson]
    SRV = 33, // Server Selection [RFC2782]
    ANY = 255 // Any available records
};
std::string ToString(RecordType type);

enum class EntryType {
    UNKNOWN,
    QUESTION,
    ANSWER,
    AUTHORITY,
    ADDITIONAL
};
std::string ToString(EntryType entry);

// Top bit of the record class: cache-flush on answers, unicast-response on questions
constexpr std::uint16_t kClassTopBit = 0x8000;

struct RecordHeader {
    std::string ip_address; // Sender, possibly including port
    EntryType entry_type{EntryType::UNKNOWN};
    std::string entry_string; // Owner name, example: "Game Server A._mygame._tcp.local."

    std::uint16_t record_type{0}; // Value may not be in RecordType!
    std::uint16_t rclass{1};
    std::uint32_t ttl{0}; // Seconds. Zero is a goodbye or a cache expiry
};
bool operator==(const RecordHeader& lhs, const RecordHeader& rhs);
std::ostream& operator<<(std::ostream& os, const RecordHeader& header);

[[nodiscard]] inline bool IsCacheFlush(const RecordHeader& header) { return (header.rclass & kClassTopBit) != 0; }

struct DomainNamePointerRecord {
    RecordHeader header;

    std::string name_string; // examples: "Game Server A._mygame._tcp.local."
};
bool operator==(const DomainNamePointerRecord& lhs, const DomainNamePointerRecord& rhs);
std::ostream& operator<<(std::ostream& os, const DomainNamePointerRecord& record);

struct ServiceRecord {
    RecordHeader header;

    std::string target; // example: "marks-pc.local."
    std::uint16_t priority{0};
    std::uint16_t weight{0};
    std::uint16_t port{0};
};
bool operator==(const ServiceRecord& lhs, const ServiceRecord& rhs);
std::ostream& operator<<(std::ostream& os, const ServiceRecord& record);

struct ARecord {
    RecordHeader header;

    std::string address_string;
};
bool operator==(const ARecord& lhs, const ARecord& rhs);
std::ostream& operator<<(std::ostream& os, const ARecord& record);

struct AAAARecord {
    RecordHeader header;

    std::string address_string;
};
bool operator==(const AAAARecord& lhs, const AAAARecord& rhs);
std::ostream& operator<<(std::ostream& os, const AAAARecord& record);

struct TXTRecord {
    RecordHeader header;

    TxtMap txt;
    std::size_t malformed_entries{0};
};
bool operator==(const TXTRecord& lhs, const TXTRecord& rhs);
std::ostream& operator<<(std::ostream& os, const TXTRecord& record);

struct AnyRecord {
    RecordHeader header;
};
bool operator==(const AnyRecord& lhs, const AnyRecord& rhs);
std::ostream& operator<<(std::ostream& os, const AnyRecord& record);

using Record = std::variant<DomainNamePointerRecord,
                            ServiceRecord,
                            ARecord,
                            AAAARecord,
                            TXTRecord,
                            AnyRecord>;
std::ostream& operator<<(std::ostream& os, const Record& record);

const RecordHeader& GetHeader(const Record& record);
RecordHeader& GetHeader(Record& record);

// Records of one datagram (or one cache sweep) relevant to one subscription
struct RecordBatch {
    std::uint64_t generation{0};
    std::vector<Record> records;
};

}
