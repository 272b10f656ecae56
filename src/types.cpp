#include "mdns_session/types.hpp"

#include <ostream>
#include <sstream>

#include <fmt/core.h>
#include <fmt/ranges.h>


namespace mdns_session
{

std::string ToString(RecordType type)
{
    switch (type) {
        case RecordType::A: return "A";
        case RecordType::PTR: return "PTR";
        case RecordType::TXT: return "TXT";
        case RecordType::AAAA: return "AAAA";
        case RecordType::SRV: return "SRV";
        case RecordType::ANY: return "ANY";
    }
    return "";
}

std::string ToString(EntryType entry)
{
    switch (entry) {
        case EntryType::UNKNOWN: return "unknown";
        case EntryType::QUESTION: return "question";
        case EntryType::ANSWER: return "answer";
        case EntryType::AUTHORITY: return "authority";
        case EntryType::ADDITIONAL: return "additional";
    }
    return "";
}

bool operator==(const RecordHeader& lhs, const RecordHeader& rhs)
{
    return lhs.ip_address == rhs.ip_address
        && lhs.entry_type == rhs.entry_type
        && lhs.entry_string == rhs.entry_string
        && lhs.record_type == rhs.record_type
        && lhs.rclass == rhs.rclass
        && lhs.ttl == rhs.ttl;
}

std::ostream& operator<<(std::ostream& os, const RecordHeader& header)
{
    os << fmt::format("{} : {} {}", header.ip_address, ToString(header.entry_type), header.entry_string);
    return os;
}

bool operator==(const DomainNamePointerRecord& lhs, const DomainNamePointerRecord& rhs)
{
    return lhs.header == rhs.header
        && lhs.name_string == rhs.name_string;
}

std::ostream& operator<<(std::ostream& os, const DomainNamePointerRecord& record)
{
    os << record.header << fmt::format(" PTR {} rclass {:#x} ttl {}", record.name_string, record.header.rclass, record.header.ttl);
    return os;
}

bool operator==(const ServiceRecord& lhs, const ServiceRecord& rhs)
{
    return lhs.header == rhs.header
        && lhs.target == rhs.target
        && lhs.priority == rhs.priority
        && lhs.weight == rhs.weight
        && lhs.port == rhs.port;
}

std::ostream& operator<<(std::ostream& os, const ServiceRecord& record)
{
    os << record.header << fmt::format(" SRV {} priority {} weight {} port {} ttl {}", record.target, record.priority, record.weight, record.port, record.header.ttl);
    return os;
}

bool operator==(const ARecord& lhs, const ARecord& rhs)
{
    return lhs.header == rhs.header
        && lhs.address_string == rhs.address_string;
}

std::ostream& operator<<(std::ostream& os, const ARecord& record)
{
    os << record.header << fmt::format(" A {} ttl {}", record.address_string, record.header.ttl);
    return os;
}

bool operator==(const AAAARecord& lhs, const AAAARecord& rhs)
{
    return lhs.header == rhs.header
        && lhs.address_string == rhs.address_string;
}

std::ostream& operator<<(std::ostream& os, const AAAARecord& record)
{
    os << record.header << fmt::format(" AAAA {} ttl {}", record.address_string, record.header.ttl);
    return os;
}

bool operator==(const TXTRecord& lhs, const TXTRecord& rhs)
{
    return lhs.header == rhs.header
        && lhs.txt == rhs.txt
        && lhs.malformed_entries == rhs.malformed_entries;
}

std::ostream& operator<<(std::ostream& os, const TXTRecord& record)
{
    os << record.header << fmt::format(" TXT {} ttl {}", record.txt, record.header.ttl);
    if (record.malformed_entries > 0) {
        os << fmt::format(" ({} malformed)", record.malformed_entries);
    }
    return os;
}

bool operator==(const AnyRecord& lhs, const AnyRecord& rhs)
{
    return lhs.header == rhs.header;
}

std::ostream& operator<<(std::ostream& os, const AnyRecord& record)
{
    os << record.header << fmt::format(" type {} rclass {:#x} ttl {}", record.header.record_type, record.header.rclass, record.header.ttl);
    return os;
}

std::ostream& operator<<(std::ostream& os, const Record& record)
{
    std::visit([&os](const auto& rec){
        os << rec;
    }, record);
    return os;
}

const RecordHeader& GetHeader(const Record& record)
{
    return std::visit([](const auto& rec) -> const RecordHeader& {
        return rec.header;
    }, record);
}

RecordHeader& GetHeader(Record& record)
{
    return std::visit([](auto& rec) -> RecordHeader& {
        return rec.header;
    }, record);
}

}
