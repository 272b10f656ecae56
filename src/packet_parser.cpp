#include "packet_parser.hpp"

#include "mdns_utils.hpp"
#include "mdns_session/log.hpp"
#include "mdns_session/txt_codec.hpp"

#include <array>

#include <fmt/format.h>

namespace mdns_session
{

namespace
{

constexpr std::size_t kHeaderSize = 12;
constexpr std::size_t kRecordFixedSize = 10; // type, class, ttl, rdlength
constexpr std::uint16_t kResponseFlag = 0x8000;

std::uint16_t ReadU16(const std::uint8_t* data)
{
    return static_cast<std::uint16_t>((data[0] << 8) | data[1]);
}

std::uint32_t ReadU32(const std::uint8_t* data)
{
    return (static_cast<std::uint32_t>(data[0]) << 24) | (static_cast<std::uint32_t>(data[1]) << 16)
        | (static_cast<std::uint32_t>(data[2]) << 8) | static_cast<std::uint32_t>(data[3]);
}

// Validates the name at offset before extracting it; mdns_string_extract alone cannot report failure.
bool ReadName(const void* data, std::size_t size, std::size_t& offset, std::string& name)
{
    std::size_t check = offset;
    if (!mdns_string_skip(data, size, &check)) {
        return false;
    }
    std::array<char, 256> buffer;
    const mdns_string_t str = mdns_string_extract(data, size, &offset, buffer.data(), buffer.size());
    name.assign(str.str, str.length);
    offset = check;
    return true;
}

std::optional<Record> ParseRecord(const void* data, std::size_t size, std::size_t offset, std::size_t length,
                                  RecordHeader header)
{
    std::array<char, 256> namebuffer;
    const auto* bytes = static_cast<const std::uint8_t*>(data);

    switch (static_cast<RecordType>(header.record_type)) {
        case RecordType::PTR: {
            DomainNamePointerRecord record;
            record.header = std::move(header);
            const mdns_string_t name = mdns_record_parse_ptr(data, size, offset, length, namebuffer.data(), namebuffer.size());
            if (name.length == 0) {
                return std::nullopt;
            }
            record.name_string.assign(name.str, name.length);
            return Record(std::move(record));
        }
        case RecordType::SRV: {
            if (length < 7) {
                return std::nullopt;
            }
            ServiceRecord record;
            record.header = std::move(header);
            const mdns_record_srv_t srv = mdns_record_parse_srv(data, size, offset, length, namebuffer.data(), namebuffer.size());
            record.target.assign(srv.name.str, srv.name.length);
            record.priority = srv.priority;
            record.weight = srv.weight;
            record.port = srv.port;
            return Record(std::move(record));
        }
        case RecordType::A: {
            if (length != 4) {
                return std::nullopt;
            }
            ARecord record;
            record.header = std::move(header);
            struct sockaddr_in addr;
            mdns_record_parse_a(data, size, offset, length, &addr);
            addr.sin_port = 0;
            record.address_string = IPV4AddressToString(&addr, sizeof(addr));
            return Record(std::move(record));
        }
        case RecordType::AAAA: {
            if (length != 16) {
                return std::nullopt;
            }
            AAAARecord record;
            record.header = std::move(header);
            struct sockaddr_in6 addr;
            mdns_record_parse_aaaa(data, size, offset, length, &addr);
            addr.sin6_port = 0;
            record.address_string = IPV6AddressToString(&addr, sizeof(addr));
            return Record(std::move(record));
        }
        case RecordType::TXT: {
            TXTRecord record;
            record.header = std::move(header);
            auto decoded = DecodeTxt(bytes + offset, length);
            record.txt = std::move(decoded.entries);
            record.malformed_entries = decoded.malformed;
            return Record(std::move(record));
        }
        default: {
            AnyRecord record;
            record.header = std::move(header);
            return Record(std::move(record));
        }
    }
}

}

std::optional<ParsedPacket> ParsePacket(const void* data, std::size_t size, const std::string& sender)
{
    if (size < kHeaderSize) {
        Log(LogLevel::Debug, fmt::format("Dropping {} byte datagram from {}", size, sender));
        return std::nullopt;
    }

    const auto* bytes = static_cast<const std::uint8_t*>(data);
    ParsedPacket packet;
    packet.query_id = ReadU16(bytes);
    packet.is_response = (ReadU16(bytes + 2) & kResponseFlag) != 0;
    const std::uint16_t questions = ReadU16(bytes + 4);
    const std::array<std::pair<std::uint16_t, mdns_entry_type_t>, 3> sections{{
        {ReadU16(bytes + 6), MDNS_ENTRYTYPE_ANSWER},
        {ReadU16(bytes + 8), MDNS_ENTRYTYPE_AUTHORITY},
        {ReadU16(bytes + 10), MDNS_ENTRYTYPE_ADDITIONAL},
    }};

    std::size_t offset = kHeaderSize;
    for (std::uint16_t i = 0; i < questions; ++i) {
        Question question;
        if (!ReadName(data, size, offset, question.name) || offset + 4 > size) {
            Log(LogLevel::Debug, fmt::format("Malformed question from {}", sender));
            packet.truncated = true;
            return packet;
        }
        question.record_type = ReadU16(bytes + offset);
        question.unicast_response = (ReadU16(bytes + offset + 2) & MDNS_UNICAST_RESPONSE) != 0;
        offset += 4;
        packet.questions.push_back(std::move(question));
    }

    for (const auto& [count, entry] : sections) {
        for (std::uint16_t i = 0; i < count; ++i) {
            RecordHeader header;
            header.ip_address = sender;
            header.entry_type = ParseEntryType(entry);
            if (!ReadName(data, size, offset, header.entry_string) || offset + kRecordFixedSize > size) {
                Log(LogLevel::Debug, fmt::format("Malformed record header from {}", sender));
                packet.truncated = true;
                return packet;
            }
            header.record_type = ReadU16(bytes + offset);
            header.rclass = ReadU16(bytes + offset + 2);
            header.ttl = ReadU32(bytes + offset + 4);
            const std::size_t length = ReadU16(bytes + offset + 8);
            offset += kRecordFixedSize;
            if (offset + length > size) {
                Log(LogLevel::Debug, fmt::format("Record data of {} runs past the end of the datagram from {}", header.entry_string, sender));
                packet.truncated = true;
                return packet;
            }

            auto record = ParseRecord(data, size, offset, length, header);
            if (record) {
                packet.records.push_back(std::move(*record));
            } else {
                Log(LogLevel::Debug, fmt::format("Skipping malformed {} record for {} from {}", ToString(static_cast<RecordType>(header.record_type)), header.entry_string, sender));
            }
            offset += length;
        }
    }

    return packet;
}

}
