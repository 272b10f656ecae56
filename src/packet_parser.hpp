#pragma once

#include "mdns_session/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mdns_session
{

struct Question
{
    std::string name;
    std::uint16_t record_type{0};
    bool unicast_response{false};
};

struct ParsedPacket
{
    std::uint16_t query_id{0};
    bool is_response{false};
    std::vector<Question> questions;
    std::vector<Record> records; // answer, authority and additional sections in wire order
    bool truncated{false}; // parsing stopped early on malformed data
};

// Decodes one mDNS datagram. Returns std::nullopt when not even the header is there.
// Malformed records end the walk; what was decoded up to that point is kept.
std::optional<ParsedPacket> ParsePacket(const void* data, std::size_t size, const std::string& sender);

}
