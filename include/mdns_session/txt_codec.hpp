#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mdns_session
{

using TxtMap = std::map<std::string, std::string>;

// One length byte per entry
constexpr std::size_t kMaxTxtEntryLength = 255;

struct TxtDecodeResult {
    TxtMap entries;
    std::size_t malformed{0}; // entries skipped because they could not be parsed
};

// Decodes TXT RDATA (a sequence of length-prefixed strings).
// Entries are split on the first '='; an entry without '=' is a boolean key with an empty value;
// the last occurrence of a key wins. Never throws: bad entries are counted and skipped.
TxtDecodeResult DecodeTxt(const std::uint8_t* data, std::size_t size);
TxtDecodeResult DecodeTxt(const std::vector<std::uint8_t>& data);

// Throws Error(InvalidTxtKey) or Error(EntryTooLong)
void ValidateTxt(const TxtMap& txt);

// Encodes to TXT RDATA. An empty map encodes as a single empty string.
std::vector<std::uint8_t> EncodeTxt(const TxtMap& txt);

}
