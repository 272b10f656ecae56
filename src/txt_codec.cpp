#include "mdns_session/txt_codec.hpp"
#include "mdns_session/errors.hpp"
#include "mdns_session/log.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace mdns_session
{

namespace
{

bool IsValidKeyChar(char c)
{
    const auto byte = static_cast<unsigned char>(c);
    return byte >= 0x20 && byte <= 0x7e && c != '=';
}

bool IsValidKey(const std::string& key)
{
    return !key.empty() && std::all_of(key.begin(), key.end(), IsValidKeyChar);
}

}

TxtDecodeResult DecodeTxt(const std::uint8_t* data, std::size_t size)
{
    TxtDecodeResult result;
    std::size_t offset = 0;
    while (offset < size) {
        const std::size_t length = data[offset++];
        if (length == 0) {
            continue;
        }
        if (offset + length > size) {
            // Length byte runs past the record, nothing after it can be trusted
            ++result.malformed;
            Log(LogLevel::Debug, fmt::format("TXT entry of {} bytes truncated at {} of {}", length, offset, size));
            break;
        }

        const std::string entry(reinterpret_cast<const char*>(data + offset), length);
        offset += length;

        const auto separator = entry.find('=');
        std::string key = entry.substr(0, separator);
        if (!IsValidKey(key)) {
            ++result.malformed;
            Log(LogLevel::Debug, fmt::format("Skipping TXT entry with invalid key: \"{}\"", entry));
            continue;
        }

        std::string value = separator == std::string::npos ? std::string() : entry.substr(separator + 1);
        result.entries[std::move(key)] = std::move(value);
    }
    return result;
}

TxtDecodeResult DecodeTxt(const std::vector<std::uint8_t>& data)
{
    return DecodeTxt(data.data(), data.size());
}

void ValidateTxt(const TxtMap& txt)
{
    for (const auto& [key, value] : txt) {
        if (!IsValidKey(key)) {
            throw Error(ErrorCode::InvalidTxtKey, fmt::format("EncodeTxt(\"{}\")", key),
                        "TXT keys must be non-empty printable ASCII without '='");
        }
        const std::size_t length = key.size() + 1 + value.size();
        if (length > kMaxTxtEntryLength) {
            throw Error(ErrorCode::EntryTooLong, fmt::format("EncodeTxt(\"{}\")", key),
                        fmt::format("entry is {} bytes, limit is {}", length, kMaxTxtEntryLength));
        }
    }
}

std::vector<std::uint8_t> EncodeTxt(const TxtMap& txt)
{
    ValidateTxt(txt);

    std::vector<std::uint8_t> out;
    if (txt.empty()) {
        out.push_back(0);
        return out;
    }

    for (const auto& [key, value] : txt) {
        out.push_back(static_cast<std::uint8_t>(key.size() + 1 + value.size()));
        out.insert(out.end(), key.begin(), key.end());
        out.push_back('=');
        out.insert(out.end(), value.begin(), value.end());
    }
    return out;
}

}
