#include "mdns_session/service.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include <fmt/format.h>

#include <unistd.h>

namespace mdns_session
{

namespace
{

constexpr std::size_t kMaxServiceNameLength = 15; // RFC 6335 section 5.1
constexpr std::size_t kMaxLabelLength = 63;

std::vector<std::string_view> SplitLabels(std::string_view name)
{
    std::vector<std::string_view> labels;
    std::size_t start = 0;
    while (start < name.size()) {
        const auto dot = name.find('.', start);
        if (dot == std::string_view::npos) {
            labels.push_back(name.substr(start));
            break;
        }
        labels.push_back(name.substr(start, dot - start));
        start = dot + 1;
    }
    return labels;
}

std::string CheckServiceType(std::string_view service_type)
{
    if (service_type.empty()) {
        return "service type is empty";
    }
    if (service_type.back() != '.') {
        return "service type must end with the trailing dot of \"local.\"";
    }

    const auto labels = SplitLabels(service_type.substr(0, service_type.size() - 1));
    if (labels.size() != 3 || !EqualsIgnoreCase(labels[2], "local")) {
        return "expected \"_<service>._<tcp|udp>.local.\"";
    }
    if (!EqualsIgnoreCase(labels[1], "_tcp") && !EqualsIgnoreCase(labels[1], "_udp")) {
        return "protocol label must be _tcp or _udp";
    }

    const auto service = labels[0];
    if (service.size() < 2 || service.front() != '_') {
        return "service label must start with '_'";
    }
    const auto name = service.substr(1);
    if (name.size() > kMaxServiceNameLength) {
        return fmt::format("service name is longer than {} characters", kMaxServiceNameLength);
    }
    const bool charsOk = std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-';
    });
    if (!charsOk) {
        return "service name may only contain letters, digits and '-'";
    }
    return {};
}

}

std::string NormalizeServiceType(std::string_view service_type)
{
    const auto problem = CheckServiceType(service_type);
    if (!problem.empty()) {
        throw Error(ErrorCode::InvalidServiceType, fmt::format("service type \"{}\"", service_type), problem);
    }
    return ToLower(service_type);
}

bool IsValidServiceType(std::string_view service_type)
{
    return CheckServiceType(service_type).empty();
}

void ValidateInstanceName(std::string_view instance_name)
{
    const auto context = fmt::format("instance name \"{}\"", instance_name);
    if (instance_name.empty() || instance_name.size() > kMaxLabelLength) {
        throw Error(ErrorCode::InvalidInstanceName, context,
                    fmt::format("must be 1 to {} bytes", kMaxLabelLength));
    }
    for (const char c : instance_name) {
        const auto byte = static_cast<unsigned char>(c);
        if (c == '.' || byte < 0x20 || byte == 0x7f) {
            throw Error(ErrorCode::InvalidInstanceName, context, "dots and control characters are not allowed");
        }
    }
}

std::string MakeFullName(std::string_view instance_name, std::string_view service_type)
{
    return fmt::format("{}.{}", instance_name, service_type);
}

std::string ExtractInstanceName(std::string_view full_name, std::string_view service_type)
{
    if (full_name.size() < service_type.size() + 2) {
        return {};
    }
    if (!EndsWithIgnoreCase(full_name, service_type)) {
        return {};
    }
    const auto dot = full_name.size() - service_type.size() - 1;
    if (full_name[dot] != '.') {
        return {};
    }
    return std::string(full_name.substr(0, dot));
}

std::string ToLower(std::string_view string)
{
    std::string out(string);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size()
        && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

bool EndsWithIgnoreCase(std::string_view string, std::string_view suffix)
{
    return string.size() >= suffix.size()
        && EqualsIgnoreCase(string.substr(string.size() - suffix.size()), suffix);
}

void SortAddresses(std::vector<std::string>& addresses)
{
    std::sort(addresses.begin(), addresses.end(), [](const std::string& lhs, const std::string& rhs) {
        const bool lhsIsV6 = lhs.find(':') != std::string::npos;
        const bool rhsIsV6 = rhs.find(':') != std::string::npos;
        if (lhsIsV6 != rhsIsV6) {
            return !lhsIsV6;
        }
        return lhs < rhs;
    });
    addresses.erase(std::unique(addresses.begin(), addresses.end()), addresses.end());
}

std::string GetLocalHostname()
{
    std::array<char, 256> buffer{};
    if (gethostname(buffer.data(), buffer.size() - 1) != 0 || buffer[0] == '\0') {
        return "unknown-host";
    }
    std::string hostname(buffer.data());
    const auto dot = hostname.find('.');
    if (dot != std::string::npos) {
        hostname.resize(dot);
    }
    return hostname.empty() ? "unknown-host" : hostname;
}

std::string ToString(ServiceState state)
{
    switch (state) {
        case ServiceState::Partial: return "partial";
        case ServiceState::Resolved: return "resolved";
        case ServiceState::Removed: return "removed";
    }
    return "";
}

bool operator==(const DiscoveredService& lhs, const DiscoveredService& rhs)
{
    return lhs.instance_name == rhs.instance_name
        && lhs.full_name == rhs.full_name
        && lhs.hostname == rhs.hostname
        && lhs.addresses == rhs.addresses
        && lhs.port == rhs.port
        && lhs.txt == rhs.txt
        && lhs.state == rhs.state;
}

bool operator!=(const DiscoveredService& lhs, const DiscoveredService& rhs)
{
    return !(lhs == rhs);
}

std::string ToString(ServiceEventKind kind)
{
    switch (kind) {
        case ServiceEventKind::Discovered: return "discovered";
        case ServiceEventKind::Updated: return "updated";
        case ServiceEventKind::Removed: return "removed";
    }
    return "";
}

std::string ToString(RegistrationState state)
{
    switch (state) {
        case RegistrationState::Pending: return "pending";
        case RegistrationState::Registered: return "registered";
        case RegistrationState::Failed: return "failed";
        case RegistrationState::Unregistered: return "unregistered";
    }
    return "";
}

}
