#pragma once

#include "mdns_session/errors.hpp"
#include "mdns_session/txt_codec.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mdns_session
{

// Validates "_<service>._<tcp|udp>.local." and returns its canonical (lower-case) form.
// Throws Error(InvalidServiceType); a missing trailing dot is rejected, not repaired.
std::string NormalizeServiceType(std::string_view service_type);
[[nodiscard]] bool IsValidServiceType(std::string_view service_type);

// Throws Error(InvalidInstanceName)
void ValidateInstanceName(std::string_view instance_name);

// "<instance>.<_service-name>._tcp.local."
std::string MakeFullName(std::string_view instance_name, std::string_view service_type);

// Returns the instance label when full_name is "<instance>.<service_type>", empty otherwise
std::string ExtractInstanceName(std::string_view full_name, std::string_view service_type);

std::string ToLower(std::string_view string);
[[nodiscard]] bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs);
[[nodiscard]] bool EndsWithIgnoreCase(std::string_view string, std::string_view suffix);

// IPv4 before IPv6, each family in lexical order, duplicates removed
void SortAddresses(std::vector<std::string>& addresses);

// Bare host label of this machine, "unknown-host" if it cannot be read
std::string GetLocalHostname();


enum class ServiceState {
    Partial,
    Resolved,
    Removed
};
std::string ToString(ServiceState state);

struct DiscoveredService
{
    std::string instance_name; // "Game Server A"
    std::string full_name; // "Game Server A._mygame._tcp.local."
    std::string hostname; // "marks-pc.local."
    std::vector<std::string> addresses;
    std::uint16_t port{0};
    TxtMap txt;
    ServiceState state{ServiceState::Partial};
};
bool operator==(const DiscoveredService& lhs, const DiscoveredService& rhs);
bool operator!=(const DiscoveredService& lhs, const DiscoveredService& rhs);

enum class ServiceEventKind {
    Discovered,
    Updated,
    Removed
};
std::string ToString(ServiceEventKind kind);

struct ServiceEvent
{
    ServiceEventKind kind{ServiceEventKind::Discovered};
    DiscoveredService service;
};


struct AdvertiseRequest
{
    std::string instance_name;
    std::string service_type{"_http._tcp.local."};
    std::uint16_t port{0};
    TxtMap txt;
};

enum class RegistrationState {
    Pending,
    Registered,
    Failed,
    Unregistered
};
std::string ToString(RegistrationState state);

struct RegistrationStatus
{
    RegistrationState state{RegistrationState::Pending};
    std::optional<ErrorCode> error; // set when state is Failed
    std::string message;
};

}
