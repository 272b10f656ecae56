#pragma once

#include <mdns.h>

#include "mdns_session/log.hpp"
#include "mdns_session/types.hpp"

#include <string>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <fmt/core.h>

namespace mdns_session
{

inline EntryType ParseEntryType(mdns_entry_type_t entry_type) {
	switch (entry_type) {
		case MDNS_ENTRYTYPE_QUESTION : return EntryType::QUESTION;
		case MDNS_ENTRYTYPE_ANSWER : return EntryType::ANSWER;
		case MDNS_ENTRYTYPE_AUTHORITY : return EntryType::AUTHORITY;
		case MDNS_ENTRYTYPE_ADDITIONAL : return EntryType::ADDITIONAL;
	}
	return EntryType::UNKNOWN;
}

inline std::string IPV4AddressToString(const sockaddr_in *addr, size_t addrlen) {
	char host[NI_MAXHOST] = {0};
	char service[NI_MAXSERV] = {0};
	const int ret = getnameinfo((const struct sockaddr *)addr, (socklen_t)addrlen, host, NI_MAXHOST, service, NI_MAXSERV, NI_NUMERICSERV | NI_NUMERICHOST);
	if (ret == 0) {
		if (addr->sin_port != 0) {
			return fmt::format("{}:{}", host, service);
		} else {
			return fmt::format("{}", host);
		}
	}
	return "";
}

inline std::string IPV6AddressToString(const sockaddr_in6 *addr, size_t addrlen) {
	char host[NI_MAXHOST] = {0};
	char service[NI_MAXSERV] = {0};
	const int ret = getnameinfo((const struct sockaddr *)addr, (socklen_t)addrlen, host, NI_MAXHOST, service, NI_MAXSERV, NI_NUMERICSERV | NI_NUMERICHOST);
	if (ret == 0) {
		if (addr->sin6_port != 0) {
			return fmt::format("[{}]:{}", host, service);
		} else {
			return fmt::format("{}", host);
		}
	}
	return "";
}

inline std::string IPAddressToString(const sockaddr *addr, size_t addrlen) {
	if (addr->sa_family == AF_INET6) {
		return IPV6AddressToString((const struct sockaddr_in6 *)addr, addrlen);
	}
	return IPV4AddressToString((const struct sockaddr_in *)addr, addrlen);
}

// The address of each family the responder advertises in its A/AAAA records
struct LocalAddresses {
	bool pinned{false};
	bool has_ipv4{false};
	bool has_ipv6{false};
	struct sockaddr_in address_ipv4;
	struct sockaddr_in6 address_ipv6;
	unsigned int interface_index_ipv6{0}; // only set when pinned
};

// Picks the first usable address of each family. With a pinned address only that address
// (and so only its family) is taken. Loopback is used when nothing else is up.
inline LocalAddresses FindLocalAddresses(const std::string& pinned_address) {
	LocalAddresses local;
	std::memset(&local.address_ipv4, 0, sizeof(local.address_ipv4));
	std::memset(&local.address_ipv6, 0, sizeof(local.address_ipv6));
	local.pinned = !pinned_address.empty();

	struct ifaddrs* ifaddr = nullptr;
	if (getifaddrs(&ifaddr) < 0) {
		Log(LogLevel::Warn, "Unable to get interface addresses");
		return local;
	}

	bool loopback_ipv4 = false;
	struct sockaddr_in fallback_ipv4;
	std::memset(&fallback_ipv4, 0, sizeof(fallback_ipv4));

	for (struct ifaddrs* ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
		if (!ifa->ifa_addr)
			continue;
		if (!(ifa->ifa_flags & IFF_UP))
			continue;

		if (ifa->ifa_addr->sa_family == AF_INET) {
			const struct sockaddr_in* saddr = (const struct sockaddr_in*)ifa->ifa_addr;
			const auto address = IPV4AddressToString(saddr, sizeof(struct sockaddr_in));
			if (local.pinned) {
				if (address == pinned_address && !local.has_ipv4) {
					local.address_ipv4 = *saddr;
					local.has_ipv4 = true;
				}
				continue;
			}
			if ((ifa->ifa_flags & IFF_LOOPBACK) || saddr->sin_addr.s_addr == htonl(INADDR_LOOPBACK)) {
				if (!loopback_ipv4) {
					fallback_ipv4 = *saddr;
					loopback_ipv4 = true;
				}
				continue;
			}
			if (!(ifa->ifa_flags & IFF_MULTICAST) || (ifa->ifa_flags & IFF_POINTOPOINT))
				continue;
			if (!local.has_ipv4) {
				local.address_ipv4 = *saddr;
				local.has_ipv4 = true;
				Log(LogLevel::Debug, "Local IPv4 address: " + address);
			}
		} else if (ifa->ifa_addr->sa_family == AF_INET6) {
			const struct sockaddr_in6* saddr = (const struct sockaddr_in6*)ifa->ifa_addr;
			const auto address = IPV6AddressToString(saddr, sizeof(struct sockaddr_in6));
			if (local.pinned) {
				if (address == pinned_address && !local.has_ipv6) {
					local.address_ipv6 = *saddr;
					local.has_ipv6 = true;
					local.interface_index_ipv6 = if_nametoindex(ifa->ifa_name);
				}
				continue;
			}
			if ((ifa->ifa_flags & IFF_LOOPBACK) || !(ifa->ifa_flags & IFF_MULTICAST) || (ifa->ifa_flags & IFF_POINTOPOINT))
				continue;
			// Ignore link-local addresses
			if (saddr->sin6_scope_id)
				continue;
			const unsigned char localhost[] = {0, 0, 0, 0, 0, 0, 0, 0,
			                                   0, 0, 0, 0, 0, 0, 0, 1};
			const unsigned char localhost_mapped[] = {0, 0, 0,    0,    0,    0, 0, 0,
			                                          0, 0, 0xff, 0xff, 0x7f, 0, 0, 1};
			if (memcmp(saddr->sin6_addr.s6_addr, localhost, 16) &&
			    memcmp(saddr->sin6_addr.s6_addr, localhost_mapped, 16) &&
			    !local.has_ipv6) {
				local.address_ipv6 = *saddr;
				local.has_ipv6 = true;
				Log(LogLevel::Debug, "Local IPv6 address: " + address);
			}
		}
	}

	freeifaddrs(ifaddr);

	if (!local.pinned && !local.has_ipv4 && !local.has_ipv6 && loopback_ipv4) {
		Log(LogLevel::Warn, "No multicast capable interface is up, advertising the loopback address.");
		local.address_ipv4 = fallback_ipv4;
		local.has_ipv4 = true;
	}

	local.address_ipv4.sin_port = 0;
	local.address_ipv6.sin6_port = 0;
	return local;
}

struct SocketOpenResult {
	int sock{-1};
	bool joined{false};
};

template <typename T>
bool SetSocketOption(int sock, int level, int name, const T& value, const char* what) {
	if (setsockopt(sock, level, name, &value, sizeof(value)) < 0) {
		Log(LogLevel::Debug, fmt::format("setsockopt {} failed: {}", what, std::strerror(errno)));
		return false;
	}
	return true;
}

inline bool SetNonBlocking(int sock) {
	const int flags = fcntl(sock, F_GETFL, 0);
	return flags >= 0 && fcntl(sock, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Binds 0.0.0.0:5353 and joins 224.0.0.251. A bound socket whose join failed is still
// returned so the caller can tell a blocked group apart from a failed bind.
inline SocketOpenResult OpenServiceSocketIPv4(const LocalAddresses& local, bool loopback) {
	SocketOpenResult result;
	const int sock = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
	if (sock < 0) {
		Log(LogLevel::Warn, fmt::format("Failed to create IPv4 socket: {}", std::strerror(errno)));
		return result;
	}

	const int yes = 1;
	SetSocketOption(sock, SOL_SOCKET, SO_REUSEADDR, yes, "SO_REUSEADDR");
#ifdef SO_REUSEPORT
	SetSocketOption(sock, SOL_SOCKET, SO_REUSEPORT, yes, "SO_REUSEPORT");
#endif
	const unsigned char ttl = 255;
	const unsigned char loop = loopback ? 1 : 0;
	SetSocketOption(sock, IPPROTO_IP, IP_MULTICAST_TTL, ttl, "IP_MULTICAST_TTL");
	SetSocketOption(sock, IPPROTO_IP, IP_MULTICAST_LOOP, loop, "IP_MULTICAST_LOOP");

	struct sockaddr_in saddr;
	std::memset(&saddr, 0, sizeof(saddr));
	saddr.sin_family = AF_INET;
	saddr.sin_addr.s_addr = INADDR_ANY;
	saddr.sin_port = htons(MDNS_PORT);
	if (bind(sock, (const struct sockaddr*)&saddr, sizeof(saddr)) < 0) {
		Log(LogLevel::Warn, fmt::format("Failed to bind IPv4 socket to port {}: {}", MDNS_PORT, std::strerror(errno)));
		close(sock);
		return result;
	}

	struct ip_mreq req;
	std::memset(&req, 0, sizeof(req));
	req.imr_multiaddr.s_addr = htonl((((uint32_t)224U) << 24U) | ((uint32_t)251U));
	req.imr_interface.s_addr = local.pinned ? local.address_ipv4.sin_addr.s_addr : INADDR_ANY;
	result.joined = SetSocketOption(sock, IPPROTO_IP, IP_ADD_MEMBERSHIP, req, "IP_ADD_MEMBERSHIP");
	if (local.pinned) {
		SetSocketOption(sock, IPPROTO_IP, IP_MULTICAST_IF, local.address_ipv4.sin_addr, "IP_MULTICAST_IF");
	}

	if (!SetNonBlocking(sock)) {
		Log(LogLevel::Warn, "Failed to make IPv4 socket non-blocking");
		close(sock);
		return result;
	}

	result.sock = sock;
	return result;
}

// Binds [::]:5353 and joins ff02::fb
inline SocketOpenResult OpenServiceSocketIPv6(const LocalAddresses& local, bool loopback) {
	SocketOpenResult result;
	const int sock = socket(AF_INET6, SOCK_DGRAM, IPPROTO_UDP);
	if (sock < 0) {
		Log(LogLevel::Warn, fmt::format("Failed to create IPv6 socket: {}", std::strerror(errno)));
		return result;
	}

	const int yes = 1;
	SetSocketOption(sock, SOL_SOCKET, SO_REUSEADDR, yes, "SO_REUSEADDR");
#ifdef SO_REUSEPORT
	SetSocketOption(sock, SOL_SOCKET, SO_REUSEPORT, yes, "SO_REUSEPORT");
#endif
	SetSocketOption(sock, IPPROTO_IPV6, IPV6_V6ONLY, yes, "IPV6_V6ONLY");
	const int hops = 255;
	const unsigned int loop = loopback ? 1 : 0;
	SetSocketOption(sock, IPPROTO_IPV6, IPV6_MULTICAST_HOPS, hops, "IPV6_MULTICAST_HOPS");
	SetSocketOption(sock, IPPROTO_IPV6, IPV6_MULTICAST_LOOP, loop, "IPV6_MULTICAST_LOOP");

	struct sockaddr_in6 saddr;
	std::memset(&saddr, 0, sizeof(saddr));
	saddr.sin6_family = AF_INET6;
	saddr.sin6_addr = in6addr_any;
	saddr.sin6_port = htons(MDNS_PORT);
	if (bind(sock, (const struct sockaddr*)&saddr, sizeof(saddr)) < 0) {
		Log(LogLevel::Warn, fmt::format("Failed to bind IPv6 socket to port {}: {}", MDNS_PORT, std::strerror(errno)));
		close(sock);
		return result;
	}

	struct ipv6_mreq req;
	std::memset(&req, 0, sizeof(req));
	req.ipv6mr_multiaddr.s6_addr[0] = 0xFF;
	req.ipv6mr_multiaddr.s6_addr[1] = 0x02;
	req.ipv6mr_multiaddr.s6_addr[15] = 0xFB;
	req.ipv6mr_interface = local.interface_index_ipv6;
	result.joined = SetSocketOption(sock, IPPROTO_IPV6, IPV6_JOIN_GROUP, req, "IPV6_JOIN_GROUP");
	if (local.pinned && local.interface_index_ipv6 != 0) {
		SetSocketOption(sock, IPPROTO_IPV6, IPV6_MULTICAST_IF, local.interface_index_ipv6, "IPV6_MULTICAST_IF");
	}

	if (!SetNonBlocking(sock)) {
		Log(LogLevel::Warn, "Failed to make IPv6 socket non-blocking");
		close(sock);
		return result;
	}

	result.sock = sock;
	return result;
}

}
