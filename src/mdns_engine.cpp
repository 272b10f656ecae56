#include "mdns_session/mdns_engine.hpp"
#include "mdns_session/errors.hpp"
#include "mdns_session/log.hpp"
#include "mdns_utils.hpp"
#include "packet_parser.hpp"
#include "record_cache.hpp"
#include "types_utils.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>
#include <variant>

#include <sys/select.h>

#include <fmt/format.h>

namespace mdns_session
{

namespace
{

using Clock = std::chrono::steady_clock;

constexpr auto kSelectTimeout = std::chrono::milliseconds(100);
constexpr auto kInitialQueryInterval = std::chrono::seconds(1);
constexpr auto kMaxQueryInterval = std::chrono::seconds(3600);
constexpr auto kResolveInterval = std::chrono::seconds(1);
constexpr auto kProbeInterval = std::chrono::milliseconds(250);
constexpr int kProbeCount = 3;
// Offsets from the end of probing, RFC 6762 section 8.3
constexpr std::array<std::chrono::seconds, 3> kAnnounceOffsets{std::chrono::seconds(0), std::chrono::seconds(1), std::chrono::seconds(3)};

constexpr std::uint32_t kHostRecordTtl = 120;
constexpr std::uint32_t kOtherRecordTtl = 4500;
constexpr auto kReannounceInterval = std::chrono::seconds(kHostRecordTtl * 8 / 10);

constexpr std::size_t kReceiveBufferSize = 9000;
constexpr std::size_t kSendBufferSize = 4096;
constexpr int kMaxDatagramsPerWakeup = 64;

constexpr char kDnsSdMetaQuery[] = "_services._dns-sd._udp.local.";

std::string Describe(const Record& record)
{
	std::ostringstream os;
	os << record;
	return os.str();
}

}

struct SubscribeCommand
{
	SubscriptionId id;
	std::string service_type;
	std::uint64_t generation;
	RecordSink sink;
};

struct UnsubscribeCommand
{
	SubscriptionId id;
};

struct RegisterCommand
{
	RegistrationId id;
	AdvertiseRequest request;
	StatusSink sink;
};

struct UnregisterCommand
{
	RegistrationId id;
};

using Command = std::variant<SubscribeCommand, UnsubscribeCommand, RegisterCommand, UnregisterCommand>;

struct Subscription
{
	std::string service_type;
	std::uint64_t generation{0};
	RecordSink sink;
	Clock::time_point next_query;
	Clock::duration query_interval{kInitialQueryInterval};
};

struct Registration
{
	std::string service_type;
	std::string full_name;
	std::uint16_t port{0};
	StatusSink sink;

	RegistrationState state{RegistrationState::Pending};
	int probes_sent{0};
	std::size_t announces_sent{0};
	Clock::time_point probing_done;
	Clock::time_point next_action;

	DomainNamePointerRecord record_ptr;
	DomainNamePointerRecord record_meta;
	ServiceRecord record_service;
	ARecord record_a;
	AAAARecord record_aaaa;
	TXTRecord record_txt;

	// Views for the mdns lib into the records above
	mdns_record_t mdns_ptr;
	mdns_record_t mdns_meta;
	mdns_record_t mdns_srv;
	mdns_record_t mdns_a;
	mdns_record_t mdns_aaaa;
	std::vector<mdns_record_t> mdns_txt;
};

// Everything the worker thread touches. Shared with the thread so that a detached
// worker can still finish on its own after a timed out Shutdown.
class EngineWorker
{
private:
	EngineSettings m_settings;
	std::string m_hostnameQualified;
	LocalAddresses m_local;
	std::vector<int> m_sockets;

	std::atomic<bool> m_running{false};

	std::mutex m_commandMutex;
	std::vector<Command> m_commands;

	std::mutex m_doneMutex;
	std::condition_variable m_doneCondition;
	bool m_done{false};

	// Worker thread only from here on
	RecordCache m_cache;
	std::map<SubscriptionId, Subscription> m_subscriptions;
	std::map<RegistrationId, std::unique_ptr<Registration>> m_registrations;
	std::map<std::string, Clock::time_point> m_lastQuery;
	std::vector<char> m_receiveBuffer;
	std::array<char, kSendBufferSize> m_sendBuffer;

public:
	EngineWorker(EngineSettings settings, std::string hostnameQualified)
	: m_settings(std::move(settings))
	, m_hostnameQualified(std::move(hostnameQualified))
	, m_receiveBuffer(kReceiveBufferSize)
	{}

	~EngineWorker()
	{
		CloseSockets();
	}

	// Throws Error(EngineUnavailable) when nothing could be bound, Error(MulticastBlocked)
	// when sockets bound but none could join the mDNS group.
	void OpenSockets(const std::string& context)
	{
		m_local = FindLocalAddresses(m_settings.interface_address);
		if (m_local.pinned && !m_local.has_ipv4 && !m_local.has_ipv6) {
			Log(LogLevel::Error, fmt::format("No local interface has address {}.", m_settings.interface_address));
			throw Error(ErrorCode::EngineUnavailable, context, fmt::format("no local interface has address {}", m_settings.interface_address));
		}

		std::size_t bound = 0;
		const auto keep = [this, &bound](SocketOpenResult result) {
			if (result.sock < 0) {
				return;
			}
			++bound;
			if (result.joined) {
				m_sockets.push_back(result.sock);
			} else {
				close(result.sock);
			}
		};

		if (!m_local.pinned || m_local.has_ipv4) {
			keep(OpenServiceSocketIPv4(m_local, m_settings.multicast_loopback));
		}
		if (m_settings.enable_ipv6 && (!m_local.pinned || m_local.has_ipv6)) {
			keep(OpenServiceSocketIPv6(m_local, m_settings.multicast_loopback));
		}

		if (bound == 0) {
			Log(LogLevel::Error, "Failed to open any mDNS sockets.");
			throw Error(ErrorCode::EngineUnavailable, context, fmt::format("could not bind UDP port {}", MDNS_PORT));
		}
		if (m_sockets.empty()) {
			Log(LogLevel::Error, "Failed to join the mDNS multicast group on any socket.");
			throw Error(ErrorCode::MulticastBlocked, context, "could not join the mDNS multicast group, inbound multicast may be blocked on this device");
		}

		const auto num_sockets = m_sockets.size();
		Log(LogLevel::Info, fmt::format("Opened {} socket{} for mDNS engine, hostname {}.", num_sockets, num_sockets > 1 ? "s" : "", m_hostnameQualified));
		m_running.store(true, std::memory_order_release);
	}

	void Post(Command command)
	{
		std::lock_guard<std::mutex> lock(m_commandMutex);
		m_commands.push_back(std::move(command));
	}

	void RequestStop()
	{
		m_running.store(false, std::memory_order_release);
	}

	[[nodiscard]] bool Running() const
	{
		return m_running.load(std::memory_order_acquire);
	}

	bool WaitDone(std::chrono::milliseconds timeout)
	{
		std::unique_lock<std::mutex> lock(m_doneMutex);
		return m_doneCondition.wait_for(lock, timeout, [this]() { return m_done; });
	}

	void Run()
	{
		while (m_running.load(std::memory_order_acquire)) {
			DrainCommands();

			int nfds = 0;
			fd_set readfs;
			FD_ZERO(&readfs);
			for (const auto& sock : m_sockets) {
				if (sock >= nfds)
					nfds = sock + 1;
				FD_SET(sock, &readfs);
			}

			struct timeval timeout;
			timeout.tv_sec = 0;
			timeout.tv_usec = std::chrono::duration_cast<std::chrono::microseconds>(kSelectTimeout).count();

			const int ready = select(nfds, &readfs, nullptr, nullptr, &timeout);
			if (ready < 0) {
				if (errno == EINTR) {
					continue;
				}
				Log(LogLevel::Error, fmt::format("mDNS engine select failed: {}", std::strerror(errno)));
				break;
			}
			if (ready > 0) {
				for (const auto& sock : m_sockets) {
					if (FD_ISSET(sock, &readfs)) {
						ReceiveAll(sock);
					}
				}
			}

			const auto now = Clock::now();
			RunQueries(now);
			RunCacheMaintenance(now);
			RunRegistrations(now);
		}

		Teardown();
	}

private:
	void CloseSockets()
	{
		for (const auto& socket : m_sockets) {
			mdns_socket_close(socket);
		}
		m_sockets.clear();
	}

	void Teardown()
	{
		m_running.store(false, std::memory_order_release);
		DrainCommands();

		for (auto& [id, registration] : m_registrations) {
			if (registration->state == RegistrationState::Registered) {
				SendGoodbye(*registration);
			}
			PushStatus(*registration, RegistrationState::Unregistered, std::nullopt, "engine stopped");
		}
		m_registrations.clear();
		m_subscriptions.clear();
		CloseSockets();

		Log(LogLevel::Info, "mDNS engine stopped.");
		{
			std::lock_guard<std::mutex> lock(m_doneMutex);
			m_done = true;
		}
		m_doneCondition.notify_all();
	}

	void DrainCommands()
	{
		std::vector<Command> commands;
		{
			std::lock_guard<std::mutex> lock(m_commandMutex);
			commands.swap(m_commands);
		}
		for (auto& command : commands) {
			std::visit([this](auto& c) { Handle(c); }, command);
		}
	}

	void Handle(SubscribeCommand& command)
	{
		const auto now = Clock::now();
		Subscription subscription;
		subscription.service_type = command.service_type;
		subscription.generation = command.generation;
		subscription.sink = std::move(command.sink);
		subscription.next_query = now;

		Log(LogLevel::Info, fmt::format("Browsing {} (generation {}).", subscription.service_type, subscription.generation));

		RecordBatch replay{subscription.generation, m_cache.Snapshot(subscription.service_type, now)};
		if (!replay.records.empty()) {
			Log(LogLevel::Debug, fmt::format("Replaying {} cached records for {}.", replay.records.size(), subscription.service_type));
			Push(subscription, std::move(replay));
		}
		m_subscriptions[command.id] = std::move(subscription);
	}

	void Handle(UnsubscribeCommand& command)
	{
		const auto it = m_subscriptions.find(command.id);
		if (it == m_subscriptions.end()) {
			return;
		}
		Log(LogLevel::Info, fmt::format("Stopped browsing {} (generation {}).", it->second.service_type, it->second.generation));
		m_subscriptions.erase(it);
	}

	void Handle(RegisterCommand& command)
	{
		auto registration = std::make_unique<Registration>();
		registration->service_type = command.request.service_type;
		registration->full_name = MakeFullName(command.request.instance_name, registration->service_type);
		registration->port = command.request.port;
		registration->sink = std::move(command.sink);
		registration->next_action = Clock::now();
		SetupRecords(*registration, command.request);

		Log(LogLevel::Info, fmt::format("Registering {} port {}, probing.", registration->full_name, registration->port));
		m_registrations[command.id] = std::move(registration);
	}

	void Handle(UnregisterCommand& command)
	{
		const auto it = m_registrations.find(command.id);
		if (it == m_registrations.end()) {
			return;
		}
		auto& registration = *it->second;
		if (registration.state == RegistrationState::Registered) {
			SendGoodbye(registration);
		}
		PushStatus(registration, RegistrationState::Unregistered, std::nullopt, "unregistered");
		Log(LogLevel::Info, fmt::format("Unregistered {}.", registration.full_name));
		m_registrations.erase(it);
	}

	void SetupRecords(Registration& registration, const AdvertiseRequest& request)
	{
		const std::uint16_t rclass_shared = MDNS_CLASS_IN;
		const std::uint16_t rclass_unique = MDNS_CLASS_IN | MDNS_CACHE_FLUSH;

		// PTR record "<_service-name>._tcp.local." -> "<instance>.<_service-name>._tcp.local."
		registration.record_ptr.header.entry_string = registration.service_type;
		registration.record_ptr.header.rclass = rclass_shared;
		registration.record_ptr.header.ttl = kOtherRecordTtl;
		registration.record_ptr.name_string = registration.full_name;

		// DNS-SD service type enumeration
		registration.record_meta.header.entry_string = kDnsSdMetaQuery;
		registration.record_meta.header.rclass = rclass_shared;
		registration.record_meta.header.ttl = kOtherRecordTtl;
		registration.record_meta.name_string = registration.service_type;

		// SRV record
		registration.record_service.header.entry_string = registration.full_name;
		registration.record_service.header.rclass = rclass_unique;
		registration.record_service.header.ttl = kHostRecordTtl;
		registration.record_service.target = m_hostnameQualified;
		registration.record_service.port = registration.port;

		// A/AAAA record
		registration.record_a.header.entry_string = m_hostnameQualified;
		registration.record_a.header.rclass = rclass_unique;
		registration.record_a.header.ttl = kHostRecordTtl;
		registration.record_a.address_string = IPV4AddressToString(&m_local.address_ipv4, sizeof(struct sockaddr_in));

		registration.record_aaaa.header.entry_string = m_hostnameQualified;
		registration.record_aaaa.header.rclass = rclass_unique;
		registration.record_aaaa.header.ttl = kHostRecordTtl;
		registration.record_aaaa.address_string = IPV6AddressToString(&m_local.address_ipv6, sizeof(struct sockaddr_in6));

		// TXT record
		registration.record_txt.header.entry_string = registration.full_name;
		registration.record_txt.header.rclass = rclass_unique;
		registration.record_txt.header.ttl = kOtherRecordTtl;
		registration.record_txt.txt = request.txt;

		// create data structs for calls to the mdns lib
		registration.mdns_ptr = Convert(registration.record_ptr);
		registration.mdns_meta = Convert(registration.record_meta);
		registration.mdns_srv = Convert(registration.record_service);
		registration.mdns_a = Convert(registration.record_a);
		registration.mdns_a.data.a.addr = m_local.address_ipv4;
		registration.mdns_aaaa = Convert(registration.record_aaaa);
		registration.mdns_aaaa.data.aaaa.addr = m_local.address_ipv6;
		registration.mdns_txt = Convert(registration.record_txt);
	}

	void PushStatus(Registration& registration, RegistrationState state, std::optional<ErrorCode> error, std::string message)
	{
		registration.state = state;
		if (!registration.sink) {
			return;
		}
		if (!registration.sink->Push(RegistrationStatus{state, error, std::move(message)})) {
			Log(LogLevel::Warn, fmt::format("Status queue of {} is full, {} not delivered.", registration.full_name, ToString(state)));
		}
	}

	void Push(Subscription& subscription, RecordBatch batch)
	{
		if (batch.records.empty()) {
			return;
		}
		if (subscription.sink->Overflowed()) {
			return;
		}
		if (!subscription.sink->Push(std::move(batch))) {
			Log(LogLevel::Warn, fmt::format("Event queue of {} overflowed after {} batches.", subscription.service_type, subscription.sink->Capacity()));
		}
	}

	void ReceiveAll(int sock)
	{
		for (int i = 0; i < kMaxDatagramsPerWakeup; ++i) {
			struct sockaddr_storage from;
			socklen_t addrlen = sizeof(from);
			const ssize_t received = recvfrom(sock, m_receiveBuffer.data(), m_receiveBuffer.size(), 0, (struct sockaddr*)&from, &addrlen);
			if (received < 0) {
				if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
					Log(LogLevel::Debug, fmt::format("recvfrom failed: {}", std::strerror(errno)));
				}
				return;
			}

			const auto sender = IPAddressToString((const struct sockaddr*)&from, addrlen);
			const auto packet = ParsePacket(m_receiveBuffer.data(), static_cast<std::size_t>(received), sender);
			if (packet) {
				HandlePacket(sock, *packet, from, addrlen);
			}
		}
	}

	void HandlePacket(int sock, const ParsedPacket& packet, const struct sockaddr_storage& from, socklen_t addrlen)
	{
		if (!packet.is_response) {
			for (const auto& question : packet.questions) {
				Answer(sock, question, packet.query_id, from, addrlen);
			}
			return;
		}

		const auto now = Clock::now();
		std::vector<Record> changed;
		for (const auto& record : packet.records) {
			Log(LogLevel::Debug, Describe(record));
			CheckConflict(record);
			if (!ShouldCache(record)) {
				continue;
			}
			auto result = m_cache.Insert(record, now);
			changed.insert(changed.end(), std::make_move_iterator(result.begin()), std::make_move_iterator(result.end()));
		}

		Deliver(changed, now);
		ResolveMissing(changed, now);
	}

	[[nodiscard]] bool ShouldCache(const Record& record) const
	{
		if (std::holds_alternative<AnyRecord>(record)) {
			return false;
		}
		// Addresses may arrive before the SRV that makes them relevant
		if (std::holds_alternative<ARecord>(record) || std::holds_alternative<AAAARecord>(record)) {
			return true;
		}
		for (const auto& [id, subscription] : m_subscriptions) {
			if (m_cache.IsRelevant(record, subscription.service_type)) {
				return true;
			}
		}
		return false;
	}

	void Deliver(const std::vector<Record>& records, Clock::time_point now)
	{
		if (records.empty()) {
			return;
		}
		for (auto& [id, subscription] : m_subscriptions) {
			Push(subscription, RecordBatch{subscription.generation, m_cache.BatchFor(records, subscription.service_type, now)});
		}
	}

	// Asks for the SRV/TXT of instances we only know by PTR and the addresses of targets we cannot reach
	void ResolveMissing(const std::vector<Record>& records, Clock::time_point now)
	{
		for (const auto& record : records) {
			if (GetHeader(record).ttl == 0) {
				continue;
			}
			if (const auto* ptr = std::get_if<DomainNamePointerRecord>(&record)) {
				if (IsBrowsed(record) && !m_cache.HasService(ptr->name_string)) {
					SendQuery(ptr->name_string, RecordType::SRV, now);
					SendQuery(ptr->name_string, RecordType::TXT, now);
				}
			} else if (const auto* srv = std::get_if<ServiceRecord>(&record)) {
				if (IsBrowsed(record) && !m_cache.HasAddresses(srv->target)) {
					SendQuery(srv->target, RecordType::A, now);
					if (m_settings.enable_ipv6) {
						SendQuery(srv->target, RecordType::AAAA, now);
					}
				}
			}
		}
	}

	[[nodiscard]] bool IsBrowsed(const Record& record) const
	{
		for (const auto& [id, subscription] : m_subscriptions) {
			if (m_cache.IsRelevant(record, subscription.service_type)) {
				return true;
			}
		}
		return false;
	}

	// At most one query per name and type per second
	void SendQuery(const std::string& name, RecordType type, Clock::time_point now)
	{
		const auto key = fmt::format("{}|{}", ToLower(name), ToString(type));
		const auto it = m_lastQuery.find(key);
		if (it != m_lastQuery.end() && now - it->second < kResolveInterval) {
			return;
		}
		m_lastQuery[key] = now;

		Log(LogLevel::Debug, fmt::format("Query {} {}", ToString(type), name));
		for (const auto& sock : m_sockets) {
			if (mdns_query_send(sock, static_cast<mdns_record_type_t>(type), name.data(), name.size(), m_sendBuffer.data(), m_sendBuffer.size(), 0) < 0) {
				Log(LogLevel::Debug, fmt::format("Failed to send {} query for {}: {}", ToString(type), name, std::strerror(errno)));
			}
		}
	}

	void RunQueries(Clock::time_point now)
	{
		for (auto& [id, subscription] : m_subscriptions) {
			if (now < subscription.next_query) {
				continue;
			}
			SendQuery(subscription.service_type, RecordType::PTR, now);
			subscription.next_query = now + subscription.query_interval;
			subscription.query_interval = std::min<Clock::duration>(subscription.query_interval * 2, kMaxQueryInterval);
		}
	}

	void RunCacheMaintenance(Clock::time_point now)
	{
		const auto expired = m_cache.Expire(now);
		for (const auto& record : expired) {
			Log(LogLevel::Debug, fmt::format("Expired {}", Describe(record)));
		}
		Deliver(expired, now);

		for (const auto& record : m_cache.DueRefreshes(now)) {
			if (IsBrowsed(record)) {
				const auto& header = GetHeader(record);
				SendQuery(header.entry_string, static_cast<RecordType>(header.record_type), now);
			}
		}

		for (auto it = m_lastQuery.begin(); it != m_lastQuery.end();) {
			if (now - it->second > kResolveInterval) {
				it = m_lastQuery.erase(it);
			} else {
				++it;
			}
		}
	}

	void RunRegistrations(Clock::time_point now)
	{
		for (auto& [id, registration] : m_registrations) {
			if (now < registration->next_action) {
				continue;
			}

			if (registration->state == RegistrationState::Pending) {
				if (registration->probes_sent < kProbeCount) {
					SendProbe(*registration);
					++registration->probes_sent;
					registration->next_action = now + kProbeInterval;
					continue;
				}
				PushStatus(*registration, RegistrationState::Registered, std::nullopt, "registered");
				Log(LogLevel::Info, fmt::format("Registered {}.", registration->full_name));
				registration->probing_done = now;
				registration->announces_sent = 0;
			}

			if (registration->state == RegistrationState::Registered) {
				SendAnnounce(*registration);
				++registration->announces_sent;
				if (registration->announces_sent < kAnnounceOffsets.size()) {
					registration->next_action = registration->probing_done + kAnnounceOffsets[registration->announces_sent];
				} else {
					registration->next_action = now + kReannounceInterval;
				}
			}
		}
	}

	// A peer answering for a name we are still probing owns it, unless it is our own data echoed back
	void CheckConflict(const Record& record)
	{
		const auto* srv = std::get_if<ServiceRecord>(&record);
		if (!srv || srv->header.ttl == 0) {
			return;
		}
		for (auto& [id, registration] : m_registrations) {
			if (registration->state != RegistrationState::Pending) {
				continue;
			}
			if (!EqualsIgnoreCase(srv->header.entry_string, registration->full_name)) {
				continue;
			}
			if (EqualsIgnoreCase(srv->target, m_hostnameQualified) && srv->port == registration->port) {
				continue;
			}
			Log(LogLevel::Warn, fmt::format("Name conflict for {}: already served by {} port {}.", registration->full_name, srv->target, srv->port));
			PushStatus(*registration, RegistrationState::Failed, ErrorCode::NameConflict,
				fmt::format("{} is already in use by {}", registration->full_name, srv->target));
		}
	}

	std::vector<mdns_record_t> ServiceAdditional(const Registration& registration, bool with_srv) const
	{
		std::vector<mdns_record_t> additional;
		if (with_srv) {
			additional.push_back(registration.mdns_srv);
		}
		if (m_local.has_ipv4) {
			additional.push_back(registration.mdns_a);
		}
		if (m_local.has_ipv6) {
			additional.push_back(registration.mdns_aaaa);
		}
		// TXT entries are coalesced into one record by the library
		additional.insert(additional.end(), registration.mdns_txt.begin(), registration.mdns_txt.end());
		return additional;
	}

	void SendProbe(const Registration& registration)
	{
		Log(LogLevel::Debug, fmt::format("Probe {} ({}/{})", registration.full_name, registration.probes_sent + 1, kProbeCount));
		for (const auto& sock : m_sockets) {
			if (mdns_query_send(sock, MDNS_RECORDTYPE_ANY, registration.full_name.data(), registration.full_name.size(), m_sendBuffer.data(), m_sendBuffer.size(), 0) < 0) {
				Log(LogLevel::Debug, fmt::format("Failed to send probe for {}: {}", registration.full_name, std::strerror(errno)));
			}
		}
	}

	void SendAnnounce(Registration& registration)
	{
		Log(LogLevel::Debug, fmt::format("Announce {}", registration.full_name));
		const auto additional = ServiceAdditional(registration, true);
		for (const auto& socket : m_sockets) {
			if (mdns_announce_multicast(socket, m_sendBuffer.data(), m_sendBuffer.size(), registration.mdns_ptr, nullptr, 0, additional.data(), additional.size()) < 0) {
				Log(LogLevel::Debug, fmt::format("Failed to announce {}: {}", registration.full_name, std::strerror(errno)));
			}
		}
	}

	void SendGoodbye(Registration& registration)
	{
		Log(LogLevel::Info, fmt::format("mDNS engine sending goodbye for {}.", registration.full_name));
		auto answer = registration.mdns_ptr;
		answer.ttl = 0;
		auto additional = ServiceAdditional(registration, true);
		for (auto& record : additional) {
			record.ttl = 0;
		}
		for (const auto& socket : m_sockets) {
			if (mdns_goodbye_multicast(socket, m_sendBuffer.data(), m_sendBuffer.size(), answer, nullptr, 0, additional.data(), additional.size()) < 0) {
				Log(LogLevel::Debug, fmt::format("Failed to send goodbye for {}: {}", registration.full_name, std::strerror(errno)));
			}
		}
	}

	void SendAnswer(int sock, const Question& question, std::uint16_t query_id, const struct sockaddr_storage& from, socklen_t addrlen,
	                const mdns_record_t& answer, const std::vector<mdns_record_t>& additional)
	{
		// Send the answer, unicast or multicast depending on flag in query
		Log(LogLevel::Debug, fmt::format("  --> answer {} {} ({})", ToString(static_cast<RecordType>(question.record_type)), question.name, question.unicast_response ? "unicast" : "multicast"));
		int result = 0;
		if (question.unicast_response) {
			result = mdns_query_answer_unicast(sock, &from, addrlen, m_sendBuffer.data(), m_sendBuffer.size(),
			                                   query_id, static_cast<mdns_record_type_t>(question.record_type), question.name.data(), question.name.size(),
			                                   answer, nullptr, 0, additional.data(), additional.size());
		} else {
			result = mdns_query_answer_multicast(sock, m_sendBuffer.data(), m_sendBuffer.size(), answer, nullptr, 0,
			                                     additional.data(), additional.size());
		}
		if (result < 0) {
			Log(LogLevel::Debug, fmt::format("Failed to answer {}: {}", question.name, std::strerror(errno)));
		}
	}

	void Answer(int sock, const Question& question, std::uint16_t query_id, const struct sockaddr_storage& from, socklen_t addrlen)
	{
		const auto rtype = static_cast<RecordType>(question.record_type);
		const bool any = rtype == RecordType::ANY;
		const Registration* host_owner = nullptr;

		for (auto& [id, entry] : m_registrations) {
			const Registration& registration = *entry;
			if (registration.state != RegistrationState::Registered) {
				continue;
			}
			if (!host_owner) {
				host_owner = &registration;
			}

			if (EqualsIgnoreCase(question.name, kDnsSdMetaQuery)) {
				if (rtype == RecordType::PTR || any) {
					// "_services._dns-sd._udp.local." -> "<_service-name>._tcp.local."
					SendAnswer(sock, question, query_id, from, addrlen, registration.mdns_meta, {});
				}
			} else if (EqualsIgnoreCase(question.name, registration.service_type)) {
				if (rtype == RecordType::PTR || any) {
					SendAnswer(sock, question, query_id, from, addrlen, registration.mdns_ptr, ServiceAdditional(registration, true));
				}
			} else if (EqualsIgnoreCase(question.name, registration.full_name)) {
				if (rtype == RecordType::SRV || rtype == RecordType::TXT || any) {
					SendAnswer(sock, question, query_id, from, addrlen, registration.mdns_srv, ServiceAdditional(registration, false));
				}
			}
		}

		if (!host_owner || !EqualsIgnoreCase(question.name, m_hostnameQualified)) {
			return;
		}
		if ((rtype == RecordType::A || any) && m_local.has_ipv4) {
			std::vector<mdns_record_t> additional;
			if (m_local.has_ipv6) {
				additional.push_back(host_owner->mdns_aaaa);
			}
			SendAnswer(sock, question, query_id, from, addrlen, host_owner->mdns_a, additional);
		} else if ((rtype == RecordType::AAAA || any) && m_local.has_ipv6) {
			std::vector<mdns_record_t> additional;
			if (m_local.has_ipv4) {
				additional.push_back(host_owner->mdns_a);
			}
			SendAnswer(sock, question, query_id, from, addrlen, host_owner->mdns_aaaa, additional);
		}
	}
};

class MdnsEngine::EngineImpl
{
private:
	EngineSettings m_settings;
	std::string m_hostnameQualified;

	mutable std::mutex m_mutex;
	std::shared_ptr<EngineWorker> m_worker;
	std::thread m_listenThread;

	SubscriptionId m_nextSubscription{1};
	RegistrationId m_nextRegistration{1};
	std::map<RegistrationId, std::string> m_registeredNames; // lower-case full names

public:
	EngineImpl(EngineSettings settings)
	: m_settings(std::move(settings))
	{
		const auto hostname = m_settings.hostname.empty() ? GetLocalHostname() : m_settings.hostname;
		m_hostnameQualified = fmt::format("{}.local.", hostname);
	}

	~EngineImpl()
	{
		Shutdown();
	}

	SubscriptionId Subscribe(const std::string& service_type, std::uint64_t generation, RecordSink sink)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		EnsureStarted(fmt::format("Subscribe({})", service_type));
		const auto id = m_nextSubscription++;
		m_worker->Post(SubscribeCommand{id, service_type, generation, std::move(sink)});
		return id;
	}

	void Unsubscribe(SubscriptionId id)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_worker) {
			m_worker->Post(UnsubscribeCommand{id});
		}
	}

	RegistrationId Register(const AdvertiseRequest& request, StatusSink sink)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		const auto full_name = MakeFullName(request.instance_name, request.service_type);
		const auto context = fmt::format("Register({})", full_name);
		const auto key = ToLower(full_name);
		for (const auto& [id, name] : m_registeredNames) {
			if (name == key) {
				Log(LogLevel::Warn, fmt::format("{} is already registered by this engine.", full_name));
				throw Error(ErrorCode::NameConflict, context, "name already registered by this engine");
			}
		}

		EnsureStarted(context);
		const auto id = m_nextRegistration++;
		m_registeredNames[id] = key;
		m_worker->Post(RegisterCommand{id, request, std::move(sink)});
		return id;
	}

	void Unregister(RegistrationId id)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_registeredNames.erase(id);
		if (m_worker) {
			m_worker->Post(UnregisterCommand{id});
		}
	}

	void Shutdown()
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		StopWorker();
	}

	[[nodiscard]] bool Running() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_worker && m_worker->Running();
	}

	[[nodiscard]] const std::string& QualifiedHostname() const
	{
		return m_hostnameQualified;
	}

private:
	void EnsureStarted(const std::string& context)
	{
		if (m_worker && m_worker->Running()) {
			return;
		}
		if (m_worker) {
			Log(LogLevel::Warn, "mDNS engine worker died, restarting it.");
			StopWorker();
		}

		Log(LogLevel::Debug, "mDNS engine start called.");
		auto worker = std::make_shared<EngineWorker>(m_settings, m_hostnameQualified);
		worker->OpenSockets(context);

		try {
			m_listenThread = std::thread([worker]() {
				worker->Run();
			});
		} catch (const std::system_error& e) {
			Log(LogLevel::Error, fmt::format("Failed to start mDNS worker thread: {}", e.what()));
			throw Error(ErrorCode::EngineUnavailable, context, fmt::format("could not start worker thread: {}", e.what()));
		}
		m_worker = std::move(worker);
	}

	void StopWorker()
	{
		if (!m_worker) {
			return;
		}

		Log(LogLevel::Info, "mDNS engine stopping.");
		m_worker->RequestStop();
		if (m_listenThread.joinable()) {
			if (m_worker->WaitDone(m_settings.teardown_timeout)) {
				m_listenThread.join();
			} else {
				Log(LogLevel::Warn, fmt::format("mDNS worker did not stop within {} ms, detaching it.", m_settings.teardown_timeout.count()));
				m_listenThread.detach();
			}
		}
		m_worker.reset();
		m_registeredNames.clear();
	}
};

MdnsEngine::MdnsEngine(EngineSettings settings)
: m_impl(std::make_unique<EngineImpl>(std::move(settings)))
{}

MdnsEngine::~MdnsEngine() = default;

SubscriptionId MdnsEngine::Subscribe(const std::string& service_type, std::uint64_t generation, RecordSink sink)
{
	return m_impl->Subscribe(service_type, generation, std::move(sink));
}

void MdnsEngine::Unsubscribe(SubscriptionId id)
{
	m_impl->Unsubscribe(id);
}

RegistrationId MdnsEngine::Register(const AdvertiseRequest& request, StatusSink sink)
{
	return m_impl->Register(request, std::move(sink));
}

void MdnsEngine::Unregister(RegistrationId id)
{
	m_impl->Unregister(id);
}

void MdnsEngine::Shutdown()
{
	m_impl->Shutdown();
}

bool MdnsEngine::Running() const
{
	return m_impl->Running();
}

std::string MdnsEngine::QualifiedHostname() const
{
	return m_impl->QualifiedHostname();
}

}
