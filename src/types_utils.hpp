#pragma once

#include "mdns_session/types.hpp"
#include <mdns.h>

#include <arpa/inet.h>

#include <cstring>
#include <string_view>
#include <vector>

namespace mdns_session
{

// The mdns_record_t views below point into the strings of the record they were made from,
// which therefore has to outlive them.

inline mdns_string_t Convert(std::string_view str) {
    return mdns_string_t{str.data(), str.size()};
}

inline mdns_record_t Convert(const DomainNamePointerRecord& record)
{
    // PTR record reverse mapping "<_service-name>._tcp.local." to
    // "<instance>.<_service-name>._tcp.local."
    mdns_record_t recordOut;
    std::memset(&recordOut, 0, sizeof(recordOut));
    recordOut.name = Convert(record.header.entry_string);
    recordOut.type = MDNS_RECORDTYPE_PTR;
    recordOut.data.ptr.name = Convert(record.name_string);

    recordOut.rclass = record.header.rclass;
    recordOut.ttl = record.header.ttl;
    return recordOut;
}

inline mdns_record_t Convert(const ServiceRecord& record)
{
    // SRV record mapping "<instance>.<_service-name>._tcp.local." to
    // "<hostname>.local." with port
    mdns_record_t recordOut;
    std::memset(&recordOut, 0, sizeof(recordOut));
    recordOut.name = Convert(record.header.entry_string);
    recordOut.type = MDNS_RECORDTYPE_SRV;
    recordOut.data.srv.name = Convert(record.target);
    recordOut.data.srv.port = record.port;
    recordOut.data.srv.priority = record.priority;
    recordOut.data.srv.weight = record.weight;

    recordOut.rclass = record.header.rclass;
    recordOut.ttl = record.header.ttl;
    return recordOut;
}

inline mdns_record_t Convert(const ARecord& record)
{
    mdns_record_t recordOut;
    std::memset(&recordOut, 0, sizeof(recordOut));
    recordOut.name = Convert(record.header.entry_string);
    recordOut.type = MDNS_RECORDTYPE_A;
    recordOut.data.a.addr.sin_family = AF_INET;
    inet_pton(AF_INET, record.address_string.c_str(), &recordOut.data.a.addr.sin_addr);

    recordOut.rclass = record.header.rclass;
    recordOut.ttl = record.header.ttl;
    return recordOut;
}

inline mdns_record_t Convert(const AAAARecord& record)
{
    mdns_record_t recordOut;
    std::memset(&recordOut, 0, sizeof(recordOut));
    recordOut.name = Convert(record.header.entry_string);
    recordOut.type = MDNS_RECORDTYPE_AAAA;
    recordOut.data.aaaa.addr.sin6_family = AF_INET6;
    inet_pton(AF_INET6, record.address_string.c_str(), &recordOut.data.aaaa.addr.sin6_addr);

    recordOut.rclass = record.header.rclass;
    recordOut.ttl = record.header.ttl;
    return recordOut;
}

// One entry per key, coalesced into a single TXT record by the library.
// The library writes every entry as "key=value" and has no way to express the zero-length
// string of an empty TXT record, so an empty map yields no entries and no TXT record is sent.
inline std::vector<mdns_record_t> Convert(const TXTRecord& recordIn)
{
    std::vector<mdns_record_t> recordsOut;
    for (const auto& txtpair : recordIn.txt) {
        mdns_record_t rec;
        std::memset(&rec, 0, sizeof(rec));
        rec.name = Convert(recordIn.header.entry_string);
        rec.type = MDNS_RECORDTYPE_TXT;
        rec.data.txt.key = Convert(txtpair.first);
        rec.data.txt.value = Convert(txtpair.second);
        rec.rclass = recordIn.header.rclass;
        rec.ttl = recordIn.header.ttl;
        recordsOut.push_back(rec);
    }
    return recordsOut;
}

}
