#include "response_decoder.hpp"
#include "address_utils.hpp"
#include "log.hpp"
#include "types_utils.hpp"

#include "mdns.h"

#include <array>
#include <utility>

#include <fmt/core.h>

namespace mdns_client
{

namespace
{

constexpr std::size_t kHeaderSize = 12;
constexpr std::uint16_t kFlagResponse = 0x8000;

enum class Section {
    Answer,
    Authority,
    Additional
};

std::uint16_t ReadUint16(const std::uint8_t* data, std::size_t offset)
{
    return static_cast<std::uint16_t>((data[offset] << 8) | data[offset + 1]);
}

// Expands the (possibly compressed) name at `offset` and moves `offset` past it
bool ReadName(const void* data, std::size_t size, std::size_t& offset, std::string& nameOut)
{
    size_t cursor = offset;
    if (!mdns_string_skip(data, size, &cursor)) {
        return false;
    }

    std::array<char, 256> namebuffer;
    size_t extractOffset = offset;
    const mdns_string_t name = mdns_string_extract(data, size, &extractOffset, namebuffer.data(), namebuffer.size());
    nameOut = std::string(NormalizeName(std::string_view(name.str, name.length)));
    offset = cursor;
    return true;
}

bool ReadRecords(const void* data, std::size_t size, std::size_t& offset, std::size_t count,
                 Section section, Response& response)
{
    const auto* bytes = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < count; ++i) {
        std::string name;
        if (!ReadName(data, size, offset, name)) {
            return false;
        }
        // type, class, ttl, rdata length
        if (offset + 10 > size) {
            return false;
        }
        const std::uint16_t rtype = ReadUint16(bytes, offset);
        const std::size_t length = ReadUint16(bytes, offset + 8);
        offset += 10;
        if (offset + length > size) {
            return false;
        }
        const std::size_t recordOffset = offset;
        offset += length;

        if (section == Section::Authority) {
            continue;
        }

        if (rtype == MDNS_RECORDTYPE_SRV) {
            // priority, weight, port and a target of at least one label.
            // A bare root target means the service is not available.
            if (length < 8) {
                continue;
            }
            size_t targetOffset = recordOffset + 6;
            if (!mdns_string_skip(data, size, &targetOffset)) {
                return false;
            }

            std::array<char, 256> namebuffer;
            const mdns_record_srv_t srv = mdns_record_parse_srv(data, size, recordOffset, length,
                                                                namebuffer.data(), namebuffer.size());
            SrvAnswer answer;
            answer.name = std::move(name);
            // Lowercased so differently cased answers for one host share a registry key
            answer.target = ToLowerAscii(NormalizeName(std::string_view(srv.name.str, srv.name.length)));
            answer.port = srv.port;
            response.srv_records.push_back(std::move(answer));
        } else if (rtype == MDNS_RECORDTYPE_A) {
            if (length != 4) {
                return false;
            }
            struct sockaddr_in addr;
            mdns_record_parse_a(data, size, recordOffset, length, &addr);
            addr.sin_port = 0;

            AAnswer answer;
            answer.name = std::move(name);
            answer.address = IPV4AddressToString(addr);
            response.a_records.push_back(std::move(answer));
        }
    }
    return true;
}

bool SrvNameMatches(std::string_view name, std::string_view service_name, MatchPolicy policy)
{
    switch (policy) {
        case MatchPolicy::Exact: return NamesEqual(name, service_name);
        case MatchPolicy::Contains: return NameContains(name, service_name);
    }
    return false;
}

}

std::optional<Response> DecodeResponse(const void* data, std::size_t size)
{
    if (data == nullptr || size < kHeaderSize) {
        return std::nullopt;
    }

    const auto* bytes = static_cast<const std::uint8_t*>(data);
    const std::uint16_t flags = ReadUint16(bytes, 2);
    const std::size_t questions = ReadUint16(bytes, 4);
    const std::size_t answers = ReadUint16(bytes, 6);
    const std::size_t authorities = ReadUint16(bytes, 8);
    const std::size_t additionals = ReadUint16(bytes, 10);

    Response response;
    response.is_query = (flags & kFlagResponse) == 0;

    std::size_t offset = kHeaderSize;
    for (std::size_t i = 0; i < questions; ++i) {
        size_t nameEnd = offset;
        if (!mdns_string_skip(data, size, &nameEnd) || nameEnd + 4 > size) {
            return std::nullopt;
        }
        offset = nameEnd + 4;
    }

    if (!ReadRecords(data, size, offset, answers, Section::Answer, response)
        || !ReadRecords(data, size, offset, authorities, Section::Authority, response)
        || !ReadRecords(data, size, offset, additionals, Section::Additional, response)) {
        return std::nullopt;
    }
    return response;
}

bool ApplyResponse(const Response& response, std::string_view service_name, MatchPolicy policy,
                   Registry& registry, Clock::time_point now)
{
    if (response.is_query) {
        return false;
    }
    if (response.srv_records.empty() && response.a_records.empty()) {
        return false;
    }

    bool touched = false;
    std::vector<Service> added;
    registry.Apply([&](ServiceMap& services) {
        for (const auto& srv : response.srv_records) {
            if (SrvNameMatches(srv.name, service_name, policy)) {
                Service service{srv.target, srv.port};
                if (Registry::Upsert(services, service, now)) {
                    added.push_back(std::move(service));
                }
                touched = true;
            }
        }
        // After the SRV records, so an A record in the same packet finds its host
        for (const auto& a : response.a_records) {
            if (Registry::AddAddress(services, a.name, a.address) > 0) {
                touched = true;
            }
        }
    });

    for (const auto& service : added) {
        Log(LogLevel::Info, fmt::format("Discovered {} for {}", ToString(service), service_name));
    }
    return touched;
}

}
