#include "response_decoder.hpp"
#include "packet_builder.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace std::chrono_literals;

namespace mdns_client
{

using test::PacketBuilder;
using test::Section;

namespace
{

const char* kServiceName = "Printer._http._tcp.local";

std::optional<Response> Decode(const std::vector<std::uint8_t>& packet)
{
    return DecodeResponse(packet.data(), packet.size());
}

}

TEST(ResponseDecoderTest, DecodesSrvAndARecords)
{
    const auto packet = PacketBuilder()
        .Srv(kServiceName, "printer1.local", 631)
        .A("printer1.local", "192.168.1.50")
        .Build();

    const auto response = Decode(packet);
    ASSERT_TRUE(response);
    EXPECT_FALSE(response->is_query);
    ASSERT_EQ(response->srv_records.size(), 1u);
    EXPECT_EQ(response->srv_records[0].name, kServiceName);
    EXPECT_EQ(response->srv_records[0].target, "printer1.local");
    EXPECT_EQ(response->srv_records[0].port, 631);
    ASSERT_EQ(response->a_records.size(), 1u);
    EXPECT_EQ(response->a_records[0].name, "printer1.local");
    EXPECT_EQ(response->a_records[0].address, "192.168.1.50");
}

TEST(ResponseDecoderTest, ReadsAdditionalButNotAuthoritySection)
{
    const auto packet = PacketBuilder()
        .Srv(kServiceName, "printer1.local", 631)
        .A("printer1.local", "10.0.0.1", Section::Authority)
        .A("printer1.local", "10.0.0.2", Section::Additional)
        .Build();

    const auto response = Decode(packet);
    ASSERT_TRUE(response);
    ASSERT_EQ(response->a_records.size(), 1u);
    EXPECT_EQ(response->a_records[0].address, "10.0.0.2");
}

TEST(ResponseDecoderTest, FollowsCompressedOwnerName)
{
    // Answer owner name points back at the question name at offset 12
    const auto packet = PacketBuilder()
        .Question(kServiceName, 33)
        .SrvWithOwner({0xC0, 0x0C}, "printer1.local", 631)
        .Build();

    const auto response = Decode(packet);
    ASSERT_TRUE(response);
    ASSERT_EQ(response->srv_records.size(), 1u);
    EXPECT_EQ(response->srv_records[0].name, kServiceName);
}

TEST(ResponseDecoderTest, FlagsQueries)
{
    const auto packet = PacketBuilder(false).Question(kServiceName, 33).Build();
    const auto response = Decode(packet);
    ASSERT_TRUE(response);
    EXPECT_TRUE(response->is_query);
}

TEST(ResponseDecoderTest, RejectsMalformedPackets)
{
    EXPECT_FALSE(DecodeResponse(nullptr, 0));

    const std::vector<std::uint8_t> shortHeader = {0x00, 0x00, 0x84, 0x00, 0x00};
    EXPECT_FALSE(Decode(shortHeader));

    auto packet = PacketBuilder()
        .Srv(kServiceName, "printer1.local", 631)
        .A("printer1.local", "192.168.1.50")
        .Build();
    packet.resize(packet.size() - 2);
    EXPECT_FALSE(Decode(packet));

    // Header claims an answer that is not there
    auto missing = PacketBuilder().Build();
    missing[7] = 1;
    EXPECT_FALSE(Decode(missing));

    // A record with a 3 byte address
    const auto badA = PacketBuilder()
        .Record({0x01, 'a', 0x00}, 1, {10, 0, 0})
        .Build();
    EXPECT_FALSE(Decode(badA));

    // Compression pointer past the end of the packet
    const auto badPointer = PacketBuilder()
        .SrvWithOwner({0xC0, 0xFF}, "printer1.local", 631)
        .Build();
    EXPECT_FALSE(Decode(badPointer));
}

TEST(ResponseDecoderTest, ApplyRegistersMatchingServiceWithAddress)
{
    Registry registry;
    const auto now = Clock::now();
    const auto response = Decode(PacketBuilder()
        .Srv(kServiceName, "printer1.local", 631)
        .A("printer1.local", "192.168.1.50")
        .Build());
    ASSERT_TRUE(response);

    EXPECT_TRUE(ApplyResponse(*response, kServiceName, MatchPolicy::Exact, registry, now));

    const auto services = registry.Snapshot();
    ASSERT_EQ(services.size(), 1u);
    EXPECT_EQ(services[0].first, (Service{"printer1.local", 631}));
    EXPECT_EQ(services[0].second.last_seen, now);
    EXPECT_EQ(services[0].second.addresses, (std::unordered_set<std::string>{"192.168.1.50"}));
}

TEST(ResponseDecoderTest, ApplyIgnoresQueries)
{
    Registry registry;
    auto packet = PacketBuilder(false)
        .Srv(kServiceName, "printer1.local", 631)
        .Build();
    const auto response = Decode(packet);
    ASSERT_TRUE(response);
    ASSERT_TRUE(response->is_query);

    EXPECT_FALSE(ApplyResponse(*response, kServiceName, MatchPolicy::Exact, registry, Clock::now()));
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(ResponseDecoderTest, ApplyIgnoresUnrelatedService)
{
    Registry registry;
    const auto response = Decode(PacketBuilder()
        .Srv("Scanner._http._tcp.local", "scanner.local", 80)
        .Srv("Printer._ipp._tcp.local", "printer1.local", 631)
        .Build());
    ASSERT_TRUE(response);

    EXPECT_FALSE(ApplyResponse(*response, kServiceName, MatchPolicy::Exact, registry, Clock::now()));
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(ResponseDecoderTest, ExactMatchIgnoresCaseAndTrailingDot)
{
    Registry registry;
    const auto response = Decode(PacketBuilder()
        .Srv("printer._HTTP._tcp.local", "printer1.local", 631)
        .Build());
    ASSERT_TRUE(response);

    EXPECT_TRUE(ApplyResponse(*response, "Printer._http._tcp.local.", MatchPolicy::Exact, registry, Clock::now()));
    EXPECT_EQ(registry.Size(), 1u);
}

TEST(ResponseDecoderTest, TargetCaseDoesNotSplitService)
{
    Registry registry;
    const auto now = Clock::now();
    const auto response = Decode(PacketBuilder()
        .Srv(kServiceName, "Printer1.local", 631)
        .Srv(kServiceName, "printer1.LOCAL.", 631)
        .A("PRINTER1.local", "192.168.1.50")
        .Build());
    ASSERT_TRUE(response);
    EXPECT_EQ(response->srv_records[0].target, "printer1.local");

    ApplyResponse(*response, kServiceName, MatchPolicy::Exact, registry, now);

    const auto services = registry.Snapshot();
    ASSERT_EQ(services.size(), 1u);
    EXPECT_EQ(services[0].first, (Service{"printer1.local", 631}));
    EXPECT_EQ(services[0].second.addresses, (std::unordered_set<std::string>{"192.168.1.50"}));
}

TEST(ResponseDecoderTest, ContainsPolicyMatchesInstanceNames)
{
    const auto response = Decode(PacketBuilder()
        .Srv("Printer._http._tcp.local", "printer1.local", 631)
        .Srv("Office._http._tcp.local", "office.local", 8080)
        .Srv("Scanner._scan._tcp.local", "scanner.local", 80)
        .Build());
    ASSERT_TRUE(response);

    Registry exact;
    ApplyResponse(*response, "_http._tcp.local", MatchPolicy::Exact, exact, Clock::now());
    EXPECT_EQ(exact.Size(), 0u);

    Registry contains;
    ApplyResponse(*response, "_http._tcp.local", MatchPolicy::Contains, contains, Clock::now());
    EXPECT_EQ(contains.Size(), 2u);
}

TEST(ResponseDecoderTest, ARecordAloneCreatesNothing)
{
    Registry registry;
    const auto response = Decode(PacketBuilder()
        .A("printer1.local", "192.168.1.50")
        .Build());
    ASSERT_TRUE(response);

    EXPECT_FALSE(ApplyResponse(*response, kServiceName, MatchPolicy::Exact, registry, Clock::now()));
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(ResponseDecoderTest, ARecordInLaterPacketIsAttributed)
{
    Registry registry;
    const auto now = Clock::now();
    const auto srv = Decode(PacketBuilder().Srv(kServiceName, "printer1.local", 631).Build());
    const auto a = Decode(PacketBuilder()
        .A("printer1.local", "192.168.1.50")
        .A("printer1.local", "192.168.1.51")
        .A("other.local", "192.168.1.60")
        .Build());
    ASSERT_TRUE(srv);
    ASSERT_TRUE(a);

    ApplyResponse(*srv, kServiceName, MatchPolicy::Exact, registry, now);
    EXPECT_TRUE(ApplyResponse(*a, kServiceName, MatchPolicy::Exact, registry, now + 1s));

    const auto services = registry.Snapshot();
    ASSERT_EQ(services.size(), 1u);
    EXPECT_EQ(services[0].second.addresses,
              (std::unordered_set<std::string>{"192.168.1.50", "192.168.1.51"}));
    // An A record alone does not confirm the service
    EXPECT_EQ(services[0].second.last_seen, now);
}

}
