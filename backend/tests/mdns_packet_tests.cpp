#include <gtest/gtest.h>
#include "discovery/MdnsPacket.hpp"
#include <algorithm>
#include <initializer_list>
#include <string>
#include <vector>

using namespace keylightd;
namespace mdns = keylightd::mdns;

namespace {

// Hand assembles DNS messages, including compression pointers.
class PacketWriter {
public:
    std::size_t offset() const { return buf.size(); }

    void u8(uint8_t v) { buf.push_back(v); }
    void u16(uint16_t v) { u8(static_cast<uint8_t>(v >> 8)); u8(static_cast<uint8_t>(v & 0xFF)); }
    void u32(uint32_t v) { u16(static_cast<uint16_t>(v >> 16)); u16(static_cast<uint16_t>(v & 0xFFFF)); }
    void label(const std::string& s) {
        u8(static_cast<uint8_t>(s.size()));
        buf.insert(buf.end(), s.begin(), s.end());
    }
    void labels(std::initializer_list<std::string> parts) {
        for (const auto& p : parts) label(p);
        u8(0);
    }
    void pointer(std::size_t target) { u16(static_cast<uint16_t>(0xC000 | target)); }

    void header(uint16_t qd, uint16_t an, uint16_t ar) {
        u16(0); u16(0x8400); u16(qd); u16(an); u16(0); u16(ar);
    }
    // Writes type/class/ttl and a placeholder rdlength; returns where rdata starts.
    std::size_t begin_rr(uint16_t type, uint16_t cls = mdns::CLASS_IN) {
        u16(type); u16(cls); u32(120); u16(0);
        return offset();
    }
    void end_rr(std::size_t rdata) {
        const std::size_t len = offset() - rdata;
        buf[rdata - 2] = static_cast<uint8_t>(len >> 8);
        buf[rdata - 1] = static_cast<uint8_t>(len & 0xFF);
    }

    std::vector<uint8_t> buf;
};

// PTR + SRV + TXT (+ A) for one light, compressed against the question.
std::vector<uint8_t> key_light_response(bool with_txt, bool with_a) {
    PacketWriter w;
    w.header(1, 1, static_cast<uint16_t>(1 + (with_txt ? 1 : 0) + (with_a ? 1 : 0)));

    const std::size_t service = w.offset();          // _elg._tcp.local
    w.labels({"_elg", "_tcp", "local"});
    const std::size_t local = service + 1 + 4 + 1 + 4; // "local" label
    w.u16(mdns::TYPE_PTR); w.u16(mdns::CLASS_IN);

    w.pointer(service);
    std::size_t rd = w.begin_rr(mdns::TYPE_PTR);
    const std::size_t instance = w.offset();
    w.label("Elgato Key Light 1A2B");
    w.pointer(service);
    w.end_rr(rd);

    w.pointer(instance);
    rd = w.begin_rr(mdns::TYPE_SRV, 0x8001);
    w.u16(0); w.u16(0); w.u16(9123);
    const std::size_t target = w.offset();
    w.label("keylight-1a2b");
    w.pointer(local);
    w.end_rr(rd);

    if (with_txt) {
        w.pointer(instance);
        rd = w.begin_rr(mdns::TYPE_TXT, 0x8001);
        w.label("mf=Elgato");
        w.label("id=3C:6A:9D:14:1A:2B");
        w.label("md=Elgato Key Light 20GAK9901");
        w.end_rr(rd);
    }
    if (with_a) {
        w.pointer(target);
        rd = w.begin_rr(mdns::TYPE_A, 0x8001);
        w.u8(10); w.u8(0); w.u8(0); w.u8(5);
        w.end_rr(rd);
    }
    return w.buf;
}

} // namespace

TEST(MdnsPacket, QueryAsksForPtrWithUnicastBit) {
    auto q = mdns::build_query("_elg._tcp.local.", 7);
    ASSERT_GE(q.size(), 12u + 17u + 4u);
    EXPECT_EQ(q[0], 0);
    EXPECT_EQ(q[1], 7);
    EXPECT_EQ(q[5], 1); // qdcount
    const std::vector<uint8_t> name = {4, '_', 'e', 'l', 'g', 4, '_', 't', 'c', 'p', 5, 'l', 'o', 'c', 'a', 'l', 0};
    EXPECT_TRUE(std::equal(name.begin(), name.end(), q.begin() + 12));
    const std::size_t n = q.size();
    EXPECT_EQ(q[n - 4], 0);
    EXPECT_EQ(q[n - 3], mdns::TYPE_PTR);
    EXPECT_EQ(q[n - 2], 0x80);
    EXPECT_EQ(q[n - 1], 0x01);

    auto parsed = mdns::parse(q.data(), q.size());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed->is_response);
    EXPECT_EQ(parsed->id, 7);
}

TEST(MdnsPacket, ParsesCompressedResponse) {
    auto bytes = key_light_response(true, true);
    auto msg = mdns::parse(bytes.data(), bytes.size());
    ASSERT_TRUE(msg.has_value());
    EXPECT_TRUE(msg->is_response);

    const std::string instance = "elgato key light 1a2b._elg._tcp.local";
    ASSERT_EQ(msg->ptr.count("_elg._tcp.local"), 1u);
    EXPECT_EQ(msg->ptr.find("_elg._tcp.local")->second, instance);
    ASSERT_EQ(msg->srv.count(instance), 1u);
    EXPECT_EQ(msg->srv.at(instance).target, "keylight-1a2b.local");
    EXPECT_EQ(msg->srv.at(instance).port, 9123);
    EXPECT_EQ(msg->txt.at(instance).at("id"), "3C:6A:9D:14:1A:2B");
    EXPECT_EQ(msg->a.at("keylight-1a2b.local"), "10.0.0.5");

    auto obs = mdns::to_observations(*msg, "_elg._tcp.local", "192.168.1.50");
    ASSERT_EQ(obs.size(), 1u);
    EXPECT_EQ(obs[0].id, "3c:6a:9d:14:1a:2b");
    EXPECT_EQ(obs[0].address, (Address{"10.0.0.5", 9123}));
    EXPECT_EQ(obs[0].model, "Elgato Key Light 20GAK9901");
    EXPECT_EQ(obs[0].name, "elgato key light 1a2b");
    EXPECT_EQ(obs[0].source, "mdns");
}

TEST(MdnsPacket, SenderAddressWhenNoARecord) {
    auto bytes = key_light_response(true, false);
    auto msg = mdns::parse(bytes.data(), bytes.size());
    ASSERT_TRUE(msg.has_value());
    auto obs = mdns::to_observations(*msg, "_elg._tcp.local", "192.168.1.50");
    ASSERT_EQ(obs.size(), 1u);
    EXPECT_EQ(obs[0].address.host, "192.168.1.50");
    EXPECT_EQ(obs[0].address.port, 9123);
}

TEST(MdnsPacket, InstanceLabelIsIdWithoutTxt) {
    auto bytes = key_light_response(false, true);
    auto msg = mdns::parse(bytes.data(), bytes.size());
    ASSERT_TRUE(msg.has_value());
    auto obs = mdns::to_observations(*msg, "_elg._tcp.local", "");
    ASSERT_EQ(obs.size(), 1u);
    EXPECT_EQ(obs[0].id, "elgatokeylight1a2b");
}

TEST(MdnsPacket, OtherServicesAreIgnored) {
    auto bytes = key_light_response(true, true);
    auto msg = mdns::parse(bytes.data(), bytes.size());
    ASSERT_TRUE(msg.has_value());
    EXPECT_TRUE(mdns::to_observations(*msg, "_hap._tcp.local", "10.0.0.1").empty());
}

TEST(MdnsPacket, RejectsTruncatedPackets) {
    auto bytes = key_light_response(true, true);
    for (std::size_t cut : {std::size_t(5), std::size_t(20), bytes.size() - 3}) {
        EXPECT_FALSE(mdns::parse(bytes.data(), cut).has_value()) << "cut at " << cut;
    }
}

TEST(MdnsPacket, RejectsPointerLoops) {
    PacketWriter w;
    w.header(1, 0, 0);
    w.pointer(12); // question name points at itself
    w.u16(mdns::TYPE_PTR);
    w.u16(mdns::CLASS_IN);
    EXPECT_FALSE(mdns::parse(w.buf.data(), w.buf.size()).has_value());
}
