#include <doctest/doctest.h>
#include <vector>
#include "bacgate/transport/transport_bip.hpp"
using namespace bacgate;
using namespace bacgate::transport;

using Bytes = std::vector<uint8_t>;

static BipAddress udp_from(uint32_t ip, uint16_t port) {
    BipAddress a;
    a.ip = ip;
    a.port = port;
    return a;
}

TEST_CASE("BVLC wrap prepends type, function and total length") {
    const Bytes npdu{0x01, 0x00, 0x10, 0x08};
    const Bytes d = bvlc_wrap(BVLC_ORIGINAL_BROADCAST, npdu);
    CHECK(d == Bytes{0x81, 0x0B, 0x00, 0x08, 0x01, 0x00, 0x10, 0x08});

    Frame f;
    const BipAddress from = udp_from(0xC0A8010A, 47808);
    REQUIRE(bvlc_unwrap(d.data(), d.size(), from, f) == TransportError::None);
    CHECK(f.npdu == npdu);
    CHECK(f.source == from);
}

TEST_CASE("Original-Unicast keeps the UDP source") {
    const Bytes d = bvlc_wrap(BVLC_ORIGINAL_UNICAST, {0x01, 0x04});
    Frame f;
    const BipAddress from = udp_from(0x0A000002, 47809);
    REQUIRE(bvlc_unwrap(d.data(), d.size(), from, f) == TransportError::None);
    CHECK(f.source.to_string() == "10.0.0.2:47809");
}

TEST_CASE("Forwarded-NPDU reports the originating device address") {
    const Bytes d{0x81, 0x04, 0x00, 0x0C,
                  0xC0, 0xA8, 0x02, 0x05, 0xBA, 0xC0,
                  0x01, 0x00};
    Frame f;
    REQUIRE(bvlc_unwrap(d.data(), d.size(), udp_from(0x0A000001, 47808), f) == TransportError::None);
    CHECK(f.source.to_string() == "192.168.2.5:47808");
    CHECK(f.npdu == Bytes{0x01, 0x00});
}

TEST_CASE("Datagrams that are not plain B/IP NPDUs are foreign") {
    Frame f;
    const BipAddress from = udp_from(1, 1);

    const Bytes wrong_type{0x82, 0x0A, 0x00, 0x06, 0x01, 0x00};
    CHECK(bvlc_unwrap(wrong_type.data(), wrong_type.size(), from, f) == TransportError::Foreign);

    const Bytes bad_length{0x81, 0x0A, 0x00, 0x09, 0x01, 0x00};
    CHECK(bvlc_unwrap(bad_length.data(), bad_length.size(), from, f) == TransportError::Foreign);

    const Bytes bvlc_result{0x81, 0x00, 0x00, 0x06, 0x00, 0x00};
    CHECK(bvlc_unwrap(bvlc_result.data(), bvlc_result.size(), from, f) == TransportError::Foreign);

    const Bytes short_forward{0x81, 0x04, 0x00, 0x06, 0xC0, 0xA8};
    CHECK(bvlc_unwrap(short_forward.data(), short_forward.size(), from, f) == TransportError::Foreign);

    const Bytes tiny{0x81, 0x0A};
    CHECK(bvlc_unwrap(tiny.data(), tiny.size(), from, f) == TransportError::Foreign);
}

TEST_CASE("Closed datalink refuses to send or receive") {
    BipDatalink link;
    CHECK_FALSE(link.is_open());
    CHECK(link.send_broadcast({0x01, 0x00}) == TransportError::NotOpen);
    CHECK(link.send_unicast({0x01, 0x00}, udp_from(0x7F000001, 47808)) == TransportError::NotOpen);
    Frame f;
    CHECK(link.receive_frame(f, std::chrono::milliseconds(1)) == TransportError::NotOpen);
}

TEST_CASE("Loopback datalinks exchange frames and interrupt wakes a receiver") {
    BipConfig a_cfg;
    a_cfg.bind = udp_from(0x7F000001, 0);
    a_cfg.broadcast = udp_from(0x7F000001, 0);
    BipDatalink a;
    REQUIRE(a.begin(a_cfg) == TransportError::None);

    BipConfig b_cfg = a_cfg;
    BipDatalink b;
    REQUIRE(b.begin(b_cfg) == TransportError::None);
    REQUIRE(b.local_address().port != 0);

    const Bytes npdu{0x01, 0x04, 0x02, 0x05, 0x01, 0x0C};
    REQUIRE(a.send_unicast(npdu, b.local_address()) == TransportError::None);

    Frame f;
    REQUIRE(b.receive_frame(f, std::chrono::milliseconds(2000)) == TransportError::None);
    CHECK(f.npdu == npdu);
    CHECK(f.source.port == a.local_address().port);

    CHECK(b.receive_frame(f, std::chrono::milliseconds(20)) == TransportError::Timeout);

    CHECK(b.send_unicast(Bytes(BIP_MAX_NPDU + 1, 0), a.local_address()) == TransportError::Oversize);

    b.interrupt();
    CHECK(b.receive_frame(f, std::chrono::milliseconds(2000)) == TransportError::Cancelled);
    CHECK(b.receive_frame(f, std::chrono::milliseconds(2000)) == TransportError::Cancelled);
}
