#include <doctest/doctest.h>
#include "bacgate/address.hpp"
using namespace bacgate;

TEST_CASE("parse_address accepts host:port and falls back to the default port") {
    BipAddress a;
    REQUIRE(parse_address("10.0.0.5:47809", a));
    CHECK(a.ip == 0x0A000005u);
    CHECK(a.port == 47809);
    CHECK(a.to_string() == "10.0.0.5:47809");

    REQUIRE(parse_address("192.168.1.20", a));
    CHECK(a.port == BACNET_IP_PORT);
    CHECK(a.to_string() == "192.168.1.20:47808");

    REQUIRE(parse_address("0.0.0.0", a, 0));
    CHECK(a.port == 0);
}

TEST_CASE("parse_address rejects malformed text and leaves the output alone") {
    BipAddress a;
    a.ip = 1; a.port = 2;
    CHECK_FALSE(parse_address("", a));
    CHECK_FALSE(parse_address("10.0.0", a));
    CHECK_FALSE(parse_address("10.0.0.5.6", a));
    CHECK_FALSE(parse_address("10.0.0.256", a));
    CHECK_FALSE(parse_address("10.0.0.5:", a));
    CHECK_FALSE(parse_address("10.0.0.5:70000", a));
    CHECK_FALSE(parse_address("10.0.-1.5", a));
    CHECK_FALSE(parse_address("host.example:47808", a));
    CHECK(a.ip == 1);
    CHECK(a.port == 2);
}

TEST_CASE("B/IP six-byte form is big-endian ip then port") {
    BipAddress a;
    REQUIRE(parse_address("192.168.1.10:47808", a));
    uint8_t raw[6] = {};
    a.to_bip_bytes(raw);
    const uint8_t expect[6] = {0xC0, 0xA8, 0x01, 0x0A, 0xBA, 0xC0};
    for (int i = 0; i < 6; ++i) CHECK(raw[i] == expect[i]);
    CHECK(BipAddress::from_bip_bytes(raw) == a);
}

TEST_CASE("BipAddress ordering is by ip then port") {
    BipAddress a, b, c;
    REQUIRE(parse_address("10.0.0.1:5", a));
    REQUIRE(parse_address("10.0.0.1:6", b));
    REQUIRE(parse_address("10.0.0.2:1", c));
    CHECK(a < b);
    CHECK(b < c);
    CHECK_FALSE(c < a);
    CHECK(a != b);
}
