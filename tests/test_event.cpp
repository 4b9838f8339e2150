#include <doctest/doctest.h>
#include <cstdlib>
#include <limits>
#include "bacgate/event.hpp"
#include "fakes.hpp"
using namespace bacgate;
using bacgate::test::addr;

TEST_CASE("format_value prints the shortest text that reads back") {
    CHECK(format_value(24.5f) == "24.5");
    CHECK(format_value(100.0f) == "100");
    CHECK(format_value(0.1f) == "0.1");
    CHECK(format_value(-3.25f) == "-3.25");
    CHECK(format_value(0.0f) == "0");
    CHECK(format_value(21.7f) == "21.7");
}

TEST_CASE("format_value never switches to exponent notation") {
    CHECK(format_value(1e10f) == "10000000000");
    CHECK(format_value(-2e9f) == "-2000000000");
    CHECK(format_value(0.0001f) == "0.0001");

    const std::string huge = format_value(std::numeric_limits<float>::max());
    CHECK(huge.find('e') == std::string::npos);
    CHECK(huge.size() == 39);

    const std::string tiny = format_value(1e-30f);
    CHECK(tiny.find('e') == std::string::npos);
    CHECK(std::strtof(tiny.c_str(), nullptr) == 1e-30f);
}

TEST_CASE("to_hex is lowercase without separators") {
    CHECK(to_hex({0x3E, 0x41, 0xC4, 0x00, 0x00}) == "3e41c40000");
    CHECK(to_hex({}).empty());
}

TEST_CASE("describe renders one key=value line per event") {
    IAm a;
    a.device = ObjectIdentifier(ObjectType::Device, 42);
    a.vendor_id = 260;
    const auto ev = BacnetEvent::make_i_am(a, addr(192, 168, 1, 10));
    CHECK(describe(ev) ==
          "event=i_am device=42 vendor=260 max_apdu=1476 segmentation=none source=192.168.1.10:47808");

    ReadPropertyAck ack;
    ack.object = ObjectIdentifier(ObjectType::AnalogInput, 0);
    ack.value = PropertyValue::real(24.5f);
    const auto rd = BacnetEvent::make_read_ack(ack, 7, addr(10, 0, 0, 5, 47809));
    CHECK(describe(rd) ==
          "event=read_property_ack invoke=7 object=0:0 property=85 tag=4 value=24.5 source=10.0.0.5:47809");

    const auto to = BacnetEvent::make_timeout(9, SERVICE_READ_PROPERTY,
                                              ObjectIdentifier(ObjectType::AnalogInput, 0),
                                              PROP_PRESENT_VALUE, addr(10, 0, 0, 6));
    CHECK(to.kind == EventKind::RequestTimeout);
    CHECK(describe(to) ==
          "event=request_timeout invoke=9 service=12 object=0:0 property=85 source=10.0.0.6:47808");

    const auto who = BacnetEvent::make_who_is(WhoIs{}, addr(10, 0, 0, 7));
    CHECK(describe(who) == "event=who_is range=all source=10.0.0.7:47808");
}

TEST_CASE("Non-REAL ACK values are described as hex") {
    ReadPropertyAck ack;
    ack.object = ObjectIdentifier(ObjectType::BinaryInput, 2);
    ack.value.app_tag = 9;
    ack.value.raw = {0x91, 0x01};
    const auto ev = BacnetEvent::make_read_ack(ack, 1, addr(10, 0, 0, 1));
    CHECK(describe(ev) ==
          "event=read_property_ack invoke=1 object=3:2 property=85 tag=9 raw=9101 source=10.0.0.1:47808");
}
