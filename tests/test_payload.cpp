#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include "bacgate/payload.hpp"
using namespace bacgate;

TEST_CASE("Topics follow the auto-discovery layout") {
    CHECK(unique_id_for(7) == "bacnet_7");
    CHECK(discovery_topic("homeassistant", "bacnet_7") == "homeassistant/sensor/bacnet_7/config");
    CHECK(state_topic("homeassistant", "bacnet_7") == "homeassistant/sensor/bacnet_7/state");
    CHECK(status_topic("bacnet") == "bacnet/status");
    CHECK(command_topic("bacnet", "discover") == "bacnet/command/discover");
}

TEST_CASE("Discovery config carries device identity") {
    const DiscoveryConfig c = make_discovery_config("homeassistant", 42, 260);
    auto j = nlohmann::json::parse(serialize(c));

    CHECK(j["name"] == "BACnet Device 42");
    CHECK(j["unique_id"] == "bacnet_42");
    CHECK(j["state_topic"] == "homeassistant/sensor/bacnet_42/state");
    CHECK(j["device"]["identifiers"] == nlohmann::json::array({"bacnet_42"}));
    CHECK(j["device"]["name"] == "BACnet Device 42");
    CHECK(j["device"]["manufacturer"] == "Vendor ID 260");
    CHECK(j["device"]["model"] == "Generic BACnet Device");
    CHECK_FALSE(j.contains("command_topic"));
}

TEST_CASE("command_topic is written only when set") {
    DiscoveryConfig c = make_discovery_config("ha", 1, 5);
    CHECK_FALSE(nlohmann::json::parse(serialize(c)).contains("command_topic"));

    c.command_topic = "ha/sensor/bacnet_1/set";
    const auto j = nlohmann::json::parse(serialize(c));
    REQUIRE(j.contains("command_topic"));
    CHECK(j["command_topic"] == "ha/sensor/bacnet_1/set");
    CHECK(j["unique_id"] == "bacnet_1");
    CHECK(j.size() == 5);
}
