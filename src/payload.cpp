// ============================================================================
// payload.cpp — implementation for bacgate/payload.hpp
// ============================================================================

#include "bacgate/payload.hpp"

using nlohmann::json;

namespace bacgate {

void to_json(json& j, const DiscoveryDevice& d) {
    j = json{
        {"identifiers",  d.identifiers},
        {"name",         d.name},
        {"manufacturer", d.manufacturer},
        {"model",        d.model}
    };
}

void to_json(json& j, const DiscoveryConfig& c) {
    j = json{
        {"name",        c.name},
        {"state_topic", c.state_topic},
        {"unique_id",   c.unique_id},
        {"device",      c.device}
    };
    if (c.command_topic) j["command_topic"] = *c.command_topic;
}

std::string unique_id_for(uint32_t instance) {
    return "bacnet_" + std::to_string(instance);
}

std::string discovery_topic(const std::string& prefix, const std::string& unique_id) {
    return prefix + "/sensor/" + unique_id + "/config";
}

std::string state_topic(const std::string& prefix, const std::string& unique_id) {
    return prefix + "/sensor/" + unique_id + "/state";
}

std::string status_topic(const std::string& base_topic) {
    return base_topic + "/status";
}

std::string command_topic(const std::string& base_topic, const std::string& verb) {
    return base_topic + "/command/" + verb;
}

DiscoveryConfig make_discovery_config(const std::string& prefix, uint32_t instance, uint16_t vendor_id) {
    DiscoveryConfig c;
    c.unique_id   = unique_id_for(instance);
    c.name        = "BACnet Device " + std::to_string(instance);
    c.state_topic = state_topic(prefix, c.unique_id);

    c.device.identifiers  = {c.unique_id};
    c.device.name         = c.name;
    c.device.manufacturer = "Vendor ID " + std::to_string(vendor_id);
    c.device.model        = "Generic BACnet Device";
    return c;
}

std::string serialize(const DiscoveryConfig& c) {
    return json(c).dump();
}

} // namespace bacgate
