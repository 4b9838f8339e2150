#pragma once
/**
 * @file payload.hpp
 * @brief Auto-discovery documents and the MQTT topic layout.
 *
 * @details
 * Topic layout (prefix = discovery prefix, base = gateway base topic):
 *
 *   <prefix>/sensor/bacnet_<n>/config   retained discovery document
 *   <prefix>/sensor/bacnet_<n>/state    retained "online" / present-value text
 *   <base>/status                       gateway availability (LWT "offline")
 *   <base>/command/<verb>               incoming operator commands
 *
 * The discovery document is serialized with nlohmann::json. command_topic is
 * left out entirely when unset (sensors are read-only).
 */

#include <stdint.h>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace bacgate {

struct DiscoveryDevice {
  std::vector<std::string> identifiers;
  std::string name;
  std::string manufacturer;
  std::string model;
};

struct DiscoveryConfig {
  std::string name;
  std::string state_topic;
  std::optional<std::string> command_topic;
  std::string unique_id;
  DiscoveryDevice device;
};

void to_json(nlohmann::json& j, const DiscoveryDevice& d);
void to_json(nlohmann::json& j, const DiscoveryConfig& c);

/// "bacnet_<instance>"
std::string unique_id_for(uint32_t instance);

std::string discovery_topic(const std::string& prefix, const std::string& unique_id);
std::string state_topic(const std::string& prefix, const std::string& unique_id);
std::string status_topic(const std::string& base_topic);
std::string command_topic(const std::string& base_topic, const std::string& verb);

/// Discovery document for a device announced by I-Am.
DiscoveryConfig make_discovery_config(const std::string& prefix, uint32_t instance, uint16_t vendor_id);

/// Compact JSON text for publishing.
std::string serialize(const DiscoveryConfig& c);

} // namespace bacgate
