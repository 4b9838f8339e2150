#pragma once
/**
 * @page bg-config bacgate configuration
 * @file gateway_config.hpp
 * @brief Gateway settings: defaults, JSON file loading, validation, dump.
 *
 * @details
 * PURPOSE
 * -------
 * One struct holds everything the daemon needs to wire itself up. Values come
 * from three layers, later ones winning:
 *   1. built-in defaults (below),
 *   2. an optional JSON file (`--config gateway.json`),
 *   3. command-line overrides (see src/main.cpp).
 *
 * FILE FORMAT
 * -----------
 * @code
 *   {
 *     "bacnet": { "device_id": 12345, "bind_addr": "0.0.0.0:47808",
 *                 "broadcast_addr": "255.255.255.255:47808",
 *                 "vendor_name": "BACnet Gateway", "model_name": "MQTT Bridge V1",
 *                 "request_timeout_ms": 3000 },
 *     "mqtt":   { "broker_host": "127.0.0.1", "broker_port": 1883,
 *                 "username": "gw", "password": "secret",
 *                 "discovery_prefix": "homeassistant", "base_topic": "bacnet" },
 *     "poll":   { "interval_ms": 10000, "rediscover_every": 6,
 *                 "stale_after_s": 180, "evict_after_s": 0 },
 *     "log_level": "info"
 *   }
 * @endcode
 * Every key is optional; missing keys keep their default. Unknown keys are
 * ignored. Wrong types, unparsable addresses and out-of-range values are
 * errors with a message naming the key.
 *
 * DEPENDENCIES
 * ------------
 * nlohmann::json for parsing and dumping.
 */

#include <stdint.h>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "bacgate/address.hpp"

namespace bacgate {

struct BacnetSettings {
  uint32_t   device_id{12345};
  BipAddress bind_addr{0, BACNET_IP_PORT};
  BipAddress broadcast_addr{0xFFFFFFFFu, BACNET_IP_PORT};
  std::string vendor_name{"BACnet Gateway"};
  std::string model_name{"MQTT Bridge V1"};
  uint32_t   request_timeout_ms{3000};
};

struct MqttSettings {
  std::string broker_host{"127.0.0.1"};
  uint16_t    broker_port{1883};
  std::optional<std::string> username;
  std::optional<std::string> password;
  std::string discovery_prefix{"homeassistant"};
  std::string base_topic{"bacnet"};
  uint32_t    keepalive_s{5};
  uint32_t    reconnect_delay_s{3};
};

struct PollSettings {
  uint32_t interval_ms{10000};
  uint32_t rediscover_every{6};     ///< 0 = never rediscover
  uint32_t stale_after_s{180};
  uint32_t evict_after_s{0};        ///< 0 = keep stale devices forever
};

struct GatewayConfig {
  BacnetSettings bacnet;
  MqttSettings   mqtt;
  PollSettings   poll;
  std::string    log_level{"info"};
};

/// Merge a JSON document into @p cfg. On error @p cfg may be partly updated.
bool parse_config(const std::string& text, GatewayConfig& cfg, std::string& err);

/// Read @p path and merge it into @p cfg.
bool load_config(const std::string& path, GatewayConfig& cfg, std::string& err);

/// Cross-field and range checks. Returns false with a message on the first problem.
bool validate_config(const GatewayConfig& cfg, std::string& err);

/// Effective configuration as JSON (password masked when @p redact).
nlohmann::json config_to_json(const GatewayConfig& cfg, bool redact = true);

/// Write the full configuration (not redacted) to @p path, pretty-printed.
bool save_config(const std::string& path, const GatewayConfig& cfg, std::string& err);

} // namespace bacgate
