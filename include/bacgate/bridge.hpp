#pragma once
/**
 * @file bridge.hpp
 * @brief Consumes BacnetEvents, keeps the registry current, publishes to MQTT.
 *
 * @details
 * Single consumer of the EventChannel; events are handled strictly in order.
 *
 *   IAm              upsert registry, publish discovery config + "online" (retained)
 *   ReadPropertyAck  present-value REAL -> "<prefix>/sensor/bacnet_<n>/state" (retained)
 *                    where n is the one instance registered at the source address
 *   RequestTimeout   warning
 *   WhoIs, ReadPropertyRequest   logged only
 *
 * Acks from an unknown address, or from an address shared by several
 * instances, are logged and dropped: a value is only ever published under a
 * device instance.
 *
 * Operator commands arrive from the MQTT thread through handle_command().
 */

#include <stdint.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include "bacgate/device_registry.hpp"
#include "bacgate/event.hpp"
#include "bacgate/event_channel.hpp"
#include "bacgate/publisher.hpp"

namespace bacgate {

class Bridge {
public:
  using Clock = std::chrono::steady_clock;
  using DiscoverFn = std::function<void()>;

  struct Options {
    std::string discovery_prefix{"homeassistant"};
    std::string base_topic{"bacnet"};
  };

  Bridge(DeviceRegistry& registry, IPublisher& publisher, Options opts);

  /// Apply one event.
  void handle(const BacnetEvent& ev, Clock::time_point now);

  /// Pop and handle until the channel is closed and drained. Closes the channel on exit.
  void run(EventChannel& channel);

  /// Called for `<base>/command/discover`.
  void set_discover_handler(DiscoverFn fn) { on_discover_ = std::move(fn); }

  /// Route an incoming MQTT message. False if the topic is not a supported command.
  bool handle_command(const std::string& topic, const std::string& payload);

  uint64_t publish_failures() const { return publish_failures_.load(); }

private:
  void on_i_am(const BacnetEvent& ev, Clock::time_point now);
  void on_read_ack(const BacnetEvent& ev, Clock::time_point now);
  bool publish(const std::string& topic, const std::string& payload);

  DeviceRegistry& registry_;
  IPublisher&     publisher_;
  Options         opts_;
  DiscoverFn      on_discover_;
  std::atomic<uint64_t> publish_failures_{0};
};

} // namespace bacgate
