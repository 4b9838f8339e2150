#pragma once
/**
 * @page bg-mqtt bacgate MQTT adapter
 * @file mqtt_client.hpp
 * @brief IPublisher over the Eclipse Paho synchronous C client.
 *
 * @details
 * PURPOSE
 * -------
 * Owns the broker connection for the daemon: connect with a last will,
 * announce availability, subscribe to the command topics, keep the session
 * alive, reconnect after a fixed delay when it drops, and publish on behalf of
 * the bridge.
 *
 * THREADING
 * ---------
 * run() is the connection loop and lives on its own thread. publish() may be
 * called from any thread. All Paho calls are serialized by one mutex; the loop
 * only holds it for short receive slices, so a publish waits at most one slice.
 * Incoming messages are handed to the message handler outside the lock.
 *
 * AVAILABILITY
 * ------------
 *   on connect        "online"  retained on the status topic
 *   clean shutdown    "offline" retained (disconnect())
 *   crash / net loss  "offline" retained by the broker (last will)
 *
 * DEPENDENCIES
 * ------------
 * paho.mqtt.c (MQTTClient.h, libpaho-mqtt3c), ETL for the client id buffer.
 */

#include <stdint.h>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "MQTTClient.h"
#include "bacgate/cancel.hpp"
#include "bacgate/publisher.hpp"

namespace bacgate {

struct MqttOptions {
  std::string host{"127.0.0.1"};
  uint16_t    port{1883};
  std::string client_id;
  std::optional<std::string> username;
  std::optional<std::string> password;
  uint32_t    keepalive_s{5};
  uint32_t    reconnect_delay_s{3};

  std::string status_topic;                ///< empty: no availability messages
  std::vector<std::string> subscriptions;  ///< filters subscribed after every connect
};

/// "bacnet-gateway-<pid>"
std::string default_client_id();

class MqttClient : public IPublisher {
public:
  using MessageFn = std::function<void(const std::string& topic, const std::string& payload)>;

  explicit MqttClient(MqttOptions opts);
  ~MqttClient() override;

  MqttClient(const MqttClient&) = delete;
  MqttClient& operator=(const MqttClient&) = delete;

  /// Create the Paho handle. False if the URI or options are rejected.
  bool create();

  /// One connect attempt (then "online" + subscriptions).
  bool connect();

  /// Keep the session up and deliver messages until @p cancel is raised.
  void run(CancelToken& cancel);

  /// Publish "offline" and disconnect cleanly. Safe to call when not connected.
  void disconnect();

  bool publish(const std::string& topic, const std::string& payload, bool retained, Qos qos) override;

  bool connected() const;

  void set_message_handler(MessageFn fn) { on_message_ = std::move(fn); }

private:
  bool publish_locked(const std::string& topic, const std::string& payload, bool retained, Qos qos);
  void receive_slice(int timeout_ms);

  MqttOptions opts_;
  MQTTClient  client_{nullptr};
  mutable std::mutex mu_;
  MessageFn   on_message_;
  std::atomic<bool> was_connected_{false};
};

} // namespace bacgate
