#pragma once
/**
 * @file publisher.hpp
 * @brief Outbound MQTT capability the bridge publishes through.
 *
 * Implemented by MqttClient in the daemon and by a recording fake in tests.
 * publish() returns false on failure; callers log and move on (no retry).
 */

#include <string>

namespace bacgate {

enum class Qos : int { AtMostOnce = 0, AtLeastOnce = 1, ExactlyOnce = 2 };

class IPublisher {
public:
  virtual ~IPublisher() = default;
  virtual bool publish(const std::string& topic, const std::string& payload,
                       bool retained, Qos qos) = 0;
};

} // namespace bacgate
