#pragma once
/**
 * @file poller.hpp
 * @brief Periodic present-value reads for every live device.
 *
 * Each tick: optional eviction, registry snapshot, one ReadProperty per
 * non-stale device. Every rediscover_every ticks a Who-Is goes out too, so
 * stale and new devices get a chance to announce themselves (0 disables).
 * A failed send is logged and skipped; it never affects the other devices.
 */

#include <stdint.h>
#include <chrono>
#include <optional>
#include "bacgate/cancel.hpp"
#include "bacgate/device_registry.hpp"
#include "bacgate/engine.hpp"

namespace bacgate {

class Poller {
public:
  using Clock = std::chrono::steady_clock;

  struct Options {
    std::chrono::milliseconds interval{10000};
    unsigned rediscover_every{6};
    std::optional<Clock::duration> evict_after;         ///< unset: never evict
    ObjectIdentifier object{ObjectType::AnalogInput, 0};
    uint32_t property{PROP_PRESENT_VALUE};
  };

  Poller(Engine& engine, DeviceRegistry& registry, Options opts);

  /// One polling round. Returns the number of requests sent.
  size_t tick(Clock::time_point now);

  /// tick() at once, then every interval until @p cancel is raised.
  void run(CancelToken& cancel);

  uint64_t ticks() const { return ticks_; }

private:
  Engine&         engine_;
  DeviceRegistry& registry_;
  Options         opts_;
  uint64_t        ticks_{0};
};

} // namespace bacgate
