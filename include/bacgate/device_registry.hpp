#pragma once
/**
 * @file device_registry.hpp
 * @brief Live table of discovered devices: instance <-> B/IP address.
 *
 * @details
 * Written by the bridge (I-Am, matched acks), read by the poller. Readers take
 * a shared lock and copy out; nobody holds a reference into the table.
 *
 * Two indexes are kept in step:
 *   instance -> record        (the identity key; last I-Am wins)
 *   address  -> {instances}   (reverse lookup for acks)
 *
 * Several instances behind one address (a router, a multi-device host) make a
 * reverse lookup Ambiguous. That is reported as such and never resolved by
 * picking the first match.
 *
 * A record is stale once it has not been seen for stale_after. Stale records
 * stay in the table (and keep their discovery topic) until evicted.
 */

#include <stdint.h>
#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <vector>
#include "bacgate/address.hpp"

namespace bacgate {

struct DeviceRecord {
  uint32_t   instance{0};
  BipAddress address;
  uint16_t   vendor_id{0};
  std::chrono::steady_clock::time_point last_seen;
  bool       stale{false};      ///< computed at snapshot time
};

struct Resolution {
  enum class Kind : uint8_t { Resolved, Unknown, Ambiguous };

  Kind     kind{Kind::Unknown};
  uint32_t instance{0};                  ///< valid when Resolved
  std::vector<uint32_t> candidates;      ///< filled when Ambiguous
};

class DeviceRegistry {
public:
  using Clock = std::chrono::steady_clock;

  explicit DeviceRegistry(Clock::duration stale_after = std::chrono::seconds(180))
      : stale_after_(stale_after) {}

  /// Insert or overwrite. Returns true if the instance was not known before.
  bool upsert(uint32_t instance, const BipAddress& address, uint16_t vendor_id, Clock::time_point now);

  /// Refresh last_seen. False if the instance is unknown.
  bool touch(uint32_t instance, Clock::time_point now);

  /// Copy of every record, ordered by instance, with stale flags for @p now.
  std::vector<DeviceRecord> snapshot(Clock::time_point now) const;

  std::optional<DeviceRecord> find(uint32_t instance, Clock::time_point now) const;

  Resolution resolve_address_to_instance(const BipAddress& address) const;

  /// Remove records last seen before @p cutoff. Returns how many went.
  size_t evict_older_than(Clock::time_point cutoff);

  size_t size() const;
  Clock::duration stale_after() const { return stale_after_; }

private:
  struct Entry {
    BipAddress address;
    uint16_t   vendor_id{0};
    Clock::time_point last_seen;
  };

  void unlink_address(const BipAddress& address, uint32_t instance);
  DeviceRecord make_record(uint32_t instance, const Entry& e, Clock::time_point now) const;

  Clock::duration stale_after_;
  mutable std::shared_mutex mu_;
  std::map<uint32_t, Entry> by_instance_;
  std::map<BipAddress, std::set<uint32_t>> by_address_;
};

} // namespace bacgate
