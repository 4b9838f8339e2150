#pragma once
/**
 * @file pending_requests.hpp
 * @brief Outstanding confirmed requests, keyed by invoke id.
 *
 * @details
 * Invoke ids are 1..255, handed out round-robin (255 wraps to 1, 0 is never
 * used) and skipping ids that are still outstanding. At most 255 requests
 * can be in flight; allocate() fails after that until something completes,
 * is released or expires.
 *
 * An acknowledgement only matches when invoke id, source address and service
 * choice all agree with what was sent. Thread-safe: the poller allocates while
 * the receive thread completes and expires.
 */

#include <stdint.h>
#include <chrono>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>
#include "etl/map.h"
#include "bacgate/address.hpp"
#include "bacgate/types.hpp"

namespace bacgate {

struct PendingRequest {
  BipAddress       target;
  uint8_t          service{0};
  ObjectIdentifier object;
  uint32_t         property{0};
  std::chrono::steady_clock::time_point deadline;
};

class PendingRequests {
public:
  using Clock = std::chrono::steady_clock;
  static constexpr size_t CAPACITY = 255;

  /// Reserve the next free invoke id and record the request. nullopt when all 255 are in use.
  std::optional<uint8_t> allocate(const PendingRequest& req);

  /// Remove and return the entry if (invoke_id, source, service) match it.
  std::optional<PendingRequest> complete(uint8_t invoke_id, const BipAddress& source, uint8_t service);

  /// Remove and return every entry whose deadline is at or before @p now.
  std::vector<std::pair<uint8_t, PendingRequest>> expire(Clock::time_point now);

  /// Drop an entry without a response (send failed). False if it was not there.
  bool release(uint8_t invoke_id);

  /// Earliest deadline among outstanding entries.
  std::optional<Clock::time_point> next_deadline() const;

  size_t size() const;
  bool   contains(uint8_t invoke_id) const;

private:
  mutable std::mutex mu_;
  etl::map<uint8_t, PendingRequest, CAPACITY> table_;
  uint8_t next_id_{1};
};

} // namespace bacgate
