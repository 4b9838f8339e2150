#pragma once
/**
 * @file event_channel.hpp
 * @brief Bounded, closable hand-off queue between the engine and the bridge.
 *
 * @details
 * Fixed capacity (ETL deque, no heap growth in the queue itself). The producer
 * blocks while the queue is full; that back-pressure reaches the UDP socket,
 * whose kernel buffer then absorbs or drops datagrams.
 *
 * close() is one-way. After it:
 *  - push() returns false immediately (the receive loop treats this as "the
 *    consumer is gone" and exits),
 *  - pop() keeps returning queued events until the queue is drained, then
 *    returns false.
 */

#include <stddef.h>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include "etl/deque.h"
#include "bacgate/event.hpp"

namespace bacgate {

class EventChannel {
public:
  static constexpr size_t CAPACITY = 100;

  EventChannel() = default;
  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;

  /// Enqueue, blocking while full. False once closed.
  bool push(const BacnetEvent& ev);

  /// Dequeue, blocking while empty. False once closed and drained.
  bool pop(BacnetEvent& out);

  /// Like pop() but gives up after @p timeout (returns false, channel still open).
  bool pop_for(BacnetEvent& out, std::chrono::milliseconds timeout);

  void   close();
  bool   closed() const;
  size_t size() const;

private:
  mutable std::mutex mu_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  etl::deque<BacnetEvent, CAPACITY> queue_;
  bool closed_{false};
};

} // namespace bacgate
