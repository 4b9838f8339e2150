#pragma once
/**
 * @page bg-engine bacgate protocol engine
 * @file engine.hpp
 * @brief Turns datagrams into BacnetEvents and requests into datagrams.
 *
 * @details
 * PURPOSE
 * -------
 * The engine is the only piece that touches the datalink. Outbound it builds
 * Who-Is broadcasts and ReadProperty requests. Inbound it runs a dedicated
 * receive thread that decodes every frame and pushes the result onto the
 * EventChannel for the bridge.
 *
 * OPERATIONAL MODEL
 * -----------------
 * ```
 *   poller ── read_property() ──► pending table ──► unicast
 *                                      ▲
 *   receive thread: receive_frame ─► decode_frame ─┴─► EventChannel ─► bridge
 *                         │
 *                         └─ between frames: expire_pending() ─► RequestTimeout
 * ```
 * The receive wait is bounded by the earliest pending deadline, so timeouts
 * are reported on time even on a silent network.
 *
 * DISPATCH
 * --------
 *   Unconfirmed  Who-Is        -> WhoIs
 *   Unconfirmed  I-Am          -> IAm
 *   Confirmed    ReadProperty  -> ReadPropertyRequest
 *   Complex-ACK  ReadProperty  -> ReadPropertyAck   (only if it matches a pending request)
 *   anything else, network-layer messages, decode failures -> no event
 *
 * SHUTDOWN
 * --------
 * stop() raises the engine's stop flag, interrupts the datalink and joins the
 * thread. The loop also ends by itself when the channel is closed. A stopped
 * engine cannot be restarted.
 */

#include <stdint.h>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include "bacgate/cancel.hpp"
#include "bacgate/event.hpp"
#include "bacgate/event_channel.hpp"
#include "bacgate/pending_requests.hpp"
#include "bacgate/transport/transport_base.hpp"

namespace bacgate {

enum class RequestError : uint8_t {
  None = 0,
  NoInvokeId,     // 255 requests already outstanding
  Transport       // the datalink refused the send
};

const char* request_error_name(RequestError e);

class Engine {
public:
  using Clock = std::chrono::steady_clock;

  struct Options {
    std::chrono::milliseconds request_timeout{3000};
  };

  Engine(transport::IDatalink& link, EventChannel& events, Options opts);
  Engine(transport::IDatalink& link, EventChannel& events) : Engine(link, events, Options{}) {}
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  /// Broadcast Who-Is (no range = every device). No state change.
  transport::TransportError discover(const WhoIs& req = WhoIs{});

  /**
   * @brief Send ReadProperty to @p target and return without waiting.
   * @param invoke_id  set to the id used on success.
   * The answer arrives later as a ReadPropertyAck (or RequestTimeout) event.
   */
  RequestError read_property(const BipAddress& target, const ObjectIdentifier& object,
                             uint32_t property, uint8_t& invoke_id);

  /// Decode one frame and apply the dispatch table. Completes matching pending entries.
  std::optional<BacnetEvent> decode_frame(const transport::Frame& frame);

  /// Push a RequestTimeout event for every request due at @p now. Returns how many expired.
  size_t expire_pending(Clock::time_point now);

  /// Spawn the receive thread (no-op if running). An engine runs once:
  /// start() after stop() leaves it stopped.
  void start();
  /// Stop and join the receive thread. Safe to call twice.
  void stop();
  bool running() const { return running_.load(); }

  size_t pending_count() const { return pending_.size(); }

private:
  void receive_loop();
  std::chrono::milliseconds next_wait(Clock::time_point now) const;

  transport::IDatalink& link_;
  EventChannel&         events_;
  Options               opts_;
  PendingRequests       pending_;

  CancelToken       cancel_;
  std::thread       rx_thread_;
  std::atomic<bool> running_{false};
};

} // namespace bacgate
