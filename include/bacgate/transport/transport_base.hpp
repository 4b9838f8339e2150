#pragma once
/**
 * @file transport_base.hpp
 * @brief Datalink interface the engine talks to (B/IP in production, a fake in tests).
 *
 * Header-only. Frames carry NPDU bytes: any datalink framing (the BVLC header
 * on B/IP) is added on send and stripped on receive by the implementation.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "bacgate/address.hpp"

namespace bacgate::transport {

// Result codes for every datalink call.
enum class TransportError : uint8_t {
  None = 0,
  NotOpen,     // begin() not called or failed
  Socket,      // socket()/pipe()/setsockopt() failed
  Bind,        // bind() failed (port in use, bad address)
  Send,        // sendto() failed or short write
  Receive,     // recvfrom()/poll() failed
  Timeout,     // nothing arrived within the timeout
  Cancelled,   // interrupt() woke the receiver
  Foreign,     // datagram is not a BACnet/IP NPDU we handle
  Oversize     // NPDU does not fit one datagram
};

inline const char* transport_error_name(TransportError e) {
  switch (e) {
    case TransportError::None:      return "none";
    case TransportError::NotOpen:   return "not_open";
    case TransportError::Socket:    return "socket";
    case TransportError::Bind:      return "bind";
    case TransportError::Send:      return "send";
    case TransportError::Receive:   return "receive";
    case TransportError::Timeout:   return "timeout";
    case TransportError::Cancelled: return "cancelled";
    case TransportError::Foreign:   return "foreign";
    case TransportError::Oversize:  return "oversize";
  }
  return "unknown";
}

/// One received NPDU and where it came from.
struct Frame {
  std::vector<uint8_t> npdu;
  BipAddress source;
};

/**
 * @brief Datalink every engine can rely on.
 *
 * Contract:
 *  - send_*() may be called from any thread; implementations serialize.
 *  - receive_frame() is called from one thread only (the engine's receiver).
 *    It blocks up to @p timeout; Timeout means "nothing yet", not a fault.
 *  - interrupt() makes a blocked receive_frame() return Cancelled, and every
 *    later call too (it is a shutdown signal, not a one-shot wake).
 *  - name() is a short identifier for logs.
 */
class IDatalink {
public:
  virtual ~IDatalink() = default;
  virtual TransportError send_broadcast(const std::vector<uint8_t>& npdu) = 0;
  virtual TransportError send_unicast(const std::vector<uint8_t>& npdu, const BipAddress& dest) = 0;
  virtual TransportError receive_frame(Frame& out, std::chrono::milliseconds timeout) = 0;
  virtual void           interrupt() = 0;
  virtual const char*    name() const = 0;
};

} // namespace bacgate::transport
