#pragma once
/**
 * @file event.hpp
 * @brief BacnetEvent: the one thing the engine hands to the bridge.
 *
 * @details
 * A flat tagged record. `kind` says which payload member is meaningful; the
 * others stay default-constructed. `source` is the B/IP address the datagram
 * came from (for RequestTimeout: the address the request was sent to).
 *
 * RequestTimeout reuses `read_request` for the object/property that went
 * unanswered and `service_choice` for the confirmed service.
 */

#include <stdint.h>
#include <string>
#include <vector>
#include "bacgate/address.hpp"
#include "bacgate/services.hpp"

namespace bacgate {

enum class EventKind : uint8_t {
  WhoIs = 0,
  IAm,
  ReadPropertyRequest,
  ReadPropertyAck,
  RequestTimeout
};

struct BacnetEvent {
  EventKind  kind{EventKind::WhoIs};
  uint8_t    invoke_id{0};        ///< confirmed request / ack / timeout only
  uint8_t    service_choice{0};
  BipAddress source;

  WhoIs               who_is;
  IAm                 i_am;
  ReadPropertyRequest read_request;
  ReadPropertyAck     read_ack;

  static BacnetEvent make_who_is(const WhoIs& w, const BipAddress& from);
  static BacnetEvent make_i_am(const IAm& a, const BipAddress& from);
  static BacnetEvent make_read_request(const ReadPropertyRequest& r, uint8_t invoke_id, const BipAddress& from);
  static BacnetEvent make_read_ack(const ReadPropertyAck& a, uint8_t invoke_id, const BipAddress& from);
  static BacnetEvent make_timeout(uint8_t invoke_id, uint8_t service, const ObjectIdentifier& obj,
                                  uint32_t property, const BipAddress& target);
};

/// "who_is", "i_am", ... (used as the event= value).
const char* event_kind_name(EventKind k);

/**
 * @brief One-line key=value summary of an event, for logs and the CLI.
 *
 * Examples:
 *   "event=i_am device=42 vendor=260 max_apdu=1476 segmentation=none source=10.0.0.5:47808"
 *   "event=read_property_ack invoke=3 object=0:0 property=85 tag=4 value=24.5 source=..."
 */
std::string describe(const BacnetEvent& ev);

/// Lowercase hex with no separators ("3e41c40000").
std::string to_hex(const std::vector<uint8_t>& bytes);

/// Shortest fixed-notation text that reads back as the same float ("24.5", "0.1", "10000000000").
std::string format_value(float v);

} // namespace bacgate
