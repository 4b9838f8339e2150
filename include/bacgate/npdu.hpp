#ifndef BACGATE_NPDU_HPP
#define BACGATE_NPDU_HPP
/**
 * @file npdu.hpp
 * @brief Network-layer header (NPDU) that precedes every APDU.
 *
 * @details
 * Layout (ASHRAE 135 clause 6.2):
 *
 *     [version=1][control]
 *     [DNET(2) DLEN(1) DADR(DLEN)]     if control bit 5
 *     [SNET(2) SLEN(1) SADR(SLEN)]     if control bit 3
 *     [hop count(1)]                   if control bit 5
 *     [message type(1) [vendor(2)]]    if control bit 7 (network message)
 *
 * Control bits: 7 network-layer message, 5 DNET present, 3 SNET present,
 * 2 expecting reply, 1-0 priority.
 *
 * The gateway only ever produces the two-byte local form. Routed frames are
 * decoded so their APDU can still be reached; network-layer messages are
 * decoded and then ignored by the engine.
 */

#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <vector>
#include "bacgate/types.hpp"

namespace bacgate {

static constexpr uint8_t NPDU_VERSION = 0x01;

/// Remote network + MAC (DNET/DADR or SNET/SADR). Empty mac = broadcast on net.
struct NpduAddress {
  uint16_t net{0};
  std::vector<uint8_t> mac;

  bool operator==(const NpduAddress& o) const { return net == o.net && mac == o.mac; }
};

struct Npdu {
  uint8_t version{NPDU_VERSION};
  bool    network_message{false};
  bool    expecting_reply{false};
  uint8_t priority{0};                    ///< 0..3 (normal, urgent, critical, life-safety)

  std::optional<NpduAddress> destination;
  uint8_t hop_count{255};                 ///< meaningful only with destination

  std::optional<NpduAddress> source;

  uint8_t  message_type{0};               ///< network messages only
  uint16_t vendor_id{0};                  ///< network messages with type >= 0x80
};

/// Append the encoded header to @p out.
void encode_npdu(std::vector<uint8_t>& out, const Npdu& npdu);

/**
 * @brief Decode an NPDU header from the front of @p data.
 * @param consumed  header length on success; the APDU starts there.
 * @return InvalidLength if shorter than 2 bytes or a routing field is cut off,
 *         InvalidVersion if the version octet is not 1.
 */
DecodeError decode_npdu(const uint8_t* data, size_t len, Npdu& out, size_t& consumed);

} // namespace bacgate

#endif // BACGATE_NPDU_HPP
