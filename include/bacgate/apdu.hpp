#ifndef BACGATE_APDU_HPP
#define BACGATE_APDU_HPP
/**
 * @file apdu.hpp
 * @brief Application-layer PDU header: the three forms this gateway speaks.
 *
 * @details
 * The first octet carries the PDU type in its high nibble and the PDU flags in
 * its low nibble.
 *
 * | Form                | Octets                                                        |
 * |---------------------|---------------------------------------------------------------|
 * | Confirmed-Request   | [0x0 SEG MOR SA] [maxseg<<4 maxapdu] [invoke] [service] data  |
 * | Unconfirmed-Request | [0x10] [service] data                                         |
 * | Complex-ACK         | [0x3 SEG MOR 0] [invoke] [service] data                       |
 *
 * Segmented frames (SEG set) decode to SegmentationUnsupported. Every other
 * PDU type (Simple-ACK, Error, Reject, Abort, ...) decodes to UnsupportedPdu.
 */

#include <stdint.h>
#include <stddef.h>
#include <vector>
#include "bacgate/types.hpp"

namespace bacgate {

/// PDU type (high nibble of the first APDU octet).
enum class ApduKind : uint8_t {
  ConfirmedRequest   = 0,
  UnconfirmedRequest = 1,
  ComplexAck         = 3
};

/// Max-APDU code 5 = up to 1476 octets (fits a B/IP datagram).
static constexpr uint8_t MAX_APDU_CODE_1476 = 5;

struct Apdu {
  ApduKind kind{ApduKind::UnconfirmedRequest};
  uint8_t  service_choice{0};
  uint8_t  invoke_id{0};                      ///< confirmed / ack only
  std::vector<uint8_t> service_data;

  // Confirmed-Request header fields.
  uint8_t max_segments{0};                    ///< 0 = unspecified
  uint8_t max_apdu{MAX_APDU_CODE_1476};
  bool    segmented_response_accepted{true};

  static Apdu unconfirmed(uint8_t service, std::vector<uint8_t> data);
  static Apdu confirmed(uint8_t invoke_id, uint8_t service, std::vector<uint8_t> data);
  static Apdu complex_ack(uint8_t invoke_id, uint8_t service, std::vector<uint8_t> data);
};

/// Append the encoded APDU to @p out. Never sets SEG or MOR.
void encode_apdu(std::vector<uint8_t>& out, const Apdu& apdu);

/**
 * @brief Decode one APDU occupying all of @p data.
 * @return InvalidLength on a short header, SegmentationUnsupported,
 *         UnsupportedPdu; None on success.
 */
DecodeError decode_apdu(const uint8_t* data, size_t len, Apdu& out);

} // namespace bacgate

#endif // BACGATE_APDU_HPP
