#ifndef BACGATE_SERVICES_HPP
#define BACGATE_SERVICES_HPP
/**
 * @page bg-services bacgate service codecs
 * @file services.hpp
 * @brief Who-Is, I-Am and ReadProperty request/ack bodies.
 *
 * @details
 * These work on the service_data part of an Apdu only; headers are the
 * business of apdu.hpp and npdu.hpp.
 *
 * GRAMMAR
 * -------
 *   Who-Is            [0] low-limit  [1] high-limit        (both or neither)
 *   I-Am              object-id, unsigned max-apdu, enumerated segmentation,
 *                     unsigned vendor-id                   (application tags)
 *   ReadProperty      [0] object-id  [1] property  [2] array-index (optional)
 *   ReadProperty-ACK  same as the request, then [3] { value } [3]
 *
 * DECODING RULES
 * --------------
 * - Every decoder consumes the whole body. Leftover bytes are InvalidLength.
 * - Values are range-checked (instance <= 4194303, segmentation 0..3,
 *   vendor id <= 65535). Violations are InvalidValue.
 * - The ReadProperty-ACK value is kept raw: the first application tag number
 *   plus every octet between the opening and closing tag 3. decode_real()
 *   interprets it when it is a REAL.
 */

#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <vector>
#include "bacgate/types.hpp"

namespace bacgate {

// ----------------------------- Who-Is ------------------------------------

struct InstanceRange {
  uint32_t low{0};
  uint32_t high{MAX_INSTANCE};

  bool contains(uint32_t instance) const { return instance >= low && instance <= high; }
  bool operator==(const InstanceRange& o) const { return low == o.low && high == o.high; }
};

struct WhoIs {
  std::optional<InstanceRange> range;     ///< absent: every device answers

  bool operator==(const WhoIs& o) const { return range == o.range; }
};

void        encode_who_is(std::vector<uint8_t>& out, const WhoIs& req);
DecodeError decode_who_is(const uint8_t* data, size_t len, WhoIs& out);

// ----------------------------- I-Am --------------------------------------

struct IAm {
  ObjectIdentifier device{ObjectType::Device, 0};
  uint32_t     max_apdu{MAX_APDU_LENGTH};
  Segmentation segmentation{Segmentation::None};
  uint16_t     vendor_id{0};

  bool operator==(const IAm& o) const {
    return device == o.device && max_apdu == o.max_apdu &&
           segmentation == o.segmentation && vendor_id == o.vendor_id;
  }
};

void        encode_i_am(std::vector<uint8_t>& out, const IAm& ann);
DecodeError decode_i_am(const uint8_t* data, size_t len, IAm& out);

// ----------------------------- ReadProperty ------------------------------

struct ReadPropertyRequest {
  ObjectIdentifier object;
  uint32_t property{PROP_PRESENT_VALUE};
  std::optional<uint32_t> array_index;

  bool operator==(const ReadPropertyRequest& o) const {
    return object == o.object && property == o.property && array_index == o.array_index;
  }
};

void        encode_read_property(std::vector<uint8_t>& out, const ReadPropertyRequest& req);
DecodeError decode_read_property(const uint8_t* data, size_t len, ReadPropertyRequest& out);

/// Property value as carried inside the ACK's [3] { } block.
struct PropertyValue {
  uint8_t app_tag{0};              ///< application tag number of the first element
  std::vector<uint8_t> raw;        ///< tagged octets between opening and closing tag 3

  static PropertyValue real(float v);
  bool operator==(const PropertyValue& o) const { return app_tag == o.app_tag && raw == o.raw; }
};

struct ReadPropertyAck {
  ObjectIdentifier object;
  uint32_t property{PROP_PRESENT_VALUE};
  std::optional<uint32_t> array_index;
  PropertyValue value;
};

void        encode_read_property_ack(std::vector<uint8_t>& out, const ReadPropertyAck& ack);
DecodeError decode_read_property_ack(const uint8_t* data, size_t len, ReadPropertyAck& out);

/// The value as a float, only for a single REAL (application tag 4, length 4).
std::optional<float> decode_real(const PropertyValue& value);

} // namespace bacgate

#endif // BACGATE_SERVICES_HPP
