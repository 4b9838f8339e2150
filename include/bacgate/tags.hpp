#ifndef BACGATE_TAGS_HPP
#define BACGATE_TAGS_HPP
/**
 * @page bg-tags bacgate tag-length-value primitives
 * @file tags.hpp
 * @brief Encoders and bounded decoders for BACnet's tagged primitive encoding.
 *
 * @details
 * Every service body in BACnet is a sequence of tagged primitives. A tag
 * starts with one octet:
 *
 * | Bits | Meaning                                                   |
 * |------|-----------------------------------------------------------|
 * | 7-4  | tag number (15 = extended, real number in next octet)     |
 * | 3    | class: 0 = application tag, 1 = context-specific tag      |
 * | 2-0  | length/value/type: 0..4 length, 5 = extended length,      |
 * |      | 6 = opening tag, 7 = closing tag (context tags only)      |
 *
 * Extended length: LVT=5 is followed by one octet with the length; 254 means a
 * 2-octet length follows, 255 a 4-octet length.
 *
 * Application tag numbers used here: 1 boolean, 2 unsigned, 3 signed,
 * 4 REAL, 9 enumerated, 12 object identifier.
 *
 * The builders append to a byte vector (the same shape the service builders
 * use). The decoders work on a TagReader, a cursor over a read-only span that
 * refuses to move past the end.
 */

#include <stdint.h>
#include <stddef.h>
#include <vector>
#include "bacgate/types.hpp"

namespace bacgate {

/// Application tag numbers.
enum : uint8_t {
  APP_TAG_NULL        = 0,
  APP_TAG_BOOLEAN     = 1,
  APP_TAG_UNSIGNED    = 2,
  APP_TAG_SIGNED      = 3,
  APP_TAG_REAL        = 4,
  APP_TAG_DOUBLE      = 5,
  APP_TAG_OCTET_STR   = 6,
  APP_TAG_CHAR_STR    = 7,
  APP_TAG_BIT_STR     = 8,
  APP_TAG_ENUMERATED  = 9,
  APP_TAG_DATE        = 10,
  APP_TAG_TIME        = 11,
  APP_TAG_OBJECT_ID   = 12
};

/// Decoded tag header.
struct Tag {
  uint8_t  number{0};      ///< tag number (extended numbers resolved)
  bool     context{false}; ///< true for context-specific tags
  bool     opening{false}; ///< context opening tag (LVT=6)
  bool     closing{false}; ///< context closing tag (LVT=7)
  uint32_t length{0};      ///< value length in octets (0 for opening/closing)
};

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

/// Append a tag header. Handles extended tag numbers and extended lengths.
void encode_tag(std::vector<uint8_t>& b, uint8_t number, bool context, uint32_t length);

void encode_opening_tag(std::vector<uint8_t>& b, uint8_t number);
void encode_closing_tag(std::vector<uint8_t>& b, uint8_t number);

/// Shortest big-endian form of an unsigned value (1..4 octets).
void encode_unsigned_value(std::vector<uint8_t>& b, uint32_t v);
/// Number of octets encode_unsigned_value() will write.
uint8_t unsigned_length(uint32_t v);

void encode_app_unsigned(std::vector<uint8_t>& b, uint32_t v);
void encode_app_enumerated(std::vector<uint8_t>& b, uint32_t v);
void encode_app_real(std::vector<uint8_t>& b, float v);
void encode_app_object_id(std::vector<uint8_t>& b, const ObjectIdentifier& oid);

void encode_ctx_unsigned(std::vector<uint8_t>& b, uint8_t tag, uint32_t v);
void encode_ctx_enumerated(std::vector<uint8_t>& b, uint8_t tag, uint32_t v);
void encode_ctx_object_id(std::vector<uint8_t>& b, uint8_t tag, const ObjectIdentifier& oid);

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------

/**
 * @brief Bounded cursor over an encoded service body.
 *
 * All reads check the remaining length first and return DecodeError instead
 * of reading out of bounds. On error the cursor position is unspecified; the
 * caller is expected to abandon the whole body.
 */
class TagReader {
public:
  TagReader(const uint8_t* data, size_t len) : data_(data), len_(len) {}

  size_t remaining() const { return len_ - pos_; }
  bool   at_end()    const { return pos_ >= len_; }
  size_t position()  const { return pos_; }
  const uint8_t* cursor() const { return data_ + pos_; }

  /// Decode the next tag header without consuming it.
  DecodeError peek_tag(Tag& out) const;

  /// Decode and consume the next tag header.
  DecodeError read_tag(Tag& out);

  /// Consume @p n raw octets into @p out (appended).
  DecodeError read_bytes(size_t n, std::vector<uint8_t>& out);

  /// Skip @p n octets.
  DecodeError skip(size_t n);

  /// Read an unsigned value body of @p length octets (1..4).
  DecodeError read_unsigned_value(uint32_t length, uint32_t& out);

  // Typed helpers: read the tag, check number/class/length, read the value.
  DecodeError read_app_unsigned(uint32_t& out);
  DecodeError read_app_enumerated(uint32_t& out);
  DecodeError read_app_object_id(ObjectIdentifier& out);
  DecodeError read_ctx_unsigned(uint8_t tag, uint32_t& out);
  DecodeError read_ctx_object_id(uint8_t tag, ObjectIdentifier& out);
  DecodeError expect_opening(uint8_t tag);
  DecodeError expect_closing(uint8_t tag);

  /// True if the next tag is context tag @p tag (not opening/closing).
  bool next_is_context(uint8_t tag) const;

private:
  DecodeError decode_header(size_t at, Tag& out, size_t& header_len) const;

  const uint8_t* data_;
  size_t len_;
  size_t pos_{0};
};

/**
 * @brief Decode a REAL from an application-tagged encoding.
 * @return DecodeError::InvalidTag if the first tag is not application tag 4
 *         with length 4; InvalidLength if truncated.
 */
DecodeError decode_app_real(const uint8_t* data, size_t len, float& out);

} // namespace bacgate

#endif // BACGATE_TAGS_HPP
