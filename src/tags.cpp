// ============================================================================
// tags.cpp — implementation for bacgate/tags.hpp
// For the octet layout see the table in the header.
// ============================================================================

#include "bacgate/tags.hpp"

#include <cstring>      // std::memcpy for float <-> uint32 punning

namespace bacgate {

const char* decode_error_name(DecodeError e) {
    switch (e) {
        case DecodeError::None:                    return "none";
        case DecodeError::InvalidLength:           return "invalid_length";
        case DecodeError::InvalidVersion:          return "invalid_version";
        case DecodeError::InvalidTag:              return "invalid_tag";
        case DecodeError::UnsupportedPdu:          return "unsupported_pdu";
        case DecodeError::SegmentationUnsupported: return "segmentation_unsupported";
        case DecodeError::InvalidValue:            return "invalid_value";
    }
    return "unknown";
}

// ============================================================================
// Encoding
// ============================================================================

// Tag numbers 0..14 fit the high nibble; 15+ go into a following octet.
static inline uint8_t tag_nibble(uint8_t number) {
    return number < 15 ? static_cast<uint8_t>(number << 4) : 0xF0;
}

void encode_tag(std::vector<uint8_t>& b, uint8_t number, bool context, uint32_t length) {
    uint8_t first = tag_nibble(number);
    if (context) first |= 0x08;

    if (length <= 4) {
        b.push_back(static_cast<uint8_t>(first | length));
        if (number >= 15) b.push_back(number);
        return;
    }

    // Extended length: LVT=5, then 1, 1+2 or 1+4 length octets.
    b.push_back(static_cast<uint8_t>(first | 5));
    if (number >= 15) b.push_back(number);
    if (length <= 253) {
        b.push_back(static_cast<uint8_t>(length));
    } else if (length <= 0xFFFF) {
        b.push_back(254);
        b.push_back(static_cast<uint8_t>(length >> 8));
        b.push_back(static_cast<uint8_t>(length));
    } else {
        b.push_back(255);
        b.push_back(static_cast<uint8_t>(length >> 24));
        b.push_back(static_cast<uint8_t>(length >> 16));
        b.push_back(static_cast<uint8_t>(length >> 8));
        b.push_back(static_cast<uint8_t>(length));
    }
}

void encode_opening_tag(std::vector<uint8_t>& b, uint8_t number) {
    b.push_back(static_cast<uint8_t>(tag_nibble(number) | 0x08 | 6));
    if (number >= 15) b.push_back(number);
}

void encode_closing_tag(std::vector<uint8_t>& b, uint8_t number) {
    b.push_back(static_cast<uint8_t>(tag_nibble(number) | 0x08 | 7));
    if (number >= 15) b.push_back(number);
}

uint8_t unsigned_length(uint32_t v) {
    if (v <= 0xFF)     return 1;
    if (v <= 0xFFFF)   return 2;
    if (v <= 0xFFFFFF) return 3;
    return 4;
}

void encode_unsigned_value(std::vector<uint8_t>& b, uint32_t v) {
    const uint8_t n = unsigned_length(v);
    for (int shift = (n - 1) * 8; shift >= 0; shift -= 8)   // big-endian, no leading zeros
        b.push_back(static_cast<uint8_t>(v >> shift));
}

static void encode_object_id_value(std::vector<uint8_t>& b, const ObjectIdentifier& oid) {
    const uint32_t v = oid.pack();
    b.push_back(static_cast<uint8_t>(v >> 24));
    b.push_back(static_cast<uint8_t>(v >> 16));
    b.push_back(static_cast<uint8_t>(v >> 8));
    b.push_back(static_cast<uint8_t>(v));
}

void encode_app_unsigned(std::vector<uint8_t>& b, uint32_t v) {
    encode_tag(b, APP_TAG_UNSIGNED, false, unsigned_length(v));
    encode_unsigned_value(b, v);
}

void encode_app_enumerated(std::vector<uint8_t>& b, uint32_t v) {
    encode_tag(b, APP_TAG_ENUMERATED, false, unsigned_length(v));
    encode_unsigned_value(b, v);
}

void encode_app_real(std::vector<uint8_t>& b, float v) {
    uint32_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "REAL must be 32-bit IEEE-754");
    std::memcpy(&bits, &v, sizeof(bits));

    encode_tag(b, APP_TAG_REAL, false, 4);
    b.push_back(static_cast<uint8_t>(bits >> 24));
    b.push_back(static_cast<uint8_t>(bits >> 16));
    b.push_back(static_cast<uint8_t>(bits >> 8));
    b.push_back(static_cast<uint8_t>(bits));
}

void encode_app_object_id(std::vector<uint8_t>& b, const ObjectIdentifier& oid) {
    encode_tag(b, APP_TAG_OBJECT_ID, false, 4);
    encode_object_id_value(b, oid);
}

void encode_ctx_unsigned(std::vector<uint8_t>& b, uint8_t tag, uint32_t v) {
    encode_tag(b, tag, true, unsigned_length(v));
    encode_unsigned_value(b, v);
}

void encode_ctx_enumerated(std::vector<uint8_t>& b, uint8_t tag, uint32_t v) {
    encode_ctx_unsigned(b, tag, v);     // same body encoding as unsigned
}

void encode_ctx_object_id(std::vector<uint8_t>& b, uint8_t tag, const ObjectIdentifier& oid) {
    encode_tag(b, tag, true, 4);
    encode_object_id_value(b, oid);
}

// ============================================================================
// Decoding
// ============================================================================

// ---------------------------------------------------------------------------
// decode_header()
// Parse the tag octet(s) at @p at without moving the cursor.
// Length is checked against the buffer later, in read_tag().
// ---------------------------------------------------------------------------
DecodeError TagReader::decode_header(size_t at, Tag& out, size_t& header_len) const {
    if (at >= len_) return DecodeError::InvalidLength;

    const uint8_t first = data_[at];
    size_t i = at + 1;

    out = Tag{};
    out.number  = first >> 4;
    out.context = (first & 0x08) != 0;
    const uint8_t lvt = first & 0x07;

    if (out.number == 15) {                       // extended tag number
        if (i >= len_) return DecodeError::InvalidLength;
        out.number = data_[i++];
    }

    if (out.context && lvt == 6) {
        out.opening = true;
    } else if (out.context && lvt == 7) {
        out.closing = true;
    } else if (!out.context && out.number == APP_TAG_BOOLEAN) {
        out.length = 0;                           // value lives in LVT, no content octets
    } else if (lvt == 5) {
        if (i >= len_) return DecodeError::InvalidLength;
        const uint8_t ext = data_[i++];
        if (ext == 254) {
            if (len_ - i < 2) return DecodeError::InvalidLength;
            out.length = (uint32_t(data_[i]) << 8) | data_[i + 1];
            i += 2;
        } else if (ext == 255) {
            if (len_ - i < 4) return DecodeError::InvalidLength;
            out.length = (uint32_t(data_[i]) << 24) | (uint32_t(data_[i + 1]) << 16) |
                         (uint32_t(data_[i + 2]) << 8) | data_[i + 3];
            i += 4;
        } else {
            out.length = ext;
        }
    } else if (lvt > 5) {
        return DecodeError::InvalidTag;           // LVT 6/7 on an application tag
    } else {
        out.length = lvt;
    }

    header_len = i - at;
    return DecodeError::None;
}

DecodeError TagReader::peek_tag(Tag& out) const {
    size_t hl = 0;
    return decode_header(pos_, out, hl);
}

DecodeError TagReader::read_tag(Tag& out) {
    size_t hl = 0;
    DecodeError e = decode_header(pos_, out, hl);
    if (e != DecodeError::None) return e;
    pos_ += hl;
    if (!out.opening && !out.closing && out.length > remaining())
        return DecodeError::InvalidLength;        // value would run past the buffer
    return DecodeError::None;
}

DecodeError TagReader::read_bytes(size_t n, std::vector<uint8_t>& out) {
    if (n > remaining()) return DecodeError::InvalidLength;
    out.insert(out.end(), data_ + pos_, data_ + pos_ + n);
    pos_ += n;
    return DecodeError::None;
}

DecodeError TagReader::skip(size_t n) {
    if (n > remaining()) return DecodeError::InvalidLength;
    pos_ += n;
    return DecodeError::None;
}

DecodeError TagReader::read_unsigned_value(uint32_t length, uint32_t& out) {
    if (length == 0 || length > 4) return DecodeError::InvalidValue;
    if (length > remaining()) return DecodeError::InvalidLength;
    uint32_t v = 0;
    for (uint32_t k = 0; k < length; ++k) v = (v << 8) | data_[pos_ + k];
    pos_ += length;
    out = v;
    return DecodeError::None;
}

DecodeError TagReader::read_app_unsigned(uint32_t& out) {
    Tag t;
    DecodeError e = read_tag(t);
    if (e != DecodeError::None) return e;
    if (t.context || t.number != APP_TAG_UNSIGNED) return DecodeError::InvalidTag;
    return read_unsigned_value(t.length, out);
}

DecodeError TagReader::read_app_enumerated(uint32_t& out) {
    Tag t;
    DecodeError e = read_tag(t);
    if (e != DecodeError::None) return e;
    if (t.context || t.number != APP_TAG_ENUMERATED) return DecodeError::InvalidTag;
    return read_unsigned_value(t.length, out);
}

DecodeError TagReader::read_app_object_id(ObjectIdentifier& out) {
    Tag t;
    DecodeError e = read_tag(t);
    if (e != DecodeError::None) return e;
    if (t.context || t.number != APP_TAG_OBJECT_ID) return DecodeError::InvalidTag;
    if (t.length != 4) return DecodeError::InvalidValue;
    uint32_t v = 0;
    e = read_unsigned_value(4, v);
    if (e != DecodeError::None) return e;
    out = ObjectIdentifier::unpack(v);
    return DecodeError::None;
}

DecodeError TagReader::read_ctx_unsigned(uint8_t tag, uint32_t& out) {
    Tag t;
    DecodeError e = read_tag(t);
    if (e != DecodeError::None) return e;
    if (!t.context || t.opening || t.closing || t.number != tag) return DecodeError::InvalidTag;
    return read_unsigned_value(t.length, out);
}

DecodeError TagReader::read_ctx_object_id(uint8_t tag, ObjectIdentifier& out) {
    Tag t;
    DecodeError e = read_tag(t);
    if (e != DecodeError::None) return e;
    if (!t.context || t.opening || t.closing || t.number != tag) return DecodeError::InvalidTag;
    if (t.length != 4) return DecodeError::InvalidValue;
    uint32_t v = 0;
    e = read_unsigned_value(4, v);
    if (e != DecodeError::None) return e;
    out = ObjectIdentifier::unpack(v);
    return DecodeError::None;
}

DecodeError TagReader::expect_opening(uint8_t tag) {
    Tag t;
    DecodeError e = read_tag(t);
    if (e != DecodeError::None) return e;
    return (t.opening && t.number == tag) ? DecodeError::None : DecodeError::InvalidTag;
}

DecodeError TagReader::expect_closing(uint8_t tag) {
    Tag t;
    DecodeError e = read_tag(t);
    if (e != DecodeError::None) return e;
    return (t.closing && t.number == tag) ? DecodeError::None : DecodeError::InvalidTag;
}

bool TagReader::next_is_context(uint8_t tag) const {
    Tag t;
    if (peek_tag(t) != DecodeError::None) return false;
    return t.context && !t.opening && !t.closing && t.number == tag;
}

DecodeError decode_app_real(const uint8_t* data, size_t len, float& out) {
    TagReader r(data, len);
    Tag t;
    DecodeError e = r.read_tag(t);
    if (e != DecodeError::None) return e;
    if (t.context || t.number != APP_TAG_REAL || t.length != 4) return DecodeError::InvalidTag;

    uint32_t bits = 0;
    e = r.read_unsigned_value(4, bits);
    if (e != DecodeError::None) return e;
    std::memcpy(&out, &bits, sizeof(out));
    return DecodeError::None;
}

} // namespace bacgate
