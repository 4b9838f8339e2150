// ============================================================================
// services.cpp — implementation for bacgate/services.hpp
// ============================================================================

#include "bacgate/services.hpp"
#include "bacgate/tags.hpp"

namespace bacgate {

// ============================================================================
// Who-Is
// ============================================================================

void encode_who_is(std::vector<uint8_t>& out, const WhoIs& req) {
    if (!req.range) return;                       // empty body = everybody
    encode_ctx_unsigned(out, 0, req.range->low);
    encode_ctx_unsigned(out, 1, req.range->high);
}

DecodeError decode_who_is(const uint8_t* data, size_t len, WhoIs& out) {
    TagReader r(data, len);
    WhoIs w;

    if (!r.at_end()) {
        InstanceRange range;
        if (const DecodeError e = r.read_ctx_unsigned(0, range.low); e != DecodeError::None) return e;
        if (r.at_end()) return DecodeError::InvalidTag;    // low without high
        if (const DecodeError e = r.read_ctx_unsigned(1, range.high); e != DecodeError::None) return e;
        if (range.low > MAX_INSTANCE || range.high > MAX_INSTANCE || range.low > range.high)
            return DecodeError::InvalidValue;
        w.range = range;
    }
    if (!r.at_end()) return DecodeError::InvalidLength;

    out = w;
    return DecodeError::None;
}

// ============================================================================
// I-Am
// ============================================================================

void encode_i_am(std::vector<uint8_t>& out, const IAm& ann) {
    encode_app_object_id(out, ann.device);
    encode_app_unsigned(out, ann.max_apdu);
    encode_app_enumerated(out, static_cast<uint32_t>(ann.segmentation));
    encode_app_unsigned(out, ann.vendor_id);
}

DecodeError decode_i_am(const uint8_t* data, size_t len, IAm& out) {
    TagReader r(data, len);
    IAm a;
    uint32_t seg = 0;
    uint32_t vendor = 0;

    if (const DecodeError e = r.read_app_object_id(a.device); e != DecodeError::None) return e;
    if (const DecodeError e = r.read_app_unsigned(a.max_apdu); e != DecodeError::None) return e;
    if (const DecodeError e = r.read_app_enumerated(seg); e != DecodeError::None) return e;
    if (const DecodeError e = r.read_app_unsigned(vendor); e != DecodeError::None) return e;
    if (!r.at_end()) return DecodeError::InvalidLength;

    if (!a.device.is_device() || seg > static_cast<uint32_t>(Segmentation::None) || vendor > 0xFFFF)
        return DecodeError::InvalidValue;

    a.segmentation = static_cast<Segmentation>(seg);
    a.vendor_id = static_cast<uint16_t>(vendor);
    out = a;
    return DecodeError::None;
}

// ============================================================================
// ReadProperty
// ============================================================================

// ---------------------------------------------------------------------------
// Shared head of request and ACK: [0] object, [1] property, [2] index.
// ---------------------------------------------------------------------------
static void encode_rp_head(std::vector<uint8_t>& out, const ObjectIdentifier& obj,
                           uint32_t property, const std::optional<uint32_t>& index) {
    encode_ctx_object_id(out, 0, obj);
    encode_ctx_enumerated(out, 1, property);
    if (index) encode_ctx_unsigned(out, 2, *index);
}

static DecodeError decode_rp_head(TagReader& r, ObjectIdentifier& obj,
                                  uint32_t& property, std::optional<uint32_t>& index) {
    if (const DecodeError e = r.read_ctx_object_id(0, obj); e != DecodeError::None) return e;
    if (const DecodeError e = r.read_ctx_unsigned(1, property); e != DecodeError::None) return e;
    index.reset();
    if (r.next_is_context(2)) {
        uint32_t i = 0;
        if (const DecodeError e = r.read_ctx_unsigned(2, i); e != DecodeError::None) return e;
        index = i;
    }
    return DecodeError::None;
}

void encode_read_property(std::vector<uint8_t>& out, const ReadPropertyRequest& req) {
    encode_rp_head(out, req.object, req.property, req.array_index);
}

DecodeError decode_read_property(const uint8_t* data, size_t len, ReadPropertyRequest& out) {
    TagReader r(data, len);
    ReadPropertyRequest req;
    if (const DecodeError e = decode_rp_head(r, req.object, req.property, req.array_index); e != DecodeError::None)
        return e;
    if (!r.at_end()) return DecodeError::InvalidLength;
    out = req;
    return DecodeError::None;
}

PropertyValue PropertyValue::real(float v) {
    PropertyValue pv;
    pv.app_tag = APP_TAG_REAL;
    encode_app_real(pv.raw, v);
    return pv;
}

void encode_read_property_ack(std::vector<uint8_t>& out, const ReadPropertyAck& ack) {
    encode_rp_head(out, ack.object, ack.property, ack.array_index);
    encode_opening_tag(out, 3);
    out.insert(out.end(), ack.value.raw.begin(), ack.value.raw.end());
    encode_closing_tag(out, 3);
}

// ---------------------------------------------------------------------------
// read_value_block()
// Walk the tags inside [3] ... [3], tracking nested opening/closing pairs,
// and copy the octets verbatim. The matching closing tag 3 is consumed.
// ---------------------------------------------------------------------------
static DecodeError read_value_block(TagReader& r, PropertyValue& out) {
    if (const DecodeError e = r.expect_opening(3); e != DecodeError::None) return e;

    const uint8_t* begin = r.cursor();
    size_t depth = 0;
    bool first = true;

    for (;;) {
        Tag t;
        if (const DecodeError e = r.peek_tag(t); e != DecodeError::None) return e;
        if (t.closing && depth == 0) {
            if (t.number != 3 || first) return first ? DecodeError::InvalidValue : DecodeError::InvalidTag;
            const uint8_t* end = r.cursor();
            out.raw.assign(begin, end);
            return r.expect_closing(3);
        }

        if (const DecodeError e = r.read_tag(t); e != DecodeError::None) return e;
        if (first) {
            if (t.context) return DecodeError::InvalidTag;   // value must start application-tagged
            out.app_tag = t.number;
            first = false;
        }
        if (t.opening) {
            ++depth;
        } else if (t.closing) {
            --depth;
        } else if (const DecodeError e = r.skip(t.length); e != DecodeError::None) {
            return e;
        }
    }
}

DecodeError decode_read_property_ack(const uint8_t* data, size_t len, ReadPropertyAck& out) {
    TagReader r(data, len);
    ReadPropertyAck ack;
    if (const DecodeError e = decode_rp_head(r, ack.object, ack.property, ack.array_index); e != DecodeError::None)
        return e;
    if (const DecodeError e = read_value_block(r, ack.value); e != DecodeError::None) return e;
    if (!r.at_end()) return DecodeError::InvalidLength;
    out = std::move(ack);
    return DecodeError::None;
}

std::optional<float> decode_real(const PropertyValue& value) {
    if (value.app_tag != APP_TAG_REAL || value.raw.size() != 5) return std::nullopt;
    float f = 0.0f;
    if (decode_app_real(value.raw.data(), value.raw.size(), f) != DecodeError::None) return std::nullopt;
    return f;
}

} // namespace bacgate
