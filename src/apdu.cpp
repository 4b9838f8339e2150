// ============================================================================
// apdu.cpp — implementation for bacgate/apdu.hpp
// ============================================================================

#include "bacgate/apdu.hpp"

#include <utility>

namespace bacgate {

enum : uint8_t {
  PDU_FLAG_SEG = 0x08,     // segmented message
  PDU_FLAG_MOR = 0x04,     // more follows
  PDU_FLAG_SA  = 0x02      // segmented response accepted (confirmed only)
};

Apdu Apdu::unconfirmed(uint8_t service, std::vector<uint8_t> data) {
    Apdu a;
    a.kind = ApduKind::UnconfirmedRequest;
    a.service_choice = service;
    a.service_data = std::move(data);
    return a;
}

Apdu Apdu::confirmed(uint8_t invoke_id, uint8_t service, std::vector<uint8_t> data) {
    Apdu a;
    a.kind = ApduKind::ConfirmedRequest;
    a.invoke_id = invoke_id;
    a.service_choice = service;
    a.service_data = std::move(data);
    return a;
}

Apdu Apdu::complex_ack(uint8_t invoke_id, uint8_t service, std::vector<uint8_t> data) {
    Apdu a;
    a.kind = ApduKind::ComplexAck;
    a.invoke_id = invoke_id;
    a.service_choice = service;
    a.service_data = std::move(data);
    return a;
}

void encode_apdu(std::vector<uint8_t>& out, const Apdu& apdu) {
    const uint8_t type = static_cast<uint8_t>(static_cast<uint8_t>(apdu.kind) << 4);
    switch (apdu.kind) {
        case ApduKind::ConfirmedRequest:
            out.push_back(static_cast<uint8_t>(type | (apdu.segmented_response_accepted ? PDU_FLAG_SA : 0)));
            out.push_back(static_cast<uint8_t>(((apdu.max_segments & 0x07) << 4) | (apdu.max_apdu & 0x0F)));
            out.push_back(apdu.invoke_id);
            out.push_back(apdu.service_choice);
            break;
        case ApduKind::UnconfirmedRequest:
            out.push_back(type);
            out.push_back(apdu.service_choice);
            break;
        case ApduKind::ComplexAck:
            out.push_back(type);
            out.push_back(apdu.invoke_id);
            out.push_back(apdu.service_choice);
            break;
    }
    out.insert(out.end(), apdu.service_data.begin(), apdu.service_data.end());
}

DecodeError decode_apdu(const uint8_t* data, size_t len, Apdu& out) {
    if (!data || len < 1) return DecodeError::InvalidLength;

    const uint8_t type  = data[0] >> 4;
    const uint8_t flags = data[0] & 0x0F;
    Apdu a;
    size_t body = 0;

    switch (type) {
        case 0: // Confirmed-Request
            if (flags & PDU_FLAG_SEG) return DecodeError::SegmentationUnsupported;
            if (len < 4) return DecodeError::InvalidLength;
            a.kind = ApduKind::ConfirmedRequest;
            a.segmented_response_accepted = (flags & PDU_FLAG_SA) != 0;
            a.max_segments   = (data[1] >> 4) & 0x07;
            a.max_apdu       = data[1] & 0x0F;
            a.invoke_id      = data[2];
            a.service_choice = data[3];
            body = 4;
            break;
        case 1: // Unconfirmed-Request
            if (len < 2) return DecodeError::InvalidLength;
            a.kind = ApduKind::UnconfirmedRequest;
            a.service_choice = data[1];
            body = 2;
            break;
        case 3: // Complex-ACK
            if (flags & PDU_FLAG_SEG) return DecodeError::SegmentationUnsupported;
            if (len < 3) return DecodeError::InvalidLength;
            a.kind = ApduKind::ComplexAck;
            a.invoke_id      = data[1];
            a.service_choice = data[2];
            body = 3;
            break;
        default:
            return DecodeError::UnsupportedPdu;
    }

    a.service_data.assign(data + body, data + len);
    out = std::move(a);
    return DecodeError::None;
}

} // namespace bacgate
