// ============================================================================
// npdu.cpp — implementation for bacgate/npdu.hpp
// ============================================================================

#include "bacgate/npdu.hpp"

namespace bacgate {

enum : uint8_t {
  NPDU_CTRL_NETWORK_MSG = 0x80,
  NPDU_CTRL_DNET        = 0x20,
  NPDU_CTRL_SNET        = 0x08,
  NPDU_CTRL_EXPECTING   = 0x04,
  NPDU_CTRL_PRIORITY    = 0x03
};

static void put_address(std::vector<uint8_t>& out, const NpduAddress& a) {
    out.push_back(static_cast<uint8_t>(a.net >> 8));
    out.push_back(static_cast<uint8_t>(a.net));
    out.push_back(static_cast<uint8_t>(a.mac.size()));
    out.insert(out.end(), a.mac.begin(), a.mac.end());
}

void encode_npdu(std::vector<uint8_t>& out, const Npdu& npdu) {
    uint8_t control = npdu.priority & NPDU_CTRL_PRIORITY;
    if (npdu.network_message) control |= NPDU_CTRL_NETWORK_MSG;
    if (npdu.destination)     control |= NPDU_CTRL_DNET;
    if (npdu.source)          control |= NPDU_CTRL_SNET;
    if (npdu.expecting_reply) control |= NPDU_CTRL_EXPECTING;

    out.push_back(npdu.version);
    out.push_back(control);

    if (npdu.destination) put_address(out, *npdu.destination);
    if (npdu.source)      put_address(out, *npdu.source);
    if (npdu.destination) out.push_back(npdu.hop_count);

    if (npdu.network_message) {
        out.push_back(npdu.message_type);
        if (npdu.message_type >= 0x80) {
            out.push_back(static_cast<uint8_t>(npdu.vendor_id >> 8));
            out.push_back(static_cast<uint8_t>(npdu.vendor_id));
        }
    }
}

// ---------------------------------------------------------------------------
// take_address()
// NET(2) LEN(1) ADDR(LEN), bounds-checked against len.
// ---------------------------------------------------------------------------
static bool take_address(const uint8_t* data, size_t len, size_t& i, NpduAddress& a) {
    if (len - i < 3) return false;
    a.net = static_cast<uint16_t>((data[i] << 8) | data[i + 1]);
    const uint8_t mlen = data[i + 2];
    i += 3;
    if (len - i < mlen) return false;
    a.mac.assign(data + i, data + i + mlen);
    i += mlen;
    return true;
}

DecodeError decode_npdu(const uint8_t* data, size_t len, Npdu& out, size_t& consumed) {
    if (!data || len < 2) return DecodeError::InvalidLength;
    if (data[0] != NPDU_VERSION) return DecodeError::InvalidVersion;

    Npdu n;
    n.version = data[0];
    const uint8_t control = data[1];
    n.network_message = (control & NPDU_CTRL_NETWORK_MSG) != 0;
    n.expecting_reply = (control & NPDU_CTRL_EXPECTING) != 0;
    n.priority        = control & NPDU_CTRL_PRIORITY;

    size_t i = 2;
    if (control & NPDU_CTRL_DNET) {
        NpduAddress d;
        if (!take_address(data, len, i, d)) return DecodeError::InvalidLength;
        n.destination = std::move(d);
    }
    if (control & NPDU_CTRL_SNET) {
        NpduAddress s;
        if (!take_address(data, len, i, s)) return DecodeError::InvalidLength;
        n.source = std::move(s);
    }
    if (n.destination) {
        if (i >= len) return DecodeError::InvalidLength;
        n.hop_count = data[i++];
    }
    if (n.network_message) {
        if (i >= len) return DecodeError::InvalidLength;
        n.message_type = data[i++];
        if (n.message_type >= 0x80) {
            if (len - i < 2) return DecodeError::InvalidLength;
            n.vendor_id = static_cast<uint16_t>((data[i] << 8) | data[i + 1]);
            i += 2;
        }
    }

    out = std::move(n);
    consumed = i;
    return DecodeError::None;
}

} // namespace bacgate
