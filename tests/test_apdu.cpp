#include <doctest/doctest.h>
#include <vector>
#include "bacgate/apdu.hpp"
using namespace bacgate;

using Bytes = std::vector<uint8_t>;

TEST_CASE("Unconfirmed request header") {
    Bytes b;
    encode_apdu(b, Apdu::unconfirmed(SERVICE_WHO_IS, {}));
    CHECK(b == Bytes{0x10, 0x08});

    Apdu a;
    REQUIRE(decode_apdu(b.data(), b.size(), a) == DecodeError::None);
    CHECK(a.kind == ApduKind::UnconfirmedRequest);
    CHECK(a.service_choice == SERVICE_WHO_IS);
    CHECK(a.service_data.empty());
}

TEST_CASE("Confirmed request header advertises 1476-octet APDUs") {
    Bytes b;
    encode_apdu(b, Apdu::confirmed(7, SERVICE_READ_PROPERTY, {0x0C, 0x00, 0x00, 0x00, 0x00, 0x19, 0x55}));
    CHECK(b == Bytes{0x02, 0x05, 0x07, 0x0C, 0x0C, 0x00, 0x00, 0x00, 0x00, 0x19, 0x55});

    Apdu a;
    REQUIRE(decode_apdu(b.data(), b.size(), a) == DecodeError::None);
    CHECK(a.kind == ApduKind::ConfirmedRequest);
    CHECK(a.invoke_id == 7);
    CHECK(a.max_apdu == MAX_APDU_CODE_1476);
    CHECK(a.segmented_response_accepted);
    CHECK(a.service_data.size() == 7);
}

TEST_CASE("Complex ACK header") {
    Bytes b{0x30, 0x2A, 0x0C, 0xAA};
    Apdu a;
    REQUIRE(decode_apdu(b.data(), b.size(), a) == DecodeError::None);
    CHECK(a.kind == ApduKind::ComplexAck);
    CHECK(a.invoke_id == 42);
    CHECK(a.service_choice == SERVICE_READ_PROPERTY);
    CHECK(a.service_data == Bytes{0xAA});

    Bytes again;
    encode_apdu(again, a);
    CHECK(again == b);
}

TEST_CASE("Segmented and unsupported PDUs are refused") {
    Apdu a;
    Bytes seg_ack{0x38, 0x01, 0x00, 0x0C};
    CHECK(decode_apdu(seg_ack.data(), seg_ack.size(), a) == DecodeError::SegmentationUnsupported);

    Bytes seg_req{0x08, 0x05, 0x01, 0x0C};
    CHECK(decode_apdu(seg_req.data(), seg_req.size(), a) == DecodeError::SegmentationUnsupported);

    Bytes simple_ack{0x20, 0x01, 0x0F};
    CHECK(decode_apdu(simple_ack.data(), simple_ack.size(), a) == DecodeError::UnsupportedPdu);

    Bytes error_pdu{0x50, 0x01, 0x0C, 0x91, 0x02};
    CHECK(decode_apdu(error_pdu.data(), error_pdu.size(), a) == DecodeError::UnsupportedPdu);
}

TEST_CASE("Truncated APDU headers") {
    Apdu a;
    CHECK(decode_apdu(nullptr, 0, a) == DecodeError::InvalidLength);

    Bytes u{0x10};
    CHECK(decode_apdu(u.data(), u.size(), a) == DecodeError::InvalidLength);

    Bytes c{0x00, 0x05, 0x01};
    CHECK(decode_apdu(c.data(), c.size(), a) == DecodeError::InvalidLength);

    Bytes k{0x30, 0x01};
    CHECK(decode_apdu(k.data(), k.size(), a) == DecodeError::InvalidLength);
}
