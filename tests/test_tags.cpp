#include <doctest/doctest.h>
#include <vector>
#include "bacgate/tags.hpp"
using namespace bacgate;

using Bytes = std::vector<uint8_t>;

TEST_CASE("Application unsigned uses the shortest big-endian body") {
    Bytes b;
    encode_app_unsigned(b, 5);
    CHECK(b == Bytes{0x21, 0x05});

    b.clear();
    encode_app_unsigned(b, 256);
    CHECK(b == Bytes{0x22, 0x01, 0x00});

    b.clear();
    encode_app_unsigned(b, 1476);
    CHECK(b == Bytes{0x22, 0x05, 0xC4});

    b.clear();
    encode_app_unsigned(b, 0x01000000);
    CHECK(b == Bytes{0x24, 0x01, 0x00, 0x00, 0x00});
}

TEST_CASE("Context, opening and closing tags") {
    Bytes b;
    encode_ctx_unsigned(b, 0, 100);
    encode_opening_tag(b, 3);
    encode_closing_tag(b, 3);
    CHECK(b == Bytes{0x09, 0x64, 0x3E, 0x3F});
}

TEST_CASE("Extended tag numbers and extended lengths") {
    Bytes b;
    encode_ctx_unsigned(b, 20, 1);
    CHECK(b == Bytes{0xF9, 0x14, 0x01});

    b.clear();
    encode_tag(b, APP_TAG_CHAR_STR, false, 10);
    CHECK(b == Bytes{0x75, 0x0A});

    b.clear();
    encode_tag(b, APP_TAG_OCTET_STR, false, 300);
    CHECK(b == Bytes{0x65, 0xFE, 0x01, 0x2C});

    b.clear();
    encode_tag(b, APP_TAG_OCTET_STR, false, 70000);
    CHECK(b == Bytes{0x65, 0xFF, 0x00, 0x01, 0x11, 0x70});

    // read back the headers
    Bytes body(300, 0xAA);
    Bytes enc;
    encode_tag(enc, APP_TAG_OCTET_STR, false, 300);
    enc.insert(enc.end(), body.begin(), body.end());
    TagReader r(enc.data(), enc.size());
    Tag t;
    REQUIRE(r.read_tag(t) == DecodeError::None);
    CHECK(t.number == APP_TAG_OCTET_STR);
    CHECK_FALSE(t.context);
    CHECK(t.length == 300);
    CHECK(r.remaining() == 300);

    Bytes ext{0xF9, 0x14, 0x01};
    TagReader r2(ext.data(), ext.size());
    uint32_t v = 0;
    CHECK(r2.read_ctx_unsigned(20, v) == DecodeError::None);
    CHECK(v == 1);
    CHECK(r2.at_end());
}

TEST_CASE("REAL and object identifier encodings") {
    Bytes b;
    encode_app_real(b, 24.5f);
    CHECK(b == Bytes{0x44, 0x41, 0xC4, 0x00, 0x00});

    float f = 0.0f;
    CHECK(decode_app_real(b.data(), b.size(), f) == DecodeError::None);
    CHECK(f == 24.5f);

    b.clear();
    encode_app_object_id(b, ObjectIdentifier(ObjectType::Device, 42));
    CHECK(b == Bytes{0xC4, 0x02, 0x00, 0x00, 0x2A});

    TagReader r(b.data(), b.size());
    ObjectIdentifier oid;
    REQUIRE(r.read_app_object_id(oid) == DecodeError::None);
    CHECK(oid.type == ObjectType::Device);
    CHECK(oid.instance == 42);
}

TEST_CASE("ObjectIdentifier packs type into the top ten bits") {
    ObjectIdentifier oid(ObjectType::AnalogInput, MAX_INSTANCE);
    CHECK(oid.pack() == 0x003FFFFFu);
    CHECK(ObjectIdentifier::unpack(0x0200002Au) == ObjectIdentifier(ObjectType::Device, 42));
    CHECK(ObjectIdentifier::unpack(0xFFFFFFFFu).instance == MAX_INSTANCE);
}

TEST_CASE("TagReader never reads past the end") {
    SUBCASE("tag promising more bytes than remain") {
        Bytes b{0x22, 0x01};
        TagReader r(b.data(), b.size());
        uint32_t v = 0;
        CHECK(r.read_app_unsigned(v) == DecodeError::InvalidLength);
    }
    SUBCASE("empty buffer") {
        TagReader r(nullptr, 0);
        Tag t;
        CHECK(r.peek_tag(t) == DecodeError::InvalidLength);
        CHECK(r.at_end());
    }
    SUBCASE("extended length cut off") {
        Bytes b{0x65, 0xFE, 0x01};
        TagReader r(b.data(), b.size());
        Tag t;
        CHECK(r.read_tag(t) == DecodeError::InvalidLength);
    }
    SUBCASE("extended tag number cut off") {
        Bytes b{0xF9};
        TagReader r(b.data(), b.size());
        Tag t;
        CHECK(r.read_tag(t) == DecodeError::InvalidLength);
    }
    SUBCASE("REAL truncated") {
        Bytes b{0x44, 0x41, 0xC4};
        float f = 0.0f;
        CHECK(decode_app_real(b.data(), b.size(), f) == DecodeError::InvalidLength);
    }
}

TEST_CASE("TagReader rejects tags the grammar does not expect") {
    Bytes app_opening{0x26};
    TagReader r1(app_opening.data(), app_opening.size());
    Tag t;
    CHECK(r1.read_tag(t) == DecodeError::InvalidTag);

    Bytes ctx{0x09, 0x01};
    TagReader r2(ctx.data(), ctx.size());
    uint32_t v = 0;
    CHECK(r2.read_app_unsigned(v) == DecodeError::InvalidTag);

    TagReader r3(ctx.data(), ctx.size());
    CHECK(r3.read_ctx_unsigned(1, v) == DecodeError::InvalidTag);

    Bytes wide{0x25, 0x05, 1, 2, 3, 4, 5};
    TagReader r4(wide.data(), wide.size());
    CHECK(r4.read_app_unsigned(v) == DecodeError::InvalidValue);

    Bytes unsigned_not_real{0x21, 0x05};
    float f = 0.0f;
    CHECK(decode_app_real(unsigned_not_real.data(), unsigned_not_real.size(), f) == DecodeError::InvalidTag);
}

TEST_CASE("next_is_context peeks without consuming") {
    Bytes b{0x29, 0x03};
    TagReader r(b.data(), b.size());
    CHECK(r.next_is_context(2));
    CHECK_FALSE(r.next_is_context(1));
    CHECK(r.position() == 0);
}

TEST_CASE("decode_error_name gives log-friendly names") {
    CHECK(std::string(decode_error_name(DecodeError::InvalidLength)) == "invalid_length");
    CHECK(std::string(decode_error_name(DecodeError::SegmentationUnsupported)) == "segmentation_unsupported");
}
