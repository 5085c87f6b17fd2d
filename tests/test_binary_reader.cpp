#include <catch2/catch_test_macros.hpp>
#include "core/binary_reader.hpp"

using namespace halon;

TEST_CASE("BinaryReader reads little-endian scalars", "[binary]") {
    const u8 data[] = {0x2a, 0x34, 0x12, 0x78, 0x56, 0x34, 0x12,
                       0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01};
    BinaryReader r(data, sizeof(data));

    CHECK(r.read_u8() == 0x2a);
    CHECK(r.read_u16() == 0x1234);
    CHECK(r.read_u32() == 0x12345678u);
    CHECK(r.read_u64() == 0x0102030405060708ull);
    CHECK_FALSE(r.failed());
    CHECK(r.remaining() == 0);
}

TEST_CASE("BinaryReader fixed and length-prefixed reads", "[binary]") {
    const u8 data[] = {'K', 'C', 'A', 'P', 3, 0, 0, 0, 'a', 'b', 'c',
                       'x', 'y', 0, 'z'};
    BinaryReader r(data, sizeof(data));

    auto magic = r.read_fixed<4>();
    CHECK(magic == std::array<u8, 4>{'K', 'C', 'A', 'P'});
    CHECK(r.read_length_prefixed_string() == "abc");
    CHECK(r.read_cstring() == "xy");
    CHECK(r.position() == 14);
    CHECK_FALSE(r.failed());
}

TEST_CASE("BinaryReader fails sticky on truncation", "[binary]") {
    const u8 data[] = {1, 2, 3};
    BinaryReader r(data, sizeof(data));

    CHECK(r.read_u32() == 0);
    CHECK(r.failed());
    // Later reads stay failed even though a u8 would fit
    CHECK(r.read_u8() == 0);
    CHECK(r.position() == 0);

    auto err = r.error("Header");
    CHECK(err.code == ErrorCode::TruncatedData);
    CHECK(err.message.find("Header") != std::string::npos);
}

TEST_CASE("BinaryReader length prefix beyond buffer", "[binary]") {
    const u8 data[] = {200, 0, 0, 0, 'a', 'b'};
    BinaryReader r(data, sizeof(data));

    CHECK(r.read_length_prefixed_string().empty());
    CHECK(r.failed());
}

TEST_CASE("BinaryReader cstring keeps bytes above 0x7f", "[binary]") {
    const u8 data[] = {0xe9, 't', 0xe9, 0, 'n'};
    BinaryReader r(data, sizeof(data));

    CHECK(r.read_cstring() == std::string("\xe9t\xe9"));
    CHECK(r.position() == 4);
    CHECK(r.read_u8() == 'n');
    CHECK_FALSE(r.failed());
}

TEST_CASE("BinaryReader unterminated cstring", "[binary]") {
    const u8 data[] = {'a', 'b', 'c'};
    BinaryReader r(data, sizeof(data));

    CHECK(r.read_cstring().empty());
    CHECK(r.failed());
}

TEST_CASE("BinaryReader seek and skip", "[binary]") {
    const u8 data[] = {0, 0, 0, 0, 9, 0, 0, 0};
    BinaryReader r(data, sizeof(data));

    r.skip(4);
    CHECK(r.read_u32() == 9);
    r.seek(0);
    CHECK(r.read_u32() == 0);
    CHECK(r.has_remaining(4));
    CHECK_FALSE(r.has_remaining(5));

    r.seek(9);
    CHECK(r.failed());
}
