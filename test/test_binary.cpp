// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the fixed-width primitive codec.

#include "test_framework.h"

#include "codec/binary.h"
#include "codec/buffer.h"
#include "codec/endian.h"
#include "core/error.h"
#include "core/hex.h"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

using codec::Endian;

namespace {

template <typename Fn>
std::string encode_hex(Fn&& fn) {
    codec::ByteBuilder b;
    fn(b);
    return core::to_hex(b.view());
}

uint32_t float_bits(float f) {
    uint32_t u;
    std::memcpy(&u, &f, sizeof(u));
    return u;
}

uint64_t double_bits(double d) {
    uint64_t u;
    std::memcpy(&u, &d, sizeof(u));
    return u;
}

float float_from_bits(uint32_t u) {
    float f;
    std::memcpy(&f, &u, sizeof(f));
    return f;
}

} // anonymous namespace

// ============================================================================
// Endian helpers
// ============================================================================

TEST_CASE(Endian, parse_names) {
    CHECK(codec::parse_endian("big") == Endian::BIG);
    CHECK(codec::parse_endian("BE") == Endian::BIG);
    CHECK(codec::parse_endian("Little") == Endian::LITTLE);
    CHECK(codec::parse_endian("le") == Endian::LITTLE);
    CHECK(!codec::parse_endian("middle").has_value());
    CHECK_EQ(codec::endian_name(Endian::LITTLE), std::string_view("little"));
}

TEST_CASE(Endian, store_and_load) {
    uint8_t buf[4];
    codec::store_uint<uint32_t>(buf, 0x01020304u, Endian::BIG);
    CHECK_EQ(buf[0], 0x01);
    CHECK_EQ(buf[3], 0x04);
    CHECK_EQ(codec::load_uint<uint32_t>(buf, Endian::BIG), 0x01020304u);
    CHECK_EQ(codec::load_uint<uint32_t>(buf, Endian::LITTLE), 0x04030201u);
}

// ============================================================================
// Byte layout of the fixed-width kinds
// ============================================================================

TEST_CASE(Binary, integer_byte_order) {
    CHECK_EQ(encode_hex([](auto& b) { codec::write_u16(b, 0x0102); }),
             std::string("0102"));
    CHECK_EQ(encode_hex([](auto& b) {
                 codec::write_u16(b, 0x0102, Endian::LITTLE);
             }),
             std::string("0201"));
    CHECK_EQ(encode_hex([](auto& b) { codec::write_i32(b, -1); }),
             std::string("ffffffff"));
    CHECK_EQ(encode_hex([](auto& b) {
                 codec::write_u32(b, 0xdeadbeef, Endian::LITTLE);
             }),
             std::string("efbeadde"));
    CHECK_EQ(encode_hex([](auto& b) {
                 codec::write_i64(b, std::numeric_limits<int64_t>::min());
             }),
             std::string("8000000000000000"));
}

TEST_CASE(Binary, float_byte_order) {
    CHECK_EQ(encode_hex([](auto& b) { codec::write_f32(b, 1.0f); }),
             std::string("3f800000"));
    CHECK_EQ(encode_hex([](auto& b) {
                 codec::write_f64(b, 1.0, Endian::LITTLE);
             }),
             std::string("000000000000f03f"));
}

TEST_CASE(Binary, single_byte_kinds) {
    CHECK_EQ(encode_hex([](auto& b) {
                 codec::write_bool(b, true);
                 codec::write_bool(b, false);
                 codec::write_i8(b, -2);
                 codec::write_u8(b, 0x7f);
             }),
             std::string("0100fe7f"));

    std::vector<uint8_t> data = {0x02, 0x00, 0xfe};
    size_t off = 0;
    CHECK(codec::read_bool(data, off).value());
    CHECK(!codec::read_bool(data, off).value());
    CHECK_EQ(codec::read_i8(data, off).value(), -2);
    CHECK_EQ(off, 3u);
}

// ============================================================================
// Round trips
// ============================================================================

TEST_CASE(Binary, integer_roundtrip_extremes) {
    for (Endian e : {Endian::BIG, Endian::LITTLE}) {
        codec::ByteBuilder b;
        codec::write_i16(b, std::numeric_limits<int16_t>::min(), e);
        codec::write_u16(b, std::numeric_limits<uint16_t>::max(), e);
        codec::write_i32(b, std::numeric_limits<int32_t>::max(), e);
        codec::write_u32(b, 0, e);
        codec::write_i64(b, -1, e);
        codec::write_u64(b, std::numeric_limits<uint64_t>::max(), e);

        auto buf = b.finish();
        size_t off = 0;
        CHECK_EQ(codec::read_i16(buf, off, e).value(),
                 std::numeric_limits<int16_t>::min());
        CHECK_EQ(codec::read_u16(buf, off, e).value(),
                 std::numeric_limits<uint16_t>::max());
        CHECK_EQ(codec::read_i32(buf, off, e).value(),
                 std::numeric_limits<int32_t>::max());
        CHECK_EQ(codec::read_u32(buf, off, e).value(), 0u);
        CHECK_EQ(codec::read_i64(buf, off, e).value(), -1);
        CHECK_EQ(codec::read_u64(buf, off, e).value(),
                 std::numeric_limits<uint64_t>::max());
        CHECK_EQ(off, buf.size());
    }
}

TEST_CASE(Binary, float_special_values) {
    const float qnan = float_from_bits(0x7fc00001u);
    const float inf  = std::numeric_limits<float>::infinity();

    for (Endian e : {Endian::BIG, Endian::LITTLE}) {
        codec::ByteBuilder b;
        codec::write_f32(b, qnan, e);
        codec::write_f32(b, -inf, e);
        codec::write_f64(b, std::numeric_limits<double>::quiet_NaN(), e);
        codec::write_f64(b, -0.0, e);
        auto buf = b.finish();

        size_t off = 0;
        float n = codec::read_f32(buf, off, e).value();
        CHECK(std::isnan(n));
        CHECK_EQ(float_bits(n), 0x7fc00001u);

        float ninf = codec::read_f32(buf, off, e).value();
        CHECK(std::isinf(ninf));
        CHECK(ninf < 0);

        double dn = codec::read_f64(buf, off, e).value();
        CHECK_EQ(double_bits(dn),
                 double_bits(std::numeric_limits<double>::quiet_NaN()));

        double nz = codec::read_f64(buf, off, e).value();
        CHECK_EQ(double_bits(nz), 0x8000000000000000ull);
    }
}

// ============================================================================
// Triads
// ============================================================================

TEST_CASE(Triad, byte_order) {
    CHECK_EQ(encode_hex([](auto& b) { codec::write_triad(b, 0x123456); }),
             std::string("123456"));
    CHECK_EQ(encode_hex([](auto& b) {
                 codec::write_triad(b, 0x123456, Endian::LITTLE);
             }),
             std::string("563412"));
}

TEST_CASE(Triad, read_masks_top_nibble) {
    codec::ByteBuilder b;
    codec::write_triad(b, 0xFFFFFFFFu, Endian::LITTLE);
    CHECK_EQ(core::to_hex(b.view()), std::string("ffffff"));

    auto buf = b.finish();
    size_t off = 0;
    CHECK_EQ(codec::read_triad(buf, off, Endian::LITTLE).value(), 0x000FFFFFu);
    CHECK_EQ(off, 3u);
}

TEST_CASE(Triad, read_masks_top_nibble_big_endian) {
    codec::ByteBuilder b;
    codec::write_triad(b, 0xFFFFFFFFu, Endian::BIG);
    codec::write_triad(b, 0x00F12345u, Endian::BIG);
    CHECK_EQ(core::to_hex(b.view()), std::string("fffffff12345"));

    auto buf = b.finish();
    size_t off = 0;
    CHECK_EQ(codec::read_triad(buf, off, Endian::BIG).value(), 0x000FFFFFu);
    CHECK_EQ(off, 3u);
    // The masked nibble is the high half of the first byte.
    CHECK_EQ(codec::read_triad(buf, off, Endian::BIG).value(), 0x00012345u);
    CHECK_EQ(off, 6u);
}

TEST_CASE(Triad, roundtrip_within_mask) {
    for (Endian e : {Endian::BIG, Endian::LITTLE}) {
        codec::ByteBuilder b;
        codec::write_triad(b, 0x0ABCDE, e);
        auto buf = b.finish();
        size_t off = 0;
        CHECK_EQ(codec::read_triad(buf, off, e).value(), 0x0ABCDEu);
    }
}

// ============================================================================
// Strings and byte blobs
// ============================================================================

TEST_CASE(String, hello_layout) {
    codec::ByteBuilder b;
    codec::write_string(b, "hello");
    CHECK_EQ(core::to_hex(b.view()), std::string("0568656c6c6f"));

    auto buf = b.finish();
    size_t off = 0;
    auto s = codec::read_string(buf, off);
    CHECK_OK(s);
    CHECK_EQ(s.value(), std::string("hello"));
    CHECK_EQ(off, 6u);
}

TEST_CASE(String, empty_and_long) {
    codec::ByteBuilder b;
    codec::write_string(b, "");
    codec::write_string(b, std::string(200, 'x'));
    auto buf = b.finish();

    CHECK_EQ(buf[0], 0x00);
    CHECK_EQ(buf[1], 0xc8);  // 200 -> c8 01
    CHECK_EQ(buf[2], 0x01);

    size_t off = 0;
    CHECK_EQ(codec::read_string(buf, off).value(), std::string(""));
    CHECK_EQ(codec::read_string(buf, off).value().size(), 200u);
    CHECK_EQ(off, buf.size());
}

TEST_CASE(String, truncated_body_leaves_offset) {
    std::vector<uint8_t> buf = {0x05, 'h', 'e'};
    size_t off = 0;
    CHECK_ERR_CODE(codec::read_string(buf, off),
                   core::ErrorCode::INSUFFICIENT_BYTES);
    CHECK_EQ(off, 0u);
}

TEST_CASE(String, length_prefix_limit) {
    CHECK(codec::fits_length_prefix(0));
    CHECK(codec::fits_length_prefix(0xFFFFFFFFull));
    CHECK(!codec::fits_length_prefix(static_cast<size_t>(0x100000000ull)));
    CHECK_EQ(codec::MAX_PREFIXED_LENGTH, size_t{0xFFFFFFFFu});
}

TEST_CASE(String, length_prefixed_bytes) {
    std::vector<uint8_t> blob = {0xde, 0xad};
    codec::ByteBuilder b;
    codec::write_length_prefixed_bytes(b, blob);
    CHECK_EQ(core::to_hex(b.view()), std::string("02dead"));

    auto buf = b.finish();
    size_t off = 0;
    CHECK(codec::read_length_prefixed_bytes(buf, off).value() == blob);
}

// ============================================================================
// Insufficient bytes
// ============================================================================

TEST_CASE(Binary, insufficient_bytes_leaves_offset) {
    std::vector<uint8_t> buf = {0x01, 0x02, 0x03};
    size_t off = 1;
    auto r = codec::read_u32(buf, off);
    CHECK_ERR_CODE(r, core::ErrorCode::INSUFFICIENT_BYTES);
    CHECK(r.error().message().find("read_u32") == 0);
    CHECK_EQ(off, 1u);

    CHECK_ERR_CODE(codec::read_triad(buf, off),
                   core::ErrorCode::INSUFFICIENT_BYTES);
    CHECK_EQ(off, 1u);

    std::vector<uint8_t> empty;
    size_t zero = 0;
    CHECK_ERR_CODE(codec::read_u8(empty, zero),
                   core::ErrorCode::INSUFFICIENT_BYTES);
}

TEST_CASE(Binary, read_bytes_bounds) {
    std::vector<uint8_t> buf = {0x01, 0x02, 0x03};
    size_t off = 0;
    auto all = codec::read_bytes(buf, off, 3);
    CHECK_OK(all);
    CHECK_EQ(all.value().size(), 3u);

    auto none = codec::read_bytes(buf, off, 0);
    CHECK_OK(none);
    CHECK_EQ(off, 3u);

    size_t past = 5;
    CHECK_ERR_CODE(codec::read_bytes(buf, past, 0),
                   core::ErrorCode::INSUFFICIENT_BYTES);
}

// ============================================================================
// Sinks
// ============================================================================

TEST_CASE(Sink, vector_writer_appends) {
    std::vector<uint8_t> out = {0xaa};
    codec::VectorWriter w(out);
    codec::write_u16(w, 0x0102, Endian::LITTLE);
    CHECK_EQ(core::to_hex(out), std::string("aa0201"));
}

TEST_CASE(Sink, builder_finish_empties) {
    codec::ByteBuilder b(16);
    CHECK(b.empty());
    codec::write_u8(b, 1);
    CHECK_EQ(b.size(), 1u);
    auto bytes = b.finish();
    CHECK_EQ(bytes.size(), 1u);
    CHECK(b.empty());
}
