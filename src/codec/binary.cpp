// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/binary.h"

#include <string>

namespace codec {

namespace {

template <std::unsigned_integral UInt>
core::Result<UInt> read_uint(ByteSpan buf, size_t& offset, Endian e,
                             const char* what) {
    auto bytes = read_bytes(buf, offset, sizeof(UInt));
    if (!bytes.ok()) {
        return bytes.error().wrap(what);
    }
    return load_uint<UInt>(bytes.value().data(), e);
}

template <typename Signed, std::unsigned_integral UInt>
core::Result<Signed> read_signed(ByteSpan buf, size_t& offset, Endian e,
                                 const char* what) {
    return read_uint<UInt>(buf, offset, e, what).map(
        [](UInt u) { return static_cast<Signed>(u); });
}

template <typename Float, std::unsigned_integral UInt>
core::Result<Float> read_float(ByteSpan buf, size_t& offset, Endian e,
                               const char* what) {
    static_assert(sizeof(Float) == sizeof(UInt));
    return read_uint<UInt>(buf, offset, e, what).map([](UInt bits) {
        Float v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    });
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Raw bytes
// ---------------------------------------------------------------------------

core::Result<ByteSpan> read_bytes(ByteSpan buf, size_t& offset,
                                  size_t length) {
    if (offset > buf.size() || length > buf.size() - offset) {
        const size_t have = offset > buf.size() ? 0 : buf.size() - offset;
        return core::make_error(
            core::ErrorCode::INSUFFICIENT_BYTES,
            "need " + std::to_string(length) + " bytes at offset " +
            std::to_string(offset) + ", " + std::to_string(have) +
            " available");
    }
    ByteSpan out = buf.subspan(offset, length);
    offset += length;
    return out;
}

// ---------------------------------------------------------------------------
// Single-byte kinds
// ---------------------------------------------------------------------------

core::Result<bool> read_bool(ByteSpan buf, size_t& offset) {
    return read_uint<uint8_t>(buf, offset, Endian::BIG, "read_bool")
        .map([](uint8_t b) { return b != 0x00; });
}

core::Result<uint8_t> read_u8(ByteSpan buf, size_t& offset) {
    return read_uint<uint8_t>(buf, offset, Endian::BIG, "read_u8");
}

core::Result<int8_t> read_i8(ByteSpan buf, size_t& offset) {
    return read_signed<int8_t, uint8_t>(buf, offset, Endian::BIG, "read_i8");
}

// ---------------------------------------------------------------------------
// Fixed-width integers
// ---------------------------------------------------------------------------

core::Result<uint16_t> read_u16(ByteSpan buf, size_t& offset, Endian e) {
    return read_uint<uint16_t>(buf, offset, e, "read_u16");
}

core::Result<int16_t> read_i16(ByteSpan buf, size_t& offset, Endian e) {
    return read_signed<int16_t, uint16_t>(buf, offset, e, "read_i16");
}

core::Result<uint32_t> read_u32(ByteSpan buf, size_t& offset, Endian e) {
    return read_uint<uint32_t>(buf, offset, e, "read_u32");
}

core::Result<int32_t> read_i32(ByteSpan buf, size_t& offset, Endian e) {
    return read_signed<int32_t, uint32_t>(buf, offset, e, "read_i32");
}

core::Result<uint64_t> read_u64(ByteSpan buf, size_t& offset, Endian e) {
    return read_uint<uint64_t>(buf, offset, e, "read_u64");
}

core::Result<int64_t> read_i64(ByteSpan buf, size_t& offset, Endian e) {
    return read_signed<int64_t, uint64_t>(buf, offset, e, "read_i64");
}

// ---------------------------------------------------------------------------
// IEEE-754
// ---------------------------------------------------------------------------

core::Result<float> read_f32(ByteSpan buf, size_t& offset, Endian e) {
    return read_float<float, uint32_t>(buf, offset, e, "read_f32");
}

core::Result<double> read_f64(ByteSpan buf, size_t& offset, Endian e) {
    return read_float<double, uint64_t>(buf, offset, e, "read_f64");
}

// ---------------------------------------------------------------------------
// Triads
// ---------------------------------------------------------------------------

core::Result<uint32_t> read_triad(ByteSpan buf, size_t& offset, Endian e) {
    auto bytes = read_bytes(buf, offset, 3);
    if (!bytes.ok()) {
        return bytes.error().wrap("read_triad");
    }
    const uint8_t* b = bytes.value().data();
    uint32_t v;
    if (e == Endian::BIG) {
        v = static_cast<uint32_t>(b[2])
          | (static_cast<uint32_t>(b[1]) << 8)
          | (static_cast<uint32_t>(b[0]) << 16);
    } else {
        v = static_cast<uint32_t>(b[0])
          | (static_cast<uint32_t>(b[1]) << 8)
          | (static_cast<uint32_t>(b[2]) << 16);
    }
    return v & TRIAD_READ_MASK;
}

// ---------------------------------------------------------------------------
// Length-prefixed strings and byte blobs
// ---------------------------------------------------------------------------

core::Result<std::string> read_string(ByteSpan buf, size_t& offset) {
    size_t pos = offset;
    auto len = read_uvarint32(buf, pos);
    if (!len.ok()) {
        return len.error().wrap("read_string: length");
    }
    auto bytes = read_bytes(buf, pos, len.value());
    if (!bytes.ok()) {
        return bytes.error().wrap("read_string: body");
    }
    offset = pos;
    const ByteSpan body = bytes.value();
    return std::string(reinterpret_cast<const char*>(body.data()),
                       body.size());
}

core::Result<Bytes> read_length_prefixed_bytes(ByteSpan buf, size_t& offset) {
    size_t pos = offset;
    auto len = read_uvarint32(buf, pos);
    if (!len.ok()) {
        return len.error().wrap("read_length_prefixed_bytes: length");
    }
    auto bytes = read_bytes(buf, pos, len.value());
    if (!bytes.ok()) {
        return bytes.error().wrap("read_length_prefixed_bytes: body");
    }
    offset = pos;
    return Bytes(bytes.value().begin(), bytes.value().end());
}

}  // namespace codec
