#pragma once
// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/buffer.h"
#include "codec/endian.h"
#include "codec/varint.h"
#include "core/error.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <string>
#include <string_view>

namespace codec {

// ===================================================================
// Primitive codec
// ===================================================================
//
// Writes append to any ByteSink and cannot fail. Reads take an immutable
// view plus an explicit cursor, return core::Result<T>, and advance the
// cursor only on success.
//
// Multi-byte kinds take an Endian tag (default BIG). Signed kinds are the
// two's-complement reinterpretation of the unsigned pattern; floats are
// the IEEE-754 bit pattern, so NaN payloads survive a round trip.
// ===================================================================

/// Byte mask applied to triads on read: the most significant byte keeps
/// only its low nibble, so a triad carries 20 bits.
inline constexpr uint32_t TRIAD_READ_MASK = 0x000FFFFF;

// -------------------------------------------------------------------
// Raw bytes
// -------------------------------------------------------------------

/// The single read primitive: a view of @p length bytes at @p offset.
/// Fails with INSUFFICIENT_BYTES when fewer than @p length bytes remain.
[[nodiscard]] core::Result<ByteSpan> read_bytes(ByteSpan buf, size_t& offset,
                                                size_t length);

template <ByteSink Sink>
inline void write_byte(Sink& s, uint8_t v) {
    s.write(std::span<const uint8_t>(&v, 1));
}

template <ByteSink Sink>
inline void write_raw(Sink& s, std::span<const uint8_t> data) {
    if (!data.empty()) {
        s.write(data);
    }
}

// -------------------------------------------------------------------
// Single-byte kinds
// -------------------------------------------------------------------

template <ByteSink Sink>
inline void write_bool(Sink& s, bool v) {
    write_byte(s, static_cast<uint8_t>(v ? 0x01 : 0x00));
}

template <ByteSink Sink>
inline void write_u8(Sink& s, uint8_t v) {
    write_byte(s, v);
}

template <ByteSink Sink>
inline void write_i8(Sink& s, int8_t v) {
    write_byte(s, static_cast<uint8_t>(v));
}

/// Any nonzero byte decodes as true.
[[nodiscard]] core::Result<bool>    read_bool(ByteSpan buf, size_t& offset);
[[nodiscard]] core::Result<uint8_t> read_u8(ByteSpan buf, size_t& offset);
[[nodiscard]] core::Result<int8_t>  read_i8(ByteSpan buf, size_t& offset);

// -------------------------------------------------------------------
// Fixed-width integers
// -------------------------------------------------------------------

template <ByteSink Sink, std::unsigned_integral UInt>
inline void write_uint(Sink& s, UInt v, Endian e) {
    uint8_t buf[sizeof(UInt)];
    store_uint(buf, v, e);
    s.write(std::span<const uint8_t>(buf, sizeof(UInt)));
}

template <ByteSink Sink>
inline void write_u16(Sink& s, uint16_t v, Endian e = Endian::BIG) {
    write_uint(s, v, e);
}

template <ByteSink Sink>
inline void write_i16(Sink& s, int16_t v, Endian e = Endian::BIG) {
    write_uint(s, static_cast<uint16_t>(v), e);
}

template <ByteSink Sink>
inline void write_u32(Sink& s, uint32_t v, Endian e = Endian::BIG) {
    write_uint(s, v, e);
}

template <ByteSink Sink>
inline void write_i32(Sink& s, int32_t v, Endian e = Endian::BIG) {
    write_uint(s, static_cast<uint32_t>(v), e);
}

template <ByteSink Sink>
inline void write_u64(Sink& s, uint64_t v, Endian e = Endian::BIG) {
    write_uint(s, v, e);
}

template <ByteSink Sink>
inline void write_i64(Sink& s, int64_t v, Endian e = Endian::BIG) {
    write_uint(s, static_cast<uint64_t>(v), e);
}

[[nodiscard]] core::Result<uint16_t> read_u16(ByteSpan buf, size_t& offset,
                                              Endian e = Endian::BIG);
[[nodiscard]] core::Result<int16_t>  read_i16(ByteSpan buf, size_t& offset,
                                              Endian e = Endian::BIG);
[[nodiscard]] core::Result<uint32_t> read_u32(ByteSpan buf, size_t& offset,
                                              Endian e = Endian::BIG);
[[nodiscard]] core::Result<int32_t>  read_i32(ByteSpan buf, size_t& offset,
                                              Endian e = Endian::BIG);
[[nodiscard]] core::Result<uint64_t> read_u64(ByteSpan buf, size_t& offset,
                                              Endian e = Endian::BIG);
[[nodiscard]] core::Result<int64_t>  read_i64(ByteSpan buf, size_t& offset,
                                              Endian e = Endian::BIG);

// -------------------------------------------------------------------
// IEEE-754
// -------------------------------------------------------------------

template <ByteSink Sink>
inline void write_f32(Sink& s, float v, Endian e = Endian::BIG) {
    static_assert(sizeof(float) == sizeof(uint32_t));
    uint32_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    write_uint(s, bits, e);
}

template <ByteSink Sink>
inline void write_f64(Sink& s, double v, Endian e = Endian::BIG) {
    static_assert(sizeof(double) == sizeof(uint64_t));
    uint64_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    write_uint(s, bits, e);
}

[[nodiscard]] core::Result<float>  read_f32(ByteSpan buf, size_t& offset,
                                            Endian e = Endian::BIG);
[[nodiscard]] core::Result<double> read_f64(ByteSpan buf, size_t& offset,
                                            Endian e = Endian::BIG);

// -------------------------------------------------------------------
// Triads (3 bytes)
// -------------------------------------------------------------------
// Writes emit the low 24 bits unmasked in either order. Reads apply
// TRIAD_READ_MASK, so 0xFFFFFFFF written and read back is 0x000FFFFF.
// The asymmetry is part of the wire contract.

template <ByteSink Sink>
inline void write_triad(Sink& s, uint32_t v, Endian e = Endian::BIG) {
    uint8_t buf[3];
    if (e == Endian::BIG) {
        buf[0] = static_cast<uint8_t>((v >> 16) & 0xFF);
        buf[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
        buf[2] = static_cast<uint8_t>(v & 0xFF);
    } else {
        buf[0] = static_cast<uint8_t>(v & 0xFF);
        buf[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
        buf[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
    }
    s.write(std::span<const uint8_t>(buf, 3));
}

[[nodiscard]] core::Result<uint32_t> read_triad(ByteSpan buf, size_t& offset,
                                                Endian e = Endian::BIG);

// -------------------------------------------------------------------
// Length-prefixed strings and byte blobs
// -------------------------------------------------------------------
// Unsigned 32-bit varint byte length followed by the raw bytes. The text
// encoding is not validated. Writes cannot fail, so a payload longer than
// MAX_PREFIXED_LENGTH gets a prefix holding only the low 32 bits of its
// size; callers with untrusted sizes check fits_length_prefix() first.

inline constexpr size_t MAX_PREFIXED_LENGTH =
    std::numeric_limits<uint32_t>::max();

constexpr bool fits_length_prefix(size_t n) noexcept {
    return n <= MAX_PREFIXED_LENGTH;
}

template <ByteSink Sink>
void write_string(Sink& s, std::string_view str) {
    write_uvarint32(s, static_cast<uint32_t>(str.size()));
    write_raw(s, std::span<const uint8_t>(
                     reinterpret_cast<const uint8_t*>(str.data()),
                     str.size()));
}

template <ByteSink Sink>
void write_length_prefixed_bytes(Sink& s, std::span<const uint8_t> data) {
    write_uvarint32(s, static_cast<uint32_t>(data.size()));
    write_raw(s, data);
}

/// On failure @p offset is left unchanged, even if the length prefix
/// decoded.
[[nodiscard]] core::Result<std::string> read_string(ByteSpan buf,
                                                    size_t& offset);
[[nodiscard]] core::Result<Bytes> read_length_prefixed_bytes(ByteSpan buf,
                                                             size_t& offset);

}  // namespace codec
