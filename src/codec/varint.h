#pragma once
// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/buffer.h"
#include "core/error.h"

#include <cstddef>
#include <cstdint>
#include <span>

namespace codec {

// ---------------------------------------------------------------------------
// Base-128 variable-length integers
// ---------------------------------------------------------------------------
// Each byte carries 7 bits of payload in bits [0..6]. Bit 7 (0x80) is the
// continuation flag: when set, more bytes follow. Groups are written least
// significant first.
//
//   0          -> 00
//   127        -> 7f
//   128        -> 80 01
//   300        -> ac 02
//   2^32 - 1   -> ff ff ff ff 0f
//
// Signed forms go through zig-zag first, so small magnitudes of either sign
// stay short: 0 -> 0, -1 -> 1, 1 -> 2, -2 -> 3, ...
// ---------------------------------------------------------------------------

/// Maximum groups in a 32-bit varint (ceil(32/7)).
inline constexpr size_t MAX_VARINT32_BYTES = 5;

/// Maximum groups in a 64-bit varint (ceil(64/7)).
inline constexpr size_t MAX_VARINT64_BYTES = 10;

// -- Zig-zag ----------------------------------------------------------------

[[nodiscard]] constexpr uint32_t to_zigzag32(int32_t n) noexcept {
    return (static_cast<uint32_t>(n) << 1) ^ static_cast<uint32_t>(n >> 31);
}

[[nodiscard]] constexpr int32_t from_zigzag32(uint32_t u) noexcept {
    return static_cast<int32_t>((u >> 1) ^ (0u - (u & 1u)));
}

[[nodiscard]] constexpr uint64_t to_zigzag64(int64_t n) noexcept {
    return (static_cast<uint64_t>(n) << 1) ^ static_cast<uint64_t>(n >> 63);
}

[[nodiscard]] constexpr int64_t from_zigzag64(uint64_t u) noexcept {
    return static_cast<int64_t>((u >> 1) ^ (0ull - (u & 1ull)));
}

// -- Encoding ---------------------------------------------------------------

template <ByteSink Sink>
void write_uvarint64(Sink& s, uint64_t n) {
    uint8_t buf[MAX_VARINT64_BYTES];
    size_t len = 0;
    while (n > 0x7F) {
        buf[len++] = static_cast<uint8_t>(n & 0x7F) | 0x80;
        n >>= 7;
    }
    buf[len++] = static_cast<uint8_t>(n);
    s.write(std::span<const uint8_t>(buf, len));
}

template <ByteSink Sink>
inline void write_uvarint32(Sink& s, uint32_t n) {
    write_uvarint64(s, n);
}

template <ByteSink Sink>
inline void write_varint32(Sink& s, int32_t n) {
    write_uvarint64(s, to_zigzag32(n));
}

template <ByteSink Sink>
inline void write_varint64(Sink& s, int64_t n) {
    write_uvarint64(s, to_zigzag64(n));
}

/// Encoded size of @p n in bytes.
[[nodiscard]] inline size_t varint_size(uint64_t n) noexcept {
    size_t len = 1;
    while (n > 0x7F) {
        ++len;
        n >>= 7;
    }
    return len;
}

/// Encode @p n into a self-contained byte vector.
[[nodiscard]] Bytes encode_uvarint(uint64_t n);

// -- Decoding ---------------------------------------------------------------
// Groups are consumed until one has the continuation bit clear. A group
// beyond the width's maximum fails with VARINT_TOO_LARGE (32-bit) or
// VARLONG_TOO_LARGE (64-bit); running out of bytes first fails with
// INSUFFICIENT_BYTES. On failure @p offset is left unchanged.

[[nodiscard]] core::Result<uint32_t> read_uvarint32(ByteSpan buf,
                                                    size_t& offset);
[[nodiscard]] core::Result<uint64_t> read_uvarint64(ByteSpan buf,
                                                    size_t& offset);
[[nodiscard]] core::Result<int32_t> read_varint32(ByteSpan buf,
                                                  size_t& offset);
[[nodiscard]] core::Result<int64_t> read_varint64(ByteSpan buf,
                                                  size_t& offset);

}  // namespace codec
