#pragma once
// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace codec {

// ---------------------------------------------------------------------------
// Endian -- byte order of a multi-byte field on the wire
// ---------------------------------------------------------------------------
enum class Endian : uint8_t {
    BIG    = 0,  // most-significant byte first
    LITTLE = 1,  // least-significant byte first
};

/// "big" or "little".
[[nodiscard]] std::string_view endian_name(Endian e) noexcept;

/// Accepts "big", "be", "little", "le" (case-insensitive).
[[nodiscard]] std::optional<Endian> parse_endian(std::string_view s) noexcept;

// ---------------------------------------------------------------------------
// store_uint / load_uint -- the single place byte order is applied
// ---------------------------------------------------------------------------
// Every fixed-width primitive funnels through these two helpers, so the
// endianness tag selects the byte walk at runtime instead of each kind
// carrying a big and a little variant.

template <std::unsigned_integral UInt>
inline void store_uint(uint8_t* out, UInt v, Endian e) noexcept {
    constexpr size_t N = sizeof(UInt);
    for (size_t i = 0; i < N; ++i) {
        const size_t shift = 8 * (e == Endian::BIG ? N - 1 - i : i);
        out[i] = static_cast<uint8_t>(v >> shift);
    }
}

template <std::unsigned_integral UInt>
[[nodiscard]] inline UInt load_uint(const uint8_t* in, Endian e) noexcept {
    constexpr size_t N = sizeof(UInt);
    UInt v = 0;
    for (size_t i = 0; i < N; ++i) {
        const size_t shift = 8 * (e == Endian::BIG ? N - 1 - i : i);
        v |= static_cast<UInt>(static_cast<UInt>(in[i]) << shift);
    }
    return v;
}

}  // namespace codec
