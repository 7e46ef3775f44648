#pragma once
// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/endian.h"
#include "codec/stream.h"
#include "core/error.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace codec {

// ---------------------------------------------------------------------------
// Field layouts -- a message described as a list of primitive fields
// ---------------------------------------------------------------------------
// Token grammar (comma-separated, whitespace ignored):
//
//   <kind>[be|le]   kind in bool i8 u8 i16 u16 i32 u32 i64 u64 f32 f64
//                   triad varint uvarint varlong uvarlong string lpbytes;
//                   the suffix is only valid on multi-byte fixed kinds
//   bytes:<N>       N raw bytes
//   rest            whatever remains, per the stream's EofMode
//
// Example: "u16le, varint, string, bytes:4, rest"
// ---------------------------------------------------------------------------

enum class FieldKind : uint8_t {
    BOOL, I8, U8, I16, U16, I32, U32, I64, U64, F32, F64, TRIAD,
    VARINT, UVARINT, VARLONG, UVARLONG, STRING, LPBYTES, BYTES, REST,
};

struct FieldSpec {
    FieldKind kind   = FieldKind::U8;
    Endian    endian = Endian::BIG;
    size_t    length = 0;  // BYTES only

    /// Canonical token, e.g. "u16le", "bytes:4".
    [[nodiscard]] std::string to_string() const;

    bool operator==(const FieldSpec&) const = default;
};

struct DecodedField {
    FieldSpec   spec;
    size_t      offset = 0;  // where the field started
    std::string text;
};

struct FieldValue {
    FieldSpec   spec;
    std::string value;
};

/// Base name of a kind without endianness ("u16", "bytes", ...).
[[nodiscard]] std::string_view field_kind_name(FieldKind kind) noexcept;

/// True for kinds that accept a be/le suffix.
[[nodiscard]] bool field_kind_has_endian(FieldKind kind) noexcept;

[[nodiscard]] core::Result<FieldSpec> parse_field_spec(std::string_view token);

[[nodiscard]] core::Result<std::vector<FieldSpec>> parse_layout(
    std::string_view text);

/// Read each field from @p stream and render it as text. If the stream
/// faults, its latched error is returned.
[[nodiscard]] core::Result<std::vector<DecodedField>> decode_layout(
    Stream& stream, const std::vector<FieldSpec>& fields);

/// Parse "u16le=300,string=hi,bytes=dead". BYTES values are hex and take
/// their length from the value; REST is not accepted.
[[nodiscard]] core::Result<std::vector<FieldValue>> parse_field_values(
    std::string_view text);

/// Put one textual value. Fails with VALUE_ERROR if the text does not
/// parse or is out of range for the kind; nothing is written in that case.
[[nodiscard]] core::Result<void> encode_field(Stream& stream,
                                              const FieldValue& field);

[[nodiscard]] core::Result<void> encode_fields(
    Stream& stream, const std::vector<FieldValue>& fields);

}  // namespace codec
