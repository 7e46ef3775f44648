// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/layout.h"

#include "core/hex.h"
#include "core/logging.h"

#include <array>
#include <cctype>
#include <charconv>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

namespace codec {

namespace {

struct KindName {
    FieldKind        kind;
    std::string_view name;
};

constexpr std::array<KindName, 20> KIND_NAMES = {{
    {FieldKind::BOOL,     "bool"},
    {FieldKind::I8,       "i8"},
    {FieldKind::U8,       "u8"},
    {FieldKind::I16,      "i16"},
    {FieldKind::U16,      "u16"},
    {FieldKind::I32,      "i32"},
    {FieldKind::U32,      "u32"},
    {FieldKind::I64,      "i64"},
    {FieldKind::U64,      "u64"},
    {FieldKind::F32,      "f32"},
    {FieldKind::F64,      "f64"},
    {FieldKind::TRIAD,    "triad"},
    {FieldKind::VARINT,   "varint"},
    {FieldKind::UVARINT,  "uvarint"},
    {FieldKind::VARLONG,  "varlong"},
    {FieldKind::UVARLONG, "uvarlong"},
    {FieldKind::STRING,   "string"},
    {FieldKind::LPBYTES,  "lpbytes"},
    {FieldKind::BYTES,    "bytes"},
    {FieldKind::REST,     "rest"},
}};

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

std::string to_lower(std::string_view sv) {
    std::string out(sv);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

const KindName* find_kind(std::string_view name) {
    for (const auto& k : KIND_NAMES) {
        if (k.name == name) return &k;
    }
    return nullptr;
}

/// Split on commas, trimming each piece and dropping empty ones.
std::vector<std::string_view> split_list(std::string_view text) {
    std::vector<std::string_view> out;
    while (true) {
        auto comma = text.find(',');
        auto piece = trim(text.substr(0, comma));
        if (!piece.empty()) out.push_back(piece);
        if (comma == std::string_view::npos) break;
        text.remove_prefix(comma + 1);
    }
    return out;
}

template <typename Float>
std::string format_float(Float v) {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<Float>::max_digits10) << v;
    return oss.str();
}

template <typename Int>
core::Result<Int> parse_integer(std::string_view text, const FieldSpec& spec) {
    const std::string_view original = text;
    int base = 10;
    if (std::is_unsigned_v<Int> &&
        (text.starts_with("0x") || text.starts_with("0X"))) {
        text.remove_prefix(2);
        base = 16;
    }
    Int value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                     value, base);
    if (text.empty() || ec != std::errc{} ||
        ptr != text.data() + text.size()) {
        return core::make_error(core::ErrorCode::VALUE_ERROR,
                                "'" + std::string(original) +
                                "' is not a valid " + spec.to_string());
    }
    return value;
}

core::Result<void> check_prefixed_length(size_t n) {
    if (!fits_length_prefix(n)) {
        return core::make_error(core::ErrorCode::VALUE_ERROR,
                                std::to_string(n) +
                                " bytes do not fit a 32-bit length prefix");
    }
    return core::make_ok();
}

template <typename Float>
core::Result<Float> parse_float(std::string_view text, const FieldSpec& spec) {
    // Out-of-range input is an error, not a rounding to infinity.
    Float value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                     value);
    if (text.empty() || ec != std::errc{} ||
        ptr != text.data() + text.size()) {
        return core::make_error(core::ErrorCode::VALUE_ERROR,
                                "'" + std::string(text) +
                                "' is not a valid " + spec.to_string());
    }
    return value;
}

core::Result<bool> parse_bool(std::string_view text) {
    const std::string v = to_lower(text);
    if (v == "true" || v == "1")  return true;
    if (v == "false" || v == "0") return false;
    return core::make_error(core::ErrorCode::VALUE_ERROR,
                            "'" + std::string(text) + "' is not a bool");
}

core::Result<Bytes> parse_hex_value(std::string_view text) {
    auto bytes = core::from_hex(text);
    if (!bytes) {
        return core::make_error(core::ErrorCode::VALUE_ERROR,
                                "'" + std::string(text) + "' is not hex");
    }
    return std::move(*bytes);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

std::string_view field_kind_name(FieldKind kind) noexcept {
    for (const auto& k : KIND_NAMES) {
        if (k.kind == kind) return k.name;
    }
    return "unknown";
}

bool field_kind_has_endian(FieldKind kind) noexcept {
    switch (kind) {
        case FieldKind::I16: case FieldKind::U16:
        case FieldKind::I32: case FieldKind::U32:
        case FieldKind::I64: case FieldKind::U64:
        case FieldKind::F32: case FieldKind::F64:
        case FieldKind::TRIAD:
            return true;
        default:
            return false;
    }
}

std::string FieldSpec::to_string() const {
    std::string out(field_kind_name(kind));
    if (kind == FieldKind::BYTES) {
        out += ':';
        out += std::to_string(length);
    } else if (field_kind_has_endian(kind)) {
        out += endian == Endian::BIG ? "be" : "le";
    }
    return out;
}

// ---------------------------------------------------------------------------
// Parsing layouts
// ---------------------------------------------------------------------------

core::Result<FieldSpec> parse_field_spec(std::string_view token) {
    const std::string t = to_lower(trim(token));
    std::string_view sv = t;

    if (sv.starts_with("bytes:")) {
        std::string_view digits = sv.substr(6);
        size_t n = 0;
        auto [ptr, ec] = std::from_chars(digits.data(),
                                         digits.data() + digits.size(), n);
        if (digits.empty() || ec != std::errc{} ||
            ptr != digits.data() + digits.size()) {
            return core::make_error(core::ErrorCode::LAYOUT_ERROR,
                                    "bad byte count in '" + t + "'");
        }
        if (n > static_cast<size_t>(std::numeric_limits<int64_t>::max())) {
            return core::make_error(core::ErrorCode::LAYOUT_ERROR,
                                    "byte count too large in '" + t + "'");
        }
        return FieldSpec{FieldKind::BYTES, Endian::BIG, n};
    }

    if (const auto* k = find_kind(sv)) {
        if (k->kind == FieldKind::BYTES) {
            return core::make_error(core::ErrorCode::LAYOUT_ERROR,
                                    "'bytes' needs a length, e.g. bytes:4");
        }
        return FieldSpec{k->kind, Endian::BIG, 0};
    }

    if (sv.size() > 2) {
        auto endian = parse_endian(sv.substr(sv.size() - 2));
        const auto* k = find_kind(sv.substr(0, sv.size() - 2));
        if (endian && k && field_kind_has_endian(k->kind)) {
            return FieldSpec{k->kind, *endian, 0};
        }
    }

    return core::make_error(core::ErrorCode::LAYOUT_ERROR,
                            "unknown field kind '" + t + "'");
}

core::Result<std::vector<FieldSpec>> parse_layout(std::string_view text) {
    std::vector<FieldSpec> fields;
    for (auto token : split_list(text)) {
        BYTEWIRE_TRY_ASSIGN(spec, parse_field_spec(token));
        fields.push_back(spec);
    }
    if (fields.empty()) {
        return core::make_error(core::ErrorCode::LAYOUT_ERROR,
                                "layout has no fields");
    }
    return fields;
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------

core::Result<std::vector<DecodedField>> decode_layout(
    Stream& stream, const std::vector<FieldSpec>& fields) {
    std::vector<DecodedField> out;
    out.reserve(fields.size());

    for (const auto& spec : fields) {
        DecodedField field{spec, stream.offset(), {}};
        const Endian e = spec.endian;

        switch (spec.kind) {
            case FieldKind::BOOL:
                field.text = stream.get_bool() ? "true" : "false";
                break;
            case FieldKind::I8:
                field.text = std::to_string(stream.get_i8());
                break;
            case FieldKind::U8:
                field.text = std::to_string(stream.get_u8());
                break;
            case FieldKind::I16:
                field.text = std::to_string(stream.get_i16(e));
                break;
            case FieldKind::U16:
                field.text = std::to_string(stream.get_u16(e));
                break;
            case FieldKind::I32:
                field.text = std::to_string(stream.get_i32(e));
                break;
            case FieldKind::U32:
                field.text = std::to_string(stream.get_u32(e));
                break;
            case FieldKind::I64:
                field.text = std::to_string(stream.get_i64(e));
                break;
            case FieldKind::U64:
                field.text = std::to_string(stream.get_u64(e));
                break;
            case FieldKind::F32:
                field.text = format_float(stream.get_f32(e));
                break;
            case FieldKind::F64:
                field.text = format_float(stream.get_f64(e));
                break;
            case FieldKind::TRIAD:
                field.text = std::to_string(stream.get_triad(e));
                break;
            case FieldKind::VARINT:
                field.text = std::to_string(stream.get_varint32());
                break;
            case FieldKind::UVARINT:
                field.text = std::to_string(stream.get_uvarint32());
                break;
            case FieldKind::VARLONG:
                field.text = std::to_string(stream.get_varint64());
                break;
            case FieldKind::UVARLONG:
                field.text = std::to_string(stream.get_uvarint64());
                break;
            case FieldKind::STRING:
                field.text = stream.get_string();
                break;
            case FieldKind::LPBYTES:
                field.text = core::to_hex(stream.get_length_prefixed_bytes());
                break;
            case FieldKind::BYTES:
                field.text = core::to_hex(
                    stream.get_bytes(static_cast<int64_t>(spec.length)));
                break;
            case FieldKind::REST:
                field.text = core::to_hex(stream.get_bytes(Stream::REMAINING));
                break;
        }

        if (stream.faulted()) {
            return stream.fault()->error.wrap(spec.to_string() +
                                              " at field " +
                                              std::to_string(out.size()));
        }

        LOG_TRACE(core::LogCategory::LAYOUT,
                  spec.to_string() + " @" + std::to_string(field.offset) +
                  " = " + field.text);
        out.push_back(std::move(field));
    }
    return out;
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

core::Result<std::vector<FieldValue>> parse_field_values(
    std::string_view text) {
    std::vector<FieldValue> out;

    for (auto piece : split_list(text)) {
        auto eq = piece.find('=');
        if (eq == std::string_view::npos) {
            return core::make_error(core::ErrorCode::LAYOUT_ERROR,
                                    "expected kind=value, got '" +
                                    std::string(piece) + "'");
        }
        std::string_view kind  = trim(piece.substr(0, eq));
        std::string_view value = trim(piece.substr(eq + 1));

        FieldSpec spec;
        if (to_lower(kind) == "bytes") {
            spec.kind = FieldKind::BYTES;
        } else {
            BYTEWIRE_TRY_ASSIGN(parsed, parse_field_spec(kind));
            spec = parsed;
        }
        if (spec.kind == FieldKind::REST) {
            return core::make_error(core::ErrorCode::LAYOUT_ERROR,
                                    "'rest' cannot be encoded");
        }
        out.push_back(FieldValue{spec, std::string(value)});
    }

    if (out.empty()) {
        return core::make_error(core::ErrorCode::LAYOUT_ERROR,
                                "no fields to encode");
    }
    return out;
}

core::Result<void> encode_field(Stream& stream, const FieldValue& field) {
    const FieldSpec& spec = field.spec;
    const std::string_view v = field.value;
    const Endian e = spec.endian;

    switch (spec.kind) {
        case FieldKind::BOOL: {
            BYTEWIRE_TRY_ASSIGN(b, parse_bool(v));
            stream.put_bool(b);
            break;
        }
        case FieldKind::I8: {
            BYTEWIRE_TRY_ASSIGN(n, parse_integer<int8_t>(v, spec));
            stream.put_i8(n);
            break;
        }
        case FieldKind::U8: {
            BYTEWIRE_TRY_ASSIGN(n, parse_integer<uint8_t>(v, spec));
            stream.put_u8(n);
            break;
        }
        case FieldKind::I16: {
            BYTEWIRE_TRY_ASSIGN(n, parse_integer<int16_t>(v, spec));
            stream.put_i16(n, e);
            break;
        }
        case FieldKind::U16: {
            BYTEWIRE_TRY_ASSIGN(n, parse_integer<uint16_t>(v, spec));
            stream.put_u16(n, e);
            break;
        }
        case FieldKind::I32: {
            BYTEWIRE_TRY_ASSIGN(n, parse_integer<int32_t>(v, spec));
            stream.put_i32(n, e);
            break;
        }
        case FieldKind::U32: {
            BYTEWIRE_TRY_ASSIGN(n, parse_integer<uint32_t>(v, spec));
            stream.put_u32(n, e);
            break;
        }
        case FieldKind::I64: {
            BYTEWIRE_TRY_ASSIGN(n, parse_integer<int64_t>(v, spec));
            stream.put_i64(n, e);
            break;
        }
        case FieldKind::U64: {
            BYTEWIRE_TRY_ASSIGN(n, parse_integer<uint64_t>(v, spec));
            stream.put_u64(n, e);
            break;
        }
        case FieldKind::F32: {
            BYTEWIRE_TRY_ASSIGN(f, parse_float<float>(v, spec));
            stream.put_f32(f, e);
            break;
        }
        case FieldKind::F64: {
            BYTEWIRE_TRY_ASSIGN(f, parse_float<double>(v, spec));
            stream.put_f64(f, e);
            break;
        }
        case FieldKind::TRIAD: {
            BYTEWIRE_TRY_ASSIGN(n, parse_integer<uint32_t>(v, spec));
            stream.put_triad(n, e);
            break;
        }
        case FieldKind::VARINT: {
            BYTEWIRE_TRY_ASSIGN(n, parse_integer<int32_t>(v, spec));
            stream.put_varint32(n);
            break;
        }
        case FieldKind::UVARINT: {
            BYTEWIRE_TRY_ASSIGN(n, parse_integer<uint32_t>(v, spec));
            stream.put_uvarint32(n);
            break;
        }
        case FieldKind::VARLONG: {
            BYTEWIRE_TRY_ASSIGN(n, parse_integer<int64_t>(v, spec));
            stream.put_varint64(n);
            break;
        }
        case FieldKind::UVARLONG: {
            BYTEWIRE_TRY_ASSIGN(n, parse_integer<uint64_t>(v, spec));
            stream.put_uvarint64(n);
            break;
        }
        case FieldKind::STRING:
            BYTEWIRE_TRY_VOID(check_prefixed_length(v.size()));
            stream.put_string(v);
            break;
        case FieldKind::LPBYTES: {
            BYTEWIRE_TRY_ASSIGN(bytes, parse_hex_value(v));
            BYTEWIRE_TRY_VOID(check_prefixed_length(bytes.size()));
            stream.put_length_prefixed_bytes(bytes);
            break;
        }
        case FieldKind::BYTES: {
            BYTEWIRE_TRY_ASSIGN(bytes, parse_hex_value(v));
            if (spec.length != 0 && bytes.size() != spec.length) {
                return core::make_error(
                    core::ErrorCode::VALUE_ERROR,
                    "expected " + std::to_string(spec.length) +
                    " bytes, got " + std::to_string(bytes.size()));
            }
            stream.put_bytes(bytes);
            break;
        }
        case FieldKind::REST:
            return core::make_error(core::ErrorCode::LAYOUT_ERROR,
                                    "'rest' cannot be encoded");
    }
    return core::make_ok();
}

core::Result<void> encode_fields(Stream& stream,
                                 const std::vector<FieldValue>& fields) {
    for (const auto& field : fields) {
        BYTEWIRE_TRY_VOID(encode_field(stream, field));
    }
    return core::make_ok();
}

}  // namespace codec
