#include "core/hex.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace core {

// ---------------------------------------------------------------------------
// Lookup tables
// ---------------------------------------------------------------------------

static constexpr char HEX_DIGITS[] = "0123456789abcdef";

// Maps ASCII value -> nibble value, 0xFF means invalid.
static constexpr std::array<uint8_t, 256> make_decode_table() {
    std::array<uint8_t, 256> table{};
    for (auto& v : table) v = 0xFF;
    for (int i = 0; i <= 9; ++i) {
        table[static_cast<size_t>('0') + i] = static_cast<uint8_t>(i);
    }
    for (int i = 0; i < 6; ++i) {
        table[static_cast<size_t>('a') + i] = static_cast<uint8_t>(10 + i);
        table[static_cast<size_t>('A') + i] = static_cast<uint8_t>(10 + i);
    }
    return table;
}

static constexpr auto DECODE_TABLE = make_decode_table();

static void append_byte(std::string& out, uint8_t byte) {
    out += HEX_DIGITS[(byte >> 4) & 0xF];
    out += HEX_DIGITS[byte & 0xF];
}

// ---------------------------------------------------------------------------
// Encoding / decoding
// ---------------------------------------------------------------------------

std::string to_hex(std::span<const uint8_t> data) {
    std::string result;
    result.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        append_byte(result, byte);
    }
    return result;
}

std::optional<std::vector<uint8_t>> from_hex(std::string_view hex) {
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }

    std::vector<uint8_t> result;
    result.reserve(hex.size() / 2);

    int pending = -1;
    for (char ch : hex) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            // Separators are only allowed between whole bytes.
            if (pending >= 0) return std::nullopt;
            continue;
        }
        const uint8_t nibble = DECODE_TABLE[static_cast<uint8_t>(ch)];
        if (nibble == 0xFF) {
            return std::nullopt;
        }
        if (pending < 0) {
            pending = nibble;
        } else {
            result.push_back(static_cast<uint8_t>((pending << 4) | nibble));
            pending = -1;
        }
    }

    if (pending >= 0) {
        return std::nullopt;
    }
    return result;
}

bool is_hex(std::string_view str) {
    if (str.size() % 2 != 0) {
        return false;
    }
    return std::all_of(str.begin(), str.end(), [](char ch) {
        return DECODE_TABLE[static_cast<uint8_t>(ch)] != 0xFF;
    });
}

// ---------------------------------------------------------------------------
// Diagnostics
// ---------------------------------------------------------------------------

std::string hex_window(std::span<const uint8_t> data, size_t pos,
                       size_t radius) {
    const size_t begin = pos > radius ? pos - radius : 0;
    const size_t end   = std::min(data.size(), pos + radius + 1);

    std::string out;
    if (begin > 0) {
        out += "..";
    }
    for (size_t i = begin; i < end; ++i) {
        if (!out.empty()) out += ' ';
        if (i == pos) {
            out += '[';
            append_byte(out, data[i]);
            out += ']';
        } else {
            append_byte(out, data[i]);
        }
    }
    if (pos >= data.size()) {
        if (!out.empty()) out += ' ';
        out += "[]";
    } else if (end < data.size()) {
        out += " ..";
    }
    return out;
}

}  // namespace core
