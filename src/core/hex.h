#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Encode a byte span to a lowercase hexadecimal string.
std::string to_hex(std::span<const uint8_t> data);

// Decode a hexadecimal string to bytes. Whitespace between byte pairs is
// skipped and an optional "0x" prefix is accepted. Returns nullopt on an odd
// digit count or a non-hex character.
std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

// Check whether a string is a strict hexadecimal encoding (even length,
// every character in [0-9a-fA-F], no separators).
bool is_hex(std::string_view str);

// Render up to @p radius bytes either side of @p pos as space-separated hex,
// with the byte at @p pos bracketed: "0a 0b [0c] 0d". A position at or past
// the end is shown as "[]" after the last byte. Elided context is marked
// with "..".
std::string hex_window(std::span<const uint8_t> data, size_t pos,
                       size_t radius = 8);

}  // namespace core
