// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/endian.h"

#include <cctype>

namespace codec {

std::string_view endian_name(Endian e) noexcept {
    switch (e) {
        case Endian::BIG:    return "big";
        case Endian::LITTLE: return "little";
    }
    return "unknown";
}

std::optional<Endian> parse_endian(std::string_view s) noexcept {
    std::string_view keys[] = {"big", "be", "little", "le"};
    for (size_t k = 0; k < 4; ++k) {
        std::string_view key = keys[k];
        if (key.size() != s.size()) continue;
        bool match = true;
        for (size_t i = 0; i < s.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(s[i])) != key[i]) {
                match = false;
                break;
            }
        }
        if (match) return k < 2 ? Endian::BIG : Endian::LITTLE;
    }
    return std::nullopt;
}

}  // namespace codec
