// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:                return "NONE";

        // Codec
        case ErrorCode::INSUFFICIENT_BYTES:  return "INSUFFICIENT_BYTES";
        case ErrorCode::VARINT_TOO_LARGE:    return "VARINT_TOO_LARGE";
        case ErrorCode::VARLONG_TOO_LARGE:   return "VARLONG_TOO_LARGE";
        case ErrorCode::OFFSET_OUT_OF_RANGE: return "OFFSET_OUT_OF_RANGE";

        // Field layouts
        case ErrorCode::LAYOUT_ERROR:        return "LAYOUT_ERROR";
        case ErrorCode::VALUE_ERROR:         return "VALUE_ERROR";

        // Tooling
        case ErrorCode::CONFIG_ERROR:        return "CONFIG_ERROR";
        case ErrorCode::IO_ERROR:            return "IO_ERROR";

        // Internal
        case ErrorCode::INTERNAL_ERROR:      return "INTERNAL_ERROR";
    }

    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Error::format: build a diagnostic string including source location
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    const char* file = location_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file
            << ':' << location_.line()
            << ':' << location_.column() << ']';
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Error::wrap
// ---------------------------------------------------------------------------
Error Error::wrap(std::string_view context) const {
    std::string msg{context};
    if (!message_.empty()) {
        msg += ": ";
        msg += message_;
    }
    return Error(code_, std::move(msg), location_);
}

} // namespace core
