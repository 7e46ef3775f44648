// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/varint.h"
#include "codec/binary.h"

#include <string>

namespace codec {

namespace {

template <typename UInt, size_t MaxGroups>
core::Result<UInt> read_groups(ByteSpan buf, size_t& offset,
                               core::ErrorCode too_large,
                               const char* what) {
    UInt result = 0;
    size_t pos = offset;

    for (size_t group = 0;; ++group) {
        auto byte = read_bytes(buf, pos, 1);
        if (!byte.ok()) {
            return byte.error().wrap(std::string(what) + ": group " +
                                     std::to_string(group));
        }
        if (group >= MaxGroups) {
            return core::make_error(
                too_large,
                std::string(what) + ": more than " +
                std::to_string(MaxGroups) + " groups at offset " +
                std::to_string(offset));
        }

        const uint8_t b = byte.value()[0];
        result |= static_cast<UInt>(b & 0x7F) << (7 * group);
        if ((b & 0x80) == 0) {
            offset = pos;
            return result;
        }
    }
}

} // anonymous namespace

Bytes encode_uvarint(uint64_t n) {
    ByteBuilder out(varint_size(n));
    write_uvarint64(out, n);
    return out.finish();
}

core::Result<uint32_t> read_uvarint32(ByteSpan buf, size_t& offset) {
    return read_groups<uint32_t, MAX_VARINT32_BYTES>(
        buf, offset, core::ErrorCode::VARINT_TOO_LARGE, "read_uvarint32");
}

core::Result<uint64_t> read_uvarint64(ByteSpan buf, size_t& offset) {
    return read_groups<uint64_t, MAX_VARINT64_BYTES>(
        buf, offset, core::ErrorCode::VARLONG_TOO_LARGE, "read_uvarint64");
}

core::Result<int32_t> read_varint32(ByteSpan buf, size_t& offset) {
    return read_uvarint32(buf, offset).map(
        [](uint32_t u) { return from_zigzag32(u); });
}

core::Result<int64_t> read_varint64(ByteSpan buf, size_t& offset) {
    return read_uvarint64(buf, offset).map(
        [](uint64_t u) { return from_zigzag64(u); });
}

}  // namespace codec
