// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/stream.h"

#include "core/hex.h"
#include "core/logging.h"

#include <algorithm>
#include <string>

namespace codec {

// ---------------------------------------------------------------------------
// StreamFault
// ---------------------------------------------------------------------------

std::string StreamFault::format() const {
    std::string out = error.format();
    out += " at offset ";
    out += std::to_string(offset);
    out += " of ";
    out += std::to_string(buffer.size());
    out += ": ";
    out += core::hex_window(buffer, offset);
    return out;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Stream::Stream(Bytes buffer, size_t offset, EofMode mode)
    : buf_(std::move(buffer)),
      offset_(std::min(offset, buf_.size())),
      eof_mode_(mode) {}

// ---------------------------------------------------------------------------
// Get
// ---------------------------------------------------------------------------

bool Stream::get_bool() {
    return get<bool>([](ByteSpan b, size_t& o) { return read_bool(b, o); });
}

uint8_t Stream::get_u8() {
    return get<uint8_t>([](ByteSpan b, size_t& o) { return read_u8(b, o); });
}

int8_t Stream::get_i8() {
    return get<int8_t>([](ByteSpan b, size_t& o) { return read_i8(b, o); });
}

uint16_t Stream::get_u16(Endian e) {
    return get<uint16_t>(
        [e](ByteSpan b, size_t& o) { return read_u16(b, o, e); });
}

int16_t Stream::get_i16(Endian e) {
    return get<int16_t>(
        [e](ByteSpan b, size_t& o) { return read_i16(b, o, e); });
}

uint32_t Stream::get_u32(Endian e) {
    return get<uint32_t>(
        [e](ByteSpan b, size_t& o) { return read_u32(b, o, e); });
}

int32_t Stream::get_i32(Endian e) {
    return get<int32_t>(
        [e](ByteSpan b, size_t& o) { return read_i32(b, o, e); });
}

uint64_t Stream::get_u64(Endian e) {
    return get<uint64_t>(
        [e](ByteSpan b, size_t& o) { return read_u64(b, o, e); });
}

int64_t Stream::get_i64(Endian e) {
    return get<int64_t>(
        [e](ByteSpan b, size_t& o) { return read_i64(b, o, e); });
}

float Stream::get_f32(Endian e) {
    return get<float>(
        [e](ByteSpan b, size_t& o) { return read_f32(b, o, e); });
}

double Stream::get_f64(Endian e) {
    return get<double>(
        [e](ByteSpan b, size_t& o) { return read_f64(b, o, e); });
}

uint32_t Stream::get_triad(Endian e) {
    return get<uint32_t>(
        [e](ByteSpan b, size_t& o) { return read_triad(b, o, e); });
}

uint32_t Stream::get_uvarint32() {
    return get<uint32_t>(
        [](ByteSpan b, size_t& o) { return read_uvarint32(b, o); });
}

uint64_t Stream::get_uvarint64() {
    return get<uint64_t>(
        [](ByteSpan b, size_t& o) { return read_uvarint64(b, o); });
}

int32_t Stream::get_varint32() {
    return get<int32_t>(
        [](ByteSpan b, size_t& o) { return read_varint32(b, o); });
}

int64_t Stream::get_varint64() {
    return get<int64_t>(
        [](ByteSpan b, size_t& o) { return read_varint64(b, o); });
}

std::string Stream::get_string() {
    return get<std::string>(
        [](ByteSpan b, size_t& o) { return read_string(b, o); });
}

Bytes Stream::get_length_prefixed_bytes() {
    return get<Bytes>([](ByteSpan b, size_t& o) {
        return read_length_prefixed_bytes(b, o);
    });
}

Bytes Stream::get_bytes(int64_t length) {
    if (fault_) {
        return {};
    }

    size_t want;
    if (length < 0) {
        const size_t left = buf_.size() - offset_;
        if (eof_mode_ == EofMode::LEGACY) {
            want = left > 0 ? left - 1 : 0;
        } else {
            want = left;
        }
    } else {
        want = static_cast<size_t>(length);
    }

    return get<Bytes>([want](ByteSpan b, size_t& o) -> core::Result<Bytes> {
        auto view = read_bytes(b, o, want);
        if (!view.ok()) {
            return view.error().wrap("get_bytes");
        }
        return Bytes(view.value().begin(), view.value().end());
    });
}

// ---------------------------------------------------------------------------
// Position / state
// ---------------------------------------------------------------------------

bool Stream::eof() const noexcept {
    if (eof_mode_ == EofMode::STRICT) {
        return offset_ >= buf_.size();
    }
    return offset_ + 1 >= buf_.size();
}

core::Result<void> Stream::set_offset(size_t offset) {
    if (offset > buf_.size()) {
        return core::make_error(
            core::ErrorCode::OFFSET_OUT_OF_RANGE,
            "offset " + std::to_string(offset) + " past end of " +
            std::to_string(buf_.size()) + "-byte buffer");
    }
    offset_ = offset;
    return core::make_ok();
}

void Stream::set_buffer(Bytes buffer) {
    buf_ = std::move(buffer);
    offset_ = 0;
}

void Stream::reset() {
    buf_.clear();
    offset_ = 0;
    fault_.reset();
}

Bytes Stream::release() {
    Bytes out = std::move(buf_);
    reset();
    return out;
}

// ---------------------------------------------------------------------------
// Fault latch
// ---------------------------------------------------------------------------

void Stream::latch(core::Error error) {
    LOG_DEBUG(core::LogCategory::STREAM,
              "read fault at offset " + std::to_string(offset_) + ": " +
              error.message());
    fault_ = StreamFault{std::move(error), offset_, buf_};
}

}  // namespace codec
