#pragma once
// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "codec/binary.h"
#include "codec/buffer.h"
#include "codec/endian.h"
#include "core/error.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace codec {

// ---------------------------------------------------------------------------
// EofMode -- which end-of-buffer convention eof() and get_bytes(REMAINING)
// follow
// ---------------------------------------------------------------------------
enum class EofMode : uint8_t {
    /// offset >= size - 1: the last byte position already counts as the
    /// end, and "all remaining" stops one byte short. Existing callers are
    /// written against this convention, so it is the default.
    LEGACY = 0,
    /// offset >= size: end means nothing left to read.
    STRICT = 1,
};

// ---------------------------------------------------------------------------
// StreamFault -- the first read failure on a Stream
// ---------------------------------------------------------------------------
struct StreamFault {
    core::Error error;
    size_t      offset = 0;  // stream offset when the failing get started
    Bytes       buffer;      // snapshot of the buffer at that moment

    /// "<error> at offset N of M: .. 0a 0b [0c]"
    [[nodiscard]] std::string format() const;
};

// ---------------------------------------------------------------------------
// Stream -- owned buffer + read cursor + latched fault
// ---------------------------------------------------------------------------
// put_* append to the buffer and never fail, whatever the fault state.
//
// get_* read at the cursor. The first failure is latched: the error, the
// cursor position and a copy of the buffer are kept, and from then on every
// get_* returns the type's zero value without looking at the buffer. Only
// reset() or clear_fault() leave the faulted state.
//
// A Stream is not synchronized; use one per thread or lock externally.
// ---------------------------------------------------------------------------
class Stream {
public:
    /// Length sentinel for get_bytes(): read everything that remains.
    static constexpr int64_t REMAINING = -1;

    // -- Construction -------------------------------------------------------

    /// Empty stream for writing.
    Stream() = default;

    explicit Stream(EofMode mode) : eof_mode_(mode) {}

    /// Stream for reading @p buffer starting at @p offset (clamped to the
    /// buffer size).
    Stream(Bytes buffer, size_t offset, EofMode mode = EofMode::LEGACY);

    Stream(ByteSpan buffer, size_t offset, EofMode mode = EofMode::LEGACY)
        : Stream(Bytes(buffer.begin(), buffer.end()), offset, mode) {}

    // -- Sink interface -----------------------------------------------------

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    // -- Put ----------------------------------------------------------------

    void put_bool(bool v)     { write_bool(*this, v); }
    void put_u8(uint8_t v)    { write_u8(*this, v); }
    void put_i8(int8_t v)     { write_i8(*this, v); }

    void put_u16(uint16_t v, Endian e = Endian::BIG) { write_u16(*this, v, e); }
    void put_i16(int16_t v, Endian e = Endian::BIG)  { write_i16(*this, v, e); }
    void put_u32(uint32_t v, Endian e = Endian::BIG) { write_u32(*this, v, e); }
    void put_i32(int32_t v, Endian e = Endian::BIG)  { write_i32(*this, v, e); }
    void put_u64(uint64_t v, Endian e = Endian::BIG) { write_u64(*this, v, e); }
    void put_i64(int64_t v, Endian e = Endian::BIG)  { write_i64(*this, v, e); }
    void put_f32(float v, Endian e = Endian::BIG)    { write_f32(*this, v, e); }
    void put_f64(double v, Endian e = Endian::BIG)   { write_f64(*this, v, e); }

    void put_triad(uint32_t v, Endian e = Endian::BIG) {
        write_triad(*this, v, e);
    }

    void put_uvarint32(uint32_t v) { write_uvarint32(*this, v); }
    void put_uvarint64(uint64_t v) { write_uvarint64(*this, v); }
    void put_varint32(int32_t v)   { write_varint32(*this, v); }
    void put_varint64(int64_t v)   { write_varint64(*this, v); }

    void put_string(std::string_view v) { write_string(*this, v); }
    void put_bytes(std::span<const uint8_t> v) { write_raw(*this, v); }
    void put_length_prefixed_bytes(std::span<const uint8_t> v) {
        write_length_prefixed_bytes(*this, v);
    }

    // -- Get ----------------------------------------------------------------

    [[nodiscard]] bool    get_bool();
    [[nodiscard]] uint8_t get_u8();
    [[nodiscard]] int8_t  get_i8();

    [[nodiscard]] uint16_t get_u16(Endian e = Endian::BIG);
    [[nodiscard]] int16_t  get_i16(Endian e = Endian::BIG);
    [[nodiscard]] uint32_t get_u32(Endian e = Endian::BIG);
    [[nodiscard]] int32_t  get_i32(Endian e = Endian::BIG);
    [[nodiscard]] uint64_t get_u64(Endian e = Endian::BIG);
    [[nodiscard]] int64_t  get_i64(Endian e = Endian::BIG);
    [[nodiscard]] float    get_f32(Endian e = Endian::BIG);
    [[nodiscard]] double   get_f64(Endian e = Endian::BIG);
    [[nodiscard]] uint32_t get_triad(Endian e = Endian::BIG);

    [[nodiscard]] uint32_t get_uvarint32();
    [[nodiscard]] uint64_t get_uvarint64();
    [[nodiscard]] int32_t  get_varint32();
    [[nodiscard]] int64_t  get_varint64();

    [[nodiscard]] std::string get_string();
    [[nodiscard]] Bytes       get_length_prefixed_bytes();

    /// Read @p length bytes; a negative length (REMAINING) reads what is
    /// left according to the stream's EofMode.
    [[nodiscard]] Bytes get_bytes(int64_t length);

    // -- Position / state ---------------------------------------------------

    /// LEGACY: offset >= size - 1 (true for an empty buffer).
    /// STRICT: offset >= size. Does not look at the fault.
    [[nodiscard]] bool eof() const noexcept;

    [[nodiscard]] size_t offset() const noexcept { return offset_; }

    /// Fails with OFFSET_OUT_OF_RANGE past the end of the buffer.
    [[nodiscard]] core::Result<void> set_offset(size_t offset);

    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }
    [[nodiscard]] size_t remaining() const noexcept {
        return buf_.size() - offset_;
    }

    [[nodiscard]] const Bytes& buffer() const noexcept { return buf_; }
    [[nodiscard]] ByteSpan view() const noexcept { return buf_; }

    /// Replace the buffer and rewind the cursor. The fault is untouched.
    void set_buffer(Bytes buffer);

    [[nodiscard]] EofMode eof_mode() const noexcept { return eof_mode_; }
    void set_eof_mode(EofMode mode) noexcept { eof_mode_ = mode; }

    // -- Fault --------------------------------------------------------------

    [[nodiscard]] bool ok() const noexcept { return !fault_.has_value(); }
    [[nodiscard]] bool faulted() const noexcept { return fault_.has_value(); }
    [[nodiscard]] const std::optional<StreamFault>& fault() const noexcept {
        return fault_;
    }
    void clear_fault() noexcept { fault_.reset(); }

    // -- Lifetime -----------------------------------------------------------

    /// Clear buffer, cursor and fault. The EofMode is kept.
    void reset();

    /// Move the buffer out and reset the stream.
    [[nodiscard]] Bytes release();

private:
    /// Shared body of every get_*: short-circuit when faulted, otherwise
    /// run @p read at the cursor and latch on failure.
    template <typename T, typename ReadFn>
    T get(ReadFn&& read) {
        if (fault_) {
            return T{};
        }
        auto res = read(ByteSpan(buf_), offset_);
        if (!res.ok()) {
            latch(std::move(res).error());
            return T{};
        }
        return std::move(res).value();
    }

    void latch(core::Error error);

    Bytes                      buf_;
    size_t                     offset_   = 0;
    EofMode                    eof_mode_ = EofMode::LEGACY;
    std::optional<StreamFault> fault_;
};

}  // namespace codec
