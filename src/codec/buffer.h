#pragma once
// Copyright (c) 2024-2026 The Bytewire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace codec {

using Bytes    = std::vector<uint8_t>;
using ByteSpan = std::span<const uint8_t>;

/// Anything the write_* primitives can append to.
template <typename T>
concept ByteSink = requires(T& s, std::span<const uint8_t> data) {
    s.write(data);
};

// ---------------------------------------------------------------------------
// ByteBuilder -- write-only sink that owns its backing storage
// ---------------------------------------------------------------------------
// Bytes already written are never mutated; callers see them only through an
// immutable view or by taking the finished vector.
// ---------------------------------------------------------------------------
class ByteBuilder {
public:
    ByteBuilder() = default;

    explicit ByteBuilder(size_t reserve_bytes) { buf_.reserve(reserve_bytes); }

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    [[nodiscard]] ByteSpan view() const noexcept { return buf_; }
    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }
    [[nodiscard]] bool empty() const noexcept { return buf_.empty(); }

    /// Move the finished bytes out. The builder is left empty.
    [[nodiscard]] Bytes finish() {
        Bytes out = std::move(buf_);
        buf_.clear();
        return out;
    }

    void clear() { buf_.clear(); }

private:
    Bytes buf_;
};

// ---------------------------------------------------------------------------
// VectorWriter -- write-only sink appending to a caller-owned vector
// ---------------------------------------------------------------------------
// Does not own the vector; the caller must ensure the referenced vector
// outlives the writer.
// ---------------------------------------------------------------------------
class VectorWriter {
public:
    explicit VectorWriter(Bytes& vec) : vec_(vec) {}

    void write(std::span<const uint8_t> data) {
        vec_.insert(vec_.end(), data.begin(), data.end());
    }

private:
    Bytes& vec_;
};

}  // namespace codec
