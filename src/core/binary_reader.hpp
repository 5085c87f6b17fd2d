#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <array>
#include <cstring>
#include <span>
#include <string>
#include <string_view>

namespace halon {

/// Sequential little-endian reader over an immutable byte buffer.
///
/// Reads are bounds-checked. The first read that would run past the end
/// records a TruncatedData error and every later read returns zero values,
/// so a group of reads can be checked once with failed().
class BinaryReader {
public:
    explicit BinaryReader(std::span<const u8> data) : data_(data) {}
    BinaryReader(const u8* data, size_t size) : data_(data, size) {}

    bool has_remaining(size_t bytes) const {
        return !failed_ && bytes <= data_.size() - pos_;
    }
    size_t position() const { return pos_; }
    size_t remaining() const { return data_.size() - pos_; }
    size_t size() const { return data_.size(); }

    bool failed() const { return failed_; }

    /// TruncatedData error describing the first failed read.
    Error error(std::string_view context) const;

    u8 read_u8() { return read_scalar<u8>(); }
    u16 read_u16() { return read_scalar<u16>(); }
    u32 read_u32() { return read_scalar<u32>(); }
    u64 read_u64() { return read_scalar<u64>(); }

    template <size_t N>
    std::array<u8, N> read_fixed() {
        std::array<u8, N> result{};
        if (claim(N)) {
            std::memcpy(result.data(), data_.data() + pos_ - N, N);
        }
        return result;
    }

    /// View of the next count bytes. Empty on failure.
    std::span<const u8> read_bytes(size_t count);

    /// u32 length followed by that many bytes.
    std::string read_length_prefixed_string();

    /// Read null-terminated C string, advancing past the null byte.
    /// A missing terminator counts as a truncated read.
    std::string read_cstring();

    void skip(size_t bytes) { claim(bytes); }

    /// Move to an absolute position. Positions past the end fail.
    void seek(size_t pos);

private:
    // Host byte order is little-endian on every supported platform, so the
    // on-disk layout can be copied directly.
    template <typename T>
    T read_scalar() {
        T val{};
        if (claim(sizeof(T))) {
            std::memcpy(&val, data_.data() + pos_ - sizeof(T), sizeof(T));
        }
        return val;
    }

    bool claim(size_t bytes);

    std::span<const u8> data_;
    size_t pos_ = 0;
    bool failed_ = false;
    size_t failed_at_ = 0;
    size_t failed_want_ = 0;
};

} // namespace halon
