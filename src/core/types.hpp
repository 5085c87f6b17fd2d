#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace halon {

namespace fs = std::filesystem;

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i32 = int32_t;
using i64 = int64_t;

using Bytes = std::vector<u8>;

/// Raw 20-byte SHA-1 digest as stored in the index and archive tables.
using Sha1Digest = std::array<u8, 20>;

/// Lowercase hex rendering of a digest.
std::string to_hex(const Sha1Digest& digest);

} // namespace halon
