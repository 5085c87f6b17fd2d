#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <array>
#include <span>
#include <string_view>
#include <vector>

namespace halon::pack {

/// 'PACK' stored little-endian.
constexpr std::array<u8, 4> PACK_MAGIC = {'K', 'C', 'A', 'P'};
constexpr u32 PACK_VERSION = 1;

/// magic + version + 512 reserved + 3 * u64 + 3 * u32
constexpr size_t PACK_HEADER_SIZE = 556;
constexpr size_t BLOCK_RECORD_SIZE = 16;

/// Outer header shared by the .index and .archive files.
struct PackHeader {
    std::array<u8, 4> magic{};
    u32 version = 0;
    u64 file_size = 0;
    u64 unknown1 = 0;
    u64 block_table_offset = 0;
    u32 block_count = 0;
    u32 unknown2 = 0;
    u32 root_block = 0;
};

/// Location of one block inside its file.
struct BlockRecord {
    u64 offset = 0;
    u64 size = 0;
};

/// Parse the 556-byte header at the start of data.
Result<PackHeader> parse_pack_header(std::span<const u8> data);

/// Parse count block records from data (the raw table bytes).
Result<std::vector<BlockRecord>> parse_block_table(std::span<const u8> data,
                                                   u32 count);

/// Look up block index and check it lies within a file of file_size bytes.
/// Failures use the caller's corruption code (CorruptIndex or CorruptArchive).
Result<BlockRecord> block_at(const std::vector<BlockRecord>& table, u32 index,
                             u64 file_size, ErrorCode corrupt,
                             std::string_view file_kind);

std::string magic_string(const std::array<u8, 4>& magic);

} // namespace halon::pack
