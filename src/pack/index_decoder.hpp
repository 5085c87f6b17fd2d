#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "pack/entry.hpp"
#include "pack/pack_file.hpp"

#include <span>
#include <vector>

namespace halon::pack {

/// 'AIDX' stored little-endian.
constexpr std::array<u8, 4> INDEX_MAGIC = {'X', 'D', 'I', 'A'};

constexpr size_t DIRECTORY_RECORD_SIZE = 8;
constexpr size_t FILE_RECORD_SIZE = 56;

/// Fields of the index root block.
struct IndexRoot {
    u32 version = 0;
    u32 unknown = 0;
    u32 root_directory_block = 0;
};

/// Everything decoded from an .index file.
struct IndexTable {
    PackHeader header;
    IndexRoot root;
    std::vector<Entry> entries;

    /// Block count declared by the pack header.
    u32 declared_block_count() const { return header.block_count; }
};

/// Decode a complete .index file.
/// Directory blocks are walked breadth-first from the root directory; every
/// child is appended to the flat table after its parent directory.
Result<IndexTable> decode_index(std::span<const u8> data);

} // namespace halon::pack
