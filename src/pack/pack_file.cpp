#include "pack/pack_file.hpp"
#include "core/binary_reader.hpp"

#include <spdlog/spdlog.h>

namespace halon::pack {

std::string magic_string(const std::array<u8, 4>& magic) {
    std::string result;
    for (u8 c : magic) {
        if (c >= 0x20 && c < 0x7f) {
            result += static_cast<char>(c);
        } else {
            static constexpr char digits[] = "0123456789abcdef";
            result += "\\x";
            result += digits[c >> 4];
            result += digits[c & 0x0f];
        }
    }
    return result;
}

Result<PackHeader> parse_pack_header(std::span<const u8> data) {
    BinaryReader r(data);

    PackHeader header;
    header.magic = r.read_fixed<4>();
    header.version = r.read_u32();
    if (r.failed()) return r.error("Pack header");

    if (header.magic != PACK_MAGIC) {
        return Error(ErrorCode::UnrecognizedFormat,
                     "Invalid pack magic (expected 'KCAP', got '" +
                         magic_string(header.magic) + "')");
    }
    if (header.version != PACK_VERSION) {
        return Error(ErrorCode::UnrecognizedFormat,
                     "Unsupported pack version " +
                         std::to_string(header.version));
    }

    r.skip(512); // reserved
    header.file_size = r.read_u64();
    header.unknown1 = r.read_u64();
    header.block_table_offset = r.read_u64();
    header.block_count = r.read_u32();
    header.unknown2 = r.read_u32();
    header.root_block = r.read_u32();
    if (r.failed()) return r.error("Pack header");

    if (header.root_block >= header.block_count) {
        return Error(ErrorCode::UnrecognizedFormat,
                     "Pack root block " + std::to_string(header.root_block) +
                         " outside block table of " +
                         std::to_string(header.block_count) + " entries");
    }

    spdlog::debug("Pack header: version {}, {} blocks, table at {:#x}, root {}",
                  header.version, header.block_count,
                  header.block_table_offset, header.root_block);
    return header;
}

Result<std::vector<BlockRecord>> parse_block_table(std::span<const u8> data,
                                                   u32 count) {
    BinaryReader r(data);
    if (!r.has_remaining(static_cast<size_t>(count) * BLOCK_RECORD_SIZE)) {
        return Error(ErrorCode::TruncatedData,
                     "Block table of " + std::to_string(count) +
                         " entries needs " +
                         std::to_string(static_cast<u64>(count) *
                                        BLOCK_RECORD_SIZE) +
                         " bytes, have " + std::to_string(r.remaining()));
    }

    std::vector<BlockRecord> table;
    table.reserve(count);
    for (u32 i = 0; i < count; i++) {
        BlockRecord block;
        block.offset = r.read_u64();
        block.size = r.read_u64();
        table.push_back(block);
    }
    if (r.failed()) return r.error("Block table");
    return table;
}

Result<BlockRecord> block_at(const std::vector<BlockRecord>& table, u32 index,
                             u64 file_size, ErrorCode corrupt,
                             std::string_view file_kind) {
    if (index >= table.size()) {
        return Error(corrupt, std::string(file_kind) + " block " +
                                  std::to_string(index) +
                                  " outside block table of " +
                                  std::to_string(table.size()) + " entries");
    }

    const auto& block = table[index];
    if (block.offset > file_size || block.size > file_size - block.offset) {
        return Error(corrupt, std::string(file_kind) + " block " +
                                  std::to_string(index) + " (offset " +
                                  std::to_string(block.offset) + ", size " +
                                  std::to_string(block.size) +
                                  ") extends beyond file of " +
                                  std::to_string(file_size) + " bytes");
    }
    return block;
}

} // namespace halon::pack
