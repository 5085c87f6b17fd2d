#include "pack/index_decoder.hpp"
#include "core/binary_reader.hpp"

#include <algorithm>
#include <deque>
#include <optional>
#include <spdlog/spdlog.h>
#include <utility>

namespace halon::pack {

namespace {

Result<std::string> name_at(std::span<const u8> names, u32 offset,
                            u32 block_index) {
    if (offset >= names.size()) {
        return Error(ErrorCode::CorruptIndex,
                     "Name offset " + std::to_string(offset) +
                         " outside name table of directory block " +
                         std::to_string(block_index));
    }
    auto begin = names.begin() + offset;
    auto end = std::find(begin, names.end(), u8{0});
    if (end == names.end()) {
        return Error(ErrorCode::CorruptIndex,
                     "Unterminated name at offset " + std::to_string(offset) +
                         " in directory block " + std::to_string(block_index));
    }
    return std::string(begin, end);
}

struct PendingDirectory {
    u32 block_index = 0;
    std::optional<u32> entry_id; // empty for the root directory
};

class IndexDecoder {
public:
    IndexDecoder(std::span<const u8> data, std::vector<BlockRecord> blocks)
        : data_(data), blocks_(std::move(blocks)),
          visited_(blocks_.size(), false) {}

    Result<void> decode_tree(u32 root_directory_block,
                             std::vector<Entry>& entries);

private:
    Result<void> decode_directory(const PendingDirectory& dir,
                                  std::vector<Entry>& entries);

    std::span<const u8> data_;
    std::vector<BlockRecord> blocks_;
    std::vector<bool> visited_;
    std::deque<PendingDirectory> queue_;
};

Result<void> IndexDecoder::decode_tree(u32 root_directory_block,
                                       std::vector<Entry>& entries) {
    queue_.push_back({root_directory_block, std::nullopt});
    while (!queue_.empty()) {
        auto dir = queue_.front();
        queue_.pop_front();
        auto result = decode_directory(dir, entries);
        if (!result) return result;
    }
    return {};
}

Result<void> IndexDecoder::decode_directory(const PendingDirectory& dir,
                                            std::vector<Entry>& entries) {
    auto block_result = block_at(blocks_, dir.block_index, data_.size(),
                                 ErrorCode::CorruptIndex, "Index");
    if (!block_result) return block_result.error();
    const auto& block = block_result.value();

    // Two directory records pointing at one block would make the tree a
    // graph; a record pointing back up would make it a cycle.
    if (visited_[dir.block_index]) {
        return Error(ErrorCode::CorruptIndex,
                     "Directory block " + std::to_string(dir.block_index) +
                         " referenced more than once");
    }
    visited_[dir.block_index] = true;

    BinaryReader r(data_.subspan(static_cast<size_t>(block.offset),
                                 static_cast<size_t>(block.size)));
    u32 dir_count = r.read_u32();
    u32 file_count = r.read_u32();
    if (r.failed()) return r.error("Directory block header");

    size_t records_size = static_cast<size_t>(dir_count) * DIRECTORY_RECORD_SIZE +
                          static_cast<size_t>(file_count) * FILE_RECORD_SIZE;
    if (!r.has_remaining(records_size)) {
        return Error(ErrorCode::CorruptIndex,
                     "Directory block " + std::to_string(dir.block_index) +
                         " declares " + std::to_string(dir_count) + " dirs and " +
                         std::to_string(file_count) + " files but holds only " +
                         std::to_string(r.remaining()) + " bytes");
    }

    struct DirectoryRecord {
        u32 name_offset;
        u32 block_index;
    };
    std::vector<DirectoryRecord> dir_records(dir_count);
    for (auto& rec : dir_records) {
        rec.name_offset = r.read_u32();
        rec.block_index = r.read_u32();
    }

    std::vector<std::pair<u32, FileInfo>> file_records(file_count);
    for (auto& [name_offset, info] : file_records) {
        name_offset = r.read_u32();
        info.compression = r.read_u32();
        info.write_time = r.read_u64();
        info.uncompressed_size = r.read_u64();
        info.compressed_size = r.read_u64();
        info.sha1 = r.read_fixed<20>();
        r.skip(4); // reserved
    }

    // Whatever follows the records is the name table.
    auto names = r.read_bytes(r.remaining());
    if (r.failed()) return r.error("Directory block records");

    for (const auto& rec : dir_records) {
        auto name = name_at(names, rec.name_offset, dir.block_index);
        if (!name) return name.error();

        Entry entry;
        entry.name = std::move(name.value());
        entry.parent_id = dir.entry_id;
        entry.kind = EntryKind::Directory;
        entry.block_index = rec.block_index;
        entries.push_back(std::move(entry));

        queue_.push_back({rec.block_index,
                          static_cast<u32>(entries.size() - 1)});
    }

    for (auto& [name_offset, info] : file_records) {
        auto name = name_at(names, name_offset, dir.block_index);
        if (!name) return name.error();

        Entry entry;
        entry.name = std::move(name.value());
        entry.parent_id = dir.entry_id;
        entry.kind = EntryKind::File;
        entry.block_index = dir.block_index;
        entry.file = info;
        entries.push_back(std::move(entry));
    }

    return {};
}

} // namespace

Result<IndexTable> decode_index(std::span<const u8> data) {
    auto header = parse_pack_header(data);
    if (!header) return header.error();

    IndexTable table;
    table.header = header.value();

    const auto table_offset = table.header.block_table_offset;
    if (table_offset > data.size()) {
        return Error(ErrorCode::TruncatedData,
                     "Index block table offset " + std::to_string(table_offset) +
                         " beyond end of file (" + std::to_string(data.size()) +
                         " bytes)");
    }
    auto blocks = parse_block_table(data.subspan(static_cast<size_t>(table_offset)),
                                    table.header.block_count);
    if (!blocks) return blocks.error();

    auto root_block = block_at(blocks.value(), table.header.root_block,
                               data.size(), ErrorCode::CorruptIndex, "Index");
    if (!root_block) return root_block.error();

    BinaryReader r(data.subspan(static_cast<size_t>(root_block.value().offset),
                                static_cast<size_t>(root_block.value().size)));
    auto magic = r.read_fixed<4>();
    table.root.version = r.read_u32();
    table.root.unknown = r.read_u32();
    table.root.root_directory_block = r.read_u32();
    if (r.failed()) return r.error("Index root block");

    if (magic != INDEX_MAGIC) {
        return Error(ErrorCode::UnrecognizedFormat,
                     "Invalid index root magic (expected 'XDIA', got '" +
                         magic_string(magic) + "')");
    }

    IndexDecoder decoder(data, std::move(blocks.value()));
    auto tree = decoder.decode_tree(table.root.root_directory_block,
                                    table.entries);
    if (!tree) return tree.error();

    spdlog::debug("Index: {} entries decoded from {} blocks",
                  table.entries.size(), table.header.block_count);
    return table;
}

} // namespace halon::pack
