#include "pack/archive_reader.hpp"
#include "core/binary_reader.hpp"
#include "core/file_io.hpp"
#include "core/sha1.hpp"
#include "pack/decompress.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace halon::pack {

Result<ArchiveReader> ArchiveReader::open(const fs::path& path) {
    ArchiveReader reader;
    reader.path_ = path;

    std::error_code ec;
    reader.file_size_ = fs::file_size(path, ec);
    if (ec) {
        return Error(ErrorCode::IoFailure,
                     "Cannot stat " + path.string() + ": " + ec.message());
    }

    auto header_bytes = read_file_range(
        path, 0, std::min<u64>(reader.file_size_, PACK_HEADER_SIZE));
    if (!header_bytes) return header_bytes.error();
    auto header = parse_pack_header(header_bytes.value());
    if (!header) return header.error();
    reader.header_ = header.value();

    // --- Block table ---
    const u64 table_offset = reader.header_.block_table_offset;
    const u64 table_size =
        static_cast<u64>(reader.header_.block_count) * BLOCK_RECORD_SIZE;
    if (table_offset > reader.file_size_ ||
        table_size > reader.file_size_ - table_offset) {
        return Error(ErrorCode::TruncatedData,
                     "Archive block table (offset " +
                         std::to_string(table_offset) + ", " +
                         std::to_string(table_size) +
                         " bytes) extends beyond file of " +
                         std::to_string(reader.file_size_) + " bytes");
    }
    auto table_bytes = read_file_range(path, table_offset, table_size);
    if (!table_bytes) return table_bytes.error();
    auto blocks = parse_block_table(table_bytes.value(),
                                    reader.header_.block_count);
    if (!blocks) return blocks.error();
    reader.blocks_ = std::move(blocks.value());

    // --- Root block ---
    auto root_block =
        block_at(reader.blocks_, reader.header_.root_block, reader.file_size_,
                 ErrorCode::CorruptArchive, "Archive");
    if (!root_block) return root_block.error();
    auto root_bytes = read_file_range(path, root_block.value().offset,
                                      root_block.value().size);
    if (!root_bytes) return root_bytes.error();

    BinaryReader r(root_bytes.value());
    auto magic = r.read_fixed<4>();
    reader.root_.version = r.read_u32();
    reader.root_.entry_count = r.read_u32();
    reader.root_.hash_table_block = r.read_u32();
    if (r.failed()) return r.error("Archive root block");

    if (magic != ARCHIVE_MAGIC) {
        return Error(ErrorCode::UnrecognizedFormat,
                     "Invalid archive root magic (expected 'CRAA', got '" +
                         magic_string(magic) + "')");
    }

    // --- Hash table ---
    auto table_block =
        block_at(reader.blocks_, reader.root_.hash_table_block,
                 reader.file_size_, ErrorCode::CorruptArchive, "Archive");
    if (!table_block) return table_block.error();
    const u64 needed =
        static_cast<u64>(reader.root_.entry_count) * ARCHIVE_RECORD_SIZE;
    if (table_block.value().size < needed) {
        return Error(ErrorCode::CorruptArchive,
                     "Archive hash table block holds " +
                         std::to_string(table_block.value().size) +
                         " bytes, " + std::to_string(reader.root_.entry_count) +
                         " entries need " + std::to_string(needed));
    }
    auto hash_bytes =
        read_file_range(path, table_block.value().offset, needed);
    if (!hash_bytes) return hash_bytes.error();

    BinaryReader h(hash_bytes.value());
    reader.entries_.reserve(reader.root_.entry_count);
    for (u32 i = 0; i < reader.root_.entry_count; i++) {
        ArchiveEntry entry;
        entry.block_index = h.read_u32();
        auto sha1 = h.read_fixed<20>();
        entry.size = h.read_u64();
        reader.entries_[key(sha1)] = entry;
    }
    if (h.failed()) return h.error("Archive hash table");

    spdlog::debug("Archive {}: {} payload blocks indexed",
                  path.filename().string(), reader.entries_.size());
    return reader;
}

bool ArchiveReader::contains(const Sha1Digest& sha1) const {
    return entries_.contains(key(sha1));
}

Result<Bytes> ArchiveReader::read_stored(const FileInfo& file) const {
    auto it = entries_.find(key(file.sha1));
    if (it == entries_.end()) {
        return Error(ErrorCode::IoFailure,
                     "No payload for sha1 " + to_hex(file.sha1) + " in " +
                         path_.string());
    }

    auto block = block_at(blocks_, it->second.block_index, file_size_,
                          ErrorCode::IoFailure, "Archive");
    if (!block) return block.error();

    u64 size = block.value().size;
    if (file.is_compressed()) {
        if (file.compressed_size > size) {
            return Error(ErrorCode::CorruptArchive,
                         "Payload block " +
                             std::to_string(it->second.block_index) + " holds " +
                             std::to_string(size) + " bytes, index expects " +
                             std::to_string(file.compressed_size));
        }
        size = file.compressed_size;
    }
    return read_file_range(path_, block.value().offset, size);
}

Result<Bytes> ArchiveReader::read(const FileInfo& file) const {
    if (file.uncompressed_size == 0) {
        return Bytes{};
    }

    auto stored = read_stored(file);
    if (!stored) return stored;

    switch (file.compression) {
    case compression::NONE:
    case compression::STORED: {
        auto& data = stored.value();
        if (data.size() < file.uncompressed_size) {
            return Error(ErrorCode::CorruptArchive,
                         "Stored payload holds " + std::to_string(data.size()) +
                             " bytes, expected " +
                             std::to_string(file.uncompressed_size));
        }
        // Blocks may be padded past the file's end
        data.resize(static_cast<size_t>(file.uncompressed_size));
        return stored;
    }
    case compression::ZLIB:
        return inflate_zlib(stored.value(), file.uncompressed_size);
    case compression::LZMA:
        return decode_lzma(stored.value(), file.uncompressed_size);
    default:
        return Error(ErrorCode::CorruptArchive,
                     "Unsupported compression type " +
                         std::to_string(file.compression));
    }
}

Result<void> ArchiveReader::verify(const FileInfo& file) const {
    // Empty files carry no payload and an all-zero fingerprint
    if (file.uncompressed_size == 0 && file.sha1 == Sha1Digest{}) {
        return {};
    }

    auto data = read(file);
    if (!data) return data.error();

    auto digest = sha1_digest(data.value());
    if (!digest) return digest.error();

    if (digest.value() != file.sha1) {
        return Error(ErrorCode::CorruptArchive,
                     "SHA-1 mismatch: index has " + to_hex(file.sha1) +
                         ", content hashes to " + to_hex(digest.value()));
    }
    return {};
}

} // namespace halon::pack
