#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "pack/entry.hpp"
#include "pack/pack_file.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace halon::pack {

/// 'AARC' stored little-endian.
constexpr std::array<u8, 4> ARCHIVE_MAGIC = {'C', 'R', 'A', 'A'};
constexpr size_t ARCHIVE_RECORD_SIZE = 32;

/// Fields of the archive root block.
struct ArchiveRoot {
    u32 version = 0;
    u32 entry_count = 0;
    u32 hash_table_block = 0;
};

/// Payload block registered in the archive hash table.
struct ArchiveEntry {
    u32 block_index = 0;
    u64 size = 0;
};

/// Reads payloads out of an .archive file.
///
/// Opening parses the header, block table and hash table; payload bytes are
/// read on demand. Each read opens the file independently, so a const reader
/// can serve any number of traversals.
class ArchiveReader {
public:
    static Result<ArchiveReader> open(const fs::path& path);

    /// Payload of a file, decompressed according to its compression code.
    Result<Bytes> read(const FileInfo& file) const;

    /// Raw payload block as stored in the archive.
    Result<Bytes> read_stored(const FileInfo& file) const;

    /// Read the file and compare the SHA-1 of its content with the
    /// fingerprint recorded in the index.
    Result<void> verify(const FileInfo& file) const;

    bool contains(const Sha1Digest& sha1) const;

    const fs::path& path() const { return path_; }
    const PackHeader& header() const { return header_; }
    const ArchiveRoot& root() const { return root_; }
    size_t entry_count() const { return entries_.size(); }

private:
    static std::string key(const Sha1Digest& sha1) {
        return std::string(sha1.begin(), sha1.end());
    }

    fs::path path_;
    u64 file_size_ = 0;
    PackHeader header_;
    ArchiveRoot root_;
    std::vector<BlockRecord> blocks_;

    /// Raw 20-byte SHA-1 -> payload block.
    std::unordered_map<std::string, ArchiveEntry> entries_;
};

} // namespace halon::pack
