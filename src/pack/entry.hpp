#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>

namespace halon::pack {

/// Compression codes carried by index file records.
namespace compression {
constexpr u32 NONE = 0;
constexpr u32 STORED = 1;
constexpr u32 ZLIB = 3;
constexpr u32 LZMA = 5;
} // namespace compression

const char* compression_name(u32 code);

/// Per-file metadata from the index. The sha1 doubles as the key of the
/// file's payload block in the archive.
struct FileInfo {
    u32 compression = compression::STORED;
    u64 write_time = 0; ///< Windows FILETIME (100ns ticks since 1601)
    u64 uncompressed_size = 0;
    u64 compressed_size = 0;
    Sha1Digest sha1{};

    bool is_compressed() const {
        return compression != compression::NONE &&
               compression != compression::STORED;
    }
};

enum class EntryKind { Directory, File };

/// Flat record emitted by the index decoder. Ids are positions in the
/// decoded entry table; parent_id is empty for children of the root.
struct Entry {
    std::string name;
    std::optional<u32> parent_id;
    EntryKind kind = EntryKind::File;
    u32 block_index = 0; ///< Directory block this entry was read from (dirs)
    FileInfo file;       ///< Only meaningful for files
};

} // namespace halon::pack
