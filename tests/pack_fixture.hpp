#pragma once

#include "core/types.hpp"
#include "pack/entry.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace halon::test {

Bytes to_bytes(std::string_view text);
Bytes compress_zlib(const Bytes& data);

/// 5 property bytes followed by a raw LZMA1 stream without end marker.
Bytes compress_lzma(const Bytes& data);

Sha1Digest sha1_of(const Bytes& data);

/// Little-endian byte sink.
class ByteWriter {
public:
    void put_u32(u32 value);
    void put_u64(u64 value);
    void put_bytes(const Bytes& data) { data_.insert(data_.end(), data.begin(), data.end()); }
    void put_raw(const void* data, size_t size);

    const Bytes& data() const { return data_; }
    Bytes take() { return std::move(data_); }

private:
    Bytes data_;
};

/// header + blocks + block table, as both file kinds are laid out.
Bytes assemble_pack(const std::vector<Bytes>& blocks, u32 root_block);

Bytes index_root_block(u32 root_directory_block);

/// Directory block from (name, block) dir records and (name, info) file records.
Bytes directory_block(
    const std::vector<std::pair<std::string, u32>>& dirs,
    const std::vector<std::pair<std::string, pack::FileInfo>>& files);

struct FixtureFile {
    std::string name;
    Bytes content;
    u32 compression = pack::compression::STORED;
    u64 write_time = 0;
    std::optional<Sha1Digest> sha1_override;

    Bytes payload() const;
    Sha1Digest sha1() const;
    pack::FileInfo info() const;
};

/// In-memory description of a namespace that can be written out as an
/// .index/.archive pair.
class PackFixture {
public:
    PackFixture();
    PackFixture(const PackFixture& other);
    PackFixture& operator=(const PackFixture& other);

    /// Add a file; missing parent directories are created in call order.
    void add_file(std::string_view path, const Bytes& content,
                  u32 compression = pack::compression::STORED);
    void add_directory(std::string_view path);

    /// nullptr if no file has that path.
    FixtureFile* file(std::string_view path);

    Bytes build_index() const;
    Bytes build_archive() const;

    /// Write <dir>/<base>.index and .archive; returns <dir>/<base>.
    fs::path write(const fs::path& dir, const std::string& base) const;

private:
    struct Dir {
        std::string name;
        std::vector<std::unique_ptr<Dir>> dirs;
        std::vector<FixtureFile> files;
    };

    static std::unique_ptr<Dir> clone(const Dir& dir);
    Dir* ensure_dir(const std::vector<std::string_view>& segments);
    static u32 emit_directory(const Dir& dir, std::vector<Bytes>& blocks);

    std::unique_ptr<Dir> root_;
};

/// UI/FloatText and friends, mixing stored, zlib and LZMA payloads.
PackFixture sample_fixture();

/// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

void write_bytes(const fs::path& path, const Bytes& data);
Bytes read_bytes(const fs::path& path);

} // namespace halon::test
