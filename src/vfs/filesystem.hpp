#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "pack/archive_reader.hpp"
#include "pack/index_decoder.hpp"
#include "vfs/diff_engine.hpp"
#include "vfs/extractor.hpp"
#include "vfs/node.hpp"
#include "vfs/path_resolver.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace halon::vfs {

constexpr const char* INDEX_EXTENSION = ".index";
constexpr const char* ARCHIVE_EXTENSION = ".archive";

struct FilesystemOptions {
    LookupOptions lookup;
};

/// Paths of the two halves of a pair.
struct PairPaths {
    fs::path base;
    fs::path index;
    fs::path archive;
};

/// Derive the pair from a base path with or without the .index / .archive
/// extension.
PairPaths pair_paths(const fs::path& base_path);

/// An opened index/archive pair. Built once by open() and immutable after
/// that; every query is const.
class Filesystem {
public:
    /// Open <base>.index and <base>.archive. Both must exist (MissingPair
    /// otherwise, before anything is parsed). The index is decoded fully;
    /// archive payloads are read on demand.
    static Result<Filesystem> open(const fs::path& base_path,
                                   const FilesystemOptions& options = {});

    const Node& root() const { return *root_; }

    Result<const Node*> resolve(std::string_view path) const;

    /// Every node whose path contains substring, lazily, in pre-order.
    NodeRange find(std::string_view substring) const;

    /// Immediate children of a directory in declaration order, or its whole
    /// pre-order subtree when recursive. A file lists as itself.
    std::vector<const Node*> list(const Node& node,
                                  bool recursive = false) const;

    /// Decompressed content of a file.
    Result<Bytes> read(const Node& node) const;

    /// Check the SHA-1 of every file at or below node. Returns the number
    /// of files verified; stops at the first mismatch.
    Result<size_t> verify(const Node& node) const;

    Result<ExtractStats> extract(const Node& node,
                                 const fs::path& destination) const;

    /// Diff the node at path in this filesystem against the same path in
    /// other.
    Result<DiffReport> diff(const Filesystem& other,
                            std::string_view path = {}) const;

    const fs::path& base_path() const { return base_path_; }
    const pack::PackHeader& index_header() const { return index_header_; }
    const pack::IndexRoot& index_root() const { return index_root_; }
    const pack::ArchiveReader& archive() const { return archive_; }
    size_t entry_count() const { return entry_count_; }

private:
    Filesystem() = default;

    fs::path base_path_;
    FilesystemOptions options_;
    pack::PackHeader index_header_;
    pack::IndexRoot index_root_;
    size_t entry_count_ = 0;
    std::unique_ptr<Node> root_;
    pack::ArchiveReader archive_;
};

} // namespace halon::vfs
