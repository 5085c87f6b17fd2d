#include "vfs/filesystem.hpp"
#include "core/file_io.hpp"
#include "vfs/namespace_builder.hpp"

#include <spdlog/spdlog.h>

namespace halon::vfs {

namespace {

Error with_path(const Node& node, const Error& err) {
    return Error(err.code, node.path() + ": " + err.message);
}

} // namespace

PairPaths pair_paths(const fs::path& base_path) {
    PairPaths paths;
    paths.base = base_path;
    auto ext = base_path.extension();
    if (ext == INDEX_EXTENSION || ext == ARCHIVE_EXTENSION) {
        paths.base.replace_extension();
    }
    paths.index = paths.base;
    paths.index += INDEX_EXTENSION;
    paths.archive = paths.base;
    paths.archive += ARCHIVE_EXTENSION;
    return paths;
}

Result<Filesystem> Filesystem::open(const fs::path& base_path,
                                    const FilesystemOptions& options) {
    auto paths = pair_paths(base_path);

    std::error_code ec;
    for (const auto& half : {paths.index, paths.archive}) {
        if (!fs::is_regular_file(half, ec)) {
            return Error(ErrorCode::MissingPair,
                         "Missing " + half.string() + " (both " +
                             paths.base.string() + ".index and .archive " +
                             "are required)");
        }
    }

    auto index_bytes = read_file(paths.index);
    if (!index_bytes) return index_bytes.error();

    auto table = pack::decode_index(index_bytes.value());
    if (!table) {
        const auto& err = table.error();
        return Error(err.code, paths.index.string() + ": " + err.message);
    }

    auto root = build_namespace(table.value().entries);
    if (!root) {
        const auto& err = root.error();
        return Error(err.code, paths.index.string() + ": " + err.message);
    }

    auto archive = pack::ArchiveReader::open(paths.archive);
    if (!archive) {
        const auto& err = archive.error();
        return Error(err.code, paths.archive.string() + ": " + err.message);
    }

    Filesystem filesystem;
    filesystem.base_path_ = paths.base;
    filesystem.options_ = options;
    filesystem.index_header_ = table.value().header;
    filesystem.index_root_ = table.value().root;
    filesystem.entry_count_ = table.value().entries.size();
    filesystem.root_ = std::move(root.value());
    filesystem.archive_ = std::move(archive.value());

    spdlog::info("Opened {}: {} entries, {} archive payloads",
                 paths.base.string(), filesystem.entry_count_,
                 filesystem.archive_.entry_count());
    return std::move(filesystem);
}

Result<const Node*> Filesystem::resolve(std::string_view path) const {
    return vfs::resolve(*root_, path, options_.lookup);
}

NodeRange Filesystem::find(std::string_view substring) const {
    return vfs::find(*root_, substring, options_.lookup);
}

std::vector<const Node*> Filesystem::list(const Node& node,
                                          bool recursive) const {
    if (node.is_file()) {
        return {&node};
    }
    if (recursive) {
        return NodeRange(node, {}).collect();
    }

    std::vector<const Node*> result;
    result.reserve(node.children().size());
    for (const auto& child : node.children()) {
        result.push_back(child.get());
    }
    return result;
}

Result<Bytes> Filesystem::read(const Node& node) const {
    if (!node.is_file()) {
        return Error(ErrorCode::InvalidArgument,
                     "'" + node.path() + "' is a directory");
    }
    auto data = archive_.read(*node.file_info());
    if (!data) return with_path(node, data.error());
    return data;
}

Result<size_t> Filesystem::verify(const Node& node) const {
    if (node.is_file()) {
        auto ok = archive_.verify(*node.file_info());
        if (!ok) return with_path(node, ok.error());
        return size_t{1};
    }

    size_t verified = 0;
    for (const Node* child : NodeRange(node, {})) {
        if (!child->is_file()) continue;
        auto ok = archive_.verify(*child->file_info());
        if (!ok) return with_path(*child, ok.error());
        verified++;
    }
    spdlog::debug("Verified {} files under '{}'", verified, node.path());
    return verified;
}

Result<ExtractStats> Filesystem::extract(const Node& node,
                                         const fs::path& destination) const {
    return vfs::extract(node, archive_, destination);
}

Result<DiffReport> Filesystem::diff(const Filesystem& other,
                                    std::string_view path) const {
    auto mine = resolve(path);
    if (!mine) {
        return Error(ErrorCode::NotFound, base_path_.string() + ": " +
                                              mine.error().message);
    }
    auto theirs = other.resolve(path);
    if (!theirs) {
        return Error(ErrorCode::NotFound, other.base_path_.string() + ": " +
                                              theirs.error().message);
    }
    return vfs::diff(*mine.value(), *theirs.value());
}

} // namespace halon::vfs
