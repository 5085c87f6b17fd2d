#pragma once

#include "core/types.hpp"
#include "pack/entry.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace halon::vfs {

enum class NodeKind { Directory, File };

/// A name usable as a single path component: non-empty, not "." or "..",
/// and free of '/' and '\\'.
bool is_valid_name(std::string_view name);

/// One entry of the archive namespace: either a Directory owning its
/// children in declaration order, or a File carrying its index metadata.
/// Paths are slash-joined from the root and computed once at build time.
class Node {
public:
    static std::unique_ptr<Node> make_directory(std::string name,
                                                std::string path,
                                                u32 block_index = 0);
    static std::unique_ptr<Node> make_file(std::string name, std::string path,
                                           const pack::FileInfo& info);

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    const std::string& name() const { return name_; }
    const std::string& path() const { return path_; }

    NodeKind kind() const;
    bool is_directory() const { return kind() == NodeKind::Directory; }
    bool is_file() const { return kind() == NodeKind::File; }

    /// File metadata, or nullptr for directories.
    const pack::FileInfo* file_info() const;

    /// Index block a directory was decoded from (debug output).
    u32 block_index() const { return block_index_; }

    /// Children in declaration order. Always empty for files.
    const std::vector<std::unique_ptr<Node>>& children() const;

    /// Exact-name child lookup. nullptr if absent or this is a file.
    const Node* child(std::string_view name) const;

    /// Number of files in this subtree; a file counts itself.
    size_t file_count() const;

    /// Attach a child during namespace assembly. Returns false when this is
    /// not a directory or the name is already taken.
    bool add_child(std::unique_ptr<Node> child);

private:
    struct DirectoryData {
        std::vector<std::unique_ptr<Node>> children;
        std::unordered_map<std::string, size_t> by_name;
    };

    Node(std::string name, std::string path,
         std::variant<DirectoryData, pack::FileInfo> data);

    std::string name_;
    std::string path_;
    u32 block_index_ = 0;
    std::variant<DirectoryData, pack::FileInfo> data_;
};

} // namespace halon::vfs
