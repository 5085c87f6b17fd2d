#include "vfs/namespace_builder.hpp"

#include <spdlog/spdlog.h>

namespace halon::vfs {

namespace {

struct PendingDirectory {
    Node* node;
    const std::vector<u32>* children;
};

} // namespace

Result<std::unique_ptr<Node>> build_namespace(
    const std::vector<pack::Entry>& entries) {
    // --- Pass 1: link by id ---
    std::vector<std::vector<u32>> children_of(entries.size());
    std::vector<u32> root_children;

    for (u32 id = 0; id < entries.size(); id++) {
        const auto& entry = entries[id];
        if (!is_valid_name(entry.name)) {
            return Error(ErrorCode::CorruptIndex,
                         "Entry " + std::to_string(id) + " has invalid name '" +
                             entry.name + "'");
        }

        if (!entry.parent_id) {
            root_children.push_back(id);
            continue;
        }

        u32 parent = *entry.parent_id;
        if (parent >= entries.size()) {
            return Error(ErrorCode::CorruptIndex,
                         "Entry '" + entry.name + "' references parent " +
                             std::to_string(parent) + " of " +
                             std::to_string(entries.size()) + " entries");
        }
        if (entries[parent].kind != pack::EntryKind::Directory) {
            return Error(ErrorCode::CorruptIndex,
                         "Entry '" + entry.name + "' has file '" +
                             entries[parent].name + "' as its parent");
        }
        children_of[parent].push_back(id);
    }

    // --- Pass 2: attach depth-first from the root ---
    auto root = Node::make_directory("", "");
    std::vector<PendingDirectory> stack;
    stack.push_back({root.get(), &root_children});
    size_t attached = 0;

    while (!stack.empty()) {
        auto dir = stack.back();
        stack.pop_back();

        for (u32 id : *dir.children) {
            const auto& entry = entries[id];
            std::string path = dir.node->path().empty()
                                   ? entry.name
                                   : dir.node->path() + "/" + entry.name;

            std::unique_ptr<Node> child;
            if (entry.kind == pack::EntryKind::Directory) {
                child = Node::make_directory(entry.name, std::move(path),
                                             entry.block_index);
            } else {
                child = Node::make_file(entry.name, std::move(path), entry.file);
            }

            Node* raw = child.get();
            if (!dir.node->add_child(std::move(child))) {
                return Error(ErrorCode::CorruptIndex,
                             "Duplicate entry '" + entry.name +
                                 "' in directory '" + dir.node->path() + "'");
            }
            attached++;

            if (raw->is_directory()) {
                stack.push_back({raw, &children_of[id]});
            }
        }
    }

    if (attached != entries.size()) {
        return Error(ErrorCode::CorruptIndex,
                     std::to_string(entries.size() - attached) +
                         " entries are not reachable from the root");
    }

    spdlog::debug("Namespace: {} nodes attached", attached);
    return std::move(root);
}

} // namespace halon::vfs
