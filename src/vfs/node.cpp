#include "vfs/node.hpp"

namespace halon::vfs {

bool is_valid_name(std::string_view name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find_first_of("/\\") == std::string_view::npos;
}

Node::Node(std::string name, std::string path,
           std::variant<DirectoryData, pack::FileInfo> data)
    : name_(std::move(name)), path_(std::move(path)), data_(std::move(data)) {}

std::unique_ptr<Node> Node::make_directory(std::string name, std::string path,
                                           u32 block_index) {
    std::unique_ptr<Node> node(
        new Node(std::move(name), std::move(path), DirectoryData{}));
    node->block_index_ = block_index;
    return node;
}

std::unique_ptr<Node> Node::make_file(std::string name, std::string path,
                                      const pack::FileInfo& info) {
    return std::unique_ptr<Node>(
        new Node(std::move(name), std::move(path), info));
}

NodeKind Node::kind() const {
    return std::holds_alternative<DirectoryData>(data_) ? NodeKind::Directory
                                                        : NodeKind::File;
}

const pack::FileInfo* Node::file_info() const {
    return std::get_if<pack::FileInfo>(&data_);
}

const std::vector<std::unique_ptr<Node>>& Node::children() const {
    static const std::vector<std::unique_ptr<Node>> none;
    if (auto* dir = std::get_if<DirectoryData>(&data_)) {
        return dir->children;
    }
    return none;
}

const Node* Node::child(std::string_view name) const {
    auto* dir = std::get_if<DirectoryData>(&data_);
    if (!dir) return nullptr;

    auto it = dir->by_name.find(std::string(name));
    if (it == dir->by_name.end()) return nullptr;
    return dir->children[it->second].get();
}

size_t Node::file_count() const {
    auto* dir = std::get_if<DirectoryData>(&data_);
    if (!dir) return 1;

    size_t count = 0;
    for (const auto& c : dir->children) {
        count += c->file_count();
    }
    return count;
}

bool Node::add_child(std::unique_ptr<Node> child) {
    auto* dir = std::get_if<DirectoryData>(&data_);
    if (!dir) return false;

    auto [it, inserted] =
        dir->by_name.emplace(child->name(), dir->children.size());
    if (!inserted) return false;
    dir->children.push_back(std::move(child));
    return true;
}

} // namespace halon::vfs
