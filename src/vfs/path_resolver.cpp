#include "vfs/path_resolver.hpp"

#include <algorithm>
#include <cctype>

namespace halon::vfs {

namespace {

char ascii_lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string lowercase(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(), ascii_lower);
    return result;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return ascii_lower(x) == ascii_lower(y);
           });
}

const Node* lookup_child(const Node& dir, std::string_view name,
                         const LookupOptions& options) {
    if (options.case_sensitive) {
        return dir.child(name);
    }
    for (const auto& c : dir.children()) {
        if (iequals(c->name(), name)) return c.get();
    }
    return nullptr;
}

} // namespace

std::vector<std::string_view> split_path(std::string_view path) {
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find_first_of("/\\", start);
        if (end == std::string_view::npos) end = path.size();
        if (end > start) {
            segments.push_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

Result<const Node*> resolve(const Node& root, std::string_view path,
                            const LookupOptions& options) {
    const Node* node = &root;
    for (auto segment : split_path(path)) {
        if (!node->is_directory()) {
            return Error(ErrorCode::NotFound,
                         "Cannot descend into file " + node->path() +
                             " in path " + std::string(path));
        }
        const Node* next = lookup_child(*node, segment, options);
        if (!next) {
            return Error(ErrorCode::NotFound,
                         "Could not find " + std::string(segment) +
                             " in path " + std::string(path));
        }
        node = next;
    }
    return node;
}

// --- NodeIterator ---

NodeIterator::NodeIterator(const Node& start, const NodeRange* range)
    : range_(range) {
    push_children(start);
    advance();
}

void NodeIterator::push_children(const Node& node) {
    const auto& children = node.children();
    // Reversed so the first declared child is popped first
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        stack_.push_back(it->get());
    }
}

void NodeIterator::advance() {
    while (!stack_.empty()) {
        const Node* node = stack_.back();
        stack_.pop_back();
        push_children(*node);
        if (range_->matches(*node)) {
            current_ = node;
            return;
        }
    }
    current_ = nullptr;
}

NodeIterator& NodeIterator::operator++() {
    advance();
    return *this;
}

// --- NodeRange ---

NodeRange::NodeRange(const Node& start, std::string substring,
                     const LookupOptions& options)
    : start_(&start), substring_(std::move(substring)), options_(options) {
    if (!options_.case_sensitive) {
        substring_ = lowercase(substring_);
    }
}

bool NodeRange::matches(const Node& node) const {
    if (substring_.empty()) return true;
    if (options_.case_sensitive) {
        return node.path().find(substring_) != std::string::npos;
    }
    return lowercase(node.path()).find(substring_) != std::string::npos;
}

std::vector<const Node*> NodeRange::collect() const {
    std::vector<const Node*> result;
    for (const Node* node : *this) {
        result.push_back(node);
    }
    return result;
}

NodeRange find(const Node& root, std::string_view substring,
               const LookupOptions& options) {
    return NodeRange(root, std::string(substring), options);
}

} // namespace halon::vfs
