#pragma once

#include "core/result.hpp"
#include "vfs/node.hpp"

#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace halon::vfs {

struct LookupOptions {
    bool case_sensitive = true;
};

/// Split a path on '/' or '\', dropping empty segments.
std::vector<std::string_view> split_path(std::string_view path);

/// Walk from root to the node named by path. An empty path is the root.
/// Fails with NotFound when a segment is missing or names a file that is
/// not the last segment.
Result<const Node*> resolve(const Node& root, std::string_view path,
                            const LookupOptions& options = {});

class NodeRange;

/// Pre-order iterator over the descendants of a node.
class NodeIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = const Node*;
    using difference_type = std::ptrdiff_t;
    using pointer = const Node* const*;
    using reference = const Node*;

    NodeIterator() = default;
    NodeIterator(const Node& start, const NodeRange* range);

    reference operator*() const { return current_; }
    NodeIterator& operator++();
    void operator++(int) { ++*this; }

    bool operator==(const NodeIterator& other) const {
        return current_ == other.current_;
    }

private:
    void push_children(const Node& node);
    void advance();

    std::vector<const Node*> stack_;
    const Node* current_ = nullptr;
    const NodeRange* range_ = nullptr;
};

/// Lazy, restartable pre-order walk over the descendants of a node (the
/// start node itself is not visited) yielding those whose path contains a
/// substring. Each begin() starts a fresh traversal; nothing is cached.
class NodeRange {
public:
    NodeRange(const Node& start, std::string substring,
              const LookupOptions& options = {});

    NodeIterator begin() const { return NodeIterator(*start_, this); }
    NodeIterator end() const { return {}; }

    bool matches(const Node& node) const;

    /// Drain the walk into a vector.
    std::vector<const Node*> collect() const;

private:
    const Node* start_;
    std::string substring_;
    LookupOptions options_;
};

/// Every descendant of root whose path contains substring, in pre-order.
NodeRange find(const Node& root, std::string_view substring,
               const LookupOptions& options = {});

} // namespace halon::vfs
