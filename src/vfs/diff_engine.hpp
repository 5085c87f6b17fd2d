#pragma once

#include "vfs/node.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace halon::vfs {

/// File counts for one top-level bucket. Unchanged files are not counted.
struct DiffCounts {
    size_t removed = 0;
    size_t added = 0;
    size_t changed = 0;

    bool empty() const { return removed == 0 && added == 0 && changed == 0; }
    bool operator==(const DiffCounts&) const = default;
};

struct DiffEntry {
    std::string name;
    DiffCounts counts;
};

/// Per top-level entry counts, in the order of the first tree with names
/// only present in the second tree appended in its order.
struct DiffReport {
    std::vector<DiffEntry> entries;

    /// Counts for a bucket, or nullptr when the name appears in neither tree.
    const DiffCounts* find(std::string_view name) const;

    DiffCounts total() const;

    bool identical() const { return total().empty(); }
};

/// Compare two namespaces. When both nodes are directories every child name
/// of either side becomes a bucket; otherwise a single bucket named after
/// the node is produced. Files differ when their sizes or SHA-1 differ. A
/// name that is a directory on one side and a file on the other counts as
/// the removal of one side's files plus the addition of the other's.
DiffReport diff(const Node& a, const Node& b);

} // namespace halon::vfs
