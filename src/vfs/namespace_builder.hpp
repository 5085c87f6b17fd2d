#pragma once

#include "core/result.hpp"
#include "pack/entry.hpp"
#include "vfs/node.hpp"

#include <memory>
#include <vector>

namespace halon::vfs {

/// Assemble the flat entry table into a tree under a synthetic root.
///
/// Pass 1 groups entry ids by parent id; pass 2 attaches nodes depth-first
/// from the root, so parents need not precede their children in the table.
/// Fails with CorruptIndex when a parent id is out of range or names a file,
/// when a directory holds two children with one name, or when some entries
/// cannot be reached from the root (a parent cycle).
Result<std::unique_ptr<Node>> build_namespace(
    const std::vector<pack::Entry>& entries);

} // namespace halon::vfs
