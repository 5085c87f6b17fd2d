#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "pack/archive_reader.hpp"
#include "vfs/node.hpp"

namespace halon::vfs {

struct ExtractStats {
    size_t directories = 0;
    size_t files = 0;
    u64 bytes = 0;
};

/// Write the subtree rooted at node under destination, keeping the node's
/// own name as the top-level entry (the unnamed root extracts straight into
/// destination). Directories are created if missing, files are replaced.
/// Not transactional: a failure leaves whatever was already written.
Result<ExtractStats> extract(const Node& node,
                             const pack::ArchiveReader& archive,
                             const fs::path& destination);

} // namespace halon::vfs
