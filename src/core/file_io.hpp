#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

namespace halon {

/// Read a whole file into memory.
Result<Bytes> read_file(const fs::path& path);

/// Read exactly size bytes starting at offset. Short reads fail with
/// IoFailure naming the file and range.
Result<Bytes> read_file_range(const fs::path& path, u64 offset, u64 size);

/// Write data to path, replacing any existing file.
Result<void> write_file(const fs::path& path, const Bytes& data);

} // namespace halon
