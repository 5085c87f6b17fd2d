#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <span>

namespace halon::pack {

/// Inflate a zlib (RFC 1950) stream. The output must be exactly
/// expected_size bytes.
Result<Bytes> inflate_zlib(std::span<const u8> input, u64 expected_size);

/// Decode the archive's LZMA payload: 5 property bytes followed by a raw
/// LZMA1 stream. The uncompressed size is not stored in the payload; it
/// comes from the index and the output must match it exactly.
Result<Bytes> decode_lzma(std::span<const u8> input, u64 expected_size);

} // namespace halon::pack
