#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <span>

namespace halon {

/// SHA-1 of data (OpenSSL EVP).
Result<Sha1Digest> sha1_digest(std::span<const u8> data);

} // namespace halon
