#include "core/sha1.hpp"

#include <openssl/evp.h>

namespace halon {

Result<Sha1Digest> sha1_digest(std::span<const u8> data) {
    Sha1Digest digest{};
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &length,
                   EVP_sha1(), nullptr) != 1 ||
        length != digest.size()) {
        return Error(ErrorCode::IoFailure, "SHA-1 digest computation failed");
    }
    return digest;
}

} // namespace halon
