#include "core/types.hpp"

namespace halon {

std::string to_hex(const Sha1Digest& digest) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(digest.size() * 2);
    for (u8 b : digest) {
        result += digits[b >> 4];
        result += digits[b & 0x0f];
    }
    return result;
}

} // namespace halon
