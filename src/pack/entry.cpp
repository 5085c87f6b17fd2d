#include "pack/entry.hpp"

namespace halon::pack {

const char* compression_name(u32 code) {
    switch (code) {
    case compression::NONE:
    case compression::STORED: return "stored";
    case compression::ZLIB: return "zlib";
    case compression::LZMA: return "lzma";
    default: return "unknown";
    }
}

} // namespace halon::pack
