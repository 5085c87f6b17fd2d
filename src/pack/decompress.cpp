#include "pack/decompress.hpp"

#include <algorithm>
#include <cstdint>
#include <lzma.h>
#include <zlib.h>

namespace halon::pack {

namespace {

constexpr size_t LZMA_PROPS_SIZE = 5;

/// Output grows by at most this much per step; the declared size is only
/// an upper bound.
constexpr size_t CHUNK_SIZE = 64 * 1024;

constexpr u64 LZMA_MEMORY_LIMIT = 512ull * 1024 * 1024;

/// One byte past the declared size, so an oversized stream is detected.
u64 output_limit(u64 expected_size) {
    return expected_size == UINT64_MAX ? expected_size : expected_size + 1;
}

/// Grow output by the next chunk (bounded by limit); returns its size.
size_t next_chunk(Bytes& output, u64 produced, u64 limit) {
    size_t room = static_cast<size_t>(std::min<u64>(limit - produced, CHUNK_SIZE));
    output.resize(static_cast<size_t>(produced) + room);
    return room;
}

Error size_mismatch(const char* method, u64 produced, u64 expected) {
    return Error(ErrorCode::CorruptArchive,
                 std::string(method) + " payload decompressed to " +
                     std::to_string(produced) + " bytes, expected " +
                     std::to_string(expected));
}

} // namespace

Result<Bytes> inflate_zlib(std::span<const u8> input, u64 expected_size) {
    z_stream strm{};
    if (inflateInit(&strm) != Z_OK) {
        return Error(ErrorCode::CorruptArchive, "zlib inflateInit failed");
    }

    const u64 limit = output_limit(expected_size);
    Bytes output;
    u64 produced = 0;
    size_t consumed = 0;
    int ret = Z_OK;
    while (ret == Z_OK && produced < limit) {
        if (strm.avail_in == 0 && consumed < input.size()) {
            size_t feed = std::min(input.size() - consumed, CHUNK_SIZE);
            strm.next_in = const_cast<Bytef*>(input.data() + consumed);
            strm.avail_in = static_cast<uInt>(feed);
            consumed += feed;
        }

        size_t room = next_chunk(output, produced, limit);
        strm.next_out = output.data() + produced;
        strm.avail_out = static_cast<uInt>(room);
        ret = inflate(&strm, Z_NO_FLUSH);
        produced = output.size() - strm.avail_out;
    }
    inflateEnd(&strm);
    output.resize(static_cast<size_t>(produced));

    if (ret == Z_STREAM_END || ret == Z_OK || ret == Z_BUF_ERROR) {
        // Z_OK here means the output reached the limit before the stream
        // ended; Z_BUF_ERROR means the input ran out first.
        if (ret != Z_STREAM_END || produced != expected_size) {
            return size_mismatch("zlib", produced, expected_size);
        }
        return output;
    }
    return Error(ErrorCode::CorruptArchive,
                 "zlib error: " + std::to_string(ret));
}

Result<Bytes> decode_lzma(std::span<const u8> input, u64 expected_size) {
    if (input.size() < LZMA_PROPS_SIZE) {
        return Error(ErrorCode::CorruptArchive,
                     "LZMA payload of " + std::to_string(input.size()) +
                         " bytes is shorter than its property header");
    }

    // Rebuild a .lzma "alone" stream: props, u64 uncompressed size, data.
    Bytes stream;
    stream.reserve(input.size() + 8);
    stream.insert(stream.end(), input.begin(),
                  input.begin() + LZMA_PROPS_SIZE);
    for (int i = 0; i < 8; i++) {
        stream.push_back(static_cast<u8>(expected_size >> (8 * i)));
    }
    stream.insert(stream.end(), input.begin() + LZMA_PROPS_SIZE, input.end());

    lzma_stream strm = LZMA_STREAM_INIT;
    lzma_ret ret = lzma_alone_decoder(&strm, LZMA_MEMORY_LIMIT);
    if (ret != LZMA_OK) {
        return Error(ErrorCode::CorruptArchive,
                     "lzma decoder init failed: " + std::to_string(ret));
    }

    // One spare byte so a trailing end marker can be consumed after the
    // declared size is reached.
    const u64 limit = output_limit(expected_size);
    Bytes output;
    u64 produced = 0;
    strm.next_in = stream.data();
    strm.avail_in = stream.size();
    while (ret == LZMA_OK && produced < limit) {
        size_t room = next_chunk(output, produced, limit);
        strm.next_out = output.data() + produced;
        strm.avail_out = room;
        ret = lzma_code(&strm, LZMA_FINISH);
        produced = output.size() - strm.avail_out;
    }
    lzma_end(&strm);
    output.resize(static_cast<size_t>(produced));

    if (ret != LZMA_STREAM_END) {
        if (ret == LZMA_OK || ret == LZMA_BUF_ERROR) {
            return size_mismatch("lzma", produced, expected_size);
        }
        return Error(ErrorCode::CorruptArchive,
                     "lzma error: " + std::to_string(ret));
    }
    if (produced != expected_size) {
        return size_mismatch("lzma", produced, expected_size);
    }
    return output;
}

} // namespace halon::pack
