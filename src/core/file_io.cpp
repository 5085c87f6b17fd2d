#include "core/file_io.hpp"

#include <fstream>

namespace halon {

Result<Bytes> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return Error(ErrorCode::IoFailure, "Cannot open " + path.string());
    }

    auto size = file.tellg();
    if (size < 0) {
        return Error(ErrorCode::IoFailure, "Cannot size " + path.string());
    }
    file.seekg(0, std::ios::beg);

    Bytes buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return Error(ErrorCode::IoFailure, "Failed to read " + path.string());
    }

    return buffer;
}

Result<Bytes> read_file_range(const fs::path& path, u64 offset, u64 size) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Error(ErrorCode::IoFailure, "Cannot open " + path.string());
    }

    file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    Bytes buffer(static_cast<size_t>(size));
    if (!file || !file.read(reinterpret_cast<char*>(buffer.data()),
                            static_cast<std::streamsize>(size))) {
        return Error(ErrorCode::IoFailure,
                     "Failed to read " + std::to_string(size) +
                         " bytes at offset " + std::to_string(offset) +
                         " from " + path.string());
    }

    return buffer;
}

Result<void> write_file(const fs::path& path, const Bytes& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error(ErrorCode::IoFailure,
                     "Failed to create output file: " + path.string());
    }

    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!out) {
        return Error(ErrorCode::IoFailure,
                     "Failed to write to output file: " + path.string());
    }

    return {};
}

} // namespace halon
