#include "core/binary_reader.hpp"

namespace halon {

bool BinaryReader::claim(size_t bytes) {
    if (failed_) return false;
    if (bytes > data_.size() - pos_) {
        failed_ = true;
        failed_at_ = pos_;
        failed_want_ = bytes;
        return false;
    }
    pos_ += bytes;
    return true;
}

Error BinaryReader::error(std::string_view context) const {
    return Error(ErrorCode::TruncatedData,
                 std::string(context) + ": read of " +
                     std::to_string(failed_want_) + " bytes at offset " +
                     std::to_string(failed_at_) + " exceeds buffer of " +
                     std::to_string(data_.size()) + " bytes");
}

std::span<const u8> BinaryReader::read_bytes(size_t count) {
    if (!claim(count)) return {};
    return data_.subspan(pos_ - count, count);
}

std::string BinaryReader::read_length_prefixed_string() {
    u32 length = read_u32();
    auto bytes = read_bytes(length);
    return std::string(bytes.begin(), bytes.end());
}

std::string BinaryReader::read_cstring() {
    if (failed_) return {};
    size_t end = pos_;
    while (end < data_.size() && data_[end] != 0) {
        end++;
    }
    if (end == data_.size()) {
        claim(end - pos_ + 1);
        return {};
    }
    std::string result;
    result.reserve(end - pos_);
    while (pos_ < end) {
        result.push_back(static_cast<char>(data_[pos_++]));
    }
    pos_++; // skip null terminator
    return result;
}

void BinaryReader::seek(size_t pos) {
    if (failed_) return;
    if (pos > data_.size()) {
        failed_ = true;
        failed_at_ = pos;
        failed_want_ = 0;
        return;
    }
    pos_ = pos;
}

} // namespace halon
