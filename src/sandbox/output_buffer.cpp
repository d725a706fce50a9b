/**
 * @file output_buffer.cpp
 * @brief Implementation of BoundedBuffer
 *
 * @date 2025
 */

#include "codecell/sandbox/output_buffer.hpp"
#include "codecell/utils/string_utils.hpp"

#include <algorithm>

namespace codecell {
namespace sandbox {

using utils::StringUtils;

BoundedBuffer::BoundedBuffer(std::size_t capacity)
    : capacity_(capacity) {
    data_.reserve(std::min<std::size_t>(capacity_, 64 * 1024));
}

void BoundedBuffer::Append(const char* data, std::size_t size) {
    total_bytes_ += size;

    std::size_t room = capacity_ > data_.size() ? capacity_ - data_.size() : 0;
    std::size_t take = std::min(room, size);
    data_.append(data, take);

    if (take < size) {
        truncated_ = true;
    }
}

std::string BoundedBuffer::Contents() const {
    if (!truncated_) {
        return data_;
    }

    const std::string& marker = StringUtils::kTruncationMarker;
    if (capacity_ <= marker.size()) {
        return marker.substr(0, capacity_);
    }

    std::size_t keep = StringUtils::Utf8SafePrefix(data_, capacity_ - marker.size());
    return data_.substr(0, keep) + marker;
}

} // namespace sandbox
} // namespace codecell
