/**
 * @file output_buffer.hpp
 * @brief Byte-capped capture of a child stream
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <cstddef>

namespace codecell {
namespace sandbox {

/**
 * @class BoundedBuffer
 * @brief Keeps at most capacity bytes of a stream
 *
 * Bytes past the cap are counted and discarded; the pipe keeps being
 * drained so the writer never blocks. Contents() never exceeds the cap:
 * when data was dropped, the tail is replaced by the truncation marker.
 */
class BoundedBuffer {
public:
    explicit BoundedBuffer(std::size_t capacity);

    void Append(const char* data, std::size_t size);

    /// Captured text, marker included when truncated
    std::string Contents() const;

    bool Truncated() const { return truncated_; }
    std::size_t TotalBytes() const { return total_bytes_; }
    std::size_t Capacity() const { return capacity_; }

private:
    std::size_t capacity_;
    std::string data_;
    std::size_t total_bytes_{0};
    bool truncated_{false};
};

} // namespace sandbox
} // namespace codecell
