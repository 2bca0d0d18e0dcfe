#pragma once

#include "cborkit/core/common.hpp"
#include "cborkit/core/error.hpp"

#include <cstddef>
#include <memory>
#include <system_error>

namespace cborkit::core {

/**
 * @brief 可扩容的读缓冲区（读写指针模型）。
 *
 * 用于异步解码：网络字节先 commit 到尾部，解码成功后 consume 已解析前缀；
 * 解码因截断失败时保留数据，等待更多字节后重试。
 *
 * 注意：
 * - 容量受 max_capacity 约束，超过返回 errc::buffer_overflow；
 * - 本类不做线程安全保证。
 */
class ByteBuffer final {
public:
    explicit ByteBuffer(
        std::size_t initial_capacity = kDefaultBufferCapacity,
        std::size_t max_capacity = kDefaultBufferMaxCapacity);

    ByteBuffer(ByteBuffer &&other) noexcept;
    ByteBuffer &operator=(ByteBuffer &&other) noexcept;

    ByteBuffer(const ByteBuffer &) = delete;
    ByteBuffer &operator=(const ByteBuffer &) = delete;

    ~ByteBuffer() = default;

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t size() const noexcept { return write_pos_ - read_pos_; }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    void clear() noexcept;

    [[nodiscard]] bytes_view readable_bytes() const noexcept;

    /**
     * @brief 准备至少 n 字节的尾部可写空间（必要时搬移/扩容）。
     */
    std::error_code prepare(std::size_t n, mutable_bytes_view &out) noexcept;

    std::error_code commit(std::size_t n) noexcept;
    std::error_code append(bytes_view data) noexcept;
    std::error_code consume(std::size_t n) noexcept;

private:
    void compact() noexcept;
    std::error_code grow(std::size_t min_capacity) noexcept;

    std::unique_ptr<byte[]> data_;
    std::size_t max_capacity_{0};
    std::size_t capacity_{0};
    std::size_t read_pos_{0};
    std::size_t write_pos_{0};
};

} // namespace cborkit::core
