#include "cborkit/core/buffer.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <new>

namespace cborkit::core {

ByteBuffer::ByteBuffer(std::size_t initial_capacity, std::size_t max_capacity)
    : max_capacity_(max_capacity),
      capacity_(std::min(initial_capacity, max_capacity)) {
    if (capacity_ != 0) {
        data_ = std::make_unique<byte[]>(capacity_);
    }
}

ByteBuffer::ByteBuffer(ByteBuffer &&other) noexcept
    : data_(std::move(other.data_)), max_capacity_(other.max_capacity_),
      capacity_(other.capacity_), read_pos_(other.read_pos_),
      write_pos_(other.write_pos_) {
    other.capacity_ = 0;
    other.read_pos_ = 0;
    other.write_pos_ = 0;
}

ByteBuffer &ByteBuffer::operator=(ByteBuffer &&other) noexcept {
    if (this == &other) {
        return *this;
    }
    data_ = std::move(other.data_);
    max_capacity_ = other.max_capacity_;
    capacity_ = other.capacity_;
    read_pos_ = other.read_pos_;
    write_pos_ = other.write_pos_;
    other.capacity_ = 0;
    other.read_pos_ = 0;
    other.write_pos_ = 0;
    return *this;
}

void ByteBuffer::clear() noexcept {
    read_pos_ = 0;
    write_pos_ = 0;
}

void ByteBuffer::compact() noexcept {
    const auto readable = size();
    if (readable == 0) {
        clear();
        return;
    }
    if (read_pos_ == 0) {
        return;
    }
    std::memmove(data_.get(), data_.get() + read_pos_, readable);
    read_pos_ = 0;
    write_pos_ = readable;
}

bytes_view ByteBuffer::readable_bytes() const noexcept {
    if (!data_) {
        return {};
    }
    return bytes_view{data_.get() + read_pos_, size()};
}

std::error_code ByteBuffer::prepare(std::size_t n, mutable_bytes_view &out) noexcept {
    if (capacity_ - write_pos_ < n && read_pos_ != 0) {
        compact();
    }
    if (capacity_ - write_pos_ < n) {
        const auto readable = size();
        if (n > std::numeric_limits<std::size_t>::max() - readable) {
            return make_error_code(errc::buffer_overflow);
        }
        if (auto ec = grow(readable + n)) {
            return ec;
        }
    }
    out = mutable_bytes_view{data_.get() + write_pos_, capacity_ - write_pos_};
    return {};
}

std::error_code ByteBuffer::commit(std::size_t n) noexcept {
    if (n > capacity_ - write_pos_) {
        return make_error_code(errc::invalid_argument);
    }
    write_pos_ += n;
    return {};
}

std::error_code ByteBuffer::append(bytes_view data) noexcept {
    if (data.empty()) {
        return {};
    }
    mutable_bytes_view dst;
    if (auto ec = prepare(data.size(), dst)) {
        return ec;
    }
    std::memcpy(dst.data(), data.data(), data.size());
    write_pos_ += data.size();
    return {};
}

std::error_code ByteBuffer::consume(std::size_t n) noexcept {
    if (n > size()) {
        return make_error_code(errc::invalid_argument);
    }
    read_pos_ += n;
    if (read_pos_ == write_pos_) {
        clear();
    }
    return {};
}

std::error_code ByteBuffer::grow(std::size_t min_capacity) noexcept {
    if (min_capacity > max_capacity_) {
        return make_error_code(errc::buffer_overflow);
    }
    // 按 2 倍增长，直到 >= min_capacity，且不超过 max_capacity_。
    std::size_t new_capacity = std::max<std::size_t>(capacity_, 1);
    while (new_capacity < min_capacity) {
        if (new_capacity > max_capacity_ / 2) {
            new_capacity = max_capacity_;
            break;
        }
        new_capacity *= 2;
    }

    std::unique_ptr<byte[]> grown(new (std::nothrow) byte[new_capacity]);
    if (!grown) {
        return make_error_code(errc::buffer_overflow);
    }
    const auto readable = size();
    if (readable != 0) {
        std::memcpy(grown.get(), data_.get() + read_pos_, readable);
    }
    data_ = std::move(grown);
    capacity_ = new_capacity;
    read_pos_ = 0;
    write_pos_ = readable;
    return {};
}

} // namespace cborkit::core
