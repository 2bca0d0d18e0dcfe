#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace cborkit::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// ByteBuffer 默认初始容量：多数 CBOR 文档较小，优先一次分配到位。
inline constexpr std::size_t kDefaultBufferCapacity = 4 * 1024;

// ByteBuffer 默认最大容量：异步解码重缓冲的上限，避免恶意长度导致内存耗尽。
inline constexpr std::size_t kDefaultBufferMaxCapacity = 64 * 1024 * 1024;  // 64MB

}  // 命名空间 cborkit::core
