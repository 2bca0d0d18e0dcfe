#pragma once

#include "cborkit/cbor/integer.hpp"
#include "cborkit/cbor/packing.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

namespace cborkit::cbor {

class ByteSource;

enum class major_type : std::uint8_t {
  unsigned_integer = 0,
  negative_integer = 1,
  byte_string = 2,
  text_string = 3,
  array = 4,
  map = 5,
  tag = 6,
  simple = 7,
};

enum class header_kind : std::uint8_t {
  definite = 0,
  indefinite = 1,
  break_code = 2,
};

// 低 5 位的特殊取值。
inline constexpr std::uint8_t kAdditionalOneByte = 24;
inline constexpr std::uint8_t kAdditionalTwoBytes = 25;
inline constexpr std::uint8_t kAdditionalFourBytes = 26;
inline constexpr std::uint8_t kAdditionalEightBytes = 27;
inline constexpr std::uint8_t kAdditionalIndefinite = 31;

inline constexpr byte kBreakByte = 0xFF;

/**
 * @brief 一个数据项的头部：major type + 参数（或 indefinite / break 标记）。
 *
 * - additional：初始字节的低 5 位（major 7 用它区分 simple/half/single/double）；
 * - width：参数占用的额外字节数（0/1/2/4/8）。
 */
struct Header final {
  major_type major{major_type::unsigned_integer};
  header_kind kind{header_kind::definite};
  std::uint8_t additional{0};
  std::uint8_t width{0};
  std::uint64_t argument{0};
};

[[nodiscard]] constexpr byte initial_byte(major_type major, std::uint8_t additional) noexcept {
  return static_cast<byte>((static_cast<std::uint8_t>(major) << 5) | (additional & 0x1Fu));
}

/**
 * @brief 编码参数所需的额外字节数（最短宽度：0/1/2/4/8）。
 */
[[nodiscard]] std::size_t argument_width(std::uint64_t argument) noexcept;

/**
 * @brief 以最短宽度追加 (major, argument) 头部。
 */
void append_header(std::vector<byte>& out, major_type major, std::uint64_t argument);

/**
 * @brief 任意精度版本：参数超过 64 位时返回 errc::overflow，out 不变，
 *        调用方据此退回到 tag 2/3 的 bignum 编码。
 */
std::error_code append_header(std::vector<byte>& out, major_type major, const BigInt& argument);

void append_indefinite(std::vector<byte>& out, major_type major);

/**
 * @brief 从 source 读取一个头部。
 *
 * - 低 5 位 28..30：errc::reserved_initial_byte；
 * - 低 5 位 31：major 2..5 为 indefinite，major 7 为 break，其余为 errc::misplaced_break；
 * - require_minimal 为 true 时，major 0..6 的参数若能用更短宽度表示则返回 errc::non_minimal_length。
 */
std::error_code decode_header(ByteSource& source, Header& out, bool require_minimal) noexcept;

}  // namespace cborkit::cbor
