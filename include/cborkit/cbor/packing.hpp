#pragma once

#include "cborkit/core/common.hpp"

#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>

namespace cborkit::cbor {

using byte = cborkit::core::byte;
using bytes_view = cborkit::core::bytes_view;
using mutable_bytes_view = cborkit::core::mutable_bytes_view;

/*
 * 定宽整数/浮点的大小端打包工具。
 *
 * CBOR 线格式一律大端；typed array（RFC 8746）额外允许小端，因此读写都带字节序参数。
 */

enum class byte_order : std::uint8_t {
  big = 0,
  little = 1,
};

template <class UInt>
[[nodiscard]] constexpr UInt load_uint(const byte* p, byte_order order = byte_order::big) noexcept {
  static_assert(std::is_unsigned_v<UInt>);
  UInt v = 0;
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    const auto idx = (order == byte_order::big) ? i : (sizeof(UInt) - 1u - i);
    v = static_cast<UInt>((v << 8) | static_cast<UInt>(p[idx]));
  }
  return v;
}

template <class UInt>
constexpr void store_uint(byte* p, UInt v, byte_order order = byte_order::big) noexcept {
  static_assert(std::is_unsigned_v<UInt>);
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    const auto shift = static_cast<unsigned>(8u * (sizeof(UInt) - 1u - i));
    const auto idx = (order == byte_order::big) ? i : (sizeof(UInt) - 1u - i);
    p[idx] = static_cast<byte>((v >> shift) & 0xFFu);
  }
}

// 标准 NaN 的半精度位模式（f9 7e00）。
inline constexpr std::uint16_t kCanonicalHalfNaN = 0x7E00u;

/**
 * @brief IEEE-754 binary16 -> double（精确，半精度的所有值都能被 double 表示）。
 */
[[nodiscard]] inline double half_to_double(std::uint16_t h) noexcept {
  const bool negative = (h & 0x8000u) != 0;
  const int exp = static_cast<int>((h >> 10) & 0x1Fu);
  const int frac = static_cast<int>(h & 0x3FFu);

  double v = 0.0;
  if (exp == 0) {
    v = std::ldexp(static_cast<double>(frac), -24);
  } else if (exp == 0x1F) {
    v = (frac == 0) ? HUGE_VAL : std::nan("");
  } else {
    v = std::ldexp(static_cast<double>(frac + 0x400), exp - 25);
  }
  return negative ? -v : v;
}

/**
 * @brief double -> binary16，仅当转换无损时返回位模式。
 *
 * NaN 不在此处理（由调用方决定是否规范化为 kCanonicalHalfNaN）。
 */
[[nodiscard]] inline std::optional<std::uint16_t> double_to_half_exact(double d) noexcept {
  if (std::isnan(d)) {
    return std::nullopt;
  }
  const auto sign = static_cast<std::uint16_t>(std::signbit(d) ? 0x8000u : 0u);
  if (std::isinf(d)) {
    return static_cast<std::uint16_t>(sign | 0x7C00u);
  }
  if (d == 0.0) {
    return sign;
  }

  int exp = 0;
  const double mant = std::frexp(std::fabs(d), &exp);  // |d| = mant * 2^exp, mant ∈ [0.5, 1)
  // 规格化数：2^-14 <= |d| <= 65504
  if (exp >= -13 && exp <= 16) {
    const double scaled = std::ldexp(mant, 11);  // 11 位有效数字
    if (scaled != std::floor(scaled)) {
      return std::nullopt;
    }
    const auto significand = static_cast<std::uint32_t>(scaled);  // [1024, 2048)
    const auto biased = static_cast<std::uint32_t>(exp - 1 + 15);
    return static_cast<std::uint16_t>(sign | (biased << 10) | (significand & 0x3FFu));
  }
  // 次正规数：|d| = frac * 2^-24
  if (exp < -13 && exp >= -23) {
    const double scaled = std::ldexp(std::fabs(d), 24);
    if (scaled != std::floor(scaled)) {
      return std::nullopt;
    }
    return static_cast<std::uint16_t>(sign | static_cast<std::uint16_t>(scaled));
  }
  return std::nullopt;
}

/**
 * @brief double -> binary32，仅当转换无损时返回。
 */
[[nodiscard]] inline std::optional<float> double_to_float_exact(double d) noexcept {
  if (std::isnan(d)) {
    return std::nullopt;
  }
  if (std::isinf(d)) {
    return static_cast<float>(d);
  }
  if (std::fabs(d) > static_cast<double>(std::numeric_limits<float>::max())) {
    return std::nullopt;
  }
  const auto f = static_cast<float>(d);
  if (static_cast<double>(f) != d) {
    return std::nullopt;
  }
  return f;
}

}  // namespace cborkit::cbor
