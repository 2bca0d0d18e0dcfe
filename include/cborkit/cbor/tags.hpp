#pragma once

#include "cborkit/cbor/options.hpp"
#include "cborkit/cbor/packing.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace cborkit::cbor {

namespace tag_number {
inline constexpr std::uint64_t datetime_text = 0;
inline constexpr std::uint64_t datetime_epoch = 1;
inline constexpr std::uint64_t positive_bignum = 2;
inline constexpr std::uint64_t negative_bignum = 3;
inline constexpr std::uint64_t decimal_fraction = 4;
inline constexpr std::uint64_t bigfloat = 5;
inline constexpr std::uint64_t shareable = 28;
inline constexpr std::uint64_t shared_ref = 29;
inline constexpr std::uint64_t rational = 30;
inline constexpr std::uint64_t regex = 35;
inline constexpr std::uint64_t uuid = 37;
inline constexpr std::uint64_t set = 258;
inline constexpr std::uint64_t ip_address = 260;
inline constexpr std::uint64_t ip_network = 261;
inline constexpr std::uint64_t ordered_map = 272;
inline constexpr std::uint64_t typed_array_first = 64;
inline constexpr std::uint64_t typed_array_last = 87;
}  // namespace tag_number

/**
 * @brief RFC 8746 typed array 的元素描述。
 *
 * tag 位布局（64..87）：0b010_f_s_e_ll，f=浮点，s=有符号，e=小端，ll=宽度。
 * 76（sint8 小端保留）、83/87（float128）不在支持范围内，按普通 Tag 处理。
 */
struct TypedArrayInfo final {
  enum class element : std::uint8_t {
    unsigned_integer = 0,
    clamped_unsigned = 1,
    signed_integer = 2,
    floating = 3,
  };

  element kind{element::unsigned_integer};
  std::size_t width{1};
  byte_order order{byte_order::big};
};

[[nodiscard]] std::optional<TypedArrayInfo> typed_array_info(std::uint64_t tag) noexcept;

/**
 * @brief 进程级默认 tag 表（只读，首次使用时构建）。
 *
 * 覆盖 0/1、2/3、4/5、28/29、30、35、37、258、260/261、272 与 typed array。
 * 未登记的 tag 解码为通用 Tag，不报错。
 */
[[nodiscard]] const TagTable& default_tag_table();

}  // namespace cborkit::cbor
