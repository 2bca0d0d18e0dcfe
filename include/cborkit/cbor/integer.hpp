#pragma once

#include "cborkit/cbor/packing.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace cborkit::cbor {

/**
 * @brief 任意精度整数（CBOR 整数、bignum、decimal/bigfloat 的尾数、有理数分子分母）。
 */
using BigInt = boost::multiprecision::cpp_int;

/**
 * @brief 若 v 落在 [0, 2^64) 内返回其 u64 值。
 */
[[nodiscard]] std::optional<std::uint64_t> to_u64(const BigInt& v);

/**
 * @brief 若 v 落在 int64 范围内返回其值。
 */
[[nodiscard]] std::optional<std::int64_t> to_i64(const BigInt& v);

/**
 * @brief 非负整数的最短大端字节序列（0 得到空序列，与 tag 2/3 载荷一致）。
 */
[[nodiscard]] std::vector<byte> to_be_bytes(const BigInt& magnitude);

[[nodiscard]] BigInt from_be_bytes(bytes_view data);

}  // namespace cborkit::cbor
