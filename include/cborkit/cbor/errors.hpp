#pragma once

#include <system_error>

namespace cborkit::cbor {

/**
 * @brief CBOR 编解码错误码。
 *
 * 三类错误（见 condition）：
 * - ill_formed：字节流违反 CBOR 语法（坏的初始字节、错位 break、截断、残留数据等）；
 * - invalid：语法正确但违反语义/有效性规则（重复键、非法 UTF-8、tag 载荷不合法、
 *   确定性策略下的非最短编码等）；
 * - encoding：调用方给出的值无法编码（自引用未声明共享、缺少时区等）。
 *
 * 三类错误对当前调用都是致命的：不重试、不返回部分结果。
 */
enum class errc : int {
  ok = 0,

  // ill-formed
  unexpected_eof = 1,
  bad_initial_byte = 2,
  reserved_initial_byte = 3,
  misplaced_break = 4,
  bad_simple = 5,
  unconsumed_data = 6,

  // invalid
  string_encoding = 20,
  duplicate_key = 21,
  non_minimal_length = 22,
  non_minimal_float = 23,
  indefinite_length = 24,
  bad_tag_payload = 25,
  unknown_shared_reference = 26,
  bad_shared_reference_type = 27,
  mutable_key = 28,
  nesting_too_deep = 29,
  shared_expansion_limit = 30,

  // encoding
  unsupported_value = 40,
  self_referential = 41,
  missing_timezone = 42,
  overflow = 43,
  invalid_options = 44,
};

enum class condition : int {
  ill_formed = 1,
  invalid = 2,
  encoding = 3,
};

const std::error_category& error_category() noexcept;
const std::error_category& condition_category() noexcept;

std::error_code make_error_code(errc e) noexcept;
std::error_condition make_error_condition(condition c) noexcept;

/**
 * @brief 正则编译失败的错误域（"std.regex"）。
 *
 * tag 35 的载荷由 std::regex 编译；失败时返回本域的 error_code，
 * value 为 std::regex_constants::error_type，便于调用方区分“编解码错误”与“正则引擎错误”。
 */
const std::error_category& regex_category() noexcept;

}  // namespace cborkit::cbor

namespace std {
template <>
struct is_error_code_enum<cborkit::cbor::errc> : true_type {};
template <>
struct is_error_condition_enum<cborkit::cbor::condition> : true_type {};
}  // namespace std
