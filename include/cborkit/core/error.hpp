#pragma once

#include <system_error>

namespace cborkit::core {

/**
 * @brief 本库通用错误码（与具体编解码规则无关的部分）。
 *
 * 约定：
 * - 所有公开接口返回 std::error_code，不向调用方抛异常；
 * - 与 CBOR 语法/语义相关的错误见 cborkit::cbor::errc。
 */
enum class errc : int {
  ok = 0,
  buffer_overflow = 1,
  invalid_argument = 2,
  end_of_stream = 3,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace cborkit::core

namespace std {
template <>
struct is_error_code_enum<cborkit::core::errc> : true_type {};
}  // namespace std
