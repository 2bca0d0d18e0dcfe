#pragma once

#include "cborkit/cbor/decoder.hpp"
#include "cborkit/cbor/encoder.hpp"
#include "cborkit/cbor/options.hpp"
#include "cborkit/core/common.hpp"

#include <string>
#include <system_error>

namespace cborkit::utils {

/**
 * @brief 把 CBOR 字节渲染为 RFC 8949 §8 诊断记法。
 *
 * 例：a2 01 02 03 04 -> "{1: 2, 3: 4}"；5f 41 01 ff -> "(_ h'01')"；c1 1a ... -> "1(1363896240)"。
 * 基于 cbor::EventReader，不解释 tag 语义。输入含多个顶层数据项时以 ", " 分隔。
 * 失败时返回解码错误，out 内容不完整。
 */
std::error_code diagnose(cborkit::core::bytes_view in,
                         std::string &out,
                         const cborkit::cbor::DecodeOptions &options = {}) noexcept;

/**
 * @brief 值的诊断记法：先按 options 编码，再渲染编码结果（语义类型显示为 tag 形式）。
 */
std::error_code to_diagnostic(const cborkit::cbor::Document &doc,
                              std::string &out,
                              const cborkit::cbor::EncodeOptions &options = {}) noexcept;

std::error_code to_diagnostic(const cborkit::cbor::Value &value,
                              std::string &out,
                              const cborkit::cbor::EncodeOptions &options = {}) noexcept;

} // namespace cborkit::utils
