#pragma once

#include "cborkit/core/common.hpp"
#include "cborkit/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cborkit::utils {

/**
 * @brief 16 进制解析/格式化工具。
 *
 * 典型使用场景：
 * - 从 RFC 附录或日志里复制 “a2 01 02 03 04” 这样的文本，解析为 bytes；
 * - 将编码结果以 hexdump 形式输出，便于人工比对。
 */

struct HexDumpOptions final {
    // 每行字节数（典型 16/32）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分会打印截断提示。
    std::size_t max_bytes{256};

    bool show_offset{true};

    // ASCII 侧栏（仅展示可打印字符，其余用 '.'）。
    bool show_ascii{false};
};

[[nodiscard]] std::string hex_dump(cborkit::core::bytes_view bytes,
                                   HexDumpOptions options = {});

/**
 * @brief 连续小写 16 进制（"a201020304"）。
 */
[[nodiscard]] std::string to_hex(cborkit::core::bytes_view bytes);

/**
 * @brief 解析 16 进制字符串为 bytes。
 *
 * 支持大小写 hex、空白/逗号/冒号等分隔符、可选的 0x 前缀。
 * 失败返回 core::errc::invalid_argument。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<cborkit::core::byte> &out) noexcept;

} // namespace cborkit::utils
