#pragma once

#include <cstdint>

namespace cborkit::core {

/**
 * @brief 日志级别（库内 spdlog 日志的统一开关）。
 *
 * 说明：
 * - 库内部用 spdlog 记录解码/编码失败原因（debug）与共享表活动（trace）；
 * - spdlog 类型不出现在 public headers，调用方只通过本枚举调整级别。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

} // namespace cborkit::core
