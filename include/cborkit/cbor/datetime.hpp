#pragma once

#include "cborkit/cbor/value.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace cborkit::cbor {

/**
 * @brief 解析 tag 0 文本（RFC 3339，要求大写 'T' 与 'Z'）。
 *
 * 接受：
 * - "YYYY-MM-DD"                              -> Date
 * - "YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM|-HH:MM)" -> aware DateTime
 *
 * 小数秒按四舍五入保留到微秒。格式或日历非法时返回 errc::bad_tag_payload。
 */
std::error_code parse_rfc3339(std::string_view text, Value& out);

/**
 * @brief 格式化为 tag 0 文本。
 *
 * utc 为 true 时换算到 UTC 并以 'Z' 结尾；否则保留 offset（"+HH:MM"）。
 * 微秒非零时输出 6 位小数。dt 必须是 aware 的。
 */
[[nodiscard]] std::string format_rfc3339(const DateTime& dt, bool utc);

[[nodiscard]] std::string format_date(const Date& date);

/**
 * @brief tag 1 纪元秒 -> UTC DateTime。落在 0001..9999 年之外或非有限值返回 errc::bad_tag_payload。
 */
std::error_code datetime_from_epoch(std::int64_t seconds, DateTime& out) noexcept;
std::error_code datetime_from_epoch(double seconds, DateTime& out) noexcept;

}  // namespace cborkit::cbor
