#pragma once

#include "cborkit/cbor/value.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <system_error>
#include <unordered_map>

namespace cborkit::cbor {

class Decoder;

/**
 * @brief 确定性/有效性检查开关（解码侧各自独立）。
 *
 * - minimal_length：头部参数必须使用最短宽度；
 * - minimal_float：浮点必须使用能无损表示其值的最窄宽度，NaN 必须是 f9 7e00；
 * - forbid_indefinite：任何 indefinite-length 字符串/数组/映射都视为 invalid；
 * - forced_sort_order：仅编码器使用（解码不检查键顺序）。
 */
struct DeterministicPolicy final {
  bool minimal_length{false};
  bool minimal_float{false};
  bool forbid_indefinite{false};
  bool forced_sort_order{false};

  [[nodiscard]] static constexpr DeterministicPolicy none() noexcept { return {}; }
  [[nodiscard]] static constexpr DeterministicPolicy strict() noexcept { return {true, true, true, true}; }

  friend bool operator==(const DeterministicPolicy&, const DeterministicPolicy&) = default;
};

/**
 * @brief 非法 UTF-8 文本的处理方式。
 */
enum class string_errors : std::uint8_t {
  strict = 0,   // errc::string_encoding
  replace = 1,  // 每个非法序列替换为 U+FFFD
  ignore = 2,   // 丢弃非法字节
};

/**
 * @brief tag 解码函数：载荷尚未读取，由处理函数通过 decoder 递归解码。
 */
using TagHandler = std::function<std::error_code(Decoder& decoder, std::uint64_t tag, Value& out)>;
using TagTable = std::unordered_map<std::uint64_t, TagHandler>;

/**
 * @brief simple 值工厂（0..19、32..255）；默认产生 Simple{n}。
 */
using SimpleValueFactory = std::function<std::error_code(std::uint8_t value, Value& out)>;

inline constexpr std::size_t kDefaultMaxDepth = 256;

struct DecodeOptions final {
  DeterministicPolicy policy{};

  // 单值解码后要求输入恰好耗尽（errc::unconsumed_data）。
  bool check_eof{true};

  // true：tag 2/3 产生 BigNum；false：折叠为 Integer（与同值整数键冲突）。
  bool retain_bignums{false};

  std::size_t max_depth{kDefaultMaxDepth};
  string_errors on_string_error{string_errors::strict};

  // 本次调用的自定义 tag 表，优先于默认表。
  std::shared_ptr<const TagTable> tags;

  SimpleValueFactory simple_factory;
};

enum class sort_method : std::uint8_t {
  lexicographic = 0,  // 按编码后键字节逐字节比较
  length_first = 1,   // 先比编码长度，再逐字节比较
  unsorted = 2,       // 插入顺序
};

enum class float_style : std::uint8_t {
  shortest = 0,
  always_double = 1,
};

enum class datetime_style : std::uint8_t {
  epoch = 0,       // tag 1
  iso_z = 1,       // tag 0，UTC + 'Z'
  iso_offset = 2,  // tag 0，保留原偏移
};

struct EncodeOptions final {
  sort_method sort{sort_method::unsorted};
  float_style floats{float_style::shortest};
  datetime_style datetimes{datetime_style::iso_z};

  // naive DateTime 的默认时区偏移；为空时编码 naive 值返回 errc::missing_timezone。
  std::optional<std::chrono::minutes> default_timezone;

  // 被同一 SharedRef 多次引用（或自引用）时使用 tag 28/29 的值种类。
  std::set<ValueKind> shared_types;

  bool realize_indefinite_length{false};

  // 要求 sort != unsorted，并强制 realize_indefinite_length 与最短浮点。
  bool deterministic{false};
};

}  // namespace cborkit::cbor
