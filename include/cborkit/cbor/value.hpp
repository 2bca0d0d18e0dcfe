#pragma once

#include "cborkit/cbor/integer.hpp"
#include "cborkit/cbor/packing.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cborkit::cbor {

class Value;
class Encoder;

using List = std::vector<Value>;
using MapItems = std::vector<std::pair<Value, Value>>;

struct Null final {
  friend bool operator==(const Null&, const Null&) = default;
};

struct Undefined final {
  friend bool operator==(const Undefined&, const Undefined&) = default;
};

struct Boolean final {
  bool value{false};
  friend bool operator==(const Boolean&, const Boolean&) = default;
};

/**
 * @brief 整数（major 0/1，以及未保留的 bignum）。任意精度。
 */
struct Integer final {
  BigInt value;
  friend bool operator==(const Integer&, const Integer&) = default;
};

/**
 * @brief 保留下来的 bignum（DecodeOptions::retain_bignums）。与 Integer 永不相等。
 */
struct BigNum final {
  BigInt value;
  friend bool operator==(const BigNum&, const BigNum&) = default;
};

struct Bytes final {
  std::vector<byte> value;
  friend bool operator==(const Bytes&, const Bytes&) = default;
};

struct Text final {
  std::string value;
  friend bool operator==(const Text&, const Text&) = default;
};

// IEEE 语义：NaN != NaN。
struct Float final {
  double value{0.0};
  friend bool operator==(const Float&, const Float&) = default;
};

/**
 * @brief 未赋值的 simple 值（0..19、32..255）。
 */
struct Simple final {
  std::uint8_t value{0};
  friend bool operator==(const Simple&, const Simple&) = default;
};

/**
 * @brief 映射。items 保持插入顺序。
 *
 * ordered 为 true 表示来自/将编码为 tag 272：编码器不对其重排。
 * 相等性：两边都 ordered 时逐项比较，否则按键值集合比较。
 */
struct Map final {
  MapItems items;
  bool ordered{false};

  friend bool operator==(const Map& lhs, const Map& rhs);
};

class Tag final {
 public:
  Tag(std::uint64_t number, Value value);

  Tag(const Tag& other);
  Tag& operator=(const Tag& other);
  Tag(Tag&&) noexcept = default;
  Tag& operator=(Tag&&) noexcept = default;
  ~Tag();

  [[nodiscard]] std::uint64_t number() const noexcept { return number_; }
  [[nodiscard]] const Value& value() const noexcept { return *value_; }
  [[nodiscard]] Value& value() noexcept { return *value_; }

  friend bool operator==(const Tag& lhs, const Tag& rhs);

 private:
  std::uint64_t number_{0};
  std::unique_ptr<Value> value_;
};

/**
 * @brief 共享值引用：指向 Document::shared 中的槽位。
 */
struct SharedRef final {
  std::size_t index{0};
  friend bool operator==(const SharedRef&, const SharedRef&) = default;
};

using Microseconds = std::chrono::sys_time<std::chrono::microseconds>;

/**
 * @brief 日期时间（tag 0/1）。
 *
 * wall 为本地挂钟时间（按 UTC 纪元计数）；utc_offset 为空表示 naive。
 * aware 值按绝对时刻比较；naive 与 aware 永不相等。
 */
struct DateTime final {
  Microseconds wall{};
  std::optional<std::chrono::minutes> utc_offset;

  [[nodiscard]] bool aware() const noexcept { return utc_offset.has_value(); }
  [[nodiscard]] Microseconds instant() const noexcept {
    return utc_offset ? wall - *utc_offset : wall;
  }

  friend bool operator==(const DateTime& lhs, const DateTime& rhs) noexcept;
};

struct Date final {
  std::chrono::sys_days day{};
  friend bool operator==(const Date&, const Date&) = default;
};

// tag 4：mantissa * 10^exponent
struct Decimal final {
  BigInt mantissa;
  std::int64_t exponent{0};
  friend bool operator==(const Decimal&, const Decimal&) = default;
};

// tag 5：mantissa * 2^exponent
struct BigFloat final {
  BigInt mantissa;
  std::int64_t exponent{0};
  friend bool operator==(const BigFloat&, const BigFloat&) = default;
};

// tag 30：denominator > 0；按数值比较（1/2 == 2/4）。
struct Rational final {
  BigInt numerator;
  BigInt denominator{1};
  friend bool operator==(const Rational& lhs, const Rational& rhs);
};

// tag 35：模式文本（解码时已用 std::regex 校验可编译）。
struct Regex final {
  std::string pattern;
  friend bool operator==(const Regex&, const Regex&) = default;
};

struct Uuid final {
  std::array<byte, 16> bytes{};
  friend bool operator==(const Uuid&, const Uuid&) = default;
};

// tag 258：成员无序、唯一。
struct Set final {
  std::vector<Value> members;
  friend bool operator==(const Set& lhs, const Set& rhs);
};

// tag 260：4 或 16 字节地址。
struct IpAddress final {
  std::vector<byte> address;
  friend bool operator==(const IpAddress&, const IpAddress&) = default;
};

// tag 261：{address: prefix}
struct IpNetwork final {
  std::vector<byte> address;
  std::uint8_t prefix{0};
  friend bool operator==(const IpNetwork&, const IpNetwork&) = default;
};

/**
 * @brief RFC 8746 定宽数值数组（tag 64..86）。
 *
 * tag 决定元素类型与字节序；float16 元素以 float 承载（无损）。
 */
struct TypedArray final {
  using elements_type = std::variant<
    std::vector<std::uint8_t>,
    std::vector<std::uint16_t>,
    std::vector<std::uint32_t>,
    std::vector<std::uint64_t>,
    std::vector<std::int8_t>,
    std::vector<std::int16_t>,
    std::vector<std::int32_t>,
    std::vector<std::int64_t>,
    std::vector<float>,
    std::vector<double>>;

  std::uint64_t tag{64};
  elements_type elements;

  friend bool operator==(const TypedArray&, const TypedArray&) = default;
};

// 以下四种仅用于编码：按 indefinite-length 形式输出（除非 realize_indefinite_length）。
struct IndefiniteBytes final {
  std::vector<std::vector<byte>> chunks;
  friend bool operator==(const IndefiniteBytes&, const IndefiniteBytes&) = default;
};

struct IndefiniteText final {
  std::vector<std::string> chunks;
  friend bool operator==(const IndefiniteText&, const IndefiniteText&) = default;
};

struct IndefiniteList final {
  std::vector<Value> items;
  friend bool operator==(const IndefiniteList& lhs, const IndefiniteList& rhs);
};

struct IndefiniteMap final {
  MapItems items;
  friend bool operator==(const IndefiniteMap& lhs, const IndefiniteMap& rhs);
};

/**
 * @brief 用户自定义类型的编码扩展点。
 *
 * 实现者通过 Encoder 的公开接口写出自身（通常是一个 tag + 载荷）。
 */
class ToWireFormat {
 public:
  virtual ~ToWireFormat() = default;
  virtual std::error_code to_wire(Encoder& encoder) const = 0;
};

// 按对象身份比较。
struct Extension final {
  std::shared_ptr<const ToWireFormat> object;
  friend bool operator==(const Extension&, const Extension&) = default;
};

/**
 * @brief 值的种类；顺序与 Value::storage_type 的备选类型一致。
 */
enum class ValueKind : std::uint8_t {
  null = 0,
  undefined,
  boolean,
  integer,
  bignum,
  bytes,
  text,
  floating,
  simple,
  list,
  map,
  tag,
  shared_ref,
  datetime,
  date,
  decimal,
  bigfloat,
  rational,
  regex,
  uuid,
  set,
  ip_address,
  ip_network,
  typed_array,
  indefinite_bytes,
  indefinite_text,
  indefinite_list,
  indefinite_map,
  extension,
};

[[nodiscard]] std::string_view to_string(ValueKind kind) noexcept;

/**
 * @brief CBOR 数据项（强类型，支持嵌套 List/Map/Tag）。
 *
 * 约定：
 * - 值语义：拷贝即深拷贝，List/Map/Tag 拥有全部子结构；
 * - 共享与环只能通过 SharedRef + SharedTable 表达；
 * - 默认构造为 Null。
 */
class Value final {
 public:
  using storage_type = std::variant<
    Null,
    Undefined,
    Boolean,
    Integer,
    BigNum,
    Bytes,
    Text,
    Float,
    Simple,
    List,
    Map,
    Tag,
    SharedRef,
    DateTime,
    Date,
    Decimal,
    BigFloat,
    Rational,
    Regex,
    Uuid,
    Set,
    IpAddress,
    IpNetwork,
    TypedArray,
    IndefiniteBytes,
    IndefiniteText,
    IndefiniteList,
    IndefiniteMap,
    Extension>;

  Value() = default;

  // T 必须恰好是 storage_type 的某个备选类型（List 与 IndefiniteList 等不做隐式推断）。
  template <class T>
    requires(!std::is_same_v<std::remove_cvref_t<T>, Value>)
  explicit Value(T&& v) : storage_(std::in_place_type<std::remove_cvref_t<T>>, std::forward<T>(v)) {}

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(storage_.index()); }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] T* get_if() noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] bool is() const noexcept {
    return std::holds_alternative<T>(storage_);
  }

  static Value null();
  static Value undefined();
  static Value boolean(bool v);
  static Value integer(std::int64_t v);
  static Value integer(BigInt v);
  static Value bignum(BigInt v);
  static Value floating(double v);
  static Value simple(std::uint8_t v);
  static Value text(std::string v);
  static Value bytes(std::vector<byte> v);
  static Value list(std::vector<Value> items);
  static Value map(MapItems items);
  static Value ordered_map(MapItems items);
  static Value tag(std::uint64_t number, Value v);
  static Value shared(std::size_t index);

  friend bool operator==(const Value& lhs, const Value& rhs);
  friend bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }

 private:
  storage_type storage_{};
};

/**
 * @brief 与 operator== 一致的哈希（用于重复键、集合成员去重）。
 */
[[nodiscard]] std::size_t hash_value(const Value& v);

struct ValueHash final {
  std::size_t operator()(const Value& v) const { return hash_value(v); }
};

/**
 * @brief 共享值的槽位表（单次解码/编码调用内有效）。
 *
 * tag 28 先 allocate() 得到编号，载荷中的 tag 29 可引用尚未 finalize 的槽位（环）；
 * 载荷解码完成后 finalize() 写入内容。
 */
class SharedTable final {
 public:
  [[nodiscard]] std::size_t allocate();
  void finalize(std::size_t index, Value value);

  [[nodiscard]] std::size_t size() const noexcept { return slots_.size(); }
  [[nodiscard]] bool contains(std::size_t index) const noexcept { return index < slots_.size(); }
  [[nodiscard]] bool finalized(std::size_t index) const noexcept {
    return contains(index) && slots_[index].finalized;
  }

  [[nodiscard]] const Value& at(std::size_t index) const { return slots_.at(index).value; }
  [[nodiscard]] Value& at(std::size_t index) { return slots_.at(index).value; }

  void clear() noexcept { slots_.clear(); }

  friend bool operator==(const SharedTable&, const SharedTable&) = default;

 private:
  struct Slot final {
    Value value;
    bool finalized{false};
    friend bool operator==(const Slot&, const Slot&) = default;
  };
  std::vector<Slot> slots_;
};

/**
 * @brief 一次顶层解码的结果：根值 + 它引用的共享槽位。
 */
struct Document final {
  Value root;
  SharedTable shared;

  /**
   * @brief 沿 SharedRef 链取得实际的值（非 SharedRef 原样返回）。
   */
  [[nodiscard]] const Value& resolve(const Value& v) const;

  friend bool operator==(const Document&, const Document&) = default;
};

}  // namespace cborkit::cbor
