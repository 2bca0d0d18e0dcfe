#pragma once

#include "cborkit/cbor/header.hpp"
#include "cborkit/cbor/options.hpp"
#include "cborkit/cbor/value.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace cborkit::cbor {

/**
 * @brief 按值类型分派的编码器（单次调用作用域；不可跨线程共享）。
 *
 * 输出追加到内部缓冲区。ToWireFormat 扩展通过 write_* 接口写出自身，
 * 也可以对子值递归调用 encode()。
 */
class Encoder final {
 public:
  /**
   * @param options 构造时按 effective_options() 归一化后保存。
   * @param shared SharedRef 所指向的槽位表（编码 Document 时传入）；为空时遇到 SharedRef 返回 errc::unsupported_value。
   */
  explicit Encoder(const EncodeOptions& options, const SharedTable* shared = nullptr);

  Encoder(const Encoder&) = delete;
  Encoder& operator=(const Encoder&) = delete;

  std::error_code encode(const Value& v) noexcept;

  /**
   * @brief 统计从 root 出发每个共享槽位被引用的次数。
   *
   * 调用后只被引用一次的槽位按值内联，不输出 tag 28；未调用时所有声明共享的槽位都输出 tag 28。
   */
  void count_references(const Value& root);

  void write_header(major_type major, std::uint64_t argument);
  void write_tag(std::uint64_t number) { write_header(major_type::tag, number); }
  void write_bytes(bytes_view raw);

  [[nodiscard]] const EncodeOptions& options() const noexcept { return options_; }
  [[nodiscard]] const std::vector<byte>& bytes() const noexcept { return out_; }
  [[nodiscard]] std::vector<byte> take() noexcept { return std::move(out_); }

 private:
  std::error_code encode_integer(const BigInt& v);
  std::error_code encode_bignum(const BigInt& v);
  void encode_float(double v);
  std::error_code encode_simple(std::uint8_t v);
  std::error_code encode_list(const std::vector<Value>& items);
  std::error_code encode_entries(const MapItems& items, bool sort);
  std::error_code encode_members(const std::vector<Value>& members);
  std::error_code encode_shared(const SharedRef& ref);
  std::error_code encode_datetime(const DateTime& dt);
  std::error_code encode_typed_array(const TypedArray& array);
  std::error_code encode_text(std::string_view text);

  // 以独立缓冲区编码 v（不改变共享状态），用于排序键。
  std::error_code encode_detached(const Value& v, std::vector<byte>& out);
  void sort_by_encoding(std::vector<std::size_t>& order, const std::vector<std::vector<byte>>& encoded) const;

  std::error_code fail(std::error_code ec, const char* what);

  EncodeOptions options_;
  const SharedTable* shared_{nullptr};
  std::vector<byte> out_;

  // 槽位 -> 线上共享编号（已输出过 tag 28 的槽位）。
  std::unordered_map<std::size_t, std::uint64_t> emitted_;
  std::uint64_t next_shared_id_{0};

  // 槽位 -> 引用次数（count_references 之后有效）。
  std::unordered_map<std::size_t, std::size_t> references_;
  bool counted_{false};

  // 正在内联展开的槽位（检测未声明共享的自引用）。
  std::vector<std::size_t> active_;
};

/**
 * @brief 检查选项组合：deterministic 与 sort_method::unsorted 冲突时返回 errc::invalid_options。
 */
std::error_code validate(const EncodeOptions& options) noexcept;

/**
 * @brief 归一化后的实际选项（deterministic 隐含 realize_indefinite_length 与最短浮点）。
 */
[[nodiscard]] EncodeOptions effective_options(const EncodeOptions& options);

/**
 * @brief 与解码侧检查对应的编码选项：forced_sort_order 选择 length_first 排序的
 * 确定性编码，forbid_indefinite 展开 indefinite 形式。
 */
[[nodiscard]] EncodeOptions encode_options_for(const DeterministicPolicy& policy);

/**
 * @brief 编码单个值并追加到 out（失败时 out 不变）。
 */
std::error_code encode_one(const Value& value, std::vector<byte>& out, const EncodeOptions& options = {}) noexcept;

/**
 * @brief 编码一个文档（根值可通过 SharedRef 引用 doc.shared 中的槽位）。
 */
std::error_code encode_one(const Document& doc, std::vector<byte>& out, const EncodeOptions& options = {}) noexcept;

}  // namespace cborkit::cbor
