#pragma once

#include "cborkit/cbor/header.hpp"
#include "cborkit/cbor/options.hpp"
#include "cborkit/cbor/source.hpp"
#include "cborkit/cbor/value.hpp"

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace cborkit::cbor {

/**
 * @brief 解码失败的详细信息（可选输出）。
 *
 * - offset：检测到错误时已消费的字节数；
 * - requested/available：unexpected_eof 时本次请求与实际可得的字节数；
 * - duplicate_keys：duplicate_key 时收集到的全部重复键；
 * - bad_bytes：string_encoding 时非法的原始字节。
 */
struct DecodeFailure final {
  std::error_code code;
  std::size_t offset{0};
  std::size_t requested{0};
  std::size_t available{0};
  std::vector<Value> duplicate_keys;
  std::vector<byte> bad_bytes;
  std::string message;
};

/**
 * @brief 递归下降解码器（单次调用作用域；不可跨线程共享）。
 *
 * 状态机：ReadHeader -> Dispatch(major) -> {Primitive | Aggregate | Tag | Simple}。
 * 自定义 tag 处理函数拿到的就是本对象，可继续调用 decode_item()/decode_immutable()
 * 读取载荷。
 */
class Decoder final {
 public:
  Decoder(ByteSource& source, const DecodeOptions& options);

  Decoder(const Decoder&) = delete;
  Decoder& operator=(const Decoder&) = delete;

  /**
   * @brief 解码一个完整的数据项。顶层或定长上下文中的 break 返回 errc::misplaced_break。
   */
  std::error_code decode_item(Value& out) noexcept;

  /**
   * @brief 在“不可变”子模式下解码一个数据项（映射键、集合成员）。
   *
   * 该模式下引用尚未完成的共享槽位返回 errc::mutable_key；已完成的共享值被展开为副本。
   */
  std::error_code decode_immutable(Value& out) noexcept;

  /**
   * @brief 解码一个顶层文档：清空共享表后解码根值。
   */
  std::error_code decode_document(Document& out) noexcept;

  /**
   * @brief 读取下一个头部 / 从已读头部继续解码。
   *
   * 供需要区分载荷编码形态的 tag 处理函数使用（例如 tag 1 拒绝 bignum 载荷）。
   */
  std::error_code read_header(Header& out) noexcept;
  std::error_code decode_from_header(const Header& h, Value& out) noexcept;

  /**
   * @brief 自行读取容器头部的 tag 处理函数登记/退出一层嵌套。
   *
   * 已达 max_depth 时 enter_nested 返回 errc::nesting_too_deep 且不改变深度。
   */
  std::error_code enter_nested() noexcept;
  void leave_nested() noexcept { --depth_; }

  /**
   * @brief 不可变模式展开共享值之前登记其规模（节点数 + 字符串字节数）。
   *
   * 一次文档解码内累计的展开量不得超过 max(64Ki, 16 × 已消费字节数)，
   * 否则返回 errc::shared_expansion_limit。
   */
  std::error_code charge_expansion(const Value& v) noexcept;

  /**
   * @brief 记录失败（只保留最先发生的一次）并返回 ec。tag 处理函数也可用它补充信息。
   */
  std::error_code fail(std::error_code ec, std::string message = {});

  [[nodiscard]] const DecodeOptions& options() const noexcept { return options_; }
  [[nodiscard]] ByteSource& source() noexcept { return source_; }
  [[nodiscard]] SharedTable& shared() noexcept { return shared_; }
  [[nodiscard]] bool immutable() const noexcept { return immutable_; }
  [[nodiscard]] std::size_t depth() const noexcept { return depth_; }

  [[nodiscard]] DecodeFailure& failure() noexcept { return failure_; }
  [[nodiscard]] const DecodeFailure& failure() const noexcept { return failure_; }

  void reset_failure() { failure_ = DecodeFailure{}; }

 private:
  std::error_code read_payload(std::uint64_t length, std::vector<byte>& out) noexcept;
  std::error_code decode_byte_string(const Header& h, Value& out) noexcept;
  std::error_code decode_text_string(const Header& h, Value& out) noexcept;
  std::error_code decode_array(const Header& h, Value& out) noexcept;
  std::error_code decode_map(const Header& h, Value& out) noexcept;
  std::error_code decode_tag(const Header& h, Value& out) noexcept;
  std::error_code decode_simple(const Header& h, Value& out) noexcept;

  std::error_code check_duplicates(const MapItems& items) noexcept;
  std::error_code check_text(std::vector<byte>& raw, std::string& out) noexcept;

  ByteSource& source_;
  const DecodeOptions& options_;
  SharedTable shared_;
  DecodeFailure failure_;
  std::size_t depth_{0};
  std::size_t expanded_{0};
  bool immutable_{false};
};

/**
 * @brief 从内存解码单个顶层值。
 *
 * options.check_eof 为 true 时，值之后仍有剩余字节返回 errc::unconsumed_data。
 * 失败时 out 不被修改（无部分结果）。
 */
std::error_code decode_one(
  bytes_view in,
  Document& out,
  const DecodeOptions& options = {},
  DecodeFailure* failure = nullptr) noexcept;

/**
 * @brief 从 std::istream 解码单个顶层值（load 风格）。
 */
std::error_code decode_one(
  std::istream& in,
  Document& out,
  const DecodeOptions& options = {},
  DecodeFailure* failure = nullptr) noexcept;

/**
 * @brief 从缓冲区前缀解码一个值（流式 API）。
 *
 * 成功时 consumed 为该值占用的字节数，剩余字节留给下一次调用；忽略 check_eof。
 */
std::error_code decode_prefix(
  bytes_view in,
  Document& out,
  std::size_t& consumed,
  const DecodeOptions& options = {},
  DecodeFailure* failure = nullptr) noexcept;

/**
 * @brief 顶层值序列解码（RFC 8742 CBOR sequence）。
 *
 * next() 在数据项边界遇到 EOF 时把 out 置为 nullopt 并返回成功；
 * 数据项中途 EOF 返回 errc::unexpected_eof。之前已产出的值不受后续错误影响。
 */
class SequenceDecoder final {
 public:
  SequenceDecoder(ByteSource& source, DecodeOptions options = {});

  std::error_code next(std::optional<Document>& out) noexcept;

  [[nodiscard]] const DecodeFailure& failure() const noexcept { return decoder_.failure(); }
  [[nodiscard]] std::size_t items_decoded() const noexcept { return count_; }

 private:
  ByteSource& source_;
  DecodeOptions options_;
  Decoder decoder_;
  std::size_t count_{0};
};

}  // namespace cborkit::cbor
