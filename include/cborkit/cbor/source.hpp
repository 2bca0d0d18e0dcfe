#pragma once

#include "cborkit/cbor/packing.hpp"

#include <cstddef>
#include <iosfwd>
#include <system_error>

namespace cborkit::cbor {

/**
 * @brief 解码器的字节来源（拉模式）。
 *
 * 约定：
 * - read_exact(out) 要么读满 out.size() 字节，要么返回 errc::unexpected_eof，
 *   并在 shortfall() 中记录本次请求/实际可得的字节数；
 * - offset() 为已消费的字节数，用于错误定位与 check_eof；
 * - at_end() 仅在“下一个数据项边界”上由序列解码器调用，判断是否正常结束。
 */
class ByteSource {
 public:
  struct Shortfall {
    std::size_t requested{0};
    std::size_t available{0};
  };

  virtual ~ByteSource() = default;

  std::error_code read_exact(mutable_bytes_view out) noexcept;

  [[nodiscard]] std::size_t offset() const noexcept { return offset_; }
  [[nodiscard]] const Shortfall& shortfall() const noexcept { return shortfall_; }

  [[nodiscard]] virtual bool at_end() noexcept = 0;

 protected:
  // 返回实际读取的字节数；少于 out.size() 表示输入已耗尽。
  virtual std::size_t read_some(mutable_bytes_view out) noexcept = 0;

 private:
  std::size_t offset_{0};
  Shortfall shortfall_{};
};

/**
 * @brief 内存缓冲区来源（不拷贝，data 的生命周期需覆盖解码过程）。
 */
class SpanSource final : public ByteSource {
 public:
  explicit SpanSource(bytes_view data) noexcept : data_(data) {}

  [[nodiscard]] bool at_end() noexcept override { return pos_ >= data_.size(); }
  [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

 protected:
  std::size_t read_some(mutable_bytes_view out) noexcept override;

 private:
  bytes_view data_{};
  std::size_t pos_{0};
};

/**
 * @brief std::istream 来源（load 风格：文件、字符串流等）。
 *
 * 流的 badbit/failbit 异常开关被视为 EOF，不向外抛出。
 */
class IstreamSource final : public ByteSource {
 public:
  explicit IstreamSource(std::istream& in) noexcept : in_(in) {}

  [[nodiscard]] bool at_end() noexcept override;

 protected:
  std::size_t read_some(mutable_bytes_view out) noexcept override;

 private:
  std::istream& in_;
};

}  // namespace cborkit::cbor
