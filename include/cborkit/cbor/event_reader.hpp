#pragma once

#include "cborkit/cbor/decoder.hpp"
#include "cborkit/cbor/header.hpp"
#include "cborkit/cbor/options.hpp"
#include "cborkit/cbor/source.hpp"
#include "cborkit/cbor/value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace cborkit::cbor {

enum class event_type : std::uint8_t {
  enter_list = 0,   // length：元素数；nullopt 表示 indefinite
  enter_map = 1,    // length：键值对数；nullopt 表示 indefinite
  enter_bytes = 2,  // indefinite 字节串开始，随后是各分块（scalar）
  enter_text = 3,   // indefinite 文本串开始
  enter_tag = 4,    // tag：编号；紧随其后的一个数据项是载荷
  scalar = 5,       // value：整数、定长字符串、浮点、simple
  break_code = 6,   // 结束最近一个 indefinite 容器
  end = 7,          // 输入在数据项边界耗尽
};

struct Event final {
  event_type type{event_type::end};
  std::optional<std::uint64_t> length;
  std::uint64_t tag{0};
  Value value;
};

/**
 * @brief 拉模式事件流（有界内存、无递归）。
 *
 * 与 Decoder 相同的良构性检查：break 只能结束 indefinite 容器，indefinite 字符串只能
 * 包含同类定长分块，嵌套深度受 max_depth 约束。定长容器不产生结束事件，由调用方按
 * length 计数。不解释 tag 语义，也不检查重复键。
 *
 * 一个顶层数据项结束后可以继续读取下一个（CBOR sequence），输入耗尽时返回 event_type::end。
 */
class EventReader final {
 public:
  explicit EventReader(ByteSource& source, DecodeOptions options = {});

  std::error_code next(Event& out) noexcept;

  [[nodiscard]] std::size_t depth() const noexcept { return frames_.size(); }
  [[nodiscard]] const DecodeFailure& failure() const noexcept { return decoder_.failure(); }

 private:
  struct Frame final {
    major_type major{major_type::array};
    bool indefinite{false};
    std::uint64_t remaining{0};  // 定长：尚缺的数据项数
    std::uint64_t consumed{0};   // indefinite：已读的数据项数
  };

  std::error_code push(const Frame& frame) noexcept;
  void complete_item() noexcept;

  ByteSource& source_;
  DecodeOptions options_;
  Decoder decoder_;
  std::vector<Frame> frames_;
};

}  // namespace cborkit::cbor
