#include "cborkit/cbor/event_reader.hpp"

#include "cborkit/cbor/errors.hpp"

#include <string>
#include <utility>

namespace cborkit::cbor {

EventReader::EventReader(ByteSource& source, DecodeOptions options)
    : source_(source), options_(std::move(options)), decoder_(source_, options_) {}

std::error_code EventReader::push(const Frame& frame) noexcept {
  if (frames_.size() >= options_.max_depth) {
    return decoder_.fail(make_error_code(errc::nesting_too_deep),
                         "nesting deeper than " + std::to_string(options_.max_depth));
  }
  frames_.push_back(frame);
  return {};
}

void EventReader::complete_item() noexcept {
  while (!frames_.empty()) {
    auto& top = frames_.back();
    if (top.indefinite) {
      ++top.consumed;
      return;
    }
    if (--top.remaining != 0) {
      return;
    }
    // 定长容器（或 tag）已完整，它本身是父容器中的一个数据项。
    frames_.pop_back();
  }
}

std::error_code EventReader::next(Event& out) noexcept {
  if (frames_.empty() && source_.at_end()) {
    out = Event{};
    return {};
  }

  Header h;
  if (auto ec = decoder_.read_header(h)) {
    return ec;
  }

  Frame* top = frames_.empty() ? nullptr : &frames_.back();
  const bool in_string = top && top->indefinite &&
                         (top->major == major_type::byte_string || top->major == major_type::text_string);

  if (h.kind == header_kind::break_code) {
    if (!top || !top->indefinite || (top->major == major_type::map && top->consumed % 2 != 0)) {
      return decoder_.fail(make_error_code(errc::misplaced_break));
    }
    frames_.pop_back();
    complete_item();
    out = Event{event_type::break_code, std::nullopt, 0, Value{}};
    return {};
  }

  if (in_string && (h.major != top->major || h.kind != header_kind::definite)) {
    return decoder_.fail(make_error_code(errc::bad_initial_byte), "indefinite string contains a foreign chunk");
  }
  if (h.kind == header_kind::indefinite && options_.policy.forbid_indefinite) {
    return decoder_.fail(make_error_code(errc::indefinite_length));
  }

  const bool indefinite = h.kind == header_kind::indefinite;
  switch (h.major) {
    case major_type::byte_string:
    case major_type::text_string:
      if (indefinite) {
        if (auto ec = push(Frame{h.major, true, 0, 0})) {
          return ec;
        }
        out = Event{h.major == major_type::byte_string ? event_type::enter_bytes : event_type::enter_text,
                    std::nullopt, 0, Value{}};
        return {};
      }
      break;
    case major_type::array:
    case major_type::map: {
      const auto type = h.major == major_type::array ? event_type::enter_list : event_type::enter_map;
      if (indefinite) {
        if (auto ec = push(Frame{h.major, true, 0, 0})) {
          return ec;
        }
        out = Event{type, std::nullopt, 0, Value{}};
        return {};
      }
      const auto items = h.major == major_type::map ? h.argument * 2 : h.argument;
      if (h.major == major_type::map && h.argument > (UINT64_MAX / 2)) {
        return decoder_.fail(make_error_code(errc::bad_initial_byte), "map length overflow");
      }
      if (items == 0) {
        complete_item();
      } else if (auto ec = push(Frame{h.major, false, items, 0})) {
        return ec;
      }
      out = Event{type, h.argument, 0, Value{}};
      return {};
    }
    case major_type::tag:
      if (auto ec = push(Frame{major_type::tag, false, 1, 0})) {
        return ec;
      }
      out = Event{event_type::enter_tag, std::nullopt, h.argument, Value{}};
      return {};
    default:
      break;
  }

  // 标量：整数、定长字符串、simple/浮点，复用 Decoder 的校验。
  Value v;
  if (auto ec = decoder_.decode_from_header(h, v)) {
    return ec;
  }
  complete_item();
  out = Event{event_type::scalar, std::nullopt, 0, std::move(v)};
  return {};
}

}  // namespace cborkit::cbor
