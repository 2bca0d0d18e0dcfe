#include "cborkit/cbor/header.hpp"

#include "cborkit/cbor/errors.hpp"
#include "cborkit/cbor/source.hpp"

#include <array>

namespace cborkit::cbor {
namespace {

[[nodiscard]] bool is_minimal(std::uint8_t width, std::uint64_t argument) noexcept {
  switch (width) {
    case 1:
      return argument >= 24;
    case 2:
      return argument > 0xFFu;
    case 4:
      return argument > 0xFFFFu;
    case 8:
      return argument > 0xFFFFFFFFu;
    default:
      return true;
  }
}

}  // namespace

std::size_t argument_width(std::uint64_t argument) noexcept {
  if (argument < 24) {
    return 0;
  }
  if (argument <= 0xFFu) {
    return 1;
  }
  if (argument <= 0xFFFFu) {
    return 2;
  }
  if (argument <= 0xFFFFFFFFu) {
    return 4;
  }
  return 8;
}

void append_header(std::vector<byte>& out, major_type major, std::uint64_t argument) {
  std::array<byte, 9> buf{};
  std::size_t n = 1;
  switch (argument_width(argument)) {
    case 0:
      buf[0] = initial_byte(major, static_cast<std::uint8_t>(argument));
      break;
    case 1:
      buf[0] = initial_byte(major, kAdditionalOneByte);
      buf[1] = static_cast<byte>(argument);
      n = 2;
      break;
    case 2:
      buf[0] = initial_byte(major, kAdditionalTwoBytes);
      store_uint<std::uint16_t>(buf.data() + 1, static_cast<std::uint16_t>(argument));
      n = 3;
      break;
    case 4:
      buf[0] = initial_byte(major, kAdditionalFourBytes);
      store_uint<std::uint32_t>(buf.data() + 1, static_cast<std::uint32_t>(argument));
      n = 5;
      break;
    default:
      buf[0] = initial_byte(major, kAdditionalEightBytes);
      store_uint<std::uint64_t>(buf.data() + 1, argument);
      n = 9;
      break;
  }
  out.insert(out.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n));
}

std::error_code append_header(std::vector<byte>& out, major_type major, const BigInt& argument) {
  const auto narrow = to_u64(argument);
  if (!narrow) {
    return make_error_code(errc::overflow);
  }
  append_header(out, major, *narrow);
  return {};
}

void append_indefinite(std::vector<byte>& out, major_type major) {
  out.push_back(initial_byte(major, kAdditionalIndefinite));
}

std::error_code decode_header(ByteSource& source, Header& out, bool require_minimal) noexcept {
  std::array<byte, 8> buf{};
  if (auto ec = source.read_exact(mutable_bytes_view{buf.data(), 1})) {
    return ec;
  }
  const auto first = buf[0];
  Header h;
  h.major = static_cast<major_type>(first >> 5);
  h.additional = static_cast<std::uint8_t>(first & 0x1Fu);

  if (h.additional < 24) {
    h.argument = h.additional;
    out = h;
    return {};
  }
  if (h.additional <= kAdditionalEightBytes) {
    h.width = static_cast<std::uint8_t>(1u << (h.additional - kAdditionalOneByte));
    if (auto ec = source.read_exact(mutable_bytes_view{buf.data(), h.width})) {
      return ec;
    }
    switch (h.width) {
      case 1:
        h.argument = buf[0];
        break;
      case 2:
        h.argument = load_uint<std::uint16_t>(buf.data());
        break;
      case 4:
        h.argument = load_uint<std::uint32_t>(buf.data());
        break;
      default:
        h.argument = load_uint<std::uint64_t>(buf.data());
        break;
    }
    // major 7 的参数是 simple 值或浮点位模式，最短规则另行检查。
    if (require_minimal && h.major != major_type::simple && !is_minimal(h.width, h.argument)) {
      return make_error_code(errc::non_minimal_length);
    }
    out = h;
    return {};
  }
  if (h.additional < kAdditionalIndefinite) {
    return make_error_code(errc::reserved_initial_byte);
  }

  switch (h.major) {
    case major_type::byte_string:
    case major_type::text_string:
    case major_type::array:
    case major_type::map:
      h.kind = header_kind::indefinite;
      break;
    case major_type::simple:
      h.kind = header_kind::break_code;
      break;
    default:
      // 整数与 tag 没有 indefinite 形式。
      return make_error_code(errc::bad_initial_byte);
  }
  out = h;
  return {};
}

}  // namespace cborkit::cbor
