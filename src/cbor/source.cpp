#include "cborkit/cbor/source.hpp"

#include "cborkit/cbor/errors.hpp"

#include <algorithm>
#include <cstring>
#include <ios>
#include <istream>
#include <string>

namespace cborkit::cbor {

std::error_code ByteSource::read_exact(mutable_bytes_view out) noexcept {
  if (out.empty()) {
    return {};
  }
  const auto got = read_some(out);
  offset_ += got;
  if (got < out.size()) {
    shortfall_ = Shortfall{out.size(), got};
    return make_error_code(errc::unexpected_eof);
  }
  return {};
}

std::size_t SpanSource::read_some(mutable_bytes_view out) noexcept {
  const auto n = std::min(out.size(), remaining());
  if (n != 0) {
    std::memcpy(out.data(), data_.data() + pos_, n);
    pos_ += n;
  }
  return n;
}

bool IstreamSource::at_end() noexcept {
  try {
    return in_.peek() == std::char_traits<char>::eof();
  } catch (const std::ios_base::failure&) {
    return true;
  }
}

std::size_t IstreamSource::read_some(mutable_bytes_view out) noexcept {
  try {
    in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
  } catch (const std::ios_base::failure&) {
    // 已读到的部分仍由 gcount() 给出。
  }
  return static_cast<std::size_t>(in_.gcount());
}

}  // namespace cborkit::cbor
