#include "cborkit/cbor/integer.hpp"

#include <algorithm>
#include <iterator>
#include <limits>

namespace cborkit::cbor {

std::optional<std::uint64_t> to_u64(const BigInt& v) {
  if (v < 0 || v > std::numeric_limits<std::uint64_t>::max()) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(v);
}

std::optional<std::int64_t> to_i64(const BigInt& v) {
  if (v < std::numeric_limits<std::int64_t>::min() || v > std::numeric_limits<std::int64_t>::max()) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(v);
}

std::vector<byte> to_be_bytes(const BigInt& magnitude) {
  std::vector<byte> out;
  if (magnitude <= 0) {
    return out;
  }
  boost::multiprecision::export_bits(magnitude, std::back_inserter(out), 8, true);
  return out;
}

BigInt from_be_bytes(bytes_view data) {
  BigInt v;
  if (data.empty()) {
    return v;
  }
  boost::multiprecision::import_bits(v, data.begin(), data.end(), 8, true);
  return v;
}

}  // namespace cborkit::cbor
