#include "cborkit/cbor/encoder.hpp"

#include "cborkit/cbor/datetime.hpp"
#include "cborkit/cbor/errors.hpp"
#include "cborkit/cbor/tags.hpp"

#include "core/log_internal.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <chrono>
#include <cmath>
#include <numeric>
#include <type_traits>
#include <variant>

namespace cborkit::cbor {
namespace {

template <class T>
inline constexpr bool always_false_v = false;

constexpr byte kFalse = 0xF4;
constexpr byte kTrue = 0xF5;
constexpr byte kNull = 0xF6;
constexpr byte kUndefined = 0xF7;

constexpr std::uint64_t kCanonicalDoubleNaN = 0x7FF8000000000000ULL;

[[nodiscard]] bool lexicographic_less(const std::vector<byte>& a, const std::vector<byte>& b) {
  return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end());
}

[[nodiscard]] bool length_first_less(const std::vector<byte>& a, const std::vector<byte>& b) {
  if (a.size() != b.size()) {
    return a.size() < b.size();
  }
  return lexicographic_less(a, b);
}

template <class T>
[[nodiscard]] const std::vector<T>* elements_as(const TypedArray& array) noexcept {
  return std::get_if<std::vector<T>>(&array.elements);
}

template <class T>
void store_integers(std::vector<byte>& raw, const std::vector<T>& values, byte_order order) {
  using U = std::make_unsigned_t<T>;
  raw.resize(values.size() * sizeof(T));
  for (std::size_t i = 0; i < values.size(); ++i) {
    store_uint<U>(raw.data() + i * sizeof(T), static_cast<U>(values[i]), order);
  }
}

}  // namespace

std::error_code validate(const EncodeOptions& options) noexcept {
  if (options.deterministic && options.sort == sort_method::unsorted) {
    return make_error_code(errc::invalid_options);
  }
  return {};
}

EncodeOptions effective_options(const EncodeOptions& options) {
  EncodeOptions eff = options;
  if (eff.deterministic) {
    eff.realize_indefinite_length = true;
    eff.floats = float_style::shortest;
  }
  return eff;
}

EncodeOptions encode_options_for(const DeterministicPolicy& policy) {
  EncodeOptions opts;
  if (policy.forced_sort_order) {
    opts.sort = sort_method::length_first;
    opts.deterministic = true;
  }
  if (policy.forbid_indefinite) {
    opts.realize_indefinite_length = true;
  }
  return opts;
}

Encoder::Encoder(const EncodeOptions& options, const SharedTable* shared)
    : options_(effective_options(options)), shared_(shared) {}

void Encoder::count_references(const Value& root) {
  references_.clear();
  counted_ = true;
  std::vector<const Value*> pending{&root};
  while (!pending.empty()) {
    const Value* v = pending.back();
    pending.pop_back();
    std::visit(
      [&](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, SharedRef>) {
          // 槽位内容只在第一次遇到时展开，环因此也只走一遍
          if (++references_[x.index] == 1 && shared_ && shared_->contains(x.index)) {
            pending.push_back(&shared_->at(x.index));
          }
        } else if constexpr (std::is_same_v<T, List>) {
          for (const auto& item : x) {
            pending.push_back(&item);
          }
        } else if constexpr (std::is_same_v<T, IndefiniteList>) {
          for (const auto& item : x.items) {
            pending.push_back(&item);
          }
        } else if constexpr (std::is_same_v<T, Set>) {
          for (const auto& item : x.members) {
            pending.push_back(&item);
          }
        } else if constexpr (std::is_same_v<T, Map> || std::is_same_v<T, IndefiniteMap>) {
          for (const auto& [key, value] : x.items) {
            pending.push_back(&key);
            pending.push_back(&value);
          }
        } else if constexpr (std::is_same_v<T, Tag>) {
          pending.push_back(&x.value());
        }
      },
      v->storage());
  }
}

std::error_code Encoder::fail(std::error_code ec, const char* what) {
  core::detail::logger()->debug("cbor encode failed: {} ({})", ec.message(), what);
  return ec;
}

void Encoder::write_header(major_type major, std::uint64_t argument) { append_header(out_, major, argument); }

void Encoder::write_bytes(bytes_view raw) { out_.insert(out_.end(), raw.begin(), raw.end()); }

std::error_code Encoder::encode_bignum(const BigInt& v) {
  if (v >= 0) {
    write_tag(tag_number::positive_bignum);
    const auto magnitude = to_be_bytes(v);
    write_header(major_type::byte_string, magnitude.size());
    write_bytes(magnitude);
    return {};
  }
  write_tag(tag_number::negative_bignum);
  const auto magnitude = to_be_bytes(BigInt{-1} - v);
  write_header(major_type::byte_string, magnitude.size());
  write_bytes(magnitude);
  return {};
}

std::error_code Encoder::encode_integer(const BigInt& v) {
  // 超出 64 位时退回到 tag 2/3。
  if (v >= 0) {
    if (append_header(out_, major_type::unsigned_integer, v)) {
      return encode_bignum(v);
    }
    return {};
  }
  if (append_header(out_, major_type::negative_integer, BigInt{-1} - v)) {
    return encode_bignum(v);
  }
  return {};
}

void Encoder::encode_float(double v) {
  std::array<byte, 9> buf{};
  if (options_.floats == float_style::always_double) {
    buf[0] = initial_byte(major_type::simple, kAdditionalEightBytes);
    store_uint<std::uint64_t>(buf.data() + 1, std::isnan(v) ? kCanonicalDoubleNaN : std::bit_cast<std::uint64_t>(v));
    write_bytes(bytes_view{buf.data(), 9});
    return;
  }
  if (std::isnan(v)) {
    buf[0] = initial_byte(major_type::simple, kAdditionalTwoBytes);
    store_uint<std::uint16_t>(buf.data() + 1, kCanonicalHalfNaN);
    write_bytes(bytes_view{buf.data(), 3});
    return;
  }
  if (const auto half = double_to_half_exact(v)) {
    buf[0] = initial_byte(major_type::simple, kAdditionalTwoBytes);
    store_uint<std::uint16_t>(buf.data() + 1, *half);
    write_bytes(bytes_view{buf.data(), 3});
    return;
  }
  if (const auto single = double_to_float_exact(v)) {
    buf[0] = initial_byte(major_type::simple, kAdditionalFourBytes);
    store_uint<std::uint32_t>(buf.data() + 1, std::bit_cast<std::uint32_t>(*single));
    write_bytes(bytes_view{buf.data(), 5});
    return;
  }
  buf[0] = initial_byte(major_type::simple, kAdditionalEightBytes);
  store_uint<std::uint64_t>(buf.data() + 1, std::bit_cast<std::uint64_t>(v));
  write_bytes(bytes_view{buf.data(), 9});
}

std::error_code Encoder::encode_simple(std::uint8_t v) {
  if (v >= 24 && v < 32) {
    return fail(make_error_code(errc::unsupported_value), "reserved simple value");
  }
  if (v < 24) {
    out_.push_back(initial_byte(major_type::simple, v));
  } else {
    out_.push_back(initial_byte(major_type::simple, kAdditionalOneByte));
    out_.push_back(v);
  }
  return {};
}

std::error_code Encoder::encode_text(std::string_view text) {
  write_header(major_type::text_string, text.size());
  out_.insert(out_.end(), text.begin(), text.end());
  return {};
}

std::error_code Encoder::encode_list(const std::vector<Value>& items) {
  write_header(major_type::array, items.size());
  for (const auto& item : items) {
    if (auto ec = encode(item)) {
      return ec;
    }
  }
  return {};
}

std::error_code Encoder::encode_detached(const Value& v, std::vector<byte>& out) {
  auto saved_emitted = emitted_;
  const auto saved_next = next_shared_id_;
  std::swap(out_, out);
  out_.clear();
  auto ec = encode(v);
  std::swap(out_, out);
  emitted_ = std::move(saved_emitted);
  next_shared_id_ = saved_next;
  return ec;
}

void Encoder::sort_by_encoding(std::vector<std::size_t>& order, const std::vector<std::vector<byte>>& encoded) const {
  if (options_.sort == sort_method::length_first) {
    std::stable_sort(order.begin(), order.end(), [&encoded](std::size_t a, std::size_t b) {
      return length_first_less(encoded[a], encoded[b]);
    });
    return;
  }
  std::stable_sort(order.begin(), order.end(), [&encoded](std::size_t a, std::size_t b) {
    return lexicographic_less(encoded[a], encoded[b]);
  });
}

/*
 * 映射/集合排序：比较的是“编码后的字节”，而不是源值。
 * 先以独立缓冲区编码每个键确定顺序，再按该顺序正式输出键值，
 * 以保证共享标记（tag 28）总是先于对它的引用（tag 29）出现。
 *
 * 注意：排序键只知道本映射之前已输出的槽位。若同一槽位在本映射的多个键中首次出现，
 * 每个排序键里它都是 tag 28，而正式输出时只有第一个是 tag 28、其余是 tag 29，
 * 因此这类键的最终顺序不保证与其最终字节的顺序一致。
 */
std::error_code Encoder::encode_entries(const MapItems& items, bool sort) {
  write_header(major_type::map, items.size());
  std::vector<std::size_t> order(items.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  if (sort && options_.sort != sort_method::unsorted && items.size() > 1) {
    std::vector<std::vector<byte>> keys(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
      if (auto ec = encode_detached(items[i].first, keys[i])) {
        return ec;
      }
    }
    sort_by_encoding(order, keys);
  }
  for (const auto idx : order) {
    if (auto ec = encode(items[idx].first)) {
      return ec;
    }
    if (auto ec = encode(items[idx].second)) {
      return ec;
    }
  }
  return {};
}

std::error_code Encoder::encode_members(const std::vector<Value>& members) {
  write_header(major_type::array, members.size());
  std::vector<std::size_t> order(members.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  if (options_.sort != sort_method::unsorted && members.size() > 1) {
    std::vector<std::vector<byte>> encoded(members.size());
    for (std::size_t i = 0; i < members.size(); ++i) {
      if (auto ec = encode_detached(members[i], encoded[i])) {
        return ec;
      }
    }
    sort_by_encoding(order, encoded);
  }
  for (const auto idx : order) {
    if (auto ec = encode(members[idx])) {
      return ec;
    }
  }
  return {};
}

std::error_code Encoder::encode_shared(const SharedRef& ref) {
  if (!shared_ || !shared_->contains(ref.index)) {
    return fail(make_error_code(errc::unsupported_value), "dangling shared reference");
  }
  const auto& target = shared_->at(ref.index);
  const bool repeated = !counted_ || references_[ref.index] > 1;
  if (repeated && options_.shared_types.contains(target.kind())) {
    if (auto it = emitted_.find(ref.index); it != emitted_.end()) {
      write_tag(tag_number::shared_ref);
      write_header(major_type::unsigned_integer, it->second);
      return {};
    }
    const auto id = next_shared_id_++;
    emitted_.emplace(ref.index, id);
    core::detail::logger()->trace("cbor shared slot {} emitted as {}", ref.index, id);
    write_tag(tag_number::shareable);
    return encode(target);
  }

  // 未声明共享或只引用一次：按值内联；在自身内部再次遇到即为自引用。
  if (std::find(active_.begin(), active_.end(), ref.index) != active_.end()) {
    return fail(make_error_code(errc::self_referential), "cyclic value without sharing");
  }
  active_.push_back(ref.index);
  auto ec = encode(target);
  active_.pop_back();
  return ec;
}

std::error_code Encoder::encode_datetime(const DateTime& dt) {
  DateTime aware = dt;
  if (!aware.utc_offset) {
    if (!options_.default_timezone) {
      return fail(make_error_code(errc::missing_timezone), "naive datetime");
    }
    aware.utc_offset = options_.default_timezone;
  }
  switch (options_.datetimes) {
    case datetime_style::epoch: {
      const auto us = aware.instant().time_since_epoch().count();
      write_tag(tag_number::datetime_epoch);
      if (us % 1'000'000 == 0) {
        return encode_integer(BigInt{us / 1'000'000});
      }
      encode_float(static_cast<double>(us) / 1'000'000.0);
      return {};
    }
    case datetime_style::iso_z:
      write_tag(tag_number::datetime_text);
      return encode_text(format_rfc3339(aware, true));
    case datetime_style::iso_offset:
      write_tag(tag_number::datetime_text);
      return encode_text(format_rfc3339(aware, false));
  }
  return fail(make_error_code(errc::invalid_options), "datetime style");
}

std::error_code Encoder::encode_typed_array(const TypedArray& array) {
  const auto info = typed_array_info(array.tag);
  if (!info) {
    return fail(make_error_code(errc::unsupported_value), "typed array tag");
  }
  using element = TypedArrayInfo::element;
  std::vector<byte> raw;
  bool matched = false;

  if (info->kind == element::floating) {
    if (info->width == 8) {
      if (const auto* v = elements_as<double>(array)) {
        raw.resize(v->size() * 8);
        for (std::size_t i = 0; i < v->size(); ++i) {
          store_uint<std::uint64_t>(raw.data() + i * 8, std::bit_cast<std::uint64_t>((*v)[i]), info->order);
        }
        matched = true;
      }
    } else if (const auto* v = elements_as<float>(array)) {
      raw.resize(v->size() * info->width);
      for (std::size_t i = 0; i < v->size(); ++i) {
        const auto f = (*v)[i];
        if (info->width == 4) {
          store_uint<std::uint32_t>(raw.data() + i * 4, std::bit_cast<std::uint32_t>(f), info->order);
          continue;
        }
        auto half = double_to_half_exact(static_cast<double>(f));
        if (!half && std::isnan(f)) {
          half = kCanonicalHalfNaN;
        }
        if (!half) {
          return fail(make_error_code(errc::unsupported_value), "float16 element not representable");
        }
        store_uint<std::uint16_t>(raw.data() + i * 2, *half, info->order);
      }
      matched = true;
    }
  } else {
    const bool is_signed = info->kind == element::signed_integer;
    const auto store = [&](const auto* v) {
      if (v) {
        store_integers(raw, *v, info->order);
        matched = true;
      }
    };
    switch (info->width) {
      case 1:
        is_signed ? store(elements_as<std::int8_t>(array)) : store(elements_as<std::uint8_t>(array));
        break;
      case 2:
        is_signed ? store(elements_as<std::int16_t>(array)) : store(elements_as<std::uint16_t>(array));
        break;
      case 4:
        is_signed ? store(elements_as<std::int32_t>(array)) : store(elements_as<std::uint32_t>(array));
        break;
      default:
        is_signed ? store(elements_as<std::int64_t>(array)) : store(elements_as<std::uint64_t>(array));
        break;
    }
  }
  if (!matched) {
    return fail(make_error_code(errc::unsupported_value), "typed array element type does not match tag");
  }
  write_tag(array.tag);
  write_header(major_type::byte_string, raw.size());
  write_bytes(raw);
  return {};
}

std::error_code Encoder::encode(const Value& v) noexcept {
  return std::visit(
    [this](const auto& x) -> std::error_code {
      using T = std::decay_t<decltype(x)>;
      if constexpr (std::is_same_v<T, Null>) {
        out_.push_back(kNull);
        return {};
      } else if constexpr (std::is_same_v<T, Undefined>) {
        out_.push_back(kUndefined);
        return {};
      } else if constexpr (std::is_same_v<T, Boolean>) {
        out_.push_back(x.value ? kTrue : kFalse);
        return {};
      } else if constexpr (std::is_same_v<T, Integer>) {
        return encode_integer(x.value);
      } else if constexpr (std::is_same_v<T, BigNum>) {
        return encode_bignum(x.value);
      } else if constexpr (std::is_same_v<T, Bytes>) {
        write_header(major_type::byte_string, x.value.size());
        write_bytes(x.value);
        return {};
      } else if constexpr (std::is_same_v<T, Text>) {
        return encode_text(x.value);
      } else if constexpr (std::is_same_v<T, Float>) {
        encode_float(x.value);
        return {};
      } else if constexpr (std::is_same_v<T, Simple>) {
        return encode_simple(x.value);
      } else if constexpr (std::is_same_v<T, List>) {
        return encode_list(x);
      } else if constexpr (std::is_same_v<T, Map>) {
        if (x.ordered) {
          write_tag(tag_number::ordered_map);
          return encode_entries(x.items, false);
        }
        return encode_entries(x.items, true);
      } else if constexpr (std::is_same_v<T, Tag>) {
        write_tag(x.number());
        return encode(x.value());
      } else if constexpr (std::is_same_v<T, SharedRef>) {
        return encode_shared(x);
      } else if constexpr (std::is_same_v<T, DateTime>) {
        return encode_datetime(x);
      } else if constexpr (std::is_same_v<T, Date>) {
        write_tag(tag_number::datetime_text);
        return encode_text(format_date(x));
      } else if constexpr (std::is_same_v<T, Decimal> || std::is_same_v<T, BigFloat>) {
        write_tag(std::is_same_v<T, Decimal> ? tag_number::decimal_fraction : tag_number::bigfloat);
        write_header(major_type::array, 2);
        if (auto ec = encode_integer(BigInt{x.exponent})) {
          return ec;
        }
        return encode_integer(x.mantissa);
      } else if constexpr (std::is_same_v<T, Rational>) {
        if (x.denominator <= 0) {
          return fail(make_error_code(errc::unsupported_value), "rational denominator must be positive");
        }
        write_tag(tag_number::rational);
        write_header(major_type::array, 2);
        if (auto ec = encode_integer(x.numerator)) {
          return ec;
        }
        return encode_integer(x.denominator);
      } else if constexpr (std::is_same_v<T, Regex>) {
        write_tag(tag_number::regex);
        return encode_text(x.pattern);
      } else if constexpr (std::is_same_v<T, Uuid>) {
        write_tag(tag_number::uuid);
        write_header(major_type::byte_string, x.bytes.size());
        write_bytes(x.bytes);
        return {};
      } else if constexpr (std::is_same_v<T, Set>) {
        write_tag(tag_number::set);
        return encode_members(x.members);
      } else if constexpr (std::is_same_v<T, IpAddress>) {
        if (x.address.size() != 4 && x.address.size() != 16) {
          return fail(make_error_code(errc::unsupported_value), "ip address length");
        }
        write_tag(tag_number::ip_address);
        write_header(major_type::byte_string, x.address.size());
        write_bytes(x.address);
        return {};
      } else if constexpr (std::is_same_v<T, IpNetwork>) {
        if ((x.address.size() != 4 && x.address.size() != 16) || x.prefix > 8 * x.address.size()) {
          return fail(make_error_code(errc::unsupported_value), "ip network");
        }
        write_tag(tag_number::ip_network);
        write_header(major_type::map, 1);
        write_header(major_type::byte_string, x.address.size());
        write_bytes(x.address);
        write_header(major_type::unsigned_integer, x.prefix);
        return {};
      } else if constexpr (std::is_same_v<T, TypedArray>) {
        return encode_typed_array(x);
      } else if constexpr (std::is_same_v<T, IndefiniteBytes>) {
        if (options_.realize_indefinite_length) {
          std::vector<byte> joined;
          for (const auto& chunk : x.chunks) {
            joined.insert(joined.end(), chunk.begin(), chunk.end());
          }
          write_header(major_type::byte_string, joined.size());
          write_bytes(joined);
          return {};
        }
        append_indefinite(out_, major_type::byte_string);
        for (const auto& chunk : x.chunks) {
          write_header(major_type::byte_string, chunk.size());
          write_bytes(chunk);
        }
        out_.push_back(kBreakByte);
        return {};
      } else if constexpr (std::is_same_v<T, IndefiniteText>) {
        if (options_.realize_indefinite_length) {
          std::string joined;
          for (const auto& chunk : x.chunks) {
            joined += chunk;
          }
          return encode_text(joined);
        }
        append_indefinite(out_, major_type::text_string);
        for (const auto& chunk : x.chunks) {
          if (auto ec = encode_text(chunk)) {
            return ec;
          }
        }
        out_.push_back(kBreakByte);
        return {};
      } else if constexpr (std::is_same_v<T, IndefiniteList>) {
        if (options_.realize_indefinite_length) {
          return encode_list(x.items);
        }
        append_indefinite(out_, major_type::array);
        for (const auto& item : x.items) {
          if (auto ec = encode(item)) {
            return ec;
          }
        }
        out_.push_back(kBreakByte);
        return {};
      } else if constexpr (std::is_same_v<T, IndefiniteMap>) {
        if (options_.realize_indefinite_length) {
          return encode_entries(x.items, true);
        }
        append_indefinite(out_, major_type::map);
        for (const auto& [key, value] : x.items) {
          if (auto ec = encode(key)) {
            return ec;
          }
          if (auto ec = encode(value)) {
            return ec;
          }
        }
        out_.push_back(kBreakByte);
        return {};
      } else if constexpr (std::is_same_v<T, Extension>) {
        if (!x.object) {
          return fail(make_error_code(errc::unsupported_value), "empty extension");
        }
        return x.object->to_wire(*this);
      } else {
        static_assert(always_false_v<T>, "unhandled value kind");
      }
    },
    v.storage());
}

std::error_code encode_one(const Value& value, std::vector<byte>& out, const EncodeOptions& options) noexcept {
  if (auto ec = validate(options)) {
    return ec;
  }
  Encoder encoder(options);
  if (auto ec = encoder.encode(value)) {
    return ec;
  }
  const auto& bytes = encoder.bytes();
  out.insert(out.end(), bytes.begin(), bytes.end());
  return {};
}

std::error_code encode_one(const Document& doc, std::vector<byte>& out, const EncodeOptions& options) noexcept {
  if (auto ec = validate(options)) {
    return ec;
  }
  Encoder encoder(options, &doc.shared);
  encoder.count_references(doc.root);
  if (auto ec = encoder.encode(doc.root)) {
    return ec;
  }
  const auto& bytes = encoder.bytes();
  out.insert(out.end(), bytes.begin(), bytes.end());
  return {};
}

}  // namespace cborkit::cbor
