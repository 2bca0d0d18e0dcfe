#include "cborkit/cbor/tags.hpp"

#include "cborkit/cbor/datetime.hpp"
#include "cborkit/cbor/decoder.hpp"
#include "cborkit/cbor/errors.hpp"

#include "core/log_internal.hpp"

#include <algorithm>
#include <bit>
#include <regex>
#include <utility>

namespace cborkit::cbor {
namespace {

[[nodiscard]] std::error_code bad_payload() noexcept { return make_error_code(errc::bad_tag_payload); }

// 载荷中的整数（Integer 或保留的 BigNum）。
[[nodiscard]] const BigInt* integer_of(const Value& v) noexcept {
  if (const auto* i = v.get_if<Integer>()) {
    return &i->value;
  }
  if (const auto* b = v.get_if<BigNum>()) {
    return &b->value;
  }
  return nullptr;
}

std::error_code decode_datetime_text(Decoder& dec, std::uint64_t, Value& out) {
  Value payload;
  if (auto ec = dec.decode_item(payload)) {
    return ec;
  }
  const auto* text = payload.get_if<Text>();
  if (!text) {
    return bad_payload();
  }
  return parse_rfc3339(text->value, out);
}

std::error_code decode_datetime_epoch(Decoder& dec, std::uint64_t, Value& out) {
  Header h;
  if (auto ec = dec.read_header(h)) {
    return ec;
  }
  // bignum 载荷即使能折叠成整数也拒绝。
  if (h.major == major_type::tag) {
    return bad_payload();
  }
  Value payload;
  if (auto ec = dec.decode_from_header(h, payload)) {
    return ec;
  }
  DateTime dt;
  if (const auto* i = payload.get_if<Integer>()) {
    const auto secs = to_i64(i->value);
    if (!secs) {
      return bad_payload();
    }
    if (auto ec = datetime_from_epoch(*secs, dt)) {
      return ec;
    }
  } else if (const auto* f = payload.get_if<Float>()) {
    if (auto ec = datetime_from_epoch(f->value, dt)) {
      return ec;
    }
  } else {
    return bad_payload();
  }
  out = Value{dt};
  return {};
}

std::error_code decode_bignum(Decoder& dec, std::uint64_t tag, Value& out) {
  Value payload;
  if (auto ec = dec.decode_item(payload)) {
    return ec;
  }
  const auto* bytes = payload.get_if<Bytes>();
  if (!bytes) {
    return bad_payload();
  }
  BigInt v = from_be_bytes(bytes->value);
  if (tag == tag_number::negative_bignum) {
    v = BigInt{-1} - v;
  }
  out = dec.options().retain_bignums ? Value::bignum(std::move(v)) : Value::integer(std::move(v));
  return {};
}

class NestedScope final {
 public:
  explicit NestedScope(Decoder& dec) noexcept : dec_(dec) {}
  ~NestedScope() {
    if (entered_) {
      dec_.leave_nested();
    }
  }

  NestedScope(const NestedScope&) = delete;
  NestedScope& operator=(const NestedScope&) = delete;

  std::error_code enter() noexcept {
    auto ec = dec_.enter_nested();
    entered_ = !ec;
    return ec;
  }

 private:
  Decoder& dec_;
  bool entered_{false};
};

/**
 * @brief tag 4/5：[exponent, mantissa]。
 *
 * exponent 必须是普通整数（不能是 bignum，且在 int64 内）；mantissa 可以是 bignum。
 * 需要看到 exponent 的编码形态，所以数组头部在这里读取，并自行登记一层嵌套。
 */
std::error_code decode_exponent_mantissa(Decoder& dec, std::uint64_t tag, Value& out) {
  Header list;
  if (auto ec = dec.read_header(list)) {
    return ec;
  }
  if (list.kind == header_kind::break_code) {
    return dec.fail(make_error_code(errc::misplaced_break));
  }
  if (list.major != major_type::array) {
    return bad_payload();
  }
  if (list.kind == header_kind::definite && list.argument != 2) {
    return bad_payload();
  }
  if (list.kind == header_kind::indefinite && dec.options().policy.forbid_indefinite) {
    return make_error_code(errc::indefinite_length);
  }
  const bool indefinite = list.kind == header_kind::indefinite;
  NestedScope scope(dec);
  if (auto ec = scope.enter()) {
    return ec;
  }

  // indefinite 数组里提前出现的 break 只是元素个数不对，属于 invalid。
  Header eh;
  if (auto ec = dec.read_header(eh)) {
    return ec;
  }
  if (eh.kind == header_kind::break_code) {
    return indefinite ? bad_payload() : dec.fail(make_error_code(errc::misplaced_break));
  }
  if (eh.major != major_type::unsigned_integer && eh.major != major_type::negative_integer) {
    return bad_payload();
  }
  Value exponent;
  if (auto ec = dec.decode_from_header(eh, exponent)) {
    return ec;
  }

  Header mh;
  if (auto ec = dec.read_header(mh)) {
    return ec;
  }
  if (mh.kind == header_kind::break_code) {
    return indefinite ? bad_payload() : dec.fail(make_error_code(errc::misplaced_break));
  }
  Value mantissa;
  if (auto ec = dec.decode_from_header(mh, mantissa)) {
    return ec;
  }
  if (indefinite) {
    Header end;
    if (auto ec = dec.read_header(end)) {
      return ec;
    }
    if (end.kind != header_kind::break_code) {
      return bad_payload();
    }
  }

  const auto exp = to_i64(exponent.get_if<Integer>()->value);
  const auto* m = integer_of(mantissa);
  if (!exp || !m) {
    return bad_payload();
  }
  if (tag == tag_number::decimal_fraction) {
    out = Value{Decimal{*m, *exp}};
  } else {
    out = Value{BigFloat{*m, *exp}};
  }
  return {};
}

std::error_code decode_shareable(Decoder& dec, std::uint64_t, Value& out) {
  auto& table = dec.shared();
  const auto id = table.allocate();
  core::detail::logger()->trace("cbor shared slot {} allocated", id);
  Value payload;
  if (auto ec = dec.decode_item(payload)) {
    return ec;
  }
  if (dec.immutable()) {
    if (auto ec = dec.charge_expansion(payload)) {
      return ec;
    }
    table.finalize(id, payload);
    out = std::move(payload);
    return {};
  }
  table.finalize(id, std::move(payload));
  out = Value::shared(id);
  return {};
}

std::error_code decode_shared_ref(Decoder& dec, std::uint64_t, Value& out) {
  Value payload;
  if (auto ec = dec.decode_item(payload)) {
    return ec;
  }
  const auto* index = payload.get_if<Integer>();
  if (!index) {
    return make_error_code(errc::bad_shared_reference_type);
  }
  const auto id = to_u64(index->value);
  auto& table = dec.shared();
  if (!id || !table.contains(static_cast<std::size_t>(*id))) {
    return make_error_code(errc::unknown_shared_reference);
  }
  const auto slot = static_cast<std::size_t>(*id);
  if (dec.immutable()) {
    if (!table.finalized(slot)) {
      return make_error_code(errc::mutable_key);
    }
    if (auto ec = dec.charge_expansion(table.at(slot))) {
      return ec;
    }
    out = table.at(slot);
    return {};
  }
  core::detail::logger()->trace("cbor shared slot {} referenced", slot);
  out = Value::shared(slot);
  return {};
}

std::error_code decode_rational(Decoder& dec, std::uint64_t, Value& out) {
  Value payload;
  if (auto ec = dec.decode_item(payload)) {
    return ec;
  }
  const auto* list = payload.get_if<List>();
  if (!list || list->size() != 2) {
    return bad_payload();
  }
  const auto* num = integer_of((*list)[0]);
  const auto* den = integer_of((*list)[1]);
  if (!num || !den || *den <= 0) {
    return bad_payload();
  }
  out = Value{Rational{*num, *den}};
  return {};
}

std::error_code decode_regex(Decoder& dec, std::uint64_t, Value& out) {
  Value payload;
  if (auto ec = dec.decode_item(payload)) {
    return ec;
  }
  auto* text = payload.get_if<Text>();
  if (!text) {
    return bad_payload();
  }
  try {
    const std::regex compiled(text->value);
    static_cast<void>(compiled);
  } catch (const std::regex_error& e) {
    return std::error_code(static_cast<int>(e.code()), regex_category());
  }
  out = Value{Regex{std::move(text->value)}};
  return {};
}

std::error_code decode_uuid(Decoder& dec, std::uint64_t, Value& out) {
  Value payload;
  if (auto ec = dec.decode_item(payload)) {
    return ec;
  }
  const auto* bytes = payload.get_if<Bytes>();
  if (!bytes || bytes->value.size() != 16) {
    return bad_payload();
  }
  Uuid uuid;
  std::copy(bytes->value.begin(), bytes->value.end(), uuid.bytes.begin());
  out = Value{uuid};
  return {};
}

std::error_code decode_set(Decoder& dec, std::uint64_t, Value& out) {
  Value payload;
  if (auto ec = dec.decode_immutable(payload)) {
    return ec;
  }
  auto* list = payload.get_if<List>();
  if (!list) {
    return bad_payload();
  }
  Set set;
  set.members.reserve(list->size());
  for (auto& member : *list) {
    if (std::find(set.members.begin(), set.members.end(), member) == set.members.end()) {
      set.members.push_back(std::move(member));
    }
  }
  out = Value{std::move(set)};
  return {};
}

[[nodiscard]] bool valid_ip_length(std::size_t n) noexcept { return n == 4 || n == 16; }

std::error_code decode_ip_address(Decoder& dec, std::uint64_t, Value& out) {
  Value payload;
  if (auto ec = dec.decode_item(payload)) {
    return ec;
  }
  auto* bytes = payload.get_if<Bytes>();
  if (!bytes || !valid_ip_length(bytes->value.size())) {
    return bad_payload();
  }
  out = Value{IpAddress{std::move(bytes->value)}};
  return {};
}

std::error_code decode_ip_network(Decoder& dec, std::uint64_t, Value& out) {
  Value payload;
  if (auto ec = dec.decode_item(payload)) {
    return ec;
  }
  auto* map = payload.get_if<Map>();
  if (!map || map->items.size() != 1) {
    return bad_payload();
  }
  auto& [key, value] = map->items.front();
  auto* address = key.get_if<Bytes>();
  const auto* prefix = value.get_if<Integer>();
  if (!address || !prefix || !valid_ip_length(address->value.size())) {
    return bad_payload();
  }
  const auto bits = static_cast<long>(8 * address->value.size());
  if (prefix->value < 0 || prefix->value > bits) {
    return bad_payload();
  }
  out = Value{IpNetwork{std::move(address->value), static_cast<std::uint8_t>(prefix->value)}};
  return {};
}

std::error_code decode_ordered_map(Decoder& dec, std::uint64_t, Value& out) {
  Value payload;
  if (auto ec = dec.decode_item(payload)) {
    return ec;
  }
  auto* map = payload.get_if<Map>();
  if (!map) {
    return bad_payload();
  }
  map->ordered = true;
  out = std::move(payload);
  return {};
}

template <class T>
std::vector<T> load_integers(const std::vector<byte>& raw, const TypedArrayInfo& info) {
  using U = std::make_unsigned_t<T>;
  std::vector<T> elements;
  elements.reserve(raw.size() / sizeof(T));
  for (std::size_t off = 0; off < raw.size(); off += sizeof(T)) {
    elements.push_back(static_cast<T>(load_uint<U>(raw.data() + off, info.order)));
  }
  return elements;
}

[[nodiscard]] TypedArray::elements_type load_elements(const std::vector<byte>& raw, const TypedArrayInfo& info) {
  using element = TypedArrayInfo::element;
  if (info.kind == element::floating) {
    if (info.width == 8) {
      std::vector<double> out;
      out.reserve(raw.size() / 8);
      for (std::size_t off = 0; off < raw.size(); off += 8) {
        out.push_back(std::bit_cast<double>(load_uint<std::uint64_t>(raw.data() + off, info.order)));
      }
      return out;
    }
    std::vector<float> out;
    out.reserve(raw.size() / info.width);
    for (std::size_t off = 0; off < raw.size(); off += info.width) {
      if (info.width == 2) {
        out.push_back(static_cast<float>(half_to_double(load_uint<std::uint16_t>(raw.data() + off, info.order))));
      } else {
        out.push_back(std::bit_cast<float>(load_uint<std::uint32_t>(raw.data() + off, info.order)));
      }
    }
    return out;
  }
  const bool is_signed = info.kind == element::signed_integer;
  switch (info.width) {
    case 1:
      return is_signed ? TypedArray::elements_type{load_integers<std::int8_t>(raw, info)}
                       : TypedArray::elements_type{load_integers<std::uint8_t>(raw, info)};
    case 2:
      return is_signed ? TypedArray::elements_type{load_integers<std::int16_t>(raw, info)}
                       : TypedArray::elements_type{load_integers<std::uint16_t>(raw, info)};
    case 4:
      return is_signed ? TypedArray::elements_type{load_integers<std::int32_t>(raw, info)}
                       : TypedArray::elements_type{load_integers<std::uint32_t>(raw, info)};
    default:
      return is_signed ? TypedArray::elements_type{load_integers<std::int64_t>(raw, info)}
                       : TypedArray::elements_type{load_integers<std::uint64_t>(raw, info)};
  }
}

std::error_code decode_typed_array(Decoder& dec, std::uint64_t tag, Value& out) {
  const auto info = typed_array_info(tag);
  Value payload;
  if (auto ec = dec.decode_item(payload)) {
    return ec;
  }
  const auto* bytes = payload.get_if<Bytes>();
  if (!info || !bytes || bytes->value.size() % info->width != 0) {
    return bad_payload();
  }
  out = Value{TypedArray{tag, load_elements(bytes->value, *info)}};
  return {};
}

TagTable build_default_table() {
  TagTable table;
  table.emplace(tag_number::datetime_text, decode_datetime_text);
  table.emplace(tag_number::datetime_epoch, decode_datetime_epoch);
  table.emplace(tag_number::positive_bignum, decode_bignum);
  table.emplace(tag_number::negative_bignum, decode_bignum);
  table.emplace(tag_number::decimal_fraction, decode_exponent_mantissa);
  table.emplace(tag_number::bigfloat, decode_exponent_mantissa);
  table.emplace(tag_number::shareable, decode_shareable);
  table.emplace(tag_number::shared_ref, decode_shared_ref);
  table.emplace(tag_number::rational, decode_rational);
  table.emplace(tag_number::regex, decode_regex);
  table.emplace(tag_number::uuid, decode_uuid);
  table.emplace(tag_number::set, decode_set);
  table.emplace(tag_number::ip_address, decode_ip_address);
  table.emplace(tag_number::ip_network, decode_ip_network);
  table.emplace(tag_number::ordered_map, decode_ordered_map);
  for (auto tag = tag_number::typed_array_first; tag <= tag_number::typed_array_last; ++tag) {
    if (typed_array_info(tag)) {
      table.emplace(tag, decode_typed_array);
    }
  }
  return table;
}

}  // namespace

std::optional<TypedArrayInfo> typed_array_info(std::uint64_t tag) noexcept {
  if (tag < tag_number::typed_array_first || tag > tag_number::typed_array_last) {
    return std::nullopt;
  }
  const auto bits = static_cast<unsigned>(tag - tag_number::typed_array_first);
  const bool is_float = (bits & 0x10u) != 0;
  const bool is_signed = (bits & 0x08u) != 0;
  const bool little = (bits & 0x04u) != 0;
  const unsigned ll = bits & 0x03u;

  TypedArrayInfo info;
  info.order = little ? byte_order::little : byte_order::big;
  if (is_float) {
    // f=1 时 s 与 ll 组合表示宽度：16/32/64/128 位。
    const unsigned sll = (is_signed ? 4u : 0u) | ll;
    if (sll > 2) {
      return std::nullopt;
    }
    info.kind = TypedArrayInfo::element::floating;
    info.width = std::size_t{2} << sll;
    return info;
  }
  info.width = std::size_t{1} << ll;
  if (ll == 0) {
    // 单字节元素无字节序：e 位在无符号时表示 clamped，在有符号时保留。
    if (little && is_signed) {
      return std::nullopt;
    }
    info.order = byte_order::big;
    info.kind = is_signed ? TypedArrayInfo::element::signed_integer
                          : (little ? TypedArrayInfo::element::clamped_unsigned
                                    : TypedArrayInfo::element::unsigned_integer);
    return info;
  }
  info.kind = is_signed ? TypedArrayInfo::element::signed_integer : TypedArrayInfo::element::unsigned_integer;
  return info;
}

const TagTable& default_tag_table() {
  static const TagTable table = build_default_table();
  return table;
}

}  // namespace cborkit::cbor
