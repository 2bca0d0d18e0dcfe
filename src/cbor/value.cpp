#include "cborkit/cbor/value.hpp"

#include <boost/container_hash/hash.hpp>

#include <algorithm>
#include <bit>
#include <cmath>
#include <functional>
#include <type_traits>

namespace cborkit::cbor {
namespace {

template <class T>
inline constexpr bool always_false_v = false;

[[nodiscard]] bool unordered_items_equal(const MapItems& lhs, const MapItems& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  std::vector<std::size_t> rhs_hashes;
  rhs_hashes.reserve(rhs.size());
  for (const auto& [k, v] : rhs) {
    rhs_hashes.push_back(hash_value(k));
  }
  for (const auto& [k, v] : lhs) {
    const auto h = hash_value(k);
    bool found = false;
    for (std::size_t i = 0; i < rhs.size(); ++i) {
      if (rhs_hashes[i] == h && rhs[i].first == k) {
        found = rhs[i].second == v;
        break;
      }
    }
    if (!found) {
      return false;
    }
  }
  return true;
}

[[nodiscard]] bool contains_member(const std::vector<Value>& members, const Value& v) {
  return std::find(members.begin(), members.end(), v) != members.end();
}

[[nodiscard]] std::size_t hash_bytes(const std::vector<byte>& data) {
  return boost::hash_range(data.begin(), data.end());
}

[[nodiscard]] std::size_t hash_double(double d) {
  // +0.0 == -0.0
  if (d == 0.0) {
    return 0;
  }
  return std::hash<std::uint64_t>{}(std::bit_cast<std::uint64_t>(d));
}

[[nodiscard]] std::size_t hash_items_unordered(const MapItems& items) {
  std::size_t sum = 0;
  for (const auto& [k, v] : items) {
    std::size_t entry = hash_value(k);
    boost::hash_combine(entry, hash_value(v));
    sum += entry;
  }
  return sum;
}

}  // namespace

std::string_view to_string(ValueKind kind) noexcept {
  switch (kind) {
    case ValueKind::null:
      return "null";
    case ValueKind::undefined:
      return "undefined";
    case ValueKind::boolean:
      return "boolean";
    case ValueKind::integer:
      return "integer";
    case ValueKind::bignum:
      return "bignum";
    case ValueKind::bytes:
      return "bytes";
    case ValueKind::text:
      return "text";
    case ValueKind::floating:
      return "float";
    case ValueKind::simple:
      return "simple";
    case ValueKind::list:
      return "list";
    case ValueKind::map:
      return "map";
    case ValueKind::tag:
      return "tag";
    case ValueKind::shared_ref:
      return "shared_ref";
    case ValueKind::datetime:
      return "datetime";
    case ValueKind::date:
      return "date";
    case ValueKind::decimal:
      return "decimal";
    case ValueKind::bigfloat:
      return "bigfloat";
    case ValueKind::rational:
      return "rational";
    case ValueKind::regex:
      return "regex";
    case ValueKind::uuid:
      return "uuid";
    case ValueKind::set:
      return "set";
    case ValueKind::ip_address:
      return "ip_address";
    case ValueKind::ip_network:
      return "ip_network";
    case ValueKind::typed_array:
      return "typed_array";
    case ValueKind::indefinite_bytes:
      return "indefinite_bytes";
    case ValueKind::indefinite_text:
      return "indefinite_text";
    case ValueKind::indefinite_list:
      return "indefinite_list";
    case ValueKind::indefinite_map:
      return "indefinite_map";
    case ValueKind::extension:
      return "extension";
  }
  return "unknown";
}

bool operator==(const Map& lhs, const Map& rhs) {
  if (lhs.ordered && rhs.ordered) {
    return lhs.items == rhs.items;
  }
  return unordered_items_equal(lhs.items, rhs.items);
}

Tag::Tag(std::uint64_t number, Value value)
    : number_(number), value_(std::make_unique<Value>(std::move(value))) {}

Tag::Tag(const Tag& other)
    : number_(other.number_),
      value_(other.value_ ? std::make_unique<Value>(*other.value_) : nullptr) {}

Tag& Tag::operator=(const Tag& other) {
  if (this != &other) {
    number_ = other.number_;
    value_ = other.value_ ? std::make_unique<Value>(*other.value_) : nullptr;
  }
  return *this;
}

Tag::~Tag() = default;

bool operator==(const Tag& lhs, const Tag& rhs) {
  if (lhs.number_ != rhs.number_) {
    return false;
  }
  if (!lhs.value_ || !rhs.value_) {
    return lhs.value_ == rhs.value_;
  }
  return *lhs.value_ == *rhs.value_;
}

bool operator==(const DateTime& lhs, const DateTime& rhs) noexcept {
  if (lhs.aware() != rhs.aware()) {
    return false;
  }
  return lhs.instant() == rhs.instant();
}

bool operator==(const Rational& lhs, const Rational& rhs) {
  return lhs.numerator * rhs.denominator == rhs.numerator * lhs.denominator;
}

bool operator==(const Set& lhs, const Set& rhs) {
  for (const auto& m : lhs.members) {
    if (!contains_member(rhs.members, m)) {
      return false;
    }
  }
  for (const auto& m : rhs.members) {
    if (!contains_member(lhs.members, m)) {
      return false;
    }
  }
  return true;
}

bool operator==(const IndefiniteList& lhs, const IndefiniteList& rhs) {
  return lhs.items == rhs.items;
}

bool operator==(const IndefiniteMap& lhs, const IndefiniteMap& rhs) {
  return lhs.items == rhs.items;
}

bool operator==(const Value& lhs, const Value& rhs) {
  return lhs.storage_ == rhs.storage_;
}

Value Value::null() { return Value{Null{}}; }
Value Value::undefined() { return Value{Undefined{}}; }
Value Value::boolean(bool v) { return Value{Boolean{v}}; }
Value Value::integer(std::int64_t v) { return Value{Integer{BigInt{v}}}; }
Value Value::integer(BigInt v) { return Value{Integer{std::move(v)}}; }
Value Value::bignum(BigInt v) { return Value{BigNum{std::move(v)}}; }
Value Value::floating(double v) { return Value{Float{v}}; }
Value Value::simple(std::uint8_t v) { return Value{Simple{v}}; }
Value Value::text(std::string v) { return Value{Text{std::move(v)}}; }
Value Value::bytes(std::vector<byte> v) { return Value{Bytes{std::move(v)}}; }
Value Value::list(std::vector<Value> items) { return Value{std::move(items)}; }
Value Value::map(MapItems items) { return Value{Map{std::move(items), false}}; }
Value Value::ordered_map(MapItems items) { return Value{Map{std::move(items), true}}; }
Value Value::tag(std::uint64_t number, Value v) { return Value{Tag{number, std::move(v)}}; }
Value Value::shared(std::size_t index) { return Value{SharedRef{index}}; }

std::size_t hash_value(const Value& v) {
  std::size_t seed = static_cast<std::size_t>(v.kind());
  std::visit(
    [&seed](const auto& x) {
      using T = std::decay_t<decltype(x)>;
      if constexpr (std::is_same_v<T, Null> || std::is_same_v<T, Undefined>) {
        // 仅由种类决定
      } else if constexpr (std::is_same_v<T, Boolean>) {
        boost::hash_combine(seed, x.value);
      } else if constexpr (std::is_same_v<T, Integer> || std::is_same_v<T, BigNum>) {
        boost::hash_combine(seed, std::hash<BigInt>{}(x.value));
      } else if constexpr (std::is_same_v<T, Bytes>) {
        boost::hash_combine(seed, hash_bytes(x.value));
      } else if constexpr (std::is_same_v<T, Text>) {
        boost::hash_combine(seed, std::hash<std::string>{}(x.value));
      } else if constexpr (std::is_same_v<T, Regex>) {
        boost::hash_combine(seed, std::hash<std::string>{}(x.pattern));
      } else if constexpr (std::is_same_v<T, Float>) {
        boost::hash_combine(seed, hash_double(x.value));
      } else if constexpr (std::is_same_v<T, Simple>) {
        boost::hash_combine(seed, x.value);
      } else if constexpr (std::is_same_v<T, List>) {
        for (const auto& item : x) {
          boost::hash_combine(seed, hash_value(item));
        }
      } else if constexpr (std::is_same_v<T, Map>) {
        boost::hash_combine(seed, hash_items_unordered(x.items));
      } else if constexpr (std::is_same_v<T, Tag>) {
        boost::hash_combine(seed, x.number());
        boost::hash_combine(seed, hash_value(x.value()));
      } else if constexpr (std::is_same_v<T, SharedRef>) {
        boost::hash_combine(seed, x.index);
      } else if constexpr (std::is_same_v<T, DateTime>) {
        boost::hash_combine(seed, x.aware());
        boost::hash_combine(seed, x.instant().time_since_epoch().count());
      } else if constexpr (std::is_same_v<T, Date>) {
        boost::hash_combine(seed, x.day.time_since_epoch().count());
      } else if constexpr (std::is_same_v<T, Decimal> || std::is_same_v<T, BigFloat>) {
        boost::hash_combine(seed, std::hash<BigInt>{}(x.mantissa));
        boost::hash_combine(seed, x.exponent);
      } else if constexpr (std::is_same_v<T, Rational>) {
        BigInt g = boost::multiprecision::gcd(x.numerator, x.denominator);
        if (g == 0) {
          g = 1;
        }
        BigInt num = x.numerator / g;
        BigInt den = x.denominator / g;
        if (den < 0) {
          num = -num;
          den = -den;
        }
        boost::hash_combine(seed, std::hash<BigInt>{}(num));
        boost::hash_combine(seed, std::hash<BigInt>{}(den));
      } else if constexpr (std::is_same_v<T, Uuid>) {
        boost::hash_combine(seed, boost::hash_range(x.bytes.begin(), x.bytes.end()));
      } else if constexpr (std::is_same_v<T, Set>) {
        // 与集合相等一致：对成员哈希去重后再组合。
        std::vector<std::size_t> hashes;
        hashes.reserve(x.members.size());
        for (const auto& m : x.members) {
          hashes.push_back(hash_value(m));
        }
        std::sort(hashes.begin(), hashes.end());
        hashes.erase(std::unique(hashes.begin(), hashes.end()), hashes.end());
        boost::hash_combine(seed, boost::hash_range(hashes.begin(), hashes.end()));
      } else if constexpr (std::is_same_v<T, IpAddress>) {
        boost::hash_combine(seed, hash_bytes(x.address));
      } else if constexpr (std::is_same_v<T, IpNetwork>) {
        boost::hash_combine(seed, hash_bytes(x.address));
        boost::hash_combine(seed, x.prefix);
      } else if constexpr (std::is_same_v<T, TypedArray>) {
        boost::hash_combine(seed, x.tag);
        boost::hash_combine(seed, std::visit([](const auto& e) { return e.size(); }, x.elements));
      } else if constexpr (std::is_same_v<T, IndefiniteBytes> || std::is_same_v<T, IndefiniteText>) {
        boost::hash_combine(seed, x.chunks.size());
      } else if constexpr (std::is_same_v<T, IndefiniteList>) {
        for (const auto& item : x.items) {
          boost::hash_combine(seed, hash_value(item));
        }
      } else if constexpr (std::is_same_v<T, IndefiniteMap>) {
        boost::hash_combine(seed, x.items.size());
      } else if constexpr (std::is_same_v<T, Extension>) {
        boost::hash_combine(seed, std::hash<const ToWireFormat*>{}(x.object.get()));
      } else {
        static_assert(always_false_v<T>, "unhandled value kind");
      }
    },
    v.storage());
  return seed;
}

std::size_t SharedTable::allocate() {
  slots_.push_back(Slot{});
  return slots_.size() - 1;
}

void SharedTable::finalize(std::size_t index, Value value) {
  auto& slot = slots_.at(index);
  slot.value = std::move(value);
  slot.finalized = true;
}

const Value& Document::resolve(const Value& v) const {
  const Value* current = &v;
  // 槽位内容本身也可能是 SharedRef；链长不超过槽位数。
  for (std::size_t hops = 0; hops <= shared.size(); ++hops) {
    const auto* ref = current->get_if<SharedRef>();
    if (!ref || !shared.contains(ref->index)) {
      return *current;
    }
    current = &shared.at(ref->index);
  }
  return *current;
}

}  // namespace cborkit::cbor
