#include "cborkit/cbor/decoder.hpp"

#include "cborkit/cbor/errors.hpp"
#include "cborkit/cbor/tags.hpp"

#include "core/log_internal.hpp"

#include <algorithm>
#include <cmath>
#include <istream>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace cborkit::cbor {
namespace {

// 定长字符串分块读取，避免恶意长度一次性分配。
constexpr std::size_t kReadChunk = 64 * 1024;

// 定长数组/映射预留上限（真实元素数由输入决定）。
constexpr std::size_t kMaxReserve = 4096;

// 共享值展开预算：下限与每输入字节允许的展开量。
constexpr std::size_t kMinExpansion = 64 * 1024;
constexpr std::size_t kExpansionPerByte = 16;

constexpr const char kReplacementChar[] = "\xEF\xBF\xBD";

/**
 * @brief 校验一个 UTF-8 序列；返回该序列长度，非法时返回 0 并给出应跳过的字节数。
 */
[[nodiscard]] std::size_t utf8_sequence(const std::vector<byte>& s, std::size_t i, std::size_t& skip) noexcept {
  const auto c = s[i];
  std::size_t need = 0;
  std::uint32_t min_cp = 0;
  std::uint32_t cp = 0;
  if (c < 0x80) {
    return 1;
  }
  if (c >= 0xC2 && c <= 0xDF) {
    need = 1;
    min_cp = 0x80;
    cp = c & 0x1Fu;
  } else if (c >= 0xE0 && c <= 0xEF) {
    need = 2;
    min_cp = 0x800;
    cp = c & 0x0Fu;
  } else if (c >= 0xF0 && c <= 0xF4) {
    need = 3;
    min_cp = 0x10000;
    cp = c & 0x07u;
  } else {
    skip = 1;
    return 0;
  }
  std::size_t k = 1;
  for (; k <= need; ++k) {
    if (i + k >= s.size() || (s[i + k] & 0xC0u) != 0x80u) {
      skip = k;
      return 0;
    }
    cp = (cp << 6) | (s[i + k] & 0x3Fu);
  }
  if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    skip = k;
    return 0;
  }
  return need + 1;
}

class DepthGuard final {
 public:
  explicit DepthGuard(std::size_t& depth) noexcept : depth_(depth) { ++depth_; }
  ~DepthGuard() { --depth_; }

  DepthGuard(const DepthGuard&) = delete;
  DepthGuard& operator=(const DepthGuard&) = delete;

 private:
  std::size_t& depth_;
};

class ImmutableScope final {
 public:
  explicit ImmutableScope(bool& flag) noexcept : flag_(flag), saved_(flag) { flag_ = true; }
  ~ImmutableScope() { flag_ = saved_; }

  ImmutableScope(const ImmutableScope&) = delete;
  ImmutableScope& operator=(const ImmutableScope&) = delete;

 private:
  bool& flag_;
  bool saved_;
};

// 值的规模：每个节点计 1，字节串/文本再加上长度；超过 limit 后不再继续统计。
[[nodiscard]] std::size_t weigh(const Value& root, std::size_t limit) {
  std::size_t total = 0;
  std::vector<const Value*> pending{&root};
  while (!pending.empty() && total <= limit) {
    const Value* v = pending.back();
    pending.pop_back();
    ++total;
    std::visit(
      [&](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, Bytes> || std::is_same_v<T, Text>) {
          total += x.value.size();
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
  return total;
}

[[nodiscard]] bool is_canonical_nan(double v, std::uint8_t additional, std::uint64_t bits) noexcept {
  return std::isnan(v) && additional == kAdditionalTwoBytes && bits == kCanonicalHalfNaN;
}

}  // namespace

Decoder::Decoder(ByteSource& source, const DecodeOptions& options) : source_(source), options_(options) {}

std::error_code Decoder::fail(std::error_code ec, std::string message) {
  if (!ec || failure_.code) {
    return ec;
  }
  failure_.code = ec;
  failure_.offset = source_.offset();
  if (ec == errc::unexpected_eof) {
    failure_.requested = source_.shortfall().requested;
    failure_.available = source_.shortfall().available;
    if (message.empty()) {
      message = "need " + std::to_string(failure_.requested) + " bytes, only " +
                std::to_string(failure_.available) + " available";
    }
  }
  failure_.message = message.empty() ? ec.message() : std::move(message);
  core::detail::logger()->debug(
    "cbor decode failed at offset {}: [{}] {}", failure_.offset, ec.category().name(), failure_.message);
  return ec;
}

std::error_code Decoder::read_header(Header& out) noexcept {
  return fail(decode_header(source_, out, options_.policy.minimal_length));
}

std::error_code Decoder::decode_item(Value& out) noexcept {
  Header h;
  if (auto ec = read_header(h)) {
    return ec;
  }
  return decode_from_header(h, out);
}

std::error_code Decoder::decode_immutable(Value& out) noexcept {
  ImmutableScope scope(immutable_);
  return decode_item(out);
}

std::error_code Decoder::decode_document(Document& out) noexcept {
  shared_.clear();
  expanded_ = 0;
  Value root;
  if (auto ec = decode_item(root)) {
    return ec;
  }
  out.root = std::move(root);
  out.shared = std::move(shared_);
  shared_.clear();
  return {};
}

std::error_code Decoder::enter_nested() noexcept {
  if (depth_ >= options_.max_depth) {
    return fail(make_error_code(errc::nesting_too_deep), "nesting deeper than " + std::to_string(options_.max_depth));
  }
  ++depth_;
  return {};
}

std::error_code Decoder::charge_expansion(const Value& v) noexcept {
  const std::size_t budget = std::max(kMinExpansion, kExpansionPerByte * source_.offset());
  const std::size_t left = expanded_ < budget ? budget - expanded_ : 0;
  const std::size_t cost = weigh(v, left);
  if (cost > left) {
    return fail(make_error_code(errc::shared_expansion_limit),
                "shared value expansion exceeds " + std::to_string(budget));
  }
  expanded_ += cost;
  return {};
}

std::error_code Decoder::decode_from_header(const Header& h, Value& out) noexcept {
  if (h.kind == header_kind::break_code) {
    return fail(make_error_code(errc::misplaced_break));
  }
  if (h.kind == header_kind::indefinite && options_.policy.forbid_indefinite) {
    return fail(make_error_code(errc::indefinite_length));
  }
  switch (h.major) {
    case major_type::unsigned_integer:
      out = Value::integer(BigInt{h.argument});
      return {};
    case major_type::negative_integer:
      out = Value::integer(BigInt{-1} - BigInt{h.argument});
      return {};
    case major_type::byte_string:
      return decode_byte_string(h, out);
    case major_type::text_string:
      return decode_text_string(h, out);
    case major_type::array:
    case major_type::map:
    case major_type::tag: {
      if (depth_ >= options_.max_depth) {
        return fail(make_error_code(errc::nesting_too_deep),
                    "nesting deeper than " + std::to_string(options_.max_depth));
      }
      DepthGuard guard(depth_);
      if (h.major == major_type::array) {
        return decode_array(h, out);
      }
      if (h.major == major_type::map) {
        return decode_map(h, out);
      }
      return decode_tag(h, out);
    }
    case major_type::simple:
      return decode_simple(h, out);
  }
  return fail(make_error_code(errc::bad_initial_byte));
}

std::error_code Decoder::read_payload(std::uint64_t length, std::vector<byte>& out) noexcept {
  std::uint64_t left = length;
  while (left != 0) {
    const auto n = static_cast<std::size_t>(std::min<std::uint64_t>(left, kReadChunk));
    const auto old = out.size();
    out.resize(old + n);
    if (auto ec = source_.read_exact(mutable_bytes_view{out.data() + old, n})) {
      return fail(ec);
    }
    left -= n;
  }
  return {};
}

std::error_code Decoder::decode_byte_string(const Header& h, Value& out) noexcept {
  std::vector<byte> data;
  if (h.kind == header_kind::definite) {
    if (auto ec = read_payload(h.argument, data)) {
      return ec;
    }
    out = Value::bytes(std::move(data));
    return {};
  }

  // 缓冲式消费者：分块立即拼接。
  for (;;) {
    Header chunk;
    if (auto ec = read_header(chunk)) {
      return ec;
    }
    if (chunk.kind == header_kind::break_code) {
      break;
    }
    if (chunk.major != major_type::byte_string || chunk.kind != header_kind::definite) {
      return fail(make_error_code(errc::bad_initial_byte), "indefinite byte string contains a non-byte-string chunk");
    }
    if (auto ec = read_payload(chunk.argument, data)) {
      return ec;
    }
  }
  out = Value::bytes(std::move(data));
  return {};
}

std::error_code Decoder::check_text(std::vector<byte>& raw, std::string& out) noexcept {
  std::size_t i = 0;
  bool clean = true;
  std::string fixed;
  while (i < raw.size()) {
    std::size_t skip = 0;
    const auto n = utf8_sequence(raw, i, skip);
    if (n != 0) {
      if (!clean) {
        fixed.append(reinterpret_cast<const char*>(raw.data() + i), n);
      }
      i += n;
      continue;
    }
    if (options_.on_string_error == string_errors::strict) {
      failure_.bad_bytes.assign(raw.begin() + static_cast<std::ptrdiff_t>(i),
                                raw.begin() + static_cast<std::ptrdiff_t>(i + skip));
      return fail(make_error_code(errc::string_encoding),
                  "invalid utf-8 at byte " + std::to_string(i) + " of text string");
    }
    if (clean) {
      fixed.assign(reinterpret_cast<const char*>(raw.data()), i);
      clean = false;
    }
    if (options_.on_string_error == string_errors::replace) {
      fixed.append(kReplacementChar);
    }
    i += skip;
  }
  if (clean) {
    out.append(reinterpret_cast<const char*>(raw.data()), raw.size());
  } else {
    out.append(fixed);
  }
  return {};
}

std::error_code Decoder::decode_text_string(const Header& h, Value& out) noexcept {
  std::string text;
  std::vector<byte> raw;
  if (h.kind == header_kind::definite) {
    if (auto ec = read_payload(h.argument, raw)) {
      return ec;
    }
    if (auto ec = check_text(raw, text)) {
      return ec;
    }
    out = Value::text(std::move(text));
    return {};
  }

  // 每个分块必须各自是合法 UTF-8。
  for (;;) {
    Header chunk;
    if (auto ec = read_header(chunk)) {
      return ec;
    }
    if (chunk.kind == header_kind::break_code) {
      break;
    }
    if (chunk.major != major_type::text_string || chunk.kind != header_kind::definite) {
      return fail(make_error_code(errc::bad_initial_byte), "indefinite text string contains a non-text-string chunk");
    }
    raw.clear();
    if (auto ec = read_payload(chunk.argument, raw)) {
      return ec;
    }
    if (auto ec = check_text(raw, text)) {
      return ec;
    }
  }
  out = Value::text(std::move(text));
  return {};
}

std::error_code Decoder::decode_array(const Header& h, Value& out) noexcept {
  List items;
  if (h.kind == header_kind::definite) {
    items.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(h.argument, kMaxReserve)));
    for (std::uint64_t i = 0; i < h.argument; ++i) {
      Value item;
      if (auto ec = decode_item(item)) {
        return ec;
      }
      items.push_back(std::move(item));
    }
  } else {
    for (;;) {
      Header ih;
      if (auto ec = read_header(ih)) {
        return ec;
      }
      if (ih.kind == header_kind::break_code) {
        break;
      }
      Value item;
      if (auto ec = decode_from_header(ih, item)) {
        return ec;
      }
      items.push_back(std::move(item));
    }
  }
  out = Value::list(std::move(items));
  return {};
}

std::error_code Decoder::check_duplicates(const MapItems& items) noexcept {
  if (items.size() < 2) {
    return {};
  }
  std::unordered_map<Value, std::size_t, ValueHash> seen;
  seen.reserve(items.size());
  std::vector<Value> duplicates;
  for (const auto& [key, value] : items) {
    auto [it, inserted] = seen.try_emplace(key, 1);
    if (!inserted) {
      // 同一个键出现多次只报告一次。
      if (it->second++ == 1) {
        duplicates.push_back(key);
      }
    }
  }
  if (duplicates.empty()) {
    return {};
  }
  failure_.duplicate_keys = duplicates;
  return fail(make_error_code(errc::duplicate_key), std::to_string(duplicates.size()) + " duplicate keys");
}

std::error_code Decoder::decode_map(const Header& h, Value& out) noexcept {
  MapItems items;
  const auto read_entry = [this, &items](const Header* key_header) -> std::error_code {
    Value key;
    {
      ImmutableScope scope(immutable_);
      auto ec = key_header ? decode_from_header(*key_header, key) : decode_item(key);
      if (ec) {
        return ec;
      }
    }
    Value value;
    if (auto ec = decode_item(value)) {
      return ec;
    }
    items.emplace_back(std::move(key), std::move(value));
    return {};
  };

  if (h.kind == header_kind::definite) {
    items.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(h.argument, kMaxReserve)));
    for (std::uint64_t i = 0; i < h.argument; ++i) {
      if (auto ec = read_entry(nullptr)) {
        return ec;
      }
    }
  } else {
    for (;;) {
      Header kh;
      if (auto ec = read_header(kh)) {
        return ec;
      }
      if (kh.kind == header_kind::break_code) {
        break;
      }
      if (auto ec = read_entry(&kh)) {
        return ec;
      }
    }
  }
  if (auto ec = check_duplicates(items)) {
    return ec;
  }
  out = Value::map(std::move(items));
  return {};
}

std::error_code Decoder::decode_tag(const Header& h, Value& out) noexcept {
  const auto number = h.argument;
  const TagHandler* handler = nullptr;
  if (options_.tags) {
    if (auto it = options_.tags->find(number); it != options_.tags->end()) {
      handler = &it->second;
    }
  }
  if (!handler) {
    const auto& defaults = default_tag_table();
    if (auto it = defaults.find(number); it != defaults.end()) {
      handler = &it->second;
    }
  }

  if (handler && *handler) {
    Value result;
    if (auto ec = (*handler)(*this, number, result)) {
      return fail(ec, "tag " + std::to_string(number) + ": " + ec.message());
    }
    out = std::move(result);
    return {};
  }

  Value payload;
  if (auto ec = decode_item(payload)) {
    return ec;
  }
  out = Value::tag(number, std::move(payload));
  return {};
}

std::error_code Decoder::decode_simple(const Header& h, Value& out) noexcept {
  const auto& policy = options_.policy;
  const auto make_simple = [this, &out](std::uint8_t v) -> std::error_code {
    if (options_.simple_factory) {
      Value produced;
      if (auto ec = options_.simple_factory(v, produced)) {
        return fail(ec);
      }
      out = std::move(produced);
      return {};
    }
    out = Value::simple(v);
    return {};
  };

  switch (h.additional) {
    case 20:
      out = Value::boolean(false);
      return {};
    case 21:
      out = Value::boolean(true);
      return {};
    case 22:
      out = Value::null();
      return {};
    case 23:
      out = Value::undefined();
      return {};
    case kAdditionalOneByte:
      if (h.argument < 32) {
        return fail(make_error_code(errc::bad_simple),
                    "simple value " + std::to_string(h.argument) + " encoded with an extra byte");
      }
      return make_simple(static_cast<std::uint8_t>(h.argument));
    case kAdditionalTwoBytes: {
      const auto bits = static_cast<std::uint16_t>(h.argument);
      const double v = half_to_double(bits);
      if (policy.minimal_float && std::isnan(v) && !is_canonical_nan(v, h.additional, bits)) {
        return fail(make_error_code(errc::non_minimal_float), "non-canonical NaN");
      }
      out = Value::floating(v);
      return {};
    }
    case kAdditionalFourBytes: {
      const auto f = std::bit_cast<float>(static_cast<std::uint32_t>(h.argument));
      const double v = static_cast<double>(f);
      if (policy.minimal_float && (std::isnan(v) || double_to_half_exact(v))) {
        return fail(make_error_code(errc::non_minimal_float), "float32 representable in a narrower width");
      }
      out = Value::floating(v);
      return {};
    }
    case kAdditionalEightBytes: {
      const auto v = std::bit_cast<double>(h.argument);
      if (policy.minimal_float && (std::isnan(v) || double_to_half_exact(v) || double_to_float_exact(v))) {
        return fail(make_error_code(errc::non_minimal_float), "float64 representable in a narrower width");
      }
      out = Value::floating(v);
      return {};
    }
    default:
      break;
  }
  // 0..19
  return make_simple(h.additional);
}

std::error_code decode_prefix(
  bytes_view in,
  Document& out,
  std::size_t& consumed,
  const DecodeOptions& options,
  DecodeFailure* failure) noexcept {
  SpanSource source(in);
  Decoder decoder(source, options);
  Document doc;
  auto ec = decoder.decode_document(doc);
  if (failure) {
    *failure = decoder.failure();
  }
  if (ec) {
    return ec;
  }
  consumed = source.offset();
  out = std::move(doc);
  return {};
}

std::error_code decode_one(
  bytes_view in,
  Document& out,
  const DecodeOptions& options,
  DecodeFailure* failure) noexcept {
  SpanSource source(in);
  Decoder decoder(source, options);
  Document doc;
  auto ec = decoder.decode_document(doc);
  if (!ec && options.check_eof && !source.at_end()) {
    ec = decoder.fail(make_error_code(errc::unconsumed_data),
                      std::to_string(source.remaining()) + " bytes of unconsumed data");
  }
  if (failure) {
    *failure = decoder.failure();
  }
  if (ec) {
    return ec;
  }
  out = std::move(doc);
  return {};
}

std::error_code decode_one(
  std::istream& in,
  Document& out,
  const DecodeOptions& options,
  DecodeFailure* failure) noexcept {
  IstreamSource source(in);
  Decoder decoder(source, options);
  Document doc;
  auto ec = decoder.decode_document(doc);
  if (!ec && options.check_eof && !source.at_end()) {
    ec = decoder.fail(make_error_code(errc::unconsumed_data));
  }
  if (failure) {
    *failure = decoder.failure();
  }
  if (ec) {
    return ec;
  }
  out = std::move(doc);
  return {};
}

SequenceDecoder::SequenceDecoder(ByteSource& source, DecodeOptions options)
    : source_(source), options_(std::move(options)), decoder_(source_, options_) {}

std::error_code SequenceDecoder::next(std::optional<Document>& out) noexcept {
  if (source_.at_end()) {
    out.reset();
    return {};
  }
  decoder_.reset_failure();
  Document doc;
  if (auto ec = decoder_.decode_document(doc)) {
    return ec;
  }
  ++count_;
  out = std::move(doc);
  return {};
}

}  // namespace cborkit::cbor
