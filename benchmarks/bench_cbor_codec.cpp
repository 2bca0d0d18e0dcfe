#include "bench_main.hpp"
#include "cborkit/cbor/decoder.hpp"
#include "cborkit/cbor/encoder.hpp"
#include "cborkit/cbor/event_reader.hpp"

#include <string>
#include <vector>

using namespace cborkit;
using namespace cborkit::cbor;
using benchmarks::measure;
using benchmarks::phase;

static Value create_deep_nested_list(int depth) {
  if (depth <= 0) {
    return Value::integer(42);
  }
  return Value::list({create_deep_nested_list(depth - 1)});
}

// 编码一次 value，并在所有解码类基准之前准备好输入。
static std::vector<byte> encode_fixture(const Value& value, const EncodeOptions& opts = {}) {
  std::vector<byte> out;
  if (auto ec = encode_one(value, out, opts)) {
    std::cerr << "fixture encode failed: " << ec.message() << "\n";
  }
  return out;
}

static void bench_encode_decode(const std::string& label, const Value& value, std::size_t items, int iterations) {
  const auto encoded = encode_fixture(value);

  measure(label, phase::encode, items, iterations, [&](std::size_t& wire) {
    std::vector<byte> out;
    out.reserve(encoded.size());
    auto ec = encode_one(value, out);
    wire = out.size();
    return ec;
  });

  measure(label, phase::decode, items, iterations, [&](std::size_t& wire) {
    Document doc;
    wire = encoded.size();
    return decode_one(encoded, doc);
  });
}

static void bench_codec_deep_nested() {
  constexpr int depth = 200;
  bench_encode_decode("Deep nested list (200 levels)", create_deep_nested_list(depth), depth + 1, 3);
}

static void bench_codec_large_map() {
  constexpr std::size_t entry_count = 10000;

  MapItems items;
  items.reserve(entry_count);
  for (std::size_t i = 0; i < entry_count; ++i) {
    items.emplace_back(Value::text("key-" + std::to_string(i)),
                       Value::list({Value::integer(static_cast<std::int64_t>(i)), Value::floating(i * 0.5)}));
  }
  const Value value = Value::map(std::move(items));
  // 每个条目：键、数组、两个元素
  const std::size_t item_count = 1 + entry_count * 4;

  bench_encode_decode("Large map (10000 entries)", value, item_count, 3);

  EncodeOptions sorted;
  sorted.sort = sort_method::length_first;
  sorted.deterministic = true;
  measure("Large map, deterministic (10000 entries)", phase::encode, item_count, 3, [&](std::size_t& wire) {
    std::vector<byte> out;
    auto ec = encode_one(value, out, sorted);
    wire = out.size();
    return ec;
  });

  const auto encoded = encode_fixture(value);
  measure("Large map (10000 entries)", phase::scan, item_count, 3, [&](std::size_t& wire) {
    SpanSource source(encoded);
    EventReader reader(source);
    Event ev;
    wire = encoded.size();
    for (;;) {
      if (auto ec = reader.next(ev)) {
        return ec;
      }
      if (ev.type == event_type::end) {
        return std::error_code{};
      }
    }
  });
}

static void bench_codec_large_bytes() {
  constexpr std::size_t size = 1024 * 1024;
  bench_encode_decode("Byte string (1MB)", Value::bytes(std::vector<byte>(size, 0xA5)), 1, 10);
}

static void bench_codec_typed_array() {
  constexpr std::size_t count = 100000;

  std::vector<double> samples(count);
  for (std::size_t i = 0; i < count; ++i) {
    samples[i] = static_cast<double>(i) * 0.25;
  }
  bench_encode_decode("float64le typed array (100000 items)", Value{TypedArray{86, std::move(samples)}}, count, 3);
}

int main() {
  bench_codec_deep_nested();
  bench_codec_large_map();
  bench_codec_large_bytes();
  bench_codec_typed_array();

  benchmarks::print_results();
  return benchmarks::exit_code();
}
