#include "cborkit/cbor/decoder.hpp"
#include "cborkit/cbor/encoder.hpp"
#include "cborkit/cbor/errors.hpp"
#include "cborkit/utils/hex.hpp"

#include "test_main.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace cborkit::cbor;
using namespace std::chrono;
using cborkit::utils::to_hex;

std::string encode_hex(const Value& v, const EncodeOptions& opts = {}) {
  std::vector<byte> out;
  TEST_EXPECT_OK(encode_one(v, out, opts));
  return to_hex(out);
}

std::error_code encode_err(const Value& v, const EncodeOptions& opts = {}) {
  std::vector<byte> out;
  return encode_one(v, out, opts);
}

const Microseconds kRfcInstant = Microseconds{sys_days{year{2013} / 3 / 21}} + hours{20} + minutes{4};

void test_integers() {
  TEST_EXPECT_EQ(encode_hex(Value::integer(0)), "00");
  TEST_EXPECT_EQ(encode_hex(Value::integer(23)), "17");
  TEST_EXPECT_EQ(encode_hex(Value::integer(24)), "1818");
  TEST_EXPECT_EQ(encode_hex(Value::integer(1000000)), "1a000f4240");
  TEST_EXPECT_EQ(encode_hex(Value::integer(-1)), "20");
  TEST_EXPECT_EQ(encode_hex(Value::integer(-1000)), "3903e7");
  TEST_EXPECT_EQ(encode_hex(Value::integer(BigInt{"18446744073709551615"})), "1bffffffffffffffff");
  TEST_EXPECT_EQ(encode_hex(Value::integer(BigInt{"-18446744073709551616"})), "3bffffffffffffffff");

  // 超出 64 位退回 bignum
  TEST_EXPECT_EQ(encode_hex(Value::integer(BigInt{"18446744073709551616"})), "c249010000000000000000");
  TEST_EXPECT_EQ(encode_hex(Value::integer(BigInt{"-18446744073709551617"})), "c349010000000000000000");
  TEST_EXPECT_EQ(encode_hex(Value::bignum(BigInt{1})), "c24101");
  TEST_EXPECT_EQ(encode_hex(Value::bignum(BigInt{0})), "c240");
}

void test_floats() {
  TEST_EXPECT_EQ(encode_hex(Value::floating(1.0)), "f93c00");
  TEST_EXPECT_EQ(encode_hex(Value::floating(-0.0)), "f98000");
  TEST_EXPECT_EQ(encode_hex(Value::floating(100000.0)), "fa47c35000");
  TEST_EXPECT_EQ(encode_hex(Value::floating(1.1)), "fb3ff199999999999a");
  TEST_EXPECT_EQ(encode_hex(Value::floating(std::numeric_limits<double>::infinity())), "f97c00");
  TEST_EXPECT_EQ(encode_hex(Value::floating(std::nan(""))), "f97e00");
  TEST_EXPECT_EQ(encode_hex(Value::floating(5.960464477539063e-8)), "f90001");

  EncodeOptions wide;
  wide.floats = float_style::always_double;
  TEST_EXPECT_EQ(encode_hex(Value::floating(1.0), wide), "fb3ff0000000000000");
  TEST_EXPECT_EQ(encode_hex(Value::floating(std::nan("")), wide), "fb7ff8000000000000");
}

void test_simple_values() {
  TEST_EXPECT_EQ(encode_hex(Value::boolean(false)), "f4");
  TEST_EXPECT_EQ(encode_hex(Value::boolean(true)), "f5");
  TEST_EXPECT_EQ(encode_hex(Value::null()), "f6");
  TEST_EXPECT_EQ(encode_hex(Value::undefined()), "f7");
  TEST_EXPECT_EQ(encode_hex(Value::simple(16)), "f0");
  TEST_EXPECT_EQ(encode_hex(Value::simple(255)), "f8ff");
  TEST_EXPECT_CODE(encode_err(Value::simple(24)), errc::unsupported_value);
  TEST_EXPECT_CODE(encode_err(Value::simple(31)), errc::unsupported_value);
}

void test_strings_and_containers() {
  TEST_EXPECT_EQ(encode_hex(Value::text("IETF")), "6449455446");
  TEST_EXPECT_EQ(encode_hex(Value::text("")), "60");
  TEST_EXPECT_EQ(encode_hex(Value::bytes({1, 2, 3, 4})), "4401020304");
  TEST_EXPECT_EQ(encode_hex(Value::list({Value::integer(1), Value::list({Value::integer(2), Value::integer(3)})})),
                 "8201820203");
  TEST_EXPECT_EQ(encode_hex(Value::map({{Value::integer(1), Value::integer(2)}, {Value::integer(3), Value::integer(4)}})),
                 "a201020304");
  TEST_EXPECT_EQ(encode_hex(Value::tag(6, Value::integer(1))), "c601");
}

void test_map_key_sorting() {
  const auto map = Value::map({{Value::integer(-1), Value::integer(1)}, {Value::integer(100), Value::integer(2)}});
  TEST_EXPECT_EQ(encode_hex(map), "a220011864" "02");

  EncodeOptions lex;
  lex.sort = sort_method::lexicographic;
  TEST_EXPECT_EQ(encode_hex(map, lex), "a218640220" "01");

  EncodeOptions len;
  len.sort = sort_method::length_first;
  TEST_EXPECT_EQ(encode_hex(map, len), "a220011864" "02");

  const auto text_keys = Value::map({
    {Value::text("aa"), Value::integer(1)},
    {Value::text("b"), Value::integer(2)},
    {Value::integer(10), Value::integer(3)},
  });
  TEST_EXPECT_EQ(encode_hex(text_keys, lex), "a30a03616202626161" "01");

  // tag 272 的映射保持插入顺序
  const auto ordered = Value::ordered_map({{Value::integer(2), Value::integer(1)}, {Value::integer(1), Value::integer(2)}});
  TEST_EXPECT_EQ(encode_hex(ordered, lex), "d90110a202010102");

  // 集合成员同样按编码排序
  TEST_EXPECT_EQ(encode_hex(Value{Set{{Value::integer(2), Value::integer(1)}}}, lex), "d9010282" "0102");
}

void test_deterministic_options() {
  EncodeOptions bad;
  bad.deterministic = true;
  TEST_EXPECT_CODE(validate(bad), errc::invalid_options);
  TEST_EXPECT_CODE(encode_err(Value::integer(1), bad), errc::invalid_options);

  EncodeOptions det;
  det.deterministic = true;
  det.sort = sort_method::length_first;
  det.floats = float_style::always_double;
  TEST_EXPECT_OK(validate(det));
  const auto eff = effective_options(det);
  TEST_EXPECT(eff.realize_indefinite_length);
  TEST_EXPECT(eff.floats == float_style::shortest);
  TEST_EXPECT_EQ(encode_hex(Value{IndefiniteList{{Value::integer(1), Value::floating(1.0)}}}, det), "8201f93c00");

  const auto from_policy = encode_options_for(DeterministicPolicy::strict());
  TEST_EXPECT(from_policy.deterministic);
  TEST_EXPECT(from_policy.sort == sort_method::length_first);
  TEST_EXPECT_OK(validate(from_policy));
  TEST_EXPECT(encode_options_for(DeterministicPolicy::none()).sort == sort_method::unsorted);
}

void test_indefinite_forms() {
  const Value chunks{IndefiniteBytes{{{0x01}, {0x02, 0x03}}}};
  TEST_EXPECT_EQ(encode_hex(chunks), "5f4101420203ff");
  const Value text{IndefiniteText{{"ab", "c"}}};
  TEST_EXPECT_EQ(encode_hex(text), "7f626162" "6163ff");
  TEST_EXPECT_EQ(encode_hex(Value{IndefiniteList{{Value::integer(1), Value::integer(2)}}}), "9f0102ff");
  TEST_EXPECT_EQ(encode_hex(Value{IndefiniteMap{{{Value::integer(1), Value::integer(2)}}}}), "bf0102ff");

  EncodeOptions realize;
  realize.realize_indefinite_length = true;
  TEST_EXPECT_EQ(encode_hex(chunks, realize), "43010203");
  TEST_EXPECT_EQ(encode_hex(text, realize), "63616263");
  TEST_EXPECT_EQ(encode_hex(Value{IndefiniteList{{Value::integer(1)}}}, realize), "8101");
}

void test_datetimes() {
  const Value utc{DateTime{kRfcInstant, minutes{0}}};
  TEST_EXPECT_EQ(encode_hex(utc), "c074323031332d30332d32315432303a30343a30305a");

  EncodeOptions epoch;
  epoch.datetimes = datetime_style::epoch;
  TEST_EXPECT_EQ(encode_hex(utc, epoch), "c11a514b67b0");
  const Value half_second{DateTime{kRfcInstant + milliseconds{500}, minutes{0}}};
  TEST_EXPECT_EQ(encode_hex(half_second, epoch), "c1fb41d452d9ec200000");

  // 同一时刻，+01:30 的挂钟时间
  const Value shifted{DateTime{kRfcInstant + minutes{90}, minutes{90}}};
  std::vector<byte> out;
  EncodeOptions offset;
  offset.datetimes = datetime_style::iso_offset;
  TEST_EXPECT_OK(encode_one(shifted, out, offset));
  Document doc;
  TEST_EXPECT_OK(decode_one(out, doc));
  TEST_EXPECT_EQ(doc.root, shifted);
  TEST_EXPECT_EQ(encode_hex(shifted), encode_hex(utc));

  const Value naive{DateTime{kRfcInstant, std::nullopt}};
  TEST_EXPECT_CODE(encode_err(naive), errc::missing_timezone);
  EncodeOptions tz;
  tz.default_timezone = minutes{0};
  TEST_EXPECT_EQ(encode_hex(naive, tz), encode_hex(utc));

  TEST_EXPECT_EQ(encode_hex(Value{Date{sys_days{year{2013} / 3 / 21}}}), "c06a323031332d30332d3231");
}

void test_semantic_types() {
  TEST_EXPECT_EQ(encode_hex(Value{Decimal{BigInt{27315}, -2}}), "c48221196ab3");
  TEST_EXPECT_EQ(encode_hex(Value{BigFloat{BigInt{3}, -1}}), "c5822003");
  TEST_EXPECT_EQ(encode_hex(Value{Rational{BigInt{1}, BigInt{2}}}), "d81e820102");
  TEST_EXPECT_CODE(encode_err(Value{Rational{BigInt{1}, BigInt{0}}}), errc::unsupported_value);
  TEST_EXPECT_EQ(encode_hex(Value{Regex{"\\d+"}}), "d823635c642b");

  Uuid uuid;
  for (std::size_t i = 0; i < uuid.bytes.size(); ++i) {
    uuid.bytes[i] = static_cast<byte>(i);
  }
  TEST_EXPECT_EQ(encode_hex(Value{uuid}), "d82550000102030405060708090a0b0c0d0e0f");

  TEST_EXPECT_EQ(encode_hex(Value{IpAddress{{0xc0, 0xa8, 0x00, 0x01}}}), "d9010444c0a80001");
  TEST_EXPECT_EQ(encode_hex(Value{IpNetwork{{0xc0, 0xa8, 0x00, 0x00}, 24}}), "d90105a144c0a800001818");
  TEST_EXPECT_CODE(encode_err(Value{IpAddress{{0x01, 0x02, 0x03}}}), errc::unsupported_value);
  TEST_EXPECT_CODE(encode_err(Value{IpNetwork{{0xc0, 0xa8, 0x00, 0x00}, 33}}), errc::unsupported_value);
}

void test_typed_arrays() {
  TEST_EXPECT_EQ(encode_hex(Value{TypedArray{65, std::vector<std::uint16_t>{0x0102, 0x0304}}}), "d8414401020304");
  TEST_EXPECT_EQ(encode_hex(Value{TypedArray{69, std::vector<std::uint16_t>{0x0102}}}), "d845420201");
  TEST_EXPECT_EQ(encode_hex(Value{TypedArray{80, std::vector<float>{1.0f, -4.0f}}}), "d850443c00c400");
  TEST_EXPECT_CODE(encode_err(Value{TypedArray{80, std::vector<float>{0.1f}}}), errc::unsupported_value);
  TEST_EXPECT_CODE(encode_err(Value{TypedArray{65, std::vector<std::uint32_t>{1}}}), errc::unsupported_value);
  TEST_EXPECT_CODE(encode_err(Value{TypedArray{83, std::vector<double>{1.0}}}), errc::unsupported_value);
}

// 自定义类型：以 tag 4001 + [x, y] 写出自身。
class Point final : public ToWireFormat {
 public:
  Point(std::int64_t x, std::int64_t y) : x_(x), y_(y) {}

  std::error_code to_wire(Encoder& encoder) const override {
    encoder.write_tag(4001);
    encoder.write_header(major_type::array, 2);
    if (auto ec = encoder.encode(Value::integer(x_))) {
      return ec;
    }
    return encoder.encode(Value::integer(y_));
  }

 private:
  std::int64_t x_;
  std::int64_t y_;
};

void test_extension() {
  const Value point{Extension{std::make_shared<Point>(1, -2)}};
  TEST_EXPECT_EQ(encode_hex(Value::list({point})), "81d90fa1820121");
  TEST_EXPECT_CODE(encode_err(Value{Extension{}}), errc::unsupported_value);
}

void test_failure_leaves_output_untouched() {
  std::vector<byte> out{0xaa};
  TEST_EXPECT_CODE(encode_one(Value::list({Value::integer(1), Value::simple(24)}), out), errc::unsupported_value);
  TEST_EXPECT_EQ(out.size(), 1u);

  // 裸 SharedRef 没有可解析的槽位
  TEST_EXPECT_CODE(encode_one(Value::shared(0), out), errc::unsupported_value);
}

}  // namespace

int main() {
  test_integers();
  test_floats();
  test_simple_values();
  test_strings_and_containers();
  test_map_key_sorting();
  test_deterministic_options();
  test_indefinite_forms();
  test_datetimes();
  test_semantic_types();
  test_typed_arrays();
  test_extension();
  test_failure_leaves_output_untouched();
  return ::cborkit::tests::run_and_report();
}
