#include "cborkit/cbor/datetime.hpp"
#include "cborkit/cbor/errors.hpp"

#include "test_main.hpp"

#include <chrono>
#include <cstdint>
#include <string_view>

namespace {

using namespace cborkit::cbor;
using namespace std::chrono;

const Microseconds kBase = Microseconds{sys_days{year{2013} / 3 / 21}} + hours{20} + minutes{4};

const DateTime* parse_datetime(std::string_view text, Value& holder) {
  TEST_EXPECT_OK(parse_rfc3339(text, holder));
  return holder.get_if<DateTime>();
}

void test_parse_forms() {
  Value v;
  const auto* z = parse_datetime("2013-03-21T20:04:00Z", v);
  TEST_EXPECT(z != nullptr && z->wall == kBase && z->utc_offset == minutes{0});

  Value w;
  const auto* off = parse_datetime("2013-03-21T21:34:00+01:30", w);
  TEST_EXPECT(off != nullptr && off->utc_offset == minutes{90});
  TEST_EXPECT(off != nullptr && off->instant() == kBase);
  TEST_EXPECT_EQ(v, w);

  Value neg;
  const auto* west = parse_datetime("2013-03-21T15:04:00-05:00", neg);
  TEST_EXPECT(west != nullptr && west->instant() == kBase);

  Value d;
  TEST_EXPECT_OK(parse_rfc3339("2013-03-21", d));
  TEST_EXPECT_EQ(d, (Value{Date{sys_days{year{2013} / 3 / 21}}}));
}

void test_fraction_rounding() {
  Value v;
  const auto* a = parse_datetime("2013-03-21T20:04:00.5Z", v);
  TEST_EXPECT(a != nullptr && a->wall == kBase + milliseconds{500});

  Value b;
  const auto* rounded = parse_datetime("2013-03-21T20:04:00.1234565Z", b);
  TEST_EXPECT(rounded != nullptr && rounded->wall == kBase + microseconds{123457});

  Value c;
  const auto* truncated = parse_datetime("2013-03-21T20:04:00.1234564Z", c);
  TEST_EXPECT(truncated != nullptr && truncated->wall == kBase + microseconds{123456});

  Value bad;
  TEST_EXPECT_CODE(parse_rfc3339("2013-03-21T20:04:00.9999995Z", bad), errc::bad_tag_payload);
  TEST_EXPECT_CODE(parse_rfc3339("2013-03-21T20:04:00.Z", bad), errc::bad_tag_payload);
}

void test_parse_rejects() {
  Value v;
  TEST_EXPECT_CODE(parse_rfc3339("", v), errc::bad_tag_payload);
  TEST_EXPECT_CODE(parse_rfc3339("2013-02-30", v), errc::bad_tag_payload);
  TEST_EXPECT_CODE(parse_rfc3339("0000-01-01", v), errc::bad_tag_payload);
  TEST_EXPECT_CODE(parse_rfc3339("2013-03-21t20:04:00Z", v), errc::bad_tag_payload);
  TEST_EXPECT_CODE(parse_rfc3339("2013-03-21T20:04:00z", v), errc::bad_tag_payload);
  TEST_EXPECT_CODE(parse_rfc3339("2013-03-21T20:04:00", v), errc::bad_tag_payload);
  TEST_EXPECT_CODE(parse_rfc3339("2013-03-21T24:00:00Z", v), errc::bad_tag_payload);
  TEST_EXPECT_CODE(parse_rfc3339("2013-03-21T20:04:00+0100", v), errc::bad_tag_payload);
  TEST_EXPECT_CODE(parse_rfc3339("2013-03-21T20:04:00Zjunk", v), errc::bad_tag_payload);
  TEST_EXPECT_CODE(parse_rfc3339("13-03-21", v), errc::bad_tag_payload);
}

void test_format() {
  const DateTime utc{kBase, minutes{0}};
  TEST_EXPECT_EQ(format_rfc3339(utc, true), "2013-03-21T20:04:00Z");
  TEST_EXPECT_EQ(format_rfc3339(utc, false), "2013-03-21T20:04:00+00:00");

  const DateTime shifted{kBase - hours{5}, minutes{-300}};
  TEST_EXPECT_EQ(format_rfc3339(shifted, false), "2013-03-21T15:04:00-05:00");
  TEST_EXPECT_EQ(format_rfc3339(shifted, true), "2013-03-21T20:04:00Z");

  const DateTime frac{kBase + microseconds{1500}, minutes{0}};
  TEST_EXPECT_EQ(format_rfc3339(frac, true), "2013-03-21T20:04:00.001500Z");

  TEST_EXPECT_EQ(format_date(Date{sys_days{year{1} / 1 / 1}}), "0001-01-01");
}

void test_from_epoch() {
  DateTime dt;
  TEST_EXPECT_OK(datetime_from_epoch(std::int64_t{1363896240}, dt));
  TEST_EXPECT(dt.aware() && dt.instant() == kBase);

  TEST_EXPECT_OK(datetime_from_epoch(1363896240.25, dt));
  TEST_EXPECT(dt.instant() == kBase + milliseconds{250});

  TEST_EXPECT_OK(datetime_from_epoch(std::int64_t{-1}, dt));
  TEST_EXPECT_EQ(format_rfc3339(dt, true), "1969-12-31T23:59:59Z");

  TEST_EXPECT_CODE(datetime_from_epoch(std::int64_t{1} << 62, dt), errc::bad_tag_payload);
  TEST_EXPECT_CODE(datetime_from_epoch(std::int64_t{300000000000}, dt), errc::bad_tag_payload);
  TEST_EXPECT_CODE(datetime_from_epoch(1.0e300, dt), errc::bad_tag_payload);
}

void test_naive_vs_aware() {
  const Value naive{DateTime{kBase, std::nullopt}};
  const Value aware{DateTime{kBase, minutes{0}}};
  TEST_EXPECT(naive != aware);
  TEST_EXPECT_EQ(naive, (Value{DateTime{kBase, std::nullopt}}));
}

}  // namespace

int main() {
  test_parse_forms();
  test_fraction_rounding();
  test_parse_rejects();
  test_format();
  test_from_epoch();
  test_naive_vs_aware();
  return ::cborkit::tests::run_and_report();
}
