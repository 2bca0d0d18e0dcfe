#include "cborkit/cbor/errors.hpp"
#include "cborkit/cbor/header.hpp"
#include "cborkit/cbor/source.hpp"
#include "cborkit/utils/hex.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <limits>
#include <string_view>
#include <vector>

namespace {

using namespace cborkit::cbor;

std::vector<byte> hex(std::string_view text) {
  std::vector<byte> out;
  TEST_EXPECT_OK(cborkit::utils::parse_hex(text, out));
  return out;
}

std::error_code read_one(std::string_view text, Header& h, bool minimal = false) {
  const auto raw = hex(text);
  SpanSource source(raw);
  return decode_header(source, h, minimal);
}

void test_append_header_minimal_widths() {
  struct Case {
    std::uint64_t value;
    std::string_view expected;
  };
  const Case cases[] = {
    {0, "00"},
    {23, "17"},
    {24, "1818"},
    {255, "18ff"},
    {256, "190100"},
    {65535, "19ffff"},
    {65536, "1a00010000"},
    {1000000, "1a000f4240"},
    {4294967296ULL, "1b0000000100000000"},
    {std::numeric_limits<std::uint64_t>::max(), "1bffffffffffffffff"},
  };
  for (const auto& c : cases) {
    std::vector<byte> out;
    append_header(out, major_type::unsigned_integer, c.value);
    TEST_EXPECT_EQ(cborkit::utils::to_hex(out), c.expected);
  }

  std::vector<byte> neg;
  append_header(neg, major_type::negative_integer, 99);
  TEST_EXPECT_EQ(cborkit::utils::to_hex(neg), "3863");
}

void test_append_header_bigint_overflow() {
  std::vector<byte> out;
  TEST_EXPECT_OK(append_header(out, major_type::unsigned_integer, BigInt{"18446744073709551615"}));
  TEST_EXPECT_EQ(out.size(), 9u);

  std::vector<byte> big;
  TEST_EXPECT_CODE(append_header(big, major_type::unsigned_integer, BigInt{"18446744073709551616"}),
                   errc::overflow);
  TEST_EXPECT(big.empty());
}

void test_decode_header_widths() {
  Header h;
  TEST_EXPECT_OK(read_one("1a000f4240", h));
  TEST_EXPECT(h.major == major_type::unsigned_integer);
  TEST_EXPECT(h.kind == header_kind::definite);
  TEST_EXPECT_EQ(h.width, 4u);
  TEST_EXPECT_EQ(h.argument, 1000000u);

  TEST_EXPECT_OK(read_one("9f", h));
  TEST_EXPECT(h.major == major_type::array);
  TEST_EXPECT(h.kind == header_kind::indefinite);

  TEST_EXPECT_OK(read_one("ff", h));
  TEST_EXPECT(h.kind == header_kind::break_code);

  TEST_EXPECT_OK(read_one("f97e00", h));
  TEST_EXPECT(h.major == major_type::simple);
  TEST_EXPECT_EQ(h.additional, kAdditionalTwoBytes);
  TEST_EXPECT_EQ(h.argument, 0x7e00u);
}

void test_decode_header_errors() {
  Header h;
  TEST_EXPECT_CODE(read_one("1c", h), errc::reserved_initial_byte);
  TEST_EXPECT_CODE(read_one("5e", h), errc::reserved_initial_byte);
  TEST_EXPECT_CODE(read_one("1f", h), errc::bad_initial_byte);
  TEST_EXPECT_CODE(read_one("3f", h), errc::bad_initial_byte);
  TEST_EXPECT_CODE(read_one("df", h), errc::bad_initial_byte);
  TEST_EXPECT_CODE(read_one("18", h), errc::unexpected_eof);
  TEST_EXPECT_CODE(read_one("1a0001", h), errc::unexpected_eof);
}

void test_decode_header_minimal() {
  Header h;
  TEST_EXPECT_OK(read_one("1817", h));
  TEST_EXPECT_CODE(read_one("1817", h, true), errc::non_minimal_length);
  TEST_EXPECT_CODE(read_one("190010", h, true), errc::non_minimal_length);
  TEST_EXPECT_OK(read_one("1818", h, true));
  // major 7 的宽度代表浮点精度，不参与最短长度检查
  TEST_EXPECT_OK(read_one("fa47c35000", h, true));
}

void test_shortfall_reports_requested_and_available() {
  const auto raw = hex("1b0000");
  SpanSource source(raw);
  Header h;
  TEST_EXPECT_CODE(decode_header(source, h, false), errc::unexpected_eof);
  TEST_EXPECT_EQ(source.shortfall().requested, 8u);
  TEST_EXPECT_EQ(source.shortfall().available, 2u);
}

}  // namespace

int main() {
  test_append_header_minimal_widths();
  test_append_header_bigint_overflow();
  test_decode_header_widths();
  test_decode_header_errors();
  test_decode_header_minimal();
  test_shortfall_reports_requested_and_available();
  return ::cborkit::tests::run_and_report();
}
