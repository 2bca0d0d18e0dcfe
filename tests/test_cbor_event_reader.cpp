#include "cborkit/cbor/errors.hpp"
#include "cborkit/cbor/event_reader.hpp"
#include "cborkit/utils/hex.hpp"

#include "test_main.hpp"

#include <string_view>
#include <vector>

namespace {

using namespace cborkit::cbor;

std::vector<byte> hex(std::string_view text) {
  std::vector<byte> out;
  TEST_EXPECT_OK(cborkit::utils::parse_hex(text, out));
  return out;
}

std::error_code read_all(std::string_view text, std::vector<Event>& events, const DecodeOptions& opts = {}) {
  const auto raw = hex(text);
  SpanSource source(raw);
  EventReader reader(source, opts);
  events.clear();
  for (;;) {
    Event ev;
    if (auto ec = reader.next(ev)) {
      return ec;
    }
    events.push_back(ev);
    if (ev.type == event_type::end) {
      return {};
    }
  }
}

void test_event_sequence() {
  std::vector<Event> events;
  TEST_EXPECT_OK(read_all("9f01a16161f6ff", events));
  TEST_EXPECT_EQ(events.size(), 7u);
  if (events.size() != 7u) {
    return;
  }
  TEST_EXPECT(events[0].type == event_type::enter_list && !events[0].length);
  TEST_EXPECT(events[1].type == event_type::scalar && events[1].value == Value::integer(1));
  TEST_EXPECT(events[2].type == event_type::enter_map && events[2].length == 1u);
  TEST_EXPECT(events[3].type == event_type::scalar && events[3].value == Value::text("a"));
  TEST_EXPECT(events[4].type == event_type::scalar && events[4].value == Value::null());
  TEST_EXPECT(events[5].type == event_type::break_code);
  TEST_EXPECT(events[6].type == event_type::end);
}

void test_tags_and_chunks() {
  std::vector<Event> events;
  TEST_EXPECT_OK(read_all("c11a514b67b0", events));
  TEST_EXPECT_EQ(events.size(), 3u);
  if (events.size() == 3u) {
    TEST_EXPECT(events[0].type == event_type::enter_tag && events[0].tag == 1u);
    // tag 语义不解释，载荷原样给出
    TEST_EXPECT(events[1].value == Value::integer(1363896240));
  }

  TEST_EXPECT_OK(read_all("5f41014102ff", events));
  TEST_EXPECT_EQ(events.size(), 5u);
  if (events.size() == 5u) {
    TEST_EXPECT(events[0].type == event_type::enter_bytes);
    TEST_EXPECT(events[1].value == Value::bytes({0x01}));
    TEST_EXPECT(events[3].type == event_type::break_code);
  }
}

void test_sequence_of_items() {
  std::vector<Event> events;
  TEST_EXPECT_OK(read_all("01820203f5", events));
  TEST_EXPECT_EQ(events.size(), 6u);
  if (events.size() == 6u) {
    TEST_EXPECT(events[1].type == event_type::enter_list && events[1].length == 2u);
    TEST_EXPECT(events[4].value == Value::boolean(true));
  }
}

void test_well_formedness_errors() {
  std::vector<Event> events;
  TEST_EXPECT_CODE(read_all("ff", events), errc::misplaced_break);
  TEST_EXPECT_CODE(read_all("8201ff", events), errc::misplaced_break);
  TEST_EXPECT_CODE(read_all("bf01ff", events), errc::misplaced_break);
  TEST_EXPECT_CODE(read_all("c6ff", events), errc::misplaced_break);
  TEST_EXPECT_CODE(read_all("5f6161ff", events), errc::bad_initial_byte);
  TEST_EXPECT_CODE(read_all("7f7fffff", events), errc::bad_initial_byte);
  TEST_EXPECT_CODE(read_all("8201", events), errc::unexpected_eof);
  TEST_EXPECT_CODE(read_all("62c328", events), errc::string_encoding);

  DecodeOptions strict;
  strict.policy = DeterministicPolicy::strict();
  TEST_EXPECT_CODE(read_all("9fff", events, strict), errc::indefinite_length);

  DecodeOptions shallow;
  shallow.max_depth = 2;
  TEST_EXPECT_OK(read_all("818100", events, shallow));
  TEST_EXPECT_CODE(read_all("81818100", events, shallow), errc::nesting_too_deep);
}

void test_duplicate_keys_not_checked() {
  std::vector<Event> events;
  TEST_EXPECT_OK(read_all("a201020103", events));
}

}  // namespace

int main() {
  test_event_sequence();
  test_tags_and_chunks();
  test_sequence_of_items();
  test_well_formedness_errors();
  test_duplicate_keys_not_checked();
  return ::cborkit::tests::run_and_report();
}
