#include "cborkit/core/buffer.hpp"
#include "cborkit/core/error.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>

namespace {

using cborkit::core::ByteBuffer;
using cborkit::core::byte;
using cborkit::core::bytes_view;
using cborkit::core::errc;
using cborkit::core::make_error_code;
using cborkit::core::mutable_bytes_view;

bytes_view as_bytes(std::string_view s) {
  return bytes_view{reinterpret_cast<const byte*>(s.data()), s.size()};
}

std::string_view as_text(bytes_view b) {
  return std::string_view(reinterpret_cast<const char*>(b.data()), b.size());
}

void test_append_consume_basic() {
  ByteBuffer buf(16);
  TEST_EXPECT(buf.empty());
  TEST_EXPECT_EQ(buf.size(), 0u);

  TEST_EXPECT_OK(buf.append(as_bytes("hello")));
  TEST_EXPECT_EQ(buf.size(), 5u);
  TEST_EXPECT_EQ(as_text(buf.readable_bytes()), "hello");

  TEST_EXPECT_OK(buf.consume(2));
  TEST_EXPECT_EQ(as_text(buf.readable_bytes()), "llo");

  TEST_EXPECT_OK(buf.consume(3));
  TEST_EXPECT(buf.empty());
}

void test_prepare_commit() {
  ByteBuffer buf(8);
  mutable_bytes_view w;
  TEST_EXPECT_OK(buf.prepare(4, w));
  TEST_EXPECT(w.size() >= 4u);
  std::memcpy(w.data(), "a201", 4);
  TEST_EXPECT_OK(buf.commit(4));
  TEST_EXPECT_EQ(as_text(buf.readable_bytes()), "a201");

  // commit 超过可写空间
  TEST_EXPECT_EQ(buf.commit(1024), make_error_code(errc::invalid_argument));
}

void test_prepare_compacts_before_growing() {
  ByteBuffer buf(8);
  TEST_EXPECT_OK(buf.append(as_bytes("abcdef")));
  TEST_EXPECT_OK(buf.consume(4));  // 剩下 "ef"

  mutable_bytes_view w;
  TEST_EXPECT_OK(buf.prepare(6, w));
  TEST_EXPECT_EQ(buf.capacity(), 8u);
  TEST_EXPECT_EQ(as_text(buf.readable_bytes()), "ef");
}

void test_grow_preserve_data() {
  ByteBuffer buf(8);
  TEST_EXPECT_OK(buf.append(as_bytes("12345678")));
  TEST_EXPECT_OK(buf.append(as_bytes("9")));

  TEST_EXPECT_EQ(as_text(buf.readable_bytes()), "123456789");
  TEST_EXPECT(buf.capacity() >= 9u);
}

void test_bounds() {
  ByteBuffer buf(4);
  TEST_EXPECT_OK(buf.append(as_bytes("abcd")));
  TEST_EXPECT_EQ(buf.consume(5), make_error_code(errc::invalid_argument));
  TEST_EXPECT_OK(buf.consume(0));
  TEST_EXPECT_OK(buf.append(bytes_view{}));
}

void test_max_capacity_rejects() {
  ByteBuffer buf(4, 8);
  TEST_EXPECT_OK(buf.append(as_bytes("1234")));
  TEST_EXPECT_EQ(buf.append(as_bytes("56789")), make_error_code(errc::buffer_overflow));
  TEST_EXPECT_EQ(as_text(buf.readable_bytes()), "1234");

  mutable_bytes_view w;
  TEST_EXPECT_EQ(buf.prepare(std::numeric_limits<std::size_t>::max(), w), make_error_code(errc::buffer_overflow));

  ByteBuffer none(16, 0);
  TEST_EXPECT_EQ(none.capacity(), 0u);
  TEST_EXPECT_EQ(none.append(as_bytes("a")), make_error_code(errc::buffer_overflow));
}

void test_move_semantics() {
  ByteBuffer buf(8);
  TEST_EXPECT_OK(buf.append(as_bytes("move")));

  ByteBuffer moved(std::move(buf));
  TEST_EXPECT_EQ(as_text(moved.readable_bytes()), "move");

  ByteBuffer assigned(1);
  assigned = std::move(moved);
  TEST_EXPECT_EQ(as_text(assigned.readable_bytes()), "move");
}

}  // namespace

int main() {
  test_append_consume_basic();
  test_prepare_commit();
  test_prepare_compacts_before_growing();
  test_grow_preserve_data();
  test_bounds();
  test_max_capacity_rejects();
  test_move_semantics();
  return ::cborkit::tests::run_and_report();
}
