#include "cborkit/cbor/datetime.hpp"

#include "cborkit/cbor/errors.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace cborkit::cbor {
namespace {

using namespace std::chrono;

// 与常见日期库一致的范围：0001-01-01 .. 9999-12-31。
constexpr int kMinYear = 1;
constexpr int kMaxYear = 9999;

class TextCursor final {
 public:
  explicit TextCursor(std::string_view text) : text_(text) {}

  [[nodiscard]] bool done() const noexcept { return pos_ >= text_.size(); }
  [[nodiscard]] char peek() const noexcept { return done() ? '\0' : text_[pos_]; }

  bool expect(char c) noexcept {
    if (peek() != c) {
      return false;
    }
    ++pos_;
    return true;
  }

  bool digits(std::size_t count, int& out) noexcept {
    if (text_.size() - pos_ < count) {
      return false;
    }
    int v = 0;
    for (std::size_t i = 0; i < count; ++i) {
      const char c = text_[pos_ + i];
      if (c < '0' || c > '9') {
        return false;
      }
      v = v * 10 + (c - '0');
    }
    pos_ += count;
    out = v;
    return true;
  }

  // 读取一串数字（至少 1 位），返回其文本。
  std::string_view digit_run() noexcept {
    const auto start = pos_;
    while (!done() && text_[pos_] >= '0' && text_[pos_] <= '9') {
      ++pos_;
    }
    return text_.substr(start, pos_ - start);
  }

 private:
  std::string_view text_;
  std::size_t pos_{0};
};

[[nodiscard]] std::error_code bad_payload() noexcept { return make_error_code(errc::bad_tag_payload); }

bool parse_date(TextCursor& cur, sys_days& out) noexcept {
  int y = 0;
  int m = 0;
  int d = 0;
  if (!cur.digits(4, y) || !cur.expect('-') || !cur.digits(2, m) || !cur.expect('-') || !cur.digits(2, d)) {
    return false;
  }
  if (y < kMinYear) {
    return false;
  }
  const year_month_day ymd{year{y}, month{static_cast<unsigned>(m)}, day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) {
    return false;
  }
  out = sys_days{ymd};
  return true;
}

// 小数秒 -> 微秒（第 7 位四舍五入；进位到 1 秒视为非法）。
bool parse_fraction(std::string_view digits, std::int64_t& micros) noexcept {
  if (digits.empty()) {
    return false;
  }
  std::int64_t v = 0;
  for (std::size_t i = 0; i < 6; ++i) {
    v = v * 10 + (i < digits.size() ? digits[i] - '0' : 0);
  }
  if (digits.size() > 6 && digits[6] >= '5') {
    ++v;
  }
  if (v >= 1'000'000) {
    return false;
  }
  micros = v;
  return true;
}

void put2(std::ostringstream& oss, int v) { oss << std::setw(2) << std::setfill('0') << v; }

void put_date(std::ostringstream& oss, sys_days day) {
  const year_month_day ymd{day};
  oss << std::setw(4) << std::setfill('0') << static_cast<int>(ymd.year()) << '-';
  put2(oss, static_cast<int>(static_cast<unsigned>(ymd.month())));
  oss << '-';
  put2(oss, static_cast<int>(static_cast<unsigned>(ymd.day())));
}

[[nodiscard]] bool in_supported_range(Microseconds t) noexcept {
  const auto day = floor<days>(t);
  const year_month_day ymd{day};
  const int y = static_cast<int>(ymd.year());
  return y >= kMinYear && y <= kMaxYear;
}

}  // namespace

std::error_code parse_rfc3339(std::string_view text, Value& out) {
  TextCursor cur(text);
  sys_days day{};
  if (!parse_date(cur, day)) {
    return bad_payload();
  }
  if (cur.done()) {
    out = Value{Date{day}};
    return {};
  }

  int hh = 0;
  int mm = 0;
  int ss = 0;
  if (!cur.expect('T') || !cur.digits(2, hh) || !cur.expect(':') || !cur.digits(2, mm) || !cur.expect(':') ||
      !cur.digits(2, ss)) {
    return bad_payload();
  }
  if (hh > 23 || mm > 59 || ss > 59) {
    return bad_payload();
  }
  std::int64_t micros = 0;
  if (cur.expect('.')) {
    if (!parse_fraction(cur.digit_run(), micros)) {
      return bad_payload();
    }
  }

  minutes offset{0};
  if (cur.expect('Z')) {
    // UTC
  } else {
    const char sign = cur.peek();
    if (sign != '+' && sign != '-') {
      return bad_payload();
    }
    cur.expect(sign);
    int oh = 0;
    int om = 0;
    if (!cur.digits(2, oh) || !cur.expect(':') || !cur.digits(2, om) || oh > 23 || om > 59) {
      return bad_payload();
    }
    offset = hours{oh} + minutes{om};
    if (sign == '-') {
      offset = -offset;
    }
  }
  if (!cur.done()) {
    return bad_payload();
  }

  DateTime dt;
  dt.wall = Microseconds{day} + hours{hh} + minutes{mm} + seconds{ss} + microseconds{micros};
  dt.utc_offset = offset;
  out = Value{dt};
  return {};
}

std::string format_rfc3339(const DateTime& dt, bool utc) {
  const auto offset = dt.utc_offset.value_or(minutes{0});
  const Microseconds t = utc ? dt.instant() : dt.wall;
  const auto day = floor<days>(t);
  const hh_mm_ss<microseconds> tod{t - day};

  std::ostringstream oss;
  put_date(oss, day);
  oss << 'T';
  put2(oss, static_cast<int>(tod.hours().count()));
  oss << ':';
  put2(oss, static_cast<int>(tod.minutes().count()));
  oss << ':';
  put2(oss, static_cast<int>(tod.seconds().count()));
  if (tod.subseconds().count() != 0) {
    oss << '.' << std::setw(6) << std::setfill('0') << tod.subseconds().count();
  }
  if (utc) {
    oss << 'Z';
    return oss.str();
  }
  const auto abs_offset = offset.count() < 0 ? -offset : offset;
  oss << (offset.count() < 0 ? '-' : '+');
  put2(oss, static_cast<int>(abs_offset.count() / 60));
  oss << ':';
  put2(oss, static_cast<int>(abs_offset.count() % 60));
  return oss.str();
}

std::string format_date(const Date& date) {
  std::ostringstream oss;
  put_date(oss, date.day);
  return oss.str();
}

std::error_code datetime_from_epoch(std::int64_t secs, DateTime& out) noexcept {
  // 预先限制量级，避免换算到微秒时溢出。
  constexpr std::int64_t kLimit = 400'000'000'000LL;
  if (secs > kLimit || secs < -kLimit) {
    return bad_payload();
  }
  const Microseconds t{seconds{secs}};
  if (!in_supported_range(t)) {
    return bad_payload();
  }
  out = DateTime{t, minutes{0}};
  return {};
}

std::error_code datetime_from_epoch(double secs, DateTime& out) noexcept {
  if (!std::isfinite(secs) || std::fabs(secs) > 4.0e11) {
    return bad_payload();
  }
  const auto us = static_cast<std::int64_t>(std::llround(secs * 1'000'000.0));
  const Microseconds t{microseconds{us}};
  if (!in_supported_range(t)) {
    return bad_payload();
  }
  out = DateTime{t, minutes{0}};
  return {};
}

}  // namespace cborkit::cbor
