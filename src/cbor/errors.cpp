#include "cborkit/cbor/errors.hpp"

#include <regex>
#include <string>

namespace cborkit::cbor {
namespace {

[[nodiscard]] int family_of(int ev) noexcept {
  if (ev >= 1 && ev < 20) {
    return static_cast<int>(condition::ill_formed);
  }
  if (ev >= 20 && ev < 40) {
    return static_cast<int>(condition::invalid);
  }
  if (ev >= 40) {
    return static_cast<int>(condition::encoding);
  }
  return 0;
}

class cbor_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "cborkit.cbor"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::unexpected_eof:
        return "unexpected end of input";
      case errc::bad_initial_byte:
        return "bad initial byte";
      case errc::reserved_initial_byte:
        return "reserved initial byte";
      case errc::misplaced_break:
        return "misplaced break";
      case errc::bad_simple:
        return "simple value encoded with extra byte";
      case errc::unconsumed_data:
        return "unconsumed data after item";
      case errc::string_encoding:
        return "text string is not valid utf-8";
      case errc::duplicate_key:
        return "duplicate map key";
      case errc::non_minimal_length:
        return "integer or length not minimally encoded";
      case errc::non_minimal_float:
        return "float not minimally encoded";
      case errc::indefinite_length:
        return "indefinite-length item not permitted";
      case errc::bad_tag_payload:
        return "invalid tagged item payload";
      case errc::unknown_shared_reference:
        return "non-existent shared reference";
      case errc::bad_shared_reference_type:
        return "shared reference must be an integer";
      case errc::mutable_key:
        return "incomplete shared value used as key";
      case errc::nesting_too_deep:
        return "nesting depth limit exceeded";
      case errc::shared_expansion_limit:
        return "shared value expansion limit exceeded";
      case errc::unsupported_value:
        return "value cannot be encoded";
      case errc::self_referential:
        return "self-referential value without sharing";
      case errc::missing_timezone:
        return "naive datetime without default timezone";
      case errc::overflow:
        return "integer does not fit in 64 bits";
      case errc::invalid_options:
        return "invalid encoder options";
      default:
        return "unknown cborkit.cbor error";
    }
  }

  std::error_condition default_error_condition(int ev) const noexcept override {
    const int family = family_of(ev);
    if (family == 0) {
      return {ev, *this};
    }
    return {family, condition_category()};
  }
};

class cbor_condition_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "cborkit.cbor.condition"; }

  std::string message(int ev) const override {
    switch (static_cast<condition>(ev)) {
      case condition::ill_formed:
        return "ill-formed cbor";
      case condition::invalid:
        return "invalid cbor";
      case condition::encoding:
        return "cbor encoding error";
      default:
        return "unknown cborkit.cbor condition";
    }
  }

  bool equivalent(const std::error_code& code, int cond) const noexcept override {
    return code.category() == cborkit::cbor::error_category() && family_of(code.value()) == cond;
  }
};

class regex_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "std.regex"; }

  std::string message(int ev) const override {
    using namespace std::regex_constants;
    switch (static_cast<error_type>(ev)) {
      case error_collate:
        return "invalid collating element name";
      case error_ctype:
        return "invalid character class name";
      case error_escape:
        return "invalid escaped character or trailing escape";
      case error_backref:
        return "invalid back reference";
      case error_brack:
        return "mismatched brackets";
      case error_paren:
        return "mismatched parentheses";
      case error_brace:
        return "mismatched braces";
      case error_badbrace:
        return "invalid range in braces";
      case error_range:
        return "invalid character range";
      case error_space:
        return "insufficient memory to compile pattern";
      case error_badrepeat:
        return "repeat specifier not preceded by an expression";
      case error_complexity:
        return "pattern too complex";
      case error_stack:
        return "insufficient stack to match pattern";
      default:
        return "regular expression error";
    }
  }

  // tag 35 载荷无法编译，归入 invalid。
  std::error_condition default_error_condition(int) const noexcept override {
    return {static_cast<int>(condition::invalid), condition_category()};
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static cbor_error_category category;
  return category;
}

const std::error_category& condition_category() noexcept {
  static cbor_condition_category category;
  return category;
}

const std::error_category& regex_category() noexcept {
  static regex_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

std::error_condition make_error_condition(condition c) noexcept {
  return {static_cast<int>(c), condition_category()};
}

}  // namespace cborkit::cbor
