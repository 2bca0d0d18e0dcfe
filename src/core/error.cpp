#include "cborkit/core/error.hpp"

#include <string>

namespace cborkit::core {
namespace {

class core_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "cborkit.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::buffer_overflow:
        return "buffer overflow";
      case errc::invalid_argument:
        return "invalid argument";
      case errc::end_of_stream:
        return "end of stream";
      default:
        return "unknown cborkit.core error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static core_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // 命名空间 cborkit::core
