#pragma once

#include <spdlog/logger.h>

#include <memory>

namespace cborkit::core::detail {

// 库内部共用的命名 logger（"cborkit"）；首次调用时创建，并注册到 spdlog。
[[nodiscard]] const std::shared_ptr<spdlog::logger> &logger();

} // namespace cborkit::core::detail
