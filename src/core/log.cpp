#include "cborkit/core/log.hpp"

#include "log_internal.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace cborkit::core {
namespace {

constexpr const char *kLoggerName = "cborkit";

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::trace:
        return spdlog::level::trace;
    case LogLevel::debug:
        return spdlog::level::debug;
    case LogLevel::info:
        return spdlog::level::info;
    case LogLevel::warn:
        return spdlog::level::warn;
    case LogLevel::error:
        return spdlog::level::err;
    case LogLevel::critical:
        return spdlog::level::critical;
    case LogLevel::off:
        return spdlog::level::off;
    }
    return spdlog::level::off;
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::trace;
    case spdlog::level::debug:
        return LogLevel::debug;
    case spdlog::level::info:
        return LogLevel::info;
    case spdlog::level::warn:
        return LogLevel::warn;
    case spdlog::level::err:
        return LogLevel::error;
    case spdlog::level::critical:
        return LogLevel::critical;
    default:
        return LogLevel::off;
    }
}

std::shared_ptr<spdlog::logger> make_logger() {
    // 业务侧可能已经注册了同名 logger（自定义 sink），优先复用。
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    // 编解码失败属于调用方可处理的结果，默认不输出。
    created->set_level(spdlog::level::warn);
    return created;
}

} // namespace

namespace detail {

const std::shared_ptr<spdlog::logger> &logger() {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return instance;
}

} // namespace detail

void set_log_level(LogLevel level) noexcept {
    try {
        detail::logger()->set_level(to_spdlog_level(level));
    } catch (const spdlog::spdlog_ex &) {
        // logger 创建失败（sink 初始化异常）时退回到全局级别。
        spdlog::set_level(to_spdlog_level(level));
    }
}

LogLevel log_level() noexcept {
    try {
        return from_spdlog_level(detail::logger()->level());
    } catch (const spdlog::spdlog_ex &) {
        return from_spdlog_level(spdlog::get_level());
    }
}

} // namespace cborkit::core
