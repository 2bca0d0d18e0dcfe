#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace cborkit::benchmarks {

enum class phase { encode, decode, scan };

inline const char *to_string(phase p) noexcept {
    switch (p) {
        case phase::encode:
            return "encode";
        case phase::decode:
            return "decode";
        case phase::scan:
            return "scan";
    }
    return "?";
}

/**
 * @brief 一项编解码基准的结果。
 *
 * wire_bytes 为每轮处理的 CBOR 字节数（编码为输出长度，解码为输入长度），
 * 吞吐按中位耗时计算，避免个别慢轮次拉低结果。
 */
struct CodecResult {
    std::string name;
    phase kind;
    std::size_t wire_bytes;
    std::size_t items;
    double median_ms;
    double best_ms;
    std::size_t failures;
    std::error_code first_error;
};

inline std::vector<CodecResult> &results() {
    static std::vector<CodecResult> results_;
    return results_;
}

/**
 * @brief 运行 iterations 轮（另加一轮预热）。
 *
 * run 的签名为 std::error_code(std::size_t &wire_bytes)：返回本轮的错误码并写出处理的字节数。
 * 失败的轮次计入 failures，但仍参与计时。
 */
template <typename Func>
void measure(std::string name, phase kind, std::size_t items, int iterations, Func &&run) {
    using clock = std::chrono::steady_clock;

    std::size_t wire_bytes = 0;
    std::size_t failures = 0;
    std::error_code first_error;

    auto once = [&] {
        const auto ec = run(wire_bytes);
        if (ec) {
            ++failures;
            if (!first_error) {
                first_error = ec;
            }
        }
    };

    once();
    failures = 0;
    first_error.clear();

    std::vector<double> timings;
    timings.reserve(static_cast<std::size_t>(iterations));
    for (int i = 0; i < iterations; ++i) {
        const auto start = clock::now();
        once();
        const auto elapsed = std::chrono::duration<double, std::milli>(clock::now() - start);
        timings.push_back(elapsed.count());
    }
    std::sort(timings.begin(), timings.end());

    const double median = timings.empty() ? 0.0 : timings[timings.size() / 2];
    const double best = timings.empty() ? 0.0 : timings.front();
    results().push_back({std::move(name), kind, wire_bytes, items, median, best, failures, first_error});
}

inline std::string human_size(std::size_t bytes) {
    if (bytes >= 1024 * 1024) {
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }
    if (bytes >= 1024) {
        return std::to_string(bytes / 1024) + " KB";
    }
    return std::to_string(bytes) + " B";
}

inline void print_results() {
    const std::string rule(118, '=');
    std::cout << "\n" << rule << "\n";
    std::cout << "CBOR CODEC BENCHMARKS\n";
    std::cout << rule << "\n";
    std::cout << std::left << std::setw(46) << "Benchmark" << std::setw(8) << "Phase" << std::setw(12) << "Wire"
              << std::setw(12) << "Median ms" << std::setw(12) << "Best ms" << std::setw(12) << "MB/s"
              << std::setw(14) << "Mitems/s" << "Fail"
              << "\n";
    std::cout << std::string(118, '-') << "\n";

    for (const auto &r : results()) {
        const double seconds = r.median_ms / 1000.0;
        std::cout << std::left << std::setw(46) << r.name << std::setw(8) << to_string(r.kind) << std::setw(12)
                  << human_size(r.wire_bytes) << std::fixed << std::setprecision(3) << std::setw(12) << r.median_ms
                  << std::setw(12) << r.best_ms;
        if (seconds > 0.0) {
            std::cout << std::setw(12) << static_cast<double>(r.wire_bytes) / (1024.0 * 1024.0) / seconds
                      << std::setw(14) << static_cast<double>(r.items) / 1'000'000.0 / seconds;
        } else {
            std::cout << std::setw(12) << "N/A" << std::setw(14) << "N/A";
        }
        std::cout << r.failures << "\n";
        if (r.first_error) {
            std::cout << "    first error: [" << r.first_error.category().name() << "] " << r.first_error.message()
                      << "\n";
        }
    }

    std::cout << rule << "\n\n";
}

// 有失败轮次时返回非零，便于脚本判断。
inline int exit_code() {
    return std::any_of(results().begin(), results().end(), [](const CodecResult &r) { return r.failures != 0; })
               ? 1
               : 0;
}

} // namespace cborkit::benchmarks
