#include "cborkit/utils/hex.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace cborkit::utils {
namespace {

constexpr char kDigits[] = "0123456789abcdef";

[[nodiscard]] int hex_value_(unsigned char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] bool is_separator_(unsigned char c) noexcept {
    switch (c) {
    case ' ':
    case '\t':
    case '\r':
    case '\n':
    case ',':
    case ':':
    case '-':
    case '_':
    case '[':
    case ']':
        return true;
    default:
        return false;
    }
}

[[nodiscard]] char to_printable_ascii_(cborkit::core::byte b) noexcept {
    return (b >= 0x20 && b <= 0x7E) ? static_cast<char>(b) : '.';
}

} // namespace

std::string to_hex(cborkit::core::bytes_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto b : bytes) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

std::string hex_dump(cborkit::core::bytes_view bytes, HexDumpOptions options) {
    std::ostringstream oss;
    const std::size_t total = bytes.size();
    const std::size_t max_bytes =
        (options.max_bytes == 0 ? total : std::min(total, options.max_bytes));
    const std::size_t per_line =
        (options.bytes_per_line == 0 ? std::size_t{16} : options.bytes_per_line);

    for (std::size_t offset = 0; offset < max_bytes; offset += per_line) {
        const std::size_t line_n = std::min(per_line, max_bytes - offset);
        if (options.show_offset) {
            oss << std::setw(4) << std::setfill('0') << std::hex << offset << ": ";
        }
        for (std::size_t i = 0; i < line_n; ++i) {
            const auto b = bytes[offset + i];
            oss << kDigits[b >> 4] << kDigits[b & 0x0F];
            if (i + 1 != line_n) {
                oss << ' ';
            }
        }
        if (options.show_ascii) {
            // 补齐短行，保证 ASCII 列对齐。
            oss << std::string((per_line - line_n) * 3 + 2, ' ');
            for (std::size_t i = 0; i < line_n; ++i) {
                oss << to_printable_ascii_(bytes[offset + i]);
            }
        }
        oss << '\n';
    }
    if (options.max_bytes != 0 && total > options.max_bytes) {
        oss << "... (truncated, total=" << std::dec << total << " bytes)\n";
    }
    return oss.str();
}

std::error_code parse_hex(std::string_view text,
                          std::vector<cborkit::core::byte> &out) noexcept {
    out.clear();
    int hi_nibble = -1;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (is_separator_(c)) {
            continue;
        }
        // 可选 0x/0X 前缀：只在字节边界上识别。
        if (c == '0' && hi_nibble < 0 && (i + 1) < text.size() &&
            (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            ++i;
            continue;
        }
        const int v = hex_value_(c);
        if (v < 0) {
            return cborkit::core::make_error_code(cborkit::core::errc::invalid_argument);
        }
        if (hi_nibble < 0) {
            hi_nibble = v;
            continue;
        }
        out.push_back(static_cast<cborkit::core::byte>((hi_nibble << 4) | v));
        hi_nibble = -1;
    }

    // 两个 nibble 组成一个 byte。
    if (hi_nibble >= 0) {
        return cborkit::core::make_error_code(cborkit::core::errc::invalid_argument);
    }
    return {};
}

} // namespace cborkit::utils
