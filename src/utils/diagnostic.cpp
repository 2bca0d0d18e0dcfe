#include "cborkit/utils/diagnostic.hpp"

#include "cborkit/cbor/event_reader.hpp"
#include "cborkit/utils/hex.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace cborkit::utils {
namespace {

using cborkit::cbor::Event;
using cborkit::cbor::event_type;
using cborkit::cbor::Value;

enum class FrameKind : std::uint8_t { list, map, tag, bytes, text };

struct Frame final {
    FrameKind kind{FrameKind::list};
    bool indefinite{false};
    std::uint64_t expected{0};
    std::uint64_t count{0};
};

void append_float_(std::ostringstream &oss, double v) {
    if (std::isnan(v)) {
        oss << "NaN";
        return;
    }
    if (std::isinf(v)) {
        oss << (v < 0 ? "-Infinity" : "Infinity");
        return;
    }
    // 先取最短的科学记数形式，得到十进制指数
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::scientific);
    std::string sci(buf, static_cast<std::size_t>(res.ptr - buf));
    const auto e = sci.find('e');
    const int exponent = std::atoi(sci.c_str() + e + 1);

    // 与 RFC 8949 附录 A 一致：10^-5 .. 10^16 之间用定点，其余用 "1.0e+300" 形式
    if (v == 0.0 || (exponent >= -5 && exponent < 16)) {
        res = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed);
        const std::string_view text(buf, static_cast<std::size_t>(res.ptr - buf));
        oss << text;
        if (text.find('.') == std::string_view::npos) {
            oss << ".0";
        }
        return;
    }
    std::string mantissa = sci.substr(0, e);
    if (mantissa.find('.') == std::string::npos) {
        mantissa += ".0";
    }
    oss << mantissa << 'e' << (exponent < 0 ? '-' : '+') << (exponent < 0 ? -exponent : exponent);
}

void append_text_(std::ostringstream &oss, const std::string &s) {
    oss << '"';
    for (const char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (c < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(c) << std::dec;
            } else {
                oss << ch;
            }
            break;
        }
    }
    oss << '"';
}

void append_scalar_(std::ostringstream &oss, const Value &v) {
    using namespace cborkit::cbor;
    if (const auto *i = v.get_if<Integer>()) {
        oss << i->value.str();
    } else if (const auto *b = v.get_if<Bytes>()) {
        oss << "h'" << to_hex(b->value) << '\'';
    } else if (const auto *t = v.get_if<Text>()) {
        append_text_(oss, t->value);
    } else if (const auto *f = v.get_if<Float>()) {
        append_float_(oss, f->value);
    } else if (const auto *bo = v.get_if<Boolean>()) {
        oss << (bo->value ? "true" : "false");
    } else if (v.is<Null>()) {
        oss << "null";
    } else if (v.is<Undefined>()) {
        oss << "undefined";
    } else if (const auto *s = v.get_if<Simple>()) {
        oss << "simple(" << static_cast<int>(s->value) << ')';
    } else {
        // simple_factory 产生的自定义值
        oss << '<' << to_string(v.kind()) << '>';
    }
}

class DiagnosticPrinter final {
public:
    explicit DiagnosticPrinter(std::ostringstream &oss) : oss_(oss) {}

    [[nodiscard]] bool idle() const noexcept { return frames_.empty(); }

    void on_event(const Event &ev) {
        if (ev.type == event_type::break_code) {
            close_top();
            item_done();
            return;
        }

        separator();
        switch (ev.type) {
        case event_type::enter_list:
            oss_ << (ev.length ? "[" : "[_ ");
            open(FrameKind::list, ev.length, 1);
            return;
        case event_type::enter_map:
            oss_ << (ev.length ? "{" : "{_ ");
            open(FrameKind::map, ev.length, 2);
            return;
        case event_type::enter_bytes:
        case event_type::enter_text:
            oss_ << "(_ ";
            open(ev.type == event_type::enter_bytes ? FrameKind::bytes : FrameKind::text, std::nullopt, 1);
            return;
        case event_type::enter_tag:
            oss_ << ev.tag << '(';
            open(FrameKind::tag, std::uint64_t{1}, 1);
            return;
        default:
            append_scalar_(oss_, ev.value);
            item_done();
            return;
        }
    }

private:
    void separator() {
        if (frames_.empty()) {
            return;
        }
        const auto &top = frames_.back();
        if (top.count == 0) {
            return;
        }
        if (top.kind == FrameKind::map && top.count % 2 == 1) {
            oss_ << ": ";
        } else {
            oss_ << ", ";
        }
    }

    void open(FrameKind kind, std::optional<std::uint64_t> length, std::uint64_t per_entry) {
        Frame f;
        f.kind = kind;
        f.indefinite = !length.has_value();
        f.expected = length.value_or(0) * per_entry;
        frames_.push_back(f);
        if (!f.indefinite && f.expected == 0) {
            close_top();
            item_done();
        }
    }

    void close_top() {
        if (frames_.empty()) {
            return;
        }
        switch (frames_.back().kind) {
        case FrameKind::list:
            oss_ << ']';
            break;
        case FrameKind::map:
            oss_ << '}';
            break;
        default:
            oss_ << ')';
            break;
        }
        frames_.pop_back();
    }

    void item_done() {
        while (!frames_.empty()) {
            auto &top = frames_.back();
            ++top.count;
            if (top.indefinite || top.count < top.expected) {
                return;
            }
            close_top();
        }
    }

    std::ostringstream &oss_;
    std::vector<Frame> frames_;
};

} // namespace

std::error_code diagnose(cborkit::core::bytes_view in,
                         std::string &out,
                         const cborkit::cbor::DecodeOptions &options) noexcept {
    cborkit::cbor::SpanSource source(in);
    cborkit::cbor::EventReader reader(source, options);
    std::ostringstream oss;
    DiagnosticPrinter printer(oss);
    bool first = true;

    for (;;) {
        Event ev;
        if (auto ec = reader.next(ev)) {
            out = oss.str();
            return ec;
        }
        if (ev.type == event_type::end) {
            break;
        }
        if (printer.idle()) {
            if (!first) {
                oss << ", ";
            }
            first = false;
        }
        printer.on_event(ev);
    }
    out = oss.str();
    return {};
}

std::error_code to_diagnostic(const cborkit::cbor::Document &doc,
                              std::string &out,
                              const cborkit::cbor::EncodeOptions &options) noexcept {
    std::vector<cborkit::core::byte> encoded;
    if (auto ec = cborkit::cbor::encode_one(doc, encoded, options)) {
        return ec;
    }
    return diagnose(encoded, out);
}

std::error_code to_diagnostic(const cborkit::cbor::Value &value,
                              std::string &out,
                              const cborkit::cbor::EncodeOptions &options) noexcept {
    std::vector<cborkit::core::byte> encoded;
    if (auto ec = cborkit::cbor::encode_one(value, encoded, options)) {
        return ec;
    }
    return diagnose(encoded, out);
}

} // namespace cborkit::utils
