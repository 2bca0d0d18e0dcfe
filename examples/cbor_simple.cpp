#include <cborkit/cbor/decoder.hpp>
#include <cborkit/cbor/encoder.hpp>
#include <cborkit/core/log.hpp>
#include <cborkit/utils/diagnostic.hpp>
#include <cborkit/utils/hex.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace cborkit::cbor;

int main() {
    std::cout << "=== CBOR 编解码简单示例 ===\n\n";

    cborkit::core::set_log_level(cborkit::core::LogLevel::debug);

    // 构造一条传感器记录
    Value record = Value::map({
        {Value::text("id"), Value::integer(17)},
        {Value::text("name"), Value::text("temp-1")},
        {Value::text("samples"), Value::list({Value::floating(21.5), Value::floating(21.75)})},
        {Value::text("ok"), Value::boolean(true)},
    });

    // 确定性编码
    EncodeOptions opts;
    opts.sort = sort_method::length_first;
    opts.deterministic = true;

    std::vector<byte> encoded;
    auto ec = encode_one(record, encoded, opts);
    if (ec) {
        std::cerr << "编码失败: " << ec.message() << "\n";
        return 1;
    }
    std::cout << "编码成功: " << encoded.size() << " 字节\n";
    std::cout << cborkit::utils::hex_dump(encoded);

    std::string diag;
    if (!cborkit::utils::diagnose(encoded, diag)) {
        std::cout << "诊断记法: " << diag << "\n";
    }

    // 解码
    Document doc;
    ec = decode_one(encoded, doc);
    if (ec) {
        std::cerr << "解码失败: " << ec.message() << "\n";
        return 1;
    }
    std::cout << "解码成功，与原值相等: " << (doc.root == record ? "是" : "否") << "\n";

    // 截断输入：错误信息包含缺少的字节数
    DecodeFailure failure;
    ec = decode_one(bytes_view{encoded.data(), encoded.size() - 3}, doc, {}, &failure);
    if (ec) {
        std::cout << "截断输入: [" << ec.category().name() << "] " << failure.message << "\n";
    }

    return 0;
}
