/**
 * @file cbor_hex_dump.cpp
 * @brief 把 16 进制文本解析为 CBOR 并输出 hexdump 与诊断记法
 *
 * 用法：
 *   cbor_hex_dump "a2 01 02 03 04"
 *   echo "9f 01 02 ff" | cbor_hex_dump
 * 不带参数且标准输入为空时，输出几段内置示例。
 */

#include <cborkit/cbor/decoder.hpp>
#include <cborkit/cbor/errors.hpp>
#include <cborkit/utils/diagnostic.hpp>
#include <cborkit/utils/hex.hpp>

#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace cborkit;

namespace {

int dump_one(const std::string &label, const std::string &text) {
    std::cout << "\n=== " << label << " ===\n";

    std::vector<core::byte> data;
    if (auto ec = utils::parse_hex(text, data)) {
        std::cerr << "16进制解析失败: " << ec.message() << "\n";
        return 1;
    }
    std::cout << "总长度: " << data.size() << " 字节\n";

    utils::HexDumpOptions opts;
    opts.show_ascii = true;
    std::cout << utils::hex_dump(data, opts);

    // 诊断记法不解释 tag，可以渲染多个顶层值
    std::string diag;
    if (auto ec = utils::diagnose(data, diag)) {
        std::cout << "诊断记法（不完整）: " << diag << "\n";
        std::cout << "错误: [" << ec.category().name() << "] " << ec.message() << "\n";
        return 1;
    }
    std::cout << "诊断记法: " << diag << "\n";

    // 完整解码：报告 tag 语义与确定性检查结果
    cbor::DecodeOptions strict;
    strict.policy = cbor::DeterministicPolicy::strict();
    cbor::Document doc;
    cbor::DecodeFailure failure;
    if (auto ec = cbor::decode_one(data, doc, strict, &failure)) {
        const char *family = ec == cbor::condition::ill_formed ? "ill-formed"
                             : ec == cbor::condition::invalid  ? "invalid"
                                                                : "other";
        std::cout << "严格解码: " << family << " @" << failure.offset << ": " << failure.message << "\n";
    } else {
        std::cout << "严格解码: ok (" << cbor::to_string(doc.root.kind()) << ")\n";
    }
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    if (argc > 1) {
        int rc = 0;
        for (int i = 1; i < argc; ++i) {
            rc |= dump_one("argv[" + std::to_string(i) + "]", argv[i]);
        }
        return rc;
    }

    std::string input{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    if (!input.empty()) {
        return dump_one("stdin", input);
    }

    std::cout << "=== CBOR 16 进制示例 ===\n";
    dump_one("确定性映射", "a2 01 02 03 04");
    dump_one("indefinite 数组", "9f 01 02 ff");
    dump_one("分块字节串", "5f 41 01 ff");
    dump_one("日期时间 tag 0", "c0 74 32 30 31 33 2d 30 33 2d 32 31 54 32 30 3a 30 34 3a 30 30 5a");
    dump_one("截断输入", "18");
    return 0;
}
