#include "test_main.hpp"

#include <cborkit/core/error.hpp>
#include <cborkit/utils/hex.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace cborkit;

int main() {
    // 1) hex 解析：分隔符、大小写、0x 前缀
    {
        std::vector<core::byte> bytes;
        const auto ec = utils::parse_hex("A2 01,02:0x03 04", bytes);
        TEST_EXPECT_OK(ec);
        TEST_EXPECT_EQ(bytes.size(), static_cast<std::size_t>(5));
        TEST_EXPECT_EQ(bytes[0], static_cast<core::byte>(0xa2));
        TEST_EXPECT_EQ(bytes[3], static_cast<core::byte>(0x03));
        TEST_EXPECT_EQ(bytes[4], static_cast<core::byte>(0x04));
    }

    // 2) 非法输入
    {
        std::vector<core::byte> bytes;
        TEST_EXPECT_EQ(utils::parse_hex("a2 0", bytes), core::make_error_code(core::errc::invalid_argument));
        TEST_EXPECT_EQ(utils::parse_hex("zz", bytes), core::make_error_code(core::errc::invalid_argument));
        TEST_EXPECT_OK(utils::parse_hex("", bytes));
        TEST_EXPECT(bytes.empty());
    }

    // 3) to_hex
    {
        const std::vector<core::byte> bytes{0xa2, 0x01, 0x02, 0x03, 0x04};
        TEST_EXPECT_EQ(utils::to_hex(bytes), "a201020304");
    }

    // 4) hex_dump：偏移、ASCII 侧栏与截断
    {
        std::vector<core::byte> bytes;
        TEST_EXPECT_OK(utils::parse_hex("6449455446", bytes));

        utils::HexDumpOptions opt;
        opt.show_ascii = true;
        const auto s = utils::hex_dump(bytes, opt);
        TEST_EXPECT(s.find("0000: 64 49 45 54 46") != std::string::npos);
        TEST_EXPECT(s.find("dIETF") != std::string::npos);

        std::vector<core::byte> big(40, 0x00);
        utils::HexDumpOptions limited;
        limited.max_bytes = 16;
        const auto t = utils::hex_dump(big, limited);
        TEST_EXPECT(t.find("truncated, total=40") != std::string::npos);
    }

    return ::cborkit::tests::run_and_report();
}
