#include "cborkit/io/async_decoder.hpp"
#include "cborkit/io/stream.hpp"

#include "cborkit/cbor/encoder.hpp"
#include "cborkit/cbor/errors.hpp"
#include "cborkit/core/error.hpp"
#include "cborkit/utils/hex.hpp"

#include "test_main.hpp"

#include <asio/as_tuple.hpp>
#include <asio/buffer.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/error.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <deque>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

using cborkit::core::byte;
using namespace cborkit::cbor;
using cborkit::io::AsyncSequenceDecoder;
using cborkit::io::ByteStream;

std::vector<byte> hex(std::string_view text) {
    std::vector<byte> out;
    TEST_EXPECT_OK(cborkit::utils::parse_hex(text, out));
    return out;
}

/**
 * @brief 按预定分块交付数据的内存流；分块耗尽后返回 eof（或注入的错误）。
 */
class ChunkedStream final : public ByteStream {
public:
    ChunkedStream(asio::any_io_executor ex, std::deque<std::vector<byte>> chunks,
                  std::error_code final_error = asio::error::eof)
        : ex_(ex), chunks_(std::move(chunks)), final_error_(final_error) {}

    [[nodiscard]] asio::any_io_executor executor() const noexcept override {
        return ex_;
    }

    asio::awaitable<std::pair<std::error_code, std::size_t>>
    async_read_some(cborkit::core::mutable_bytes_view dst) override {
        ++reads_;
        if (chunks_.empty()) {
            co_return std::pair{final_error_, std::size_t{0}};
        }
        auto &front = chunks_.front();
        const std::size_t n = std::min(dst.size(), front.size());
        std::copy_n(front.begin(), n, dst.begin());
        front.erase(front.begin(), front.begin() + static_cast<std::ptrdiff_t>(n));
        if (front.empty()) {
            chunks_.pop_front();
        }
        co_return std::pair{std::error_code{}, n};
    }

    [[nodiscard]] std::size_t reads() const noexcept { return reads_; }

private:
    asio::any_io_executor ex_;
    std::deque<std::vector<byte>> chunks_;
    std::error_code final_error_;
    std::size_t reads_{0};
};

// 逐字节切分，模拟最坏的网络分片。
std::deque<std::vector<byte>> byte_by_byte(const std::vector<byte> &data) {
    std::deque<std::vector<byte>> chunks;
    for (const auto b : data) {
        chunks.push_back({b});
    }
    return chunks;
}

void test_items_across_fragmented_reads() {
    asio::io_context ioc;
    ChunkedStream stream(ioc.get_executor(), byte_by_byte(hex("a201020304 9f0102ff 6449455446")));
    AsyncSequenceDecoder decoder(stream);

    std::vector<Value> got;
    std::error_code last;
    asio::co_spawn(
        ioc,
        [&]() -> asio::awaitable<void> {
            for (;;) {
                auto [ec, doc] = co_await decoder.async_next();
                if (ec || !doc) {
                    last = ec;
                    co_return;
                }
                got.push_back(doc->root);
            }
        },
        asio::detached);
    ioc.run();

    TEST_EXPECT_OK(last);
    TEST_EXPECT_EQ(got.size(), 3u);
    if (got.size() == 3u) {
        TEST_EXPECT_EQ(got[0], Value::map({{Value::integer(1), Value::integer(2)},
                                           {Value::integer(3), Value::integer(4)}}));
        TEST_EXPECT_EQ(got[1], Value::list({Value::integer(1), Value::integer(2)}));
        TEST_EXPECT_EQ(got[2], Value::text("IETF"));
    }
    TEST_EXPECT_EQ(decoder.buffered(), 0u);
}

void test_truncated_stream() {
    asio::io_context ioc;
    std::deque<std::vector<byte>> chunks;
    chunks.push_back(hex("01"));
    chunks.push_back(hex("8201"));
    ChunkedStream stream(ioc.get_executor(), std::move(chunks));
    AsyncSequenceDecoder decoder(stream);

    std::vector<Value> got;
    std::error_code last;
    asio::co_spawn(
        ioc,
        [&]() -> asio::awaitable<void> {
            for (;;) {
                auto [ec, doc] = co_await decoder.async_next();
                if (ec || !doc) {
                    last = ec;
                    co_return;
                }
                got.push_back(doc->root);
            }
        },
        asio::detached);
    ioc.run();

    TEST_EXPECT_EQ(got.size(), 1u);
    TEST_EXPECT_CODE(last, errc::unexpected_eof);
    TEST_EXPECT_EQ(decoder.failure().code, make_error_code(errc::unexpected_eof));
}

void test_invalid_item_and_transport_error() {
    asio::io_context ioc;
    std::deque<std::vector<byte>> chunks;
    chunks.push_back(hex("a2010201"));
    chunks.push_back(hex("03"));
    ChunkedStream dup(ioc.get_executor(), std::move(chunks));
    AsyncSequenceDecoder dup_decoder(dup);

    std::deque<std::vector<byte>> partial;
    partial.push_back(hex("82"));
    ChunkedStream broken(ioc.get_executor(), std::move(partial),
                         std::make_error_code(std::errc::connection_reset));
    AsyncSequenceDecoder broken_decoder(broken);

    std::error_code dup_ec;
    std::error_code broken_ec;
    asio::co_spawn(
        ioc,
        [&]() -> asio::awaitable<void> {
            auto [ec1, doc1] = co_await dup_decoder.async_next();
            dup_ec = ec1;
            auto [ec2, doc2] = co_await broken_decoder.async_next();
            broken_ec = ec2;
        },
        asio::detached);
    ioc.run();

    TEST_EXPECT_CODE(dup_ec, errc::duplicate_key);
    TEST_EXPECT(broken_ec == std::errc::connection_reset);
}

void test_buffer_limit() {
    asio::io_context ioc;
    // 声明 1000 字节的字节串，但上限只有 64 字节
    std::vector<byte> data = hex("5903e8");
    data.resize(3 + 200, 0x00);
    std::deque<std::vector<byte>> chunks;
    chunks.push_back(data);
    ChunkedStream stream(ioc.get_executor(), std::move(chunks));
    AsyncSequenceDecoder decoder(stream, {}, 64);

    std::error_code last;
    asio::co_spawn(
        ioc,
        [&]() -> asio::awaitable<void> {
            auto [ec, doc] = co_await decoder.async_next();
            last = ec;
        },
        asio::detached);
    ioc.run();

    TEST_EXPECT_EQ(last, cborkit::core::make_error_code(cborkit::core::errc::buffer_overflow));
}

void test_tcp_loopback() {
    asio::io_context ioc;
    asio::ip::tcp::acceptor acceptor(ioc, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    const auto endpoint = acceptor.local_endpoint();

    std::vector<byte> payload;
    TEST_EXPECT_OK(encode_one(Value::list({Value::text("sensor"), Value::floating(21.5)}), payload));
    TEST_EXPECT_OK(encode_one(Value::integer(7), payload));

    std::vector<Value> got;
    std::atomic<bool> done{false};

    asio::co_spawn(
        ioc,
        [&]() -> asio::awaitable<void> {
            auto [aec, socket] = co_await acceptor.async_accept(asio::as_tuple(asio::use_awaitable));
            if (aec) {
                co_return;
            }
            cborkit::io::TcpByteStream stream(std::move(socket));
            AsyncSequenceDecoder decoder(stream);
            for (;;) {
                auto [ec, doc] = co_await decoder.async_next();
                if (ec || !doc) {
                    break;
                }
                got.push_back(doc->root);
            }
            done = true;
        },
        asio::detached);

    asio::co_spawn(
        ioc,
        [&]() -> asio::awaitable<void> {
            asio::ip::tcp::socket client(ioc);
            auto [cec] = co_await client.async_connect(endpoint, asio::as_tuple(asio::use_awaitable));
            if (cec) {
                co_return;
            }
            co_await asio::async_write(client, asio::buffer(payload), asio::as_tuple(asio::use_awaitable));
            std::error_code ignored;
            client.shutdown(asio::ip::tcp::socket::shutdown_send, ignored);
            client.close(ignored);
        },
        asio::detached);

    ioc.run();

    TEST_EXPECT(done.load());
    TEST_EXPECT_EQ(got.size(), 2u);
    if (got.size() == 2u) {
        TEST_EXPECT_EQ(got[1], Value::integer(7));
    }
}

} // namespace

int main() {
    test_items_across_fragmented_reads();
    test_truncated_stream();
    test_invalid_item_and_transport_error();
    test_buffer_limit();
    test_tcp_loopback();
    return ::cborkit::tests::run_and_report();
}
