#include "cborkit/io/async_decoder.hpp"

#include "cborkit/cbor/errors.hpp"

#include "core/log_internal.hpp"

#include <asio/error.hpp>

#include <algorithm>

namespace cborkit::io {
namespace {

// 每次读取的最小可写空间。
constexpr std::size_t kReadChunk = 4096;

} // namespace

AsyncSequenceDecoder::AsyncSequenceDecoder(ByteStream &stream,
                                           cbor::DecodeOptions options,
                                           std::size_t max_buffer)
    : stream_(stream), options_(std::move(options)),
      buffer_(std::min(core::kDefaultBufferCapacity, max_buffer), max_buffer) {}

asio::awaitable<std::error_code> AsyncSequenceDecoder::async_fill() {
    core::mutable_bytes_view dst;
    // 接近上限时退而求其次，只要还有 1 字节空间就继续读。
    if (auto ec = buffer_.prepare(kReadChunk, dst)) {
        if (auto ec2 = buffer_.prepare(1, dst)) {
            co_return ec2;
        }
    }
    auto [ec, n] = co_await stream_.async_read_some(dst);
    if (ec == asio::error::eof) {
        eof_ = true;
        co_return std::error_code{};
    }
    if (ec) {
        co_return ec;
    }
    co_return buffer_.commit(n);
}

asio::awaitable<std::pair<std::error_code, std::optional<cbor::Document>>>
AsyncSequenceDecoder::async_next() {
    for (;;) {
        if (!buffer_.empty()) {
            cbor::Document doc;
            std::size_t consumed = 0;
            failure_ = cbor::DecodeFailure{};
            auto ec = cbor::decode_prefix(buffer_.readable_bytes(), doc, consumed, options_, &failure_);
            if (!ec) {
                if (auto cec = buffer_.consume(consumed)) {
                    co_return std::pair{cec, std::optional<cbor::Document>{}};
                }
                co_return std::pair{std::error_code{}, std::optional<cbor::Document>{std::move(doc)}};
            }
            if (ec != cbor::errc::unexpected_eof || eof_) {
                co_return std::pair{ec, std::optional<cbor::Document>{}};
            }
        } else if (eof_) {
            co_return std::pair{std::error_code{}, std::optional<cbor::Document>{}};
        }

        if (auto ec = co_await async_fill()) {
            core::detail::logger()->debug("cbor async read failed: {}", ec.message());
            co_return std::pair{ec, std::optional<cbor::Document>{}};
        }
    }
}

} // namespace cborkit::io
