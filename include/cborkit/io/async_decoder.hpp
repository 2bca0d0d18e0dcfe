#pragma once

#include "cborkit/cbor/decoder.hpp"
#include "cborkit/cbor/options.hpp"
#include "cborkit/core/buffer.hpp"
#include "cborkit/io/stream.hpp"

#include <asio/awaitable.hpp>

#include <cstddef>
#include <optional>
#include <system_error>
#include <utility>

namespace cborkit::io {

/**
 * @brief 从异步字节流中逐个产出顶层 CBOR 值（重缓冲前端）。
 *
 * - 已缓冲字节不足以构成一个完整值时继续读取，然后从头重试解码；
 * - 流在数据项边界结束：返回 {ok, nullopt}；
 * - 流在数据项中途结束：返回 cbor::errc::unexpected_eof；
 * - 缓冲超过 max_buffer 返回 core::errc::buffer_overflow。
 *
 * 同一时刻只应有一个协程调用 async_next()。
 */
class AsyncSequenceDecoder final {
public:
    explicit AsyncSequenceDecoder(
        ByteStream &stream,
        cbor::DecodeOptions options = {},
        std::size_t max_buffer = core::kDefaultBufferMaxCapacity);

    asio::awaitable<std::pair<std::error_code, std::optional<cbor::Document>>> async_next();

    [[nodiscard]] const cbor::DecodeFailure &failure() const noexcept { return failure_; }
    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size(); }

private:
    asio::awaitable<std::error_code> async_fill();

    ByteStream &stream_;
    cbor::DecodeOptions options_;
    core::ByteBuffer buffer_;
    cbor::DecodeFailure failure_;
    bool eof_{false};
};

} // namespace cborkit::io
