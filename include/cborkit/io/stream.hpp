#pragma once

#include "cborkit/core/common.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/ip/tcp.hpp>

#include <cstddef>
#include <system_error>
#include <utility>

namespace cborkit::io {

/**
 * @brief 异步字节流抽象（异步解码器只依赖 read 语义）。
 *
 * 说明：
 * - 生产环境使用 TcpByteStream；单元测试可注入纯内存实现；
 * - 对端正常关闭时 async_read_some 返回 asio::error::eof。
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    [[nodiscard]] virtual asio::any_io_executor executor() const noexcept = 0;

    virtual asio::awaitable<std::pair<std::error_code, std::size_t>>
    async_read_some(core::mutable_bytes_view dst) = 0;
};

class TcpByteStream final : public ByteStream {
public:
    explicit TcpByteStream(asio::ip::tcp::socket socket);

    [[nodiscard]] asio::any_io_executor executor() const noexcept override;

    asio::awaitable<std::pair<std::error_code, std::size_t>>
    async_read_some(core::mutable_bytes_view dst) override;

    [[nodiscard]] asio::ip::tcp::socket &socket() noexcept { return socket_; }

private:
    asio::any_io_executor executor_;
    asio::ip::tcp::socket socket_;
};

} // namespace cborkit::io
