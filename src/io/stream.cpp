#include "cborkit/io/stream.hpp"

#include <asio/as_tuple.hpp>
#include <asio/buffer.hpp>
#include <asio/use_awaitable.hpp>

namespace cborkit::io {

TcpByteStream::TcpByteStream(asio::ip::tcp::socket socket)
    : executor_(socket.get_executor()), socket_(std::move(socket)) {}

asio::any_io_executor TcpByteStream::executor() const noexcept { return executor_; }

asio::awaitable<std::pair<std::error_code, std::size_t>>
TcpByteStream::async_read_some(core::mutable_bytes_view dst) {
    auto [ec, n] = co_await socket_.async_read_some(
        asio::buffer(dst.data(), dst.size()),
        asio::as_tuple(asio::use_awaitable));
    co_return std::pair{ec, n};
}

} // namespace cborkit::io
