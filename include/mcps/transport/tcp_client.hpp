#pragma once

#include "mcps/protocol/json_rpc.hpp"
#include "mcps/transport/transport_error.hpp"

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace mcps {

// ─────────────────────────────────────────────────────────────────────────────
// TcpClient - blocking newline-delimited JSON client
// ─────────────────────────────────────────────────────────────────────────────
// The counterpart of Connection for command-line tools and tests. One
// request at a time; not thread-safe.

class TcpClient {
public:
    explicit TcpClient(std::size_t max_message_size = 1024 * 1024);
    ~TcpClient();

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    [[nodiscard]] TransportResult<void> connect(const std::string& host, std::uint16_t port);

    [[nodiscard]] TransportResult<void> send(const Json& message);

    /// Write `line` followed by a newline, without looking at it.
    [[nodiscard]] TransportResult<void> send_line(std::string_view line);

    /// Next line without its newline. Category::Closed at end of stream.
    [[nodiscard]] TransportResult<std::string> receive_line();

    /// Next line parsed as JSON.
    [[nodiscard]] TransportResult<Json> receive();

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return socket_.is_open(); }

private:
    asio::io_context io_context_;
    asio::ip::tcp::socket socket_;
    std::size_t max_message_size_;
    std::string buffer_;
};

}  // namespace mcps
