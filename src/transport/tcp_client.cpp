#include "mcps/transport/tcp_client.hpp"

#include "mcps/json/fast_json.hpp"

#include <asio/connect.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

namespace mcps {

TcpClient::TcpClient(std::size_t max_message_size)
    : socket_(io_context_)
    , max_message_size_(max_message_size)
{}

TcpClient::~TcpClient() {
    close();
}

TransportResult<void> TcpClient::connect(const std::string& host, std::uint16_t port) {
    if (socket_.is_open()) {
        return tl::unexpected(TransportError::network("already connected"));
    }

    asio::error_code ec;
    asio::ip::tcp::resolver resolver(io_context_);
    const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        return tl::unexpected(TransportError::network("cannot resolve " + host + ": " + ec.message()));
    }

    asio::connect(socket_, endpoints, ec);
    if (ec) {
        return tl::unexpected(TransportError::network(
            "cannot connect to " + host + ":" + std::to_string(port) + ": " + ec.message()));
    }
    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
    return {};
}

TransportResult<void> TcpClient::send(const Json& message) {
    return send_line(message.dump(-1, ' ', false, Json::error_handler_t::replace));
}

TransportResult<void> TcpClient::send_line(std::string_view line) {
    if (socket_.is_open() == false) {
        return tl::unexpected(TransportError::closed());
    }
    std::string frame(line);
    frame.push_back('\n');

    asio::error_code ec;
    asio::write(socket_, asio::buffer(frame), ec);
    if (ec) {
        return tl::unexpected(TransportError::network(ec.message()));
    }
    return {};
}

TransportResult<std::string> TcpClient::receive_line() {
    if (socket_.is_open() == false) {
        return tl::unexpected(TransportError::closed());
    }

    asio::error_code ec;
    const std::size_t n = asio::read_until(
        socket_,
        asio::dynamic_buffer(buffer_, max_message_size_ + 1),
        '\n',
        ec
    );
    if (ec == asio::error::eof) {
        return tl::unexpected(TransportError::closed());
    }
    if (ec == asio::error::not_found) {
        return tl::unexpected(TransportError::frame_too_large(max_message_size_));
    }
    if (ec) {
        return tl::unexpected(TransportError::network(ec.message()));
    }

    std::string line = buffer_.substr(0, n - 1);
    buffer_.erase(0, n);
    if (line.empty() == false && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

TransportResult<Json> TcpClient::receive() {
    auto line = receive_line();
    if (!line) {
        return tl::unexpected(line.error());
    }
    auto parsed = fast_parse(*line);
    if (!parsed) {
        return tl::unexpected(TransportError::network("malformed reply: " + parsed.error().message));
    }
    return std::move(*parsed);
}

void TcpClient::close() noexcept {
    if (socket_.is_open() == false) {
        return;
    }
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    buffer_.clear();
}

}  // namespace mcps
