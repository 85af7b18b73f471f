#include "mcps/transport/tcp_server.hpp"

#include "mcps/log/logger.hpp"
#include "mcps/protocol/codec.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/read_until.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <sys/socket.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace mcps {

namespace {

std::string describe_endpoint(const asio::ip::tcp::socket& socket) {
    asio::error_code ec;
    const auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════════════

Connection::Connection(asio::ip::tcp::socket socket, const Dispatcher& dispatcher, std::size_t max_message_size)
    : socket_(std::move(socket))
    , dispatcher_(dispatcher)
    , max_message_size_(max_message_size)
    , peer_(describe_endpoint(socket_))
    , session_(peer_)
{
    buffer_.reserve(4096);
}

Connection::~Connection() {
    shutdown_receive();
    join();
}

void Connection::start() {
    thread_ = std::thread([this]() { run(); });
}

void Connection::shutdown_receive() noexcept {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (socket_closed_) {
        return;
    }
    // A blocked read on this socket returns end-of-stream
    ::shutdown(socket_.native_handle(), SHUT_RD);
}

void Connection::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void Connection::close_socket() noexcept {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (socket_closed_) {
        return;
    }
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    socket_closed_ = true;
}

void Connection::run() {
    MCPS_LOG_INFO("[peer=" + peer_ + "] connection opened");

    try {
        while (true) {
            auto frame = read_frame();
            if (!frame) {
                MCPS_LOG_WARN("[" + session_.describe() + "] transport error ("
                    + std::string(to_string(frame.error().category)) + "): " + frame.error().message);
                break;
            }
            if (!frame->has_value()) {
                break;
            }

            const auto trimmed = trim_frame(**frame);
            if (!trimmed) {
                continue;
            }

            std::optional<Message> reply;
            auto decoded = decode(*trimmed);
            if (!decoded) {
                reply = dispatcher_.reject_undecodable(session_, decoded.error());
            } else {
                reply = dispatcher_.handle(session_, *decoded);
            }

            if (reply) {
                auto written = write_message(*reply);
                if (!written) {
                    MCPS_LOG_WARN("[" + session_.describe() + "] write failed: " + written.error().message);
                    break;
                }
            }
        }
    } catch (const std::exception& e) {
        MCPS_LOG_ERROR("[" + session_.describe() + "] connection loop failed: " + e.what());
    }

    session_.close();
    close_socket();
    MCPS_LOG_INFO("[peer=" + peer_ + "] connection closed");
    finished_.store(true);
}

TransportResult<std::optional<std::string>> Connection::read_frame() {
    asio::error_code ec;
    // One byte of headroom for the terminating newline
    const std::size_t n = asio::read_until(
        socket_,
        asio::dynamic_buffer(buffer_, max_message_size_ + 1),
        '\n',
        ec
    );

    if (!ec) {
        std::string frame = buffer_.substr(0, n - 1);
        buffer_.erase(0, n);
        return std::optional<std::string>{std::move(frame)};
    }

    if (ec == asio::error::eof) {
        // A final message without a trailing newline is still a message
        if (buffer_.empty()) {
            return std::optional<std::string>{};
        }
        std::string frame;
        frame.swap(buffer_);
        return std::optional<std::string>{std::move(frame)};
    }

    if (ec == asio::error::not_found) {
        return tl::unexpected(TransportError::frame_too_large(max_message_size_));
    }

    return tl::unexpected(TransportError::network(ec.message()));
}

TransportResult<void> Connection::write_message(const Message& message) {
    const std::string frame = encode_frame(message);
    asio::error_code ec;
    asio::write(socket_, asio::buffer(frame), ec);
    if (ec) {
        return tl::unexpected(TransportError::network(ec.message()));
    }
    return {};
}

// ═══════════════════════════════════════════════════════════════════════════
// TcpServer
// ═══════════════════════════════════════════════════════════════════════════

TcpServer::TcpServer(ServerConfig config, std::shared_ptr<const Dispatcher> dispatcher)
    : config_(std::move(config))
    , dispatcher_(std::move(dispatcher))
    , acceptor_(io_context_)
    , accept_retry_(io_context_)
{
    if (!dispatcher_) {
        throw std::invalid_argument("TcpServer: dispatcher cannot be null");
    }
}

TcpServer::~TcpServer() {
    stop();
}

TransportResult<asio::ip::tcp::endpoint> TcpServer::start() {
    if (running_.load()) {
        return tl::unexpected(TransportError::bind("server already started"));
    }

    asio::error_code ec;
    const auto address = asio::ip::make_address(config_.host, ec);
    if (ec) {
        return tl::unexpected(TransportError::bind("invalid host '" + config_.host + "': " + ec.message()));
    }

    const asio::ip::tcp::endpoint endpoint(address, config_.port);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        asio::error_code ignored;
        acceptor_.close(ignored);
        return tl::unexpected(TransportError::bind(
            "cannot listen on " + config_.host + ":" + std::to_string(config_.port) + ": " + ec.message()));
    }

    const auto bound = acceptor_.local_endpoint(ec);
    if (ec) {
        return tl::unexpected(TransportError::bind("cannot read bound endpoint: " + ec.message()));
    }

    running_.store(true);
    asio::co_spawn(io_context_, accept_loop(), asio::detached);

    MCPS_LOG_INFO("Listening on " + bound.address().to_string() + ":" + std::to_string(bound.port()));
    return bound;
}

void TcpServer::run() {
    io_context_.run();
}

void TcpServer::stop() {
    bool was_running = true;
    if (running_.compare_exchange_strong(was_running, false) == false) {
        return;
    }

    MCPS_LOG_INFO("Stopping server");

    // The acceptor belongs to the io_context thread
    asio::post(io_context_, [this]() {
        asio::error_code ec;
        acceptor_.close(ec);
        accept_retry_.cancel();
    });

    std::vector<std::unique_ptr<Connection>> draining;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        draining.swap(connections_);
    }
    for (auto& connection : draining) {
        connection->shutdown_receive();
    }
    for (auto& connection : draining) {
        connection->join();
    }

    MCPS_LOG_INFO("Server stopped; drained " + std::to_string(draining.size()) + " connection(s)");
}

std::size_t TcpServer::active_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return static_cast<std::size_t>(std::count_if(
        connections_.begin(), connections_.end(),
        [](const auto& connection) { return connection->finished() == false; }));
}

void TcpServer::reap_finished() {
    std::vector<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto split = std::stable_partition(
            connections_.begin(), connections_.end(),
            [](const auto& connection) { return connection->finished() == false; });
        std::move(split, connections_.end(), std::back_inserter(finished));
        connections_.erase(split, connections_.end());
    }
    // Threads have left run(); joining is immediate
    for (auto& connection : finished) {
        connection->join();
    }
}

asio::awaitable<void> TcpServer::accept_loop() {
    while (running_.load()) {
        asio::ip::tcp::socket socket(io_context_);
        bool failed = false;
        try {
            socket = co_await acceptor_.async_accept(asio::use_awaitable);
        } catch (const std::system_error& e) {
            if (e.code() == asio::error::operation_aborted || running_.load() == false) {
                break;
            }
            MCPS_LOG_WARN(std::string("accept failed: ") + e.what());
            failed = true;
        }
        if (failed) {
            // The pending connection stays queued, so an immediate retry fails the same way
            asio::error_code ec;
            accept_retry_.expires_after(kAcceptRetryDelay);
            co_await accept_retry_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            continue;
        }

        reap_finished();

        auto connection = std::make_unique<Connection>(std::move(socket), *dispatcher_, config_.max_message_size);
        std::lock_guard<std::mutex> lock(connections_mutex_);
        if (running_.load() == false) {
            // stop() already drained; this socket closes with the Connection
            break;
        }
        connection->start();
        connections_.push_back(std::move(connection));
    }
}

}  // namespace mcps
