#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// TCP Server
// ═══════════════════════════════════════════════════════════════════════════
// The accept loop is a coroutine on an io_context driven by run(). Each
// accepted socket becomes a Connection with its own thread running a
// blocking read -> dispatch -> write loop, so a slow tool call stalls only
// the connection that made it.
//
// Shutdown: stop() closes the acceptor, half-closes the receive side of
// every connection and joins them. A request already being handled is
// answered before its connection ends.

#include "mcps/server/dispatcher.hpp"
#include "mcps/server/server_config.hpp"
#include "mcps/server/session.hpp"
#include "mcps/transport/transport_error.hpp"

#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcps {

// ─────────────────────────────────────────────────────────────────────────────
// Connection - one client, one thread, one Session
// ─────────────────────────────────────────────────────────────────────────────

class Connection {
public:
    Connection(asio::ip::tcp::socket socket, const Dispatcher& dispatcher, std::size_t max_message_size);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Launch the connection thread.
    void start();

    /// Stop reading new requests. The loop finishes the current one, writes
    /// its response, then sees end-of-stream. Safe from any thread.
    void shutdown_receive() noexcept;

    void join();

    [[nodiscard]] bool finished() const noexcept { return finished_.load(); }
    [[nodiscard]] const std::string& peer() const noexcept { return peer_; }

private:
    void run();

    /// Next raw frame without its newline; nullopt at end of stream.
    TransportResult<std::optional<std::string>> read_frame();
    TransportResult<void> write_message(const Message& message);
    void close_socket() noexcept;

    asio::ip::tcp::socket socket_;
    const Dispatcher& dispatcher_;
    std::size_t max_message_size_;
    std::string peer_;
    std::string buffer_;
    Session session_;

    std::thread thread_;
    std::atomic<bool> finished_{false};

    std::mutex socket_mutex_;  // guards close vs. shutdown from stop()
    bool socket_closed_ = false;
};

// ─────────────────────────────────────────────────────────────────────────────
// TcpServer
// ─────────────────────────────────────────────────────────────────────────────

class TcpServer {
public:
    /// Pause after a failed accept (EMFILE, ENOBUFS, ...) before trying again.
    static constexpr std::chrono::milliseconds kAcceptRetryDelay{100};

    TcpServer(ServerConfig config, std::shared_ptr<const Dispatcher> dispatcher);
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    /// Bind, listen and queue the accept loop. Returns the bound endpoint,
    /// which carries the real port when the configured port is 0.
    [[nodiscard]] TransportResult<asio::ip::tcp::endpoint> start();

    /// Drive the accept loop until stop(). Blocks.
    void run();

    /// Idempotent; callable from any thread, including an io_context handler.
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// Connections whose loop has not finished yet.
    [[nodiscard]] std::size_t active_connections() const;

    /// For signal_set and timers that should share the accept loop's context.
    [[nodiscard]] asio::io_context& io_context() noexcept { return io_context_; }

private:
    asio::awaitable<void> accept_loop();
    void reap_finished();

    ServerConfig config_;
    std::shared_ptr<const Dispatcher> dispatcher_;

    asio::io_context io_context_;
    asio::ip::tcp::acceptor acceptor_;
    asio::steady_timer accept_retry_;
    std::atomic<bool> running_{false};

    mutable std::mutex connections_mutex_;
    std::vector<std::unique_ptr<Connection>> connections_;
};

}  // namespace mcps
