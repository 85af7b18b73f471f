#ifndef MCPS_TRANSPORT_TRANSPORT_ERROR_HPP
#define MCPS_TRANSPORT_TRANSPORT_ERROR_HPP

#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace mcps {

// ─────────────────────────────────────────────────────────────────────────────
// Transport Error Types
// ─────────────────────────────────────────────────────────────────────────────
// Every TransportError ends the connection it happened on. Nothing here is
// ever sent to a client.

struct TransportError {
    enum class Category {
        Bind,            // could not listen on the configured address
        Network,         // reset, broken pipe, other socket failure
        FrameTooLarge,   // no newline within max_message_size; framing is lost
        Closed           // operation on a connection that already ended
    };

    Category category{Category::Network};
    std::string message;

    static TransportError bind(const std::string& msg) {
        return {Category::Bind, msg};
    }

    static TransportError network(const std::string& msg) {
        return {Category::Network, msg};
    }

    static TransportError frame_too_large(std::size_t limit) {
        return {Category::FrameTooLarge,
                "message exceeds " + std::to_string(limit) + " bytes without a newline"};
    }

    static TransportError closed() {
        return {Category::Closed, "connection is closed"};
    }
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Bind:          return "bind";
        case TransportError::Category::Network:       return "network";
        case TransportError::Category::FrameTooLarge: return "frame-too-large";
        case TransportError::Category::Closed:        return "closed";
    }
    return "unknown";
}

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace mcps

#endif  // MCPS_TRANSPORT_TRANSPORT_ERROR_HPP
