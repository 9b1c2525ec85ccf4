#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared by the process transport and anything that drives it.
//
// HTTP lives in "mcpenum/transport/http_client.hpp",
// subprocesses in "mcpenum/transport/process_transport.hpp".

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcpenum {

using Json = nlohmann::json;

/// Error type for transport operations
struct TransportError {
    enum class Category {
        Spawn,      // child could not be started
        Closed,     // peer exited or closed its end
        Io,         // read/write failure on an open channel
        Timeout,    // deadline reached while waiting
        Cancelled,  // caller withdrew the request
        Protocol    // framing or payload violated the wire format
    };

    Category category{};
    std::string message;
    std::optional<int> sys_errno{};

    [[nodiscard]] static TransportError make(Category category, std::string message) {
        return TransportError{category, std::move(message), std::nullopt};
    }

    /// Start failures caused by resource exhaustion; worth one more attempt
    [[nodiscard]] bool is_transient_spawn_failure() const noexcept;
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Spawn:     return "Spawn";
        case TransportError::Category::Closed:    return "Closed";
        case TransportError::Category::Io:        return "Io";
        case TransportError::Category::Timeout:   return "Timeout";
        case TransportError::Category::Cancelled: return "Cancelled";
        case TransportError::Category::Protocol:  return "Protocol";
    }
    return "Unknown";
}

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace mcpenum
