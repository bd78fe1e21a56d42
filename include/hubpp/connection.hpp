#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Connection Capability
// ═══════════════════════════════════════════════════════════════════════════
// The narrow byte-stream view of an established transport. HubConnection
// only ever talks to this interface; the WebSocket and SSE connections in
// hubpp/transport/ implement it, and tests substitute scripted streams.

#include "hubpp/error.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace hubpp {

class IConnection {
public:
    virtual ~IConnection() = default;

    /// Read at most buffer.size() bytes. Blocks until at least one byte is
    /// available. A zero-byte success is never returned: end of stream is
    /// reported as HubError::Code::Closed.
    [[nodiscard]] virtual HubResult<std::size_t> read(std::span<char> buffer) = 0;

    /// Write data; returns the number of bytes accepted.
    [[nodiscard]] virtual HubResult<std::size_t> write(std::string_view data) = 0;

    /// Identifier from negotiation (connectionId, never the token).
    [[nodiscard]] virtual std::string connection_id() const = 0;

    /// Tear down the stream. Unblocks a concurrent read(). Idempotent.
    virtual void close() = 0;
};

}  // namespace hubpp
