#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// HubProtocol Capability
// ═══════════════════════════════════════════════════════════════════════════
// Serializes hub messages onto a connection and parses them back out of an
// accumulation buffer owned by the caller.

#include "hubpp/connection.hpp"
#include "hubpp/error.hpp"
#include "hubpp/protocol/hub_messages.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace hubpp {

class IHubProtocol {
public:
    virtual ~IHubProtocol() = default;

    /// Parse the first complete message in buffer and erase exactly its
    /// bytes. Returns nullopt, leaving buffer untouched, when more data is
    /// needed. On error the offending frame is consumed.
    [[nodiscard]] virtual HubResult<std::optional<HubMessage>> read_message(std::string& buffer) = 0;

    /// Serialize message and write it to connection in full.
    [[nodiscard]] virtual HubResult<void> write_message(const HubMessage& message, IConnection& connection) = 0;

    /// Protocol name used in the handshake ("json").
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace hubpp
