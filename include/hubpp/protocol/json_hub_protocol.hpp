#pragma once

#include "hubpp/json/json_reader.hpp"
#include "hubpp/protocol/hub_protocol.hpp"

#include <string>

namespace hubpp {

/// Terminates every frame of the JSON hub protocol.
inline constexpr char kRecordSeparator = '\x1e';

// ─────────────────────────────────────────────────────────────────────────────
// JsonHubProtocol
// ─────────────────────────────────────────────────────────────────────────────
// Text frames: one JSON object followed by 0x1E. Several frames may share a
// read, and a frame may span reads.
//
//   {"type":1,"target":"Send","arguments":["hi"]}\x1e{"type":6}\x1e

class JsonHubProtocol final : public IHubProtocol {
public:
    JsonHubProtocol() = default;
    explicit JsonHubProtocol(JsonReaderConfig config) : reader_(config) {}

    [[nodiscard]] HubResult<std::optional<HubMessage>> read_message(std::string& buffer) override;

    [[nodiscard]] HubResult<void> write_message(const HubMessage& message, IConnection& connection) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "json"; }

    /// JSON text of message followed by the record separator. Throws
    /// Json::type_error when a string in the message is not valid UTF-8;
    /// write_message() reports that as ProtocolError instead.
    [[nodiscard]] static std::string encode(const HubMessage& message);

    /// {"protocol":"json","version":1} plus separator, sent once after connect.
    [[nodiscard]] static std::string handshake_request();

private:
    JsonReader reader_;
};

}  // namespace hubpp
