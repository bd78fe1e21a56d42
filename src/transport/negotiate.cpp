#include "hubpp/transport/negotiate.hpp"
#include "hubpp/json/json_reader.hpp"
#include "hubpp/log/logger.hpp"

#include <algorithm>

namespace hubpp {

namespace {

HubError wrong_type(std::string_view field, std::string_view expected) {
    return HubError::parse_error(
        "Negotiate field '" + std::string(field) + "' must be " + std::string(expected)
    );
}

HubResult<std::optional<std::string>> string_field(const Json& j, const char* field) {
    const auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return std::optional<std::string>();
    }
    if (it->is_string() == false) {
        return tl::unexpected(wrong_type(field, "a string"));
    }
    return std::optional<std::string>(it->get<std::string>());
}

HubResult<AvailableTransport> transport_from_json(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(wrong_type("availableTransports", "an array of objects"));
    }

    auto name = string_field(j, "transport");
    if (!name) {
        return tl::unexpected(name.error());
    }

    AvailableTransport transport;
    transport.transport = name->value_or("");

    const auto formats = j.find("transferFormats");
    if (formats != j.end() && formats->is_null() == false) {
        if (formats->is_array() == false) {
            return tl::unexpected(wrong_type("transferFormats", "an array"));
        }
        for (const auto& format : *formats) {
            if (format.is_string() == false) {
                return tl::unexpected(wrong_type("transferFormats", "an array of strings"));
            }
            transport.transfer_formats.push_back(format.get<std::string>());
        }
    }
    return transport;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// NegotiateResponse
// ─────────────────────────────────────────────────────────────────────────────

std::optional<std::vector<std::string>> NegotiateResponse::transfer_formats(std::string_view transport) const {
    const auto it = std::ranges::find_if(available_transports, [transport](const auto& entry) {
        return entry.transport == transport;
    });
    if (it == available_transports.end()) {
        return std::nullopt;
    }
    return it->transfer_formats;
}

bool NegotiateResponse::offers(std::string_view transport) const noexcept {
    return std::ranges::any_of(available_transports, [transport](const auto& entry) {
        return entry.transport == transport;
    });
}

Json NegotiateResponse::to_json() const {
    Json j = Json::object();
    j["connectionId"] = connection_id;
    if (connection_token.has_value()) {
        j["connectionToken"] = *connection_token;
    }
    if (negotiate_version.has_value()) {
        j["negotiateVersion"] = *negotiate_version;
    }
    Json transports = Json::array();
    for (const auto& entry : available_transports) {
        transports.push_back(Json{{"transport", entry.transport}, {"transferFormats", entry.transfer_formats}});
    }
    j["availableTransports"] = std::move(transports);
    return j;
}

HubResult<NegotiateResponse> NegotiateResponse::from_json(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(HubError::parse_error("Negotiate response must be a JSON object"));
    }

    auto error = string_field(j, "error");
    if (!error) {
        return tl::unexpected(error.error());
    }
    if (error->has_value()) {
        return tl::unexpected(HubError::negotiation_failed(**error));
    }

    auto connection_id = string_field(j, "connectionId");
    if (!connection_id) {
        return tl::unexpected(connection_id.error());
    }
    auto connection_token = string_field(j, "connectionToken");
    if (!connection_token) {
        return tl::unexpected(connection_token.error());
    }

    NegotiateResponse response;
    response.connection_id = connection_id->value_or("");
    const bool has_token = connection_token->has_value() && (connection_token->value().empty() == false);
    if (has_token) {
        response.connection_token = std::move(*connection_token);
    }

    const auto version = j.find("negotiateVersion");
    if (version != j.end() && version->is_null() == false) {
        if (version->is_number_integer() == false) {
            return tl::unexpected(wrong_type("negotiateVersion", "an integer"));
        }
        response.negotiate_version = version->get<int>();
    }

    const auto transports = j.find("availableTransports");
    if (transports != j.end() && transports->is_null() == false) {
        if (transports->is_array() == false) {
            return tl::unexpected(wrong_type("availableTransports", "an array"));
        }
        for (const auto& entry : *transports) {
            auto transport = transport_from_json(entry);
            if (!transport) {
                return tl::unexpected(transport.error());
            }
            response.available_transports.push_back(std::move(*transport));
        }
    }
    return response;
}

// ─────────────────────────────────────────────────────────────────────────────
// negotiate
// ─────────────────────────────────────────────────────────────────────────────

HubResult<NegotiateResponse> negotiate(
    const CancellationToken& token,
    const std::string& address,
    IHttpClient& http_client,
    const HeaderProvider& headers,
    const QueryStringProvider& query_string
) {
    std::optional<std::string> query;
    if (query_string) {
        query = query_string();
    }

    const auto url = negotiate_url(address, query);
    if (!url.has_value()) {
        return tl::unexpected(HubError::invalid_url(address));
    }

    HeaderMap request_headers;
    if (headers) {
        request_headers = headers();
    }

    auto response = http_client.post(*url, "", "", request_headers, token);
    if (!response) {
        const HubError error = HubError::from_client_error(response.error());
        if (error.is_cancelled() == false) {
            get_logger().logf(LogLevel::Warn, "Negotiate request failed: {}", error.message);
        }
        return tl::unexpected(error);
    }

    if (response->status_code != 200) {
        const std::string message = to_string(HttpMethod::Post) + " " + *url + " -> " + response->status_text();
        get_logger().write(LogLevel::Warn, message);
        return tl::unexpected(HubError::http_error(response->status_code, message));
    }

    auto body = read_json(response->body);
    if (!body) {
        return tl::unexpected(body.error());
    }

    auto negotiated = NegotiateResponse::from_json(*body);
    if (!negotiated) {
        get_logger().logf(LogLevel::Warn, "Negotiate rejected: {}", negotiated.error().message);
        return tl::unexpected(negotiated.error());
    }

    get_logger().logf(LogLevel::Debug, "Negotiated connection {} with {} transport(s)",
        negotiated->connection_id,
        negotiated->available_transports.size()
    );
    return negotiated;
}

}  // namespace hubpp
