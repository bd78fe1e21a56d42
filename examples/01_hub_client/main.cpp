// Example 01: Hub Client
//
// Negotiate with a hub endpoint, open the best transport, run the JSON
// protocol handshake, then send a ping and an invocation and print what
// the server sends back.

#include <hubpp/hub/hub_connection.hpp>
#include <hubpp/log/spdlog_logger.hpp>
#include <hubpp/protocol/json_hub_protocol.hpp>
#include <hubpp/transport/http_connection.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

using namespace hubpp;

namespace {

// Send {"protocol":"json","version":1} and wait for the server's reply.
// The reply is read one byte at a time so no hub frame after it is consumed.
HubResult<void> handshake(IConnection& connection) {
    const std::string request = JsonHubProtocol::handshake_request();
    auto written = connection.write(request);
    if (!written) {
        return tl::unexpected(written.error());
    }

    std::string reply;
    char byte = 0;
    while (true) {
        auto count = connection.read(std::span<char>(&byte, 1));
        if (!count) {
            return tl::unexpected(count.error());
        }
        if (byte == kRecordSeparator) {
            break;
        }
        reply.push_back(byte);
    }

    auto doc = read_json(reply);
    if (!doc) {
        return tl::unexpected(doc.error());
    }
    if (doc->contains("error")) {
        return tl::unexpected(HubError::protocol_error("Handshake rejected: " + doc->at("error").dump()));
    }
    return {};
}

void print_message(const HubMessage& message) {
    std::cout << "  <- " << to_string(message_type(message)) << " " << to_json(message).dump() << "\n";
}

}  // namespace

int main() {
    std::cout << "=== Hub Client Example ===\n\n";

    const char* url_env = std::getenv("HUB_URL");
    const char* token_env = std::getenv("HUB_TOKEN");

    if (!url_env) {
        std::cerr << "Please set HUB_URL environment variable\n";
        std::cerr << "Example: export HUB_URL=\"http://localhost:5000/chat\"\n";
        return 1;
    }

    std::string address = url_env;
    std::string token = token_env ? token_env : "";

    std::cout << "Hub URL: " << address << "\n";
    std::cout << "Token: " << (token.empty() ? "(none)" : "****") << "\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Debug));

    // 1. Configure the connection
    HttpConnectionOptions options;
    options.with_connect_timeout(std::chrono::seconds(10))
           .with_header("User-Agent", "hubpp-example");
    if (!token.empty()) {
        options.with_bearer_token(token);
    }

    // 2. Negotiate and open the transport
    std::cout << "Connecting...\n";
    CancellationSource connect_scope;
    auto connection = make_http_connection(connect_scope.token(), address, options);
    if (!connection) {
        std::cerr << "Failed to connect: " << connection.error().message << "\n";
        return 1;
    }
    if (*connection == nullptr) {
        std::cerr << "Server offers no supported transport\n";
        return 1;
    }
    std::cout << "Connected as " << (*connection)->connection_id() << "\n\n";

    // 3. Protocol handshake
    auto handshake_result = handshake(**connection);
    if (!handshake_result) {
        std::cerr << "Handshake failed: " << handshake_result.error().message << "\n";
        return 1;
    }

    // 4. Hub session
    HubConnection hub(std::move(*connection), std::make_shared<JsonHubProtocol>());
    hub.start();

    auto ping = hub.ping();
    if (!ping.ok()) {
        std::cerr << "Ping failed: " << ping.status.error().message << "\n";
    }

    auto invocation = hub.send_invocation("Send", "hubpp", "hello from C++");
    if (!invocation.ok()) {
        std::cerr << "Invocation failed: " << invocation.status.error().message << "\n";
    }

    // 5. Print the next few messages
    std::cout << "=== Messages ===\n";
    for (int i = 0; i < 5; ++i) {
        auto message = hub.receive();
        if (!message) {
            std::cerr << "  Receive failed: " << message.error().message << "\n";
            break;
        }
        print_message(*message);
        if (std::holds_alternative<CloseMessage>(*message)) {
            break;
        }
    }
    std::cout << "\n";

    // 6. Close
    std::cout << "Closing...\n";
    auto closed = hub.close();
    if (!closed.ok()) {
        std::cerr << "Close failed: " << closed.status.error().message << "\n";
    }
    hub.abort();
    std::cout << "Done!\n";

    return 0;
}
