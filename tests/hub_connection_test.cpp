// ═══════════════════════════════════════════════════════════════════════════
// HubConnection Tests
// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle, receive framing, cancellation, and the typed senders, driven
// through scripted connections instead of real sockets.

#include <catch2/catch_test_macros.hpp>

#include "hubpp/hub/hub_connection.hpp"
#include "hubpp/protocol/json_hub_protocol.hpp"

#include "mocks/mock_connection.hpp"
#include "mocks/scripted_hub_protocol.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace hubpp;
using hubpp::testing::MockConnection;
using hubpp::testing::ScriptedHubProtocol;
using namespace std::chrono_literals;

namespace {

struct HubFixture {
    MockConnection* connection;
    std::shared_ptr<ScriptedHubProtocol> protocol = std::make_shared<ScriptedHubProtocol>();
    std::unique_ptr<HubConnection> hub;

    explicit HubFixture(HubConnectionConfig config = {}) {
        auto owned = std::make_unique<MockConnection>("conn-1");
        connection = owned.get();
        hub = std::make_unique<HubConnection>(std::move(owned), protocol, config);
    }
};

// Keeps the mock observable after the HubConnection that owns this is gone.
class SharedConnection final : public IConnection {
public:
    explicit SharedConnection(std::shared_ptr<MockConnection> inner)
        : inner_(std::move(inner))
    {}

    HubResult<std::size_t> read(std::span<char> buffer) override { return inner_->read(buffer); }
    HubResult<std::size_t> write(std::string_view data) override { return inner_->write(data); }
    [[nodiscard]] std::string connection_id() const override { return inner_->connection_id(); }
    void close() override { inner_->close(); }

private:
    std::shared_ptr<MockConnection> inner_;
};

// Decode everything a HubConnection wrote with the JSON protocol.
std::vector<HubMessage> decode_all(std::string bytes) {
    JsonHubProtocol protocol;
    std::vector<HubMessage> messages;
    while (true) {
        auto message = protocol.read_message(bytes);
        if (!message || !message->has_value()) {
            break;
        }
        messages.push_back(std::move(**message));
    }
    return messages;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("HubConnection starts Idle", "[hub][lifecycle]") {
    HubFixture fixture;

    REQUIRE(fixture.hub->state() == HubState::Idle);
    REQUIRE(fixture.hub->is_connected() == false);
    REQUIRE(fixture.hub->connection_id() == "conn-1");
    REQUIRE(fixture.hub->token().is_cancelled() == false);
}

TEST_CASE("start moves Idle to Connected once", "[hub][lifecycle]") {
    HubFixture fixture;

    REQUIRE(fixture.hub->start());
    REQUIRE(fixture.hub->is_connected());
    REQUIRE(fixture.hub->start() == false);
    REQUIRE(fixture.hub->state() == HubState::Connected);
}

TEST_CASE("Concurrent start succeeds exactly once", "[hub][lifecycle][concurrency]") {
    HubFixture fixture;
    std::atomic<bool> go{false};
    std::atomic<int> successes{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            while (go.load() == false) {
                std::this_thread::yield();
            }
            if (fixture.hub->start()) {
                successes.fetch_add(1);
            }
        });
    }
    go = true;
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(successes.load() == 1);
    REQUIRE(fixture.hub->is_connected());
}

TEST_CASE("start does not leave a terminal state", "[hub][lifecycle]") {
    HubFixture closed;
    static_cast<void>(closed.hub->close());
    REQUIRE(closed.hub->state() == HubState::Closed);
    REQUIRE(closed.hub->start() == false);

    HubFixture aborted;
    aborted.hub->start();
    aborted.hub->abort();
    REQUIRE(aborted.hub->state() == HubState::Aborted);
    REQUIRE(aborted.hub->start() == false);
    REQUIRE(aborted.hub->is_connected() == false);
}

TEST_CASE("Destroying the HubConnection closes the connection", "[hub][lifecycle]") {
    auto inner = std::make_shared<MockConnection>();
    {
        HubConnection hub(std::make_unique<SharedConnection>(inner), std::make_shared<ScriptedHubProtocol>());
        hub.start();
        REQUIRE(inner->is_closed() == false);
    }
    REQUIRE(inner->is_closed());
}

TEST_CASE("HubConnection rejects a missing connection or protocol", "[hub][lifecycle]") {
    REQUIRE_THROWS_AS(
        HubConnection(nullptr, std::make_shared<ScriptedHubProtocol>()),
        std::invalid_argument
    );
    REQUIRE_THROWS_AS(
        HubConnection(std::make_unique<MockConnection>(), nullptr),
        std::invalid_argument
    );
}

// ═══════════════════════════════════════════════════════════════════════════
// close
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("close sends a reconnectable CloseMessage", "[hub][close]") {
    HubFixture fixture;
    fixture.hub->start();

    auto result = fixture.hub->close("boom");

    REQUIRE(result.ok());
    REQUIRE(result.message.type == MessageType::Close);
    REQUIRE(result.message.error == "boom");
    REQUIRE(result.message.allow_reconnect);

    REQUIRE(fixture.hub->state() == HubState::Closed);
    REQUIRE(fixture.hub->is_connected() == false);

    const auto written = fixture.protocol->written();
    REQUIRE(written.size() == 1);
    REQUIRE(message_type(written[0]) == MessageType::Close);
}

TEST_CASE("close without an error leaves the error unset", "[hub][close]") {
    HubFixture fixture;
    fixture.hub->start();

    auto result = fixture.hub->close();

    REQUIRE(result.message.error.has_value() == false);
    REQUIRE(result.message.allow_reconnect);
}

TEST_CASE("close leaves the cancellation scope and connection alone", "[hub][close]") {
    HubFixture fixture;
    fixture.connection->block_when_empty();
    fixture.hub->start();

    auto pending = std::async(std::launch::async, [&fixture]() { return fixture.hub->receive(); });
    std::this_thread::sleep_for(50ms);

    auto closed = fixture.hub->close("boom");
    REQUIRE(closed.ok());
    REQUIRE(fixture.hub->token().is_cancelled() == false);
    REQUIRE(fixture.connection->is_closed() == false);

    // close alone does not unblock the receive.
    REQUIRE(pending.wait_for(100ms) == std::future_status::timeout);

    fixture.hub->abort();
    REQUIRE(pending.wait_for(2s) == std::future_status::ready);
    REQUIRE(pending.get().error().is_cancelled());
}

// ═══════════════════════════════════════════════════════════════════════════
// abort
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("abort unblocks a pending receive with Cancelled", "[hub][abort]") {
    HubFixture fixture;
    fixture.connection->block_when_empty();
    fixture.hub->start();

    auto pending = std::async(std::launch::async, [&fixture]() { return fixture.hub->receive(); });
    std::this_thread::sleep_for(50ms);
    REQUIRE(pending.wait_for(0ms) == std::future_status::timeout);

    fixture.hub->abort();

    REQUIRE(pending.wait_for(2s) == std::future_status::ready);
    auto result = pending.get();
    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == HubError::Code::Cancelled);

    REQUIRE(fixture.hub->token().is_cancelled());
    REQUIRE(fixture.connection->is_closed());
    REQUIRE(fixture.hub->state() == HubState::Aborted);
}

TEST_CASE("Calls after abort return Cancelled without I/O", "[hub][abort]") {
    HubFixture fixture;
    fixture.connection->push_incoming("ping\n");
    fixture.hub->start();
    fixture.hub->abort();
    fixture.hub->abort();

    auto received = fixture.hub->receive();
    REQUIRE(received.error().is_cancelled());
    REQUIRE(fixture.connection->read_calls() == 0);

    auto sent = fixture.hub->send_invocation("Send", "hi");
    REQUIRE(sent.ok() == false);
    REQUIRE(sent.status.error().is_cancelled());
    REQUIRE(sent.message.target == "Send");
    REQUIRE(fixture.protocol->written().empty());
}

TEST_CASE("abort cancels a blocked send after its write returns", "[hub][abort][send]") {
    HubFixture fixture;
    fixture.connection->block_writes();
    fixture.hub->start();

    auto pending = std::async(std::launch::async, [&fixture]() {
        return fixture.hub->send_invocation("Send", "hi");
    });
    while (fixture.connection->write_calls() == 0) {
        std::this_thread::sleep_for(1ms);
    }
    REQUIRE(pending.wait_for(50ms) == std::future_status::timeout);

    fixture.hub->abort();

    REQUIRE(pending.wait_for(2s) == std::future_status::ready);
    auto sent = pending.get();
    REQUIRE(sent.ok() == false);
    REQUIRE(sent.status.error().is_cancelled());
    REQUIRE(sent.message.target == "Send");
    REQUIRE(sent.message.arguments == Json::array({"hi"}));

    // The write worker finished before send_invocation returned.
    REQUIRE(fixture.connection->finished_writes() == 1);
    REQUIRE(fixture.connection->writes().empty());
}

TEST_CASE("abort is observable through the token", "[hub][abort]") {
    HubFixture fixture;
    bool notified = false;
    auto registration = fixture.hub->token().on_cancel([&notified]() { notified = true; });

    fixture.hub->abort();

    REQUIRE(notified);
}

// ═══════════════════════════════════════════════════════════════════════════
// receive
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("receive returns a complete message", "[hub][receive]") {
    HubFixture fixture;
    fixture.connection->push_incoming("ping\n");
    fixture.hub->start();

    auto message = fixture.hub->receive();

    REQUIRE(message.has_value());
    REQUIRE(std::holds_alternative<PingMessage>(*message));
}

TEST_CASE("receive reassembles a message split across reads", "[hub][receive]") {
    HubFixture fixture;
    fixture.connection->push_incoming("Hel");
    fixture.connection->push_incoming("lo\n");
    fixture.hub->start();

    auto message = fixture.hub->receive();

    REQUIRE(message.has_value());
    REQUIRE(std::get<InvocationMessage>(*message).target == "Hello");
    REQUIRE(fixture.connection->read_calls() == 2);
}

TEST_CASE("receive reads at most the configured size per read", "[hub][receive]") {
    HubFixture fixture(HubConnectionConfig{}.with_maximum_receive_message_size(4));
    fixture.connection->push_incoming("LongerThanFour\n");
    fixture.hub->start();

    auto message = fixture.hub->receive();

    REQUIRE(message.has_value());
    REQUIRE(std::get<InvocationMessage>(*message).target == "LongerThanFour");
    REQUIRE(fixture.connection->read_calls() == 4);
}

TEST_CASE("Bytes after a message are kept for the next receive", "[hub][receive]") {
    HubFixture fixture;
    fixture.connection->push_incoming("First\nSecond\nThi");
    fixture.connection->push_incoming("rd\n");
    fixture.hub->start();

    auto first = fixture.hub->receive();
    auto second = fixture.hub->receive();

    REQUIRE(std::get<InvocationMessage>(*first).target == "First");
    REQUIRE(std::get<InvocationMessage>(*second).target == "Second");
    REQUIRE(fixture.connection->read_calls() == 1);

    auto third = fixture.hub->receive();
    REQUIRE(std::get<InvocationMessage>(*third).target == "Third");
    REQUIRE(fixture.connection->read_calls() == 2);
}

TEST_CASE("receive returns protocol errors", "[hub][receive][errors]") {
    HubFixture fixture;
    fixture.connection->push_incoming("bad\nping\n");
    fixture.hub->start();

    auto bad = fixture.hub->receive();
    REQUIRE(bad.has_value() == false);
    REQUIRE(bad.error().code == HubError::Code::ProtocolError);

    auto next = fixture.hub->receive();
    REQUIRE(next.has_value());
    REQUIRE(std::holds_alternative<PingMessage>(*next));
}

TEST_CASE("receive returns Closed when the peer ends the stream", "[hub][receive][errors]") {
    HubFixture fixture;
    fixture.connection->push_incoming("partial");
    fixture.hub->start();

    auto result = fixture.hub->receive();

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code == HubError::Code::Closed);
}

TEST_CASE("receive decodes JSON frames end to end", "[hub][receive][json]") {
    auto connection = std::make_unique<MockConnection>();
    connection->push_incoming("{\"type\":1,\"target\":\"Rece");
    connection->push_incoming("ive\",\"arguments\":[\"hi\"]}\x1e{\"type\":6}\x1e");
    HubConnection hub(std::move(connection), std::make_shared<JsonHubProtocol>());
    hub.start();

    auto invocation = hub.receive();
    auto ping = hub.receive();

    REQUIRE(invocation.has_value());
    REQUIRE(std::get<InvocationMessage>(*invocation).target == "Receive");
    REQUIRE(std::get<InvocationMessage>(*invocation).arguments == Json::array({"hi"}));
    REQUIRE(std::holds_alternative<PingMessage>(*ping));
}

// ═══════════════════════════════════════════════════════════════════════════
// Typed senders
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Senders write through the protocol", "[hub][send]") {
    auto inner = std::make_shared<MockConnection>();
    HubConnection hub(std::make_unique<SharedConnection>(inner), std::make_shared<JsonHubProtocol>());
    hub.start();

    auto invocation = hub.send_invocation("Send", "alice", 42, true);
    auto item = hub.stream_item("s1", Json{{"n", 1}});
    auto done = hub.completion("7", Json("ok"));
    auto failed = hub.completion("8", std::nullopt, std::string("nope"));
    auto ping = hub.ping();

    REQUIRE(invocation.ok());
    REQUIRE(item.ok());
    REQUIRE(done.ok());
    REQUIRE(failed.ok());
    REQUIRE(ping.ok());

    REQUIRE(invocation.message.arguments == Json::array({"alice", 42, true}));
    REQUIRE(done.message.result.value() == "ok");
    REQUIRE(failed.message.error == "nope");

    const auto messages = decode_all(inner->written());
    REQUIRE(messages.size() == 5);
    REQUIRE(message_type(messages[0]) == MessageType::Invocation);
    REQUIRE(message_type(messages[1]) == MessageType::StreamItem);
    REQUIRE(std::get<StreamItemMessage>(messages[1]).item["n"] == 1);
    REQUIRE(message_type(messages[2]) == MessageType::Completion);
    REQUIRE(std::get<CompletionMessage>(messages[2]).result.value() == "ok");
    REQUIRE(std::get<CompletionMessage>(messages[3]).error == "nope");
    REQUIRE(message_type(messages[4]) == MessageType::Ping);
}

TEST_CASE("send_invocation without arguments sends an empty array", "[hub][send]") {
    HubFixture fixture;

    auto sent = fixture.hub->send_invocation("Refresh");

    REQUIRE(sent.ok());
    REQUIRE(sent.message.arguments == Json::array());
}

TEST_CASE("send_invocation_with accepts prebuilt arguments", "[hub][send]") {
    HubFixture fixture;

    auto array = fixture.hub->send_invocation_with("A", Json::array({1, 2}));
    auto single = fixture.hub->send_invocation_with("B", Json{{"k", "v"}});
    auto none = fixture.hub->send_invocation_with("C", Json());

    REQUIRE(array.message.arguments == Json::array({1, 2}));
    REQUIRE(single.message.arguments.size() == 1);
    REQUIRE(single.message.arguments[0]["k"] == "v");
    REQUIRE(none.message.arguments == Json::array());
}

TEST_CASE("Write failures come back with the message", "[hub][send][errors]") {
    HubFixture fixture;
    fixture.connection->fail_writes(HubError::io("broken pipe"));
    fixture.hub->start();

    auto sent = fixture.hub->ping();

    REQUIRE(sent.ok() == false);
    REQUIRE(sent.status.error().code == HubError::Code::Io);
    REQUIRE(sent.message.type == MessageType::Ping);

    // A failed write does not change the lifecycle.
    REQUIRE(fixture.hub->is_connected());
}

TEST_CASE("Strings that are not UTF-8 fail the send instead of throwing", "[hub][send][errors]") {
    auto inner = std::make_shared<MockConnection>();
    HubConnection hub(std::make_unique<SharedConnection>(inner), std::make_shared<JsonHubProtocol>());
    hub.start();

    const std::string invalid = "\xff\xfe";

    auto invocation = hub.send_invocation("Foo", invalid);
    REQUIRE(invocation.ok() == false);
    REQUIRE(invocation.status.error().code == HubError::Code::ProtocolError);
    REQUIRE(invocation.message.arguments[0] == invalid);

    auto item = hub.stream_item("s1", Json(invalid));
    REQUIRE(item.status.error().code == HubError::Code::ProtocolError);

    auto closed = hub.close("bad \xc3");
    REQUIRE(closed.ok() == false);
    REQUIRE(closed.status.error().code == HubError::Code::ProtocolError);
    REQUIRE(closed.message.error == "bad \xc3");

    REQUIRE(inner->written().empty());

    // The session is still usable.
    auto ping = hub.ping();
    REQUIRE(ping.ok());
}

// ═══════════════════════════════════════════════════════════════════════════
// Items
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("items store caller values", "[hub][items]") {
    HubFixture fixture;

    fixture.hub->items()["user"] = std::string("alice");
    fixture.hub->items()["retries"] = 3;

    REQUIRE(fixture.hub->items().size() == 2);
    REQUIRE(std::any_cast<std::string>(fixture.hub->items().at("user")) == "alice");
    REQUIRE(std::any_cast<int>(fixture.hub->items().at("retries")) == 3);
}
