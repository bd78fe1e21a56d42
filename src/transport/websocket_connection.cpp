#include "hubpp/transport/websocket_connection.hpp"
#include "hubpp/log/logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>

namespace hubpp {

namespace {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

using PlainStream = websocket::stream<tcp::socket>;
using SecureStream = websocket::stream<ssl::stream<tcp::socket>>;

HubError to_hub_error(const beast::error_code& ec, std::string_view stage) {
    const std::string message = std::string(stage) + ": " + ec.message();

    if (ec.category() == net::error::get_ssl_category()) {
        return HubError::ssl_error(message);
    }
    if (ec == beast::error::timeout || ec == net::error::timed_out) {
        return HubError::timeout(message);
    }
    return HubError::connection_failed(message);
}

// ─────────────────────────────────────────────────────────────────────────────
// BeastWebSocketConnection
// ─────────────────────────────────────────────────────────────────────────────
// The stream is only ever touched by the connection's own I/O thread. read()
// and write() post an async operation there and block until its handler
// runs, so one receive and one send can overlap without sharing the stream
// (or the SSL object) between threads. Control frames answered by the read
// side go through the same thread.

template <typename Stream>
class BeastWebSocketConnection final : public IConnection {
public:
    BeastWebSocketConnection(
        std::unique_ptr<net::io_context> io,
        std::unique_ptr<ssl::context> tls,
        std::unique_ptr<Stream> ws,
        std::string connection_id
    )
        : io_(std::move(io))
        , tls_(std::move(tls))
        , ws_(std::move(ws))
        , connection_id_(std::move(connection_id))
        , work_(net::make_work_guard(*io_))
    {
        // The handshake ran the context until it was out of work.
        io_->restart();
        io_thread_ = std::thread([this]() { io_->run(); });
    }

    ~BeastWebSocketConnection() override {
        close();
        work_.reset();
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
    }

    BeastWebSocketConnection(const BeastWebSocketConnection&) = delete;
    BeastWebSocketConnection& operator=(const BeastWebSocketConnection&) = delete;

    HubResult<std::size_t> read(std::span<char> buffer) override {
        std::lock_guard<std::mutex> lock(read_mutex_);

        // Empty frames carry nothing; keep reading until bytes arrive.
        while (pending_.empty()) {
            if (closed_.load()) {
                return tl::unexpected(HubError::closed());
            }

            beast::flat_buffer frame;
            const auto ec = run_on_io([this, &frame](auto handler) {
                ws_->async_read(frame, std::move(handler));
            });
            if (ec) {
                const bool peer_closed = closed_.load() ||
                                         (ec == websocket::error::closed) ||
                                         (ec == net::error::eof);
                if (peer_closed) {
                    return tl::unexpected(HubError::closed("WebSocket closed"));
                }
                return tl::unexpected(HubError::io("WebSocket read failed: " + ec.message()));
            }
            pending_ = beast::buffers_to_string(frame.data());
        }

        const std::size_t count = std::min(buffer.size(), pending_.size());
        std::memcpy(buffer.data(), pending_.data(), count);
        pending_.erase(0, count);
        return count;
    }

    HubResult<std::size_t> write(std::string_view data) override {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (closed_.load()) {
            return tl::unexpected(HubError::closed());
        }

        const auto ec = run_on_io([this, data](auto handler) {
            ws_->async_write(net::buffer(data.data(), data.size()), std::move(handler));
        });
        if (ec) {
            if (closed_.load()) {
                return tl::unexpected(HubError::closed());
            }
            return tl::unexpected(HubError::io("WebSocket write failed: " + ec.message()));
        }
        return data.size();
    }

    std::string connection_id() const override {
        return connection_id_;
    }

    void close() override {
        const bool was_closed = closed_.exchange(true);
        if (was_closed) {
            return;
        }
        // Closing the socket aborts the pending read and write with
        // operation_aborted; a close handshake would need the reader.
        net::post(*io_, [this]() {
            beast::error_code ec;
            auto& socket = beast::get_lowest_layer(*ws_);
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
        });
        get_logger().logf(LogLevel::Debug, "WebSocket {} closed", connection_id_);
    }

private:
    // Starts an operation on the I/O thread and waits for its completion.
    template <typename Initiate>
    beast::error_code run_on_io(Initiate initiate) {
        auto done = std::make_shared<std::promise<beast::error_code>>();
        auto result = done->get_future();
        net::post(*io_, [initiate = std::move(initiate), done]() mutable {
            initiate([done](beast::error_code ec, std::size_t /*bytes*/) {
                done->set_value(ec);
            });
        });
        return result.get();
    }

    std::unique_ptr<net::io_context> io_;
    std::unique_ptr<ssl::context> tls_;   // null for ws://
    std::unique_ptr<Stream> ws_;
    std::string connection_id_;

    net::executor_work_guard<net::io_context::executor_type> work_;
    std::thread io_thread_;

    std::mutex read_mutex_;
    std::string pending_;                 // frame bytes not yet handed out

    std::mutex write_mutex_;
    std::atomic<bool> closed_{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// Handshake
// ─────────────────────────────────────────────────────────────────────────────
// Resolve, connect, (TLS,) upgrade, all as async operations on io so the
// whole sequence shares one deadline and can be stopped from another thread.
// After this returns the connection's I/O thread takes the stream over.

template <typename Stream>
HubResult<void> handshake(
    net::io_context& io,
    Stream& ws,
    const UrlComponents& endpoint,
    const HeaderMap& headers,
    const CancellationToken& token,
    std::chrono::milliseconds timeout
) {
    constexpr bool kSecure = std::is_same_v<Stream, SecureStream>;

    tcp::resolver resolver(io);
    websocket::response_type response;
    std::optional<HubError> failure;
    bool upgraded = false;

    ws.set_option(websocket::stream_base::decorator([headers](websocket::request_type& request) {
        for (const auto& [name, value] : headers) {
            request.set(name, value);
        }
    }));
    ws.text(true);

    const std::string host = endpoint.host_with_port();
    const std::string target = endpoint.path_with_query();

    auto fail = [&](const beast::error_code& ec, std::string_view stage) {
        failure = to_hub_error(ec, stage);
    };

    auto on_upgrade = [&](beast::error_code ec) {
        if (ec == websocket::error::upgrade_declined) {
            const auto status = static_cast<int>(response.result_int());
            failure = HubError::http_error(
                status,
                "WebSocket upgrade rejected: " + std::to_string(status) + " " +
                    std::string(response.reason())
            );
            return;
        }
        if (ec) {
            fail(ec, "WebSocket handshake");
            return;
        }
        upgraded = true;
    };

    auto on_connect = [&](beast::error_code ec, const tcp::endpoint& /*peer*/) {
        if (ec) {
            fail(ec, "connect");
            return;
        }
        if constexpr (kSecure) {
            if (!::SSL_set_tlsext_host_name(ws.next_layer().native_handle(), endpoint.host.c_str())) {
                failure = HubError::ssl_error("Failed to set SNI host name");
                return;
            }
            ws.next_layer().async_handshake(ssl::stream_base::client, [&](beast::error_code tls_ec) {
                if (tls_ec) {
                    fail(tls_ec, "TLS handshake");
                    return;
                }
                ws.async_handshake(response, host, target, on_upgrade);
            });
        } else {
            ws.async_handshake(response, host, target, on_upgrade);
        }
    };

    resolver.async_resolve(
        endpoint.host,
        std::to_string(endpoint.port),
        [&](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) {
                fail(ec, "resolve " + endpoint.host);
                return;
            }
            net::async_connect(beast::get_lowest_layer(ws), results, on_connect);
        }
    );

    auto registration = token.on_cancel([&io]() { io.stop(); });
    io.run_for(timeout);
    registration.reset();

    if (upgraded) {
        return {};
    }

    beast::error_code ignored;
    beast::get_lowest_layer(ws).close(ignored);

    if (token.is_cancelled()) {
        return tl::unexpected(HubError::cancelled());
    }
    if (failure.has_value()) {
        return tl::unexpected(*failure);
    }
    return tl::unexpected(HubError::timeout(
        "WebSocket connect to " + endpoint.host + " timed out after " +
        std::to_string(timeout.count()) + "ms"
    ));
}

// ─────────────────────────────────────────────────────────────────────────────
// BeastWebSocketDialer
// ─────────────────────────────────────────────────────────────────────────────

class BeastWebSocketDialer final : public IWebSocketDialer {
public:
    BeastWebSocketDialer(std::chrono::milliseconds connect_timeout, bool verify_ssl)
        : connect_timeout_(connect_timeout)
        , verify_ssl_(verify_ssl)
    {}

    HubResult<std::unique_ptr<IConnection>> dial(
        const std::string& url,
        const HeaderMap& headers,
        const std::string& connection_id,
        const CancellationToken& token
    ) override {
        auto endpoint = parse_url(url);
        if (!endpoint.has_value()) {
            return tl::unexpected(HubError::invalid_url(url));
        }
        if (token.is_cancelled()) {
            return tl::unexpected(HubError::cancelled());
        }

        try {
            if (endpoint->is_secure()) {
                return dial_secure(*endpoint, headers, connection_id, token);
            }
            return dial_plain(*endpoint, headers, connection_id, token);
        } catch (const boost::system::system_error& e) {
            return tl::unexpected(HubError::connection_failed(e.what()));
        }
    }

private:
    HubResult<std::unique_ptr<IConnection>> dial_plain(
        const UrlComponents& endpoint,
        const HeaderMap& headers,
        const std::string& connection_id,
        const CancellationToken& token
    ) {
        auto io = std::make_unique<net::io_context>();
        auto ws = std::make_unique<PlainStream>(*io);

        auto ready = handshake(*io, *ws, endpoint, headers, token, connect_timeout_);
        if (!ready) {
            return tl::unexpected(ready.error());
        }

        get_logger().logf(LogLevel::Info, "WebSocket connected to ws://{}{}", endpoint.host_with_port(), endpoint.path);
        return std::unique_ptr<IConnection>(std::make_unique<BeastWebSocketConnection<PlainStream>>(
            std::move(io), nullptr, std::move(ws), connection_id
        ));
    }

    HubResult<std::unique_ptr<IConnection>> dial_secure(
        const UrlComponents& endpoint,
        const HeaderMap& headers,
        const std::string& connection_id,
        const CancellationToken& token
    ) {
        auto io = std::make_unique<net::io_context>();
        auto tls = std::make_unique<ssl::context>(ssl::context::tls_client);
        if (verify_ssl_) {
            tls->set_default_verify_paths();
            tls->set_verify_mode(ssl::verify_peer);
        } else {
            tls->set_verify_mode(ssl::verify_none);
        }

        auto ws = std::make_unique<SecureStream>(*io, *tls);
        if (verify_ssl_) {
            ws->next_layer().set_verify_callback(ssl::host_name_verification(endpoint.host));
        }

        auto ready = handshake(*io, *ws, endpoint, headers, token, connect_timeout_);
        if (!ready) {
            return tl::unexpected(ready.error());
        }

        get_logger().logf(LogLevel::Info, "WebSocket connected to wss://{}{}", endpoint.host_with_port(), endpoint.path);
        return std::unique_ptr<IConnection>(std::make_unique<BeastWebSocketConnection<SecureStream>>(
            std::move(io), std::move(tls), std::move(ws), connection_id
        ));
    }

    std::chrono::milliseconds connect_timeout_;
    bool verify_ssl_;
};

}  // namespace

std::shared_ptr<IWebSocketDialer> make_websocket_dialer(
    std::chrono::milliseconds connect_timeout,
    bool verify_ssl
) {
    return std::make_shared<BeastWebSocketDialer>(connect_timeout, verify_ssl);
}

}  // namespace hubpp
