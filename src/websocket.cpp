// src/websocket.cpp
// Discovery GET and websocket connections over Boost.Beast.

#include "websocket.hpp"

#include "kratos/error.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cctype>
#include <future>
#include <mutex>
#include <thread>
#include <type_traits>

namespace kratos {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

namespace {

constexpr int MAX_TRANSPARENT_REDIRECTS = 1;

std::string to_std_string(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

bool is_transparent_redirect(unsigned status) {
    return status == 301 || status == 302 || status == 303 || status == 308;
}

// Run one async operation on a private io_context until it completes.
template <class Initiate>
beast::error_code run_blocking(net::io_context& ioc, Initiate&& initiate) {
    beast::error_code result = net::error::would_block;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

tcp::resolver::results_type resolve(net::io_context& ioc, const Url& url) {
    tcp::resolver resolver(ioc);
    beast::error_code ec;
    auto results = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        throw KratosError::connection("resolve " + url.host + ": " + ec.message());
    }
    return results;
}

// SNI and host name verification for one TLS stream.
template <class SslStream>
void prepare_tls(SslStream& stream, const std::string& host) {
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        throw KratosError::connection("tls server name " + host + ": " + ec.message());
    }
    stream.set_verify_callback(ssl::host_name_verification(host));
}

http::request<http::empty_body> make_request(const Url& url, const Headers& headers) {
    http::request<http::empty_body> req{http::verb::get, url.target, 11};
    req.set(http::field::host, url.authority());
    for (const auto& h : headers) {
        req.set(h.first, h.second);
    }
    return req;
}

void connect(net::io_context& ioc, beast::tcp_stream& stream,
             const tcp::resolver::results_type& results, const Url& url,
             std::chrono::milliseconds timeout) {
    stream.expires_after(timeout);
    auto ec = run_blocking(ioc, [&](auto handler) {
        stream.async_connect(results, std::move(handler));
    });
    if (ec) {
        throw KratosError::connection("connect " + url.authority() + ": " + ec.message());
    }
}

template <class Stream>
HttpResponse exchange(net::io_context& ioc, Stream& stream, const Url& url,
                      http::request<http::empty_body>& req, const DialOptions& options) {
    beast::get_lowest_layer(stream).expires_after(options.connect_timeout);
    auto ec = run_blocking(ioc, [&](auto handler) {
        http::async_write(stream, req, std::move(handler));
    });
    if (ec) {
        throw KratosError::connection("request to " + url.authority() + ": " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(options.connect_timeout);
    ec = run_blocking(ioc, [&](auto handler) {
        http::async_read(stream, buffer, res, std::move(handler));
    });
    if (ec) {
        throw KratosError::connection("response from " + url.authority() + ": " + ec.message());
    }

    HttpResponse out;
    out.status = res.result_int();
    out.reason = to_std_string(res.reason());
    for (const auto& field : res) {
        out.headers.emplace_back(to_std_string(field.name_string()), to_std_string(field.value()));
    }
    out.body = std::move(res.body());
    return out;
}

// A websocket whose operations all run on one private io thread.
//
// Callers block on futures, so Beast only ever sees the stream from the
// io thread. One read and one write may be outstanding at a time; the
// owning Transport serializes writes.
template <class NextLayer>
class WebSocketConnection final : public Connection {
public:
    using Stream = websocket::stream<NextLayer>;
    static constexpr bool secure = !std::is_same<NextLayer, beast::tcp_stream>::value;

    WebSocketConnection(const DialOptions& options, std::shared_ptr<ssl::context> tls)
        : options_(options), tls_(std::move(tls)), work_(net::make_work_guard(ioc_)) {
        if constexpr (secure) {
            ws_ = std::make_unique<Stream>(ioc_, *tls_);
        } else {
            ws_ = std::make_unique<Stream>(ioc_);
        }
        read_buffer_.reserve(options_.buffer_size);
        thread_ = std::thread([this] { ioc_.run(); });
    }

    ~WebSocketConnection() override {
        net::post(ioc_, [this] {
            beast::get_lowest_layer(*ws_).close();
            ioc_.stop();
        });
        work_.reset();
        if (thread_.joinable()) thread_.join();
    }

    void open(const Url& url, const Headers& headers) {
        net::io_context resolver_ctx;
        auto results = resolve(resolver_ctx, url);
        auto& layer = beast::get_lowest_layer(*ws_);

        auto ec = run_on_io([&](auto handler) {
            layer.expires_after(options_.connect_timeout);
            layer.async_connect(results, std::move(handler));
        });
        if (ec) {
            throw KratosError::connection("connect " + url.authority() + ": " + ec.message());
        }

        if constexpr (secure) {
            prepare_tls(ws_->next_layer(), url.host);
            ec = run_on_io([&](auto handler) {
                layer.expires_after(options_.tls_handshake_timeout);
                ws_->next_layer().async_handshake(ssl::stream_base::client, std::move(handler));
            });
            if (ec) {
                throw KratosError::connection("tls handshake with " + url.host + ": " + ec.message());
            }
        }

        websocket::response_type upgrade;
        ec = run_on_io([&](auto handler) {
            layer.expires_never();

            websocket::stream_base::timeout timeouts;
            timeouts.handshake_timeout = options_.handshake_timeout;
            timeouts.idle_timeout = options_.read_timeout;
            timeouts.keep_alive_pings = false;
            ws_->set_option(timeouts);
            ws_->set_option(websocket::stream_base::decorator(
                [headers](websocket::request_type& req) {
                    for (const auto& h : headers) req.set(h.first, h.second);
                }));
            ws_->binary(true);
            ws_->read_message_max(options_.max_message_size);
            ws_->write_buffer_bytes(options_.buffer_size);
            ws_->control_callback([this](websocket::frame_type kind, beast::string_view) {
                if (kind == websocket::frame_type::pong) notify_ack();
            });

            ws_->async_handshake(upgrade, url.authority(), url.target, std::move(handler));
        });
        if (ec) {
            std::string msg = "websocket upgrade to " + url.authority() + url.target + ": " +
                              ec.message();
            if (ec == websocket::error::upgrade_declined) {
                msg += " (status " + std::to_string(upgrade.result_int()) + ")";
            }
            throw KratosError::connection(msg);
        }
    }

    void write_binary(const std::vector<uint8_t>& frame) override {
        auto ec = run_on_io([&](auto handler) {
            ws_->async_write(net::buffer(frame), std::move(handler));
        }, options_.write_timeout);
        if (ec) throw KratosError::write(ec.message());
    }

    void write_ping() override {
        auto ec = run_on_io([&](auto handler) {
            ws_->async_ping(websocket::ping_data{}, std::move(handler));
        }, options_.write_timeout);
        if (ec) throw KratosError::write("ping: " + ec.message());
    }

    void write_close() override {
        auto ec = run_on_io([&](auto handler) {
            ws_->async_close(websocket::close_code::normal, std::move(handler));
        }, options_.write_timeout);
        if (ec) throw KratosError::write("close: " + ec.message());
    }

    std::vector<uint8_t> read() override {
        read_buffer_.clear();
        auto ec = run_on_io([&](auto handler) {
            ws_->async_read(read_buffer_, std::move(handler));
        });
        if (ec) throw KratosError::io("read: " + ec.message());

        auto data = read_buffer_.data();
        const auto* begin = static_cast<const uint8_t*>(data.data());
        return std::vector<uint8_t>(begin, begin + data.size());
    }

    void set_ack_listener(AckListener listener) override {
        std::lock_guard<std::mutex> lock(ack_mutex_);
        ack_listener_ = std::move(listener);
    }

    void shutdown() override {
        net::post(ioc_, [this] { beast::get_lowest_layer(*ws_).close(); });
    }

private:
    // Start an operation on the io thread and wait for its completion.
    // With a timeout, an overdue operation is aborted by closing the socket.
    template <class Initiate>
    beast::error_code run_on_io(Initiate&& initiate,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        auto done = std::make_shared<std::promise<beast::error_code>>();
        auto result = done->get_future();
        net::post(ioc_, [done, &initiate] {
            initiate([done](beast::error_code ec, auto&&...) { done->set_value(ec); });
        });

        if (timeout && result.wait_for(*timeout) == std::future_status::timeout) {
            shutdown();
            result.wait();
            return net::error::timed_out;
        }
        return result.get();
    }

    void notify_ack() {
        AckListener listener;
        {
            std::lock_guard<std::mutex> lock(ack_mutex_);
            listener = ack_listener_;
        }
        if (listener) listener();
    }

    DialOptions options_;
    std::shared_ptr<ssl::context> tls_;
    net::io_context ioc_;
    net::executor_work_guard<net::io_context::executor_type> work_;
    std::unique_ptr<Stream> ws_;
    beast::flat_buffer read_buffer_;
    std::mutex ack_mutex_;
    AckListener ack_listener_;
    std::thread thread_;
};

} // namespace

// --- Url ---

std::string Url::authority() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    bool default_port = (!secure && port == "80") || (secure && port == "443");
    return default_port ? h : h + ":" + port;
}

Url parse_url(const std::string& url) {
    Url out;
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw KratosError::connection("malformed url '" + url + "'");
    }
    out.scheme = url.substr(0, scheme_end);
    for (auto& c : out.scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    std::string default_port;
    if (out.scheme == "http" || out.scheme == "ws") {
        default_port = "80";
    } else if (out.scheme == "https" || out.scheme == "wss") {
        default_port = "443";
        out.secure = true;
    } else {
        throw KratosError::connection("unsupported url scheme '" + out.scheme + "'");
    }

    std::string rest = url.substr(scheme_end + 3);
    auto path_start = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, path_start);
    out.target = path_start == std::string::npos ? "/" : rest.substr(path_start);
    auto fragment = out.target.find('#');
    if (fragment != std::string::npos) out.target.erase(fragment);
    if (out.target.empty() || out.target[0] != '/') out.target.insert(0, "/");

    auto at = authority.rfind('@');
    if (at != std::string::npos) authority.erase(0, at + 1);

    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw KratosError::connection("malformed host in url '" + url + "'");
        }
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            out.port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        out.host = authority.substr(0, colon);
        if (colon != std::string::npos) out.port = authority.substr(colon + 1);
    }

    if (out.host.empty()) {
        throw KratosError::connection("missing host in url '" + url + "'");
    }
    if (out.port.empty()) {
        out.port = default_port;
    } else {
        int port = 0;
        for (char c : out.port) {
            if (!std::isdigit(static_cast<unsigned char>(c)) || port > 65535) {
                throw KratosError::connection("invalid port in url '" + url + "'");
            }
            port = port * 10 + (c - '0');
        }
        if (port <= 0 || port > 65535) {
            throw KratosError::connection("invalid port in url '" + url + "'");
        }
    }
    return out;
}

// --- WebSocketDialer ---

WebSocketDialer::WebSocketDialer(const std::optional<TlsIdentity>& identity)
    : tls_(std::make_shared<ssl::context>(ssl::context::tls_client)) {
    beast::error_code ec;
    tls_->set_default_verify_paths(ec);
    if (ec) {
        throw KratosError::configuration("loading system trust store: " + ec.message());
    }
    tls_->set_verify_mode(ssl::verify_peer);

    if (!identity) return;

    tls_->use_certificate_chain_file(identity->certificate_path, ec);
    if (ec) {
        throw KratosError::configuration("loading certificate " + identity->certificate_path +
                                         ": " + ec.message());
    }
    tls_->use_private_key_file(identity->key_path, ssl::context::pem, ec);
    if (ec) {
        throw KratosError::configuration("loading key " + identity->key_path + ": " +
                                         ec.message());
    }
    if (SSL_CTX_check_private_key(tls_->native_handle()) != 1) {
        throw KratosError::configuration("certificate " + identity->certificate_path +
                                         " does not match key " + identity->key_path);
    }
}

HttpResponse WebSocketDialer::fetch(const Url& url, const Headers& headers,
                                    const DialOptions& options) {
    net::io_context ioc;
    auto results = resolve(ioc, url);
    auto req = make_request(url, headers);

    if (url.secure) {
        beast::ssl_stream<beast::tcp_stream> stream(ioc, *tls_);
        prepare_tls(stream, url.host);
        connect(ioc, beast::get_lowest_layer(stream), results, url, options.connect_timeout);

        beast::get_lowest_layer(stream).expires_after(options.tls_handshake_timeout);
        auto ec = run_blocking(ioc, [&](auto handler) {
            stream.async_handshake(ssl::stream_base::client, std::move(handler));
        });
        if (ec) {
            throw KratosError::connection("tls handshake with " + url.host + ": " + ec.message());
        }

        auto response = exchange(ioc, stream, url, req, options);
        beast::get_lowest_layer(stream).close();
        return response;
    }

    beast::tcp_stream stream(ioc);
    connect(ioc, stream, results, url, options.connect_timeout);
    auto response = exchange(ioc, stream, url, req, options);
    stream.close();
    return response;
}

HttpResponse WebSocketDialer::get(const std::string& url, const Headers& headers,
                                  const DialOptions& options) {
    Url target = parse_url(url);
    if (target.scheme != "http" && target.scheme != "https") {
        throw KratosError::connection("discovery url must be http or https: '" + url + "'");
    }

    HttpResponse response = fetch(target, headers, options);
    for (int hop = 0; hop < MAX_TRANSPARENT_REDIRECTS && is_transparent_redirect(response.status);
         hop++) {
        std::string location = response.header("Location");
        if (location.empty()) break;
        if (location[0] == '/') {
            location = target.scheme + "://" + target.authority() + location;
        }

        Url next = parse_url(location);
        auto previous = std::make_shared<const HttpResponse>(std::move(response));
        response = fetch(next, headers, options);
        response.previous = std::move(previous);
        target = std::move(next);
    }
    return response;
}

std::unique_ptr<Connection> WebSocketDialer::dial(const std::string& url, const Headers& headers,
                                                  const DialOptions& options) {
    Url target = parse_url(url);
    if (target.scheme == "ws") {
        auto conn = std::make_unique<WebSocketConnection<beast::tcp_stream>>(options, nullptr);
        conn->open(target, headers);
        return conn;
    }
    if (target.scheme == "wss") {
        auto conn = std::make_unique<WebSocketConnection<beast::ssl_stream<beast::tcp_stream>>>(
            options, tls_);
        conn->open(target, headers);
        return conn;
    }
    throw KratosError::connection("websocket url must be ws or wss: '" + url + "'");
}

std::shared_ptr<Dialer> make_websocket_dialer(const std::optional<TlsIdentity>& identity) {
    return std::make_shared<WebSocketDialer>(identity);
}

} // namespace kratos
