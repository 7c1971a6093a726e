// src/websocket.hpp
// Boost.Beast implementation of the Dialer and Connection seams.

#pragma once

#include "kratos/transport.hpp"

#include <boost/asio/ssl/context.hpp>

#include <memory>
#include <optional>
#include <string>

namespace kratos {

// Parsed absolute URL (http, https, ws, wss).
struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
    bool secure = false;

    // Value for the Host header: host, plus the port when it is not the default.
    std::string authority() const;
};

// Throws KratosError (Connection) on an unsupported or malformed URL.
Url parse_url(const std::string& url);

class WebSocketDialer : public Dialer {
public:
    // Loads the TLS identity now. Throws KratosError (Configuration).
    explicit WebSocketDialer(const std::optional<TlsIdentity>& identity);

    // GET with up to one transparent redirect (301/302/303/308).
    // A 307 is returned as-is for the caller to follow.
    HttpResponse get(const std::string& url, const Headers& headers,
                     const DialOptions& options) override;

    std::unique_ptr<Connection> dial(const std::string& url, const Headers& headers,
                                     const DialOptions& options) override;

private:
    HttpResponse fetch(const Url& url, const Headers& headers, const DialOptions& options);

    std::shared_ptr<boost::asio::ssl::context> tls_;
};

} // namespace kratos
