// include/kratos/transport.hpp
// Transport seams: a duplex frame connection and the dialer that finds it.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kratos {

using Headers = std::vector<std::pair<std::string, std::string>>;

// Response to the discovery GET.
//
// `previous` holds the response of a transparent redirect that the HTTP
// layer already followed, if any (one level only).
struct HttpResponse {
    unsigned status = 0;
    std::string reason;
    Headers headers;
    std::string body;
    std::shared_ptr<const HttpResponse> previous;

    // Case-insensitive header lookup; empty when absent.
    std::string header(const std::string& name) const;
};

// Client certificate and key presented on TLS connections.
struct TlsIdentity {
    std::string certificate_path;
    std::string key_path;
};

// Timeouts and sizing applied by a Dialer.
struct DialOptions {
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds tls_handshake_timeout{5000};
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds write_timeout{10000};
    std::chrono::milliseconds read_timeout{300000};
    size_t max_message_size = 2048;
    size_t buffer_size = 65535;
};

// One live duplex connection.
//
// Only one thread reads. Writes may come from several threads but the
// caller serializes them; implementations do not have to.
class Connection {
public:
    using AckListener = std::function<void()>;

    virtual ~Connection() = default;

    // Write one binary frame. Throws KratosError (Write) on failure.
    virtual void write_binary(const std::vector<uint8_t>& frame) = 0;

    // Write a ping control frame. Throws KratosError (Write) on failure.
    virtual void write_ping() = 0;

    // Write a close control frame. Throws KratosError (Write) on failure.
    virtual void write_close() = 0;

    // Block until one data frame arrives. Throws KratosError once the
    // connection fails or is shut down.
    virtual std::vector<uint8_t> read() = 0;

    // Called for every pong received while a read is pending.
    virtual void set_ack_listener(AckListener listener) = 0;

    // Release the connection. Unblocks a pending read. Safe to repeat.
    virtual void shutdown() = 0;
};

// Performs the network side of connection establishment.
class Dialer {
public:
    virtual ~Dialer() = default;

    virtual HttpResponse get(const std::string& url, const Headers& headers,
                             const DialOptions& options) = 0;

    virtual std::unique_ptr<Connection> dial(const std::string& url, const Headers& headers,
                                             const DialOptions& options) = 0;
};

// Boost.Beast dialer. Loads the TLS identity immediately; throws
// KratosError (Configuration) when it cannot be loaded.
std::shared_ptr<Dialer> make_websocket_dialer(const std::optional<TlsIdentity>& identity);

} // namespace kratos
