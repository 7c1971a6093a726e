// include/kratos/client.hpp
// Kratos device client.

#pragma once

#include "config.hpp"
#include "error.hpp"
#include "message.hpp"
#include "transport.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace kratos {

// A persistent connection from a device to the WebPA backend.
//
// Created via Client::create(config). Creation performs the discovery
// handshake, opens the websocket and starts two background threads: the
// keepalive watchdog and the read loop that dispatches inbound messages
// to the registered handlers.
//
// Example:
//   auto client = Client::create(
//       ClientConfig::builder({"mac:112233445566", "fw", "model", "acme"},
//                             "https://petasos.example.net:8080")
//           .handler("/config", [](const Message& m) { ... })
//           .build());
//   client->send(Message::simple_event("mac:112233445566/app", "event:status", {}));
//   client->close();
//
// There is no reconnect. Once send() throws Closed the owner builds a new client.
//
// close() and the destructor may run on any thread, including inside a
// handler. A moved-from client reports is_closed() and throws Closed from
// send(); its hostname(), url() and device_id() must not be called.
class Client {
public:
    // Throws KratosError (Configuration, Connection or Server).
    static std::unique_ptr<Client> create(ClientConfig config);

    // Same, with a caller-supplied dialer. The dialer owns any TLS identity.
    static std::unique_ptr<Client> create(ClientConfig config, std::shared_ptr<Dialer> dialer);

    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    // Host of the serving endpoint the discovery handshake redirected to.
    const std::string& hostname() const noexcept;

    // Full websocket URL of the device endpoint.
    const std::string& url() const noexcept;

    // Normalized device identifier, e.g. "mac:112233445566".
    const std::string& device_id() const noexcept;

    // Encode and write one frame. Throws KratosError (Serialization, Write
    // or Closed). An encode failure means nothing was written.
    void send(const Message& message);

    // Stop the watchdog, send a close frame, release the transport and
    // join the background threads. Safe to call more than once. Called from
    // a handler, the read loop is left to finish after the handler returns.
    void close();

    bool is_closed() const noexcept;

    // Number of probe periods that ended without an acknowledgment.
    uint64_t missed_pings() const noexcept;

private:
    Client();
    struct Inner;
    std::shared_ptr<Inner> inner_;
};

} // namespace kratos
