// src/transport.hpp
// The client's single connection, with serialized writes.

#pragma once

#include "kratos/error.hpp"
#include "kratos/transport.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace kratos {

// Owns the connection for the client's lifetime.
//
// Writers (send path, watchdog probes, the final close frame) share one
// mutex. Only the read loop calls receive(). Any write failure shuts the
// connection down, which also ends the read loop.
class Transport {
public:
    explicit Transport(std::unique_ptr<Connection> connection);
    ~Transport();

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // Throws KratosError (Closed or Write).
    void send_frame(const std::vector<uint8_t>& frame);
    void send_ping();

    // Best-effort; returns false when the frame could not be written.
    bool send_close() noexcept;

    // Blocks until a frame arrives. Throws KratosError once shut down.
    std::vector<uint8_t> receive();

    void set_ack_listener(Connection::AckListener listener);

    // Idempotent. Unblocks a pending receive().
    void close_connection() noexcept;

    bool closed() const noexcept { return closed_.load(); }

private:
    template <class Write>
    void guarded_write(Write&& write);

    std::unique_ptr<Connection> connection_;
    std::mutex write_mutex_;
    std::atomic<bool> closed_{false};
};

} // namespace kratos
