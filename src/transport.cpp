// src/transport.cpp
// Serialized writes over the client's connection.

#include "transport.hpp"

namespace kratos {

Transport::Transport(std::unique_ptr<Connection> connection)
    : connection_(std::move(connection)) {}

Transport::~Transport() {
    close_connection();
}

template <class Write>
void Transport::guarded_write(Write&& write) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_.load()) {
        throw KratosError::closed();
    }
    try {
        write(*connection_);
    } catch (const KratosError&) {
        close_connection();
        throw;
    }
}

void Transport::send_frame(const std::vector<uint8_t>& frame) {
    guarded_write([&frame](Connection& c) { c.write_binary(frame); });
}

void Transport::send_ping() {
    guarded_write([](Connection& c) { c.write_ping(); });
}

bool Transport::send_close() noexcept {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_.load()) return false;
    try {
        connection_->write_close();
        return true;
    } catch (const KratosError&) {
        return false;
    }
}

std::vector<uint8_t> Transport::receive() {
    if (closed_.load()) {
        throw KratosError::closed();
    }
    return connection_->read();
}

void Transport::set_ack_listener(Connection::AckListener listener) {
    connection_->set_ack_listener(std::move(listener));
}

void Transport::close_connection() noexcept {
    if (!closed_.exchange(true) && connection_) {
        connection_->shutdown();
    }
}

} // namespace kratos
