// src/config.cpp
// Configuration builder and validation.

#include "kratos/config.hpp"
#include "validation.hpp"

namespace kratos {

// Smallest write buffer the websocket layer accepts.
static constexpr size_t MIN_BUFFER_SIZE = 8;

// --- ClientConfig ---

ClientConfigBuilder ClientConfig::builder(DeviceIdentity identity, std::string destination_url) {
    return ClientConfigBuilder(std::move(identity), std::move(destination_url));
}

std::optional<TlsIdentity> ClientConfig::tls_identity() const {
    if (certificate_path_.empty() || key_path_.empty()) {
        return std::nullopt;
    }
    return TlsIdentity{certificate_path_, key_path_};
}

DialOptions ClientConfig::dial_options() const {
    DialOptions options;
    options.connect_timeout = connect_timeout_;
    options.tls_handshake_timeout = tls_handshake_timeout_;
    options.handshake_timeout = handshake_timeout_;
    options.write_timeout = write_wait_;
    options.read_timeout = pong_wait_;
    options.max_message_size = max_message_size_;
    options.buffer_size = buffer_size_;
    return options;
}

// --- ClientConfigBuilder ---

ClientConfigBuilder::ClientConfigBuilder(DeviceIdentity identity, std::string destination_url) {
    config_.identity_ = std::move(identity);
    config_.destination_url_ = std::move(destination_url);
}

ClientConfigBuilder& ClientConfigBuilder::certificate(std::string path) {
    config_.certificate_path_ = std::move(path);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::private_key(std::string path) {
    config_.key_path_ = std::move(path);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::handler(std::string pattern, MessageHandler handler) {
    config_.handlers_.push_back(HandlerRegistration{std::move(pattern), std::move(handler)});
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::on_ping_miss(ClientConfig::PingMissCallback callback) {
    config_.on_ping_miss_ = std::move(callback);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::logger(std::shared_ptr<spdlog::logger> logger) {
    config_.logger_ = std::move(logger);
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::ping_period(std::chrono::milliseconds period) {
    config_.ping_period_ = period;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::pong_wait(std::chrono::milliseconds wait) {
    config_.pong_wait_ = wait;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::write_wait(std::chrono::milliseconds wait) {
    config_.write_wait_ = wait;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::connect_timeout(std::chrono::milliseconds timeout) {
    config_.connect_timeout_ = timeout;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::tls_handshake_timeout(std::chrono::milliseconds timeout) {
    config_.tls_handshake_timeout_ = timeout;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::handshake_timeout(std::chrono::milliseconds timeout) {
    config_.handshake_timeout_ = timeout;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::max_message_size(size_t bytes) {
    config_.max_message_size_ = bytes;
    return *this;
}

ClientConfigBuilder& ClientConfigBuilder::buffer_size(size_t bytes) {
    config_.buffer_size_ = bytes;
    return *this;
}

ClientConfig ClientConfigBuilder::build() const {
    const auto& c = config_;
    if (!validation::check_destination_url(c.destination_url_)) {
        throw KratosError::configuration(
            "destination url must be an http:// or https:// url, got: '" + c.destination_url_ + "'");
    }

    const std::chrono::milliseconds zero{0};
    if (c.ping_period_ <= zero || c.pong_wait_ <= zero || c.write_wait_ <= zero ||
        c.connect_timeout_ <= zero || c.tls_handshake_timeout_ <= zero ||
        c.handshake_timeout_ <= zero) {
        throw KratosError::configuration("timeouts and periods must be positive");
    }
    if (c.ping_period_ >= c.pong_wait_) {
        throw KratosError::configuration("ping period must be less than pong wait");
    }
    if (c.max_message_size_ == 0 || c.buffer_size_ == 0) {
        throw KratosError::configuration("message and buffer sizes must be non-zero");
    }
    if (c.buffer_size_ < MIN_BUFFER_SIZE) {
        throw KratosError::configuration("buffer size must be at least " +
                                         std::to_string(MIN_BUFFER_SIZE) + " bytes");
    }
    return c;
}

} // namespace kratos
