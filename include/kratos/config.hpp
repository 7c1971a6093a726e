// include/kratos/config.hpp
// Flat configuration struct with builder pattern.

#pragma once

#include "error.hpp"
#include "message.hpp"
#include "transport.hpp"

#include <spdlog/logger.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kratos {

class ClientConfigBuilder;

// Immutable description of the device.
struct DeviceIdentity {
    std::string device_name;
    std::string firmware_name;
    std::string model_name;
    std::string manufacturer;
};

// Receives one decoded message. Runs on the read loop and must return promptly.
using MessageHandler = std::function<void(const Message&)>;

// A pattern over the message destination and the handler it selects.
struct HandlerRegistration {
    std::string pattern;
    MessageHandler handler;
};

// Configuration for the Kratos client.
class ClientConfig {
public:
    // May throw; the exception is logged and monitoring continues.
    using PingMissCallback = std::function<void()>;

    static ClientConfigBuilder builder(DeviceIdentity identity, std::string destination_url);

    const DeviceIdentity& identity() const noexcept { return identity_; }
    const std::string& destination_url() const noexcept { return destination_url_; }
    const std::string& certificate_path() const noexcept { return certificate_path_; }
    const std::string& key_path() const noexcept { return key_path_; }
    const std::vector<HandlerRegistration>& handlers() const noexcept { return handlers_; }
    const PingMissCallback& on_ping_miss() const noexcept { return on_ping_miss_; }
    const std::shared_ptr<spdlog::logger>& logger() const noexcept { return logger_; }
    std::chrono::milliseconds ping_period() const noexcept { return ping_period_; }
    std::chrono::milliseconds pong_wait() const noexcept { return pong_wait_; }
    std::chrono::milliseconds write_wait() const noexcept { return write_wait_; }
    std::chrono::milliseconds connect_timeout() const noexcept { return connect_timeout_; }
    std::chrono::milliseconds tls_handshake_timeout() const noexcept { return tls_handshake_timeout_; }
    std::chrono::milliseconds handshake_timeout() const noexcept { return handshake_timeout_; }
    size_t max_message_size() const noexcept { return max_message_size_; }
    size_t buffer_size() const noexcept { return buffer_size_; }

    // TLS identity, present only when both certificate and key are set.
    std::optional<TlsIdentity> tls_identity() const;

    DialOptions dial_options() const;

private:
    friend class ClientConfigBuilder;

    DeviceIdentity identity_;
    std::string destination_url_;
    std::string certificate_path_;
    std::string key_path_;
    std::vector<HandlerRegistration> handlers_;
    PingMissCallback on_ping_miss_;
    std::shared_ptr<spdlog::logger> logger_;
    std::chrono::milliseconds ping_period_{270000};
    std::chrono::milliseconds pong_wait_{300000};
    std::chrono::milliseconds write_wait_{10000};
    std::chrono::milliseconds connect_timeout_{30000};
    std::chrono::milliseconds tls_handshake_timeout_{5000};
    std::chrono::milliseconds handshake_timeout_{10000};
    size_t max_message_size_ = 2048;
    size_t buffer_size_ = 65535;
};

// Fluent builder for ClientConfig.
class ClientConfigBuilder {
public:
    ClientConfigBuilder(DeviceIdentity identity, std::string destination_url);

    ClientConfigBuilder& certificate(std::string path);
    ClientConfigBuilder& private_key(std::string path);
    ClientConfigBuilder& handler(std::string pattern, MessageHandler handler);
    ClientConfigBuilder& on_ping_miss(ClientConfig::PingMissCallback callback);
    ClientConfigBuilder& logger(std::shared_ptr<spdlog::logger> logger);
    ClientConfigBuilder& ping_period(std::chrono::milliseconds period);
    ClientConfigBuilder& pong_wait(std::chrono::milliseconds wait);
    ClientConfigBuilder& write_wait(std::chrono::milliseconds wait);
    ClientConfigBuilder& connect_timeout(std::chrono::milliseconds timeout);
    ClientConfigBuilder& tls_handshake_timeout(std::chrono::milliseconds timeout);
    ClientConfigBuilder& handshake_timeout(std::chrono::milliseconds timeout);
    ClientConfigBuilder& max_message_size(size_t bytes);
    ClientConfigBuilder& buffer_size(size_t bytes);

    // Build the config. Throws KratosError on invalid options.
    ClientConfig build() const;

private:
    ClientConfig config_;
};

} // namespace kratos
