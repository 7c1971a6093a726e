// include/kratos/error.hpp
// Single error class with a kind enum.

#pragma once

#include <stdexcept>
#include <string>

namespace kratos {

enum class ErrorKind {
    Configuration,  // Bad device id, handler pattern, certificate or option
    Connection,     // Discovery or upgrade failed below the HTTP layer
    Server,         // Discovery endpoint rejected the device
    Serialization,  // Envelope encode/decode failure
    Write,          // Frame could not be written
    Closed,         // Client already torn down
    Io              // System I/O error
};

class KratosError : public std::exception {
public:
    KratosError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    KratosError(unsigned status, const std::string& server_message, const std::string& cause)
        : kind_(ErrorKind::Server),
          message_("server error: " + std::to_string(status) + ":" + server_message +
                   (cause.empty() ? "" : ": " + cause)),
          status_(status), server_message_(server_message), cause_(cause) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }

    // Only set for ErrorKind::Server.
    unsigned status() const noexcept { return status_; }
    const std::string& server_message() const noexcept { return server_message_; }
    const std::string& cause() const noexcept { return cause_; }

    static KratosError configuration(std::string msg) {
        return KratosError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static KratosError connection(std::string msg) {
        return KratosError(ErrorKind::Connection, "connection error: " + msg);
    }

    static KratosError server(unsigned status, std::string server_message, std::string cause) {
        return KratosError(status, server_message, cause);
    }

    static KratosError serialization(std::string msg) {
        return KratosError(ErrorKind::Serialization, "serialization error: " + msg);
    }

    static KratosError write(std::string msg) {
        return KratosError(ErrorKind::Write, "write error: " + msg);
    }

    static KratosError closed() {
        return KratosError(ErrorKind::Closed, "client is closed");
    }

    static KratosError io(std::string msg) {
        return KratosError(ErrorKind::Io, "io error: " + msg);
    }

private:
    ErrorKind kind_;
    std::string message_;
    unsigned status_ = 0;
    std::string server_message_;
    std::string cause_;
};

} // namespace kratos
