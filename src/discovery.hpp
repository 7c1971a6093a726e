// src/discovery.hpp
// Discovery handshake: GET the discovery URL, follow its 307 to the
// serving host, open the websocket there.

#pragma once

#include "kratos/config.hpp"
#include "kratos/error.hpp"
#include "kratos/transport.hpp"

#include <spdlog/logger.h>

#include <functional>
#include <memory>
#include <string>

namespace kratos {
namespace discovery {

static constexpr const char* DEVICE_ENDPOINT = "/api/v2/device";
static constexpr unsigned STATUS_TEMPORARY_REDIRECT = 307;
static constexpr unsigned STATUS_DEVICE_DISCONNECTED = 523;
static constexpr unsigned STATUS_DEVICE_TIMEOUT = 524;

static constexpr const char* MESSAGE_DEVICE_BUSY = "ErrorDeviceBusy";
static constexpr const char* MESSAGE_TRANSACTIONS_CLOSED =
    "ErrorTransactionsClosed/ErrorTransactionsAlreadyClosed/ErrorDeviceClosed";

using DialerFactory = std::function<std::shared_ptr<Dialer>()>;

// Result of a successful handshake.
struct Established {
    std::unique_ptr<Connection> connection;
    std::string device_id;
    std::string url;
    std::string hostname;
};

std::string user_agent(const DeviceIdentity& identity);

// Headers sent on both the discovery GET and the websocket upgrade.
Headers identity_headers(const DeviceIdentity& identity);

// Location of the 307 carried by the response or by the one it replaced.
// Throws KratosError (Server) when neither is a usable redirect.
std::string redirect_location(const HttpResponse& response);

// http(s)://host/path -> ws(s)://host/path/api/v2/device.
// Throws KratosError (Server) for a location that is not http(s).
std::string device_endpoint_url(const std::string& location);

// Host portion of an absolute URL, without scheme, port or path.
std::string hostname_of(const std::string& url);

// Decode the server's {code, message} body, or synthesize the message
// from the status code.
KratosError server_error(const HttpResponse& response, const std::string& cause);

// Run the whole handshake. The dialer is created only after the device
// id is validated, so a malformed id never touches the network.
Established establish(const ClientConfig& config, const DialerFactory& make_dialer,
                      spdlog::logger& log);

} // namespace discovery
} // namespace kratos
