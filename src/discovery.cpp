// src/discovery.cpp
// Discovery handshake and server error decoding.

#include "discovery.hpp"
#include "validation.hpp"

#include <boost/beast/http/status.hpp>
#include <rapidjson/document.h>

#include <algorithm>
#include <cctype>

namespace kratos {

std::string HttpResponse::header(const std::string& name) const {
    auto iequals = [](const std::string& a, const std::string& b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) ==
                          std::tolower(static_cast<unsigned char>(y));
               });
    };
    for (const auto& h : headers) {
        if (iequals(h.first, name)) return h.second;
    }
    return std::string();
}

namespace discovery {

std::string user_agent(const DeviceIdentity& identity) {
    return "WebPA-1.6(" + identity.firmware_name + ";" + identity.model_name + "/" +
           identity.manufacturer + ";)";
}

Headers identity_headers(const DeviceIdentity& identity) {
    return Headers{
        {"X-Webpa-Device-Name", identity.device_name},
        {"X-Webpa-Firmware-Name", identity.firmware_name},
        {"X-Webpa-Model-Name", identity.model_name},
        {"X-Webpa-Manufacturer", identity.manufacturer},
        {"User-Agent", user_agent(identity)},
    };
}

std::string redirect_location(const HttpResponse& response) {
    const HttpResponse* redirect = nullptr;
    if (response.status == STATUS_TEMPORARY_REDIRECT) {
        redirect = &response;
    } else if (response.previous && response.previous->status == STATUS_TEMPORARY_REDIRECT) {
        redirect = response.previous.get();
    }

    if (redirect == nullptr) {
        throw server_error(response, "received invalid response from discovery endpoint");
    }

    std::string location = redirect->header("Location");
    if (location.empty()) {
        throw server_error(*redirect, "redirect has no Location header");
    }
    return location;
}

std::string device_endpoint_url(const std::string& location) {
    std::string url;
    if (location.compare(0, 7, "http://") == 0) {
        url = "ws://" + location.substr(7);
    } else if (location.compare(0, 8, "https://") == 0) {
        url = "wss://" + location.substr(8);
    } else {
        throw KratosError::server(STATUS_TEMPORARY_REDIRECT, "Temporary Redirect",
                                  "invalid redirect location '" + location + "'");
    }

    if (hostname_of(url).empty()) {
        throw KratosError::server(STATUS_TEMPORARY_REDIRECT, "Temporary Redirect",
                                  "redirect location has no host '" + location + "'");
    }

    if (!url.empty() && url.back() == '/') url.pop_back();
    return url + DEVICE_ENDPOINT;
}

std::string hostname_of(const std::string& url) {
    auto scheme_end = url.find("://");
    size_t start = scheme_end == std::string::npos ? 0 : scheme_end + 3;

    // IPv6 literal: [::1]:8080
    if (start < url.size() && url[start] == '[') {
        auto close = url.find(']', start);
        if (close == std::string::npos) return std::string();
        return url.substr(start + 1, close - start - 1);
    }

    auto end = url.find_first_of(":/?#", start);
    if (end == std::string::npos) end = url.size();
    return url.substr(start, end - start);
}

KratosError server_error(const HttpResponse& response, const std::string& cause) {
    std::string message;
    unsigned code = response.status;

    if (!response.body.empty()) {
        rapidjson::Document d;
        d.Parse(response.body.c_str(), response.body.size());
        // Not JSON: the status code decides the message.
        if (!d.HasParseError() && d.IsObject()) {
            if (d.HasMember("code") && d["code"].IsUint() && d["code"].GetUint() != 0) {
                code = d["code"].GetUint();
            }
            if (d.HasMember("message") && d["message"].IsString()) {
                message.assign(d["message"].GetString(), d["message"].GetStringLength());
            }
        }
    }

    if (message.empty()) {
        switch (code) {
            case STATUS_DEVICE_DISCONNECTED:
                message = MESSAGE_DEVICE_BUSY;
                break;
            case STATUS_DEVICE_TIMEOUT:
                message = MESSAGE_TRANSACTIONS_CLOSED;
                break;
            default: {
                auto reason = boost::beast::http::obsolete_reason(
                    static_cast<boost::beast::http::status>(code));
                message = reason == "<unknown-status>" ? response.reason
                                                    : std::string(reason.data(), reason.size());
                break;
            }
        }
    }

    return KratosError::server(code, message, cause);
}

Established establish(const ClientConfig& config, const DialerFactory& make_dialer,
                      spdlog::logger& log) {
    Established result;
    result.device_id = validation::parse_device_id(config.identity().device_name);

    auto headers = identity_headers(config.identity());
    auto options = config.dial_options();
    auto dialer = make_dialer();
    if (!dialer) {
        throw KratosError::configuration("no dialer available");
    }

    log.debug("discovery request for {} to {}", result.device_id, config.destination_url());
    HttpResponse response = dialer->get(config.destination_url(), headers, options);

    auto location = redirect_location(response);
    result.url = device_endpoint_url(location);
    result.hostname = hostname_of(result.url);
    log.info("discovery redirected {} to {}", result.device_id, result.url);

    result.connection = dialer->dial(result.url, headers, options);
    if (!result.connection) {
        throw KratosError::connection("dialer returned no connection for " + result.url);
    }
    return result;
}

} // namespace discovery
} // namespace kratos
