// src/validation.hpp
// Internal input validation functions.

#pragma once

#include "kratos/error.hpp"

#include <cctype>
#include <regex>
#include <string>

namespace kratos {
namespace validation {

// Parse a device identifier of the form prefix:id[/service] and return
// the normalized "prefix:id". MAC ids lose their delimiters and are
// lower-cased. Throws KratosError (Configuration) on malformed input.
inline std::string parse_device_id(const std::string& value) {
    static const std::regex id_pattern("^(mac|uuid|dns|serial):([^/]+)(/[^/]+)?",
                                       std::regex::ECMAScript | std::regex::icase);

    std::smatch match;
    if (!std::regex_search(value, match, id_pattern)) {
        throw KratosError::configuration("invalid device id: '" + value + "'");
    }

    std::string prefix = match[1].str();
    for (auto& c : prefix) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    std::string id = match[2].str();

    if (prefix == "mac") {
        std::string hex;
        hex.reserve(12);
        for (char c : id) {
            if (std::isxdigit(static_cast<unsigned char>(c))) {
                hex.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            } else if (c == ':' || c == '-' || c == '.' || c == ',') {
                continue;
            } else {
                throw KratosError::configuration(
                    std::string("invalid character in mac: '") + c + "'");
            }
        }
        if (hex.size() != 12) {
            throw KratosError::configuration("invalid length of mac address: '" + value + "'");
        }
        id = std::move(hex);
    }

    return prefix + ":" + id;
}

// Destination URLs must be absolute http(s) URLs with a host.
inline bool check_destination_url(const std::string& url) {
    std::string rest;
    if (url.compare(0, 7, "http://") == 0) {
        rest = url.substr(7);
    } else if (url.compare(0, 8, "https://") == 0) {
        rest = url.substr(8);
    } else {
        return false;
    }
    return !rest.empty() && rest[0] != '/' && rest[0] != ':';
}

} // namespace validation
} // namespace kratos
