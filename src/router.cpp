// src/router.cpp

#include "router.hpp"

#include "kratos/error.hpp"

namespace kratos {

Router::Router(std::vector<HandlerRegistration> registrations)
    : registrations_(std::move(registrations)) {
    matchers_.reserve(registrations_.size());
    for (const auto& r : registrations_) {
        if (!r.handler) {
            throw KratosError::configuration("handler for pattern '" + r.pattern + "' is empty");
        }
        try {
            matchers_.emplace_back(r.pattern, std::regex::ECMAScript | std::regex::optimize);
        } catch (const std::regex_error& e) {
            throw KratosError::configuration("invalid handler pattern '" + r.pattern +
                                             "': " + e.what());
        }
    }
}

size_t Router::dispatch(const Message& message) const {
    size_t invoked = 0;
    for (size_t i = 0; i < registrations_.size(); i++) {
        if (std::regex_search(message.destination, matchers_[i])) {
            registrations_[i].handler(message);
            invoked++;
        }
    }
    return invoked;
}

} // namespace kratos
