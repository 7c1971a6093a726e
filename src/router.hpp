// src/router.hpp
// Destination-pattern routing of inbound messages.

#pragma once

#include "kratos/config.hpp"
#include "kratos/message.hpp"

#include <regex>
#include <vector>

namespace kratos {

// Fixed set of handler registrations with their compiled matchers.
//
// Every registration whose pattern matches the destination is invoked,
// in registration order. Patterns are searched, not anchored, so an
// empty pattern matches everything.
class Router {
public:
    // Throws KratosError (Configuration) if a pattern does not compile.
    explicit Router(std::vector<HandlerRegistration> registrations);

    // Returns the number of handlers invoked.
    size_t dispatch(const Message& message) const;

    size_t size() const noexcept { return registrations_.size(); }

private:
    std::vector<HandlerRegistration> registrations_;
    std::vector<std::regex> matchers_;  // parallel to registrations_
};

} // namespace kratos
