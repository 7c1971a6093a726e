// include/kratos/message.hpp
// WRP envelope exchanged with the server over the duplex transport.

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kratos {

// WRP message types. Values are fixed by the wire contract.
enum class MessageType : int64_t {
    Invalid0              = 0,
    Invalid1              = 1,
    Auth                  = 2,
    SimpleRequestResponse = 3,
    SimpleEvent           = 4,
    Create                = 5,
    Retrieve              = 6,
    Update                = 7,
    Delete                = 8,
    ServiceRegistration   = 9,
    ServiceAlive          = 10,
    Unknown               = 11,
};

// Decoded or to-be-encoded WRP envelope.
//
// Inbound messages are handed to handlers by const reference and do not
// outlive the handler call.
struct Message {
    MessageType type = MessageType::SimpleEvent;
    std::string source;
    std::string destination;
    std::string transaction_uuid;
    std::string content_type;
    std::string accept;
    std::optional<int64_t> status;
    std::optional<int64_t> request_delivery_response;
    std::vector<std::string> headers;
    std::map<std::string, std::string> metadata;
    std::vector<uint8_t> payload;
    std::string service_name;
    std::string url;
    std::vector<std::string> partner_ids;
    std::string session_id;

    static Message simple_event(std::string source, std::string destination,
                                std::vector<uint8_t> payload) {
        Message m;
        m.type = MessageType::SimpleEvent;
        m.source = std::move(source);
        m.destination = std::move(destination);
        m.payload = std::move(payload);
        return m;
    }

    static Message request_response(std::string source, std::string destination,
                                    std::string transaction_uuid,
                                    std::vector<uint8_t> payload) {
        Message m;
        m.type = MessageType::SimpleRequestResponse;
        m.source = std::move(source);
        m.destination = std::move(destination);
        m.transaction_uuid = std::move(transaction_uuid);
        m.payload = std::move(payload);
        return m;
    }

    std::string payload_string() const {
        return std::string(payload.begin(), payload.end());
    }

    bool operator==(const Message& other) const {
        return type == other.type && source == other.source &&
               destination == other.destination &&
               transaction_uuid == other.transaction_uuid &&
               content_type == other.content_type && accept == other.accept &&
               status == other.status &&
               request_delivery_response == other.request_delivery_response &&
               headers == other.headers && metadata == other.metadata &&
               payload == other.payload && service_name == other.service_name &&
               url == other.url && partner_ids == other.partner_ids &&
               session_id == other.session_id;
    }

    bool operator!=(const Message& other) const { return !(*this == other); }
};

} // namespace kratos
