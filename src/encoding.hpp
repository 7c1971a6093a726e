// src/encoding.hpp
// Hand-written MessagePack encoding of WRP envelopes.
// Wire layout matches the msgpack WRP format used by the WebPA servers.

#pragma once

#include "kratos/error.hpp"
#include "kratos/message.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace kratos {
namespace encoding {

// Nesting limit when skipping unknown values.
static constexpr int MAX_SKIP_DEPTH = 32;

// --- Writers (big-endian, per MessagePack) ---

inline void write_u8(std::vector<uint8_t>& buf, uint8_t value) {
    buf.push_back(value);
}

inline void write_u16(std::vector<uint8_t>& buf, uint16_t value) {
    buf.push_back(static_cast<uint8_t>(value >> 8));
    buf.push_back(static_cast<uint8_t>(value));
}

inline void write_u32(std::vector<uint8_t>& buf, uint32_t value) {
    buf.push_back(static_cast<uint8_t>(value >> 24));
    buf.push_back(static_cast<uint8_t>(value >> 16));
    buf.push_back(static_cast<uint8_t>(value >> 8));
    buf.push_back(static_cast<uint8_t>(value));
}

inline void write_u64(std::vector<uint8_t>& buf, uint64_t value) {
    for (int i = 7; i >= 0; i--) {
        buf.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

inline void write_map_header(std::vector<uint8_t>& buf, size_t n) {
    if (n < 16) {
        write_u8(buf, static_cast<uint8_t>(0x80 | n));
    } else if (n <= 0xffff) {
        write_u8(buf, 0xde);
        write_u16(buf, static_cast<uint16_t>(n));
    } else {
        write_u8(buf, 0xdf);
        write_u32(buf, static_cast<uint32_t>(n));
    }
}

inline void write_array_header(std::vector<uint8_t>& buf, size_t n) {
    if (n < 16) {
        write_u8(buf, static_cast<uint8_t>(0x90 | n));
    } else if (n <= 0xffff) {
        write_u8(buf, 0xdc);
        write_u16(buf, static_cast<uint16_t>(n));
    } else {
        write_u8(buf, 0xdd);
        write_u32(buf, static_cast<uint32_t>(n));
    }
}

inline void write_str(std::vector<uint8_t>& buf, const std::string& s) {
    size_t n = s.size();
    if (n < 32) {
        write_u8(buf, static_cast<uint8_t>(0xa0 | n));
    } else if (n <= 0xff) {
        write_u8(buf, 0xd9);
        write_u8(buf, static_cast<uint8_t>(n));
    } else if (n <= 0xffff) {
        write_u8(buf, 0xda);
        write_u16(buf, static_cast<uint16_t>(n));
    } else {
        write_u8(buf, 0xdb);
        write_u32(buf, static_cast<uint32_t>(n));
    }
    buf.insert(buf.end(), s.begin(), s.end());
}

inline void write_bin(std::vector<uint8_t>& buf, const std::vector<uint8_t>& data) {
    size_t n = data.size();
    if (n <= 0xff) {
        write_u8(buf, 0xc4);
        write_u8(buf, static_cast<uint8_t>(n));
    } else if (n <= 0xffff) {
        write_u8(buf, 0xc5);
        write_u16(buf, static_cast<uint16_t>(n));
    } else {
        write_u8(buf, 0xc6);
        write_u32(buf, static_cast<uint32_t>(n));
    }
    buf.insert(buf.end(), data.begin(), data.end());
}

// Smallest representation, as the reference encoder does.
inline void write_int(std::vector<uint8_t>& buf, int64_t value) {
    if (value >= 0) {
        if (value <= 0x7f) {
            write_u8(buf, static_cast<uint8_t>(value));
        } else if (value <= 0xff) {
            write_u8(buf, 0xcc);
            write_u8(buf, static_cast<uint8_t>(value));
        } else if (value <= 0xffff) {
            write_u8(buf, 0xcd);
            write_u16(buf, static_cast<uint16_t>(value));
        } else if (value <= 0xffffffffLL) {
            write_u8(buf, 0xce);
            write_u32(buf, static_cast<uint32_t>(value));
        } else {
            write_u8(buf, 0xcf);
            write_u64(buf, static_cast<uint64_t>(value));
        }
    } else if (value >= -32) {
        write_u8(buf, static_cast<uint8_t>(static_cast<int8_t>(value)));
    } else if (value >= INT8_MIN) {
        write_u8(buf, 0xd0);
        write_u8(buf, static_cast<uint8_t>(static_cast<int8_t>(value)));
    } else if (value >= INT16_MIN) {
        write_u8(buf, 0xd1);
        write_u16(buf, static_cast<uint16_t>(static_cast<int16_t>(value)));
    } else if (value >= INT32_MIN) {
        write_u8(buf, 0xd2);
        write_u32(buf, static_cast<uint32_t>(static_cast<int32_t>(value)));
    } else {
        write_u8(buf, 0xd3);
        write_u64(buf, static_cast<uint64_t>(value));
    }
}

inline void write_str_array(std::vector<uint8_t>& buf, const std::vector<std::string>& values) {
    write_array_header(buf, values.size());
    for (const auto& v : values) write_str(buf, v);
}

// --- Envelope encoding ---

inline bool is_valid_type(MessageType type) {
    auto v = static_cast<int64_t>(type);
    return v >= static_cast<int64_t>(MessageType::Auth) &&
           v <= static_cast<int64_t>(MessageType::Unknown);
}

inline bool requires_transaction_uuid(MessageType type) {
    switch (type) {
        case MessageType::SimpleRequestResponse:
        case MessageType::Create:
        case MessageType::Retrieve:
        case MessageType::Update:
        case MessageType::Delete:
            return true;
        default:
            return false;
    }
}

// Append the encoded envelope to buf. Throws KratosError (Serialization)
// when the message cannot be routed; buf is unchanged in that case.
inline void encode_message_into(std::vector<uint8_t>& buf, const Message& msg) {
    if (!is_valid_type(msg.type)) {
        throw KratosError::serialization(
            "invalid message type " + std::to_string(static_cast<int64_t>(msg.type)));
    }
    if (msg.type != MessageType::Auth && msg.type != MessageType::ServiceAlive &&
        msg.destination.empty()) {
        throw KratosError::serialization("destination is required");
    }
    if (requires_transaction_uuid(msg.type) && msg.transaction_uuid.empty()) {
        throw KratosError::serialization("transaction_uuid is required");
    }

    // msg_type, source and dest are always present.
    size_t fields = 3;
    fields += !msg.transaction_uuid.empty();
    fields += !msg.content_type.empty();
    fields += !msg.accept.empty();
    fields += msg.status.has_value();
    fields += msg.request_delivery_response.has_value();
    fields += !msg.headers.empty();
    fields += !msg.metadata.empty();
    fields += !msg.payload.empty();
    fields += !msg.service_name.empty();
    fields += !msg.url.empty();
    fields += !msg.partner_ids.empty();
    fields += !msg.session_id.empty();

    write_map_header(buf, fields);

    write_str(buf, "msg_type");
    write_int(buf, static_cast<int64_t>(msg.type));
    write_str(buf, "source");
    write_str(buf, msg.source);
    write_str(buf, "dest");
    write_str(buf, msg.destination);

    if (!msg.transaction_uuid.empty()) {
        write_str(buf, "transaction_uuid");
        write_str(buf, msg.transaction_uuid);
    }
    if (!msg.content_type.empty()) {
        write_str(buf, "content_type");
        write_str(buf, msg.content_type);
    }
    if (!msg.accept.empty()) {
        write_str(buf, "accept");
        write_str(buf, msg.accept);
    }
    if (msg.status) {
        write_str(buf, "status");
        write_int(buf, *msg.status);
    }
    if (msg.request_delivery_response) {
        write_str(buf, "rdr");
        write_int(buf, *msg.request_delivery_response);
    }
    if (!msg.headers.empty()) {
        write_str(buf, "headers");
        write_str_array(buf, msg.headers);
    }
    if (!msg.metadata.empty()) {
        write_str(buf, "metadata");
        write_map_header(buf, msg.metadata.size());
        for (const auto& kv : msg.metadata) {
            write_str(buf, kv.first);
            write_str(buf, kv.second);
        }
    }
    if (!msg.payload.empty()) {
        write_str(buf, "payload");
        write_bin(buf, msg.payload);
    }
    if (!msg.service_name.empty()) {
        write_str(buf, "service_name");
        write_str(buf, msg.service_name);
    }
    if (!msg.url.empty()) {
        write_str(buf, "url");
        write_str(buf, msg.url);
    }
    if (!msg.partner_ids.empty()) {
        write_str(buf, "partner_ids");
        write_str_array(buf, msg.partner_ids);
    }
    if (!msg.session_id.empty()) {
        write_str(buf, "session_id");
        write_str(buf, msg.session_id);
    }
}

inline std::vector<uint8_t> encode_message(const Message& msg) {
    std::vector<uint8_t> buf;
    buf.reserve(128 + msg.payload.size());
    encode_message_into(buf, msg);
    return buf;
}

// --- Decoding ---

class Reader {
public:
    Reader(const uint8_t* data, size_t len) : data_(data), len_(len) {}

    size_t remaining() const noexcept { return len_ - pos_; }

    uint8_t peek() const {
        need(1);
        return data_[pos_];
    }

    uint8_t read_u8() {
        need(1);
        return data_[pos_++];
    }

    uint16_t read_u16() {
        need(2);
        uint16_t v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return v;
    }

    uint32_t read_u32() {
        need(4);
        uint32_t v = (static_cast<uint32_t>(data_[pos_]) << 24) |
                     (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
                     (static_cast<uint32_t>(data_[pos_ + 2]) << 8) |
                     static_cast<uint32_t>(data_[pos_ + 3]);
        pos_ += 4;
        return v;
    }

    uint64_t read_u64() {
        need(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; i++) v = (v << 8) | data_[pos_ + i];
        pos_ += 8;
        return v;
    }

    size_t read_map_header() {
        uint8_t b = read_u8();
        if ((b & 0xf0) == 0x80) return b & 0x0f;
        if (b == 0xde) return read_u16();
        if (b == 0xdf) return read_u32();
        throw KratosError::serialization("expected map");
    }

    size_t read_array_header() {
        uint8_t b = read_u8();
        if ((b & 0xf0) == 0x90) return b & 0x0f;
        if (b == 0xdc) return read_u16();
        if (b == 0xdd) return read_u32();
        throw KratosError::serialization("expected array");
    }

    bool try_read_nil() {
        if (peek() == 0xc0) {
            pos_++;
            return true;
        }
        return false;
    }

    // Accepts str and bin families.
    std::string read_string() {
        size_t n = read_raw_length();
        need(n);
        std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
        pos_ += n;
        return s;
    }

    std::vector<uint8_t> read_bytes() {
        size_t n = read_raw_length();
        need(n);
        std::vector<uint8_t> v(data_ + pos_, data_ + pos_ + n);
        pos_ += n;
        return v;
    }

    int64_t read_int() {
        uint8_t b = read_u8();
        if (b <= 0x7f) return b;
        if (b >= 0xe0) return static_cast<int8_t>(b);
        switch (b) {
            case 0xcc: return read_u8();
            case 0xcd: return read_u16();
            case 0xce: return read_u32();
            case 0xcf: {
                uint64_t v = read_u64();
                if (v > static_cast<uint64_t>(INT64_MAX)) {
                    throw KratosError::serialization("integer overflow");
                }
                return static_cast<int64_t>(v);
            }
            case 0xd0: return static_cast<int8_t>(read_u8());
            case 0xd1: return static_cast<int16_t>(read_u16());
            case 0xd2: return static_cast<int32_t>(read_u32());
            case 0xd3: return static_cast<int64_t>(read_u64());
            default:
                throw KratosError::serialization("expected integer");
        }
    }

    std::vector<std::string> read_string_array() {
        size_t n = read_array_header();
        std::vector<std::string> out;
        out.reserve(n < remaining() ? n : remaining());
        for (size_t i = 0; i < n; i++) out.push_back(read_string());
        return out;
    }

    // Skip one value of any type.
    void skip(int depth = 0) {
        if (depth > MAX_SKIP_DEPTH) {
            throw KratosError::serialization("nesting too deep");
        }
        uint8_t b = read_u8();
        if (b <= 0x7f || b >= 0xe0) return;
        if ((b & 0xf0) == 0x80) return skip_entries(2 * static_cast<size_t>(b & 0x0f), depth);
        if ((b & 0xf0) == 0x90) return skip_entries(b & 0x0f, depth);
        if ((b & 0xe0) == 0xa0) return advance(b & 0x1f);
        switch (b) {
            case 0xc0: case 0xc2: case 0xc3: return;
            case 0xc4: case 0xd9: return advance(read_u8());
            case 0xc5: case 0xda: return advance(read_u16());
            case 0xc6: case 0xdb: return advance(read_u32());
            case 0xc7: return advance(static_cast<size_t>(read_u8()) + 1);
            case 0xc8: return advance(static_cast<size_t>(read_u16()) + 1);
            case 0xc9: return advance(static_cast<size_t>(read_u32()) + 1);
            case 0xca: return advance(4);
            case 0xcb: return advance(8);
            case 0xcc: case 0xd0: return advance(1);
            case 0xcd: case 0xd1: return advance(2);
            case 0xce: case 0xd2: return advance(4);
            case 0xcf: case 0xd3: return advance(8);
            case 0xd4: return advance(2);
            case 0xd5: return advance(3);
            case 0xd6: return advance(5);
            case 0xd7: return advance(9);
            case 0xd8: return advance(17);
            case 0xdc: return skip_entries(read_u16(), depth);
            case 0xdd: return skip_entries(read_u32(), depth);
            case 0xde: return skip_entries(2 * static_cast<size_t>(read_u16()), depth);
            case 0xdf: return skip_entries(2 * static_cast<size_t>(read_u32()), depth);
            default:
                throw KratosError::serialization("invalid type byte");
        }
    }

private:
    void need(size_t n) const {
        if (n > len_ - pos_) {
            throw KratosError::serialization("unexpected end of input");
        }
    }

    void advance(size_t n) {
        need(n);
        pos_ += n;
    }

    void skip_entries(size_t n, int depth) {
        for (size_t i = 0; i < n; i++) skip(depth + 1);
    }

    size_t read_raw_length() {
        uint8_t b = read_u8();
        if ((b & 0xe0) == 0xa0) return b & 0x1f;
        switch (b) {
            case 0xd9: case 0xc4: return read_u8();
            case 0xda: case 0xc5: return read_u16();
            case 0xdb: case 0xc6: return read_u32();
            default:
                throw KratosError::serialization("expected string or binary");
        }
    }

    const uint8_t* data_;
    size_t len_;
    size_t pos_ = 0;
};

// Decode one envelope. Unknown keys are skipped. Throws KratosError
// (Serialization) on malformed input.
inline Message decode_message(const uint8_t* data, size_t len) {
    Reader r(data, len);
    Message msg;
    msg.type = MessageType::Invalid0;

    size_t fields = r.read_map_header();
    for (size_t i = 0; i < fields; i++) {
        std::string key = r.read_string();
        if (r.try_read_nil()) continue;

        if (key == "msg_type") {
            msg.type = static_cast<MessageType>(r.read_int());
        } else if (key == "source") {
            msg.source = r.read_string();
        } else if (key == "dest") {
            msg.destination = r.read_string();
        } else if (key == "transaction_uuid") {
            msg.transaction_uuid = r.read_string();
        } else if (key == "content_type") {
            msg.content_type = r.read_string();
        } else if (key == "accept") {
            msg.accept = r.read_string();
        } else if (key == "status") {
            msg.status = r.read_int();
        } else if (key == "rdr") {
            msg.request_delivery_response = r.read_int();
        } else if (key == "headers") {
            msg.headers = r.read_string_array();
        } else if (key == "metadata") {
            size_t n = r.read_map_header();
            for (size_t j = 0; j < n; j++) {
                std::string k = r.read_string();
                msg.metadata[std::move(k)] = r.read_string();
            }
        } else if (key == "payload") {
            msg.payload = r.read_bytes();
        } else if (key == "service_name") {
            msg.service_name = r.read_string();
        } else if (key == "url") {
            msg.url = r.read_string();
        } else if (key == "partner_ids") {
            msg.partner_ids = r.read_string_array();
        } else if (key == "session_id") {
            msg.session_id = r.read_string();
        } else {
            r.skip();
        }
    }

    return msg;
}

inline Message decode_message(const std::vector<uint8_t>& frame) {
    return decode_message(frame.data(), frame.size());
}

} // namespace encoding
} // namespace kratos
