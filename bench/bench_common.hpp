// bench/bench_common.hpp
// Shared benchmark scenarios for WRP envelope encoding and decoding.

#pragma once

#include "kratos/message.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace kratos_bench {

struct BenchScenario {
    const char* name;
    size_t payload_size;
    size_t metadata_entries;
};

constexpr BenchScenario SCENARIOS[] = {
    {"ping_sized", 16, 0},
    {"typical_event", 200, 2},
    {"config_response", 1000, 4},
    {"max_frame", 1900, 8},
};

constexpr size_t SCENARIO_COUNT = sizeof(SCENARIOS) / sizeof(SCENARIOS[0]);

// JSON-ish payload of approximately the given size in bytes.
inline std::vector<uint8_t> generate_payload(size_t size) {
    std::string base = R"({"command":"GET","names":["Device.DeviceInfo"]})";
    if (base.size() < size) {
        base.pop_back();
        base += R"(,"pad":")";
        if (base.size() + 2 < size) base.append(size - base.size() - 2, 'x');
        base += "\"}";
    }
    return std::vector<uint8_t>(base.begin(), base.end());
}

inline kratos::Message scenario_message(const BenchScenario& scenario) {
    auto msg = kratos::Message::request_response(
        "dns:talaria.example.net", "mac:112233445566/config",
        "9c1c7a4e-1b5c-4a6f-8e2d-0a1b2c3d4e5f", generate_payload(scenario.payload_size));
    msg.content_type = "application/json";
    for (size_t i = 0; i < scenario.metadata_entries; i++) {
        msg.metadata["/key-" + std::to_string(i)] = "value-" + std::to_string(i);
    }
    return msg;
}

} // namespace kratos_bench
