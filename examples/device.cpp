// Kratos device: connect, register handlers, send one request, wait for traffic.
//
//   cmake -B build -DKRATOS_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/kratos_device https://petasos.example.net:8080 [cert.pem key.pem]

#include "kratos/kratos.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <mutex>
#include <random>
#include <string>
#include <vector>

// Random v4 UUID in canonical text form.
static std::string make_transaction_id() {
    std::mt19937_64 gen(std::random_device{}());
    uint8_t b[16];
    for (int i = 0; i < 16; i += 8) {
        uint64_t v = gen();
        for (int j = 0; j < 8; j++) b[i + j] = static_cast<uint8_t>(v >> (8 * j));
    }
    b[6] = (b[6] & 0x0F) | 0x40;
    b[8] = (b[8] & 0x3F) | 0x80;

    char out[37];
    std::snprintf(out, sizeof(out),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7], b[8], b[9], b[10], b[11],
                  b[12], b[13], b[14], b[15]);
    return out;
}

int main(int argc, char** argv) {
    if (argc != 2 && argc != 4) {
        std::fprintf(stderr, "usage: %s <discovery-url> [cert.pem key.pem]\n", argv[0]);
        return 2;
    }

    auto log = spdlog::stdout_color_mt("device");
    log->set_level(spdlog::level::debug);

    std::mutex mutex;
    std::condition_variable cv;
    int received = 0;

    auto greeter = [&](const char* hello) {
        return [&, hello](const kratos::Message& msg) {
            log->info("{} {} -> {}: {}", hello, msg.source, msg.destination, msg.payload_string());
            std::lock_guard<std::mutex> lock(mutex);
            received++;
            cv.notify_all();
        };
    };

    auto builder = kratos::ClientConfig::builder(
        {"mac:ffffff112233", "TG1682_2.1p7s1_PROD_sey", "TG1682G", "ARRIS Group, Inc."},
        argv[1]);
    builder.handler("/foo", greeter("Hello."))
        .handler("/bar", greeter("Hi."))
        .handler(".*", greeter("Hey."))
        .on_ping_miss([&] { log->warn("we missed the ping"); })
        .logger(log);
    if (argc == 4) {
        builder.certificate(argv[2]).private_key(argv[3]);
    }

    try {
        auto client = kratos::Client::create(builder.build());
        log->info("connected to {} as {}", client->hostname(), client->device_id());

        std::string payload = "the payload has reached the checkpoint";
        client->send(kratos::Message::request_response(
            "mac:ffffff112233/emu", "event:device-status/bla/bla",
            "emu:" + make_transaction_id(),
            std::vector<uint8_t>(payload.begin(), payload.end())));

        std::unique_lock<std::mutex> lock(mutex);
        if (!cv.wait_for(lock, std::chrono::minutes(5), [&] { return received > 0; })) {
            log->warn("no inbound message before timeout");
        }
        lock.unlock();

        client->close();
    } catch (const kratos::KratosError& e) {
        log->error("{}", e.what());
        return 1;
    }
    return 0;
}
