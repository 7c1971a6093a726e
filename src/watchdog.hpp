// src/watchdog.hpp
// Keepalive watchdog: periodic probes, advisory miss reporting.

#pragma once

#include "transport.hpp"
#include "kratos/config.hpp"

#include <spdlog/logger.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace kratos {

// Sends a ping every period and checks that the previous one was
// acknowledged. A missed acknowledgment only invokes the miss callback;
// a failed probe write is fatal and calls on_dead.
//
// States: running -> stopped. There is no restart.
class Watchdog {
public:
    Watchdog(Transport& transport, std::chrono::milliseconds period,
             ClientConfig::PingMissCallback on_miss, std::shared_ptr<spdlog::logger> log,
             std::function<void()> on_dead);
    ~Watchdog();

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    void start();

    // Peer is alive. Called from the transport on every pong.
    void acknowledge();

    // Request shutdown; the loop sends a close frame on its way out.
    // Returns false if a stop was already requested.
    bool stop();

    // Wait for the loop to exit. No-op from the watchdog thread itself.
    void join();

    uint64_t missed() const noexcept { return missed_.load(); }
    bool running() const noexcept { return running_.load(); }

private:
    void run();
    void report_miss();

    Transport& transport_;
    std::chrono::milliseconds period_;
    ClientConfig::PingMissCallback on_miss_;
    std::shared_ptr<spdlog::logger> log_;
    std::function<void()> on_dead_;
    std::thread thread_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool acked_ = false;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> missed_{0};
};

} // namespace kratos
