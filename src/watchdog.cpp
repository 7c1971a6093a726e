// src/watchdog.cpp
// Keepalive watchdog thread.

#include "watchdog.hpp"

namespace kratos {

Watchdog::Watchdog(Transport& transport, std::chrono::milliseconds period,
                   ClientConfig::PingMissCallback on_miss, std::shared_ptr<spdlog::logger> log,
                   std::function<void()> on_dead)
    : transport_(transport),
      period_(period),
      on_miss_(std::move(on_miss)),
      log_(std::move(log)),
      on_dead_(std::move(on_dead)) {}

Watchdog::~Watchdog() {
    stop();
    join();
}

void Watchdog::start() {
    running_.store(true);
    thread_ = std::thread(&Watchdog::run, this);
}

void Watchdog::acknowledge() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        acked_ = true;
    }
    log_->debug("pong received");
}

bool Watchdog::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_) return false;
        stop_requested_ = true;
    }
    cv_.notify_one();
    return true;
}

void Watchdog::join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void Watchdog::run() {
    bool probe_outstanding = false;
    bool dead = false;

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        auto deadline = std::chrono::steady_clock::now() + period_;
        if (cv_.wait_until(lock, deadline, [this] { return stop_requested_; })) {
            break;
        }

        if (probe_outstanding && !acked_) {
            missed_.fetch_add(1);
            lock.unlock();
            report_miss();
            lock.lock();
            if (stop_requested_) break;
        }
        acked_ = false;

        lock.unlock();
        try {
            transport_.send_ping();
            log_->debug("ping sent");
        } catch (const KratosError& e) {
            log_->error("ping failed, stopping watchdog: {}", e.what());
            dead = true;
        }
        lock.lock();

        if (dead) break;
        probe_outstanding = true;
    }
    lock.unlock();

    if (dead) {
        if (on_dead_) on_dead_();
    } else {
        log_->info("stopping ping handler");
        if (!transport_.send_close()) {
            log_->debug("close frame not sent, connection already down");
        }
    }
    running_.store(false);
}

void Watchdog::report_miss() {
    log_->warn("no pong within {} ms", period_.count());
    if (!on_miss_) return;
    try {
        on_miss_();
    } catch (const std::exception& e) {
        log_->warn("ping miss handler failed: {}", e.what());
    } catch (...) {
        log_->warn("ping miss handler failed with a non-standard exception");
    }
}

} // namespace kratos
