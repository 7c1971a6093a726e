// src/client.cpp
// Kratos client: discovery, read loop, send and teardown.

#include "kratos/client.hpp"
#include "discovery.hpp"
#include "encoding.hpp"
#include "router.hpp"
#include "transport.hpp"
#include "watchdog.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <mutex>
#include <thread>

namespace kratos {

// Default logger: stderr, not registered in the spdlog registry so
// several clients in one process do not collide on the name.
static std::shared_ptr<spdlog::logger> default_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto log = std::make_shared<spdlog::logger>("kratos", sink);
    log->set_level(spdlog::level::info);
    return log;
}

struct Client::Inner {
    std::shared_ptr<spdlog::logger> log;
    std::unique_ptr<Router> router;
    std::string device_id;
    std::string url;
    std::string hostname;

    std::unique_ptr<Transport> transport;
    std::unique_ptr<Watchdog> watchdog;
    std::thread reader;
    std::atomic<std::thread::id> reader_id{};

    std::mutex close_mutex;
    std::mutex join_mutex;
    std::atomic<bool> closed{false};

    bool on_reader_thread() const { return std::this_thread::get_id() == reader_id.load(); }

    void close() {
        {
            std::lock_guard<std::mutex> lock(close_mutex);
            // A second call still joins a reader that a handler left running.
            if (!closed.exchange(true) && transport) {
                log->info("closing connection for {}", device_id);

                // The watchdog writes the close frame on its way out.
                if (watchdog) {
                    watchdog->stop();
                    watchdog->join();
                }
                transport->close_connection();
            }
        }

        // From a handler the loop exits on its own once the transport is down.
        if (on_reader_thread()) return;
        std::lock_guard<std::mutex> lock(join_mutex);
        if (reader.joinable()) reader.join();
    }

    // Owner is letting go. On the reader thread the loop keeps its own
    // reference to us until it returns.
    void release() {
        close();
        if (on_reader_thread()) {
            std::lock_guard<std::mutex> lock(join_mutex);
            if (reader.joinable()) reader.detach();
        }
    }

    void read_loop() {
        reader_id.store(std::this_thread::get_id());
        while (true) {
            std::vector<uint8_t> frame;
            try {
                frame = transport->receive();
            } catch (const KratosError& e) {
                if (!transport->closed()) {
                    log->error("read failed for {}: {}", device_id, e.what());
                }
                break;
            }

            Message message;
            try {
                message = encoding::decode_message(frame);
            } catch (const KratosError& e) {
                log->error("dropping connection, undecodable frame from {}: {}", hostname,
                           e.what());
                break;
            }

            log->debug("received message type {} for {}", static_cast<int64_t>(message.type),
                       message.destination);
            if (router->dispatch(message) == 0) {
                log->debug("no handler for destination {}", message.destination);
            }
        }

        // The connection is unusable from here; close() still joins us.
        // The owner may already be gone, only our own state is touched.
        transport->close_connection();
        watchdog->stop();
    }
};

Client::Client() : inner_(std::make_shared<Inner>()) {}

Client::~Client() {
    if (inner_) inner_->release();
}

Client::Client(Client&&) noexcept = default;

Client& Client::operator=(Client&& other) noexcept {
    if (this != &other) {
        if (inner_) inner_->release();
        inner_ = std::move(other.inner_);
    }
    return *this;
}

std::unique_ptr<Client> Client::create(ClientConfig config) {
    return create(std::move(config), nullptr);
}

std::unique_ptr<Client> Client::create(ClientConfig config, std::shared_ptr<Dialer> dialer) {
    std::unique_ptr<Client> client(new Client());
    auto& in = *client->inner_;
    in.log = config.logger() ? config.logger() : default_logger();

    // Compile patterns before touching the network.
    in.router = std::make_unique<Router>(config.handlers());

    discovery::DialerFactory make_dialer;
    if (dialer) {
        make_dialer = [dialer] { return dialer; };
    } else {
        make_dialer = [&config] { return make_websocket_dialer(config.tls_identity()); };
    }

    auto established = discovery::establish(config, make_dialer, *in.log);
    in.device_id = std::move(established.device_id);
    in.url = std::move(established.url);
    in.hostname = std::move(established.hostname);
    in.transport = std::make_unique<Transport>(std::move(established.connection));

    Transport* transport = in.transport.get();
    in.watchdog = std::make_unique<Watchdog>(
        *transport, config.ping_period(), config.on_ping_miss(), in.log,
        [transport] { transport->close_connection(); });
    Watchdog* watchdog = in.watchdog.get();
    in.transport->set_ack_listener([watchdog] { watchdog->acknowledge(); });

    in.watchdog->start();
    in.reader = std::thread([keep = client->inner_] { keep->read_loop(); });
    in.reader_id.store(in.reader.get_id());

    in.log->info("connected {} to {}", in.device_id, in.url);
    return client;
}

const std::string& Client::hostname() const noexcept { return inner_->hostname; }
const std::string& Client::url() const noexcept { return inner_->url; }
const std::string& Client::device_id() const noexcept { return inner_->device_id; }

void Client::send(const Message& message) {
    if (!inner_ || inner_->closed.load()) {
        throw KratosError::closed();
    }
    auto frame = encoding::encode_message(message);
    inner_->transport->send_frame(frame);
    inner_->log->info("sent message type {} to {} ({} bytes)",
                      static_cast<int64_t>(message.type), message.destination, frame.size());
}

void Client::close() {
    if (inner_) inner_->close();
}

bool Client::is_closed() const noexcept {
    return !inner_ || inner_->closed.load() || inner_->transport->closed();
}

uint64_t Client::missed_pings() const noexcept {
    return inner_ ? inner_->watchdog->missed() : 0;
}

} // namespace kratos
