#include "server.hpp"
#include <iomanip>
#include <sstream>

namespace networking {

Server::Server(config::HostConfig config)
    : config_(std::move(config)),
      work_guard_(boost::asio::make_work_guard(timer_io_)),
      store_(config_.library_dir),
      cache_(config_.cache_max_entries, config_.cache_max_bytes),
      pin_gate_(timer_io_, config_.pin_timeout, config_.max_pin_attempts) {
    session::ControllerOptions options;
    options.worker_threads = config_.worker_threads;
    options.retry_delay = config_.retry_delay;
    options.verbose = config_.verbose;

    controller_ = std::make_unique<session::SessionController>(timer_io_, pin_gate_, cache_, store_, options,
                                                               make_callbacks());
    timer_thread_ = std::thread([this]() { timer_io_.run(); });
}

Server::~Server() {
    stop();
    controller_.reset();
    work_guard_.reset();
    timer_io_.stop();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
}

session::SessionCallbacks Server::make_callbacks() {
    session::SessionCallbacks callbacks;

    callbacks.on_state = [](session::State state) {
        std::cout << "[Host] " << session::state_name(state) << "\n";
    };

    callbacks.on_pin = [](const std::string& code, int seconds_remaining) {
        if (code.empty()) return;
        std::cout << "┌──────────────────────┐\n";
        std::cout << "│  PIN: " << code << "  (" << std::setw(2) << seconds_remaining << "s)    │\n";
        std::cout << "└──────────────────────┘\n";
    };

    callbacks.on_sync_progress = [this](double progress) {
        if (!config_.verbose) return;
        std::cout << "\r[Host] Syncing library " << static_cast<int>(progress * 100) << "%   " << std::flush;
        if (progress >= 1.0) std::cout << "\n";
    };

    callbacks.on_status = [](const std::string& message) {
        std::cout << "[Host] " << message << "\n";
    };

    callbacks.on_error = [](const std::string& message) {
        std::cerr << "[Host] Error: " << message << "\n";
    };

    callbacks.on_progress = [](const std::string& label, uint64_t sent, uint64_t total, double speed_mbps) {
        int percent = (total > 0) ? static_cast<int>((sent * 100.0) / total) : 100;
        std::cout << "\r" << label << " " << percent << "% | " << std::fixed << std::setprecision(1)
                  << speed_mbps << " MB/s    " << std::flush;
        if (sent == total) std::cout << "\n";
    };

    return callbacks;
}

// ─── Lifecycle ──────────────────────────────────────────────────────────────

void Server::start() {
    if (running_) return;

    store_.refresh();
    std::cout << "[Host] Serving " << store_.list_assets().size() << " assets from "
              << config_.library_dir << " as \"" << config_.device_name << "\"\n";

    controller_->start();
    running_ = true;

    if (config_.dial_address) {
        dial_thread_ = std::thread(&Server::dial_loop, this);
        return;
    }

    listener_ = std::make_unique<Listener>(net_io_, config_.port);
    std::cout << "[Host] Reachable at " << get_local_ip(net_io_) << ":" << listener_->port()
              << " (" << protocol::SERVICE_TYPE << ")\n";
    listener_->start([this](std::shared_ptr<Connection> connection) {
        controller_->attach(std::move(connection));
    });
}

void Server::stop() {
    if (!running_.exchange(false)) return;

    if (listener_) {
        listener_->stop();
        listener_.reset();
    }
    if (dial_thread_.joinable()) {
        dial_thread_.join();
    }
    controller_->stop();
}

// Outbound mode: keep one connection to the configured address while searching.
void Server::dial_loop() {
    auto [host, port] = config::split_address(*config_.dial_address);

    while (running_) {
        if (controller_->state() != session::State::SEARCHING || controller_->has_connection()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            continue;
        }

        try {
            auto connection = dial(net_io_, host, port);
            std::cout << "[Host] Connected to " << connection->remote_address() << "\n";
            controller_->attach(std::move(connection));
        } catch (boost::system::system_error& e) {
            std::cerr << "[Host] Dial " << host << ":" << port << " failed: " << e.what() << "\n";
            auto deadline = std::chrono::steady_clock::now() + config_.retry_delay;
            while (running_ && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }
    }
}

// ─── Console ────────────────────────────────────────────────────────────────

std::string Server::status() const {
    std::ostringstream out;
    session::State state = controller_->state();
    out << "State: " << session::state_name(state);

    std::string peer = controller_->peer_name();
    if (!peer.empty()) out << " | Peer: " << peer;

    if (state == session::State::SYNCING) {
        out << " | Sync " << static_cast<int>(controller_->sync_progress() * 100) << "%";
    } else if (state == session::State::READY) {
        auto counts = controller_->asset_counts();
        out << " | " << counts.total << " assets (" << counts.photos << " photos, " << counts.videos
            << " videos, " << format_size(counts.total_size_bytes) << ")";
    } else if (state == session::State::ERROR) {
        out << " | " << controller_->error_message();
    }

    catalog::CacheStats stats = cache_.stats();
    out << " | Cache " << stats.entries << " thumbnails, " << format_size(stats.bytes) << ", " << stats.hits
        << " hits / " << stats.misses << " misses";
    return out.str();
}

void Server::run_console(std::istream& in) {
    std::cout << "Commands: status, disconnect, retry, quit\n";

    std::string line;
    while (running_ && std::getline(in, line)) {
        if (line.empty()) continue;

        if (line == "status") {
            std::cout << status() << "\n";
        } else if (line == "disconnect") {
            controller_->disconnect();
        } else if (line == "retry") {
            controller_->retry();
        } else if (line == "quit" || line == "exit") {
            break;
        } else {
            std::cout << "Unknown command: " << line << "\n";
        }
    }
}

} // namespace networking
