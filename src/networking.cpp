#include "networking.hpp"
#include <iostream>
#include <chrono>

using boost::asio::ip::tcp;

namespace networking {

std::string get_local_ip(boost::asio::io_context& io_context) {
    try {
        boost::asio::ip::udp::socket socket(io_context);
        socket.connect(boost::asio::ip::udp::endpoint(boost::asio::ip::make_address("8.8.8.8"), 53));
        return socket.local_endpoint().address().to_string();
    } catch (boost::system::system_error&) {
        return "127.0.0.1";
    }
}

std::string format_size(uint64_t bytes) {
    double size = bytes;
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    while (size >= 1024 && i < 4) {
        size /= 1024;
        i++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f%s", size, units[i]);
    return std::string(buf);
}

// ─── Connection ─────────────────────────────────────────────────────────────

Connection::Connection(tcp::socket socket) : socket_(std::move(socket)) {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (!ec) {
        remote_address_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }
    socket_.set_option(tcp::no_delay(true), ec);
}

Connection::~Connection() {
    close();
    boost::system::error_code ec;
    socket_.close(ec);
}

transfer::ReadResult Connection::read_frame(uint64_t max_payload) {
    if (!open_) {
        return {transfer::ReadStatus::CLOSED, {}, "connection closed"};
    }
    return transfer::MessageReceiver::receive_frame(socket_, max_payload);
}

transfer::TransferState Connection::write_frame(protocol::CommandType command, const std::string& info,
                                                transfer::PayloadSource* payload,
                                                const std::atomic<bool>* cancel_flag,
                                                transfer::TransferProgressCallback progress_cb) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!open_) {
        return transfer::TransferState::FAILED;
    }

    auto state = transfer::MessageSender::send_frame(socket_, command, info, payload, cancel_flag,
                                                     std::move(progress_cb));
    if (state != transfer::TransferState::COMPLETED) {
        // A partial frame leaves the stream unusable
        close();
    }
    return state;
}

transfer::TransferState Connection::write_frame(protocol::CommandType command, const std::string& info,
                                                const std::vector<uint8_t>& payload) {
    transfer::MemoryPayload source(payload);
    return write_frame(command, info, &source);
}

void Connection::close_after_writes() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    close();
}

void Connection::close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (!open_.exchange(false)) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
}

// ─── Listener ───────────────────────────────────────────────────────────────

Listener::Listener(boost::asio::io_context& io_context, unsigned short port)
    : io_context_(io_context), acceptor_(io_context) {
    tcp::endpoint endpoint(tcp::v4(), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();
}

Listener::~Listener() {
    stop();
}

void Listener::start(ConnectionHandler handler) {
    if (running_) return;
    running_ = true;

    thread_ = std::thread([this, handler]() {
        // Non-blocking so we can check running_ periodically
        acceptor_.non_blocking(true);
        std::cout << "[Transport] Listening on port " << port_ << "\n";

        while (running_) {
            tcp::socket socket(io_context_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);

            if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                continue;
            }
            if (ec) {
                std::cerr << "[Transport] Accept failed: " << ec.message() << "\n";
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
                continue;
            }

            socket.non_blocking(false, ec);
            auto connection = std::make_shared<Connection>(std::move(socket));
            std::cout << "[Transport] Connection from " << connection->remote_address() << "\n";
            if (handler) handler(connection);
        }
    });
}

void Listener::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    boost::system::error_code ec;
    acceptor_.close(ec);
}

// ─── Dialing ────────────────────────────────────────────────────────────────

std::shared_ptr<Connection> dial(boost::asio::io_context& io_context, const std::string& host,
                                 unsigned short port) {
    tcp::socket socket(io_context);
    tcp::resolver resolver(io_context);
    boost::asio::connect(socket, resolver.resolve(host, std::to_string(port)));
    return std::make_shared<Connection>(std::move(socket));
}

} // namespace networking
