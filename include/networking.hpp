#pragma once

#include <string>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <vector>
#include <boost/asio.hpp>
#include "protocol/packet.hpp"
#include "transfer.hpp"

namespace networking {

// One live duplex byte stream to the peer, identical whether it was
// accepted or dialed.
//
// Reads come from a single reader thread. Writes may come from any thread;
// each frame is written under the write lock so chunks of different frames
// never interleave.
class Connection {
public:
    explicit Connection(boost::asio::ip::tcp::socket socket);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Payloads above `max_payload` are drained and dropped.
    transfer::ReadResult read_frame(uint64_t max_payload = UINT64_MAX);

    transfer::TransferState write_frame(protocol::CommandType command, const std::string& info,
                                        transfer::PayloadSource* payload = nullptr,
                                        const std::atomic<bool>* cancel_flag = nullptr,
                                        transfer::TransferProgressCallback progress_cb = nullptr);

    transfer::TransferState write_frame(protocol::CommandType command, const std::string& info,
                                        const std::vector<uint8_t>& payload);

    // Waits for the frame currently being written, then closes. Blocks for as
    // long as that write does, so never call it while holding a lock other
    // threads need.
    void close_after_writes();

    // Unblocks any pending read or write. Safe from any thread, idempotent.
    void close();

    bool is_open() const { return open_; }
    const std::string& remote_address() const { return remote_address_; }

    // Blocking read of the underlying socket, for peers that stream payloads
    // to disk instead of assembling them.
    boost::asio::ip::tcp::socket& socket() { return socket_; }

private:
    boost::asio::ip::tcp::socket socket_;
    std::mutex write_mutex_;
    std::mutex close_mutex_;
    std::atomic<bool> open_{true};
    std::string remote_address_;
};

// Accepts inbound connections on its own thread. Every accepted socket is
// handed to the handler; enforcing the single-active policy is the handler's
// job (the session controller supersedes its current connection).
class Listener {
public:
    using ConnectionHandler = std::function<void(std::shared_ptr<Connection>)>;

    Listener(boost::asio::io_context& io_context, unsigned short port);
    ~Listener();

    void start(ConnectionHandler handler);
    void stop();

    bool is_running() const { return running_; }
    unsigned short port() const { return port_; }

private:
    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    unsigned short port_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

// Resolves and connects. Throws boost::system::system_error on failure.
std::shared_ptr<Connection> dial(boost::asio::io_context& io_context, const std::string& host,
                                 unsigned short port);

std::string get_local_ip(boost::asio::io_context& io_context);
std::string format_size(uint64_t bytes);

} // namespace networking
