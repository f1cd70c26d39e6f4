#include "transfer.hpp"
#include <iostream>
#include <algorithm>
#include <array>
#include <chrono>
#include <cstring>

namespace transfer {

namespace {

// A peer closing mid-frame, or this side closing the socket underneath a
// blocked read, ends the stream without being a transport fault.
bool is_closed_error(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof ||
           ec == boost::asio::error::operation_aborted ||
           ec == boost::asio::error::bad_descriptor ||
           ec == boost::asio::error::shut_down;
}

} // namespace

// ─── Payload sources ────────────────────────────────────────────────────────

MemoryPayload::MemoryPayload(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

std::size_t MemoryPayload::read(uint8_t* buffer, std::size_t max_bytes) {
    std::size_t n = std::min(max_bytes, bytes_.size() - offset_);
    if (n > 0) {
        std::memcpy(buffer, bytes_.data() + offset_, n);
        offset_ += n;
    }
    return n;
}

FilePayload::FilePayload(const std::string& filepath) : file_(filepath, std::ios::binary) {
    if (!file_.is_open()) {
        std::cerr << "Could not open file for reading: " << filepath << "\n";
        return;
    }
    file_.seekg(0, std::ios::end);
    size_ = static_cast<uint64_t>(file_.tellg());
    file_.seekg(0);
    remaining_ = size_;
}

std::size_t FilePayload::read(uint8_t* buffer, std::size_t max_bytes) {
    if (!file_.is_open() || remaining_ == 0) return 0;

    std::size_t want = static_cast<std::size_t>(std::min<uint64_t>(max_bytes, remaining_));
    file_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(want));
    std::size_t got = static_cast<std::size_t>(file_.gcount());
    remaining_ -= got;
    return got;
}

// ─── MessageSender ──────────────────────────────────────────────────────────

void MessageSender::send_header(boost::asio::ip::tcp::socket& socket, const protocol::PacketHeader& header) {
    auto buf = protocol::serialize_header(header);
    boost::asio::write(socket, boost::asio::buffer(buf));
}

TransferState MessageSender::send_frame(boost::asio::ip::tcp::socket& socket, protocol::CommandType command,
                                        const std::string& info, PayloadSource* payload,
                                        const std::atomic<bool>* cancel_flag,
                                        TransferProgressCallback progress_cb) {
    uint64_t total = payload ? payload->size() : 0;

    try {
        send_header(socket, protocol::PacketHeader{command, total, info});
        if (total == 0) {
            return TransferState::COMPLETED;
        }

        uint64_t total_sent = 0;
        auto start_time = std::chrono::steady_clock::now();
        auto last_cb_time = start_time;

        std::vector<uint8_t> buffer(protocol::CHUNK_SIZE); // 64KB per chunk
        while (total_sent < total) {
            if (cancel_flag && cancel_flag->load()) {
                std::cout << "[Transport] " << protocol::command_name(command) << " cancelled after "
                          << total_sent << "/" << total << " bytes\n";
                return TransferState::CANCELLED;
            }

            std::size_t bytes_read = payload->read(buffer.data(), buffer.size());
            if (bytes_read == 0) {
                // Source shrank underneath us; the declared size can no longer be honoured
                std::cerr << "[Transport] Payload source ended early at " << total_sent
                          << "/" << total << " bytes\n";
                return TransferState::FAILED;
            }
            boost::asio::write(socket, boost::asio::buffer(buffer.data(), bytes_read));
            total_sent += bytes_read;

            if (progress_cb) {
                auto now = std::chrono::steady_clock::now();
                auto elapsed_since_cb = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_cb_time).count();
                if (elapsed_since_cb >= 300 || total_sent == total) {
                    double elapsed = std::chrono::duration<double>(now - start_time).count();
                    double speed = (elapsed > 0) ? (total_sent / elapsed / (1024.0 * 1024.0)) : 0;
                    progress_cb(info, total_sent, total, speed);
                    last_cb_time = now;
                }
            }
        }
        return TransferState::COMPLETED;
    } catch (boost::system::system_error& e) {
        std::cerr << "MessageSender Exception (" << protocol::command_name(command) << "): " << e.what() << "\n";
        return TransferState::FAILED;
    }
}

TransferState MessageSender::send_frame(boost::asio::ip::tcp::socket& socket, protocol::CommandType command,
                                        const std::string& info, const std::vector<uint8_t>& payload,
                                        const std::atomic<bool>* cancel_flag) {
    MemoryPayload source(payload);
    return send_frame(socket, command, info, &source, cancel_flag);
}

// ─── MessageReceiver ────────────────────────────────────────────────────────

ReadResult MessageReceiver::receive_header(boost::asio::ip::tcp::socket& socket) {
    ReadResult result{ReadStatus::FAILED, {}, {}};

    while (true) {
        std::array<uint8_t, protocol::HEADER_SIZE> buf;
        boost::system::error_code ec;
        boost::asio::read(socket, boost::asio::buffer(buf), ec);

        if (ec) {
            result.status = is_closed_error(ec) ? ReadStatus::CLOSED : ReadStatus::FAILED;
            result.error = ec.message();
            return result;
        }

        auto header = protocol::deserialize_header(buf);
        if (!header) {
            std::cerr << "[Transport] Invalid header (command byte " << static_cast<int>(buf[0])
                      << "), skipping\n";
            continue;
        }

        result.status = ReadStatus::FRAME;
        result.frame.header = std::move(*header);
        return result;
    }
}

ReadStatus MessageReceiver::receive_payload(boost::asio::ip::tcp::socket& socket, uint64_t size,
                                            const ChunkCallback& on_chunk, std::string* error) {
    std::vector<uint8_t> buffer(static_cast<std::size_t>(std::min<uint64_t>(size, protocol::CHUNK_SIZE)));
    uint64_t remaining = size;

    while (remaining > 0) {
        std::size_t chunk = static_cast<std::size_t>(std::min<uint64_t>(remaining, buffer.size()));
        boost::system::error_code ec;
        boost::asio::read(socket, boost::asio::buffer(buffer.data(), chunk), ec);

        if (ec) {
            if (error) *error = ec.message();
            return is_closed_error(ec) ? ReadStatus::CLOSED : ReadStatus::FAILED;
        }

        if (on_chunk) on_chunk(buffer.data(), chunk);
        remaining -= chunk;
    }
    return ReadStatus::FRAME;
}

ReadResult MessageReceiver::receive_frame(boost::asio::ip::tcp::socket& socket, uint64_t max_payload) {
    ReadResult result = receive_header(socket);
    if (result.status != ReadStatus::FRAME || result.frame.header.payload_size == 0) {
        return result;
    }

    if (result.frame.header.payload_size > max_payload) {
        std::cerr << "[Transport] Discarding " << result.frame.header.payload_size << "-byte payload of "
                  << protocol::command_name(result.frame.header.command) << "\n";
        result.status = receive_payload(socket, result.frame.header.payload_size,
                                        [](const uint8_t*, std::size_t) {}, &result.error);
        return result;
    }

    auto& payload = result.frame.payload;
    result.status = receive_payload(socket, result.frame.header.payload_size,
        [&payload](const uint8_t* data, std::size_t n) {
            payload.insert(payload.end(), data, data + n);
        }, &result.error);

    if (result.status != ReadStatus::FRAME) {
        payload.clear();
    }
    return result;
}

} // namespace transfer
