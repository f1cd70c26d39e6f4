#pragma once

#include <string>
#include <cstdint>
#include <fstream>
#include <functional>
#include <vector>
#include <boost/asio.hpp>
#include "protocol/packet.hpp"
#include <atomic>

namespace transfer {

// Progress callback: label, bytes_transferred, bytes_total, speed_mbps
using TransferProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t, double)>;

// Receives each payload chunk as it arrives
using ChunkCallback = std::function<void(const uint8_t*, std::size_t)>;

enum class TransferState {
    COMPLETED,
    CANCELLED,
    FAILED
};

enum class ReadStatus {
    FRAME,
    CLOSED,
    FAILED
};

struct ReadResult {
    ReadStatus status;
    protocol::Frame frame;
    std::string error;
};

// Byte content of one frame payload, consumed front to back exactly once.
class PayloadSource {
public:
    virtual ~PayloadSource() = default;
    virtual uint64_t size() const = 0;
    // Returns the number of bytes copied into `buffer`; 0 at end of data.
    virtual std::size_t read(uint8_t* buffer, std::size_t max_bytes) = 0;
};

class MemoryPayload : public PayloadSource {
public:
    explicit MemoryPayload(std::vector<uint8_t> bytes);
    uint64_t size() const override { return bytes_.size(); }
    std::size_t read(uint8_t* buffer, std::size_t max_bytes) override;

private:
    std::vector<uint8_t> bytes_;
    std::size_t offset_ = 0;
};

// Streams a file from disk so large originals never sit in memory whole.
class FilePayload : public PayloadSource {
public:
    explicit FilePayload(const std::string& filepath);
    bool is_open() const { return file_.is_open(); }
    uint64_t size() const override { return size_; }
    std::size_t read(uint8_t* buffer, std::size_t max_bytes) override;

private:
    std::ifstream file_;
    uint64_t size_ = 0;
    uint64_t remaining_ = 0;
};

class MessageSender {
public:
    static void send_header(boost::asio::ip::tcp::socket& socket, const protocol::PacketHeader& header);

    // Writes the header then the payload in CHUNK_SIZE pieces. The cancel flag
    // is checked between chunks; CANCELLED leaves a partial frame on the wire,
    // so the caller must close the connection.
    static TransferState send_frame(boost::asio::ip::tcp::socket& socket, protocol::CommandType command,
                                    const std::string& info, PayloadSource* payload = nullptr,
                                    const std::atomic<bool>* cancel_flag = nullptr,
                                    TransferProgressCallback progress_cb = nullptr);

    static TransferState send_frame(boost::asio::ip::tcp::socket& socket, protocol::CommandType command,
                                    const std::string& info, const std::vector<uint8_t>& payload,
                                    const std::atomic<bool>* cancel_flag = nullptr);
};

class MessageReceiver {
public:
    // Blocks for the next valid header. Headers with an unknown command are
    // logged and skipped.
    static ReadResult receive_header(boost::asio::ip::tcp::socket& socket);

    // Reads exactly `size` bytes in CHUNK_SIZE pieces, handing each to `on_chunk`.
    static ReadStatus receive_payload(boost::asio::ip::tcp::socket& socket, uint64_t size,
                                      const ChunkCallback& on_chunk, std::string* error = nullptr);

    // Header plus full payload. A payload larger than `max_payload` is read
    // off the wire and dropped; the frame comes back with an empty payload.
    static ReadResult receive_frame(boost::asio::ip::tcp::socket& socket,
                                    uint64_t max_payload = UINT64_MAX);
};

} // namespace transfer
