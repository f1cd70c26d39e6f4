#include "test_util.hpp"
#include "transfer.hpp"
#include "networking.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdio>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using boost::asio::ip::tcp;
using namespace transfer;

namespace {

struct SocketPair {
    boost::asio::io_context io;
    tcp::socket a{io};
    tcp::socket b{io};

    SocketPair() {
        tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        a.connect(acceptor.local_endpoint());
        acceptor.accept(b);
    }
};

std::vector<uint8_t> pattern(std::size_t n) {
    std::vector<uint8_t> bytes(n);
    for (std::size_t i = 0; i < n; ++i) bytes[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
    return bytes;
}

} // namespace

static void test_frame_payload_sizes() {
    std::fprintf(stderr, "-- test_frame_payload_sizes\n");

    SocketPair pair;
    const std::vector<std::size_t> sizes = {0, 1, 1000, protocol::CHUNK_SIZE, 3 * protocol::CHUNK_SIZE + 17};

    std::thread writer([&pair, &sizes]() {
        for (std::size_t n : sizes) {
            MessageSender::send_frame(pair.a, protocol::CommandType::FILE_DATA, "asset-" + std::to_string(n),
                                      pattern(n));
        }
    });

    for (std::size_t n : sizes) {
        ReadResult result = MessageReceiver::receive_frame(pair.b);
        CHECK(result.status == ReadStatus::FRAME);
        CHECK(result.frame.header.command == protocol::CommandType::FILE_DATA);
        CHECK_EQ(result.frame.header.payload_size, n);
        CHECK_STR_EQ(result.frame.header.info, "asset-" + std::to_string(n));
        CHECK(result.frame.payload == pattern(n));
    }
    writer.join();
}

static void test_chunked_receive() {
    std::fprintf(stderr, "-- test_chunked_receive\n");

    SocketPair pair;
    const std::size_t n = 2 * protocol::CHUNK_SIZE + 5;
    std::thread writer([&pair, n]() {
        MessageSender::send_frame(pair.a, protocol::CommandType::THUMBNAIL_DATA, "x", pattern(n));
    });

    ReadResult head = MessageReceiver::receive_header(pair.b);
    CHECK(head.status == ReadStatus::FRAME);

    std::size_t chunks = 0;
    std::size_t largest = 0;
    std::vector<uint8_t> collected;
    ReadStatus status = MessageReceiver::receive_payload(pair.b, head.frame.header.payload_size,
        [&](const uint8_t* data, std::size_t len) {
            ++chunks;
            largest = std::max(largest, len);
            collected.insert(collected.end(), data, data + len);
        });
    writer.join();

    CHECK(status == ReadStatus::FRAME);
    CHECK_EQ(chunks, 3u);
    CHECK(largest <= protocol::CHUNK_SIZE);
    CHECK(collected == pattern(n));
}

static void test_invalid_header_skipped() {
    std::fprintf(stderr, "-- test_invalid_header_skipped\n");

    SocketPair pair;
    std::array<uint8_t, protocol::HEADER_SIZE> junk{};
    junk[0] = 200;
    boost::asio::write(pair.a, boost::asio::buffer(junk));
    MessageSender::send_frame(pair.a, protocol::CommandType::NOTIFICATION, "hello", std::vector<uint8_t>{});

    ReadResult result = MessageReceiver::receive_frame(pair.b);
    CHECK(result.status == ReadStatus::FRAME);
    CHECK(result.frame.header.command == protocol::CommandType::NOTIFICATION);
    CHECK_STR_EQ(result.frame.header.info, "hello");
}

static void test_peer_close_is_closed() {
    std::fprintf(stderr, "-- test_peer_close_is_closed\n");

    SocketPair pair;
    pair.a.close();
    ReadResult result = MessageReceiver::receive_frame(pair.b);
    CHECK(result.status == ReadStatus::CLOSED);

    // Closed mid-payload
    SocketPair partial;
    auto head = protocol::serialize_header({protocol::CommandType::FILE_DATA, 1000, "cut"});
    boost::asio::write(partial.a, boost::asio::buffer(head));
    std::vector<uint8_t> some(10, 1);
    boost::asio::write(partial.a, boost::asio::buffer(some));
    partial.a.close();

    result = MessageReceiver::receive_frame(partial.b);
    CHECK(result.status == ReadStatus::CLOSED);
    CHECK(result.frame.payload.empty());
}

static void test_cancel_between_chunks() {
    std::fprintf(stderr, "-- test_cancel_between_chunks\n");

    SocketPair pair;
    std::atomic<bool> cancel{true};
    MemoryPayload source(pattern(protocol::CHUNK_SIZE * 4));

    TransferState state = MessageSender::send_frame(pair.a, protocol::CommandType::FILE_DATA, "big",
                                                    &source, &cancel);
    CHECK(state == TransferState::CANCELLED);

    // Only the header went out
    ReadResult head = MessageReceiver::receive_header(pair.b);
    CHECK(head.status == ReadStatus::FRAME);
    CHECK_EQ(head.frame.header.payload_size, protocol::CHUNK_SIZE * 4);
    CHECK_EQ(pair.b.available(), 0u);
}

static void test_file_payload() {
    std::fprintf(stderr, "-- test_file_payload\n");

    const char* path = "/tmp/test_mediabridge_payload.bin";
    auto bytes = pattern(100000);
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    FilePayload source(path);
    CHECK(source.is_open());
    CHECK_EQ(source.size(), bytes.size());

    std::vector<uint8_t> read_back;
    std::vector<uint8_t> buffer(4096);
    std::size_t n;
    while ((n = source.read(buffer.data(), buffer.size())) > 0) {
        read_back.insert(read_back.end(), buffer.begin(), buffer.begin() + n);
    }
    CHECK(read_back == bytes);
    std::remove(path);

    FilePayload missing("/tmp/does-not-exist-mediabridge.bin");
    CHECK(!missing.is_open());
    CHECK_EQ(missing.size(), 0u);
}

static void test_connection_write_after_close() {
    std::fprintf(stderr, "-- test_connection_write_after_close\n");

    SocketPair pair;
    networking::Connection connection(std::move(pair.a));
    CHECK(connection.is_open());
    CHECK(connection.write_frame(protocol::CommandType::PIN_OK, "") == TransferState::COMPLETED);

    connection.close();
    connection.close(); // idempotent
    CHECK(!connection.is_open());
    CHECK(connection.write_frame(protocol::CommandType::PIN_OK, "") == TransferState::FAILED);
    CHECK(connection.read_frame().status == ReadStatus::CLOSED);

    ReadResult first = MessageReceiver::receive_frame(pair.b);
    CHECK(first.status == ReadStatus::FRAME);
    CHECK(first.frame.header.command == protocol::CommandType::PIN_OK);
    CHECK(MessageReceiver::receive_frame(pair.b).status == ReadStatus::CLOSED);
}

int main() {
    test_frame_payload_sizes();
    test_chunked_receive();
    test_invalid_header_skipped();
    test_peer_close_is_closed();
    test_cancel_between_chunks();
    test_file_payload();
    test_connection_write_after_close();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
