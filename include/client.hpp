#pragma once

#include <string>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <boost/asio.hpp>
#include "config.hpp"
#include "networking.hpp"
#include "asset_store.hpp"
#include "protocol/asset_meta.hpp"

namespace networking {

// Interactive peer for a MediaBridge host. Frames are read on a background
// thread; THUMBNAIL_DATA and FILE_DATA payloads are streamed straight into
// the output directory.
class Client {
public:
    explicit Client(config::PeerConfig config);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Connects and sends CONNECT. Throws boost::system::system_error.
    void connect();

    // Prompts for the PIN until accepted. False when the host gives up on us.
    bool authenticate(std::istream& in);

    // Reads commands until "quit" or end of input, then disconnects.
    void run_console(std::istream& in);

    void disconnect();

    bool request_list();
    bool request_thumbnail(const std::string& asset_id);
    bool request_file(const std::string& asset_id, bool paired_video);

private:
    struct Event {
        protocol::CommandType command;
        std::string info;
        std::vector<uint8_t> payload;
        std::filesystem::path saved_to;
    };

    config::PeerConfig config_;
    boost::asio::io_context io_;
    std::shared_ptr<Connection> connection_;
    std::thread reader_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> events_;
    bool closed_ = false;
    bool receiving_ = false;
    std::vector<protocol::AssetMetadata> assets_; // from the last ASSETS_LIST

    void read_loop();
    void discard_events();

    // Accepts an id or a row number from the last listing.
    std::string resolve_id(const std::string& token);
    std::optional<protocol::AssetMetadata> known_asset(const std::string& asset_id);
    std::filesystem::path destination_for(protocol::CommandType command, const std::string& info);
    bool stream_to_file(const protocol::PacketHeader& header, const std::filesystem::path& path);

    // Waits for one of `commands`. The timeout restarts while a payload is
    // still arriving. nullopt on timeout or when the connection closes.
    std::optional<Event> wait_for(std::initializer_list<protocol::CommandType> commands,
                                  std::chrono::milliseconds timeout);

    void print_assets(const protocol::AssetListResponse& response);
};

} // namespace networking
