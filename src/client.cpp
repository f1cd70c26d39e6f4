#include "client.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace networking {

namespace {

constexpr std::chrono::milliseconds REPLY_TIMEOUT{10000};
constexpr std::chrono::milliseconds LIST_TIMEOUT{30000};

// Keeps only the last path component so a hostile filename cannot escape
// the output directory.
std::string safe_name(const std::string& filename, const std::string& fallback) {
    std::string name = fs::path(filename).filename().string();
    if (name.empty() || name == "." || name == "..") {
        return fallback;
    }
    return name;
}

} // namespace

Client::Client(config::PeerConfig config) : config_(std::move(config)) {}

Client::~Client() {
    if (connection_) connection_->close();
    if (reader_.joinable()) reader_.join();
}

void Client::connect() {
    std::error_code ec;
    fs::create_directories(config_.output_dir, ec);
    if (ec) {
        std::cerr << "Cannot create " << config_.output_dir << ": " << ec.message() << "\n";
    }

    connection_ = dial(io_, config_.host, config_.port);
    std::cout << "Connected to " << connection_->remote_address() << "\n";
    reader_ = std::thread(&Client::read_loop, this);

    connection_->write_frame(protocol::CommandType::CONNECT, config_.device_name);
}

void Client::disconnect() {
    if (!connection_) return;
    if (connection_->is_open()) {
        connection_->write_frame(protocol::CommandType::DISCONNECT, "");
        connection_->close();
    }
    if (reader_.joinable()) reader_.join();
}

// ─── Reading ────────────────────────────────────────────────────────────────

void Client::read_loop() {
    auto& socket = connection_->socket();

    while (true) {
        transfer::ReadResult result = transfer::MessageReceiver::receive_header(socket);
        if (result.status != transfer::ReadStatus::FRAME) {
            if (result.status == transfer::ReadStatus::FAILED) {
                std::cerr << "Connection error: " << result.error << "\n";
            }
            break;
        }

        const protocol::PacketHeader& header = result.frame.header;
        Event event{header.command, header.info, {}, {}};

        if (header.command == protocol::CommandType::THUMBNAIL_DATA ||
            header.command == protocol::CommandType::FILE_DATA) {
            fs::path path = destination_for(header.command, header.info);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                receiving_ = true;
            }
            bool ok = stream_to_file(header, path);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                receiving_ = false;
            }
            if (!ok) break;
            event.saved_to = path;
        } else if (header.payload_size > 0) {
            std::string error;
            auto status = transfer::MessageReceiver::receive_payload(socket, header.payload_size,
                [&event](const uint8_t* data, std::size_t n) {
                    event.payload.insert(event.payload.end(), data, data + n);
                }, &error);
            if (status != transfer::ReadStatus::FRAME) {
                std::cerr << "Connection lost while reading " << protocol::command_name(header.command) << "\n";
                break;
            }
        }

        if (header.command == protocol::CommandType::NOTIFICATION) {
            std::cout << "\n[Host] " << header.info << "\n";
        } else if (header.command == protocol::CommandType::DISCONNECT) {
            std::cout << "\nHost ended the session.\n";
        }

        bool done = header.command == protocol::CommandType::DISCONNECT;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        }
        cv_.notify_all();
        if (done) break;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool Client::stream_to_file(const protocol::PacketHeader& header, const fs::path& path) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        std::cerr << "Cannot write " << path.string() << ", discarding payload\n";
    }

    const bool show_progress = header.command == protocol::CommandType::FILE_DATA;
    const uint64_t expected = header.payload_size;
    uint64_t received = 0;
    auto start_time = std::chrono::steady_clock::now();
    auto last_print_time = start_time;

    std::string error;
    auto status = transfer::MessageReceiver::receive_payload(connection_->socket(), expected,
        [&](const uint8_t* data, std::size_t n) {
            if (file) file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(n));
            received += n;
            if (!show_progress) return;

            auto now = std::chrono::steady_clock::now();
            auto elapsed_since_print = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_print_time).count();
            if (elapsed_since_print >= 300 || received == expected) {
                double elapsed_seconds = std::chrono::duration<double>(now - start_time).count();
                double speed_mbps = (elapsed_seconds > 0) ? (received / elapsed_seconds) / (1024.0 * 1024.0) : 0;
                int percent = (expected > 0) ? static_cast<int>((received * 100.0) / expected) : 100;
                std::cout << "\r" << percent << "% | " << std::fixed << std::setprecision(1) << speed_mbps
                          << " MB/s    " << std::flush;
                last_print_time = now;
            }
        }, &error);

    if (show_progress && expected > 0) std::cout << "\n";
    file.close();

    if (status != transfer::ReadStatus::FRAME) {
        std::cerr << "Transfer interrupted: " << (error.empty() ? "connection closed" : error) << "\n";
        std::error_code ec;
        fs::remove(path, ec);
        return false;
    }
    return true;
}

fs::path Client::destination_for(protocol::CommandType command, const std::string& info) {
    fs::path out(config_.output_dir);

    if (command == protocol::CommandType::THUMBNAIL_DATA) {
        auto asset = known_asset(info);
        std::string stem = asset ? fs::path(safe_name(asset->filename, info)).stem().string() : info;
        return out / safe_name(stem + "_thumb.jpg", "thumbnail.jpg");
    }

    auto [asset_id, component] = assets::parse_file_request(info);
    auto asset = known_asset(asset_id);
    std::string name = asset ? safe_name(asset->filename, asset_id) : safe_name(asset_id, "download");
    if (component == assets::Component::PAIRED_VIDEO) {
        name = fs::path(name).stem().string() + "_video.mov";
    }
    return out / name;
}

// ─── Waiting ────────────────────────────────────────────────────────────────

std::optional<Client::Event> Client::wait_for(std::initializer_list<protocol::CommandType> commands,
                                              std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        for (auto it = events_.begin(); it != events_.end(); ++it) {
            for (auto command : commands) {
                if (it->command == command) {
                    Event event = std::move(*it);
                    events_.erase(it);
                    return event;
                }
            }
        }
        if (closed_) return std::nullopt;

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            if (!receiving_) return std::nullopt;
            deadline = now + timeout;
        }
        cv_.wait_until(lock, deadline);
    }
}

void Client::discard_events() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

// ─── Pairing ────────────────────────────────────────────────────────────────

bool Client::authenticate(std::istream& in) {
    auto challenge = wait_for({protocol::CommandType::PIN_CHALLENGE, protocol::CommandType::DISCONNECT},
                              REPLY_TIMEOUT);
    if (!challenge || challenge->command != protocol::CommandType::PIN_CHALLENGE) {
        std::cout << "Host did not issue a PIN challenge.\n";
        return false;
    }

    while (true) {
        std::cout << "Enter the PIN shown on the host: " << std::flush;
        std::string pin;
        if (!std::getline(in, pin)) return false;

        // Anything queued meanwhile (a re-issued challenge) is stale now
        discard_events();
        if (connection_->write_frame(protocol::CommandType::VERIFY_PIN, pin) != transfer::TransferState::COMPLETED) {
            std::cout << "Connection lost.\n";
            return false;
        }

        auto reply = wait_for({protocol::CommandType::PIN_OK, protocol::CommandType::PIN_FAIL,
                               protocol::CommandType::DISCONNECT}, REPLY_TIMEOUT);
        if (!reply) {
            std::cout << "No answer from host.\n";
            return false;
        }

        switch (reply->command) {
            case protocol::CommandType::PIN_OK:
                std::cout << "Paired. Type 'help' for commands.\n";
                return true;

            case protocol::CommandType::PIN_FAIL:
                std::cout << "PIN rejected.\n";
                // Lockout and expiry are followed by DISCONNECT
                if (wait_for({protocol::CommandType::DISCONNECT}, std::chrono::milliseconds(500))) {
                    return false;
                }
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (closed_) return false;
                }
                break;

            default:
                return false;
        }
    }
}

// ─── Requests ───────────────────────────────────────────────────────────────

std::optional<protocol::AssetMetadata> Client::known_asset(const std::string& asset_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& asset : assets_) {
        if (asset.id == asset_id) return asset;
    }
    return std::nullopt;
}

std::string Client::resolve_id(const std::string& token) {
    if (!token.empty() && token.size() < 6 && token.find_first_not_of("0123456789") == std::string::npos) {
        std::size_t row = std::stoul(token);
        std::lock_guard<std::mutex> lock(mutex_);
        if (row >= 1 && row <= assets_.size()) {
            return assets_[row - 1].id;
        }
    }
    return token;
}

bool Client::request_list() {
    discard_events();
    if (connection_->write_frame(protocol::CommandType::LIST_ASSETS, "") != transfer::TransferState::COMPLETED) {
        return false;
    }

    auto reply = wait_for({protocol::CommandType::ASSETS_LIST, protocol::CommandType::NOTIFICATION}, LIST_TIMEOUT);
    if (!reply) {
        std::cout << "No asset list received.\n";
        return false;
    }
    if (reply->command != protocol::CommandType::ASSETS_LIST) {
        return false;
    }

    try {
        protocol::AssetListResponse response = protocol::parse_asset_list(reply->payload);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            assets_ = response.assets;
        }
        print_assets(response);
        return true;
    } catch (nlohmann::json::exception& e) {
        std::cerr << "Malformed asset list: " << e.what() << "\n";
        return false;
    }
}

bool Client::request_thumbnail(const std::string& asset_id) {
    discard_events();
    if (connection_->write_frame(protocol::CommandType::GET_THUMBNAIL, asset_id) != transfer::TransferState::COMPLETED) {
        return false;
    }

    auto reply = wait_for({protocol::CommandType::THUMBNAIL_DATA}, REPLY_TIMEOUT);
    if (!reply) {
        std::cout << "No thumbnail for " << asset_id << ".\n";
        return false;
    }
    std::cout << "Saved " << reply->saved_to.string() << "\n";
    return true;
}

bool Client::request_file(const std::string& asset_id, bool paired_video) {
    discard_events();
    std::string info = assets::file_request_info(
        asset_id, paired_video ? assets::Component::PAIRED_VIDEO : assets::Component::PRIMARY);
    if (connection_->write_frame(protocol::CommandType::GET_FULL_FILE, info) != transfer::TransferState::COMPLETED) {
        return false;
    }

    auto reply = wait_for({protocol::CommandType::FILE_DATA}, REPLY_TIMEOUT);
    if (!reply) {
        std::cout << "Host sent nothing for " << info << ".\n";
        return false;
    }
    std::error_code ec;
    uint64_t size = fs::file_size(reply->saved_to, ec);
    std::cout << "Saved " << reply->saved_to.string() << " (" << format_size(ec ? 0 : size) << ")\n";
    return true;
}

void Client::print_assets(const protocol::AssetListResponse& response) {
    std::cout << response.total_count << " assets: " << response.photos_count << " photos, "
              << response.videos_count << " videos, " << format_size(response.total_size_bytes) << "\n";

    int row = 1;
    for (const auto& asset : response.assets) {
        std::cout << std::setw(4) << row++ << "  " << asset.id << "  "
                  << std::left << std::setw(10) << nlohmann::json(asset.type).get<std::string>() << std::right
                  << std::setw(10) << format_size(asset.size_bytes) << "  " << asset.filename;
        if (asset.width > 0) std::cout << "  " << asset.width << "x" << asset.height;
        std::cout << "\n";
    }
}

// ─── Console ────────────────────────────────────────────────────────────────

void Client::run_console(std::istream& in) {
    std::string line;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) break;
        }
        std::cout << "> " << std::flush;
        if (!std::getline(in, line)) break;

        std::istringstream words(line);
        std::string command, argument;
        words >> command >> argument;
        if (command.empty()) continue;

        if (command == "list") {
            request_list();
        } else if (command == "thumb" && !argument.empty()) {
            request_thumbnail(resolve_id(argument));
        } else if (command == "get" && !argument.empty()) {
            request_file(resolve_id(argument), false);
        } else if (command == "video" && !argument.empty()) {
            request_file(resolve_id(argument), true);
        } else if (command == "quit" || command == "exit") {
            break;
        } else {
            std::cout << "Commands: list, thumb <id|row>, get <id|row>, video <id|row>, quit\n";
        }
    }
    disconnect();
}

} // namespace networking
