#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <optional>
#include <utility>
#include <vector>
#include "protocol/packet.hpp"

namespace config {

struct HostConfig {
    std::string library_dir;
    std::string device_name = "MediaBridge";
    unsigned short port = protocol::DEFAULT_PORT;
    std::optional<std::string> dial_address; // "host:port"; dial out instead of listening
    std::chrono::milliseconds pin_timeout{30000};
    int max_pin_attempts = 3;
    std::size_t cache_max_entries = 500;
    uint64_t cache_max_bytes = 50ull * 1024 * 1024;
    std::size_t worker_threads = 2;
    std::chrono::milliseconds retry_delay{2000};
    bool verbose = false;
};

struct PeerConfig {
    std::string host;
    unsigned short port = protocol::DEFAULT_PORT;
    std::string device_name = "MediaBridge Peer";
    std::string output_dir = ".";
};

// Arguments after the "serve" / "peer" verb. Throw std::invalid_argument on
// unknown flags, missing values and malformed numbers.
HostConfig parse_host_args(const std::vector<std::string>& args);
PeerConfig parse_peer_args(const std::vector<std::string>& args);

// Splits "host:port". Throws std::invalid_argument.
std::pair<std::string, unsigned short> split_address(const std::string& address);

std::string usage(const std::string& program);

} // namespace config
