#include "config.hpp"
#include <stdexcept>

namespace config {

namespace {

// Next argument as the value of `flag`
const std::string& take_value(const std::vector<std::string>& args, std::size_t& i, const std::string& flag) {
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("Missing value for " + flag);
    }
    return args[++i];
}

uint64_t parse_number(const std::string& text, const std::string& what, uint64_t min, uint64_t max) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Invalid " + what + ": " + text);
    }
    uint64_t value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Invalid " + what + ": " + text);
    }
    if (value < min || value > max) {
        throw std::invalid_argument(what + " out of range: " + text);
    }
    return value;
}

unsigned short parse_port(const std::string& text) {
    return static_cast<unsigned short>(parse_number(text, "port", 1, 65535));
}

} // namespace

std::pair<std::string, unsigned short> split_address(const std::string& address) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        throw std::invalid_argument("Expected host:port, got " + address);
    }
    return {address.substr(0, colon), parse_port(address.substr(colon + 1))};
}

HostConfig parse_host_args(const std::vector<std::string>& args) {
    HostConfig cfg;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--name") {
            cfg.device_name = take_value(args, i, arg);
        } else if (arg == "--port") {
            cfg.port = parse_port(take_value(args, i, arg));
        } else if (arg == "--dial") {
            std::string address = take_value(args, i, arg);
            split_address(address); // validate now, not at connect time
            cfg.dial_address = address;
        } else if (arg == "--pin-timeout") {
            cfg.pin_timeout = std::chrono::seconds(parse_number(take_value(args, i, arg), "PIN timeout", 1, 3600));
        } else if (arg == "--max-attempts") {
            cfg.max_pin_attempts = static_cast<int>(parse_number(take_value(args, i, arg), "attempt limit", 1, 100));
        } else if (arg == "--cache-entries") {
            cfg.cache_max_entries = parse_number(take_value(args, i, arg), "cache entry limit", 1, 1000000);
        } else if (arg == "--cache-mb") {
            cfg.cache_max_bytes = parse_number(take_value(args, i, arg), "cache size", 1, 1024 * 1024) * 1024 * 1024;
        } else if (arg == "--workers") {
            cfg.worker_threads = parse_number(take_value(args, i, arg), "worker count", 1, 64);
        } else if (arg == "--retry-delay") {
            cfg.retry_delay = std::chrono::seconds(parse_number(take_value(args, i, arg), "retry delay", 0, 3600));
        } else if (arg == "--verbose" || arg == "-v") {
            cfg.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (cfg.library_dir.empty()) {
            cfg.library_dir = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }

    if (cfg.library_dir.empty()) {
        throw std::invalid_argument("Missing library directory");
    }
    if (cfg.device_name.empty()) {
        throw std::invalid_argument("Device name must not be empty");
    }
    return cfg;
}

PeerConfig parse_peer_args(const std::vector<std::string>& args) {
    PeerConfig cfg;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--port") {
            cfg.port = parse_port(take_value(args, i, arg));
        } else if (arg == "--name") {
            cfg.device_name = take_value(args, i, arg);
        } else if (arg == "--out") {
            cfg.output_dir = take_value(args, i, arg);
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (cfg.host.empty()) {
            cfg.host = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }

    if (cfg.host.empty()) {
        throw std::invalid_argument("Missing host address");
    }
    return cfg;
}

std::string usage(const std::string& program) {
    return "Usage:\n"
           "  " + program + " serve <library_dir> [--name N] [--port P] [--dial host:port]\n"
           "        [--pin-timeout SECS] [--max-attempts N] [--cache-entries N] [--cache-mb MB]\n"
           "        [--workers N] [--retry-delay SECS] [--verbose]\n"
           "  " + program + " peer <host> [--port P] [--name N] [--out DIR]\n";
}

} // namespace config
