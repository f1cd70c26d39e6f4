#include <iostream>
#include <string>
#include <vector>
#include <stdexcept>
#include "client.hpp"
#include "config.hpp"
#include "server.hpp"

namespace {

int run_host(const config::HostConfig& cfg) {
    try {
        networking::Server server(cfg);
        server.start();
        server.run_console(std::cin);
        server.stop();
    } catch (assets::AssetStoreError& e) {
        std::cerr << "Cannot open library: " << e.what() << "\n";
        return 1;
    } catch (boost::system::system_error& e) {
        std::cerr << "Network error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

int run_peer(const config::PeerConfig& cfg) {
    try {
        networking::Client client(cfg);
        client.connect();
        if (!client.authenticate(std::cin)) {
            client.disconnect();
            return 1;
        }
        client.run_console(std::cin);
    } catch (boost::system::system_error& e) {
        std::cerr << "Cannot reach " << cfg.host << ":" << cfg.port << ": " << e.what() << "\n";
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string program = argc > 0 ? argv[0] : "mediabridge";
    if (argc < 2) {
        std::cerr << config::usage(program);
        return 2;
    }

    std::string verb = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (verb == "serve") {
            return run_host(config::parse_host_args(args));
        }
        if (verb == "peer") {
            return run_peer(config::parse_peer_args(args));
        }
        if (verb == "--help" || verb == "-h" || verb == "help") {
            std::cout << config::usage(program);
            return 0;
        }
        throw std::invalid_argument("Unknown command: " + verb);
    } catch (std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << config::usage(program);
        return 2;
    }
}
