#pragma once

#include <string>
#include <atomic>
#include <iostream>
#include <memory>
#include <thread>
#include <boost/asio.hpp>
#include "asset_store.hpp"
#include "catalog.hpp"
#include "config.hpp"
#include "networking.hpp"
#include "security.hpp"
#include "session_controller.hpp"

namespace networking {

// The host process: library, cache, PIN gate and session controller, fed by
// either the listener or an outbound dial loop.
class Server {
public:
    explicit Server(config::HostConfig config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Scans the library and starts accepting (or dialing). Throws
    // assets::AssetStoreError for an unreadable library and
    // boost::system::system_error when the port cannot be bound.
    void start();
    void stop();

    // Reads console commands until "quit" or end of input.
    void run_console(std::istream& in);

    // Single-line summary for the "status" command.
    std::string status() const;

    session::SessionController& controller() { return *controller_; }

private:
    config::HostConfig config_;

    boost::asio::io_context timer_io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::thread timer_thread_;

    assets::DirectoryAssetStore store_;
    catalog::CatalogCache cache_;
    security::PinGate pin_gate_;
    std::unique_ptr<session::SessionController> controller_;

    boost::asio::io_context net_io_;
    std::unique_ptr<Listener> listener_;
    std::thread dial_thread_;
    std::atomic<bool> running_{false};

    void dial_loop();
    session::SessionCallbacks make_callbacks();
};

} // namespace networking
