#pragma once

#include <string>
#include <cstdint>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include "asset_store.hpp"
#include "catalog.hpp"
#include "networking.hpp"
#include "security.hpp"
#include "session.hpp"

namespace session {

// Presentation hooks. They run with the session lock held and must not
// call back into the controller.
struct SessionCallbacks {
    std::function<void(State)> on_state;
    // Empty code clears the display
    std::function<void(const std::string& code, int seconds_remaining)> on_pin;
    std::function<void(double)> on_sync_progress;
    std::function<void(const std::string&)> on_status;
    std::function<void(const std::string&)> on_error;
    transfer::TransferProgressCallback on_progress;
};

struct ControllerOptions {
    std::size_t worker_threads = 2;
    std::chrono::milliseconds retry_delay{2000};
    // How long a closing connection may spend on its final frames before it
    // is shut down regardless.
    std::chrono::milliseconds close_grace{2000};
    bool verbose = false;
};

// Drives one SessionMachine over the single active connection.
//
// Frames are read on a dedicated thread per connection. Asset Store work runs
// on a worker pool and writes its response through the connection's write
// lock. Every connection carries a cancellation token that is set on
// teardown, so work for a closed session is dropped instead of written.
//
// Socket writes never happen under the session lock. Frames the machine
// emits are queued on a per-connection strand of the worker pool, which keeps
// them in order. Teardown shuts the socket down at once, which also unblocks
// a worker stuck writing to a peer that stopped reading; only a teardown with
// frames to deliver first (DISCONNECT) waits, bounded by close_grace.
class SessionController {
public:
    SessionController(boost::asio::io_context& timer_io, security::PinGate& pin_gate,
                      catalog::CatalogCache& cache, assets::AssetStore& store,
                      ControllerOptions options = {}, SessionCallbacks callbacks = {});
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    void start();
    void stop();

    // Supersedes the current connection, if any, and starts reading.
    void attach(std::shared_ptr<networking::Connection> connection);

    void disconnect();
    void retry();

    State state() const;
    std::string peer_name() const;
    AssetCounts asset_counts() const;
    double sync_progress() const;
    std::string error_message() const;
    bool has_connection() const;

    bool wait_for_state(State state, std::chrono::milliseconds timeout);

private:
    // Lets timer and PIN callbacks reach the controller only while it lives.
    struct Liveness {
        std::mutex mutex;
        SessionController* self = nullptr;
    };

    using Writer = boost::asio::strand<boost::asio::thread_pool::executor_type>;

    boost::asio::io_context& timer_io_;
    security::PinGate& pin_gate_;
    catalog::CatalogCache& cache_;
    assets::AssetStore& store_;
    catalog::ThumbnailProvider thumbnails_;
    ControllerOptions options_;
    SessionCallbacks callbacks_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    SessionMachine machine_;
    std::shared_ptr<networking::Connection> connection_;
    std::shared_ptr<std::atomic<bool>> cancel_token_;
    std::shared_ptr<boost::asio::steady_timer> retry_timer_;

    std::mutex lifecycle_mutex_;
    std::vector<std::thread> readers_;

    boost::asio::thread_pool workers_;
    std::optional<Writer> writer_; // strand for connection_, guarded by mutex_
    std::shared_ptr<Liveness> liveness_;

    void read_loop(std::shared_ptr<networking::Connection> connection);
    void on_pin_expired();

    // Caller holds mutex_.
    void apply(const Transition& t);
    void queue_frames_locked(std::vector<OutgoingFrame> frames);
    void retire_connection_locked(std::vector<OutgoingFrame> farewell = {});
    void fail_locked(const std::string& reason);
    void schedule_retry_locked();

    void serve_asset_list(std::shared_ptr<networking::Connection> connection,
                          std::shared_ptr<std::atomic<bool>> token);
    void serve_thumbnail(std::shared_ptr<networking::Connection> connection,
                         std::shared_ptr<std::atomic<bool>> token, const std::string& asset_id);
    void serve_file(std::shared_ptr<networking::Connection> connection,
                    std::shared_ptr<std::atomic<bool>> token, const std::string& request);
    void run_sync(std::shared_ptr<std::atomic<bool>> token);
};

} // namespace session
