#include "session_controller.hpp"
#include <iostream>

namespace session {

namespace {

// Host-bound commands carry no payload; whatever a peer attaches is drained
// and dropped.
constexpr uint64_t MAX_REQUEST_PAYLOAD = 0;

// Stops at the first frame that fails; the connection is closed by then.
void write_frames(networking::Connection& connection, const std::vector<OutgoingFrame>& frames,
                  bool verbose) {
    for (const auto& frame : frames) {
        if (verbose) {
            std::cout << "[Session] Sending " << protocol::command_name(frame.command)
                      << " info: " << frame.info << "\n";
        }
        auto state = connection.write_frame(frame.command, frame.info);
        if (state != transfer::TransferState::COMPLETED) {
            std::cerr << "[Session] Failed to send " << protocol::command_name(frame.command) << "\n";
            return;
        }
    }
}

} // namespace

SessionController::SessionController(boost::asio::io_context& timer_io, security::PinGate& pin_gate,
                                     catalog::CatalogCache& cache, assets::AssetStore& store,
                                     ControllerOptions options, SessionCallbacks callbacks)
    : timer_io_(timer_io),
      pin_gate_(pin_gate),
      cache_(cache),
      store_(store),
      thumbnails_(cache, store),
      options_(options),
      callbacks_(std::move(callbacks)),
      machine_(pin_gate),
      workers_(options.worker_threads == 0 ? 1 : options.worker_threads),
      liveness_(std::make_shared<Liveness>()) {
    liveness_->self = this;

    machine_.set_state_listener([this](State state) {
        state_cv_.notify_all();
        if (callbacks_.on_state) callbacks_.on_state(state);
    });

    std::weak_ptr<Liveness> weak = liveness_;
    pin_gate_.set_on_expired([weak]() {
        auto liveness = weak.lock();
        if (!liveness) return;
        std::lock_guard<std::mutex> lock(liveness->mutex);
        if (liveness->self) liveness->self->on_pin_expired();
    });
}

SessionController::~SessionController() {
    {
        std::lock_guard<std::mutex> lock(liveness_->mutex);
        liveness_->self = nullptr;
    }
    pin_gate_.set_on_expired(nullptr);
    stop();
    workers_.join();
}

// ─── Lifecycle ──────────────────────────────────────────────────────────────

void SessionController::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    apply(machine_.start());
}

void SessionController::stop() {
    std::vector<std::thread> readers;
    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            apply(machine_.stop());
            retire_connection_locked();
            if (retry_timer_) {
                auto timer = std::move(retry_timer_);
                boost::asio::post(timer_io_, [timer]() { timer->cancel(); });
            }
        }
        readers.swap(readers_);
    }
    for (auto& reader : readers) {
        if (reader.joinable()) reader.join();
    }
}

void SessionController::attach(std::shared_ptr<networking::Connection> connection) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (machine_.state() == State::IDLE) {
            std::cerr << "[Session] Not started, refusing connection\n";
            connection->close();
            return;
        }
        if (connection_) {
            std::cout << "[Session] New connection supersedes " << connection_->remote_address() << "\n";
            apply(machine_.connection_closed());
            retire_connection_locked();
        }
        if (machine_.state() == State::ERROR) {
            apply(machine_.retry());
        }
    }

    // Previous readers exit once their connection is closed
    for (auto& reader : readers_) {
        if (reader.joinable()) reader.join();
    }
    readers_.clear();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = connection;
        cancel_token_ = std::make_shared<std::atomic<bool>>(false);
        writer_.emplace(boost::asio::make_strand(workers_));
        if (callbacks_.on_status) callbacks_.on_status("Peer connected from " + connection->remote_address());
    }
    readers_.emplace_back(&SessionController::read_loop, this, connection);
}

void SessionController::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    apply(machine_.disconnect());
}

void SessionController::retry() {
    std::lock_guard<std::mutex> lock(mutex_);
    apply(machine_.retry());
}

State SessionController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return machine_.state();
}

std::string SessionController::peer_name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return machine_.peer_name();
}

AssetCounts SessionController::asset_counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return machine_.asset_counts();
}

double SessionController::sync_progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return machine_.sync_progress();
}

std::string SessionController::error_message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return machine_.error_message();
}

bool SessionController::has_connection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_ != nullptr;
}

bool SessionController::wait_for_state(State state, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return state_cv_.wait_for(lock, timeout, [this, state]() { return machine_.state() == state; });
}

// ─── Reading ────────────────────────────────────────────────────────────────

void SessionController::read_loop(std::shared_ptr<networking::Connection> connection) {
    while (true) {
        transfer::ReadResult result{transfer::ReadStatus::FAILED, {}, {}};
        try {
            result = connection->read_frame(MAX_REQUEST_PAYLOAD);
        } catch (std::exception& e) {
            result.error = e.what();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (connection != connection_) {
            return; // superseded or torn down
        }

        try {
            switch (result.status) {
                case transfer::ReadStatus::FRAME:
                    if (options_.verbose) {
                        std::cout << "[Session] Received " << protocol::command_name(result.frame.header.command)
                                  << " (" << result.frame.header.payload_size << " bytes) info: "
                                  << result.frame.header.info << "\n";
                    }
                    apply(machine_.handle(result.frame));
                    break;

                case transfer::ReadStatus::CLOSED:
                    std::cout << "[Session] Connection closed by peer\n";
                    apply(machine_.connection_closed());
                    return;

                case transfer::ReadStatus::FAILED:
                    apply(machine_.connection_failed(result.error));
                    return;
            }
        } catch (std::exception& e) {
            std::cerr << "[Session] Error handling frame: " << e.what() << "\n";
            fail_locked(e.what());
            return;
        }
    }
}

void SessionController::on_pin_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        apply(machine_.pin_expired());
    } catch (std::exception& e) {
        std::cerr << "[Session] Error reissuing PIN: " << e.what() << "\n";
        fail_locked(e.what());
    }
}

// ─── Effects ────────────────────────────────────────────────────────────────

void SessionController::apply(const Transition& t) {
    auto connection = connection_;
    auto token = cancel_token_;

    // A closing transition's frames go out with the close itself
    bool closing = t.has_effect(EffectType::CLOSE_CONNECTION);
    if (closing && token) {
        token->store(true);
    }
    if (!closing) {
        queue_frames_locked(t.frames);
    }

    for (const auto& effect : t.effects) {
        switch (effect.type) {
            case EffectType::SERVE_ASSET_LIST:
                if (connection) {
                    boost::asio::post(workers_, [this, connection, token]() {
                        serve_asset_list(connection, token);
                    });
                }
                break;

            case EffectType::SERVE_THUMBNAIL:
                if (connection) {
                    std::string asset_id = effect.value;
                    boost::asio::post(workers_, [this, connection, token, asset_id]() {
                        serve_thumbnail(connection, token, asset_id);
                    });
                }
                break;

            case EffectType::SERVE_FILE:
                if (connection) {
                    std::string request = effect.value;
                    boost::asio::post(workers_, [this, connection, token, request]() {
                        serve_file(connection, token, request);
                    });
                }
                break;

            case EffectType::BEGIN_SYNC:
                if (token) {
                    boost::asio::post(workers_, [this, token]() { run_sync(token); });
                }
                break;

            case EffectType::SHOW_PIN:
                if (callbacks_.on_pin) callbacks_.on_pin(effect.value, pin_gate_.seconds_remaining());
                break;

            case EffectType::CLEAR_PIN:
                if (callbacks_.on_pin) callbacks_.on_pin("", 0);
                break;

            case EffectType::CLOSE_CONNECTION:
                retire_connection_locked(t.frames);
                break;

            case EffectType::SCHEDULE_RETRY:
                if (callbacks_.on_error) callbacks_.on_error(machine_.error_message());
                schedule_retry_locked();
                break;
        }
    }
}

void SessionController::queue_frames_locked(std::vector<OutgoingFrame> frames) {
    if (frames.empty() || !connection_ || !writer_) return;

    auto connection = connection_;
    bool verbose = options_.verbose;
    boost::asio::post(*writer_, [connection, frames = std::move(frames), verbose]() {
        write_frames(*connection, frames, verbose);
    });
}

void SessionController::retire_connection_locked(std::vector<OutgoingFrame> farewell) {
    if (cancel_token_) {
        cancel_token_->store(true);
    }
    if (!connection_) return;

    auto connection = std::move(connection_);
    connection_.reset();
    std::optional<Writer> writer = std::move(writer_);
    writer_.reset();

    if (farewell.empty() || !writer) {
        // Shutdown also fails any write blocked on a peer that stopped reading
        connection->close();
        return;
    }

    // The farewell frames queue behind anything already sent on this
    // connection; a peer that does not drain them is cut off after close_grace.
    auto deadline = std::make_shared<boost::asio::steady_timer>(timer_io_, options_.close_grace);
    deadline->async_wait([connection, deadline](const boost::system::error_code&) {
        connection->close();
    });

    boost::asio::io_context& timer_io = timer_io_;
    bool verbose = options_.verbose;
    boost::asio::post(*writer, [connection, farewell = std::move(farewell), deadline, &timer_io, verbose]() {
        write_frames(*connection, farewell, verbose);
        connection->close_after_writes();
        boost::asio::post(timer_io, [deadline]() { deadline->cancel(); });
    });
}

void SessionController::fail_locked(const std::string& reason) {
    try {
        apply(machine_.connection_failed(reason));
    } catch (std::exception& e) {
        std::cerr << "[Session] Teardown after error failed: " << e.what() << "\n";
        retire_connection_locked();
    }
}

void SessionController::schedule_retry_locked() {
    if (retry_timer_) {
        auto stale = std::move(retry_timer_);
        boost::asio::post(timer_io_, [stale]() { stale->cancel(); });
    }

    auto timer = std::make_shared<boost::asio::steady_timer>(timer_io_, options_.retry_delay);
    std::weak_ptr<Liveness> weak = liveness_;
    timer->async_wait([weak, timer](const boost::system::error_code& ec) {
        if (ec) return;
        auto liveness = weak.lock();
        if (!liveness) return;
        std::lock_guard<std::mutex> lock(liveness->mutex);
        if (liveness->self) liveness->self->retry();
    });
    retry_timer_ = timer;
}

// ─── Asset Store work (worker threads) ──────────────────────────────────────

void SessionController::serve_asset_list(std::shared_ptr<networking::Connection> connection,
                                         std::shared_ptr<std::atomic<bool>> token) {
    if (token->load()) return;

    try {
        protocol::AssetListResponse response = assets::snapshot(store_);
        transfer::MemoryPayload source(protocol::serialize_asset_list(response));
        if (token->load()) return;

        auto state = connection->write_frame(protocol::CommandType::ASSETS_LIST, "", &source, token.get());
        if (state == transfer::TransferState::COMPLETED) {
            std::cout << "[Session] Sent asset list (" << response.total_count << " assets)\n";
        }
    } catch (std::exception& e) {
        std::cerr << "[Session] Failed to build asset list: " << e.what() << "\n";
        if (!token->load()) {
            connection->write_frame(protocol::CommandType::NOTIFICATION, "Asset list unavailable");
        }
    }
}

void SessionController::serve_thumbnail(std::shared_ptr<networking::Connection> connection,
                                        std::shared_ptr<std::atomic<bool>> token,
                                        const std::string& asset_id) {
    if (token->load()) return;

    try {
        catalog::BytesPtr thumbnail = thumbnails_.get(asset_id);
        if (!thumbnail) {
            std::cout << "[Session] No thumbnail for asset: " << asset_id << "\n";
            return;
        }
        if (token->load()) return;

        transfer::MemoryPayload source(*thumbnail);
        connection->write_frame(protocol::CommandType::THUMBNAIL_DATA, asset_id, &source, token.get());
    } catch (std::exception& e) {
        std::cerr << "[Session] Thumbnail for " << asset_id << " failed: " << e.what() << "\n";
    }
}

void SessionController::serve_file(std::shared_ptr<networking::Connection> connection,
                                   std::shared_ptr<std::atomic<bool>> token,
                                   const std::string& request) {
    if (token->load()) return;

    auto [asset_id, component] = assets::parse_file_request(request);
    try {
        auto record = store_.find(asset_id);
        if (!record) {
            std::cout << "[Session] Asset not found: " << asset_id << "\n";
            return;
        }

        // A live photo's still image is its primary component
        auto payload = store_.open_original(asset_id, component);
        if (!payload) {
            std::cout << "[Session] No data for " << request << "\n";
            return;
        }
        if (token->load()) return;

        auto state = connection->write_frame(protocol::CommandType::FILE_DATA, request, payload.get(),
                                             token.get(), callbacks_.on_progress);
        if (state == transfer::TransferState::COMPLETED) {
            std::cout << "[Session] Sent " << record->filename << " ("
                      << networking::format_size(payload->size()) << ")\n";
        } else if (state == transfer::TransferState::CANCELLED) {
            std::cout << "[Session] Transfer of " << record->filename << " cancelled\n";
        }
    } catch (std::exception& e) {
        std::cerr << "[Session] File " << request << " failed: " << e.what() << "\n";
    }
}

void SessionController::run_sync(std::shared_ptr<std::atomic<bool>> token) {
    if (token->load()) return;

    AssetCounts counts;
    try {
        protocol::AssetListResponse response = assets::snapshot(store_, [this, token](double progress) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (token->load()) return;
            machine_.update_sync_progress(progress);
            if (callbacks_.on_sync_progress) callbacks_.on_sync_progress(machine_.sync_progress());
        });
        counts.total = response.total_count;
        counts.photos = response.photos_count;
        counts.videos = response.videos_count;
        counts.total_size_bytes = response.total_size_bytes;
    } catch (std::exception& e) {
        std::cerr << "[Session] Sync failed: " << e.what() << "\n";
        std::lock_guard<std::mutex> lock(mutex_);
        if (callbacks_.on_status) callbacks_.on_status(std::string("Library sync failed: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (token->load()) return;
    try {
        apply(machine_.finish_sync(counts));
    } catch (std::exception& e) {
        std::cerr << "[Session] Error finishing sync: " << e.what() << "\n";
        fail_locked(e.what());
    }
}

} // namespace session
