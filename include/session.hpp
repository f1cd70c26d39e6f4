#pragma once

#include <string>
#include <cstdint>
#include <functional>
#include <vector>
#include "protocol/packet.hpp"
#include "security.hpp"

namespace session {

enum class State {
    IDLE,
    SEARCHING,
    AWAITING_PIN,
    VERIFYING,
    CONNECTED,
    SYNCING,
    READY,
    ERROR
};

const char* state_name(State state);

struct AssetCounts {
    uint64_t total = 0;
    uint64_t photos = 0;
    uint64_t videos = 0;
    uint64_t total_size_bytes = 0;
};

struct OutgoingFrame {
    protocol::CommandType command;
    std::string info;
};

enum class EffectType {
    SERVE_ASSET_LIST,  // worker: snapshot the store, stream ASSETS_LIST
    SERVE_THUMBNAIL,   // worker: cache or generate, stream THUMBNAIL_DATA
    SERVE_FILE,        // worker: stream FILE_DATA; value is the request info
    BEGIN_SYNC,        // worker: gather counts, then finish_sync()
    SHOW_PIN,          // presentation: value is the code
    CLEAR_PIN,
    CLOSE_CONNECTION,  // cancel outstanding work; the frames above are the last sent
    SCHEDULE_RETRY     // leave ERROR after the retry delay
};

struct Effect {
    EffectType type;
    std::string value;
};

// Result of one input: the settled state, frames to write in order, and the
// side effects for the owner to run after the frames.
struct Transition {
    State state;
    std::vector<OutgoingFrame> frames;
    std::vector<Effect> effects;

    bool has_effect(EffectType type) const;
};

// Protocol decisions for one host. Frames and worker effects are returned to
// the owner rather than performed, but the machine does drive the injected
// PinGate itself: connecting and expiry issue a code (arming its timer),
// VERIFY_PIN verifies against it, and teardown cancels it.
//
// Not thread-safe: the owner serializes every call. VERIFYING is held only
// while a VERIFY_PIN is being checked and is never reported to the listener.
class SessionMachine {
public:
    using StateListener = std::function<void(State)>;

    explicit SessionMachine(security::PinGate& pin_gate);

    void set_state_listener(StateListener listener);

    Transition start();
    Transition stop();
    Transition handle(const protocol::Frame& frame);

    Transition pin_expired();
    Transition connection_closed();
    Transition connection_failed(const std::string& message);
    Transition retry();
    Transition disconnect();

    void update_sync_progress(double progress);
    Transition finish_sync(const AssetCounts& counts);

    State state() const { return state_; }
    const std::string& peer_name() const { return peer_name_; }
    const AssetCounts& asset_counts() const { return counts_; }
    double sync_progress() const { return sync_progress_; }
    const std::string& error_message() const { return error_message_; }

    // CONNECTED, SYNCING or READY: the peer has passed the PIN check
    bool is_authenticated() const;

private:
    security::PinGate& pin_gate_;
    StateListener listener_;

    State state_ = State::IDLE;
    State published_ = State::IDLE;
    std::string peer_name_;
    AssetCounts counts_;
    double sync_progress_ = 0.0;
    std::string error_message_;

    Transition on_connect(const std::string& info);
    Transition on_verify_pin(const std::string& candidate);
    Transition on_request(const protocol::Frame& frame);

    Transition settled();
    void enter(State state);
    void teardown(Transition& t, bool send_disconnect);
};

} // namespace session
