#include "session.hpp"
#include <iostream>

namespace session {

namespace {

const char* const UNKNOWN_PEER = "Unknown Peer";

} // namespace

const char* state_name(State state) {
    switch (state) {
        case State::IDLE: return "Idle";
        case State::SEARCHING: return "Searching";
        case State::AWAITING_PIN: return "AwaitingPIN";
        case State::VERIFYING: return "Verifying";
        case State::CONNECTED: return "Connected";
        case State::SYNCING: return "Syncing";
        case State::READY: return "Ready";
        case State::ERROR: return "Error";
    }
    return "Unknown";
}

bool Transition::has_effect(EffectType type) const {
    for (const auto& effect : effects) {
        if (effect.type == type) return true;
    }
    return false;
}

SessionMachine::SessionMachine(security::PinGate& pin_gate) : pin_gate_(pin_gate) {}

void SessionMachine::set_state_listener(StateListener listener) {
    listener_ = std::move(listener);
}

bool SessionMachine::is_authenticated() const {
    return state_ == State::CONNECTED || state_ == State::SYNCING || state_ == State::READY;
}

void SessionMachine::enter(State state) {
    state_ = state;
    if (state == State::VERIFYING || state == published_) {
        return;
    }
    published_ = state;
    std::cout << "[Session] State -> " << state_name(state) << "\n";
    if (listener_) listener_(state);
}

Transition SessionMachine::settled() {
    return Transition{state_, {}, {}};
}

void SessionMachine::teardown(Transition& t, bool send_disconnect) {
    pin_gate_.cancel();
    peer_name_.clear();
    sync_progress_ = 0.0;

    if (send_disconnect) {
        t.frames.push_back({protocol::CommandType::DISCONNECT, ""});
    }
    t.effects.push_back({EffectType::CLEAR_PIN, ""});
    t.effects.push_back({EffectType::CLOSE_CONNECTION, ""});
}

// ─── Lifecycle ──────────────────────────────────────────────────────────────

Transition SessionMachine::start() {
    if (state_ == State::IDLE) {
        enter(State::SEARCHING);
    }
    return settled();
}

Transition SessionMachine::stop() {
    Transition t = settled();
    if (state_ == State::IDLE) {
        return t;
    }
    bool in_session = state_ != State::SEARCHING && state_ != State::ERROR;
    teardown(t, in_session);
    error_message_.clear();
    enter(State::IDLE);
    t.state = state_;
    return t;
}

Transition SessionMachine::disconnect() {
    Transition t = settled();
    if (state_ == State::IDLE || state_ == State::ERROR) {
        return t;
    }
    teardown(t, true);
    enter(State::SEARCHING);
    t.state = state_;
    return t;
}

Transition SessionMachine::connection_closed() {
    Transition t = settled();
    if (state_ == State::IDLE) {
        return t;
    }
    teardown(t, false);
    if (state_ != State::ERROR) {
        enter(State::SEARCHING);
    }
    t.state = state_;
    return t;
}

Transition SessionMachine::connection_failed(const std::string& message) {
    Transition t = settled();
    if (state_ == State::IDLE) {
        return t;
    }
    std::cerr << "[Session] Connection failed: " << message << "\n";
    teardown(t, false);
    error_message_ = message.empty() ? "Connection lost" : message;
    enter(State::ERROR);
    t.effects.push_back({EffectType::SCHEDULE_RETRY, ""});
    t.state = state_;
    return t;
}

Transition SessionMachine::retry() {
    if (state_ == State::ERROR) {
        error_message_.clear();
        enter(State::SEARCHING);
    }
    return settled();
}

// ─── Incoming frames ────────────────────────────────────────────────────────

Transition SessionMachine::handle(const protocol::Frame& frame) {
    const auto command = frame.header.command;

    switch (command) {
        case protocol::CommandType::CONNECT:
            if (state_ == State::SEARCHING) {
                return on_connect(frame.header.info);
            }
            break;

        case protocol::CommandType::VERIFY_PIN:
            if (state_ == State::AWAITING_PIN) {
                return on_verify_pin(frame.header.info);
            }
            break;

        case protocol::CommandType::LIST_ASSETS:
        case protocol::CommandType::GET_THUMBNAIL:
        case protocol::CommandType::GET_FULL_FILE:
            if (is_authenticated()) {
                return on_request(frame);
            }
            break;

        case protocol::CommandType::DISCONNECT:
            if (state_ != State::IDLE && state_ != State::ERROR) {
                std::cout << "[Session] Peer disconnected\n";
                Transition t = settled();
                teardown(t, false);
                enter(State::SEARCHING);
                t.state = state_;
                return t;
            }
            break;

        default:
            break;
    }

    std::cout << "[Session] Ignoring " << protocol::command_name(command)
              << " in state " << state_name(state_) << "\n";
    return settled();
}

Transition SessionMachine::on_connect(const std::string& info) {
    peer_name_ = info.empty() ? UNKNOWN_PEER : info;
    std::cout << "[Session] Pairing request from " << peer_name_ << "\n";

    std::string code = pin_gate_.generate();
    enter(State::AWAITING_PIN);

    Transition t = settled();
    t.frames.push_back({protocol::CommandType::PIN_CHALLENGE, code});
    t.effects.push_back({EffectType::SHOW_PIN, code});
    return t;
}

Transition SessionMachine::on_verify_pin(const std::string& candidate) {
    enter(State::VERIFYING);
    security::PinResult result = pin_gate_.verify(candidate);
    std::cout << "[Session] PIN check: " << security::pin_status_name(result.status) << "\n";

    Transition t = settled();
    switch (result.status) {
        case security::PinStatus::SUCCESS:
            t.frames.push_back({protocol::CommandType::PIN_OK, ""});
            t.effects.push_back({EffectType::CLEAR_PIN, ""});
            enter(State::CONNECTED);
            sync_progress_ = 0.0;
            enter(State::SYNCING);
            t.effects.push_back({EffectType::BEGIN_SYNC, ""});
            break;

        case security::PinStatus::WRONG_CODE: {
            t.frames.push_back({protocol::CommandType::PIN_FAIL, ""});
            std::string message = "Wrong PIN. " + std::to_string(result.attempts_remaining) +
                                  (result.attempts_remaining == 1 ? " attempt remaining." : " attempts remaining.");
            t.frames.push_back({protocol::CommandType::NOTIFICATION, message});
            enter(State::AWAITING_PIN);
            break;
        }

        case security::PinStatus::EXPIRED:
            t.frames.push_back({protocol::CommandType::PIN_FAIL, ""});
            t.frames.push_back({protocol::CommandType::NOTIFICATION, "PIN expired"});
            teardown(t, true);
            enter(State::SEARCHING);
            break;

        case security::PinStatus::LOCKED_OUT:
            t.frames.push_back({protocol::CommandType::PIN_FAIL, ""});
            t.frames.push_back({protocol::CommandType::NOTIFICATION, "Too many failed attempts"});
            teardown(t, true);
            enter(State::SEARCHING);
            break;
    }
    t.state = state_;
    return t;
}

Transition SessionMachine::on_request(const protocol::Frame& frame) {
    Transition t = settled();
    switch (frame.header.command) {
        case protocol::CommandType::LIST_ASSETS:
            t.effects.push_back({EffectType::SERVE_ASSET_LIST, ""});
            break;
        case protocol::CommandType::GET_THUMBNAIL:
            t.effects.push_back({EffectType::SERVE_THUMBNAIL, frame.header.info});
            break;
        case protocol::CommandType::GET_FULL_FILE:
            t.effects.push_back({EffectType::SERVE_FILE, frame.header.info});
            break;
        default:
            break;
    }
    return t;
}

// ─── Timers and sync ────────────────────────────────────────────────────────

Transition SessionMachine::pin_expired() {
    if (state_ != State::AWAITING_PIN && state_ != State::VERIFYING) {
        return settled();
    }

    std::string code = pin_gate_.generate();
    enter(State::AWAITING_PIN);

    Transition t = settled();
    t.frames.push_back({protocol::CommandType::NOTIFICATION, "PIN expired. Sending new PIN..."});
    t.frames.push_back({protocol::CommandType::PIN_CHALLENGE, code});
    t.effects.push_back({EffectType::SHOW_PIN, code});
    return t;
}

void SessionMachine::update_sync_progress(double progress) {
    if (state_ != State::SYNCING) return;
    if (progress < 0.0) progress = 0.0;
    if (progress > 1.0) progress = 1.0;
    sync_progress_ = progress;
}

Transition SessionMachine::finish_sync(const AssetCounts& counts) {
    if (state_ != State::SYNCING) {
        return settled();
    }
    counts_ = counts;
    sync_progress_ = 1.0;
    enter(State::READY);
    return settled();
}

} // namespace session
