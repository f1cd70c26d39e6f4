#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <boost/asio.hpp>

namespace security {

constexpr int PIN_DIGITS = 4;
constexpr int DEFAULT_MAX_ATTEMPTS = 3;
constexpr std::chrono::milliseconds DEFAULT_PIN_TIMEOUT{30000};

// Generate a random 4-digit PIN, each digit uniform in 0-9 ("0042")
std::string generate_pin();

// Constant-time comparison of two PIN strings
bool pins_equal(const std::string& a, const std::string& b);

// BLAKE2b digest of `input`, `digest_bytes` long, as a lowercase hex string
std::string hash_hex(const std::string& input, std::size_t digest_bytes = 16);

enum class PinStatus {
    SUCCESS,
    WRONG_CODE,
    EXPIRED,
    LOCKED_OUT
};

struct PinResult {
    PinStatus status;
    int attempts_remaining;
};

const char* pin_status_name(PinStatus status);

// Owns the single live PIN session: generation, countdown and verification.
//
// The countdown runs on the supplied io_context. When it elapses without a
// successful verification the session is dropped and the expiry callback is
// invoked from the io_context thread so the owner can re-challenge.
class PinGate {
public:
    using ExpiredCallback = std::function<void()>;
    using CodeGenerator = std::function<std::string()>;

    explicit PinGate(boost::asio::io_context& io,
                     std::chrono::milliseconds timeout = DEFAULT_PIN_TIMEOUT,
                     int max_attempts = DEFAULT_MAX_ATTEMPTS);
    ~PinGate();

    PinGate(const PinGate&) = delete;
    PinGate& operator=(const PinGate&) = delete;

    void set_on_expired(ExpiredCallback callback);

    // Replaces the random source; used by tests that need a known code.
    void set_generator(CodeGenerator generator);

    // Cancels any active session and starts a new one.
    std::string generate();

    PinResult verify(const std::string& candidate);

    // No-op when no session is active.
    void cancel();

    bool is_active() const;
    std::optional<std::string> current_code() const;

    // Countdown for display, whole seconds rounded up. 0 when inactive.
    int seconds_remaining() const;

    std::chrono::milliseconds timeout() const { return timeout_; }
    int max_attempts() const { return max_attempts_; }

private:
    struct Shared;

    boost::asio::io_context& io_;
    std::chrono::milliseconds timeout_;
    int max_attempts_;
    std::shared_ptr<Shared> shared_;

    static void on_deadline(const std::weak_ptr<Shared>& weak, uint64_t generation);
};

} // namespace security
