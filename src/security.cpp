#include "security.hpp"
#include <sodium.h>
#include <random>
#include <sstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <vector>

namespace security {

namespace {

bool ensure_sodium() {
    static const bool ready = sodium_init() >= 0;
    return ready;
}

} // namespace

std::string generate_pin() {
    std::string pin;
    pin.reserve(PIN_DIGITS);

    if (!ensure_sodium()) {
        std::cerr << "libsodium initialization failed!\n";
        // Fallback to std::random_device
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<int> dist(0, 9);
        for (int i = 0; i < PIN_DIGITS; ++i) {
            pin += static_cast<char>('0' + dist(gen));
        }
        return pin;
    }

    for (int i = 0; i < PIN_DIGITS; ++i) {
        pin += static_cast<char>('0' + randombytes_uniform(10));
    }
    return pin;
}

bool pins_equal(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string hash_hex(const std::string& input, std::size_t digest_bytes) {
    if (!ensure_sodium()) {
        std::cerr << "libsodium initialization failed!\n";
        return "";
    }

    if (digest_bytes < crypto_generichash_BYTES_MIN) digest_bytes = crypto_generichash_BYTES_MIN;
    if (digest_bytes > crypto_generichash_BYTES_MAX) digest_bytes = crypto_generichash_BYTES_MAX;

    std::vector<unsigned char> hash(digest_bytes);
    crypto_generichash(hash.data(), hash.size(),
                       reinterpret_cast<const unsigned char*>(input.data()), input.size(),
                       nullptr, 0);

    // Convert to hex string
    std::ostringstream oss;
    for (unsigned char byte : hash) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

const char* pin_status_name(PinStatus status) {
    switch (status) {
        case PinStatus::SUCCESS: return "SUCCESS";
        case PinStatus::WRONG_CODE: return "WRONG_CODE";
        case PinStatus::EXPIRED: return "EXPIRED";
        case PinStatus::LOCKED_OUT: return "LOCKED_OUT";
    }
    return "UNKNOWN";
}

// ─── PinGate ────────────────────────────────────────────────────────────────

struct PinGate::Shared {
    mutable std::mutex mutex;
    bool active = false;
    std::string code;
    std::string superseded; // code replaced by the latest generate()
    int failed_attempts = 0;
    std::chrono::steady_clock::time_point deadline;
    uint64_t generation = 0;
    std::shared_ptr<boost::asio::steady_timer> timer;
    ExpiredCallback on_expired;
    CodeGenerator generator;

    // Caller holds mutex. Any pending timer handler becomes stale.
    void deactivate(boost::asio::io_context& io) {
        active = false;
        code.clear();
        superseded.clear();
        failed_attempts = 0;
        ++generation;
        if (timer) {
            auto stale = std::move(timer);
            boost::asio::post(io, [stale]() { stale->cancel(); });
        }
    }
};

PinGate::PinGate(boost::asio::io_context& io, std::chrono::milliseconds timeout, int max_attempts)
    : io_(io), timeout_(timeout), max_attempts_(max_attempts), shared_(std::make_shared<Shared>()) {}

PinGate::~PinGate() {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->on_expired = nullptr;
    shared_->deactivate(io_);
}

void PinGate::set_on_expired(ExpiredCallback callback) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->on_expired = std::move(callback);
}

void PinGate::set_generator(CodeGenerator generator) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->generator = std::move(generator);
}

std::string PinGate::generate() {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    std::string previous = shared_->active ? shared_->code : std::string();
    shared_->deactivate(io_);
    shared_->superseded = previous;

    shared_->code = shared_->generator ? shared_->generator() : generate_pin();
    shared_->active = true;
    shared_->failed_attempts = 0;
    shared_->deadline = std::chrono::steady_clock::now() + timeout_;

    uint64_t generation = shared_->generation;
    auto timer = std::make_shared<boost::asio::steady_timer>(io_, timeout_);
    std::weak_ptr<Shared> weak = shared_;
    timer->async_wait([weak, generation, timer](const boost::system::error_code& ec) {
        if (ec) return; // cancelled
        on_deadline(weak, generation);
    });
    shared_->timer = timer;

    return shared_->code;
}

void PinGate::on_deadline(const std::weak_ptr<Shared>& weak, uint64_t generation) {
    auto shared = weak.lock();
    if (!shared) return;

    ExpiredCallback callback;
    {
        std::lock_guard<std::mutex> lock(shared->mutex);
        if (!shared->active || shared->generation != generation) {
            return; // already verified, cancelled or regenerated
        }
        shared->active = false;
        shared->code.clear();
        shared->superseded.clear();
        shared->failed_attempts = 0;
        shared->timer.reset();
        ++shared->generation;
        callback = shared->on_expired;
    }

    std::cout << "[PIN] Code expired\n";
    if (callback) callback();
}

PinResult PinGate::verify(const std::string& candidate) {
    std::lock_guard<std::mutex> lock(shared_->mutex);

    if (!shared_->active || std::chrono::steady_clock::now() >= shared_->deadline) {
        if (shared_->active) {
            shared_->deactivate(io_);
        }
        return {PinStatus::EXPIRED, 0};
    }

    if (pins_equal(candidate, shared_->code)) {
        int remaining = max_attempts_ - shared_->failed_attempts;
        shared_->deactivate(io_);
        return {PinStatus::SUCCESS, remaining};
    }

    // The old code of a replaced session is stale, not a guess
    if (!shared_->superseded.empty() && pins_equal(candidate, shared_->superseded)) {
        return {PinStatus::EXPIRED, max_attempts_ - shared_->failed_attempts};
    }

    ++shared_->failed_attempts;
    if (shared_->failed_attempts >= max_attempts_) {
        shared_->deactivate(io_);
        return {PinStatus::LOCKED_OUT, 0};
    }
    return {PinStatus::WRONG_CODE, max_attempts_ - shared_->failed_attempts};
}

void PinGate::cancel() {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (shared_->active) {
        shared_->deactivate(io_);
    }
}

bool PinGate::is_active() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->active;
}

std::optional<std::string> PinGate::current_code() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (!shared_->active) return std::nullopt;
    return shared_->code;
}

int PinGate::seconds_remaining() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (!shared_->active) return 0;

    auto left = shared_->deadline - std::chrono::steady_clock::now();
    if (left <= std::chrono::steady_clock::duration::zero()) return 0;

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(left).count();
    return static_cast<int>((ms + 999) / 1000);
}

} // namespace security
