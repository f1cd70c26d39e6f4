#include "test_util.hpp"
#include "security.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <string>
#include <thread>

using namespace security;

static void test_generate_pin() {
    std::fprintf(stderr, "-- test_generate_pin\n");

    bool saw_leading_zero = false;
    for (int i = 0; i < 500; ++i) {
        std::string pin = generate_pin();
        CHECK_EQ(pin.size(), 4u);
        CHECK(pin.find_first_not_of("0123456789") == std::string::npos);
        if (pin[0] == '0') saw_leading_zero = true;
    }
    // P(no leading zero in 500 draws) = 0.9^500
    CHECK(saw_leading_zero);
}

static void test_helpers() {
    std::fprintf(stderr, "-- test_helpers\n");

    CHECK(pins_equal("0042", "0042"));
    CHECK(!pins_equal("0042", "0043"));
    CHECK(!pins_equal("0042", "042"));
    CHECK(pins_equal("", ""));

    std::string a = hash_hex("photos/IMG_0001.JPG");
    CHECK_EQ(a.size(), 32u);
    CHECK(a.find_first_not_of("0123456789abcdef") == std::string::npos);
    CHECK(a == hash_hex("photos/IMG_0001.JPG"));
    CHECK(a != hash_hex("photos/IMG_0002.JPG"));
}

static void test_regenerate_invalidates_old_code() {
    std::fprintf(stderr, "-- test_regenerate_invalidates_old_code\n");

    boost::asio::io_context io;
    PinGate gate(io);
    int calls = 0;
    gate.set_generator([&calls]() { return ++calls == 1 ? std::string("1111") : std::string("2222"); });

    CHECK(gate.generate() == "1111");
    CHECK(gate.generate() == "2222");

    PinResult result = gate.verify("1111");
    CHECK(result.status == PinStatus::EXPIRED);
    // The stale code does not use up an attempt
    CHECK_EQ(result.attempts_remaining, 3);
    CHECK(gate.is_active());

    PinResult wrong = gate.verify("9999");
    CHECK(wrong.status == PinStatus::WRONG_CODE);
    CHECK_EQ(wrong.attempts_remaining, 2);
    CHECK(gate.verify("2222").status == PinStatus::SUCCESS);
}

static void test_cancelled_code_is_expired() {
    std::fprintf(stderr, "-- test_cancelled_code_is_expired\n");

    boost::asio::io_context io;
    PinGate gate(io);
    gate.set_generator([]() { return std::string("1234"); });

    gate.generate();
    gate.cancel();
    CHECK(!gate.is_active());
    CHECK(gate.verify("1234").status == PinStatus::EXPIRED);
}

static void test_three_wrong_attempts() {
    std::fprintf(stderr, "-- test_three_wrong_attempts\n");

    boost::asio::io_context io;
    PinGate gate(io);
    gate.set_generator([]() { return std::string("0042"); });
    gate.generate();

    PinResult first = gate.verify("1111");
    CHECK(first.status == PinStatus::WRONG_CODE);
    CHECK_EQ(first.attempts_remaining, 2);
    CHECK(gate.current_code() == std::string("0042"));

    PinResult second = gate.verify("2222");
    CHECK(second.status == PinStatus::WRONG_CODE);
    CHECK_EQ(second.attempts_remaining, 1);

    PinResult third = gate.verify("3333");
    CHECK(third.status == PinStatus::LOCKED_OUT);
    CHECK(!gate.is_active());

    CHECK(gate.verify("0042").status == PinStatus::EXPIRED);
}

static void test_success_once() {
    std::fprintf(stderr, "-- test_success_once\n");

    boost::asio::io_context io;
    PinGate gate(io);
    std::string code = gate.generate();
    CHECK_EQ(code.size(), 4u);
    CHECK(gate.seconds_remaining() >= 29 && gate.seconds_remaining() <= 30);

    CHECK(gate.verify(code).status == PinStatus::SUCCESS);
    CHECK(gate.verify(code).status == PinStatus::EXPIRED);
    CHECK_EQ(gate.seconds_remaining(), 0);
}

static void test_expiry_callback() {
    std::fprintf(stderr, "-- test_expiry_callback\n");

    boost::asio::io_context io;
    PinGate gate(io, std::chrono::milliseconds(100));
    std::atomic<int> expired{0};
    gate.set_on_expired([&expired]() { ++expired; });

    std::string code = gate.generate();
    io.run_for(std::chrono::milliseconds(500));

    CHECK_EQ(expired.load(), 1);
    CHECK(!gate.is_active());
    CHECK(gate.verify(code).status == PinStatus::EXPIRED);
}

static void test_cancel_suppresses_expiry() {
    std::fprintf(stderr, "-- test_cancel_suppresses_expiry\n");

    boost::asio::io_context io;
    PinGate gate(io, std::chrono::milliseconds(100));
    std::atomic<int> expired{0};
    gate.set_on_expired([&expired]() { ++expired; });

    gate.generate();
    gate.cancel();
    gate.cancel(); // no-op
    io.run_for(std::chrono::milliseconds(300));
    CHECK_EQ(expired.load(), 0);

    // Regenerating replaces the pending countdown instead of adding one
    io.restart();
    gate.generate();
    gate.generate();
    io.run_for(std::chrono::milliseconds(400));
    CHECK_EQ(expired.load(), 1);
}

int main() {
    test_generate_pin();
    test_helpers();
    test_regenerate_invalidates_old_code();
    test_cancelled_code_is_expired();
    test_three_wrong_attempts();
    test_success_once();
    test_expiry_callback();
    test_cancel_suppresses_expiry();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
