#include "test_util.hpp"
#include "protocol/packet.hpp"

#include <cstdio>
#include <string>
#include <vector>

using namespace protocol;

static void test_header_layout() {
    std::fprintf(stderr, "-- test_header_layout\n");

    PacketHeader header{CommandType::FILE_DATA, 0x0102030405060708ull, "abc"};
    auto bytes = serialize_header(header);

    CHECK_EQ(bytes.size(), HEADER_SIZE);
    CHECK_EQ(bytes[0], 11);
    // Little-endian size
    CHECK_EQ(bytes[1], 0x08);
    CHECK_EQ(bytes[2], 0x07);
    CHECK_EQ(bytes[8], 0x01);
    CHECK_EQ(bytes[9], 'a');
    CHECK_EQ(bytes[11], 'c');
    for (std::size_t i = 12; i < HEADER_SIZE; ++i) {
        CHECK_EQ(bytes[i], 0);
    }
}

static void test_command_values() {
    std::fprintf(stderr, "-- test_command_values\n");

    CHECK_EQ(static_cast<int>(CommandType::CONNECT), 1);
    CHECK_EQ(static_cast<int>(CommandType::PIN_CHALLENGE), 2);
    CHECK_EQ(static_cast<int>(CommandType::VERIFY_PIN), 3);
    CHECK_EQ(static_cast<int>(CommandType::LIST_ASSETS), 6);
    CHECK_EQ(static_cast<int>(CommandType::GET_FULL_FILE), 10);
    CHECK_EQ(static_cast<int>(CommandType::NOTIFICATION), 13);

    CHECK(!is_known_command(0));
    CHECK(is_known_command(1));
    CHECK(is_known_command(13));
    CHECK(!is_known_command(14));
    CHECK(!is_known_command(255));
}

static void test_round_trip() {
    std::fprintf(stderr, "-- test_round_trip\n");

    PacketHeader header{CommandType::CONNECT, 0, "Workstation-7"};
    auto decoded = deserialize_header(serialize_header(header));
    CHECK(decoded.has_value());
    CHECK(decoded->command == CommandType::CONNECT);
    CHECK_EQ(decoded->payload_size, 0u);
    CHECK_STR_EQ(decoded->info, "Workstation-7");

    PacketHeader big{CommandType::ASSETS_LIST, 5ull * 1024 * 1024 * 1024, ""};
    decoded = deserialize_header(serialize_header(big));
    CHECK(decoded.has_value());
    CHECK_EQ(decoded->payload_size, 5ull * 1024 * 1024 * 1024);
    CHECK_STR_EQ(decoded->info, "");
}

static void test_info_truncation() {
    std::fprintf(stderr, "-- test_info_truncation\n");

    std::string ascii(80, 'x');
    auto decoded = deserialize_header(serialize_header({CommandType::NOTIFICATION, 0, ascii}));
    CHECK(decoded.has_value());
    CHECK_STR_EQ(decoded->info, std::string(50, 'x'));

    // 49 ASCII bytes then a 2-byte character: the character does not fit
    std::string split = std::string(49, 'a') + "\xC3\xA9";
    CHECK_EQ(truncate_utf8(split, 50).size(), 49u);
    decoded = deserialize_header(serialize_header({CommandType::NOTIFICATION, 0, split}));
    CHECK_STR_EQ(decoded->info, std::string(49, 'a'));

    // 3-byte characters: 16 fit in 48 bytes, the 17th would need 51
    std::string euro;
    for (int i = 0; i < 20; ++i) euro += "\xE2\x82\xAC";
    std::string cut = truncate_utf8(euro, INFO_SIZE);
    CHECK_EQ(cut.size(), 48u);
    CHECK(is_valid_utf8(cut));
}

static void test_invalid_headers() {
    std::fprintf(stderr, "-- test_invalid_headers\n");

    std::array<uint8_t, HEADER_SIZE> buffer{};
    buffer[0] = 0;
    CHECK(!deserialize_header(buffer).has_value());
    buffer[0] = 99;
    CHECK(!deserialize_header(buffer).has_value());

    // Undecodable info bytes give an empty string, not a failure
    buffer[0] = static_cast<uint8_t>(CommandType::NOTIFICATION);
    buffer[9] = 0xFF;
    buffer[10] = 0xFE;
    auto decoded = deserialize_header(buffer);
    CHECK(decoded.has_value());
    CHECK_STR_EQ(decoded->info, "");
}

static void test_utf8_validation() {
    std::fprintf(stderr, "-- test_utf8_validation\n");

    CHECK(is_valid_utf8(""));
    CHECK(is_valid_utf8("plain"));
    CHECK(is_valid_utf8("caf\xC3\xA9"));
    CHECK(is_valid_utf8("\xF0\x9F\x93\xB7"));
    CHECK(!is_valid_utf8("\xC3"));          // truncated sequence
    CHECK(!is_valid_utf8("\xC0\xAF"));      // overlong
    CHECK(!is_valid_utf8("\xED\xA0\x80"));  // surrogate
    CHECK(!is_valid_utf8("\x80"));          // stray continuation
}

static void test_encode_frame() {
    std::fprintf(stderr, "-- test_encode_frame\n");

    std::vector<uint8_t> payload = {1, 2, 3, 4, 5};
    auto frame = encode_frame(CommandType::THUMBNAIL_DATA, "id-1", payload);
    CHECK_EQ(frame.size(), HEADER_SIZE + payload.size());

    std::array<uint8_t, HEADER_SIZE> head{};
    std::copy(frame.begin(), frame.begin() + HEADER_SIZE, head.begin());
    auto decoded = deserialize_header(head);
    CHECK(decoded.has_value());
    CHECK_EQ(decoded->payload_size, 5u);
    CHECK_STR_EQ(decoded->info, "id-1");
    CHECK(std::vector<uint8_t>(frame.begin() + HEADER_SIZE, frame.end()) == payload);

    auto empty = encode_frame(CommandType::DISCONNECT, "");
    CHECK_EQ(empty.size(), HEADER_SIZE);
}

int main() {
    test_header_layout();
    test_command_values();
    test_round_trip();
    test_info_truncation();
    test_invalid_headers();
    test_utf8_validation();
    test_encode_frame();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
