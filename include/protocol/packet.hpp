#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace protocol {

constexpr std::size_t HEADER_SIZE = 59;
constexpr std::size_t INFO_SIZE = 50;
constexpr std::size_t CHUNK_SIZE = 64 * 1024;
constexpr unsigned short DEFAULT_PORT = 2347;

// Advertised by the discovery collaborator; the core never browses itself.
constexpr const char* SERVICE_TYPE = "_mediabridge._tcp";

// Wire values are a contract with the peer implementation. Never renumber.
enum class CommandType : uint8_t {
    CONNECT = 1,
    PIN_CHALLENGE = 2,
    VERIFY_PIN = 3,
    PIN_OK = 4,
    PIN_FAIL = 5,
    LIST_ASSETS = 6,
    ASSETS_LIST = 7,
    GET_THUMBNAIL = 8,
    THUMBNAIL_DATA = 9,
    GET_FULL_FILE = 10,
    FILE_DATA = 11,
    DISCONNECT = 12,
    NOTIFICATION = 13
};

// Fixed 59-byte header:
//   1 byte   command
//   8 bytes  payload size (little-endian)
//   50 bytes info (UTF-8, NUL-padded)
struct PacketHeader {
    CommandType command;
    uint64_t payload_size;
    std::string info;
};

struct Frame {
    PacketHeader header;
    std::vector<uint8_t> payload;
};

std::array<uint8_t, HEADER_SIZE> serialize_header(const PacketHeader& header);

// Returns std::nullopt for an unknown command byte. Info bytes that are not
// valid UTF-8 decode to an empty string.
std::optional<PacketHeader> deserialize_header(const std::array<uint8_t, HEADER_SIZE>& buffer);

// Header followed by the payload, payload_size taken from the payload.
std::vector<uint8_t> encode_frame(CommandType command, const std::string& info,
                                  const std::vector<uint8_t>& payload = {});

bool is_known_command(uint8_t value);
const char* command_name(CommandType command);

// Longest prefix of `text` that is at most `max_bytes` long and does not
// split a multi-byte UTF-8 sequence.
std::string truncate_utf8(const std::string& text, std::size_t max_bytes);
bool is_valid_utf8(const std::string& text);

} // namespace protocol
