#include "protocol/packet.hpp"
#include <cstring>

namespace protocol {

bool is_known_command(uint8_t value) {
    return value >= static_cast<uint8_t>(CommandType::CONNECT) &&
           value <= static_cast<uint8_t>(CommandType::NOTIFICATION);
}

const char* command_name(CommandType command) {
    switch (command) {
        case CommandType::CONNECT: return "CONNECT";
        case CommandType::PIN_CHALLENGE: return "PIN_CHALLENGE";
        case CommandType::VERIFY_PIN: return "VERIFY_PIN";
        case CommandType::PIN_OK: return "PIN_OK";
        case CommandType::PIN_FAIL: return "PIN_FAIL";
        case CommandType::LIST_ASSETS: return "LIST_ASSETS";
        case CommandType::ASSETS_LIST: return "ASSETS_LIST";
        case CommandType::GET_THUMBNAIL: return "GET_THUMBNAIL";
        case CommandType::THUMBNAIL_DATA: return "THUMBNAIL_DATA";
        case CommandType::GET_FULL_FILE: return "GET_FULL_FILE";
        case CommandType::FILE_DATA: return "FILE_DATA";
        case CommandType::DISCONNECT: return "DISCONNECT";
        case CommandType::NOTIFICATION: return "NOTIFICATION";
    }
    return "UNKNOWN";
}

std::string truncate_utf8(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    std::size_t cut = max_bytes;
    // Back off continuation bytes (10xxxxxx) so the lead byte is dropped too
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

bool is_valid_utf8(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        std::size_t extra;
        uint32_t cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= text.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and out-of-range code points
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
            (extra == 3 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::array<uint8_t, HEADER_SIZE> serialize_header(const PacketHeader& header) {
    std::array<uint8_t, HEADER_SIZE> buffer{};
    buffer[0] = static_cast<uint8_t>(header.command);

    for (int i = 0; i < 8; ++i) {
        buffer[1 + i] = static_cast<uint8_t>((header.payload_size >> (8 * i)) & 0xFF);
    }

    std::string info = truncate_utf8(header.info, INFO_SIZE);
    std::memcpy(buffer.data() + 9, info.data(), info.size());
    // Remaining bytes are already zero

    return buffer;
}

std::optional<PacketHeader> deserialize_header(const std::array<uint8_t, HEADER_SIZE>& buffer) {
    if (!is_known_command(buffer[0])) {
        return std::nullopt;
    }

    PacketHeader header;
    header.command = static_cast<CommandType>(buffer[0]);

    header.payload_size = 0;
    for (int i = 0; i < 8; ++i) {
        header.payload_size |= static_cast<uint64_t>(buffer[1 + i]) << (8 * i);
    }

    std::size_t len = INFO_SIZE;
    while (len > 0 && buffer[9 + len - 1] == 0) {
        --len;
    }
    std::string info(reinterpret_cast<const char*>(buffer.data() + 9), len);
    header.info = is_valid_utf8(info) ? info : std::string();

    return header;
}

std::vector<uint8_t> encode_frame(CommandType command, const std::string& info,
                                  const std::vector<uint8_t>& payload) {
    PacketHeader header{command, static_cast<uint64_t>(payload.size()), info};
    auto head = serialize_header(header);

    std::vector<uint8_t> out;
    out.reserve(HEADER_SIZE + payload.size());
    out.insert(out.end(), head.begin(), head.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

} // namespace protocol
