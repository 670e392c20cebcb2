// src/validation.hpp
// Internal input validation functions.

#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>

namespace easyquery {
namespace validation {

static constexpr char REMOTE_ADMIN_PREFIX = '/';

// True when the text is empty or only whitespace.
inline bool is_blank(const std::string& text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

inline bool check_remote_admin_prefix(const std::string& command) {
    return !command.empty() && command[0] == REMOTE_ADMIN_PREFIX;
}

// Strings in the handshake carry a u16 length.
inline bool check_handshake_string(const std::string& value) {
    return value.size() <= UINT16_MAX;
}

inline bool check_port(int port) {
    return port > 0 && port <= 65535;
}

// A max packet size of 0 means the server did not set a limit.
inline bool check_payload_size(size_t payload_len, uint16_t max_packet_size) {
    return max_packet_size == 0 || payload_len <= max_packet_size;
}

} // namespace validation
} // namespace easyquery
