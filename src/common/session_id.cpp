#include "common/session_id.hpp"
#include "common/errors.hpp"

#include <openssl/rand.h>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace funnel {

std::string generate_session_id() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw FunnelError(ErrorCode::InvalidState, "RAND_bytes failed to produce a session id");
    }
    // RFC 4122 version 4 / variant bits
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    std::ostringstream hex_ss;
    for (size_t i = 0; i < sizeof(bytes); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) hex_ss << '-';
        hex_ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return hex_ss.str();
}

bool is_valid_session_id(const std::string& id) {
    if (id.empty() || id.size() > 128) return false;
    for (unsigned char c : id) {
        if (!std::isalnum(c) && c != '-' && c != '_') return false;
    }
    return true;
}

} // namespace funnel
