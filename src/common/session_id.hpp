#pragma once

#include <string>

namespace funnel {

/// 128 random bits from OpenSSL formatted as a UUID-style lowercase hex string.
std::string generate_session_id();

/// 1..128 characters of [A-Za-z0-9_-].
bool is_valid_session_id(const std::string& id);

} // namespace funnel
