#pragma once
#include <optional>
#include <string>

namespace agentd {

// Standard base64 (RFC 4648) decode. Whitespace is skipped and trailing
// '=' padding is optional. Returns nullopt on any other non-alphabet byte.
std::optional<std::string> base64_decode(const std::string& b64);

std::string base64_encode(const std::string& raw);

// Longest prefix of `s` no longer than `max_bytes` that does not end inside
// a UTF-8 multi-byte sequence.
std::string utf8_prefix(const std::string& s, size_t max_bytes);

} // namespace agentd
