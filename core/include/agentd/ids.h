#pragma once
#include <cstdint>
#include <string>

namespace agentd {

// Random (version 4) UUID string, lower-case, 36 characters.
std::string new_correlation_id();

// True when `s` may be used as a single filesystem path segment:
// 1..128 characters of [A-Za-z0-9._-], no "..", not ".".
bool is_safe_path_segment(const std::string& s);

// Random 64-bit value from the kernel CSPRNG (getrandom, then
// /dev/urandom). Aborts when neither is available.
uint64_t secure_rand64();

} // namespace agentd
