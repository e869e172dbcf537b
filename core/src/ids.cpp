#include "agentd/ids.h"

#include <cstdio>
#include <cstdlib>

#if defined(__linux__)
  #include <sys/random.h>
#endif

namespace agentd {

uint64_t secure_rand64() {
    uint64_t v = 0;
#if defined(__linux__)
    if (::getrandom(&v, sizeof(v), 0) == (ssize_t)sizeof(v)) return v;
#endif
    FILE* f = std::fopen("/dev/urandom", "rb");
    if (f) {
        size_t got = std::fread(&v, sizeof(v), 1, f);
        std::fclose(f);
        if (got == 1) return v;
    }
    // Both getrandom and /dev/urandom failed: abort rather than hand out
    // predictable ids and jitter
    std::fprintf(stderr, "FATAL: secure_rand64() cannot obtain random bytes\n");
    std::abort();
}

std::string new_correlation_id() {
    uint64_t hi = secure_rand64();
    uint64_t lo = secure_rand64();
    // version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  (unsigned)(hi >> 32),
                  (unsigned)((hi >> 16) & 0xFFFF),
                  (unsigned)(hi & 0xFFFF),
                  (unsigned)(lo >> 48),
                  (unsigned long long)(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

bool is_safe_path_segment(const std::string& s) {
    if (s.empty() || s.size() > 128) return false;
    if (s == ".") return false;
    if (s.find("..") != std::string::npos) return false;
    for (unsigned char c : s) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '.' || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

} // namespace agentd
