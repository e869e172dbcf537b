#include "agentd/encoding.h"

#include <cstdint>

namespace agentd {

std::optional<std::string> base64_decode(const std::string& b64) {
    static const int8_t T[256] = {
        -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
        -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
        -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,62,-1,-1,-1,63,
        52,53,54,55,56,57,58,59,60,61,-1,-1,-1,-2,-1,-1,
        -1, 0, 1, 2, 3, 4, 5, 6, 7, 8, 9,10,11,12,13,14,
        15,16,17,18,19,20,21,22,23,24,25,-1,-1,-1,-1,-1,
        -1,26,27,28,29,30,31,32,33,34,35,36,37,38,39,40,
        41,42,43,44,45,46,47,48,49,50,51,-1,-1,-1,-1,-1,
        -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
        -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
        -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
        -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
        -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
        -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
        -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
        -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1
    };

    std::string in;
    in.reserve(b64.size());
    for (char c : b64) {
        if (c=='\n' || c=='\r' || c==' ' || c=='\t') continue;
        in.push_back(c);
    }
    if (in.empty()) return std::nullopt;

    std::string out;
    out.reserve((in.size()*3)/4);
    int val=0, valb=-8;
    bool padding = false;
    for (unsigned char c : in) {
        int8_t d = T[c];
        if (d == -2) { padding = true; continue; }
        if (d == -1) return std::nullopt;
        if (padding) return std::nullopt; // data after '='
        val = ((val<<6) + d) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0) {
            out.push_back(char((val>>valb)&0xFF));
            valb -= 8;
        }
    }
    return out;
}

std::string base64_encode(const std::string& raw) {
    static const char A[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(((raw.size() + 2) / 3) * 4);
    size_t i = 0;
    for (; i + 2 < raw.size(); i += 3) {
        uint32_t n = ((uint32_t)(uint8_t)raw[i] << 16) | ((uint32_t)(uint8_t)raw[i+1] << 8) | (uint8_t)raw[i+2];
        out.push_back(A[(n >> 18) & 63]);
        out.push_back(A[(n >> 12) & 63]);
        out.push_back(A[(n >> 6) & 63]);
        out.push_back(A[n & 63]);
    }
    size_t rest = raw.size() - i;
    if (rest == 1) {
        uint32_t n = (uint32_t)(uint8_t)raw[i] << 16;
        out.push_back(A[(n >> 18) & 63]);
        out.push_back(A[(n >> 12) & 63]);
        out += "==";
    } else if (rest == 2) {
        uint32_t n = ((uint32_t)(uint8_t)raw[i] << 16) | ((uint32_t)(uint8_t)raw[i+1] << 8);
        out.push_back(A[(n >> 18) & 63]);
        out.push_back(A[(n >> 12) & 63]);
        out.push_back(A[(n >> 6) & 63]);
        out.push_back('=');
    }
    return out;
}

std::string utf8_prefix(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t cut = max_bytes;
    // back off over continuation bytes, then drop the lead byte whose
    // sequence would not fit
    size_t i = cut;
    while (i > 0 && ((unsigned char)s[i-1] & 0xC0) == 0x80) i--;
    if (i > 0) {
        unsigned char lead = (unsigned char)s[i-1];
        size_t need = 1;
        if ((lead & 0xE0) == 0xC0) need = 2;
        else if ((lead & 0xF0) == 0xE0) need = 3;
        else if ((lead & 0xF8) == 0xF0) need = 4;
        if (need > 1 && (i - 1) + need > cut) cut = i - 1;
    }
    return s.substr(0, cut);
}

} // namespace agentd
