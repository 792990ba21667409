#pragma once
#include <string>
#include <algorithm>

namespace pyguard {

// High-performance, JSON-safe string scrubber for inbound request bodies
inline std::string scrub_json_string(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (unsigned char c : str) {
        // 1. Allow standard whitespace (Tab, Newline, CR)
        if (c == 0x09 || c == 0x0A || c == 0x0D) {
            out += (char)c;
            continue;
        }
        // 2. Printable ASCII and UTF-8 multibyte sequences pass through
        if (c >= 32 && c != 127) {
            out += (char)c;
            continue;
        }
        // 3. Replace any other control byte with a safe space
        out += ' ';
    }
    return out;
}

// Cuts `str` to at most `length` bytes without splitting a UTF-8 sequence.
inline std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    size_t cut = length;
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) --cut;
    return str.substr(0, cut);
}

}
