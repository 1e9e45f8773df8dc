#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace textcat {

// Decode one UTF-8 sequence starting at s[i].
// Returns the byte length consumed; malformed input consumes one byte and yields it as-is.
inline size_t utf8_decode(const std::string& s, size_t i, uint32_t& cp) {
    unsigned char c0 = (unsigned char)s[i];
    if (c0 < 0x80) { cp = c0; return 1; }

    size_t len = 0;
    if ((c0 & 0xE0) == 0xC0) { len = 2; cp = c0 & 0x1F; }
    else if ((c0 & 0xF0) == 0xE0) { len = 3; cp = c0 & 0x0F; }
    else if ((c0 & 0xF8) == 0xF0) { len = 4; cp = c0 & 0x07; }
    else { cp = c0; return 1; }

    if (i + len > s.size()) { cp = c0; return 1; }
    for (size_t k = 1; k < len; k++) {
        unsigned char cc = (unsigned char)s[i + k];
        if ((cc & 0xC0) != 0x80) { cp = c0; return 1; }
        cp = (cp << 6) | (cc & 0x3F);
    }
    return len;
}

// Append code point cp to out as UTF-8
inline void utf8_append(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back((char)cp);
    } else if (cp < 0x800) {
        out.push_back((char)(0xC0 | (cp >> 6)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back((char)(0xE0 | (cp >> 12)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back((char)(0xF0 | (cp >> 18)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

// Simple one-to-one case mapping for Latin (Basic, Latin-1, Extended-A),
// Greek, Cyrillic, Armenian and Georgian capitals. Capitals of any other
// script come back unchanged.
inline uint32_t to_lower_cp(uint32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + 32;
    if (cp < 0xC0) return cp;

    // Latin-1 Supplement
    if (cp <= 0xDE) return cp == 0xD7 ? cp : cp + 32;

    // Dotted capital I lowers to plain i, not to dotless i at U+0131
    if (cp == 0x130) return 'i';

    // Latin Extended-A (upper case letters sit on alternating code points)
    if (cp >= 0x100 && cp <= 0x137) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x139 && cp <= 0x148) return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp >= 0x14A && cp <= 0x177) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp == 0x178) return 0xFF;
    if (cp >= 0x179 && cp <= 0x17E) return (cp % 2 == 1) ? cp + 1 : cp;

    // Greek
    if (cp == 0x386) return 0x3AC;
    if (cp >= 0x388 && cp <= 0x38A) return cp + 37;
    if (cp == 0x38C) return 0x3CC;
    if (cp == 0x38E || cp == 0x38F) return cp + 63;
    if (cp >= 0x391 && cp <= 0x3AB && cp != 0x3A2) return cp + 32;

    // Cyrillic
    if (cp >= 0x400 && cp <= 0x40F) return cp + 80;
    if (cp >= 0x410 && cp <= 0x42F) return cp + 32;
    if (cp >= 0x460 && cp <= 0x481) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x48A && cp <= 0x4BF) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp == 0x4C0) return 0x4CF;
    if (cp >= 0x4C1 && cp <= 0x4CE) return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp >= 0x4D0 && cp <= 0x52F) return (cp % 2 == 0) ? cp + 1 : cp;

    // Armenian
    if (cp >= 0x531 && cp <= 0x556) return cp + 48;

    // Georgian Asomtavruli to Nuskhuri
    if (cp >= 0x10A0 && cp <= 0x10C5) return cp + 0x1C60;
    if (cp == 0x10C7 || cp == 0x10CD) return cp + 0x1C60;

    return cp;
}

// Lowercase a UTF-8 string; unknown code points and malformed bytes pass through
inline std::string to_lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        unsigned char uc = (unsigned char)s[i];
        if (uc < 0x80) {
            out.push_back((uc >= 'A' && uc <= 'Z') ? (char)(uc + 32) : (char)uc);
            i++;
            continue;
        }

        uint32_t cp = 0;
        size_t n = utf8_decode(s, i, cp);
        if (n == 1) {
            out.push_back(s[i]);  // malformed byte, copy through
        } else {
            utf8_append(out, to_lower_cp(cp));
        }
        i += n;
    }
    return out;
}

// Unicode White_Space code points
inline bool is_space_cp(uint32_t cp) {
    switch (cp) {
    case ' ': case '\t': case '\n': case '\v': case '\f': case '\r':
    case 0x85: case 0xA0: case 0x1680:
    case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
        return true;
    default:
        return cp >= 0x2000 && cp <= 0x200A;
    }
}

// Call fn(word) for every whitespace-delimited word in text, in order.
// fn returns false to stop scanning.
template <typename Fn>
void scan_words(const std::string& text, Fn&& fn) {
    size_t i = 0;
    size_t start = 0;
    bool in_word = false;

    while (i < text.size()) {
        uint32_t cp = 0;
        size_t n = utf8_decode(text, i, cp);
        // Single malformed bytes count as word characters
        bool space = (n > 1 || cp < 0x80) && is_space_cp(cp);

        if (space) {
            if (in_word) {
                if (!fn(text.substr(start, i - start))) return;
                in_word = false;
            }
        } else if (!in_word) {
            start = i;
            in_word = true;
        }
        i += n;
    }
    if (in_word) fn(text.substr(start));
}

} // namespace textcat
