#include "jdata/jdata.hpp"

#include <algorithm>
#include <cstdio>
#include <string>

namespace jdata {

static bool is_alpha(unsigned char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
static bool is_ident(unsigned char c) { return is_alpha(c) || (c >= '0' && c <= '9') || c == '_'; }

// Length of the UTF-8 sequence starting with `lead` (1 for ASCII and stray bytes).
static std::size_t utf8_len(unsigned char lead) {
    if (lead >= 0xF0 && lead < 0xF8) return 4;
    if (lead >= 0xE0) return lead < 0xF0 ? 3 : 1;
    if (lead >= 0xC0) return 2;
    return 1;
}

static std::string hex_of(const std::string& s, std::size_t pos, std::size_t len) {
    std::string out;
    char buf[4];
    for (std::size_t i = 0; i < len; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[pos + i]);
        std::snprintf(buf, sizeof(buf), len == 1 ? "%X" : "%02X", static_cast<unsigned>(c));
        out += buf;
    }
    return out;
}

std::string escape_key(const std::string& key) {
    if (key.empty()) return key;

    std::string out;
    out.reserve(key.size() + 8);
    std::size_t i = 0;
    const unsigned char c0 = static_cast<unsigned char>(key[0]);
    if (!is_alpha(c0)) {
        const std::size_t len = std::min(utf8_len(c0), key.size());
        out += "x0x" + hex_of(key, 0, len) + "_";
        i = len;
    }
    while (i < key.size()) {
        const unsigned char c = static_cast<unsigned char>(key[i]);
        if (is_ident(c)) {
            out.push_back(key[i++]);
            continue;
        }
        const std::size_t len = std::min(utf8_len(c), key.size() - i);
        out += "_0x" + hex_of(key, i, len) + "_";
        i += len;
    }
    return out;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Parses "0x<HEX>_" at `pos`; on success appends the bytes and returns the
// position after the closing '_'.
static std::size_t take_hex_run(const std::string& s, std::size_t pos, std::string& out) {
    if (pos + 2 >= s.size() || s[pos] != '0' || s[pos + 1] != 'x') return std::string::npos;
    std::size_t j = pos + 2;
    while (j < s.size() && hex_value(s[j]) >= 0) ++j;
    if (j == pos + 2 || j >= s.size() || s[j] != '_') return std::string::npos;

    std::string digits = s.substr(pos + 2, j - pos - 2);
    if (digits.size() % 2 != 0) digits.insert(digits.begin(), '0');
    for (std::size_t k = 0; k < digits.size(); k += 2) {
        out.push_back(static_cast<char>(hex_value(digits[k]) * 16 + hex_value(digits[k + 1])));
    }
    return j + 1;
}

std::string unescape_key(const std::string& key) {
    if (key.find("0x") == std::string::npos) return key;

    std::string out;
    out.reserve(key.size());
    std::size_t i = 0;
    if (key.size() > 1 && key[0] == 'x') {
        std::size_t next = take_hex_run(key, 1, out);
        if (next != std::string::npos) i = next;
    }
    while (i < key.size()) {
        if (key[i] == '_') {
            std::size_t next = take_hex_run(key, i + 1, out);
            if (next != std::string::npos) {
                i = next;
                continue;
            }
        }
        out.push_back(key[i++]);
    }
    return out;
}

} // namespace jdata
