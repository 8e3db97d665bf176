// ═══════════════════════════════════════════════════════════════════
//  src/encoding.cpp — URI component and RFC 5987 encoding
// ═══════════════════════════════════════════════════════════════════

#include "dlproxy/encoding.h"

#include <cctype>

namespace dlproxy::encoding {

namespace detail {

constexpr char kHex[] = "0123456789ABCDEF";

inline void appendEscaped(std::string& out, unsigned char c) {
    out += '%';
    out += kHex[c >> 4];
    out += kHex[c & 0x0f];
}

inline bool isComponentSafe(unsigned char c) {
    if (std::isalnum(c)) return true;
    switch (c) {
        case '-': case '_': case '.': case '!': case '~':
        case '*': case '\'': case '(': case ')':
            return true;
        default:
            return false;
    }
}

} // namespace detail

std::string encodeURIComponent(std::string_view str) {
    std::string out;
    out.reserve(str.size() * 3);
    for (char ch : str) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x80 && detail::isComponentSafe(c)) {
            out += ch;
        } else {
            detail::appendEscaped(out, c);
        }
    }
    return out;
}

std::string encodeRFC5987(std::string_view str) {
    std::string out;
    out.reserve(str.size() * 3);
    for (char ch : str) {
        auto c = static_cast<unsigned char>(ch);
        bool reserved = c == '\'' || c == '(' || c == ')' || c == '*';
        if (c < 0x80 && detail::isComponentSafe(c) && !reserved) {
            out += ch;
        } else {
            detail::appendEscaped(out, c);
        }
    }
    return out;
}

std::string attachment(std::string_view filename) {
    return "attachment; filename*=UTF-8''" + encodeRFC5987(filename);
}

} // namespace dlproxy::encoding
