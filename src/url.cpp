// ═══════════════════════════════════════════════════════════════════
//  src/url.cpp — Absolute URL parsing, resolution, query decoding
// ═══════════════════════════════════════════════════════════════════

#include "dlproxy/url.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace dlproxy::url {

// ═══════════════════════════════════════════
//  Internal: character classes and helpers
// ═══════════════════════════════════════════
namespace detail {

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

inline bool isSpecial(std::string_view scheme) {
    return scheme == "http" || scheme == "https" || scheme == "ws" ||
           scheme == "wss" || scheme == "ftp" || scheme == "file";
}

inline bool isSchemeChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

// Length of a leading "scheme:" prefix, excluding the colon; 0 when absent
inline std::size_t schemeLength(std::string_view s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return 0;
    std::size_t i = 1;
    while (i < s.size() && isSchemeChar(s[i])) ++i;
    return (i < s.size() && s[i] == ':') ? i : 0;
}

inline bool isForbiddenHostChar(unsigned char c) {
    if (c <= 0x20 || c == 0x7f) return true;
    switch (c) {
        case '#': case '%': case '/': case ':': case '<': case '>': case '?':
        case '@': case '[': case '\\': case ']': case '^': case '|':
            return true;
        default:
            return false;
    }
}

// Trim leading/trailing C0 controls and spaces, drop tabs and newlines
inline std::string clean(std::string_view in) {
    std::size_t begin = 0, end = in.size();
    while (begin < end && static_cast<unsigned char>(in[begin]) <= 0x20) ++begin;
    while (end > begin && static_cast<unsigned char>(in[end - 1]) <= 0x20) --end;
    std::string out;
    out.reserve(end - begin);
    for (auto i = begin; i < end; ++i) {
        if (in[i] != '\t' && in[i] != '\n' && in[i] != '\r') out += in[i];
    }
    return out;
}

// Percent-encode controls, space, non-ASCII and the bytes listed in `extra`
inline std::string encodeSet(std::string_view s, std::string_view extra) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x21 || c > 0x7e || extra.find(ch) != std::string_view::npos) {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0f];
        } else {
            out += ch;
        }
    }
    return out;
}

inline bool parsePort(std::string_view digits, std::string& out) {
    if (digits.empty() || digits.size() > 5) return false;
    unsigned value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    if (value > 65535) return false;
    out = std::to_string(value);
    return true;
}

inline bool parseAuthority(std::string_view authority, Url& url) {
    if (authority.empty()) return false;

    std::string_view portPart;
    bool hasPort = false;

    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return false;
        auto literal = authority.substr(1, close - 1);
        if (literal.find(':') == std::string_view::npos) return false;
        for (char c : literal) {
            if (!std::isxdigit(static_cast<unsigned char>(c)) && c != ':' && c != '.') return false;
        }
        url.host = toLower(literal);
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return false;
            portPart = after.substr(1);
            hasPort = true;
        }
    } else {
        auto colon = authority.find(':');
        auto hostPart = authority.substr(0, colon);
        if (colon != std::string_view::npos) {
            portPart = authority.substr(colon + 1);
            hasPort = true;
        }
        if (hostPart.empty()) return false;
        for (char c : hostPart) {
            if (isForbiddenHostChar(static_cast<unsigned char>(c))) return false;
        }
        url.host = toLower(hostPart);
    }

    // "host:" with an empty port means the default
    if (hasPort && !portPart.empty()) {
        return parsePort(portPart, url.port);
    }
    url.port = defaultPort(url.scheme);
    return true;
}

} // namespace detail

// ═══════════════════════════════════════════
//  Url
// ═══════════════════════════════════════════

std::string Url::hostHeader() const {
    std::string out = ipv6() ? "[" + host + "]" : host;
    if (!port.empty() && port != defaultPort(scheme)) {
        out += ":" + port;
    }
    return out;
}

std::string Url::href() const {
    if (opaque) return scheme + ":" + target;
    return scheme + "://" + hostHeader() + target;
}

std::string defaultPort(std::string_view scheme) {
    if (scheme == "http" || scheme == "ws") return "80";
    if (scheme == "https" || scheme == "wss") return "443";
    if (scheme == "ftp") return "21";
    return "";
}

// ═══════════════════════════════════════════
//  parse
// ═══════════════════════════════════════════

std::optional<Url> parse(std::string_view raw) {
    auto input = detail::clean(raw);
    auto schemeLen = detail::schemeLength(input);
    if (schemeLen == 0) return std::nullopt;

    Url url;
    url.scheme = detail::toLower(std::string_view(input).substr(0, schemeLen));
    std::string_view rest = std::string_view(input).substr(schemeLen + 1);

    auto hash = rest.find('#');
    if (hash != std::string_view::npos) {
        url.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }

    // Non-special schemes are only recognized, never fetched
    if (!detail::isSpecial(url.scheme)) {
        if (rest.substr(0, 2) != "//") {
            url.opaque = true;
            url.target = std::string(rest);
            return url;
        }
        rest.remove_prefix(2);
        auto end = rest.find_first_of("/?");
        url.host = detail::toLower(rest.substr(0, end));
        url.target = end == std::string_view::npos ? "" : std::string(rest.substr(end));
        return url;
    }

    if (url.scheme == "file") {
        if (rest.substr(0, 2) == "//") {
            rest.remove_prefix(2);
            auto end = rest.find('/');
            url.host = detail::toLower(rest.substr(0, end));
            rest = end == std::string_view::npos ? std::string_view("/") : rest.substr(end);
        }
        url.target = detail::encodeSet(removeDotSegments(rest), "\"<>`{}");
        return url;
    }

    // Special schemes tolerate any run of slashes or backslashes before the host
    std::size_t skip = 0;
    while (skip < rest.size() && (rest[skip] == '/' || rest[skip] == '\\')) ++skip;
    rest.remove_prefix(skip);

    auto authorityEnd = rest.find_first_of("/\\?");
    auto authority = rest.substr(0, authorityEnd);
    auto tail = authorityEnd == std::string_view::npos
        ? std::string_view() : rest.substr(authorityEnd);

    if (authority.find('@') != std::string_view::npos) return std::nullopt;
    if (!detail::parseAuthority(authority, url)) return std::nullopt;

    auto queryPos = tail.find('?');
    std::string path(tail.substr(0, queryPos));
    std::replace(path.begin(), path.end(), '\\', '/');
    path = removeDotSegments(path.empty() ? "/" : path);
    if (path.empty()) path = "/";

    url.target = detail::encodeSet(path, "\"<>`{}");
    if (queryPos != std::string_view::npos) {
        url.target += "?" + detail::encodeSet(tail.substr(queryPos + 1), "\"<>'");
    }
    return url;
}

// ═══════════════════════════════════════════
//  resolve
// ═══════════════════════════════════════════

std::optional<Url> resolve(const Url& base, std::string_view reference) {
    auto ref = detail::clean(reference);
    if (detail::schemeLength(ref) != 0) return parse(ref);
    if (base.opaque) return std::nullopt;

    if (ref.empty()) {
        Url same = base;
        same.fragment.clear();
        return same;
    }
    if (ref.front() == '#') {
        Url same = base;
        same.fragment = ref.substr(1);
        return same;
    }
    if (ref.rfind("//", 0) == 0 || ref.rfind("\\\\", 0) == 0) {
        return parse(base.scheme + ":" + ref);
    }

    auto origin = base.scheme + "://" + base.hostHeader();
    auto [basePath, baseQuery] = splitTarget(base.target);

    if (ref.front() == '?') return parse(origin + basePath + ref);
    if (ref.front() == '/' || ref.front() == '\\') return parse(origin + ref);

    auto directory = basePath.substr(0, basePath.rfind('/') + 1);
    return parse(origin + directory + ref);
}

// ═══════════════════════════════════════════
//  Query strings and path helpers
// ═══════════════════════════════════════════

std::string decodeComponent(std::string_view str, bool plusAsSpace) {
    std::string result;
    result.reserve(str.size());
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = detail::hexValue(str[i + 1]);
            int lo = detail::hexValue(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
            result += str[i];
        } else if (plusAsSpace && str[i] == '+') {
            result += ' ';
        } else {
            result += str[i];
        }
    }
    return result;
}

std::unordered_map<std::string, std::string> parseQuery(std::string_view qs) {
    std::unordered_map<std::string, std::string> result;
    while (!qs.empty()) {
        auto amp = qs.find('&');
        auto pair = qs.substr(0, amp);
        qs = amp == std::string_view::npos ? std::string_view() : qs.substr(amp + 1);
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        auto key = decodeComponent(pair.substr(0, eq), true);
        auto value = eq == std::string_view::npos
            ? std::string() : decodeComponent(pair.substr(eq + 1), true);
        result.emplace(std::move(key), std::move(value));
    }
    return result;
}

std::pair<std::string, std::string> splitTarget(std::string_view target) {
    auto pos = target.find('?');
    if (pos == std::string_view::npos) return {std::string(target), ""};
    return {std::string(target.substr(0, pos)), std::string(target.substr(pos + 1))};
}

std::string removeDotSegments(std::string_view path) {
    std::string input(path);
    std::string output;

    auto popSegment = [&output] {
        auto slash = output.rfind('/');
        output.erase(slash == std::string::npos ? 0 : slash);
    };

    while (!input.empty()) {
        if (input.rfind("../", 0) == 0) {
            input.erase(0, 3);
        } else if (input.rfind("./", 0) == 0) {
            input.erase(0, 2);
        } else if (input.rfind("/./", 0) == 0) {
            input.erase(0, 2);
        } else if (input == "/.") {
            input = "/";
        } else if (input.rfind("/../", 0) == 0) {
            input.erase(0, 3);
            popSegment();
        } else if (input == "/..") {
            input = "/";
            popSegment();
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            auto next = input.find('/', input.front() == '/' ? 1 : 0);
            output += input.substr(0, next);
            input.erase(0, next == std::string::npos ? input.size() : next);
        }
    }
    return output;
}

} // namespace dlproxy::url
