#pragma once
// ═══════════════════════════════════════════════════════════════════
//  dlproxy/url.h — Absolute URL parsing and query strings
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto u = url::parse("https://files.example/t/8f3a?x=1");
//    if (u && u->isHttp()) connect(u->host, u->port, u->target);
//
//    auto next = url::resolve(*u, "../other");   // redirect Location
//    auto q    = url::parseQuery("u=https%3A%2F%2Fa&name=r.pdf");
// ═══════════════════════════════════════════════════════════════════

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace dlproxy::url {

struct Url {
    std::string scheme;     // Lowercase, without ':'
    std::string host;       // Lowercase; IPv6 literals without brackets
    std::string port;       // Explicit port, or the scheme default ("" when unknown)
    std::string target;     // Path plus query ("/" at least for http/https)
    std::string fragment;   // Without '#'; never sent upstream
    bool opaque = false;    // "mailto:x" style, no authority

    bool isHttp() const { return scheme == "http" || scheme == "https"; }
    bool secure() const { return scheme == "https"; }
    bool ipv6() const { return host.find(':') != std::string::npos; }

    // host[:port] as it goes into a Host header; the port only when non-default
    std::string hostHeader() const;

    // Serialized form without the fragment
    std::string href() const;
};

// ── Default port for a scheme, or "" ──
std::string defaultPort(std::string_view scheme);

// ── Parse an absolute URL; nullopt when it is not one ──
//    URLs carrying user credentials are refused.
std::optional<Url> parse(std::string_view input);

// ── Resolve a (possibly relative) reference against base ──
std::optional<Url> resolve(const Url& base, std::string_view reference);

// ── Percent-decoding; invalid escapes are kept literally ──
std::string decodeComponent(std::string_view str, bool plusAsSpace = false);

// ── application/x-www-form-urlencoded query; first occurrence of a key wins ──
std::unordered_map<std::string, std::string> parseQuery(std::string_view qs);

// ── "/path?query" -> {"/path", "query"} ──
std::pair<std::string, std::string> splitTarget(std::string_view target);

// ── RFC 3986 section 5.2.4 ──
std::string removeDotSegments(std::string_view path);

} // namespace dlproxy::url
