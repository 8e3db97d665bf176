// ═══════════════════════════════════════════════════════════════════
//  test_url.cpp — Tests for URL parsing, resolution, and query strings
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "dlproxy/url.h"

using namespace dlproxy;

// ═══════════════════════════════════════════
//  parse
// ═══════════════════════════════════════════

TEST(UrlParseTest, SimpleHttps) {
    auto u = url::parse("https://files.example/t/8f3a?x=1");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->scheme, "https");
    EXPECT_EQ(u->host, "files.example");
    EXPECT_EQ(u->port, "443");
    EXPECT_EQ(u->target, "/t/8f3a?x=1");
    EXPECT_TRUE(u->isHttp());
    EXPECT_TRUE(u->secure());
    EXPECT_EQ(u->href(), "https://files.example/t/8f3a?x=1");
}

TEST(UrlParseTest, ExplicitPortAndEmptyPath) {
    auto u = url::parse("http://127.0.0.1:9000");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->host, "127.0.0.1");
    EXPECT_EQ(u->port, "9000");
    EXPECT_EQ(u->target, "/");
    EXPECT_EQ(u->hostHeader(), "127.0.0.1:9000");
}

TEST(UrlParseTest, DefaultPortIsOmittedFromHost) {
    auto u = url::parse("http://Example.COM:80/A");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->host, "example.com");
    EXPECT_EQ(u->port, "80");
    EXPECT_EQ(u->hostHeader(), "example.com");
    EXPECT_EQ(u->target, "/A");
}

TEST(UrlParseTest, SchemeIsCaseInsensitive) {
    auto u = url::parse("HTTPS://a.example/");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->scheme, "https");
}

TEST(UrlParseTest, Ipv6Literal) {
    auto u = url::parse("http://[::1]:8080/f");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->host, "::1");
    EXPECT_TRUE(u->ipv6());
    EXPECT_EQ(u->hostHeader(), "[::1]:8080");
}

TEST(UrlParseTest, FragmentIsDropped) {
    auto u = url::parse("https://a.example/f.zip#part");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->target, "/f.zip");
    EXPECT_EQ(u->fragment, "part");
    EXPECT_EQ(u->href(), "https://a.example/f.zip");
}

TEST(UrlParseTest, DotSegmentsAndSpaces) {
    auto u = url::parse("https://a.example/x/../y/./my file.bin");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->target, "/y/my%20file.bin");
}

TEST(UrlParseTest, SurroundingWhitespaceIsTrimmed) {
    auto u = url::parse("  https://a.example/f\n");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->href(), "https://a.example/f");
}

TEST(UrlParseTest, RejectsNonUrls) {
    EXPECT_FALSE(url::parse("not a url").has_value());
    EXPECT_FALSE(url::parse("").has_value());
    EXPECT_FALSE(url::parse("/relative/path").has_value());
    EXPECT_FALSE(url::parse("//host/scheme-relative").has_value());
    EXPECT_FALSE(url::parse("http://").has_value());
    EXPECT_FALSE(url::parse("http://exa mple.com/").has_value());
    EXPECT_FALSE(url::parse("http://host:99999/").has_value());
    EXPECT_FALSE(url::parse("http://host:12ab/").has_value());
    EXPECT_FALSE(url::parse("http://[::1/").has_value());
}

TEST(UrlParseTest, RejectsCredentials) {
    EXPECT_FALSE(url::parse("https://user:pw@a.example/f").has_value());
}

TEST(UrlParseTest, OtherSchemesParseButAreNotHttp) {
    auto ftp = url::parse("ftp://host/f");
    ASSERT_TRUE(ftp.has_value());
    EXPECT_FALSE(ftp->isHttp());

    auto file = url::parse("file:///etc/passwd");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->scheme, "file");
    EXPECT_FALSE(file->isHttp());

    auto mail = url::parse("mailto:someone@example.com");
    ASSERT_TRUE(mail.has_value());
    EXPECT_TRUE(mail->opaque);
    EXPECT_FALSE(mail->isHttp());

    auto js = url::parse("javascript:alert(1)");
    ASSERT_TRUE(js.has_value());
    EXPECT_FALSE(js->isHttp());
}

// ═══════════════════════════════════════════
//  resolve
// ═══════════════════════════════════════════

TEST(UrlResolveTest, AbsoluteReference) {
    auto base = url::parse("https://a.example/dir/file");
    auto r = url::resolve(*base, "http://b.example/other");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->href(), "http://b.example/other");
}

TEST(UrlResolveTest, AbsolutePath) {
    auto base = url::parse("https://a.example:8443/dir/file?q=1");
    auto r = url::resolve(*base, "/root.bin");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->href(), "https://a.example:8443/root.bin");
}

TEST(UrlResolveTest, RelativePath) {
    auto base = url::parse("https://a.example/dir/sub/file");
    EXPECT_EQ(url::resolve(*base, "next")->href(), "https://a.example/dir/sub/next");
    EXPECT_EQ(url::resolve(*base, "../up")->href(), "https://a.example/dir/up");
}

TEST(UrlResolveTest, SchemeRelative) {
    auto base = url::parse("https://a.example/f");
    auto r = url::resolve(*base, "//cdn.example/f");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->href(), "https://cdn.example/f");
}

TEST(UrlResolveTest, QueryOnly) {
    auto base = url::parse("https://a.example/dl?token=1");
    EXPECT_EQ(url::resolve(*base, "?token=2")->href(), "https://a.example/dl?token=2");
}

TEST(UrlResolveTest, NonHttpTargetStillResolves) {
    auto base = url::parse("https://a.example/f");
    auto r = url::resolve(*base, "ftp://b.example/f");
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->isHttp());
}

// ═══════════════════════════════════════════
//  Query strings
// ═══════════════════════════════════════════

TEST(QueryTest, DecodesPercentAndPlus) {
    auto q = url::parseQuery("u=https%3A%2F%2Fa.example%2Ff%3Fx%3D1&name=my+file.pdf");
    EXPECT_EQ(q["u"], "https://a.example/f?x=1");
    EXPECT_EQ(q["name"], "my file.pdf");
}

TEST(QueryTest, FirstOccurrenceWins) {
    auto q = url::parseQuery("u=first&u=second");
    EXPECT_EQ(q["u"], "first");
}

TEST(QueryTest, KeyWithoutValueAndEmptyPairs) {
    auto q = url::parseQuery("&&u&name=");
    ASSERT_EQ(q.count("u"), 1u);
    EXPECT_EQ(q["u"], "");
    EXPECT_EQ(q["name"], "");
    EXPECT_EQ(q.size(), 2u);
}

TEST(QueryTest, InvalidEscapesAreKept) {
    EXPECT_EQ(url::decodeComponent("100%"), "100%");
    EXPECT_EQ(url::decodeComponent("%zz"), "%zz");
    EXPECT_EQ(url::decodeComponent("%41%42"), "AB");
    EXPECT_EQ(url::decodeComponent("a+b"), "a+b");
    EXPECT_EQ(url::decodeComponent("a+b", true), "a b");
}

TEST(QueryTest, SplitTarget) {
    auto [path, query] = url::splitTarget("/dl?u=x&name=y");
    EXPECT_EQ(path, "/dl");
    EXPECT_EQ(query, "u=x&name=y");

    auto [bare, none] = url::splitTarget("/");
    EXPECT_EQ(bare, "/");
    EXPECT_EQ(none, "");
}

TEST(QueryTest, RemoveDotSegments) {
    EXPECT_EQ(url::removeDotSegments("/a/b/c/./../../g"), "/a/g");
    EXPECT_EQ(url::removeDotSegments("mid/content=5/../6"), "mid/6");
    EXPECT_EQ(url::removeDotSegments("/../x"), "/x");
}
