// URL Parser Tests

#include "ext/url.hpp"

#include <gtest/gtest.h>

using namespace just;
using namespace just::ext;

static Url parse_ok(std::string_view input) {
    auto result = Url::parse(input);
    EXPECT_TRUE(is_ok(result)) << input;
    return is_ok(result) ? unwrap(result) : Url{};
}

// ============================================================================
// Components
// ============================================================================

TEST(UrlTest, SplitsAllComponents) {
    auto url = parse_ok("https://user:pw@Example.COM:8443/a/b?x=1&y=2#frag");
    EXPECT_EQ(url.scheme, "https");
    EXPECT_EQ(url.userinfo, "user:pw");
    EXPECT_EQ(url.host, "example.com");
    ASSERT_TRUE(url.port.has_value());
    EXPECT_EQ(*url.port, 8443);
    EXPECT_EQ(url.path, "/a/b");
    EXPECT_EQ(url.query, "x=1&y=2");
    EXPECT_EQ(url.fragment, "frag");
}

TEST(UrlTest, SpecialSchemeGetsRootPath) {
    auto url = parse_ok("https://github.com");
    EXPECT_EQ(url.host, "github.com");
    EXPECT_FALSE(url.port.has_value());
    EXPECT_EQ(url.path, "/");
}

TEST(UrlTest, SpecialSchemeToleratesSlashVariants) {
    EXPECT_EQ(parse_ok("https:github.com/o/r").host, "github.com");
    EXPECT_EQ(parse_ok("https:///github.com/o/r").host, "github.com");
    EXPECT_EQ(parse_ok("https:\\\\github.com\\o\\r").path, "/o/r");
}

TEST(UrlTest, TrimsSurroundingWhitespace) {
    auto url = parse_ok("  https://github.com/o/r \n");
    EXPECT_EQ(url.host, "github.com");
    EXPECT_EQ(url.path, "/o/r");
}

TEST(UrlTest, NonSpecialSchemeWithoutAuthority) {
    auto url = parse_ok("mailto:someone@github.com");
    EXPECT_EQ(url.scheme, "mailto");
    EXPECT_TRUE(url.host.empty());
    EXPECT_EQ(url.path, "someone@github.com");
    EXPECT_FALSE(url.path_segments().has_value());
}

TEST(UrlTest, Ipv6Host) {
    auto url = parse_ok("http://[::1]:8080/x");
    EXPECT_EQ(url.host, "[::1]");
    ASSERT_TRUE(url.port.has_value());
    EXPECT_EQ(*url.port, 8080);
}

// ============================================================================
// Path Segments
// ============================================================================

TEST(UrlTest, PathSegments) {
    auto segments = parse_ok("https://github.com/owner/repo").path_segments();
    ASSERT_TRUE(segments.has_value());
    EXPECT_EQ(*segments, (std::vector<std::string>{"owner", "repo"}));

    segments = parse_ok("https://github.com/owner/").path_segments();
    ASSERT_TRUE(segments.has_value());
    EXPECT_EQ(*segments, (std::vector<std::string>{"owner", ""}));

    segments = parse_ok("https://github.com").path_segments();
    ASSERT_TRUE(segments.has_value());
    EXPECT_EQ(*segments, (std::vector<std::string>{""}));
}

// ============================================================================
// Rejections
// ============================================================================

TEST(UrlTest, RejectsRelativeAndFreeText) {
    EXPECT_TRUE(is_err(Url::parse("not a url")));
    EXPECT_TRUE(is_err(Url::parse("owner/repo")));
    EXPECT_TRUE(is_err(Url::parse("/owner/repo")));
    EXPECT_TRUE(is_err(Url::parse(":no-scheme")));
    EXPECT_TRUE(is_err(Url::parse("1http://github.com")));
    EXPECT_TRUE(is_err(Url::parse("")));
}

TEST(UrlTest, RejectsBadAuthority) {
    EXPECT_TRUE(is_err(Url::parse("https://")));
    EXPECT_TRUE(is_err(Url::parse("https://git hub.com/o/r")));
    EXPECT_TRUE(is_err(Url::parse("https://github.com:http/o/r")));
    EXPECT_TRUE(is_err(Url::parse("https://github.com:70000/o/r")));
    EXPECT_TRUE(is_err(Url::parse("http://[::1/x")));
}

TEST(UrlTest, RemovesDotSegments) {
    struct Case {
        const char* input;
        const char* path;
    };
    for (const auto& c : {Case{"https://h/a/./b", "/a/b"}, Case{"https://h/a/b/..", "/a/"},
                          Case{"https://h/a/..", "/"}, Case{"https://h/../../a", "/a"},
                          Case{"https://h/a/.", "/a/"}, Case{"https://h/a/%2E/b/%2e%2E/c", "/a/c"},
                          Case{"https://h\\a\\..\\b", "/b"}, Case{"https://h/a/..b/.c", "/a/..b/.c"}}) {
        auto result = Url::parse(c.input);
        ASSERT_TRUE(is_ok(result)) << c.input;
        EXPECT_EQ(unwrap(result).path, c.path) << c.input;
    }
}
