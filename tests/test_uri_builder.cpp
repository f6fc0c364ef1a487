//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_uri_builder.cpp
// Purpose: Tests for action URI and discovery URL construction, URL parsing and percent-coding
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "aiq/uri/UriBuilder.hpp"

using namespace aiq;
using aiq::errors::ErrorCategory;

namespace {

// Splits the segments that follow "<base>/integration/" in an action URI.
std::vector<std::string> segmentsAfterIntegration(const std::string& uri) {
    std::vector<std::string> out;
    const std::string marker = "/integration/";
    auto pos = uri.find(marker);
    if (pos == std::string::npos) {
        return out;
    }
    std::string rest = uri.substr(pos + marker.size());
    auto q = rest.find('?');
    if (q != std::string::npos) {
        rest = rest.substr(0, q);
    }
    std::size_t start = 0;
    while (true) {
        auto slash = rest.find('/', start);
        out.push_back(rest.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return out;
}

} // namespace

TEST(UriBuilder, BuildsIntegrationPathUnderBase) {
    auto r = uri::BuildActionUri("https://svc.example.com/aiq", "acme", "upload");
    ASSERT_FALSE(r.IsError()) << r.Error().message;
    EXPECT_EQ(r.Value(), "https://svc.example.com/aiq/integration/acme/upload");
}

TEST(UriBuilder, TrailingSlashOnBaseIsNotDoubled) {
    auto a = uri::BuildActionUri("https://svc.example.com/aiq/", "acme", "upload");
    auto b = uri::BuildActionUri("https://svc.example.com/", "acme", "upload");
    ASSERT_FALSE(a.IsError());
    ASSERT_FALSE(b.IsError());
    EXPECT_EQ(a.Value(), "https://svc.example.com/aiq/integration/acme/upload");
    EXPECT_EQ(b.Value(), "https://svc.example.com/integration/acme/upload");
}

TEST(UriBuilder, PercentEncodesReservedCharactersInSegments) {
    auto r = uri::BuildActionUri("http://localhost:8080/base", "my org/x", "a+b?c#d");
    ASSERT_FALSE(r.IsError()) << r.Error().message;
    EXPECT_EQ(r.Value(), "http://localhost:8080/base/integration/my%20org%2Fx/a%2Bb%3Fc%23d");
}

TEST(UriBuilder, EncodesNonAsciiAsUtf8Bytes) {
    auto r = uri::BuildActionUri("http://localhost/base", "caf\xC3\xA9", "run");
    ASSERT_FALSE(r.IsError());
    EXPECT_EQ(r.Value(), "http://localhost/base/integration/caf%C3%A9/run");
}

TEST(UriBuilder, SegmentsDecodeBackToInputs) {
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"acme", "upload"},
        {"org with spaces", "do/this"},
        {"100%", "a&b=c"},
        {"~tilde-dash_dot.", "plus+sign"},
        {"\xE6\x97\xA5\xE6\x9C\xAC", "?#[]@!$'()*,;"},
    };
    for (const auto& c : cases) {
        auto r = uri::BuildActionUri("https://svc.example.com/aiq", c.first, c.second);
        ASSERT_FALSE(r.IsError()) << c.first << " / " << c.second;

        uri::UrlParts parts;
        std::string err;
        ASSERT_TRUE(uri::ParseAbsoluteUrl(r.Value(), parts, err)) << err;

        auto segs = segmentsAfterIntegration(r.Value());
        ASSERT_EQ(segs.size(), 2u) << r.Value();
        std::string org, action;
        ASSERT_TRUE(uri::PercentDecode(segs[0], false, org));
        ASSERT_TRUE(uri::PercentDecode(segs[1], false, action));
        EXPECT_EQ(org, c.first);
        EXPECT_EQ(action, c.second);
    }
}

TEST(UriBuilder, QueryParamsKeepOrderAndDuplicates) {
    std::vector<uri::QueryParam> params = {{"b", "2"}, {"a", "1"}, {"b", "3 4"}, {"k&v", "x=y"}};
    auto r = uri::BuildActionUri("https://svc.example.com/aiq", "acme", "list", params);
    ASSERT_FALSE(r.IsError());
    EXPECT_EQ(r.Value(), "https://svc.example.com/aiq/integration/acme/list?b=2&a=1&b=3+4&k%26v=x%3Dy");
}

TEST(UriBuilder, BlankInputsAreInvalidInOrder) {
    const std::vector<std::string> blanks = {"", " ", "\t\r\n"};
    for (const auto& b : blanks) {
        auto u = uri::BuildActionUri(b, "acme", "upload");
        ASSERT_TRUE(u.IsError());
        EXPECT_EQ(u.Error().category, ErrorCategory::InvalidInput);
        EXPECT_EQ(u.Error().message, "Invalid URL");

        auto o = uri::BuildActionUri("https://svc/aiq", b, "upload");
        ASSERT_TRUE(o.IsError());
        EXPECT_EQ(o.Error().category, ErrorCategory::InvalidInput);
        EXPECT_EQ(o.Error().message, "Invalid organization");

        auto a = uri::BuildActionUri("https://svc/aiq", "acme", b);
        ASSERT_TRUE(a.IsError());
        EXPECT_EQ(a.Error().category, ErrorCategory::InvalidInput);
        EXPECT_EQ(a.Error().message, "Invalid action");
    }
    // URL is checked first when everything is blank
    auto all = uri::BuildActionUri("", "", "");
    ASSERT_TRUE(all.IsError());
    EXPECT_EQ(all.Error().message, "Invalid URL");
}

TEST(UriBuilder, MalformedBaseUrlsAreInvalidInput) {
    const std::vector<std::string> bad = {
        "svc.example.com/aiq",
        "ftp://svc.example.com/aiq",
        "http://",
        "http://host:99999/aiq",
        "http://host:0/aiq",
        "http://host:abc/aiq",
        "http://ho st/aiq",
        "http://user:pw@host/aiq",
        "http://[::1/aiq",
        "http://host/a%zz",
        "http://host/a b",
        "https://svc.example.com/aiq?x=1",
        "https://svc.example.com/aiq#frag",
    };
    for (const auto& b : bad) {
        auto r = uri::BuildActionUri(b, "acme", "upload");
        ASSERT_TRUE(r.IsError()) << b;
        EXPECT_EQ(r.Error().category, ErrorCategory::InvalidInput) << b;
    }
}

TEST(UriBuilder, ParseAbsoluteUrlFillsDefaultsAndTarget) {
    uri::UrlParts p;
    std::string err;
    ASSERT_TRUE(uri::ParseAbsoluteUrl("HTTPS://Svc.Example.com", p, err)) << err;
    EXPECT_EQ(p.scheme, "https");
    EXPECT_EQ(p.port, "443");
    EXPECT_EQ(p.path, "/");
    EXPECT_EQ(p.target, "/");

    ASSERT_TRUE(uri::ParseAbsoluteUrl("http://127.0.0.1:8081/auth/token?orgName=acme#top", p, err)) << err;
    EXPECT_EQ(p.host, "127.0.0.1");
    EXPECT_EQ(p.port, "8081");
    EXPECT_EQ(p.path, "/auth/token");
    EXPECT_EQ(p.query, "orgName=acme");
    EXPECT_EQ(p.target, "/auth/token?orgName=acme");
    EXPECT_TRUE(p.hasQuery);
    EXPECT_TRUE(p.hasFragment);

    ASSERT_TRUE(uri::ParseAbsoluteUrl("http://[::1]:9000/x", p, err)) << err;
    EXPECT_EQ(p.host, "::1");
    EXPECT_EQ(p.port, "9000");
    EXPECT_EQ(p.path, "/x");
}

TEST(UriBuilder, DiscoveryUrlAppendsFormEncodedOrg) {
    auto r = uri::BuildDiscoveryUrl("https://svc.example.com/auth", "acme corp&co");
    ASSERT_FALSE(r.IsError());
    EXPECT_EQ(r.Value(), "https://svc.example.com/auth?orgName=acme+corp%26co");

    auto q = uri::BuildDiscoveryUrl("https://svc.example.com/auth?region=eu", "acme");
    ASSERT_FALSE(q.IsError());
    EXPECT_EQ(q.Value(), "https://svc.example.com/auth?region=eu&orgName=acme");

    auto f = uri::BuildDiscoveryUrl("https://svc.example.com/auth#x", "acme");
    ASSERT_TRUE(f.IsError());
    EXPECT_EQ(f.Error().category, ErrorCategory::InvalidInput);

    auto blank = uri::BuildDiscoveryUrl("https://svc.example.com/auth", " ");
    ASSERT_TRUE(blank.IsError());
    EXPECT_EQ(blank.Error().message, "Invalid organization");
}

TEST(UriBuilder, PercentDecodeRejectsBrokenEscapes) {
    std::string out;
    EXPECT_FALSE(uri::PercentDecode("%4", false, out));
    EXPECT_FALSE(uri::PercentDecode("abc%", false, out));
    EXPECT_FALSE(uri::PercentDecode("%zz", false, out));
    ASSERT_TRUE(uri::PercentDecode("a+b%20c", true, out));
    EXPECT_EQ(out, "a b c");
    ASSERT_TRUE(uri::PercentDecode("a+b", false, out));
    EXPECT_EQ(out, "a+b");
}

TEST(UriBuilder, FormEncodingUsesPlusForSpace) {
    EXPECT_EQ(uri::UrlEncodeForm("a b"), "a+b");
    EXPECT_EQ(uri::PercentEncodePathSegment("a b"), "a%20b");
    EXPECT_EQ(uri::UrlEncodeForm("p@ss:w0rd/+"), "p%40ss%3Aw0rd%2F%2B");
    EXPECT_EQ(uri::UrlEncodeForm("AZaz09-._~"), "AZaz09-._~");
}
