//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_json_path.cpp
// Purpose: Tests for the strict JSON parser and dotted-path text extraction
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "aiq/json/JSONValue.h"
#include "aiq/json/JsonPath.hpp"

using namespace aiq;
using aiq::errors::ErrorCategory;

TEST(JsonParser, AcceptsNestedDocument) {
    json::JSONValue v;
    std::string err;
    ASSERT_TRUE(json::ParseJSON(R"({"links":{"token":"https://svc/token","self":null},"n":[1,2.5,true]})", v, err)) << err;
    ASSERT_TRUE(v.IsObject());
    const auto& obj = std::get<json::JSONValue::Object>(v.value);
    ASSERT_TRUE(obj.count("links"));
    ASSERT_TRUE(obj.at("links")->IsObject());
    ASSERT_TRUE(obj.count("n"));
    const auto& arr = std::get<json::JSONValue::Array>(obj.at("n")->value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_EQ(std::get<int64_t>(arr[0]->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(arr[1]->value), 2.5);
    EXPECT_TRUE(std::get<bool>(arr[2]->value));
}

TEST(JsonParser, RejectsMalformedText) {
    const std::vector<std::string> bad = {
        "",
        "   ",
        "notjson",
        "<html>error</html>",
        "{\"a\":",
        "{\"a\":1,}",
        "{\"a\" 1}",
        "{} trailing",
        "[1,2",
        "\"unterminated",
        "{\"a\":01x}",
        "{\"a\":\"bad\\q\"}",
        "{\"a\":tru}",
    };
    for (const auto& text : bad) {
        json::JSONValue v;
        std::string err;
        EXPECT_FALSE(json::ParseJSON(text, v, err)) << text;
        EXPECT_FALSE(err.empty()) << text;
    }
}

TEST(JsonParser, DecodesUnicodeEscapes) {
    json::JSONValue v;
    std::string err;
    ASSERT_TRUE(json::ParseJSON(R"({"s":"café 😀 \"q\" \\"})", v, err)) << err;
    auto s = json::ExtractText(v, {"s"});
    ASSERT_FALSE(s.IsError());
    EXPECT_EQ(s.Value(), "caf\xC3\xA9 \xF0\x9F\x98\x80 \"q\" \\");
}

TEST(JsonParser, RejectsExcessiveNesting) {
    std::string deep(1000, '[');
    deep += std::string(1000, ']');
    json::JSONValue v;
    std::string err;
    EXPECT_FALSE(json::ParseJSON(deep, v, err));
}

TEST(JsonPath, ExtractsNestedString) {
    auto r = json::ExtractTextFromBody(R"({"links":{"token":"https://svc.example.com/oauth/token"}})", {"links", "token"});
    ASSERT_FALSE(r.IsError()) << r.Error().message;
    EXPECT_EQ(r.Value(), "https://svc.example.com/oauth/token");
}

TEST(JsonPath, MissingFieldsAreMalformed) {
    const std::vector<std::string> bodies = {
        R"({})",
        R"({"links":{}})",
        R"({"links":{"self":"x"}})",
        R"({"link":{"token":"x"}})",
        R"({"links":"token"})",
        R"({"links":["token"]})",
        R"([{"links":{"token":"x"}}])",
    };
    for (const auto& b : bodies) {
        auto r = json::ExtractTextFromBody(b, {"links", "token"});
        ASSERT_TRUE(r.IsError()) << b;
        EXPECT_EQ(r.Error().category, ErrorCategory::MalformedResponse) << b;
        EXPECT_EQ(r.Error().message, "Field not found in the response: links.token") << b;
    }
}

TEST(JsonPath, NonTextTerminalsAreMalformed) {
    const std::vector<std::string> bodies = {
        R"({"access_token":null})",
        R"({"access_token":{"v":"x"}})",
        R"({"access_token":["x"]})",
    };
    for (const auto& b : bodies) {
        auto r = json::ExtractTextFromBody(b, {"access_token"});
        ASSERT_TRUE(r.IsError()) << b;
        EXPECT_EQ(r.Error().category, ErrorCategory::MalformedResponse) << b;
    }
}

TEST(JsonPath, ScalarsRenderAsText) {
    auto i = json::ExtractTextFromBody(R"({"v":12345})", {"v"});
    auto neg = json::ExtractTextFromBody(R"({"v":-7})", {"v"});
    auto d = json::ExtractTextFromBody(R"({"v":0.5})", {"v"});
    auto t = json::ExtractTextFromBody(R"({"v":true})", {"v"});
    auto f = json::ExtractTextFromBody(R"({"v":false})", {"v"});
    ASSERT_FALSE(i.IsError());
    ASSERT_FALSE(neg.IsError());
    ASSERT_FALSE(d.IsError());
    ASSERT_FALSE(t.IsError());
    ASSERT_FALSE(f.IsError());
    EXPECT_EQ(i.Value(), "12345");
    EXPECT_EQ(neg.Value(), "-7");
    EXPECT_EQ(d.Value(), "0.5");
    EXPECT_EQ(t.Value(), "true");
    EXPECT_EQ(f.Value(), "false");
}

TEST(JsonPath, EmptyStringIsReturnedAsIs) {
    auto r = json::ExtractTextFromBody(R"({"access_token":""})", {"access_token"});
    ASSERT_FALSE(r.IsError());
    EXPECT_TRUE(r.Value().empty());
}

TEST(JsonPath, InvalidBodyIsMalformed) {
    auto r = json::ExtractTextFromBody("<html><body>Service Unavailable</body></html>", {"access_token"});
    ASSERT_TRUE(r.IsError());
    EXPECT_EQ(r.Error().category, ErrorCategory::MalformedResponse);
    EXPECT_EQ(r.Error().message.rfind("Response is not valid JSON", 0), 0u) << r.Error().message;
}

TEST(JsonPath, JoinPathUsesDots) {
    EXPECT_EQ(json::JoinPath({"links", "token"}), "links.token");
    EXPECT_EQ(json::JoinPath({"access_token"}), "access_token");
    EXPECT_EQ(json::JoinPath({}), "");
}
