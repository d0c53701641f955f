#include "raptor/server/RequestParser.hpp"

#include <gtest/gtest.h>

using namespace raptor;
using namespace raptor::server;

TEST(RequestParserTest, UrlDecodeHandlesPlusAndPercent) {
    EXPECT_EQ(urlDecode("hello+world"), "hello world");
    EXPECT_EQ(urlDecode("a%2Fb%20c"), "a/b c");
    EXPECT_EQ(urlDecode("100%"), "100%");
    EXPECT_EQ(urlDecode("%zz"), "%zz");
}

TEST(RequestParserTest, PathIsSeparatedFromQuery) {
    auto request = buildRequest("/posts/7?q=hello&page=2", "", "");
    EXPECT_EQ(request.path, "/posts/7");
    ASSERT_EQ(request.params.size(), 2u);
    EXPECT_EQ(request.params.at("q"), "hello");
    EXPECT_EQ(request.params.at("page"), "2");
}

TEST(RequestParserTest, EmptyTargetBecomesRoot) {
    EXPECT_EQ(buildRequest("", "", "").path, "/");
    EXPECT_EQ(buildRequest("?x=1", "", "").path, "/");
}

TEST(RequestParserTest, FragmentIsDropped) {
    auto request = buildRequest("/posts?q=a#top", "", "");
    EXPECT_EQ(request.path, "/posts");
    EXPECT_EQ(request.params.at("q"), "a");
}

TEST(RequestParserTest, KeysWithoutValuesAreKept) {
    auto request = buildRequest("/posts?draft&&title=", "", "");
    EXPECT_EQ(request.params.size(), 2u);
    EXPECT_EQ(request.params.at("draft"), "");
    EXPECT_EQ(request.params.at("title"), "");
}

TEST(RequestParserTest, FormBodyIsMergedAndQueryWins) {
    auto request = buildRequest("/posts?title=from+query",
                                "title=from+body&body=Hi%21",
                                "application/x-www-form-urlencoded; charset=utf-8");
    EXPECT_EQ(request.params.at("title"), "from query");
    EXPECT_EQ(request.params.at("body"), "Hi!");
}

TEST(RequestParserTest, NonFormBodiesAreIgnored) {
    auto request = buildRequest("/posts", R"({"title":"json"})", "application/json");
    EXPECT_TRUE(request.params.empty());
}
