/// @file test_string_utils.cpp
/// URL composition, query encoding and the small string helpers.

#include <gtest/gtest.h>

#include <map>
#include <string>

#include "../src/http/model/model.hpp"
#include "../src/utils/string_utils.hpp"

// ============================================================================
// join_url
// ============================================================================

TEST(JoinUrl, InsertsExactlyOneSlash) {
    EXPECT_EQ(string_utils::join_url("http://h", "x"), "http://h/x");
    EXPECT_EQ(string_utils::join_url("http://h/", "x"), "http://h/x");
    EXPECT_EQ(string_utils::join_url("http://h", "/x"), "http://h/x");
    EXPECT_EQ(string_utils::join_url("http://h//", "//x/y"), "http://h/x/y");
}

TEST(JoinUrl, EmptyEndpointLeavesTrailingSlash) { EXPECT_EQ(string_utils::join_url("http://h", ""), "http://h/"); }

// ============================================================================
// Encoding
// ============================================================================

TEST(PercentEncode, KeepsUnreservedCharacters) { EXPECT_EQ(string_utils::percent_encode("Az09-_.~"), "Az09-_.~"); }

TEST(PercentEncode, EscapesEverythingElse) {
    EXPECT_EQ(string_utils::percent_encode("a b"), "a%20b");
    EXPECT_EQ(string_utils::percent_encode("name='m'"), "name%3D%27m%27");
    EXPECT_EQ(string_utils::percent_encode("\xC3\xA9"), "%C3%A9");
}

TEST(BuildQuery, JoinsSortedPairs) {
    const std::map<std::string, std::string> params = {{"page", "2"}, {"filter", "a&b"}};
    EXPECT_EQ(string_utils::build_query(params), "filter=a%26b&page=2");
    EXPECT_EQ(string_utils::build_query({}), "");
}

TEST(FullUrl, AppendsQueryWithTheRightSeparator) {
    http::model::Request req{.url_ = "http://h/items", .params_ = {{"q", "x y"}}};
    EXPECT_EQ(http::model::full_url(req), "http://h/items?q=x%20y");

    req.url_ = "http://h/items?fixed=1";
    EXPECT_EQ(http::model::full_url(req), "http://h/items?fixed=1&q=x%20y");

    req.params_.clear();
    EXPECT_EQ(http::model::full_url(req), "http://h/items?fixed=1");
}

TEST(JsonEscape, EscapesQuotesAndControlCharacters) {
    EXPECT_EQ(string_utils::json_escape("say \"hi\"\n"), "say \\\"hi\\\"\\n");
    EXPECT_EQ(string_utils::json_escape("a\\b"), "a\\\\b");
    EXPECT_EQ(string_utils::json_escape(std::string("\x01", 1)), "\\u0001");
}

// ============================================================================
// Misc
// ============================================================================

TEST(StringUtils, TrimAndLower) {
    EXPECT_EQ(string_utils::trim("  x y \t\r\n"), "x y");
    EXPECT_EQ(string_utils::trim("   "), "");
    EXPECT_EQ(string_utils::to_lower("Retry-After"), "retry-after");
}

TEST(StringUtils, StripOnlyTheGivenCharacter) {
    EXPECT_EQ(string_utils::rstrip("a//", '/'), "a");
    EXPECT_EQ(string_utils::lstrip("//a/", '/'), "a/");
    EXPECT_EQ(string_utils::rstrip("///", '/'), "");
}

TEST(StringUtils, CaseInsensitivePrefix) {
    const std::string line = "content-TYPE: text/plain";
    EXPECT_TRUE(string_utils::ieq_prefix(line.data(), line.size(), "Content-Type"));
    EXPECT_FALSE(string_utils::ieq_prefix(line.data(), 3, "Content-Type"));
    EXPECT_FALSE(string_utils::ieq_prefix(line.data(), line.size(), "Accept"));
}
