#include <gtest/gtest.h>
#include "mcpgate/uri_template.hpp"
#include "mcpgate/error.hpp"
#include <chrono>

using namespace mcpgate;

TEST(UriTemplate, SinglePlaceholder) {
    auto tmpl = UriTemplate::compile("user://{userId}");
    auto params = tmpl.match("user://42");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(*params, (UriParams{{"userId", "42"}}));
    EXPECT_EQ(params->at("userId"), "42");
}

TEST(UriTemplate, PlaceholderStopsAtSlash) {
    auto tmpl = UriTemplate::compile("user://{userId}");
    EXPECT_FALSE(tmpl.match("user://42/extra").has_value());
    EXPECT_FALSE(tmpl.match("user://").has_value());
    EXPECT_FALSE(tmpl.match("user:/42").has_value());
}

TEST(UriTemplate, AnchoredAtBothEnds) {
    auto tmpl = UriTemplate::compile("docs://{id}/body");
    EXPECT_TRUE(tmpl.match("docs://a/body").has_value());
    EXPECT_FALSE(tmpl.match("xdocs://a/body").has_value());
    EXPECT_FALSE(tmpl.match("docs://a/body/more").has_value());
}

TEST(UriTemplate, MultiplePlaceholdersInOrder) {
    auto tmpl = UriTemplate::compile("repo://{owner}/{name}/issues/{number}");
    EXPECT_EQ(tmpl.param_names(), (std::vector<std::string>{"owner", "name", "number"}));

    auto params = tmpl.match("repo://acme/widgets/issues/7");
    ASSERT_TRUE(params.has_value());
    ASSERT_EQ(params->size(), 3u);
    auto it = params->begin();
    EXPECT_EQ(it->first, "owner");
    EXPECT_EQ((it + 1)->second, "widgets");
    EXPECT_EQ(params->at("number"), "7");
}

TEST(UriTemplate, AdjacentLiteralWithinSegment) {
    auto tmpl = UriTemplate::compile("file:///{name}.txt");
    auto params = tmpl.match("file:///notes.v2.txt");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->at("name"), "notes.v2");
    EXPECT_FALSE(tmpl.match("file:///.txt").has_value());
}

TEST(UriTemplate, PlaceholdersAreGreedy) {
    auto tmpl = UriTemplate::compile("t://{a}-{b}");
    auto params = tmpl.match("t://x-y-z");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(*params, (UriParams{{"a", "x-y"}, {"b", "z"}}));
}

TEST(UriTemplate, LongAmbiguousUriFailsQuickly) {
    auto tmpl = UriTemplate::compile("t://{a}-{b}-{c}!");
    const std::string uri = "t://" + std::string(64 * 1024, '-');

    auto start = std::chrono::steady_clock::now();
    auto params = tmpl.match(uri);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(params.has_value());
    EXPECT_LT(elapsed, std::chrono::seconds(1));
}

TEST(UriTemplate, LongUriMatches) {
    auto tmpl = UriTemplate::compile("t://{a}-{b}-{c}!");
    const std::string filler(64 * 1024, '-');
    auto params = tmpl.match("t://" + filler + "!");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->at("a").size(), filler.size() - 4);
    EXPECT_EQ(params->at("b"), "-");
    EXPECT_EQ(params->at("c"), "-");
}

TEST(UriTemplate, LiteralCharactersAreNotPatterns) {
    auto tmpl = UriTemplate::compile("q://a.b?x={x}");
    EXPECT_TRUE(tmpl.match("q://a.b?x=1").has_value());
    EXPECT_FALSE(tmpl.match("q://aXb?x=1").has_value());
}

TEST(UriTemplate, NoPlaceholders) {
    auto tmpl = UriTemplate::compile("static://thing");
    auto params = tmpl.match("static://thing");
    ASSERT_TRUE(params.has_value());
    EXPECT_TRUE(params->empty());
    EXPECT_EQ(tmpl.pattern(), "static://thing");
}

TEST(UriTemplate, InvalidPatterns) {
    EXPECT_THROW(UriTemplate::compile("user://{userId"), McpError);
    EXPECT_THROW(UriTemplate::compile("user://userId}"), McpError);
    EXPECT_THROW(UriTemplate::compile("user://{}"), McpError);
    EXPECT_THROW(UriTemplate::compile("user://{a{b}}"), McpError);
    EXPECT_THROW(UriTemplate::compile("x://{id}/{id}"), McpError);
}

TEST(UriParams, LookupMisses) {
    UriParams params{{"a", "1"}};
    EXPECT_EQ(params.find("a"), std::optional<std::string>("1"));
    EXPECT_FALSE(params.find("b").has_value());
    EXPECT_THROW((void)params.at("b"), std::out_of_range);
}
