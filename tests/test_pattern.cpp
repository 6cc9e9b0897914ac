#include <gtest/gtest.h>

#include "pattern.hpp"
#include "topic_filter.hpp"

using message::Parameters;
using pattern::Pattern;
using pattern::SegmentType;

namespace {

Pattern compileOk(const std::string& source) {
    auto r = Pattern::compile(source);
    EXPECT_TRUE(r) << source << ": " << to_string(r);
    return r.value();
}

std::vector<std::string> levels(std::initializer_list<const char*> l) {
    return std::vector<std::string>(l.begin(), l.end());
}

} // namespace

TEST(PatternCompile, SegmentsAndParameterCount) {
    auto p = compileOk("devices/+deviceId/config/#keys");

    ASSERT_EQ(p.segments().size(), 4u);
    EXPECT_EQ(p.segments()[0].type, SegmentType::Literal);
    EXPECT_EQ(p.segments()[0].text, "devices");
    EXPECT_EQ(p.segments()[1].type, SegmentType::SingleLevel);
    EXPECT_EQ(p.segments()[1].text, "deviceId");
    EXPECT_EQ(p.segments()[3].type, SegmentType::MultiLevel);
    EXPECT_EQ(p.segments()[3].text, "keys");

    EXPECT_EQ(p.parameterCount(), 2u);
    EXPECT_TRUE(p.hasMultiLevel());
    EXPECT_EQ(p.source(), "devices/+deviceId/config/#keys");
    EXPECT_EQ(p.topic(), "devices/+/config/#");
}

TEST(PatternCompile, LiteralOnly) {
    auto p = compileOk("a/b/c");
    EXPECT_EQ(p.parameterCount(), 0u);
    EXPECT_FALSE(p.hasMultiLevel());
    EXPECT_EQ(p.topic(), "a/b/c");
}

TEST(PatternCompile, SingleMultiLevelOnly) {
    auto p = compileOk("#all");
    EXPECT_EQ(p.parameterCount(), 1u);
    EXPECT_EQ(p.topic(), "#");
}

TEST(PatternCompile, RejectsInvalidPatterns) {
    const char* bad[] = {
        "",                     // empty
        "a/#rest/b",            // multi-level not last
        "a/+/b",                // unnamed single-level
        "a/#",                  // unnamed multi-level
        "a/+id/+id",            // duplicate name
        "a/+id/#id",            // duplicate across kinds
        "a/b+c",                // wildcard inside literal
        "a/b#",                 // wildcard inside literal
        "a/+na+me",             // reserved char in name
        "#a/#b",                // two multi-level
    };
    for (auto src : bad) {
        auto r = Pattern::compile(src);
        EXPECT_FALSE(r) << "accepted '" << src << "'";
        EXPECT_EQ(r.code(), ResultCode::InvalidPattern) << src;
    }
}

TEST(PatternCompile, RejectsOverlongPattern) {
    std::string src(pattern::MAX_TOPIC_LENGTH + 1, 'a');
    EXPECT_EQ(Pattern::compile(src).code(), ResultCode::InvalidPattern);
}

TEST(PatternMatch, SingleLevelCapturesOneLevel) {
    auto p = compileOk("sensors/+room/temp");

    auto m = p.match("sensors/kitchen/temp");
    ASSERT_TRUE(m);
    auto params = p.extractParameters(*m);
    ASSERT_EQ(params.size(), 1u);
    EXPECT_EQ(*message::asLevel(params.at("room")), "kitchen");

    EXPECT_FALSE(p.match("sensors/kitchen/humidity"));
    EXPECT_FALSE(p.match("sensors/kitchen/temp/x"));
    EXPECT_FALSE(p.match("sensors/temp"));
    EXPECT_FALSE(p.match("sensors//temp"));
}

TEST(PatternMatch, MultiLevelCapturesRemainingLevels) {
    auto p = compileOk("devices/+deviceId/config/#keys");

    auto m = p.match("devices/d1/config/http/host");
    ASSERT_TRUE(m);
    auto params = p.extractParameters(*m);
    EXPECT_EQ(*message::asLevel(params.at("deviceId")), "d1");
    EXPECT_EQ(*message::asLevels(params.at("keys")), levels({"http", "host"}));
}

TEST(PatternMatch, MultiLevelNeedsAtLeastOneLevel) {
    auto p = compileOk("devices/+deviceId/config/#keys");
    EXPECT_FALSE(p.match("devices/d1/config"));
    EXPECT_TRUE(p.match("devices/d1/config/a"));
}

TEST(PatternMatch, MultiLevelKeepsEmptyLevels) {
    auto p = compileOk("x/#rest");
    auto m = p.match("x/a//b");
    ASSERT_TRUE(m);
    EXPECT_EQ(*message::asLevels(p.extractParameters(*m).at("rest")), levels({"a", "", "b"}));

    m = p.match("x/a/");
    ASSERT_TRUE(m);
    EXPECT_EQ(*message::asLevels(p.extractParameters(*m).at("rest")), levels({"a", ""}));

    m = p.match("x/");
    ASSERT_TRUE(m);
    EXPECT_EQ(*message::asLevels(p.extractParameters(*m).at("rest")), levels({""}));
}

TEST(PatternBuild, MultiLevelValuesStayNonEmpty) {
    auto p = compileOk("x/#rest");
    EXPECT_EQ(p.buildTopic({{"rest", std::vector<std::string>{"a", "", "b"}}}).code(),
              ResultCode::InvalidParameter);
}

TEST(PatternMatch, LiteralMismatchNeverMatches) {
    auto p = compileOk("x/+p/y/#rest");
    EXPECT_FALSE(p.match("z/1/y/a"));
    EXPECT_FALSE(p.match("x/1/z/a/b/c"));
    EXPECT_FALSE(p.match("X/1/y/a"));
}

TEST(PatternMatch, EmptyLiteralLevels) {
    auto p = compileOk("/a/+b");
    auto m = p.match("/a/c");
    ASSERT_TRUE(m);
    EXPECT_EQ(*message::asLevel(p.extractParameters(*m).at("b")), "c");
    EXPECT_FALSE(p.match("a/c"));
}

TEST(PatternBuild, SubstitutesParameters) {
    auto p = compileOk("devices/+deviceId/config/#keys");

    Parameters params{
        {"deviceId", std::string("d1")},
        {"keys", levels({"http", "host"})},
    };
    auto t = p.buildTopic(params);
    ASSERT_TRUE(t) << to_string(t);
    EXPECT_EQ(t.value(), "devices/d1/config/http/host");
}

TEST(PatternBuild, LiteralOnlyNeedsNoParameters) {
    auto p = compileOk("a/b");
    auto t = p.buildTopic({});
    ASSERT_TRUE(t);
    EXPECT_EQ(t.value(), "a/b");
}

TEST(PatternBuild, CountMismatch) {
    auto p = compileOk("a/+x/+y");
    auto t = p.buildTopic({{"x", std::string("1")}});
    EXPECT_EQ(t.code(), ResultCode::ParameterCountMismatch);
    ASSERT_TRUE(t.error().has_value());
    EXPECT_EQ(*t.error(), "wrong parameter count, got 1, expected 2");
}

TEST(PatternBuild, MissingParameter) {
    auto p = compileOk("a/+x/+y");
    auto t = p.buildTopic({{"x", std::string("1")}, {"z", std::string("2")}});
    EXPECT_EQ(t.code(), ResultCode::MissingParameter);
}

TEST(PatternBuild, InvalidValues) {
    auto single = compileOk("a/+x");
    EXPECT_EQ(single.buildTopic({{"x", std::string("")}}).code(), ResultCode::InvalidParameter);
    EXPECT_EQ(single.buildTopic({{"x", std::string("b/c")}}).code(), ResultCode::InvalidParameter);
    EXPECT_EQ(single.buildTopic({{"x", std::string("+")}}).code(), ResultCode::InvalidParameter);
    EXPECT_EQ(single.buildTopic({{"x", levels({"b"})}}).code(), ResultCode::InvalidParameter);

    auto multi = compileOk("a/#rest");
    EXPECT_EQ(multi.buildTopic({{"rest", levels({})}}).code(), ResultCode::InvalidParameter);
    EXPECT_EQ(multi.buildTopic({{"rest", levels({"b", ""})}}).code(), ResultCode::InvalidParameter);
    EXPECT_EQ(multi.buildTopic({{"rest", levels({"b", "#"})}}).code(), ResultCode::InvalidParameter);
    EXPECT_EQ(multi.buildTopic({{"rest", std::string("b")}}).code(), ResultCode::InvalidParameter);
}

TEST(PatternBuild, ExtractOfBuildGivesParametersBack) {
    struct Case {
        const char* pattern;
        Parameters params;
    };
    const Case cases[] = {
        {"a/+x", {{"x", std::string("1")}}},
        {"+a/+b/+c", {{"a", std::string("1")}, {"b", std::string("2")}, {"c", std::string("3")}}},
        {"root/#tail", {{"tail", levels({"one"})}}},
        {"root/#tail", {{"tail", levels({"one", "two", "three"})}}},
        {"+site/x/#rest", {{"site", std::string("s")}, {"rest", levels({"p", "q"})}}},
    };

    for (const auto& c : cases) {
        auto p = compileOk(c.pattern);
        auto topic = p.buildTopic(c.params);
        ASSERT_TRUE(topic) << c.pattern;
        auto m = p.match(topic.value());
        ASSERT_TRUE(m) << topic.value();
        EXPECT_EQ(p.extractParameters(*m), c.params) << c.pattern;
    }
}
