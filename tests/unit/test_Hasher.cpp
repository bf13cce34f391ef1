#include <gtest/gtest.h>
#include "sync/Hasher.hpp"
#include "sync/errors.hpp"

#include <algorithm>
#include <cctype>

using namespace hs::sync;
using namespace hs::sync::model;

class HasherTest : public ::testing::Test {
protected:
    std::vector<Message> messages{
        {.uuid = "m1", .timestamp = "2025-01-01T10:00:00Z", .role = "user", .content = "hello"},
        {.uuid = "m2", .timestamp = "2025-01-01T10:00:05Z", .role = "assistant", .content = "hi",
         .model = "claude-sonnet", .type = "assistant", .tokens = 12},
        {.uuid = "m3", .timestamp = "2025-01-01T10:01:00Z", .role = "assistant", .content = "more",
         .model = "claude-opus", .tokens = 3},
    };
};

TEST_F(HasherTest, DigestIs64LowercaseHex) {
    const auto h = Hasher::hashSession("s1", "/proj", messages);
    ASSERT_EQ(h.size(), 64u);
    EXPECT_TRUE(std::ranges::all_of(h, [](const char c) { return std::isdigit(c) || (c >= 'a' && c <= 'f'); }));
}

TEST_F(HasherTest, Deterministic) {
    EXPECT_EQ(Hasher::hashSession("s1", "/proj", messages), Hasher::hashSession("s1", "/proj", messages));
}

TEST_F(HasherTest, AnyContentChangeChangesDigest) {
    const auto before = Hasher::hashSession("s1", "/proj", messages);

    auto changed = messages;
    changed[1].content = "hi!";
    EXPECT_NE(Hasher::hashSession("s1", "/proj", changed), before);

    EXPECT_NE(Hasher::hashSession("s2", "/proj", messages), before);
    EXPECT_NE(Hasher::hashSession("s1", "/other", messages), before);
}

TEST_F(HasherTest, TypeFieldDoesNotAffectDigest) {
    auto retyped = messages;
    retyped[1].type = "something-else";
    EXPECT_EQ(Hasher::hashSession("s1", "/proj", retyped), Hasher::hashSession("s1", "/proj", messages));
}

TEST_F(HasherTest, CanonicalContentLayout) {
    const std::vector<Message> one{{.uuid = "a", .timestamp = "T1", .role = "user", .content = "x"}};

    EXPECT_EQ(Hasher::canonicalContent("sid", "/p", one),
              R"({"sessionId":"sid","userId":"","projectPath":"/p","timestamp":"T1","startTime":"T1",)"
              R"("endTime":"T1","messageCount":1,"models":["unknown"],"totalTokens":0})" "\n"
              R"({"uuid":"a","timestamp":"T1","role":"user","content":"x"})");
}

TEST_F(HasherTest, CanonicalContentCarriesModelsTokensAndTimes) {
    const auto content = Hasher::canonicalContent("s1", "/proj", messages);

    EXPECT_NE(content.find(R"("startTime":"2025-01-01T10:00:00Z","endTime":"2025-01-01T10:01:00Z")"), std::string::npos);
    EXPECT_NE(content.find(R"("messageCount":3,"models":["claude-sonnet","claude-opus"],"totalTokens":15})"), std::string::npos);
    EXPECT_NE(content.find(R"({"uuid":"m2","timestamp":"2025-01-01T10:00:05Z","role":"assistant","content":"hi","model":"claude-sonnet","tokens":12})"),
              std::string::npos);
    EXPECT_EQ(std::ranges::count(content, '\n'), 3);
    EXPECT_NE(content.back(), '\n');
}

TEST_F(HasherTest, DistinctModelsInFirstAppearanceOrder) {
    auto ms = messages;
    ms.push_back({.uuid = "m4", .timestamp = "t", .role = "assistant", .content = "", .model = "claude-sonnet"});
    EXPECT_EQ(Hasher::distinctModels(ms), (std::vector<std::string>{"claude-sonnet", "claude-opus"}));
    EXPECT_EQ(Hasher::distinctModels(std::span(messages).first(1)), std::vector<std::string>{"unknown"});
}

TEST_F(HasherTest, JsonEscapingInContent) {
    const std::vector<Message> tricky{{.uuid = "q", .timestamp = "t", .role = "user", .content = "line\n\"quoted\"\ttab"}};
    const auto content = Hasher::canonicalContent("s", "/", tricky);
    EXPECT_NE(content.find(R"("content":"line\n\"quoted\"\ttab")"), std::string::npos);
}

TEST_F(HasherTest, EmptySessionThrowsHashError) {
    EXPECT_THROW((void)Hasher::hashSession("s1", "/proj", {}), HashError);
}

TEST(NeedsSyncTest, MissingOrDifferentRemoteHash) {
    EXPECT_TRUE(Hasher::needsSync("abc", ""));
    EXPECT_TRUE(Hasher::needsSync("abc", "abd"));
    EXPECT_FALSE(Hasher::needsSync("abc", "abc"));
}
