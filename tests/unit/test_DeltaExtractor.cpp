#include <gtest/gtest.h>
#include "sync/DeltaExtractor.hpp"

using namespace hs::sync;
using namespace hs::sync::model;

class DeltaExtractorTest : public ::testing::Test {
protected:
    LogFile file{.path = "/tmp/s.jsonl", .project_path = "/proj", .session_id = "s"};
    std::vector<Message> messages;

    void SetUp() override {
        for (const auto* id : {"msg-1", "msg-2", "msg-3"})
            messages.push_back({.uuid = id, .timestamp = "t", .role = "user", .content = id});
    }

    static std::vector<std::string> uuids(const std::vector<Message>& ms) {
        std::vector<std::string> out;
        for (const auto& m : ms) out.push_back(m.uuid);
        return out;
    }
};

TEST_F(DeltaExtractorTest, EmptyWatermarkTakesEverything) {
    const auto delta = DeltaExtractor::extract(file, messages, "");
    ASSERT_TRUE(delta);
    EXPECT_EQ(delta->messages.size(), 3u);
    EXPECT_EQ(delta->new_last_uuid, "msg-3");
    EXPECT_EQ(delta->session_id, "s");
    EXPECT_EQ(delta->project_path, "/proj");
}

TEST_F(DeltaExtractorTest, WatermarkInTheMiddle) {
    const auto delta = DeltaExtractor::extract(file, messages, "msg-1");
    ASSERT_TRUE(delta);
    EXPECT_EQ(uuids(delta->messages), (std::vector<std::string>{"msg-2", "msg-3"}));
    EXPECT_EQ(delta->new_last_uuid, "msg-3");
}

TEST_F(DeltaExtractorTest, WatermarkAtTheEndMeansNoDelta) {
    EXPECT_FALSE(DeltaExtractor::extract(file, messages, "msg-3"));
}

TEST_F(DeltaExtractorTest, UnknownWatermarkResyncsWholeFile) {
    const auto delta = DeltaExtractor::extract(file, messages, "gone");
    ASSERT_TRUE(delta);
    EXPECT_EQ(uuids(delta->messages), (std::vector<std::string>{"msg-1", "msg-2", "msg-3"}));
}

TEST_F(DeltaExtractorTest, NoMessagesMeansNoDelta) {
    EXPECT_FALSE(DeltaExtractor::extract(file, {}, ""));
    EXPECT_FALSE(DeltaExtractor::extract(file, {}, "msg-1"));
}

TEST_F(DeltaExtractorTest, NewMessagesPreservesOrder) {
    EXPECT_EQ(DeltaExtractor::newMessages(messages, ""), messages);
    EXPECT_EQ(uuids(DeltaExtractor::newMessages(messages, "msg-2")), std::vector<std::string>{"msg-3"});
    EXPECT_TRUE(DeltaExtractor::newMessages(messages, "msg-3").empty());
}
