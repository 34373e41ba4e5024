#include <gtest/gtest.h>

#include <memory>

#include <nlohmann/json.hpp>

#include <chatrelay/MessageIngest.hpp>

#include "test_support.hpp"

namespace chatrelay
{
    using testing::FakeConnection;
    using testing::FakePrimaryStore;

    namespace
    {
        constexpr const char *kServerTime = "2030-01-01T00:00:00.000Z";

        class MessageIngestTest : public ::testing::Test
        {
        protected:
            testing::TempDir dir;
            ConnectionRegistry registry;
            std::shared_ptr<FakePrimaryStore> primary = std::make_shared<FakePrimaryStore>();
            MirrorStore mirror{dir.file("data.json")};
            RelayMetrics metrics;
            BroadcastCoordinator coordinator{registry, primary, mirror, &metrics};
            MessageIngest ingest{coordinator, &metrics, []
                                 { return std::string{kServerTime}; }};
            std::shared_ptr<FakeConnection> peer = std::make_shared<FakeConnection>(7);

            void SetUp() override { registry.add(peer); }
        };
    } // namespace

    TEST_F(MessageIngestTest, ValidFrameIsBroadcastWithServerTime)
    {
        ASSERT_TRUE(ingest.on_frame(7, R"({"date":"1999-01-01","username":"alice","message":"hi"})"));

        auto frames = peer->frames();
        ASSERT_EQ(frames.size(), 1u);
        auto j = nlohmann::json::parse(frames[0]);
        EXPECT_EQ(j["date"], kServerTime);
        EXPECT_EQ(j["username"], "alice");
        EXPECT_EQ(j["message"], "hi");

        auto history = mirror.load();
        ASSERT_EQ(history.size(), 1u);
        EXPECT_EQ(history[0].date, kServerTime);
        EXPECT_EQ(metrics.messages_in_total.load(), 1u);
    }

    TEST_F(MessageIngestTest, FrameWithoutDateIsAccepted)
    {
        ASSERT_TRUE(ingest.on_frame(7, R"({"username":"bob","message":"yo"})"));
        ASSERT_EQ(peer->frames().size(), 1u);
        EXPECT_EQ(primary->count(), 1u);
    }

    TEST_F(MessageIngestTest, MalformedFramesAreSkipped)
    {
        EXPECT_FALSE(ingest.on_frame(7, "not json"));
        EXPECT_FALSE(ingest.on_frame(7, R"(["alice","hi"])"));
        EXPECT_FALSE(ingest.on_frame(7, R"({"username":"alice"})"));
        EXPECT_FALSE(ingest.on_frame(7, R"({"username":42,"message":"hi"})"));

        EXPECT_TRUE(peer->frames().empty());
        EXPECT_FALSE(peer->closed());
        EXPECT_TRUE(registry.contains(7));
        EXPECT_EQ(primary->insert_calls(), 0u);
        EXPECT_TRUE(mirror.load().empty());
        EXPECT_EQ(metrics.messages_in_total.load(), 4u);
        EXPECT_EQ(metrics.messages_rejected_total.load(), 4u);
    }

    TEST_F(MessageIngestTest, EmptyFieldsAreRejected)
    {
        EXPECT_FALSE(ingest.on_frame(7, R"({"username":"","message":"hi"})"));
        EXPECT_FALSE(ingest.on_frame(7, R"({"username":"alice","message":""})"));
        EXPECT_TRUE(peer->frames().empty());
        EXPECT_EQ(primary->insert_calls(), 0u);
    }

    TEST_F(MessageIngestTest, LaterFramesStillFlowAfterAMalformedOne)
    {
        EXPECT_FALSE(ingest.on_frame(7, "{broken"));
        EXPECT_TRUE(ingest.on_frame(7, R"({"username":"alice","message":"back"})"));
        EXPECT_EQ(peer->frames().size(), 1u);
    }

    TEST_F(MessageIngestTest, OriginAlsoReceivesItsOwnMessage)
    {
        auto other = std::make_shared<FakeConnection>(8);
        registry.add(other);

        ASSERT_TRUE(ingest.on_frame(7, R"({"username":"alice","message":"echo"})"));
        EXPECT_EQ(peer->frames().size(), 1u);
        EXPECT_EQ(other->frames().size(), 1u);
    }

} // namespace chatrelay
