#include <gtest/gtest.h>

#include <regex>

#include <chatrelay/protocol.hpp>

namespace chatrelay
{
    TEST(Protocol, ParsesUsernameAndMessage)
    {
        auto m = Message::parse(R"({"username":"alice","message":"hi"})");
        ASSERT_TRUE(m.has_value());
        EXPECT_EQ(m->username, "alice");
        EXPECT_EQ(m->body, "hi");
        EXPECT_FALSE(m->storageId.has_value());
    }

    TEST(Protocol, KeepsClientDateOnlyAsParsed)
    {
        auto m = Message::parse(R"({"date":"1999-01-01T00:00:00","username":"bob","message":"yo"})");
        ASSERT_TRUE(m.has_value());
        EXPECT_EQ(m->date, "1999-01-01T00:00:00");
    }

    TEST(Protocol, RejectsInvalidJson)
    {
        std::string why;
        EXPECT_FALSE(Message::parse("{not json", &why).has_value());
        EXPECT_EQ(why, "invalid JSON");
    }

    TEST(Protocol, RejectsNonObjectFrames)
    {
        std::string why;
        EXPECT_FALSE(Message::parse(R"(["alice","hi"])", &why).has_value());
        EXPECT_EQ(why, "frame is not a JSON object");
        EXPECT_FALSE(Message::parse("42").has_value());
    }

    TEST(Protocol, RejectsMissingOrEmptyFields)
    {
        EXPECT_FALSE(Message::parse(R"({"username":"alice"})").has_value());
        EXPECT_FALSE(Message::parse(R"({"message":"hi"})").has_value());
        EXPECT_FALSE(Message::parse(R"({"username":"","message":"hi"})").has_value());
        EXPECT_FALSE(Message::parse(R"({"username":"alice","message":""})").has_value());
        EXPECT_FALSE(Message::parse(R"({"username":7,"message":"hi"})").has_value());
    }

    TEST(Protocol, SerializeNeverCarriesStorageId)
    {
        Message m;
        m.date = "2025-12-07T10:15:30.000Z";
        m.username = "alice";
        m.body = "hi";
        m.storageId = "00000000000000000042";

        auto j = nlohmann::json::parse(Message::serialize(m));
        EXPECT_EQ(j.size(), 3u);
        EXPECT_EQ(j["date"], "2025-12-07T10:15:30.000Z");
        EXPECT_EQ(j["username"], "alice");
        EXPECT_EQ(j["message"], "hi");
        EXPECT_FALSE(j.contains("id"));
        EXPECT_FALSE(j.contains("_id"));
    }

    TEST(Protocol, RecordKeysKeepWireOrder)
    {
        Message m;
        m.date = "d";
        m.username = "u";
        m.body = "b";
        EXPECT_EQ(Message::serialize(m), R"({"date":"d","username":"u","message":"b"})");
    }

    TEST(Protocol, TimestampIsIsoUtcWithMillis)
    {
        const std::regex iso(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)");
        EXPECT_TRUE(std::regex_match(utc_timestamp_now(), iso));
    }

} // namespace chatrelay
