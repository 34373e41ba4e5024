#include <gtest/gtest.h>

#include <chatrelay/Metrics.hpp>
#include <chatrelay/MirrorStore.hpp>

#include "test_support.hpp"

namespace chatrelay
{
    TEST(RelayMetrics, RendersEveryCounter)
    {
        RelayMetrics m;
        m.connections_total = 5;
        m.connections_active = 2;
        m.messages_in_total = 11;
        m.messages_rejected_total = 1;
        m.messages_out_total = 20;
        m.primary_failures_total = 3;
        m.mirror_failures_total = 4;
        m.evictions_total = 6;

        const std::string text = m.render_prometheus();

        EXPECT_NE(text.find("chatrelay_connections_total 5\n"), std::string::npos);
        EXPECT_NE(text.find("chatrelay_connections_active 2\n"), std::string::npos);
        EXPECT_NE(text.find("chatrelay_messages_in_total 11\n"), std::string::npos);
        EXPECT_NE(text.find("chatrelay_messages_rejected_total 1\n"), std::string::npos);
        EXPECT_NE(text.find("chatrelay_messages_out_total 20\n"), std::string::npos);
        EXPECT_NE(text.find("chatrelay_primary_failures_total 3\n"), std::string::npos);
        EXPECT_NE(text.find("chatrelay_mirror_failures_total 4\n"), std::string::npos);
        EXPECT_NE(text.find("chatrelay_evictions_total 6\n"), std::string::npos);
    }

    TEST(RelayMetrics, DeclaresTypes)
    {
        RelayMetrics m;
        const std::string text = m.render_prometheus();

        EXPECT_NE(text.find("# TYPE chatrelay_connections_active gauge"), std::string::npos);
        EXPECT_NE(text.find("# TYPE chatrelay_evictions_total counter"), std::string::npos);
        EXPECT_NE(text.find("# HELP chatrelay_messages_in_total"), std::string::npos);
    }

    TEST(ExporterRouting, HistoryIgnoresQueryString)
    {
        testing::TempDir dir;
        MirrorStore mirror{dir.file("data.json")};
        Message m;
        m.date = "2025-12-07T10:15:30.000Z";
        m.username = "alice";
        m.body = "hi";
        ASSERT_TRUE(mirror.append(m));
        RelayMetrics metrics;

        auto plain = route_exporter_request(true, "/get_messages", metrics, mirror);
        auto query = route_exporter_request(true, "/get_messages?x=1", metrics, mirror);

        EXPECT_EQ(plain.status, 200u);
        EXPECT_EQ(query.status, 200u);
        EXPECT_EQ(query.contentType, "application/json");
        EXPECT_EQ(query.body, mirror.history_json());
        EXPECT_EQ(plain.body, query.body);
    }

    TEST(ExporterRouting, MetricsAndUnknownPaths)
    {
        testing::TempDir dir;
        MirrorStore mirror{dir.file("data.json")};
        RelayMetrics metrics;
        metrics.evictions_total = 2;

        auto ok = route_exporter_request(true, "/metrics?format=text", metrics, mirror);
        EXPECT_EQ(ok.status, 200u);
        EXPECT_NE(ok.body.find("chatrelay_evictions_total 2"), std::string::npos);

        EXPECT_EQ(route_exporter_request(true, "/nope", metrics, mirror).status, 404u);
        EXPECT_EQ(route_exporter_request(true, "/get_messages/extra", metrics, mirror).status, 404u);
        EXPECT_EQ(route_exporter_request(false, "/get_messages", metrics, mirror).status, 404u);
    }

    TEST(ExporterRouting, MissingHistoryIsEmptyArray)
    {
        testing::TempDir dir;
        MirrorStore mirror{dir.file("absent.json")};
        RelayMetrics metrics;

        auto reply = route_exporter_request(true, "/get_messages", metrics, mirror);
        EXPECT_EQ(reply.status, 200u);
        EXPECT_EQ(reply.body, "[]");
    }

} // namespace chatrelay
