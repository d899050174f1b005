#include <gtest/gtest.h>
#include "metrics.hpp"

using namespace tether;

class MetricsTest : public ::testing::Test {
protected:
    void SetUp() override { MetricsRegistry::instance().reset(); }
    MetricsRegistry& reg = MetricsRegistry::instance();
};

TEST_F(MetricsTest, Counter) {
    reg.increment_counter("tether_frames_total");
    reg.increment_counter("tether_frames_total", 2.5);
    EXPECT_EQ(reg.get_counter("tether_frames_total"), 3.5);

    // Counters never go down.
    reg.increment_counter("tether_frames_total", -1.0);
    EXPECT_EQ(reg.get_counter("tether_frames_total"), 3.5);

    std::string text = reg.collect_prometheus();
    EXPECT_NE(text.find("# TYPE tether_frames_total counter"), std::string::npos);
    EXPECT_NE(text.find("tether_frames_total 3.5"), std::string::npos);
}

TEST_F(MetricsTest, Gauge) {
    reg.set_gauge("tether_session_members", 4);
    reg.increment_gauge("tether_session_members");
    reg.decrement_gauge("tether_session_members", 3);
    EXPECT_EQ(reg.get_gauge("tether_session_members"), 2.0);
    EXPECT_EQ(reg.get_gauge("missing"), 0.0);
    EXPECT_NE(reg.collect_prometheus().find("# TYPE tether_session_members gauge"), std::string::npos);
}

TEST_F(MetricsTest, SummaryAndHelp) {
    reg.describe("tether_sync_batch_size", "Envelopes per confirmed batch");
    reg.observe("tether_sync_batch_size", 50);
    reg.observe("tether_sync_batch_size", 10);
    EXPECT_EQ(reg.get_summary_count("tether_sync_batch_size"), 2u);

    std::string text = reg.collect_prometheus();
    EXPECT_NE(text.find("# HELP tether_sync_batch_size Envelopes per confirmed batch"), std::string::npos);
    EXPECT_NE(text.find("tether_sync_batch_size_count 2"), std::string::npos);
    EXPECT_NE(text.find("tether_sync_batch_size_sum 60"), std::string::npos);
}

TEST_F(MetricsTest, ResetClearsEverything) {
    reg.increment_counter("a");
    reg.set_gauge("b", 1);
    reg.observe("c", 1);
    reg.reset();
    EXPECT_EQ(reg.get_counter("a"), 0.0);
    EXPECT_EQ(reg.get_summary_count("c"), 0u);
    EXPECT_TRUE(reg.collect_prometheus().empty());
}
