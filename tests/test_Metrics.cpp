#include <gtest/gtest.h>
#include "utils/Metrics.h"
#include "utils/Logger.h"
#include <string>
#include <thread>
#include <vector>

TEST(MetricsTest, CountersStartAtZeroAndAccumulate) {
    MetricsRegistry metrics;
    EXPECT_EQ(metrics.counter("requests"), 0u);
    metrics.increment("requests");
    metrics.increment("requests", 4);
    EXPECT_EQ(metrics.counter("requests"), 5u);
}

TEST(MetricsTest, DurationKeepsLatestValue) {
    MetricsRegistry metrics;
    EXPECT_FALSE(metrics.gauge("tool.execution_time.shell").has_value());
    metrics.recordDuration("tool.execution_time.shell", std::chrono::milliseconds(120));
    metrics.recordDuration("tool.execution_time.shell", std::chrono::milliseconds(35));
    EXPECT_EQ(metrics.gauge("tool.execution_time.shell"), std::optional<std::int64_t>(35));

    metrics.setGauge("queue.depth", -3);
    EXPECT_EQ(metrics.gauge("queue.depth"), std::optional<std::int64_t>(-3));
}

TEST(MetricsTest, ReportSnapshotsAndResetKeepsGauges) {
    MetricsRegistry metrics;
    metrics.increment("a", 2);
    metrics.setGauge("g", 7);

    MetricsReport report = metrics.generateReport();
    EXPECT_EQ(report.counters.at("a"), 2u);
    EXPECT_EQ(report.gauges.at("g"), 7);
    EXPECT_GT(report.timestamp, 0u);

    nlohmann::json j = report;
    EXPECT_EQ(j["counters"]["a"], 2);
    EXPECT_EQ(j["gauges"]["g"], 7);
    EXPECT_TRUE(j.contains("interval_seconds"));

    metrics.resetCounters();
    EXPECT_EQ(metrics.counter("a"), 0u);
    EXPECT_EQ(metrics.gauge("g"), std::optional<std::int64_t>(7));
}

TEST(MetricsTest, ConcurrentIncrementsAreNotLost) {
    MetricsRegistry metrics;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&metrics]() {
            for (int i = 0; i < 1000; i++) {
                metrics.increment("hits");
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(metrics.counter("hits"), 8000u);
}

TEST(MetricsTest, LogReportWritesAtDebug) {
    MetricsRegistry metrics;
    metrics.increment("tool.executions.total", 3);

    Logger::Options opts;
    opts.minLevel = LogLevel::DEBUG;
    Logger logger(opts);
    std::vector<std::string> lines;
    logger.setCallback([&](LogLevel, const std::string& msg) { lines.push_back(msg); });

    metrics.logReport(logger);
    bool found = false;
    for (const auto& line : lines) {
        if (line == "tool.executions.total: 3") found = true;
    }
    EXPECT_TRUE(found);

    lines.clear();
    logger.setLevel(LogLevel::INFO);
    metrics.logReport(logger);
    EXPECT_TRUE(lines.empty());
}
