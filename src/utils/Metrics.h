#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

class Logger;

/**
 * @brief 某一时刻的指标快照
 */
struct MetricsReport {
    std::uint64_t timestamp = 0;         // unix 秒
    std::uint64_t intervalSeconds = 0;   // 距上一次报告
    std::map<std::string, std::uint64_t> counters;
    std::map<std::string, std::int64_t> gauges;
};

void to_json(nlohmann::json& j, const MetricsReport& report);

/**
 * @brief 计数器与仪表的注册表
 *
 * 和 Logger 一样显式构造后注入, 没有全局实例。名字第一次出现时自动创建。
 * 耗时记录为毫秒仪表, 只保留最近一次。
 */
class MetricsRegistry {
public:
    MetricsRegistry();

    void increment(const std::string& name, std::uint64_t amount = 1);
    void setGauge(const std::string& name, std::int64_t value);
    void recordDuration(const std::string& name, std::chrono::milliseconds duration);

    // 不存在的计数器返回 0
    std::uint64_t counter(const std::string& name) const;
    std::optional<std::int64_t> gauge(const std::string& name) const;

    MetricsReport generateReport();
    void resetCounters();

    /**
     * @brief 以 DEBUG 级别逐行写出报告
     */
    void logReport(Logger& logger);

private:
    std::map<std::string, std::uint64_t> counters;
    std::map<std::string, std::int64_t> gauges;
    std::uint64_t lastReportTime;
    mutable std::mutex mtx;
};
