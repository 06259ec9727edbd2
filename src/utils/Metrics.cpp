#include "utils/Metrics.h"
#include "utils/Logger.h"

namespace {
std::uint64_t unixSeconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}
} // namespace

void to_json(nlohmann::json& j, const MetricsReport& report) {
    j = nlohmann::json{
        {"timestamp", report.timestamp},
        {"interval_seconds", report.intervalSeconds},
        {"counters", report.counters},
        {"gauges", report.gauges}
    };
}

MetricsRegistry::MetricsRegistry() : lastReportTime(unixSeconds()) {}

void MetricsRegistry::increment(const std::string& name, std::uint64_t amount) {
    std::lock_guard<std::mutex> lock(mtx);
    counters[name] += amount;
}

void MetricsRegistry::setGauge(const std::string& name, std::int64_t value) {
    std::lock_guard<std::mutex> lock(mtx);
    gauges[name] = value;
}

void MetricsRegistry::recordDuration(const std::string& name, std::chrono::milliseconds duration) {
    setGauge(name, static_cast<std::int64_t>(duration.count()));
}

std::uint64_t MetricsRegistry::counter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = counters.find(name);
    return it == counters.end() ? 0 : it->second;
}

std::optional<std::int64_t> MetricsRegistry::gauge(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = gauges.find(name);
    if (it == gauges.end()) return std::nullopt;
    return it->second;
}

MetricsReport MetricsRegistry::generateReport() {
    std::uint64_t now = unixSeconds();
    std::lock_guard<std::mutex> lock(mtx);
    MetricsReport report;
    report.timestamp = now;
    report.intervalSeconds = now >= lastReportTime ? now - lastReportTime : 0;
    report.counters = counters;
    report.gauges = gauges;
    lastReportTime = now;
    return report;
}

void MetricsRegistry::resetCounters() {
    std::lock_guard<std::mutex> lock(mtx);
    counters.clear();
}

void MetricsRegistry::logReport(Logger& logger) {
    if (!logger.isEnabled(LogLevel::DEBUG)) return;

    MetricsReport report = generateReport();
    logger.debug("===== Metrics Report (" + std::to_string(report.intervalSeconds) + "s) =====");
    for (const auto& [name, value] : report.counters) {
        logger.debug(name + ": " + std::to_string(value));
    }
    for (const auto& [name, value] : report.gauges) {
        logger.debug(name + ": " + std::to_string(value));
    }
}
