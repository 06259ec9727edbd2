#include "tools/ToolCoordinator.h"
#include <thread>

namespace {
std::uint64_t fnv1a64(const std::string& data) {
    const std::uint64_t offset = 1469598103934665603ull;
    const std::uint64_t prime = 1099511628211ull;
    std::uint64_t hash = offset;
    for (unsigned char c : data) {
        hash ^= static_cast<std::uint64_t>(c);
        hash *= prime;
    }
    return hash;
}

std::string shortParams(const nlohmann::json& params) {
    std::string s = params.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (s.size() > 120) {
        s = s.substr(0, 120) + "...";
    }
    return s;
}
} // namespace

ToolCoordinator::ToolCoordinator(std::shared_ptr<ToolRegistry> registry,
                                 std::shared_ptr<ResourceManager> resources,
                                 std::shared_ptr<Logger> logger,
                                 std::chrono::milliseconds defaultTimeout,
                                 std::shared_ptr<MetricsRegistry> metrics)
    : registry(registry ? std::move(registry) : std::make_shared<ToolRegistry>()),
      resources(resources ? std::move(resources) : std::make_shared<ResourceManager>()),
      logger(logger ? std::move(logger) : Logger::null()),
      defaultTimeout(defaultTimeout),
      metrics(metrics ? std::move(metrics) : std::make_shared<MetricsRegistry>()) {}

std::uint64_t ToolCoordinator::fingerprint(const std::string& toolId, const nlohmann::json& params) {
    std::string key = toolId;
    key.push_back('\0');
    key += params.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return fnv1a64(key);
}

bool ToolCoordinator::shouldExecute(const std::string& toolId, const nlohmann::json& params) {
    std::uint64_t fp = fingerprint(toolId, params);
    bool inserted = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        inserted = fingerprints.insert(fp).second;
    }
    if (!inserted) {
        logger->warn("Duplicate tool call suppressed: " + toolId + " " + shortParams(params));
    }
    return inserted;
}

void ToolCoordinator::clear() {
    std::lock_guard<std::mutex> lock(mtx);
    fingerprints.clear();
}

size_t ToolCoordinator::fingerprintCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return fingerprints.size();
}

ToolResult ToolCoordinator::runTool(const std::shared_ptr<ITool>& tool,
                                    const std::string& toolId,
                                    const nlohmann::json& params,
                                    ResourceManager& resources) {
    ToolResult result;
    try {
        result = tool->execute(params, resources);
    } catch (const ToolTimeoutError& e) {
        return ToolResult::timeout(toolId, e.what());
    } catch (const std::exception& e) {
        return ToolResult::failure(toolId, e.what());
    } catch (...) {
        return ToolResult::failure(toolId, "Unknown error");
    }

    if (result.toolId.empty()) {
        result.toolId = toolId;
    }
    if (!result.isSuccess() && !result.error) {
        result.error = result.status == ToolStatus::Timeout ? "Tool timed out" : "Tool reported failure";
    }
    if (result.isSuccess()) {
        result.error.reset();
    }
    return result;
}

ToolResult ToolCoordinator::execute(const std::string& toolId,
                                    const nlohmann::json& params,
                                    std::optional<std::chrono::milliseconds> timeout) {
    metrics->increment("tool.executions.total");
    metrics->increment("tool.executions." + toolId);

    auto tool = registry->getTool(toolId);
    if (!tool) {
        logger->error("Tool '" + toolId + "' not found");
        ToolResult missing = ToolResult::failure(toolId, "Tool '" + toolId + "' not found");
        recordOutcome(toolId, missing, std::chrono::milliseconds(0));
        return missing;
    }

    std::chrono::milliseconds limit = timeout.value_or(defaultTimeout);
    logger->action("Executing tool " + toolId + " " + shortParams(params));

    // 工具体放到单独线程; 超时后线程继续运行直到工具自行返回, 所需对象都按值/引用计数捕获
    auto res = resources;
    auto task = std::make_shared<std::packaged_task<ToolResult()>>(
        [tool, toolId, params, res]() { return runTool(tool, toolId, params, *res); });
    std::future<ToolResult> fut = task->get_future();

    auto started = Clock::now();
    std::thread([task]() { (*task)(); }).detach();

    if (fut.wait_for(limit) == std::future_status::timeout) {
        logger->error("Tool " + toolId + " timed out after " + std::to_string(limit.count()) + "ms");
        ToolResult expired = ToolResult::timeout(toolId, "Tool '" + toolId + "' timed out after " +
                                                             std::to_string(limit.count()) + "ms");
        recordOutcome(toolId, expired, limit);
        return expired;
    }

    ToolResult result = fut.get();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    recordOutcome(toolId, result, elapsed);
    switch (result.status) {
        case ToolStatus::Success:
            logger->success("Tool " + toolId + " finished in " + std::to_string(elapsed.count()) + "ms");
            break;
        case ToolStatus::Failure:
            logger->error("Tool " + toolId + " failed: " + result.error.value_or(""));
            break;
        case ToolStatus::Timeout:
            logger->error("Tool " + toolId + " timed out: " + result.error.value_or(""));
            break;
    }
    return result;
}

void ToolCoordinator::recordOutcome(const std::string& toolId, const ToolResult& result,
                                    std::chrono::milliseconds elapsed) {
    metrics->recordDuration("tool.execution_time." + toolId, elapsed);
    if (result.isSuccess()) {
        metrics->increment("tool.executions.success");
    } else {
        metrics->increment("tool.executions.failure");
        metrics->increment("tool.failures." + toolId);
    }
}

std::future<ToolResult> ToolCoordinator::executeAsync(const std::string& toolId,
                                                      const nlohmann::json& params,
                                                      std::optional<std::chrono::milliseconds> timeout) {
    return std::async(std::launch::async, [this, toolId, params, timeout]() {
        return execute(toolId, params, timeout);
    });
}
