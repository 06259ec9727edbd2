#include <iostream>
#include <memory>
#include <string>
#include "core/ConfigManager.h"
#include "jsonrpc/Extractor.h"
#include "mcp/MethodDispatcher.h"
#include "mcp/ToolMethods.h"
#include "resources/ResourceManager.h"
#include "tools/MemoryTools.h"
#include "tools/ToolCoordinator.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"
#include "utils/Metrics.h"

namespace {
std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::shared_ptr<Logger> makeLogger(const Config& cfg) {
    Logger::Options opts;
    opts.minLevel = parseLogLevel(cfg.logging.level);
    opts.filePath = cfg.logging.file;
    opts.console = cfg.logging.console;
    return std::make_shared<Logger>(opts);
}
} // namespace

// 用法: quark [config.json]
// 标准输入每行一条消息, 响应逐行写到标准输出; 日志只写标准错误和日志文件。
int main(int argc, char* argv[]) {
    Config cfg = Config::defaults();
    if (argc > 1) {
        try {
            cfg = Config::load(argv[1]);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config: " << e.what() << std::endl;
            return 1;
        }
    }

    auto logger = makeLogger(cfg);

    auto registry = std::make_shared<ToolRegistry>();
    registry->registerTool(std::make_shared<MemoryWriteTool>());
    registry->registerTool(std::make_shared<MemoryReadTool>());

    auto resources = std::make_shared<ResourceManager>();
    auto metrics = std::make_shared<MetricsRegistry>();
    auto coordinator = std::make_shared<ToolCoordinator>(
        registry, resources, logger, std::chrono::seconds(cfg.tools.timeoutSeconds), metrics);

    MethodDispatcher dispatcher(logger);
    registerToolMethods(dispatcher, coordinator);

    logger->info("quark ready, " + std::to_string(registry->getToolCount()) + " tools registered");

    std::string line;
    while (std::getline(std::cin, line)) {
        std::string input = trim(line);
        if (input.empty()) continue;

        // 以 '{' 开头的整行按一条消息处理 (解析失败返回 ParseError);
        // 其他文本里夹带的 JSON-RPC 对象逐个处理
        if (input.front() == '{') {
            std::cout << dispatcher.processJson(input) << std::endl;
            continue;
        }

        auto objects = extractJsonRpcObjects(input);
        if (objects.empty()) {
            logger->debug("No JSON-RPC object in input line, ignored");
            continue;
        }
        for (const auto& obj : objects) {
            std::cout << dispatcher.processJson(obj.value.dump()) << std::endl;
        }
    }

    metrics->logReport(*logger);
    logger->info("stdin closed, exiting");
    return 0;
}
