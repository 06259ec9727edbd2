#pragma once
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "core/ConversationContext.h"
#include "core/EventBus.h"
#include "core/LLMClient.h"
#include "mcp/MethodDispatcher.h"
#include "tools/ToolCoordinator.h"
#include "utils/Logger.h"

/**
 * @brief Agent 运行时 - 把事件总线、方法分发器和工具协调器连起来
 *
 * Model 通道:
 * - ProcessUserMessage: 新一轮开始, 清空指纹, 记录用户消息, 发布 API SendRequest
 * - LlmStreamChunk: 累积到缓冲区
 * - LlmMessage / LlmResponseComplete: 记录助手消息, 提取其中的 JSON-RPC 请求;
 *   mcp.tool_call 经去重、取消检查和单轮上限后, 在工作线程上以 tools.execute 分发,
 *   结果以 Model ToolResult 发布; 其他请求原样分发
 * - ResetContext: 清空上下文与指纹
 *
 * UI 通道: UserInput 转成 ProcessUserMessage, RequestCancellation 取消当前请求,
 * ClearConversation 转成 ResetContext。
 * API 通道: SendRequest 在工作线程上调用 LLMClient::streamMessage, CancelRequest 取消指定请求。
 *
 * 取消只阻止之后的调度, 不中断已在运行的工具。
 * 析构时关闭事件总线并等待工作线程结束。
 */
class AgentRuntime {
public:
    AgentRuntime(std::shared_ptr<EventBus> bus,
                 std::shared_ptr<MethodDispatcher> dispatcher,
                 std::shared_ptr<ToolCoordinator> coordinator,
                 std::shared_ptr<LLMClient> llmClient,
                 const Config& config,
                 std::shared_ptr<Logger> logger = nullptr);
    ~AgentRuntime();

    AgentRuntime(const AgentRuntime&) = delete;
    AgentRuntime& operator=(const AgentRuntime&) = delete;

    /**
     * @brief 在总线上注册三个通道的处理函数; 重复调用无效果
     */
    void attach();

    ConversationContext getContext() const;

    bool isCancelled(const std::string& requestId) const;

    size_t getToolCallsThisTurn() const;

    /**
     * @brief 等待当前已调度的工具调用和模型请求全部结束
     */
    void waitForPendingTasks();

private:
    void onUiEvent(const UiEvent& event);
    void onModelEvent(const ModelEvent& event);
    void onApiEvent(const ApiEvent& event);

    void beginTurn(const std::string& userMessage);
    void handleModelOutput(const std::string& text);
    void handleToolCall(const Request& request);
    void handleOtherRequest(const Request& request);
    void resetContext();
    void cancel(const std::string& requestId);
    void sendToModel();

    void spawn(std::function<void()> task);

    std::shared_ptr<EventBus> bus;
    std::shared_ptr<MethodDispatcher> dispatcher;
    std::shared_ptr<ToolCoordinator> coordinator;
    std::shared_ptr<LLMClient> llmClient;
    Config config;
    std::shared_ptr<Logger> logger;

    mutable std::mutex mtx;
    ConversationContext context;
    std::set<std::string> cancelledRequests;
    std::string streamBuffer;
    size_t toolCallsThisTurn = 0;
    size_t requestCounter = 0;
    bool attached = false;

    std::mutex tasksMtx;
    std::vector<std::future<void>> tasks;
};
