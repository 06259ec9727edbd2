#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/ConversationContext.h"

struct LlmToolCall {
    std::string id;
    std::string tool;
    nlohmann::json params;
};

struct LlmResponse {
    std::string id;
    std::string content;
    std::vector<LlmToolCall> toolCalls;
};

struct StreamChunk {
    std::string id;
    std::string content;
    bool isToolCall = false;
    std::optional<LlmToolCall> toolCall;
    bool isComplete = false;
};

/**
 * @brief 模型客户端接口
 *
 * 具体厂商的实现 (HTTP、流式协议) 不在本仓库内; 运行时只通过这个接口调用。
 * 失败时抛出 std::runtime_error。
 */
class LLMClient {
public:
    using ChunkCallback = std::function<void(const StreamChunk&)>;

    virtual ~LLMClient() = default;

    virtual LlmResponse sendMessage(const ConversationContext& context) = 0;

    /**
     * @brief 流式请求; onChunk 按到达顺序调用, 最后一块 isComplete == true
     */
    virtual void streamMessage(const ConversationContext& context, const ChunkCallback& onChunk) = 0;

    /**
     * @brief 取消进行中的请求; 未知 id 忽略
     */
    virtual void cancelRequest(const std::string& requestId) = 0;
};
