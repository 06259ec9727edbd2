#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class MessageRole {
    System,
    User,
    Assistant,
    Tool
};

NLOHMANN_JSON_SERIALIZE_ENUM(MessageRole, {
    {MessageRole::System, "system"},
    {MessageRole::User, "user"},
    {MessageRole::Assistant, "assistant"},
    {MessageRole::Tool, "tool"},
})

struct ToolCallRecord {
    std::string toolId;
    nlohmann::json parameters;
};

struct ToolResultRecord {
    std::string toolId;
    nlohmann::json result;
};

struct ContextMessage {
    MessageRole role = MessageRole::User;
    std::string content;
    std::optional<std::vector<ToolCallRecord>> toolCalls;
    std::optional<std::vector<ToolResultRecord>> toolResults;
};

/**
 * @brief 一次会话的上下文: 系统提示 + 按顺序的消息
 *
 * 不加锁; 由 AgentRuntime 在自己的锁下读写, 交给 LLMClient 的是拷贝。
 */
class ConversationContext {
public:
    std::string systemPrompt;
    std::vector<ContextMessage> messages;
    std::optional<std::string> currentRequestId;

    ConversationContext() = default;
    explicit ConversationContext(std::string systemPrompt) : systemPrompt(std::move(systemPrompt)) {}

    void addUserMessage(const std::string& content) {
        messages.push_back({MessageRole::User, content, std::nullopt, std::nullopt});
    }

    void addAssistantMessage(const std::string& content, std::vector<ToolCallRecord> toolCalls = {}) {
        ContextMessage msg{MessageRole::Assistant, content, std::nullopt, std::nullopt};
        if (!toolCalls.empty()) {
            msg.toolCalls = std::move(toolCalls);
        }
        messages.push_back(std::move(msg));
    }

    void addToolResult(const std::string& toolId, const nlohmann::json& result) {
        ContextMessage msg{MessageRole::Tool, result.dump(), std::nullopt, std::nullopt};
        msg.toolResults = std::vector<ToolResultRecord>{{toolId, result}};
        messages.push_back(std::move(msg));
    }

    /**
     * @brief 清空消息与当前请求, 保留系统提示
     */
    void clear() {
        messages.clear();
        currentRequestId.reset();
    }

    bool empty() const { return messages.empty(); }
};

inline void to_json(nlohmann::json& j, const ToolCallRecord& c) {
    j = nlohmann::json{{"tool_id", c.toolId}, {"parameters", c.parameters}};
}

inline void to_json(nlohmann::json& j, const ToolResultRecord& r) {
    j = nlohmann::json{{"tool_id", r.toolId}, {"result", r.result}};
}

inline void to_json(nlohmann::json& j, const ContextMessage& m) {
    j = nlohmann::json{{"role", m.role}, {"content", m.content}};
    if (m.toolCalls) j["tool_calls"] = *m.toolCalls;
    if (m.toolResults) j["tool_results"] = *m.toolResults;
}

inline void to_json(nlohmann::json& j, const ConversationContext& ctx) {
    j = nlohmann::json{{"system_prompt", ctx.systemPrompt}, {"messages", ctx.messages}};
    if (ctx.currentRequestId) {
        j["current_request_id"] = *ctx.currentRequestId;
    } else {
        j["current_request_id"] = nullptr;
    }
}
