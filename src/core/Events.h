#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/ConversationContext.h"

enum class ScrollDirection {
    Up,
    Down
};

struct KeyEvent {
    std::string code;
    std::vector<std::string> modifiers;
};

/**
 * @brief 终端界面产生的事件
 */
struct UiEvent {
    enum class Type {
        KeyPress,
        UserInput,
        RequestCancellation,
        Quit,
        Scroll,
        ClearConversation,
        ToggleFocus
    };

    Type type = Type::Quit;
    KeyEvent key;                 // KeyPress
    std::string text;             // UserInput
    ScrollDirection direction = ScrollDirection::Down;  // Scroll
    std::uint16_t amount = 0;     // Scroll

    static UiEvent keyPress(KeyEvent key) {
        UiEvent e{Type::KeyPress};
        e.key = std::move(key);
        return e;
    }
    static UiEvent userInput(std::string text) {
        UiEvent e{Type::UserInput};
        e.text = std::move(text);
        return e;
    }
    static UiEvent requestCancellation() { return UiEvent{Type::RequestCancellation}; }
    static UiEvent quit() { return UiEvent{Type::Quit}; }
    static UiEvent scroll(ScrollDirection direction, std::uint16_t amount) {
        UiEvent e{Type::Scroll};
        e.direction = direction;
        e.amount = amount;
        return e;
    }
    static UiEvent clearConversation() { return UiEvent{Type::ClearConversation}; }
    static UiEvent toggleFocus() { return UiEvent{Type::ToggleFocus}; }
};

/**
 * @brief 会话模型相关事件
 *
 * text 的含义随类型变化: 用户消息、模型回复、流式片段。
 */
struct ModelEvent {
    enum class Type {
        ProcessUserMessage,
        ToolResult,
        ResetContext,
        LlmMessage,
        LlmStreamChunk,
        UpdateContext,
        ToolRequest,
        LlmResponseComplete
    };

    Type type = Type::ResetContext;
    std::string text;
    std::string toolName;         // ToolResult / ToolRequest
    nlohmann::json payload;       // ToolResult: 结果; ToolRequest: 参数
    std::shared_ptr<const ConversationContext> context;  // UpdateContext

    static ModelEvent processUserMessage(std::string text) {
        ModelEvent e{Type::ProcessUserMessage};
        e.text = std::move(text);
        return e;
    }
    static ModelEvent toolResult(std::string toolName, nlohmann::json result) {
        ModelEvent e{Type::ToolResult};
        e.toolName = std::move(toolName);
        e.payload = std::move(result);
        return e;
    }
    static ModelEvent resetContext() { return ModelEvent{Type::ResetContext}; }
    static ModelEvent llmMessage(std::string text) {
        ModelEvent e{Type::LlmMessage};
        e.text = std::move(text);
        return e;
    }
    static ModelEvent llmStreamChunk(std::string chunk) {
        ModelEvent e{Type::LlmStreamChunk};
        e.text = std::move(chunk);
        return e;
    }
    static ModelEvent updateContext(std::shared_ptr<const ConversationContext> context) {
        ModelEvent e{Type::UpdateContext};
        e.context = std::move(context);
        return e;
    }
    static ModelEvent toolRequest(std::string toolName, nlohmann::json params) {
        ModelEvent e{Type::ToolRequest};
        e.toolName = std::move(toolName);
        e.payload = std::move(params);
        return e;
    }
    // text 为完整回复; 流式场景下可为空, 表示回复已由 LlmStreamChunk 累积
    static ModelEvent llmResponseComplete(std::string text = "") {
        ModelEvent e{Type::LlmResponseComplete};
        e.text = std::move(text);
        return e;
    }
};

/**
 * @brief 与模型服务通信相关的事件
 *
 * text: SendRequest 的请求内容、ProcessStream 的流 id、CancelRequest 的请求 id、
 * ConnectionLost / Error 的原因。
 */
struct ApiEvent {
    enum class Type {
        SendRequest,
        ProcessStream,
        CancelRequest,
        ConnectionEstablished,
        ConnectionLost,
        Error
    };

    Type type = Type::Error;
    std::string text;

    static ApiEvent sendRequest(std::string content) { return {Type::SendRequest, std::move(content)}; }
    static ApiEvent processStream(std::string streamId) { return {Type::ProcessStream, std::move(streamId)}; }
    static ApiEvent cancelRequest(std::string requestId) { return {Type::CancelRequest, std::move(requestId)}; }
    static ApiEvent connectionEstablished() { return {Type::ConnectionEstablished, ""}; }
    static ApiEvent connectionLost(std::string reason) { return {Type::ConnectionLost, std::move(reason)}; }
    static ApiEvent error(std::string message) { return {Type::Error, std::move(message)}; }
};

/**
 * @brief 三类事件的统一包装, EventBus::publish 按类型路由到对应通道
 */
using Event = std::variant<UiEvent, ModelEvent, ApiEvent>;
