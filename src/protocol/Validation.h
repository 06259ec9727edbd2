#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/Message.h"

/**
 * @brief 模型回复的格式判定结果
 *
 * - Valid: 整段回复 (去掉首尾空白) 恰好是一个 JSON-RPC 对象
 * - Mixed: 叙述文本夹带了一个 JSON-RPC 对象, 或夹带了无法解析的花括号片段
 * - MultipleJsonRpc: 包含多个 JSON-RPC 对象
 * - NotJsonRpc: 是合法 JSON, 但不是 JSON-RPC
 * - InvalidFormat: 纯文本
 */
struct LlmResponseClassification {
    enum class Kind {
        Valid,
        Mixed,
        MultipleJsonRpc,
        NotJsonRpc,
        InvalidFormat
    };

    Kind kind = Kind::InvalidFormat;
    // Mixed: 第一个对象之前的文本; InvalidFormat: 全部文本
    std::string text;
    // Valid / Mixed / NotJsonRpc 时为对应的 JSON (Mixed 可能为空)
    std::optional<nlohmann::json> json;
    // MultipleJsonRpc 时的全部对象
    std::vector<nlohmann::json> objects;
};

LlmResponseClassification classifyLlmResponse(const std::string& content);

/**
 * @brief 生成发回给模型的纠正提示
 * @return Valid 时返回空字符串
 */
std::string createCorrectionPrompt(const LlmResponseClassification& classification);

/**
 * @brief 按 JSON Schema 的 "type" 与 "required" 做顶层校验
 * @return 通过返回 std::nullopt, 否则返回 InvalidParams
 */
std::optional<RpcError> validateAgainstSchema(const nlohmann::json& value, const nlohmann::json& schema);
