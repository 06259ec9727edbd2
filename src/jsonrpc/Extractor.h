#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief 文本中嵌入的一个 JSON-RPC 对象
 *
 * [start, end) 为它在原始文本中的字节偏移。
 */
struct ExtractedObject {
    nlohmann::json value;
    size_t start = 0;
    size_t end = 0;
};

/**
 * @brief 从模型输出中提取嵌入的 JSON-RPC 对象
 *
 * 扫描每个尚未消费的 '{', 按花括号深度找到配对的 '}' 作为候选片段;
 * 候选能解析为 JSON 且含有 "jsonrpc" 键时才保留, 否则丢弃并从片段末尾继续扫描
 * (不会再把片段内部当作嵌套内容重试)。找不到配对的 '}' 时停止扫描,
 * 返回已收集的结果。
 *
 * 注意: 深度计数不识别字符串字面量, 字符串值里的 '{' / '}' 会影响边界判断。
 */
std::vector<ExtractedObject> extractJsonRpcObjects(const std::string& text);

/**
 * @brief 文本与 JSON-RPC 对象拆分结果
 */
struct SplitContent {
    std::string original;
    // 对象之间的叙述文本 (已去除首尾空白, 空段落被丢弃)
    std::vector<std::string> textSegments;
    std::vector<nlohmann::json> jsonObjects;
};

SplitContent splitJsonRpcAndText(const std::string& text);

inline const char* const TOOL_CALL_PLACEHOLDER = "[Tool command detected and executed]";
inline const char* const TOOL_CALL_METHOD = "mcp.tool_call";

/**
 * @brief 把面向用户的输出中的工具调用对象替换为占位符
 *
 * 只替换 method 为 "mcp.tool_call" 的对象, 其余文本原样保留。
 */
std::string filterToolCalls(const std::string& text, const std::string& placeholder = TOOL_CALL_PLACEHOLDER);
