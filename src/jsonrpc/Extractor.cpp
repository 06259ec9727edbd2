#include "jsonrpc/Extractor.h"

namespace {
std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}
} // namespace

std::vector<ExtractedObject> extractJsonRpcObjects(const std::string& text) {
    std::vector<ExtractedObject> objects;
    size_t searchFrom = 0;

    while (true) {
        size_t start = text.find('{', searchFrom);
        if (start == std::string::npos) break;

        // 花括号都是 ASCII, 按字节扫描不会误伤 UTF-8 多字节字符
        int depth = 0;
        size_t end = std::string::npos;
        for (size_t i = start; i < text.size(); ++i) {
            char c = text[i];
            if (c == '{') {
                depth++;
            } else if (c == '}') {
                depth--;
                if (depth == 0) {
                    end = i + 1;
                    break;
                }
            }
        }

        if (end == std::string::npos) {
            // 未闭合: 返回已有结果
            break;
        }

        auto candidate = nlohmann::json::parse(text.begin() + start, text.begin() + end, nullptr, false);
        if (!candidate.is_discarded() && candidate.is_object() && candidate.contains("jsonrpc")) {
            objects.push_back({std::move(candidate), start, end});
        }

        searchFrom = end;
    }

    return objects;
}

SplitContent splitJsonRpcAndText(const std::string& text) {
    SplitContent split;
    split.original = text;

    auto objects = extractJsonRpcObjects(text);
    if (objects.empty()) {
        split.textSegments.push_back(text);
        return split;
    }

    size_t cursor = 0;
    for (auto& obj : objects) {
        if (obj.start > cursor) {
            std::string segment = trim(text.substr(cursor, obj.start - cursor));
            if (!segment.empty()) {
                split.textSegments.push_back(std::move(segment));
            }
        }
        split.jsonObjects.push_back(std::move(obj.value));
        cursor = obj.end;
    }

    if (cursor < text.size()) {
        std::string tail = trim(text.substr(cursor));
        if (!tail.empty()) {
            split.textSegments.push_back(std::move(tail));
        }
    }
    return split;
}

std::string filterToolCalls(const std::string& text, const std::string& placeholder) {
    auto objects = extractJsonRpcObjects(text);
    if (objects.empty()) return text;

    std::string out;
    out.reserve(text.size());
    size_t cursor = 0;
    for (const auto& obj : objects) {
        const auto& value = obj.value;
        bool isToolCall = value.contains("method") && value["method"].is_string() &&
                          value["method"].get<std::string>() == TOOL_CALL_METHOD;
        if (!isToolCall) continue;

        out.append(text, cursor, obj.start - cursor);
        out += placeholder;
        cursor = obj.end;
    }
    out.append(text, cursor, std::string::npos);
    return out;
}
