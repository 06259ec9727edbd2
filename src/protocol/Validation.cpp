#include "protocol/Validation.h"
#include "jsonrpc/Extractor.h"
#include <sstream>

namespace {
const size_t EXCERPT_LIMIT = 200;

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::string excerpt(const std::string& text) {
    if (text.size() > EXCERPT_LIMIT) {
        return "\"" + text.substr(0, EXCERPT_LIMIT) + "...\" (truncated)";
    }
    return "\"" + text + "\"";
}

const char* SINGLE_RESULT_EXAMPLE =
    "{\n"
    "  \"jsonrpc\": \"2.0\",\n"
    "  \"result\": \"Your message here...\",\n"
    "  \"id\": \"response_id\"\n"
    "}";

const char* SINGLE_TOOL_CALL_EXAMPLE =
    "{\n"
    "  \"jsonrpc\": \"2.0\",\n"
    "  \"method\": \"mcp.tool_call\",\n"
    "  \"params\": {\n"
    "    \"name\": \"tool_name\",\n"
    "    \"parameters\": {...}\n"
    "  },\n"
    "  \"id\": \"tool_call_id\"\n"
    "}";
} // namespace

LlmResponseClassification classifyLlmResponse(const std::string& content) {
    LlmResponseClassification out;
    std::string trimmed = trim(content);

    auto objects = extractJsonRpcObjects(trimmed);
    if (objects.size() > 1) {
        out.kind = LlmResponseClassification::Kind::MultipleJsonRpc;
        for (auto& obj : objects) {
            out.objects.push_back(std::move(obj.value));
        }
        return out;
    }

    if (objects.size() == 1) {
        const auto& obj = objects.front();
        if (obj.start == 0 && obj.end == trimmed.size()) {
            out.kind = LlmResponseClassification::Kind::Valid;
            out.json = obj.value;
            return out;
        }
        out.kind = LlmResponseClassification::Kind::Mixed;
        out.text = trim(trimmed.substr(0, trimmed.find('{')));
        out.json = obj.value;
        return out;
    }

    auto whole = nlohmann::json::parse(trimmed, nullptr, false);
    if (!whole.is_discarded()) {
        out.kind = LlmResponseClassification::Kind::NotJsonRpc;
        out.json = std::move(whole);
        return out;
    }

    if (trimmed.find('{') != std::string::npos && trimmed.find('}') != std::string::npos) {
        out.kind = LlmResponseClassification::Kind::Mixed;
        out.text = trimmed;
        return out;
    }

    out.kind = LlmResponseClassification::Kind::InvalidFormat;
    out.text = trimmed;
    return out;
}

std::string createCorrectionPrompt(const LlmResponseClassification& classification) {
    std::ostringstream ss;
    switch (classification.kind) {
        case LlmResponseClassification::Kind::Valid:
            return "";

        case LlmResponseClassification::Kind::MultipleJsonRpc:
            ss << "Your last response contained multiple JSON-RPC objects (" << classification.objects.size() << "). "
               << "According to the MCP protocol, you should respond with a single JSON-RPC object at a time. "
               << "If you need to perform multiple actions, make one tool call at a time and wait for the result.\n\n"
               << "Please reformat your response as a single JSON-RPC object. For your next response, choose ONE of:\n\n"
               << "1. A text response using:\n" << SINGLE_RESULT_EXAMPLE << "\n\n"
               << "2. OR a single tool call using:\n" << SINGLE_TOOL_CALL_EXAMPLE << "\n\n"
               << "Please respond with just ONE JSON-RPC object.";
            break;

        case LlmResponseClassification::Kind::InvalidFormat:
            ss << "Your last response was not in the required JSON-RPC 2.0 format. "
               << "Please reformat your response according to the MCP protocol. "
               << "Your message should be formatted as a single, valid JSON-RPC object like this:\n\n"
               << SINGLE_RESULT_EXAMPLE << "\n\n"
               << "Your original message content was: " << excerpt(classification.text) << "\n\n"
               << "Please respond ONLY with a valid JSON-RPC object.";
            break;

        case LlmResponseClassification::Kind::Mixed:
            ss << "Your last response mixed regular text with JSON-RPC, which breaks the protocol. "
               << "According to the MCP protocol, you should respond ONLY with a valid JSON-RPC object, "
               << "not with a combination of text and JSON.\n\n"
               << "Your text content was: " << excerpt(classification.text) << "\n\n";
            if (classification.json) {
                ss << "Your JSON part was: " << classification.json->dump(2) << "\n\n";
            }
            ss << "Please respond ONLY with a valid JSON-RPC object for your ENTIRE message:";
            break;

        case LlmResponseClassification::Kind::NotJsonRpc:
            ss << "Your last response was valid JSON but not a valid JSON-RPC 2.0 object. "
               << "According to the MCP protocol, your response must be a single JSON-RPC object "
               << "with the required fields: jsonrpc, result/error, and id.\n\n"
               << "Your JSON was: " << (classification.json ? classification.json->dump(2) : "null") << "\n\n"
               << "Please respond with a proper JSON-RPC object like this:\n\n"
               << SINGLE_RESULT_EXAMPLE;
            break;
    }
    return ss.str();
}

std::optional<RpcError> validateAgainstSchema(const nlohmann::json& value, const nlohmann::json& schema) {
    if (!schema.is_object()) return std::nullopt;

    if (schema.contains("type") && schema["type"].is_string()) {
        std::string type = schema["type"].get<std::string>();
        bool ok = true;
        if (type == "string") ok = value.is_string();
        else if (type == "number") ok = value.is_number();
        else if (type == "integer") ok = value.is_number_integer();
        else if (type == "boolean") ok = value.is_boolean();
        else if (type == "object") ok = value.is_object();
        else if (type == "array") ok = value.is_array();
        else if (type == "null") ok = value.is_null();
        if (!ok) {
            return RpcError::invalidParams();
        }
    }

    if (schema.contains("required") && schema["required"].is_array() && value.is_object()) {
        for (const auto& prop : schema["required"]) {
            if (prop.is_string() && !value.contains(prop.get<std::string>())) {
                return RpcError::invalidParams();
            }
        }
    }

    return std::nullopt;
}
