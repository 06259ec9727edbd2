#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

/**
 * @brief JSON-RPC 2.0 消息模型
 *
 * Request / Response / RpcError 三种结构以及它们与 nlohmann::json 之间的转换。
 * 序列化与解析互为逆运算: parse(serialize(x)) == x。
 */

inline constexpr const char* JSONRPC_VERSION = "2.0";

/**
 * @brief 错误码
 *
 * -32700 ~ -32000 为 JSON-RPC 标准错误; -33000 ~ -33007 为 MCP 扩展错误。
 */
enum class ErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    ServerError = -32000,

    ResourceNotFound = -33000,
    ResourceAccessDenied = -33001,
    ToolExecutionFailed = -33002,
    InvalidTool = -33003,
    PromptExecutionFailed = -33004,
    SamplingFailed = -33005,
    RootNotFound = -33006,
    InvalidRoot = -33007
};

// tools.execute 在工具层自身失败时使用的领域错误码 (不属于标准错误表)
inline constexpr int TOOL_LAYER_FAILURE_CODE = 1000;

/**
 * @brief 错误码对应的固定消息
 */
std::string errorMessage(ErrorCode code);

// optional<json> 的逐值比较 (避免 optional 与 json 隐式转换带来的重载歧义)
inline bool sameOptionalJson(const std::optional<nlohmann::json>& a, const std::optional<nlohmann::json>& b) {
    if (a.has_value() != b.has_value()) return false;
    return !a.has_value() || *a == *b;
}

/**
 * @brief 请求 ID: string / int64 / null 三选一
 */
class JsonRpcId {
public:
    using Value = std::variant<std::nullptr_t, std::int64_t, std::string>;

    JsonRpcId() : value(nullptr) {}
    JsonRpcId(std::int64_t number) : value(number) {}
    JsonRpcId(int number) : value(static_cast<std::int64_t>(number)) {}
    JsonRpcId(std::string text) : value(std::move(text)) {}
    JsonRpcId(const char* text) : value(std::string(text)) {}

    static JsonRpcId null() { return JsonRpcId(); }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isNumber() const { return std::holds_alternative<std::int64_t>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }

    std::int64_t getNumber() const { return std::get<std::int64_t>(value); }
    const std::string& getString() const { return std::get<std::string>(value); }
    const Value& getValue() const { return value; }

    // 用于日志: 字符串原样输出, 数字转十进制, null 输出 "null"
    std::string toString() const;

    bool operator==(const JsonRpcId& other) const { return value == other.value; }
    bool operator!=(const JsonRpcId& other) const { return !(*this == other); }

private:
    Value value;
};

struct RpcError {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;

    static RpcError fromCode(ErrorCode code, std::optional<nlohmann::json> data = std::nullopt);

    static RpcError parseError() { return fromCode(ErrorCode::ParseError); }
    static RpcError invalidRequest() { return fromCode(ErrorCode::InvalidRequest); }
    static RpcError methodNotFound() { return fromCode(ErrorCode::MethodNotFound); }
    static RpcError invalidParams() { return fromCode(ErrorCode::InvalidParams); }
    static RpcError internalError() { return fromCode(ErrorCode::InternalError); }
    static RpcError serverError(std::optional<nlohmann::json> data = std::nullopt) {
        return fromCode(ErrorCode::ServerError, std::move(data));
    }

    static RpcError resourceNotFound(const std::string& uri);
    static RpcError resourceAccessDenied(const std::string& uri);
    static RpcError toolExecutionFailed(const std::string& toolName, const std::string& reason);
    static RpcError invalidTool(const std::string& toolName);

    bool operator==(const RpcError& other) const {
        return code == other.code && message == other.message && sameOptionalJson(data, other.data);
    }
    bool operator!=(const RpcError& other) const { return !(*this == other); }
};

struct Request {
    std::string jsonrpc = JSONRPC_VERSION;
    std::string method;
    std::optional<nlohmann::json> params;
    // 缺省 id 表示 notification
    std::optional<JsonRpcId> id;

    Request() = default;
    Request(std::string method, std::optional<nlohmann::json> params = std::nullopt,
            std::optional<JsonRpcId> id = std::nullopt)
        : method(std::move(method)), params(std::move(params)), id(std::move(id)) {}

    bool isNotification() const { return !id.has_value(); }

    // 错误响应绑定的 id: 有则用原 id, 否则为 null
    JsonRpcId responseId() const { return id.value_or(JsonRpcId::null()); }

    bool operator==(const Request& other) const {
        return jsonrpc == other.jsonrpc && method == other.method &&
               sameOptionalJson(params, other.params) && id == other.id;
    }
    bool operator!=(const Request& other) const { return !(*this == other); }
};

/**
 * @brief 校验请求
 * @return 通过返回 std::nullopt, 否则返回 InvalidRequest
 *
 * 版本号必须严格等于 "2.0", method 不能为空字符串。
 */
std::optional<RpcError> validateRequest(const Request& request);

/**
 * @brief JSON-RPC 响应
 *
 * result 与 error 恰好存在一个, 只能通过工厂函数构造。
 */
class Response {
public:
    static Response success(nlohmann::json result, JsonRpcId id);
    static Response error(RpcError error, JsonRpcId id);

    static Response parseError(JsonRpcId id) { return error(RpcError::parseError(), std::move(id)); }
    static Response invalidRequest(JsonRpcId id) { return error(RpcError::invalidRequest(), std::move(id)); }
    static Response methodNotFound(JsonRpcId id) { return error(RpcError::methodNotFound(), std::move(id)); }
    static Response invalidParams(JsonRpcId id) { return error(RpcError::invalidParams(), std::move(id)); }
    static Response internalError(JsonRpcId id) { return error(RpcError::internalError(), std::move(id)); }

    /**
     * @brief 从 JSON 还原响应
     * @throws std::invalid_argument 结构不符 (缺少 id / result 与 error 同时存在或都不存在)
     * @throws nlohmann::json::exception 字段类型错误
     */
    static Response fromJson(const nlohmann::json& j);

    bool isSuccess() const { return result.has_value(); }
    bool isError() const { return rpcError.has_value(); }

    const std::string& getVersion() const { return jsonrpc; }
    const nlohmann::json& getResult() const { return *result; }
    const RpcError& getError() const { return *rpcError; }
    const JsonRpcId& getId() const { return id; }

    bool operator==(const Response& other) const {
        return jsonrpc == other.jsonrpc && sameOptionalJson(result, other.result) &&
               rpcError == other.rpcError && id == other.id;
    }
    bool operator!=(const Response& other) const { return !(*this == other); }

private:
    Response() = default;

    std::string jsonrpc = JSONRPC_VERSION;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> rpcError;
    JsonRpcId id;
};

// ---- nlohmann::json 转换 (ADL) ----
// 结构错误抛出 std::invalid_argument, 字段类型错误抛出 nlohmann::json::exception

void to_json(nlohmann::json& j, const JsonRpcId& id);
void from_json(const nlohmann::json& j, JsonRpcId& id);

void to_json(nlohmann::json& j, const RpcError& error);
void from_json(const nlohmann::json& j, RpcError& error);

void to_json(nlohmann::json& j, const Request& request);
void from_json(const nlohmann::json& j, Request& request);

void to_json(nlohmann::json& j, const Response& response);

/**
 * @brief 文本级便捷函数
 *
 * parse* 在 JSON 语法错误或结构不符时返回 std::nullopt;
 * serialize 在输出无法编码 (例如非法 UTF-8) 时抛出 nlohmann::json::type_error。
 */
std::optional<Request> parseRequest(const std::string& text);
std::optional<Response> parseResponse(const std::string& text);
std::string serializeRequest(const Request& request);
std::string serializeResponse(const Response& response);
