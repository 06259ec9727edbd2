#include "protocol/Message.h"
#include <limits>
#include <stdexcept>

std::string errorMessage(ErrorCode code) {
    switch (code) {
        case ErrorCode::ParseError: return "Parse error";
        case ErrorCode::InvalidRequest: return "Invalid request";
        case ErrorCode::MethodNotFound: return "Method not found";
        case ErrorCode::InvalidParams: return "Invalid params";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::ServerError: return "Server error";
        case ErrorCode::ResourceNotFound: return "Resource not found";
        case ErrorCode::ResourceAccessDenied: return "Resource access denied";
        case ErrorCode::ToolExecutionFailed: return "Tool execution failed";
        case ErrorCode::InvalidTool: return "Invalid tool";
        case ErrorCode::PromptExecutionFailed: return "Prompt execution failed";
        case ErrorCode::SamplingFailed: return "Sampling failed";
        case ErrorCode::RootNotFound: return "Root not found";
        case ErrorCode::InvalidRoot: return "Invalid root";
    }
    return "Unknown error";
}

std::string JsonRpcId::toString() const {
    if (isNull()) return "null";
    if (isNumber()) return std::to_string(getNumber());
    return getString();
}

RpcError RpcError::fromCode(ErrorCode code, std::optional<nlohmann::json> data) {
    RpcError error;
    error.code = static_cast<int>(code);
    error.message = errorMessage(code);
    error.data = std::move(data);
    return error;
}

RpcError RpcError::resourceNotFound(const std::string& uri) {
    return fromCode(ErrorCode::ResourceNotFound, nlohmann::json(uri));
}

RpcError RpcError::resourceAccessDenied(const std::string& uri) {
    return fromCode(ErrorCode::ResourceAccessDenied, nlohmann::json(uri));
}

RpcError RpcError::toolExecutionFailed(const std::string& toolName, const std::string& reason) {
    return fromCode(ErrorCode::ToolExecutionFailed, nlohmann::json{{"tool", toolName}, {"reason", reason}});
}

RpcError RpcError::invalidTool(const std::string& toolName) {
    return fromCode(ErrorCode::InvalidTool, nlohmann::json(toolName));
}

std::optional<RpcError> validateRequest(const Request& request) {
    if (request.jsonrpc != JSONRPC_VERSION) {
        return RpcError::invalidRequest();
    }
    if (request.method.empty()) {
        return RpcError::invalidRequest();
    }
    return std::nullopt;
}

Response Response::success(nlohmann::json result, JsonRpcId id) {
    Response response;
    response.result = std::move(result);
    response.id = std::move(id);
    return response;
}

Response Response::error(RpcError error, JsonRpcId id) {
    Response response;
    response.rpcError = std::move(error);
    response.id = std::move(id);
    return response;
}

Response Response::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("response must be a JSON object");
    }
    if (!j.contains("id")) {
        throw std::invalid_argument("response is missing 'id'");
    }
    bool hasResult = j.contains("result");
    bool hasError = j.contains("error");
    if (hasResult == hasError) {
        throw std::invalid_argument("response must carry exactly one of 'result' or 'error'");
    }

    Response response;
    response.jsonrpc = j.at("jsonrpc").get<std::string>();
    response.id = j.at("id").get<JsonRpcId>();
    if (hasResult) {
        response.result = j.at("result");
    } else {
        response.rpcError = j.at("error").get<RpcError>();
    }
    return response;
}

void to_json(nlohmann::json& j, const JsonRpcId& id) {
    if (id.isNull()) {
        j = nullptr;
    } else if (id.isNumber()) {
        j = id.getNumber();
    } else {
        j = id.getString();
    }
}

void from_json(const nlohmann::json& j, JsonRpcId& id) {
    if (j.is_null()) {
        id = JsonRpcId::null();
    } else if (j.is_number_integer()) {
        if (j.is_number_unsigned() &&
            j.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw std::invalid_argument("id is out of the signed 64-bit range");
        }
        id = JsonRpcId(j.get<std::int64_t>());
    } else if (j.is_string()) {
        id = JsonRpcId(j.get<std::string>());
    } else {
        throw std::invalid_argument("id must be a string, an integer or null");
    }
}

void to_json(nlohmann::json& j, const RpcError& error) {
    j = nlohmann::json{{"code", error.code}, {"message", error.message}};
    if (error.data) {
        j["data"] = *error.data;
    }
}

void from_json(const nlohmann::json& j, RpcError& error) {
    if (!j.is_object()) {
        throw std::invalid_argument("error must be a JSON object");
    }
    error.code = j.at("code").get<int>();
    error.message = j.at("message").get<std::string>();
    if (j.contains("data")) {
        error.data = j.at("data");
    } else {
        error.data.reset();
    }
}

void to_json(nlohmann::json& j, const Request& request) {
    j = nlohmann::json{{"jsonrpc", request.jsonrpc}, {"method", request.method}};
    if (request.params) {
        j["params"] = *request.params;
    }
    if (request.id) {
        j["id"] = *request.id;
    }
}

void from_json(const nlohmann::json& j, Request& request) {
    if (!j.is_object()) {
        throw std::invalid_argument("request must be a JSON object");
    }
    request.jsonrpc = j.at("jsonrpc").get<std::string>();
    request.method = j.at("method").get<std::string>();
    if (j.contains("params")) {
        request.params = j.at("params");
    } else {
        request.params.reset();
    }
    // "id": null 保留为 null id, 与缺省 id (notification) 区分
    if (j.contains("id")) {
        request.id = j.at("id").get<JsonRpcId>();
    } else {
        request.id.reset();
    }
}

void to_json(nlohmann::json& j, const Response& response) {
    j = nlohmann::json{{"jsonrpc", response.getVersion()}};
    if (response.isSuccess()) {
        j["result"] = response.getResult();
    } else {
        j["error"] = response.getError();
    }
    j["id"] = response.getId();
}

std::optional<Request> parseRequest(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return std::nullopt;
    }
    try {
        return j.get<Request>();
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

std::optional<Response> parseResponse(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return std::nullopt;
    }
    try {
        return Response::fromJson(j);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

std::string serializeRequest(const Request& request) {
    return nlohmann::json(request).dump();
}

std::string serializeResponse(const Response& response) {
    return nlohmann::json(response).dump();
}
