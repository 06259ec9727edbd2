#include "mcp/MethodDispatcher.h"
#include <algorithm>
#include <mutex>
#include <stdexcept>

MethodDispatcher::MethodDispatcher(std::shared_ptr<Logger> logger)
    : logger(logger ? std::move(logger) : Logger::null()) {}

void MethodDispatcher::registerMethod(const std::string& name, Handler handler) {
    auto shared = std::make_shared<const Handler>(std::move(handler));
    {
        std::unique_lock<std::shared_mutex> lock(mtx);
        methods[name] = std::move(shared);
    }
    logger->debug("Registered method: " + name);
}

bool MethodDispatcher::deregisterMethod(const std::string& name) {
    size_t erased = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mtx);
        erased = methods.erase(name);
    }
    if (erased > 0) {
        logger->debug("Deregistered method: " + name);
    }
    return erased > 0;
}

bool MethodDispatcher::hasMethod(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    return methods.count(name) > 0;
}

std::vector<std::string> MethodDispatcher::listMethods() const {
    std::vector<std::string> names;
    {
        std::shared_lock<std::shared_mutex> lock(mtx);
        names.reserve(methods.size());
        for (const auto& [name, _] : methods) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

Response MethodDispatcher::process(const Request& request) const {
    JsonRpcId id = request.responseId();

    if (auto err = validateRequest(request)) {
        logger->warn("Invalid request: method='" + request.method + "'");
        return Response::error(*err, id);
    }

    std::shared_ptr<const Handler> handler;
    {
        std::shared_lock<std::shared_mutex> lock(mtx);
        auto it = methods.find(request.method);
        if (it != methods.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        logger->warn("Method not found: " + request.method);
        return Response::methodNotFound(id);
    }

    logger->trace("Dispatching " + request.method + " (id " + id.toString() + ")");
    try {
        return (*handler)(request);
    } catch (const std::exception& e) {
        logger->error("Method " + request.method + " threw: " + e.what());
        return Response::error(RpcError::fromCode(ErrorCode::InternalError, nlohmann::json(e.what())), id);
    } catch (...) {
        logger->error("Method " + request.method + " threw a non-standard exception");
        return Response::error(RpcError::fromCode(ErrorCode::InternalError, nlohmann::json("Unknown error")), id);
    }
}

std::string MethodDispatcher::processJson(const std::string& text) const {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        logger->warn("Parse error on incoming message");
        return serializeResponse(Response::parseError(JsonRpcId::null()));
    }

    Request request;
    try {
        request = j.get<Request>();
    } catch (const nlohmann::json::exception& e) {
        logger->warn(std::string("Incoming JSON is not a request: ") + e.what());
        return serializeResponse(Response::parseError(JsonRpcId::null()));
    } catch (const std::invalid_argument& e) {
        logger->warn(std::string("Incoming JSON is not a request: ") + e.what());
        return serializeResponse(Response::parseError(JsonRpcId::null()));
    }

    Response response = process(request);
    try {
        return serializeResponse(response);
    } catch (const nlohmann::json::exception& e) {
        logger->error(std::string("Failed to serialize response: ") + e.what());
        return nlohmann::json(Response::internalError(request.responseId()))
            .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
}
