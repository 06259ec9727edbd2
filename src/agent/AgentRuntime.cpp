#include "agent/AgentRuntime.h"
#include "jsonrpc/Extractor.h"
#include "mcp/ToolMethods.h"
#include <algorithm>
#include <chrono>
#include <stdexcept>

AgentRuntime::AgentRuntime(std::shared_ptr<EventBus> bus,
                           std::shared_ptr<MethodDispatcher> dispatcher,
                           std::shared_ptr<ToolCoordinator> coordinator,
                           std::shared_ptr<LLMClient> llmClient,
                           const Config& config,
                           std::shared_ptr<Logger> logger)
    : bus(std::move(bus)),
      dispatcher(std::move(dispatcher)),
      coordinator(std::move(coordinator)),
      llmClient(std::move(llmClient)),
      config(config),
      logger(logger ? std::move(logger) : Logger::null()),
      context(config.agent.systemPrompt) {}

AgentRuntime::~AgentRuntime() {
    // 先停掉分发线程, 保证之后不会再有处理函数访问 this
    bus->shutdown();
    waitForPendingTasks();
}

void AgentRuntime::attach() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (attached) return;
        attached = true;
    }
    bus->registerUiHandler([this](const UiEvent& e) { onUiEvent(e); });
    bus->registerModelHandler([this](const ModelEvent& e) { onModelEvent(e); });
    bus->registerApiHandler([this](const ApiEvent& e) { onApiEvent(e); });
}

ConversationContext AgentRuntime::getContext() const {
    std::lock_guard<std::mutex> lock(mtx);
    return context;
}

bool AgentRuntime::isCancelled(const std::string& requestId) const {
    std::lock_guard<std::mutex> lock(mtx);
    return cancelledRequests.count(requestId) > 0;
}

size_t AgentRuntime::getToolCallsThisTurn() const {
    std::lock_guard<std::mutex> lock(mtx);
    return toolCallsThisTurn;
}

void AgentRuntime::spawn(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(tasksMtx);
    // 顺手回收已完成的任务
    tasks.erase(std::remove_if(tasks.begin(), tasks.end(), [](std::future<void>& f) {
        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }), tasks.end());
    tasks.push_back(std::async(std::launch::async, std::move(task)));
}

void AgentRuntime::waitForPendingTasks() {
    while (true) {
        std::vector<std::future<void>> batch;
        {
            std::lock_guard<std::mutex> lock(tasksMtx);
            batch.swap(tasks);
        }
        if (batch.empty()) return;
        for (auto& f : batch) {
            f.wait();
        }
    }
}

// ========== 事件处理 ==========

void AgentRuntime::onUiEvent(const UiEvent& event) {
    switch (event.type) {
        case UiEvent::Type::UserInput:
            bus->publish(ModelEvent::processUserMessage(event.text));
            break;
        case UiEvent::Type::RequestCancellation: {
            std::optional<std::string> current;
            {
                std::lock_guard<std::mutex> lock(mtx);
                current = context.currentRequestId;
            }
            if (current) {
                cancel(*current);
            } else {
                logger->debug("Cancellation requested with no active request");
            }
            break;
        }
        case UiEvent::Type::ClearConversation:
            bus->publish(ModelEvent::resetContext());
            break;
        default:
            break;
    }
}

void AgentRuntime::onModelEvent(const ModelEvent& event) {
    switch (event.type) {
        case ModelEvent::Type::ProcessUserMessage:
            beginTurn(event.text);
            break;
        case ModelEvent::Type::LlmStreamChunk: {
            std::lock_guard<std::mutex> lock(mtx);
            streamBuffer += event.text;
            break;
        }
        case ModelEvent::Type::LlmMessage:
            handleModelOutput(event.text);
            break;
        case ModelEvent::Type::LlmResponseComplete: {
            std::string full = event.text;
            {
                std::lock_guard<std::mutex> lock(mtx);
                if (full.empty()) full = streamBuffer;
                streamBuffer.clear();
            }
            handleModelOutput(full);
            break;
        }
        case ModelEvent::Type::ResetContext:
            resetContext();
            break;
        case ModelEvent::Type::ToolResult:
            logger->debug("Tool result published for " + event.toolName);
            break;
        default:
            break;
    }
}

void AgentRuntime::onApiEvent(const ApiEvent& event) {
    switch (event.type) {
        case ApiEvent::Type::SendRequest:
            sendToModel();
            break;
        case ApiEvent::Type::CancelRequest:
            cancel(event.text);
            break;
        case ApiEvent::Type::ConnectionLost:
            logger->warn("API connection lost: " + event.text);
            break;
        case ApiEvent::Type::Error:
            logger->error("API error: " + event.text);
            break;
        default:
            break;
    }
}

// ========== 轮次 ==========

void AgentRuntime::beginTurn(const std::string& userMessage) {
    coordinator->clear();
    {
        std::lock_guard<std::mutex> lock(mtx);
        context.addUserMessage(userMessage);
        context.currentRequestId = "req-" + std::to_string(++requestCounter);
        toolCallsThisTurn = 0;
        streamBuffer.clear();
    }
    logger->info("New turn started");
    if (!bus->publish(ApiEvent::sendRequest(userMessage))) {
        logger->error("API channel closed, request dropped");
    }
}

void AgentRuntime::sendToModel() {
    if (!llmClient) {
        logger->warn("No LLM client configured, request not sent");
        return;
    }

    ConversationContext snapshot = getContext();
    std::string requestId = snapshot.currentRequestId.value_or("");

    spawn([this, snapshot, requestId]() {
        if (isCancelled(requestId)) return;
        try {
            llmClient->streamMessage(snapshot, [this, &requestId](const StreamChunk& chunk) {
                if (isCancelled(requestId)) return;
                if (!chunk.content.empty()) {
                    bus->publish(ModelEvent::llmStreamChunk(chunk.content));
                }
                if (chunk.isComplete) {
                    bus->publish(ModelEvent::llmResponseComplete());
                }
            });
        } catch (const std::exception& e) {
            logger->error(std::string("LLM request failed: ") + e.what());
            bus->publish(ApiEvent::error(e.what()));
        }
    });
}

void AgentRuntime::handleModelOutput(const std::string& text) {
    if (text.empty()) return;

    auto objects = extractJsonRpcObjects(text);
    std::vector<ToolCallRecord> toolCalls;
    std::vector<Request> requests;

    for (const auto& obj : objects) {
        // 模型回复里的 result/error 对象不是请求
        if (!obj.value.contains("method")) continue;

        Request request;
        try {
            request = obj.value.get<Request>();
        } catch (const nlohmann::json::exception& e) {
            logger->warn(std::string("Skipping malformed embedded request: ") + e.what());
            continue;
        } catch (const std::invalid_argument& e) {
            logger->warn(std::string("Skipping malformed embedded request: ") + e.what());
            continue;
        }

        if (request.method == TOOL_CALL_METHOD && request.params && request.params->is_object()) {
            const auto& p = *request.params;
            if (p.contains("name") && p["name"].is_string()) {
                toolCalls.push_back({p["name"].get<std::string>(), p.value("parameters", nlohmann::json::object())});
            }
        }
        requests.push_back(std::move(request));
    }

    {
        std::lock_guard<std::mutex> lock(mtx);
        context.addAssistantMessage(text, toolCalls);
    }

    for (const auto& request : requests) {
        if (request.method == TOOL_CALL_METHOD) {
            handleToolCall(request);
        } else {
            handleOtherRequest(request);
        }
    }
}

void AgentRuntime::handleToolCall(const Request& request) {
    if (!request.params || !request.params->is_object() ||
        !request.params->contains("name") || !(*request.params)["name"].is_string()) {
        logger->warn("Tool call without a tool name, skipped");
        return;
    }

    std::string toolName = (*request.params)["name"].get<std::string>();
    nlohmann::json parameters = request.params->value("parameters", nlohmann::json::object());

    std::string turnId;
    {
        std::lock_guard<std::mutex> lock(mtx);
        turnId = context.currentRequestId.value_or("");
        if (cancelledRequests.count(turnId) ||
            (request.id && cancelledRequests.count(request.id->toString()))) {
            logger->info("Request cancelled, tool call skipped: " + toolName);
            return;
        }
    }

    if (config.tools.dedupEnabled && !coordinator->shouldExecute(toolName, parameters)) {
        logger->info("Duplicate tool call skipped: " + toolName);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mtx);
        if (toolCallsThisTurn >= config.agent.maxToolCallsPerTurn) {
            logger->warn("Tool call limit reached for this turn, skipped: " + toolName);
            return;
        }
        ++toolCallsThisTurn;
    }

    Request execute(TOOLS_EXECUTE_METHOD,
                    nlohmann::json{{"tool_id", toolName}, {"params", parameters}},
                    request.id ? request.id : std::optional<JsonRpcId>(JsonRpcId(toolName)));

    spawn([this, execute, toolName, turnId]() {
        if (isCancelled(turnId)) {
            logger->info("Request cancelled before tool ran: " + toolName);
            return;
        }

        Response response = dispatcher->process(execute);
        nlohmann::json result;
        if (response.isSuccess()) {
            result = response.getResult();
        } else {
            result = nlohmann::json{{"error", response.getError()}};
        }

        {
            std::lock_guard<std::mutex> lock(mtx);
            context.addToolResult(toolName, result);
        }
        bus->publish(ModelEvent::toolResult(toolName, result));
    });
}

void AgentRuntime::handleOtherRequest(const Request& request) {
    spawn([this, request]() {
        Response response = dispatcher->process(request);
        if (response.isError()) {
            logger->warn("Embedded request " + request.method + " failed: " + response.getError().message);
        } else {
            logger->debug("Embedded request " + request.method + " handled");
        }
    });
}

void AgentRuntime::resetContext() {
    coordinator->clear();
    {
        std::lock_guard<std::mutex> lock(mtx);
        context.clear();
        cancelledRequests.clear();
        streamBuffer.clear();
        toolCallsThisTurn = 0;
    }
    logger->info("Conversation context reset");
}

void AgentRuntime::cancel(const std::string& requestId) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        cancelledRequests.insert(requestId);
    }
    logger->info("Request cancelled: " + requestId);
    if (!llmClient) return;
    try {
        llmClient->cancelRequest(requestId);
    } catch (const std::exception& e) {
        logger->warn(std::string("LLM client failed to cancel ") + requestId + ": " + e.what());
    }
}
