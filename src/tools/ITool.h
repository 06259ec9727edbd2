#pragma once
#include <string>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

class ResourceManager;

enum class ToolCategory {
    FileSystem,
    Shell,
    Memory,
    Network,
    Other
};

NLOHMANN_JSON_SERIALIZE_ENUM(ToolCategory, {
    {ToolCategory::Other, "other"},
    {ToolCategory::FileSystem, "file_system"},
    {ToolCategory::Shell, "shell"},
    {ToolCategory::Memory, "memory"},
    {ToolCategory::Network, "network"},
})

/**
 * @brief 工具的描述信息, tools.list 原样返回
 *
 * id 是注册表里的唯一键; inputSchema 是 JSON Schema,
 * tools.execute 会在调用前按它做顶层校验。
 */
struct ToolMetadata {
    std::string id;
    std::string name;
    std::string description;
    ToolCategory category = ToolCategory::Other;
    nlohmann::json inputSchema = nlohmann::json::object();
    nlohmann::json outputSchema = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const ToolMetadata& m);
void from_json(const nlohmann::json& j, ToolMetadata& m);

enum class ToolStatus {
    Success,
    Failure,
    Timeout
};

NLOHMANN_JSON_SERIALIZE_ENUM(ToolStatus, {
    {ToolStatus::Success, "success"},
    {ToolStatus::Failure, "failure"},
    {ToolStatus::Timeout, "timeout"},
})

/**
 * @brief 一次工具调用的结果
 *
 * 约定: status != Success 时 error 一定有值。
 */
struct ToolResult {
    std::string toolId;
    ToolStatus status = ToolStatus::Success;
    nlohmann::json output;
    std::optional<std::string> error;

    bool isSuccess() const { return status == ToolStatus::Success; }

    static ToolResult success(const std::string& toolId, nlohmann::json output) {
        return {toolId, ToolStatus::Success, std::move(output), std::nullopt};
    }

    static ToolResult failure(const std::string& toolId, const std::string& error) {
        return {toolId, ToolStatus::Failure, nullptr, error};
    }

    static ToolResult timeout(const std::string& toolId, const std::string& error) {
        return {toolId, ToolStatus::Timeout, nullptr, error};
    }
};

void to_json(nlohmann::json& j, const ToolResult& r);
void from_json(const nlohmann::json& j, ToolResult& r);

/**
 * @brief 工具自己判定超时时抛出, 结果记为 Timeout 而不是 Failure
 */
class ToolTimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief 工具接口定义
 *
 * 工具是原子的执行单元, 只执行不判断; 是否调用、调用几次由 Agent 决定。
 * execute 可以阻塞, 协调器会把它放到工作线程上运行。
 * 失败时可以直接抛出 std::exception, 由协调器转成 Failure。
 */
class ITool {
public:
    virtual ~ITool() = default;

    virtual ToolMetadata metadata() const = 0;

    /**
     * @param params 已通过 inputSchema 顶层校验的参数
     * @param resources 进程内资源存储, 与其他工具共享
     */
    virtual ToolResult execute(const nlohmann::json& params, ResourceManager& resources) = 0;
};
