#pragma once
#include <string>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <type_traits>
#include <nlohmann/json.hpp>

struct Config {
    struct Logging {
        std::string level = "info";
        std::string file;          // 为空则不写日志文件
        bool console = true;
    } logging;

    struct Tools {
        int timeoutSeconds = 180;
        bool dedupEnabled = true;
    } tools;

    struct Agent {
        std::string systemPrompt =
            "You are a terminal agent. Reply with a single JSON-RPC 2.0 object. "
            "To call a tool, use method \"mcp.tool_call\" with params {\"name\", \"parameters\"}.";
        size_t maxToolCallsPerTurn = 16;
    } agent;

    static Config defaults() {
        return Config{};
    }

    /**
     * @brief 从已解析的 JSON 构造配置, 缺省的键保持默认值
     * @throws std::runtime_error 键存在但类型不对
     */
    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be a JSON object");
        }

        if (j.contains("logging")) {
            const auto& l = section(j, "logging");
            cfg.logging.level = read<std::string>(l, "logging.level", "level", cfg.logging.level);
            cfg.logging.file = read<std::string>(l, "logging.file", "file", cfg.logging.file);
            cfg.logging.console = read<bool>(l, "logging.console", "console", cfg.logging.console);
        }

        if (j.contains("tools")) {
            const auto& t = section(j, "tools");
            cfg.tools.timeoutSeconds = read<int>(t, "tools.timeout_seconds", "timeout_seconds", cfg.tools.timeoutSeconds);
            cfg.tools.dedupEnabled = read<bool>(t, "tools.dedup_enabled", "dedup_enabled", cfg.tools.dedupEnabled);
            if (cfg.tools.timeoutSeconds <= 0) {
                throw std::runtime_error("Config key 'tools.timeout_seconds' must be positive");
            }
        }

        if (j.contains("agent")) {
            const auto& a = section(j, "agent");
            cfg.agent.systemPrompt = read<std::string>(a, "agent.system_prompt", "system_prompt", cfg.agent.systemPrompt);
            cfg.agent.maxToolCallsPerTurn = read<size_t>(a, "agent.max_tool_calls_per_turn", "max_tool_calls_per_turn",
                                                         cfg.agent.maxToolCallsPerTurn);
        }

        return cfg;
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        return fromJson(j);
    }

private:
    static const nlohmann::json& section(const nlohmann::json& j, const char* name) {
        const auto& s = j.at(name);
        if (!s.is_object()) {
            throw std::runtime_error(std::string("Config key '") + name + "' must be an object");
        }
        return s;
    }

    template <typename T>
    static T read(const nlohmann::json& s, const char* fullKey, const char* key, const T& fallback) {
        if (!s.contains(key)) return fallback;
        const auto& v = s.at(key);
        bool ok = false;
        if constexpr (std::is_same_v<T, std::string>) {
            ok = v.is_string();
        } else if constexpr (std::is_same_v<T, bool>) {
            ok = v.is_boolean();
        } else if constexpr (std::is_unsigned_v<T>) {
            ok = v.is_number_unsigned();
        } else {
            ok = v.is_number_integer();
        }
        if (!ok) {
            throw std::runtime_error(std::string("Config key '") + fullKey + "' has the wrong type");
        }
        return v.get<T>();
    }
};
