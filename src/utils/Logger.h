#pragma once
#include <string>
#include <functional>
#include <fstream>
#include <memory>
#include <mutex>

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    ACTION,
    SUCCESS,
    WARNING,
    ERROR,
    OFF
};

/**
 * @brief 日志器
 *
 * 由调用方显式构造, 以 std::shared_ptr<Logger> 注入各组件 (没有全局单例)。
 * 低于 minLevel 的消息直接丢弃; 其余消息依次写入日志文件、控制台和回调。
 */
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    struct Options {
        LogLevel minLevel = LogLevel::INFO;
        // 为空时不写文件
        std::string filePath;
        bool console = false;
    };

    Logger() = default;
    explicit Logger(const Options& options);

    /**
     * @brief 不输出任何内容的日志器, 用于组件未注入日志器时
     */
    static std::shared_ptr<Logger> null();

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx);
        options.minLevel = level;
    }

    LogLevel getLevel() const {
        std::lock_guard<std::mutex> lock(mtx);
        return options.minLevel;
    }

    bool isEnabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mtx);
        return level != LogLevel::OFF && level >= options.minLevel;
    }

    void log(LogLevel level, const std::string& message);

    // Convenience methods
    void trace(const std::string& m) { log(LogLevel::TRACE, m); }
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void action(const std::string& m) { log(LogLevel::ACTION, m); }
    void success(const std::string& m) { log(LogLevel::SUCCESS, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }

private:
    Options options;
    LogCallback callback;
    std::ofstream logFile;
    mutable std::mutex mtx;

    void writeToFile(LogLevel level, const std::string& message);
    void printToConsole(LogLevel level, const std::string& message);
};

/**
 * @brief 配置字符串 -> 日志级别 (不区分大小写, 未知值返回 INFO)
 */
LogLevel parseLogLevel(const std::string& name);

const char* logLevelName(LogLevel level);
