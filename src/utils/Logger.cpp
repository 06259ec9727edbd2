#include "utils/Logger.h"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <ctime>

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";
}

Logger::Logger(const Options& opts) : options(opts) {
    if (!options.filePath.empty()) {
        logFile.open(options.filePath, std::ios::app);
        if (!logFile.is_open()) {
            std::cerr << "Could not open log file: " << options.filePath << std::endl;
        }
    }
}

std::shared_ptr<Logger> Logger::null() {
    Options opts;
    opts.minLevel = LogLevel::OFF;
    return std::make_shared<Logger>(opts);
}

void Logger::log(LogLevel level, const std::string& message) {
    LogCallback cb;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (level == LogLevel::OFF || level < options.minLevel) {
            return;
        }

        writeToFile(level, message);
        if (options.console) {
            printToConsole(level, message);
        }
        cb = callback;
    }
    // 回调在锁外执行, 回调里可以再写日志
    if (cb) {
        cb(level, message);
    }
}

void Logger::writeToFile(LogLevel level, const std::string& message) {
    if (!logFile.is_open()) return;

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tmBuf{};
    localtime_r(&now, &tmBuf);
    logFile << std::put_time(&tmBuf, "[%Y-%m-%d %H:%M:%S] ");
    logFile << "[" << logLevelName(level) << "] " << message << std::endl;
}

void Logger::printToConsole(LogLevel level, const std::string& message) {
    std::string prefix;
    switch (level) {
        case LogLevel::TRACE:
            prefix = GRAY + "[Trace] " + RESET;
            break;
        case LogLevel::DEBUG:
            prefix = GRAY + "[Debug] " + RESET;
            break;
        case LogLevel::INFO:
            prefix = CYAN + "[Info] " + RESET;
            break;
        case LogLevel::ACTION:
            prefix = YELLOW + BOLD + "[Action] " + RESET;
            break;
        case LogLevel::SUCCESS:
            prefix = GREEN + "✔ " + RESET;
            break;
        case LogLevel::WARNING:
            prefix = YELLOW + "⚠ " + RESET;
            break;
        case LogLevel::ERROR:
            prefix = RED + BOLD + "✖ " + RESET;
            break;
        case LogLevel::OFF:
            return;
    }

    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    // Multi-line messages: prefix on the first line, a gutter on the rest.
    // stderr keeps stdout free for the JSON-RPC stream.
    std::stringstream ss(trimmedMsg);
    std::string line;
    bool first = true;
    while (std::getline(ss, line)) {
        if (first) {
            std::cerr << prefix << line << std::endl;
        } else {
            std::cerr << GRAY << "  │ " << RESET << line << std::endl;
        }
        first = false;
    }
}

LogLevel parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "action") return LogLevel::ACTION;
    if (lower == "success") return LogLevel::SUCCESS;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "off" || lower == "none") return LogLevel::OFF;
    return LogLevel::INFO;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::ACTION: return "ACTION";
        case LogLevel::SUCCESS: return "SUCCESS";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF: return "OFF";
    }
    return "INFO";
}
