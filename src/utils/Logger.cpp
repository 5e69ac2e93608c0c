#include "utils/Logger.h"
#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    const char* levelTag(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return "[ERROR] ";
            case LogLevel::WARNING: return "[WARN] ";
            case LogLevel::INFO: return "[INFO] ";
            case LogLevel::DEBUG: return "[DEBUG] ";
        }
        return "[DEBUG] ";
    }
}

void Logger::writeRecord(LogLevel level, const std::string& message) {
    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    // 1. 文件日志：每条记录带时间戳与 pid（多个 hook 进程可能同时追加）
    if (!logFilePath.empty()) {
        std::ofstream logFile(logFilePath, std::ios::app);
        if (logFile.is_open()) {
            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm tmBuf{};
            localtime_r(&now, &tmBuf);
            logFile << std::put_time(&tmBuf, "[%Y-%m-%d %H:%M:%S] ");
            logFile << "[" << getpid() << "] " << levelTag(level) << trimmedMsg << std::endl;
        }
    }

    // 2. 控制台：默认只显示 WARNING 以上，debug 模式下全部显示
    if (level < LogLevel::WARNING && !debugEnabled) {
        return;
    }

    std::string prefix;
    switch (level) {
        case LogLevel::DEBUG:
            prefix = GRAY + "[Debug] " + RESET;
            break;
        case LogLevel::INFO:
            prefix = CYAN + "[Info] " + RESET;
            break;
        case LogLevel::WARNING:
            prefix = YELLOW + "⚠ " + RESET;
            break;
        case LogLevel::ERROR:
            prefix = RED + BOLD + "✖ " + RESET;
            break;
    }

    // Handle multi-line messages by prepending prefix to each line
    std::stringstream ss(trimmedMsg);
    std::string line;
    while (std::getline(ss, line)) {
        std::cerr << "sidekick " << prefix << line << std::endl;
    }
}
