#pragma once
#include <string>
#include <functional>
#include <mutex>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @brief 进程级日志器
 *
 * stdout 专用于 hook 协议输出，日志只写 stderr 与日志文件。
 * 工作线程 (fan-out worker) 也会调用，所有写入都在 mtx 下串行化。
 */
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    // 空字符串表示不写文件
    void setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx);
        logFilePath = path;
    }

    void setDebugEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        debugEnabled = enabled;
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (level == LogLevel::DEBUG && !debugEnabled) {
            return;
        }
        writeRecord(level, message);

        if (callback) {
            callback(level, message);
        }
    }

    // Convenience methods
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }

private:
    Logger() = default;
    LogCallback callback;
    std::string logFilePath;
    bool debugEnabled = false;
    std::mutex mtx;

    void writeRecord(LogLevel level, const std::string& message);
};
