#pragma once
#include <string>
#include <functional>
#include <mutex>

enum class LogLevel {
    INFO,
    SUCCESS,
    WARNING,
    ERROR,
    DEBUG
};

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

    void setDebug(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        debugEnabled = enabled;
    }

    bool isDebug() {
        std::lock_guard<std::mutex> lock(mtx);
        return debugEnabled;
    }

    // 默认仅在 stdout 为终端时输出颜色，CI 日志中保持纯文本
    void setColor(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        colorEnabled = enabled;
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (level == LogLevel::DEBUG && !debugEnabled) return;
        printToConsole(level, message);

        if (callback) {
            callback(level, message);
        }
    }

    // Convenience methods
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void success(const std::string& m) { log(LogLevel::SUCCESS, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }

private:
    Logger();
    LogCallback callback;
    std::mutex mtx;
    bool debugEnabled = false;
    bool colorEnabled = false;

    void printToConsole(LogLevel level, const std::string& message);
};
