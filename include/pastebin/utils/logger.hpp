#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <map>
#include <memory>
#include <vector>

namespace pastebin {
namespace utils {

// 日志级别枚举, 数值越小越严重
enum class LogLevel : int {
    Panic = 0,
    Fatal = 1,
    Error = 2,
    Warn  = 3,
    Info  = 4,
    Debug = 5
};

// 日志条目
struct LogEntry {
    LogLevel level;
    std::string message;
    std::string time;
    std::map<std::string, std::string> fields;
};

// 日志格式化器接口
class LogFormatter {
public:
    virtual ~LogFormatter() = default;
    virtual std::string Format(const LogEntry& entry) = 0;
};

// JSON格式化器
class JSONFormatter : public LogFormatter {
public:
    std::string Format(const LogEntry& entry) override;
};

// 文本格式化器
class TextFormatter : public LogFormatter {
public:
    std::string Format(const LogEntry& entry) override;
};

// 日志输出接口
class LogOutput {
public:
    virtual ~LogOutput() = default;
    virtual void Write(const std::string& message) = 0;
};

// 控制台输出
class ConsoleOutput : public LogOutput {
public:
    void Write(const std::string& message) override;
};

// 文件输出 (追加写)
class FileOutput : public LogOutput {
public:
    explicit FileOutput(const std::string& filename);
    void Write(const std::string& message) override;
    bool IsOpen() const { return file_.is_open(); }

private:
    std::ofstream file_;
};

// 日志上下文
class LogContext {
public:
    const std::map<std::string, std::string>& Fields() const { return fields_; }

    void WithField(const std::string& key, const std::string& value);

    // 返回带有新字段的副本, 便于链式调用
    LogContext With(const std::string& key, const std::string& value) const;

private:
    std::map<std::string, std::string> fields_;
};

// 日志配置
struct LoggingConfig {
    std::string level = "info";     // debug, info, warn, error, fatal, panic
    std::string format = "json";    // json, text
    std::string output = "console"; // console, file
    std::string file = "pastebin-server.log";
};

// 主日志类
class Logger {
public:
    static Logger& GetInstance();

    // 按配置重建格式化器和输出
    void Initialize(const LoggingConfig& config);

    void SetLevel(LogLevel level);
    void SetLevel(const std::string& level);

    void AddOutput(std::unique_ptr<LogOutput> output);
    void ClearOutputs();
    void SetFormatter(std::unique_ptr<LogFormatter> formatter);

    void Debug(const std::string& message, const LogContext& ctx = LogContext());
    void Info(const std::string& message, const LogContext& ctx = LogContext());
    void Warn(const std::string& message, const LogContext& ctx = LogContext());
    void Error(const std::string& message, const LogContext& ctx = LogContext());
    void Fatal(const std::string& message, const LogContext& ctx = LogContext());

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void Log(LogLevel level, const std::string& message, const LogContext& ctx);

    LogLevel level_ = LogLevel::Info;
    std::vector<std::unique_ptr<LogOutput>> outputs_;
    std::unique_ptr<LogFormatter> formatter_;
    std::mutex mutex_;
};

inline Logger& GetLogger() {
    return Logger::GetInstance();
}

// 从字符串解析日志级别, 无法识别时返回 Info
LogLevel ParseLogLevel(const std::string& level);

std::string LogLevelToString(LogLevel level);

} // namespace utils
} // namespace pastebin
