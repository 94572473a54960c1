#pragma once

#include <string>
#include <iostream>
#include <sstream>
#include <fstream>
#include <mutex>
#include <map>
#include <memory>
#include <vector>
#include <chrono>
#include <iomanip>
#include <nlohmann/json.hpp>

namespace certforge {
namespace utils {

// 日志级别枚举
enum class LogLevel : int {
    Panic = 0,    // 最严重的错误
    Fatal = 1,    // 严重错误
    Error = 2,    // 错误但可恢复
    Warn  = 3,    // 警告
    Info  = 4,    // 信息性消息
    Debug = 5     // 调试信息
};

// 获取当前时间字符串的工具函数
std::string GetTimeString();

// 日志条目结构
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

// 控制台输出 (stdout)
class ConsoleOutput : public LogOutput {
public:
    void Write(const std::string& message) override;
};

// 标准错误输出，命令行工具默认使用，保持stdout干净
class StderrOutput : public LogOutput {
public:
    void Write(const std::string& message) override;
};

// 文件输出
class FileOutput : public LogOutput {
public:
    explicit FileOutput(const std::string& filename);
    ~FileOutput();
    void Write(const std::string& message) override;

private:
    std::ofstream file_;
};

// 日志上下文
class LogContext {
public:
    LogContext() = default;
    LogContext(std::map<std::string, std::string> fields) : fields_(std::move(fields)) {}

    const std::map<std::string, std::string>& Fields() const { return fields_; }

    void WithField(const std::string& key, const std::string& value);

    // 创建带有新字段的上下文
    LogContext With(const std::string& key, const std::string& value) const;

private:
    std::map<std::string, std::string> fields_;
};

// 主日志类
class Logger {
public:
    static Logger& GetInstance();

    // 初始化日志系统
    void Initialize(const std::string& level, const std::string& format,
                    const std::string& output, const std::string& file = "certforge.log");

    void SetLevel(LogLevel level);
    void SetLevel(const std::string& level);
    LogLevel GetLevel() const;

    // SetVerbosity maps a klog style -v value onto a level: 0 keeps warnings
    // and errors only, 1-2 adds info, 3 and above adds debug output.
    void SetVerbosity(int verbosity);

    void AddOutput(std::unique_ptr<LogOutput> output);
    void ClearOutputs();
    void SetFormatter(std::unique_ptr<LogFormatter> formatter);

    void Log(const LogEntry& entry);
    void Log(LogLevel level, const std::string& message, const LogContext& ctx = LogContext());

    void Debug(const std::string& message, const LogContext& ctx = LogContext());
    void Info(const std::string& message, const LogContext& ctx = LogContext());
    void Warn(const std::string& message, const LogContext& ctx = LogContext());
    void Error(const std::string& message, const LogContext& ctx = LogContext());
    void Fatal(const std::string& message, const LogContext& ctx = LogContext());
    void Panic(const std::string& message, const LogContext& ctx = LogContext());

    // 全局上下文字段，会附加到之后的每一条日志
    Logger& WithField(const std::string& key, const std::string& value);

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LogLevel level_ = LogLevel::Info;
    std::vector<std::unique_ptr<LogOutput>> outputs_;
    std::unique_ptr<LogFormatter> formatter_;
    LogContext context_;
    mutable std::mutex mutex_;

    bool ShouldLog(LogLevel level) const;
};

inline Logger& GetLogger() {
    return Logger::GetInstance();
}

// 从字符串解析日志级别
LogLevel ParseLogLevel(const std::string& level);

// 获取日志级别名称
std::string LogLevelToString(LogLevel level);

} // namespace utils
} // namespace certforge
