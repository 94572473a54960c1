#include "certforge/utils/logger.hpp"
#include <ctime>

namespace certforge {
namespace utils {

std::string GetTimeString() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm now_tm;
    gmtime_r(&now_time_t, &now_tm);

    std::stringstream ss;
    ss << std::put_time(&now_tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << now_ms.count() << 'Z';
    return ss.str();
}

LogLevel ParseLogLevel(const std::string& level) {
    if (level == "debug" || level == "DEBUG") return LogLevel::Debug;
    if (level == "info" || level == "INFO") return LogLevel::Info;
    if (level == "warn" || level == "WARN" || level == "warning" || level == "WARNING") return LogLevel::Warn;
    if (level == "error" || level == "ERROR") return LogLevel::Error;
    if (level == "fatal" || level == "FATAL") return LogLevel::Fatal;
    if (level == "panic" || level == "PANIC") return LogLevel::Panic;

    // 默认为Info级别
    return LogLevel::Info;
}

std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Panic: return "PANIC";
        default: return "UNKNOWN";
    }
}

std::string JSONFormatter::Format(const LogEntry& entry) {
    using json = nlohmann::json;

    json j = {
        {"level", LogLevelToString(entry.level)},
        {"time", entry.time},
        {"msg", entry.message}
    };

    for (const auto& field : entry.fields) {
        j[field.first] = field.second;
    }

    return j.dump();
}

std::string TextFormatter::Format(const LogEntry& entry) {
    std::stringstream ss;
    ss << "[" << entry.time << "] "
       << "[" << LogLevelToString(entry.level) << "] "
       << entry.message;

    if (!entry.fields.empty()) {
        ss << " {";
        bool first = true;
        for (const auto& field : entry.fields) {
            if (!first) ss << ", ";
            ss << field.first << "=" << field.second;
            first = false;
        }
        ss << "}";
    }

    return ss.str();
}

void ConsoleOutput::Write(const std::string& message) {
    std::cout << message << std::endl;
}

void StderrOutput::Write(const std::string& message) {
    std::cerr << message << std::endl;
}

FileOutput::FileOutput(const std::string& filename) {
    file_.open(filename, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "cannot open log file: " << filename << std::endl;
    }
}

FileOutput::~FileOutput() {
    if (file_.is_open()) {
        file_.close();
    }
}

void FileOutput::Write(const std::string& message) {
    if (file_.is_open()) {
        file_ << message << std::endl;
        file_.flush();
    }
}

void LogContext::WithField(const std::string& key, const std::string& value) {
    fields_[key] = value;
}

LogContext LogContext::With(const std::string& key, const std::string& value) const {
    LogContext newContext = *this;
    newContext.WithField(key, value);
    return newContext;
}

Logger::Logger() {
    AddOutput(std::make_unique<StderrOutput>());
    SetFormatter(std::make_unique<TextFormatter>());
}

Logger& Logger::GetInstance() {
    static Logger instance;
    return instance;
}

void Logger::Initialize(const std::string& level, const std::string& format,
                        const std::string& output, const std::string& file) {
    SetLevel(level);

    if (format == "json") {
        SetFormatter(std::make_unique<JSONFormatter>());
    } else {
        SetFormatter(std::make_unique<TextFormatter>());
    }

    ClearOutputs();

    if (output == "file" && !file.empty()) {
        AddOutput(std::make_unique<FileOutput>(file));
    } else if (output == "stdout") {
        AddOutput(std::make_unique<ConsoleOutput>());
    } else {
        AddOutput(std::make_unique<StderrOutput>());
    }
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Logger::SetLevel(const std::string& level) {
    SetLevel(ParseLogLevel(level));
}

LogLevel Logger::GetLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::SetVerbosity(int verbosity) {
    if (verbosity <= 0) {
        SetLevel(LogLevel::Warn);
    } else if (verbosity <= 2) {
        SetLevel(LogLevel::Info);
    } else {
        SetLevel(LogLevel::Debug);
    }
}

void Logger::AddOutput(std::unique_ptr<LogOutput> output) {
    std::lock_guard<std::mutex> lock(mutex_);
    outputs_.push_back(std::move(output));
}

void Logger::ClearOutputs() {
    std::lock_guard<std::mutex> lock(mutex_);
    outputs_.clear();
}

void Logger::SetFormatter(std::unique_ptr<LogFormatter> formatter) {
    std::lock_guard<std::mutex> lock(mutex_);
    formatter_ = std::move(formatter);
}

void Logger::Log(const LogEntry& entry) {
    if (!ShouldLog(entry.level)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (formatter_) {
        std::string formatted = formatter_->Format(entry);
        for (auto& output : outputs_) {
            output->Write(formatted);
        }
    }
}

void Logger::Log(LogLevel level, const std::string& message, const LogContext& ctx) {
    if (!ShouldLog(level)) return;

    LogEntry entry;
    entry.level = level;
    entry.message = message;
    entry.time = GetTimeString();

    // 合并上下文字段，调用方字段优先
    entry.fields = ctx.Fields();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& field : context_.Fields()) {
            if (entry.fields.find(field.first) == entry.fields.end()) {
                entry.fields[field.first] = field.second;
            }
        }
    }

    Log(entry);
}

void Logger::Debug(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Debug, message, ctx);
}

void Logger::Info(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Info, message, ctx);
}

void Logger::Warn(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Warn, message, ctx);
}

void Logger::Error(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Error, message, ctx);
}

void Logger::Fatal(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Fatal, message, ctx);
}

void Logger::Panic(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Panic, message, ctx);
}

Logger& Logger::WithField(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    context_.WithField(key, value);
    return *this;
}

bool Logger::ShouldLog(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) <= static_cast<int>(level_);
}

} // namespace utils
} // namespace certforge
