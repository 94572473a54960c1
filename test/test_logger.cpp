#include <catch2/catch_test_macros.hpp>
#include "certforge/utils/logger.hpp"
#include <nlohmann/json.hpp>

using namespace certforge::utils;

namespace {

// 收集日志输出
class CaptureOutput : public LogOutput {
public:
    explicit CaptureOutput(std::vector<std::string>* lines) : lines_(lines) {}
    void Write(const std::string& message) override { lines_->push_back(message); }

private:
    std::vector<std::string>* lines_;
};

// 测试结束时恢复默认输出，避免之后的日志写入已销毁的缓冲
struct RestoreLogger {
    ~RestoreLogger() { GetLogger().Initialize("info", "text", "console"); }
};

} // namespace

TEST_CASE("Log level parsing", "[logger]") {
    REQUIRE(ParseLogLevel("debug") == LogLevel::Debug);
    REQUIRE(ParseLogLevel("WARNING") == LogLevel::Warn);
    REQUIRE(ParseLogLevel("panic") == LogLevel::Panic);
    REQUIRE(ParseLogLevel("nonsense") == LogLevel::Info);
    REQUIRE(LogLevelToString(LogLevel::Error) == "ERROR");
}

TEST_CASE("Logger filtering and formatting", "[logger]") {
    std::vector<std::string> lines;
    RestoreLogger restore;
    Logger& logger = GetLogger();
    logger.ClearOutputs();
    logger.AddOutput(std::make_unique<CaptureOutput>(&lines));

    SECTION("JSON formatter carries fields") {
        logger.SetFormatter(std::make_unique<JSONFormatter>());
        logger.SetLevel(LogLevel::Info);

        logger.Info("Generated new server certificate", LogContext().With("cert", "server.crt"));
        logger.Debug("hidden");

        REQUIRE(lines.size() == 1);
        auto entry = nlohmann::json::parse(lines[0]);
        REQUIRE(entry["level"] == "INFO");
        REQUIRE(entry["msg"] == "Generated new server certificate");
        REQUIRE(entry["cert"] == "server.crt");
        REQUIRE(entry.contains("time"));
    }

    SECTION("text formatter") {
        logger.SetFormatter(std::make_unique<TextFormatter>());
        logger.SetLevel(LogLevel::Warn);

        logger.Info("hidden");
        logger.Warn("Requested certificate lifetime exceeds the default",
                    LogContext().With("expireDays", "900"));

        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].find("[WARN] Requested certificate lifetime exceeds the default") != std::string::npos);
        REQUIRE(lines[0].find("expireDays=900") != std::string::npos);
    }

    SECTION("verbosity mapping") {
        logger.SetVerbosity(0);
        REQUIRE(logger.GetLevel() == LogLevel::Warn);
        logger.SetVerbosity(2);
        REQUIRE(logger.GetLevel() == LogLevel::Info);
        logger.SetVerbosity(4);
        REQUIRE(logger.GetLevel() == LogLevel::Debug);
    }
}
