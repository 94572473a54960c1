#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "certforge/types.hpp"

namespace certforge {
namespace utils {

// 日志配置
struct LoggingConfig {
    std::string level = "info";      // 日志级别: debug, info, warn, error, fatal, panic
    std::string format = "text";     // 日志格式: json, text
    std::string output = "console";  // 日志输出: console, stdout, file
    std::string file = "certforge.log";
};

// FileConfig holds the values read from a JSON configuration file. Unset
// optionals mean the key was absent, so command line defaults stay in effect.
//
//   {
//     "signer":  {"cert": "...", "key": "...", "serial": "..."},
//     "cert": "...", "key": "...",
//     "hostnames": ["a.example.com", "10.0.0.1"],
//     "expireDays": 730, "overwrite": false,
//     "keyAlgorithm": "rsa", "keyBits": 2048,
//     "logging": {"level": "info", "format": "json", "output": "file", "file": "..."}
//   }
struct FileConfig {
    std::optional<std::string> signerCert;
    std::optional<std::string> signerKey;
    std::optional<std::string> signerSerial;

    std::optional<std::string> cert;
    std::optional<std::string> key;
    std::optional<std::vector<std::string>> hostnames;
    std::optional<int> expireDays;
    std::optional<bool> overwrite;
    std::optional<std::string> keyAlgorithm;
    std::optional<int> keyBits;

    std::optional<std::string> logLevel;
    std::optional<std::string> logFormat;
    std::optional<std::string> logOutput;
    std::optional<std::string> logFile;
};

// ParseConfig decodes a configuration document. Malformed JSON, a non-object
// root or a value of the wrong type fails with ValidationError.
Result<FileConfig> ParseConfig(const std::string& content);

// LoadConfigFile reads and parses path.
Result<FileConfig> LoadConfigFile(const std::string& path);

// ApplyLogging overlays the logging keys of config onto logging.
void ApplyLogging(const FileConfig& config, LoggingConfig& logging);

} // namespace utils
} // namespace certforge
