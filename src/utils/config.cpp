#include "certforge/utils/config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace certforge {
namespace utils {

using json = nlohmann::json;

namespace {

template <typename T>
void readOptional(const json& obj, const std::string& key, std::optional<T>& target,
                  const std::string& path) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return;
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw std::invalid_argument("config key \"" + path + "\" has the wrong type: " + e.what());
    }
}

const json* section(const json& root, const std::string& key) {
    auto it = root.find(key);
    if (it == root.end() || it->is_null()) return nullptr;
    if (!it->is_object()) {
        throw std::invalid_argument("config key \"" + key + "\" must be an object");
    }
    return &(*it);
}

} // namespace

Result<FileConfig> ParseConfig(const std::string& content) {
    json root;
    try {
        root = json::parse(content);
    } catch (const json::parse_error& e) {
        return Result<FileConfig>(Error(ErrorCode::ValidationError,
            std::string("malformed configuration: ") + e.what()));
    }
    if (!root.is_object()) {
        return Result<FileConfig>(Error(ErrorCode::ValidationError,
            "configuration root must be a JSON object"));
    }

    FileConfig config;
    try {
        if (const json* signer = section(root, "signer")) {
            readOptional(*signer, "cert", config.signerCert, "signer.cert");
            readOptional(*signer, "key", config.signerKey, "signer.key");
            readOptional(*signer, "serial", config.signerSerial, "signer.serial");
        }

        readOptional(root, "cert", config.cert, "cert");
        readOptional(root, "key", config.key, "key");
        readOptional(root, "hostnames", config.hostnames, "hostnames");
        readOptional(root, "expireDays", config.expireDays, "expireDays");
        readOptional(root, "overwrite", config.overwrite, "overwrite");
        readOptional(root, "keyAlgorithm", config.keyAlgorithm, "keyAlgorithm");
        readOptional(root, "keyBits", config.keyBits, "keyBits");

        if (const json* logging = section(root, "logging")) {
            readOptional(*logging, "level", config.logLevel, "logging.level");
            readOptional(*logging, "format", config.logFormat, "logging.format");
            readOptional(*logging, "output", config.logOutput, "logging.output");
            readOptional(*logging, "file", config.logFile, "logging.file");
        }
    } catch (const std::invalid_argument& e) {
        return Result<FileConfig>(Error(ErrorCode::ValidationError, e.what()));
    }

    return Result<FileConfig>(std::move(config));
}

Result<FileConfig> LoadConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<FileConfig>(Error(ErrorCode::ValidationError,
            "failed to open configuration file: " + path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = ParseConfig(buffer.str());
    if (!config.ok()) {
        return Result<FileConfig>(Error(config.error().code(), path + ": " + config.error().what()));
    }
    return config;
}

void ApplyLogging(const FileConfig& config, LoggingConfig& logging) {
    if (config.logLevel) logging.level = *config.logLevel;
    if (config.logFormat) logging.format = *config.logFormat;
    if (config.logOutput) logging.output = *config.logOutput;
    if (config.logFile) logging.file = *config.logFile;
}

} // namespace utils
} // namespace certforge
