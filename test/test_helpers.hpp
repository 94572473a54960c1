#pragma once

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <cstdlib>
#include <sys/stat.h>
#include "certforge/admin/create_signercert.hpp"
#include "certforge/pki/signer.hpp"
#include "certforge/utils/logger.hpp"

namespace certforge {
namespace testing {

// 测试用临时目录，析构时删除
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "certforge_test_XXXXXX").string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        REQUIRE(mkdtemp(buf.data()) != nullptr);
        root_ = buf.data();
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& Root() const { return root_; }
    std::string Path(const std::string& name) const { return root_ + "/" + name; }

private:
    std::string root_;
};

inline bool Exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

inline std::string ReadText(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

inline void WriteText(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << content;
}

inline mode_t FileMode(const std::string& path) {
    struct stat st;
    REQUIRE(stat(path.c_str(), &st) == 0);
    return st.st_mode & 0777;
}

inline std::vector<uint8_t> Bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

// 测试CA的文件位置
struct TestCA {
    std::string certFile;
    std::string keyFile;
    std::string serialFile;

    std::shared_ptr<pki::SignerCertOptions> Options() const {
        auto options = std::make_shared<pki::SignerCertOptions>();
        options->certFile = certFile;
        options->keyFile = keyFile;
        options->serialFile = serialFile;
        return options;
    }
};

// CreateTestCA writes a fresh CA into dir under the given prefix.
inline TestCA CreateTestCA(const TempDir& dir, const std::string& prefix = "ca",
                           int expireDays = DefaultCACertificateLifetimeInDays,
                           bool withSerial = true) {
    TestCA ca;
    ca.certFile = dir.Path(prefix + ".crt");
    ca.keyFile = dir.Path(prefix + ".key");
    ca.serialFile = withSerial ? dir.Path(prefix + ".serial") : "";

    admin::CreateSignerCertOptions options;
    options.certFile = ca.certFile;
    options.keyFile = ca.keyFile;
    options.serialFile = ca.serialFile;
    options.name = "certforge-test-" + prefix;
    options.expireDays = expireDays;

    auto result = admin::CreateSignerCert(options);
    REQUIRE(result.ok());
    REQUIRE(result.value().written);
    return ca;
}

inline void QuietLogs() {
    utils::GetLogger().SetLevel(utils::LogLevel::Error);
}

} // namespace testing
} // namespace certforge
