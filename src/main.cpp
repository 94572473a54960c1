#include <string>
#include <vector>
#include <memory>
#include <CLI/CLI.hpp>
#include "certforge/admin/create_servercert.hpp"
#include "certforge/admin/create_signercert.hpp"
#include "certforge/utils/config.hpp"
#include "certforge/utils/logger.hpp"

using namespace certforge;

namespace {

// 命令行未显式给出时使用配置文件中的值
template <typename T>
void fromConfig(const CLI::Option* opt, T& target, const std::optional<T>& value) {
    if (opt->count() == 0 && value) {
        target = *value;
    }
}

int reportError(const std::string& command, const Error& err) {
    utils::GetLogger().Error(command + " failed", utils::LogContext()
        .With("code", errorCodeToString(err.code()))
        .With("error", err.what()));
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"certforge - issue server certificates signed by a local CA"};
    app.require_subcommand(1);

    // 全局选项
    std::string configFile;
    utils::LoggingConfig logging;
    int verbosity = 0;

    app.add_option("-c,--config", configFile, "JSON configuration file")->check(CLI::ExistingFile);
    auto logLevelOpt = app.add_option("--log-level", logging.level, "日志级别: debug, info, warn, error, fatal, panic");
    auto logFormatOpt = app.add_option("--log-format", logging.format, "日志格式: json, text");
    auto logOutputOpt = app.add_option("--log-output", logging.output, "日志输出: console, stdout, file");
    auto logFileOpt = app.add_option("--log-file", logging.file, "日志文件路径(当log-output为file时使用)");
    auto verbosityOpt = app.add_option("-v,--verbosity", verbosity, "Log verbosity, 0-5");

    int exitCode = 0;
    utils::FileConfig fileConfig;

    // 加载配置文件并初始化日志，失败时返回false
    auto prepare = [&](const std::string& command) -> bool {
        if (!configFile.empty()) {
            auto loaded = utils::LoadConfigFile(configFile);
            if (!loaded.ok()) {
                exitCode = reportError(command, loaded.error());
                return false;
            }
            fileConfig = loaded.value();
        }

        fromConfig(logLevelOpt, logging.level, fileConfig.logLevel);
        fromConfig(logFormatOpt, logging.format, fileConfig.logFormat);
        fromConfig(logOutputOpt, logging.output, fileConfig.logOutput);
        fromConfig(logFileOpt, logging.file, fileConfig.logFile);

        utils::GetLogger().Initialize(logging.level, logging.format, logging.output, logging.file);
        if (verbosityOpt->count() > 0) {
            utils::GetLogger().SetVerbosity(verbosity);
        }
        return true;
    };

    // create-server-cert 命令
    auto serverCmd = app.add_subcommand("create-server-cert",
        "Create a server certificate signed by the given signer, or keep a suitable existing one");

    auto signerOptions = std::make_shared<pki::SignerCertOptions>();
    admin::CreateServerCertOptions serverOptions;
    serverOptions.signerCertOptions = signerOptions;

    auto signerCertOpt = serverCmd->add_option("--signer-cert", signerOptions->certFile, "Signer CA certificate file");
    auto signerKeyOpt = serverCmd->add_option("--signer-key", signerOptions->keyFile, "Signer CA private key file");
    auto signerSerialOpt = serverCmd->add_option("--signer-serial", signerOptions->serialFile,
        "Signer serial file; random serials when empty");
    auto certOpt = serverCmd->add_option("--cert", serverOptions.certFile, "Output certificate file");
    auto keyOpt = serverCmd->add_option("--key", serverOptions.keyFile, "Output private key file");
    auto hostnamesOpt = serverCmd->add_option("--hostnames", serverOptions.hostnames,
        "Hostnames and IP addresses, comma separated or repeated")->delimiter(',');
    auto expireDaysOpt = serverCmd->add_option("--expire-days", serverOptions.expireDays,
        "Validity of the certificate in days")->capture_default_str();
    auto overwriteOpt = serverCmd->add_flag("--overwrite,!--no-overwrite", serverOptions.overwrite,
        "Replace existing files even if they are still usable (default true)");
    auto keyAlgorithmOpt = serverCmd->add_option("--key-algorithm", serverOptions.keyAlgorithm,
        "Key algorithm: rsa, ecdsa")->capture_default_str();
    auto keyBitsOpt = serverCmd->add_option("--key-bits", serverOptions.keyBits,
        "RSA modulus size or ECDSA curve size; 0 for the default");

    serverCmd->callback([&]() {
        if (!prepare("create-server-cert")) return;

        fromConfig(signerCertOpt, signerOptions->certFile, fileConfig.signerCert);
        fromConfig(signerKeyOpt, signerOptions->keyFile, fileConfig.signerKey);
        fromConfig(signerSerialOpt, signerOptions->serialFile, fileConfig.signerSerial);
        fromConfig(certOpt, serverOptions.certFile, fileConfig.cert);
        fromConfig(keyOpt, serverOptions.keyFile, fileConfig.key);
        fromConfig(hostnamesOpt, serverOptions.hostnames, fileConfig.hostnames);
        fromConfig(expireDaysOpt, serverOptions.expireDays, fileConfig.expireDays);
        fromConfig(overwriteOpt, serverOptions.overwrite, fileConfig.overwrite);
        fromConfig(keyAlgorithmOpt, serverOptions.keyAlgorithm, fileConfig.keyAlgorithm);
        fromConfig(keyBitsOpt, serverOptions.keyBits, fileConfig.keyBits);

        auto result = admin::CreateServerCert(serverOptions);
        if (!result.ok()) {
            exitCode = reportError("create-server-cert", result.error());
        }
    });

    // create-signer-cert 命令
    auto signerCmd = app.add_subcommand("create-signer-cert", "Create a self-signed signer CA");

    admin::CreateSignerCertOptions signerCertOptions;
    auto caCertOpt = signerCmd->add_option("--cert", signerCertOptions.certFile, "Output CA certificate file");
    auto caKeyOpt = signerCmd->add_option("--key", signerCertOptions.keyFile, "Output CA private key file");
    auto caSerialOpt = signerCmd->add_option("--serial", signerCertOptions.serialFile,
        "Serial file, reset to 01 when a new CA is written");
    signerCmd->add_option("--name", signerCertOptions.name,
        "Common name of the CA (default certforge-signer@<unix time>)");
    signerCmd->add_option("--expire-days", signerCertOptions.expireDays,
        "Validity of the CA certificate in days")->capture_default_str();
    auto caOverwriteOpt = signerCmd->add_flag("--overwrite,!--no-overwrite", signerCertOptions.overwrite,
        "Replace an existing CA (default true)");

    signerCmd->callback([&]() {
        if (!prepare("create-signer-cert")) return;

        // 配置文件中的signer段同样适用于CA创建
        fromConfig(caCertOpt, signerCertOptions.certFile, fileConfig.signerCert);
        fromConfig(caKeyOpt, signerCertOptions.keyFile, fileConfig.signerKey);
        fromConfig(caSerialOpt, signerCertOptions.serialFile, fileConfig.signerSerial);
        fromConfig(caOverwriteOpt, signerCertOptions.overwrite, fileConfig.overwrite);

        auto result = admin::CreateSignerCert(signerCertOptions);
        if (!result.ok()) {
            exitCode = reportError("create-signer-cert", result.error());
        }
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    return exitCode;
}
