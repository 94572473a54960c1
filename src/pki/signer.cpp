#include "certforge/pki/signer.hpp"
#include "certforge/crypto/certificate.hpp"
#include "certforge/utils/logger.hpp"
#include <filesystem>
#include <system_error>

namespace certforge {
namespace pki {

namespace fs = std::filesystem;

namespace {

bool fileExists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && !ec;
}

Result<std::shared_ptr<SerialCounter>> openSerialCounter(const std::string& serialFile) {
    if (serialFile.empty()) {
        return Result<std::shared_ptr<SerialCounter>>(std::make_shared<RandomSerialCounter>());
    }

    auto counter = FileSerialCounter::Open(serialFile);
    if (!counter.ok()) {
        return Result<std::shared_ptr<SerialCounter>>(counter.error());
    }
    return Result<std::shared_ptr<SerialCounter>>(std::shared_ptr<SerialCounter>(counter.value()));
}

} // namespace

Error SignerCertOptions::Validate() const {
    if (certFile.empty()) {
        return Error(ErrorCode::ValidationError, "signer certificate file must be provided");
    }
    if (keyFile.empty()) {
        return Error(ErrorCode::ValidationError, "signer key file must be provided");
    }
    return Error();
}

SignerMaterial::SignerMaterial(std::vector<std::shared_ptr<utils::Certificate>> certs,
                               std::shared_ptr<crypto::PrivateKey> key,
                               std::shared_ptr<SerialCounter> serial)
    : certs_(std::move(certs)), key_(std::move(key)), serial_(std::move(serial)) {}

Result<std::shared_ptr<SignerMaterial>> ResolveSigner(const SignerCertOptions& options) {
    using ResultType = Result<std::shared_ptr<SignerMaterial>>;

    Error err = options.Validate();
    if (err.hasError()) return ResultType(err);

    // 不在签发服务端证书的路径上隐式创建CA
    if (!fileExists(options.certFile)) {
        return ResultType(Error(ErrorCode::SignerNotFound,
            "signer certificate " + options.certFile + " does not exist"));
    }
    if (!fileExists(options.keyFile)) {
        return ResultType(Error(ErrorCode::SignerNotFound,
            "signer key " + options.keyFile + " does not exist"));
    }

    std::vector<std::shared_ptr<utils::Certificate>> certs;
    std::vector<uint8_t> keyBytes;
    try {
        certs = utils::LoadCertBundleFromFile(options.certFile);
        keyBytes = utils::ReadFileBytes(options.keyFile);
    } catch (const utils::CertificateError& e) {
        return ResultType(Error(ErrorCode::InvalidSignerMaterial,
            "failed to load signer from " + options.certFile + ": " + e.what()));
    }

    auto key = crypto::ParsePEMPrivateKey(keyBytes);
    if (!key.ok()) {
        return ResultType(Error(ErrorCode::InvalidSignerMaterial,
            "failed to load signer key " + options.keyFile + ": " + key.error().what()));
    }

    const auto& signerCert = certs.front();
    if (!key.value()->MatchesCertificate(signerCert->GetX509())) {
        return ResultType(Error(ErrorCode::InvalidSignerMaterial,
            "signer key " + options.keyFile + " does not match certificate " + options.certFile));
    }

    err = utils::ValidateCertificate(*signerCert, true);
    if (err.hasError()) {
        return ResultType(Error(ErrorCode::InvalidSignerMaterial,
            "signer certificate " + options.certFile + " is not usable: " + err.what()));
    }

    if (!signerCert->IsCA()) {
        utils::GetLogger().Warn("Signer certificate is not marked as a CA", utils::LogContext()
            .With("cert", options.certFile)
            .With("subject", signerCert->GetSubject()));
    }

    auto serial = openSerialCounter(options.serialFile);
    if (!serial.ok()) return ResultType(serial.error());

    utils::GetLogger().Debug("Loaded signer", utils::LogContext()
        .With("cert", options.certFile)
        .With("subject", signerCert->GetSubject())
        .With("serial", serial.value()->Describe()));

    return ResultType(std::make_shared<SignerMaterial>(std::move(certs), key.value(), serial.value()));
}

Result<std::shared_ptr<SignerMaterial>> MakeSelfSignedSigner(
    const std::string& name,
    int expireDays,
    std::shared_ptr<SerialCounter> serial,
    std::chrono::system_clock::time_point now
) {
    using ResultType = Result<std::shared_ptr<SignerMaterial>>;

    if (name.empty()) {
        return ResultType(Error(ErrorCode::ValidationError, "signer name must be provided"));
    }
    if (expireDays <= 0) {
        return ResultType(Error(ErrorCode::ValidationError, "expire days must be positive"));
    }
    if (!serial) {
        return ResultType(Error(ErrorCode::ValidationError, "signer serial counter must be provided"));
    }

    auto window = crypto::NewValidityWindow(now, expireDays);
    if (!window.ok()) return ResultType(window.error());

    auto key = crypto::GeneratePrivateKey(RSA_KEY, utils::MinRSABitSize);
    if (!key.ok()) return ResultType(key.error());

    crypto::CertificateTemplate tmpl;
    tmpl.commonName = name;
    tmpl.notBefore = window.value().notBefore;
    tmpl.notAfter = window.value().notAfter;
    tmpl.serial = SignerSerialNumber;
    tmpl.isCA = true;

    std::shared_ptr<utils::Certificate> cert;
    try {
        cert = crypto::SignCertificate(tmpl, *key.value(), *key.value(), nullptr);
    } catch (const utils::CertificateError& e) {
        return ResultType(Error(ErrorCode::SigningFailed, e.what()));
    }

    utils::GetLogger().Info("Generated self-signed signer", utils::LogContext()
        .With("name", name)
        .With("expireDays", std::to_string(expireDays)));

    std::vector<std::shared_ptr<utils::Certificate>> certs{cert};
    return ResultType(std::make_shared<SignerMaterial>(std::move(certs), key.value(), std::move(serial)));
}

} // namespace pki
} // namespace certforge
