#include "certforge/admin/create_servercert.hpp"
#include "certforge/pki/hostnames.hpp"
#include "certforge/storage/cert_writer.hpp"
#include "certforge/utils/logger.hpp"
#include <filesystem>

namespace certforge {
namespace admin {

namespace {

std::string joinHostnames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += ",";
        out += name;
    }
    return out;
}

// 仅按字面比较，不访问文件系统
bool samePath(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return false;
    std::filesystem::path pa = std::filesystem::path(a).lexically_normal();
    std::filesystem::path pb = std::filesystem::path(b).lexically_normal();
    if (pa.is_absolute() != pb.is_absolute()) {
        std::error_code ec;
        auto absA = std::filesystem::absolute(pa, ec);
        if (ec) return false;
        auto absB = std::filesystem::absolute(pb, ec);
        if (ec) return false;
        return absA.lexically_normal() == absB.lexically_normal();
    }
    return pa == pb;
}

} // namespace

Result<ServerCertResult> WriteServerCert(const CreateServerCertOptions& o,
                                         const pki::SignerMaterial& signer,
                                         std::chrono::system_clock::time_point now) {
    using ResultType = Result<ServerCertResult>;

    auto sans = pki::ValidateHostnames(o.hostnames);
    if (!sans.ok()) return ResultType(sans.error());

    // 预留序列号并持有锁，直到证书落盘后才提交
    auto reservation = signer.Serial().Reserve();
    if (!reservation.ok()) return ResultType(reservation.error());

    pki::IssueOptions issueOptions;
    issueOptions.keyAlgorithm = o.keyAlgorithm;
    issueOptions.keyBits = o.keyBits;
    issueOptions.now = now;

    auto issued = pki::IssueServerCert(signer, *reservation.value(), sans.value(), o.expireDays, issueOptions);
    if (!issued.ok()) return ResultType(issued.error());

    auto certPEM = issued.value()->CertificatePEM();
    if (!certPEM.ok()) return ResultType(certPEM.error());

    std::vector<uint8_t> keyPEM = issued.value()->KeyPEM();
    if (keyPEM.empty()) {
        return ResultType(Error(ErrorCode::SigningFailed, "failed to encode server private key"));
    }

    storage::CertificatePairWriter writer(o.certFile, o.keyFile);
    Error err = writer.Stage(certPEM.value(), keyPEM);
    if (err.hasError()) return ResultType(err);

    err = writer.Commit();
    if (err.hasError()) return ResultType(err);

    err = reservation.value()->Commit();
    if (err.hasError()) {
        // 序列号未能记录时撤回已写入的文件，避免磁盘上出现未登记的序列号
        Error rollbackErr = writer.Rollback();
        if (rollbackErr.hasError()) {
            utils::GetLogger().Error("Failed to roll back certificate after serial commit failure",
                utils::LogContext()
                    .With("cert", o.certFile)
                    .With("key", o.keyFile)
                    .With("error", rollbackErr.what()));
        }
        return ResultType(err);
    }

    utils::GetLogger().Info("Generated new server certificate", utils::LogContext()
        .With("cert", o.certFile)
        .With("key", o.keyFile)
        .With("hostnames", joinHostnames(sans.value().List()))
        .With("serial", std::to_string(issued.value()->serial))
        .With("expireDays", std::to_string(o.expireDays)));

    ServerCertResult result;
    result.issued = issued.value();
    result.certs.push_back(issued.value()->certificate);
    result.certs.insert(result.certs.end(),
                        issued.value()->signerChain.begin(), issued.value()->signerChain.end());
    result.key = issued.value()->key;
    result.written = true;
    return ResultType(std::move(result));
}

Error CreateServerCertOptions::Validate() const {
    if (hostnames.empty()) {
        return Error(ErrorCode::EmptyHostnameSet, "at least one hostname must be provided");
    }
    auto sans = pki::ValidateHostnames(hostnames);
    if (!sans.ok()) return sans.error();

    if (certFile.empty()) {
        return Error(ErrorCode::ValidationError, "cert file must be provided");
    }
    if (keyFile.empty()) {
        return Error(ErrorCode::ValidationError, "key file must be provided");
    }
    if (samePath(certFile, keyFile)) {
        return Error(ErrorCode::ValidationError, "cert file and key file must differ: " + certFile);
    }
    if (expireDays <= 0) {
        return Error(ErrorCode::ValidationError,
            "expire days must be positive, got " + std::to_string(expireDays));
    }
    if (keyAlgorithm != RSA_KEY && keyAlgorithm != ECDSA_KEY) {
        return Error(ErrorCode::ValidationError, "unsupported key algorithm: " + keyAlgorithm);
    }
    if (reusePolicy.threshold == pki::ReusePolicy::Threshold::GraceFraction &&
        (reusePolicy.fraction <= 0.0 || reusePolicy.fraction > 1.0)) {
        return Error(ErrorCode::ValidationError, "reuse grace fraction must be in (0, 1]");
    }

    if (!signerCertOptions) {
        return Error(ErrorCode::ValidationError, "signer options are required");
    }
    Error err = signerCertOptions->Validate();
    if (err.hasError()) return err;

    // 输出文件不能覆盖签发者的任何文件
    for (const std::string* out : {&certFile, &keyFile}) {
        for (const std::string* signerFile : {&signerCertOptions->certFile,
                                              &signerCertOptions->keyFile,
                                              &signerCertOptions->serialFile}) {
            if (samePath(*out, *signerFile)) {
                return Error(ErrorCode::ValidationError,
                    "output file " + *out + " collides with signer file " + *signerFile);
            }
        }
    }
    return Error();
}

Result<ServerCertResult> CreateServerCert(const CreateServerCertOptions& o,
                                          std::chrono::system_clock::time_point now) {
    using ResultType = Result<ServerCertResult>;

    Error err = o.Validate();
    if (err.hasError()) return ResultType(err);

    if (o.expireDays > DefaultCertificateLifetimeInDays) {
        utils::GetLogger().Warn("Requested certificate lifetime exceeds the default", utils::LogContext()
            .With("expireDays", std::to_string(o.expireDays))
            .With("default", std::to_string(DefaultCertificateLifetimeInDays)));
    }

    auto sans = pki::ValidateHostnames(o.hostnames);
    if (!sans.ok()) return ResultType(sans.error());

    auto signer = pki::ResolveSigner(*o.signerCertOptions);
    if (!signer.ok()) return ResultType(signer.error());

    if (!o.overwrite) {
        auto snapshot = pki::ReadExistingCertificate(o.certFile, o.keyFile);
        auto decision = pki::EvaluateReuse(snapshot, sans.value(), o.expireDays, now, o.reusePolicy);
        if (decision.reuse) {
            const auto& valid = std::get<pki::SnapshotValid>(snapshot);
            utils::GetLogger().Info("Keeping existing server certificate", utils::LogContext()
                .With("cert", o.certFile)
                .With("key", o.keyFile)
                .With("hostnames", joinHostnames(sans.value().List())));

            ServerCertResult result;
            result.certs = valid.certs;
            result.key = valid.key;
            result.written = false;
            return ResultType(std::move(result));
        }
        utils::GetLogger().Info("Regenerating server certificate", utils::LogContext()
            .With("cert", o.certFile)
            .With("reason", decision.reason));
    }

    return WriteServerCert(o, *signer.value(), now);
}

} // namespace admin
} // namespace certforge
