#include "certforge/admin/create_signercert.hpp"
#include "certforge/storage/cert_writer.hpp"
#include "certforge/utils/logger.hpp"

namespace certforge {
namespace admin {

std::string DefaultSignerName(std::chrono::system_clock::time_point now) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return "certforge-signer@" + std::to_string(seconds);
}

Error CreateSignerCertOptions::Validate() const {
    if (certFile.empty()) {
        return Error(ErrorCode::ValidationError, "cert file must be provided");
    }
    if (keyFile.empty()) {
        return Error(ErrorCode::ValidationError, "key file must be provided");
    }
    if (expireDays <= 0) {
        return Error(ErrorCode::ValidationError,
            "expire days must be positive, got " + std::to_string(expireDays));
    }
    return Error();
}

Result<SignerCertResult> CreateSignerCert(const CreateSignerCertOptions& o,
                                          std::chrono::system_clock::time_point now) {
    using ResultType = Result<SignerCertResult>;

    Error err = o.Validate();
    if (err.hasError()) return ResultType(err);

    pki::SignerCertOptions signerOptions{o.certFile, o.keyFile, o.serialFile};

    if (!o.overwrite) {
        auto existing = pki::ResolveSigner(signerOptions);
        if (existing.ok()) {
            utils::GetLogger().Info("Keeping existing signer certificate", utils::LogContext()
                .With("cert", o.certFile)
                .With("subject", existing.value()->Cert().GetSubject()));

            SignerCertResult result;
            result.signer = existing.value();
            result.written = false;
            return ResultType(std::move(result));
        }
        // 已存在但无法加载的CA不覆盖，交由调用方处理
        if (existing.error().code() != ErrorCode::SignerNotFound) {
            return ResultType(existing.error());
        }
    }

    std::shared_ptr<pki::FileSerialCounter> fileCounter;
    std::shared_ptr<pki::SerialCounter> counter;
    if (o.serialFile.empty()) {
        counter = std::make_shared<pki::RandomSerialCounter>();
    } else {
        fileCounter = std::make_shared<pki::FileSerialCounter>(o.serialFile);
        counter = fileCounter;
    }

    std::string name = o.name.empty() ? DefaultSignerName(now) : o.name;
    auto signer = pki::MakeSelfSignedSigner(name, o.expireDays, counter, now);
    if (!signer.ok()) return ResultType(signer.error());

    auto certPEM = utils::CertChainToPEM(signer.value()->Chain());
    if (!certPEM.ok()) return ResultType(certPEM.error());

    std::vector<uint8_t> keyPEM = signer.value()->Key().ToPEM();
    if (keyPEM.empty()) {
        return ResultType(Error(ErrorCode::SigningFailed, "failed to encode signer private key"));
    }

    storage::CertificatePairWriter writer(o.certFile, o.keyFile);
    err = writer.Stage(certPEM.value(), keyPEM);
    if (err.hasError()) return ResultType(err);
    err = writer.Commit();
    if (err.hasError()) return ResultType(err);

    // 新CA从序列号1重新计数
    if (fileCounter) {
        err = fileCounter->Reset(pki::SignerSerialNumber);
        if (err.hasError()) {
            Error rollbackErr = writer.Rollback();
            if (rollbackErr.hasError()) {
                utils::GetLogger().Error("Failed to roll back signer after serial reset failure",
                    utils::LogContext().With("cert", o.certFile).With("error", rollbackErr.what()));
            }
            return ResultType(err);
        }
    }

    utils::GetLogger().Info("Generated new signer certificate", utils::LogContext()
        .With("cert", o.certFile)
        .With("key", o.keyFile)
        .With("name", name)
        .With("serial", counter->Describe())
        .With("expireDays", std::to_string(o.expireDays)));

    SignerCertResult result;
    result.signer = signer.value();
    result.written = true;
    return ResultType(std::move(result));
}

} // namespace admin
} // namespace certforge
