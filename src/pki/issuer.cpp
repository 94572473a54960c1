#include "certforge/pki/issuer.hpp"
#include "certforge/crypto/certificate.hpp"
#include "certforge/utils/logger.hpp"
#include <ctime>

namespace certforge {
namespace pki {

namespace {

std::string formatTime(utils::CertTime tp) {
    std::time_t t = static_cast<std::time_t>(tp.time_since_epoch().count());
    std::tm tm;
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace

Result<CertificateRequest> CertificateRequest::New(const SubjectAltNameSet& sans, int expireDays,
                                                   const IssueOptions& options) {
    if (expireDays <= 0) {
        return Result<CertificateRequest>(Error(ErrorCode::ValidationError,
            "expire days must be positive, got " + std::to_string(expireDays)));
    }
    if (sans.Empty()) {
        return Result<CertificateRequest>(Error(ErrorCode::EmptyHostnameSet,
            "at least one hostname must be provided"));
    }
    if (options.keyAlgorithm != RSA_KEY && options.keyAlgorithm != ECDSA_KEY) {
        return Result<CertificateRequest>(Error(ErrorCode::ValidationError,
            "unsupported key algorithm: " + options.keyAlgorithm));
    }

    auto window = crypto::NewValidityWindow(options.now, expireDays);
    if (!window.ok()) return Result<CertificateRequest>(window.error());

    CertificateRequest req;
    req.sans_ = sans;
    req.notBefore_ = window.value().notBefore;
    req.notAfter_ = window.value().notAfter;
    req.keyAlgorithm_ = options.keyAlgorithm;
    req.keyBits_ = options.keyBits;
    return Result<CertificateRequest>(std::move(req));
}

std::string CertificateRequest::CommonName() const {
    std::vector<std::string> all = sans_.List();
    return all.empty() ? "" : all.front();
}

Result<std::vector<uint8_t>> IssuedCertificate::CertificatePEM() const {
    std::vector<std::shared_ptr<utils::Certificate>> chain;
    chain.reserve(signerChain.size() + 1);
    chain.push_back(certificate);
    chain.insert(chain.end(), signerChain.begin(), signerChain.end());
    return utils::CertChainToPEM(chain);
}

Result<std::shared_ptr<IssuedCertificate>> IssueServerCert(
    const SignerMaterial& signer,
    const SerialReservation& reservation,
    const SubjectAltNameSet& sans,
    int expireDays,
    const IssueOptions& options
) {
    using ResultType = Result<std::shared_ptr<IssuedCertificate>>;

    auto req = CertificateRequest::New(sans, expireDays, options);
    if (!req.ok()) return ResultType(req.error());
    const CertificateRequest& request = req.value();

    // 签发者的有效期必须覆盖叶子证书的整个有效期
    auto signerNotAfter = signer.Cert().GetNotAfter();
    if (signerNotAfter < request.NotAfter()) {
        return ResultType(Error(ErrorCode::InvalidSignerMaterial,
            "signer certificate expires at " + formatTime(signerNotAfter) +
            ", before the requested certificate would (" + formatTime(request.NotAfter()) + ")"));
    }

    auto key = crypto::GeneratePrivateKey(request.KeyAlgorithm(), request.KeyBits());
    if (!key.ok()) return ResultType(key.error());

    crypto::CertificateTemplate tmpl;
    tmpl.commonName = request.CommonName();
    tmpl.dnsNames.assign(sans.DNSNames().begin(), sans.DNSNames().end());
    tmpl.ipAddresses.assign(sans.IPAddresses().begin(), sans.IPAddresses().end());
    tmpl.notBefore = request.NotBefore();
    tmpl.notAfter = request.NotAfter();
    tmpl.serial = reservation.Serial();
    tmpl.isCA = false;

    auto issued = std::make_shared<IssuedCertificate>();
    try {
        issued->certificate = crypto::SignCertificate(tmpl, *key.value(), signer.Key(), &signer.Cert());
    } catch (const utils::CertificateError& e) {
        return ResultType(Error(ErrorCode::SigningFailed, e.what()));
    }

    issued->key = key.value();
    issued->serial = tmpl.serial;
    issued->notBefore = tmpl.notBefore;
    issued->notAfter = tmpl.notAfter;
    issued->signerChain = signer.Chain();

    utils::GetLogger().Debug("Issued server certificate", utils::LogContext()
        .With("cn", tmpl.commonName)
        .With("serial", std::to_string(tmpl.serial))
        .With("notAfter", formatTime(tmpl.notAfter)));

    return ResultType(issued);
}

Result<std::shared_ptr<IssuedCertificate>> MakeServerCert(
    const SignerMaterial& signer,
    const SubjectAltNameSet& sans,
    int expireDays,
    const IssueOptions& options
) {
    using ResultType = Result<std::shared_ptr<IssuedCertificate>>;

    auto reservation = signer.Serial().Reserve();
    if (!reservation.ok()) return ResultType(reservation.error());

    auto issued = IssueServerCert(signer, *reservation.value(), sans, expireDays, options);
    if (!issued.ok()) return issued;

    Error err = reservation.value()->Commit();
    if (err.hasError()) return ResultType(err);
    return issued;
}

} // namespace pki
} // namespace certforge
