#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include "certforge/types.hpp"
#include "certforge/crypto/keys.hpp"
#include "certforge/pki/hostnames.hpp"
#include "certforge/pki/serial.hpp"
#include "certforge/pki/signer.hpp"
#include "certforge/utils/x509.hpp"

namespace certforge {
namespace pki {

struct IssueOptions {
    std::string keyAlgorithm = RSA_KEY;
    // 0表示使用算法默认值
    int keyBits = 0;
    // 签发时刻，默认取当前时间
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
};

// CertificateRequest describes one leaf to issue. It is fixed at creation:
// the window starts CertificateBackdate before now and lasts expireDays.
class CertificateRequest {
public:
    static Result<CertificateRequest> New(const SubjectAltNameSet& sans, int expireDays,
                                          const IssueOptions& options);

    CertificateRequest() = default;

    const SubjectAltNameSet& SANs() const { return sans_; }
    std::string CommonName() const;
    utils::CertTime NotBefore() const { return notBefore_; }
    utils::CertTime NotAfter() const { return notAfter_; }
    const std::string& KeyAlgorithm() const { return keyAlgorithm_; }
    int KeyBits() const { return keyBits_; }

private:
    SubjectAltNameSet sans_;
    utils::CertTime notBefore_;
    utils::CertTime notAfter_;
    std::string keyAlgorithm_;
    int keyBits_ = 0;
};

// IssuedCertificate is a freshly signed leaf together with its key.
struct IssuedCertificate {
    std::shared_ptr<utils::Certificate> certificate;
    std::shared_ptr<crypto::PrivateKey> key;
    uint64_t serial = 0;
    utils::CertTime notBefore;
    utils::CertTime notAfter;
    // 签发者证书链，不含叶子证书
    std::vector<std::shared_ptr<utils::Certificate>> signerChain;

    std::vector<uint8_t> DER() const { return certificate->ToDER(); }

    // CertificatePEM returns the leaf followed by the signer chain.
    Result<std::vector<uint8_t>> CertificatePEM() const;
    std::vector<uint8_t> KeyPEM() const { return key->ToPEM(); }
};

// IssueServerCert generates a key pair and signs a server certificate for
// sans using the serial held by reservation. The reservation is not
// committed here.
//   - ValidationError for expireDays <= 0 or an empty SAN set
//   - InvalidSignerMaterial when the signer expires before the leaf would
//   - SigningFailed on any key generation or signing failure
Result<std::shared_ptr<IssuedCertificate>> IssueServerCert(
    const SignerMaterial& signer,
    const SerialReservation& reservation,
    const SubjectAltNameSet& sans,
    int expireDays,
    const IssueOptions& options = IssueOptions());

// MakeServerCert reserves a serial, issues and commits the serial in one step.
Result<std::shared_ptr<IssuedCertificate>> MakeServerCert(
    const SignerMaterial& signer,
    const SubjectAltNameSet& sans,
    int expireDays,
    const IssueOptions& options = IssueOptions());

} // namespace pki
} // namespace certforge
