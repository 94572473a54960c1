#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <memory>
#include <cstdint>
#include <stdexcept>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/evp.h>
#include "certforge/types.hpp"

namespace certforge {
namespace utils {

const int MinRSABitSize = 2048;

// 证书时间按秒计，int64秒可覆盖到9999年
using CertTime = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

// X.509可表示的最晚时间 9999-12-31T23:59:59Z
const CertTime MaxCertificateTime{std::chrono::seconds(253402300799LL)};

// 证书错误类，OpenSSL 封装层统一抛出该异常
class CertificateError : public std::runtime_error {
public:
    explicit CertificateError(const std::string& message)
        : std::runtime_error("Certificate error: " + message) {}
};

// X509证书包装类，持有X509的所有权
class Certificate {
public:
    Certificate() = default;
    explicit Certificate(X509* cert);
    ~Certificate();

    Certificate(const Certificate&) = delete;
    Certificate& operator=(const Certificate&) = delete;

    Certificate(Certificate&& other) noexcept;
    Certificate& operator=(Certificate&& other) noexcept;

    X509* GetX509() const { return cert_; }

    std::string GetCommonName() const;
    std::string GetSubject() const;
    std::string GetIssuer() const;

    CertTime GetNotBefore() const;
    CertTime GetNotAfter() const;

    // 序列号（十六进制大写）
    std::string GetSerialHex() const;
    // 序列号超出uint64范围时抛出CertificateError
    uint64_t GetSerialNumber() const;

    // Subject alternative names. DNS names are returned lower-cased and IP
    // addresses in the canonical inet_ntop form.
    std::vector<std::string> DNSNames() const;
    std::vector<std::string> IPAddresses() const;

    std::vector<uint8_t> ToPEM() const;
    std::vector<uint8_t> ToDER() const;

    bool IsValid() const;
    bool IsCA() const;

    // IsSignedBy reports whether issuer's subject matches this certificate's
    // issuer and issuer's public key verifies this certificate's signature.
    bool IsSignedBy(const Certificate& issuer) const;

private:
    X509* cert_ = nullptr;
};

// 从PEM数据解析第一张证书，失败返回nullptr
std::shared_ptr<Certificate> LoadCertificateFromPEM(const std::vector<uint8_t>& pemData);

// LoadCertBundleFromPEM loads every "CERTIFICATE" block from the PEM data.
// Throws CertificateError on an unparsable block, a non-certificate block, or
// when no certificate is present.
std::vector<std::shared_ptr<Certificate>> LoadCertBundleFromPEM(const std::vector<uint8_t>& pemBytes);

// LoadCertBundleFromFile reads filename and delegates to LoadCertBundleFromPEM.
std::vector<std::shared_ptr<Certificate>> LoadCertBundleFromFile(const std::string& filename);

// CertChainToPEM concatenates the PEM encoding of each certificate in order.
Result<std::vector<uint8_t>> CertChainToPEM(const std::vector<std::shared_ptr<Certificate>>& certChain);

// ValidateCertificate rejects inverted validity windows, SHA1 signatures and
// short RSA keys, and optionally expired or not yet valid certificates.
Error ValidateCertificate(const Certificate& cert, bool checkExpiry);

// ASN1TimeToCertTime converts an ASN.1 UTCTime/GeneralizedTime to CertTime (UTC).
// An unparsable time yields the epoch.
CertTime ASN1TimeToCertTime(const ASN1_TIME* t);

// ToCertTime truncates a clock reading to whole seconds.
CertTime ToCertTime(std::chrono::system_clock::time_point tp);

// 读取整个文件，无法打开或读取时抛出CertificateError
std::vector<uint8_t> ReadFileBytes(const std::string& filename);

} // namespace utils
} // namespace certforge
