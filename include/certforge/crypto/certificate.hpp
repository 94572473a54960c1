#pragma once

#include <memory>
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include "certforge/crypto/keys.hpp"
#include "certforge/utils/x509.hpp"

namespace certforge {
namespace crypto {

// 签发时起始时间向前回拨，容忍主机间的时钟偏差
const std::chrono::minutes CertificateBackdate(5);

// ValidityWindow is a certificate's [notBefore, notAfter] interval.
struct ValidityWindow {
    utils::CertTime notBefore;
    utils::CertTime notAfter;
};

// NewValidityWindow starts the window CertificateBackdate before now and ends it
// expireDays later. Fails with ValidationError when expireDays is not positive
// or the end would fall after 9999-12-31T23:59:59Z.
Result<ValidityWindow> NewValidityWindow(std::chrono::system_clock::time_point now, int expireDays);

// 证书模板：签发一张证书所需的全部字段
struct CertificateTemplate {
    std::string commonName;
    std::vector<std::string> dnsNames;
    std::vector<std::string> ipAddresses;
    utils::CertTime notBefore;
    utils::CertTime notAfter;
    uint64_t serial = 0;
    bool isCA = false;
};

// SignCertificate builds an X.509 v3 certificate from tmpl for subjectKey's
// public half and signs it with issuerKey using SHA-256. A null issuerCert
// makes the certificate self-signed. Leaf templates get the server profile
// (digitalSignature+keyEncipherment, serverAuth, CA:FALSE); CA templates get
// CA:TRUE and keyCertSign.
// Throws utils::CertificateError on any OpenSSL failure.
std::shared_ptr<utils::Certificate> SignCertificate(
    const CertificateTemplate& tmpl,
    const PrivateKey& subjectKey,
    const PrivateKey& issuerKey,
    const utils::Certificate* issuerCert
);

} // namespace crypto
} // namespace certforge
