#pragma once

#include <vector>
#include <memory>
#include <string>
#include <cstdint>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include "certforge/types.hpp"

namespace certforge {
namespace crypto {

// 私钥包装类，持有EVP_PKEY的所有权
class PrivateKey {
public:
    explicit PrivateKey(EVP_PKEY* pkey);
    ~PrivateKey();

    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;

    EVP_PKEY* GetEVPKey() const { return pkey_; }

    // RSA_KEY or ECDSA_KEY; empty for any other key type
    std::string Algorithm() const;
    int Bits() const;

    // 传统PEM编码（"RSA PRIVATE KEY" / "EC PRIVATE KEY"）
    std::vector<uint8_t> ToPEM() const;

    // SubjectPublicKeyInfo的DER编码
    std::vector<uint8_t> PublicKeyDER() const;

    // MatchesCertificate reports whether cert carries this key's public half.
    bool MatchesCertificate(X509* cert) const;

private:
    EVP_PKEY* pkey_ = nullptr;
};

// GeneratePrivateKey creates a fresh key pair. For RSA_KEY bits is the modulus
// size (at least 2048); for ECDSA_KEY bits selects the curve (256, 384 or 521).
// bits <= 0 picks the default for the algorithm.
Result<std::shared_ptr<PrivateKey>> GeneratePrivateKey(const std::string& algorithm, int bits = 0);

// 解析PEM格式的私钥（PKCS#1、SEC1或未加密的PKCS#8）
Result<std::shared_ptr<PrivateKey>> ParsePEMPrivateKey(const std::vector<uint8_t>& pemBytes);

} // namespace crypto
} // namespace certforge
