#include "certforge/crypto/keys.hpp"
#include "certforge/utils/logger.hpp"
#include "certforge/utils/x509.hpp"
#include <openssl/ec.h>
#include <openssl/rsa.h>
#include <openssl/pem.h>
#include <openssl/err.h>

namespace certforge {
namespace crypto {

namespace {

std::string lastOpenSSLError() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown OpenSSL error";

    char buf[256] = {0};
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

int curveForBits(int bits) {
    switch (bits) {
        case 0:
        case 256: return NID_X9_62_prime256v1;
        case 384: return NID_secp384r1;
        case 521: return NID_secp521r1;
        default: return NID_undef;
    }
}

} // namespace

PrivateKey::PrivateKey(EVP_PKEY* pkey) : pkey_(pkey) {}

PrivateKey::~PrivateKey() {
    if (pkey_) {
        EVP_PKEY_free(pkey_);
    }
}

std::string PrivateKey::Algorithm() const {
    if (!pkey_) return "";

    switch (EVP_PKEY_base_id(pkey_)) {
        case EVP_PKEY_RSA: return RSA_KEY;
        case EVP_PKEY_EC: return ECDSA_KEY;
        default: return "";
    }
}

int PrivateKey::Bits() const {
    return pkey_ ? EVP_PKEY_get_bits(pkey_) : 0;
}

std::vector<uint8_t> PrivateKey::ToPEM() const {
    if (!pkey_) return {};

    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), BIO_free);
    if (!bio) return {};

    if (PEM_write_bio_PrivateKey_traditional(bio.get(), pkey_, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        utils::GetLogger().Error("Failed to PEM encode private key: " + lastOpenSSLError());
        return {};
    }

    char* pemData = nullptr;
    long pemLen = BIO_get_mem_data(bio.get(), &pemData);
    return std::vector<uint8_t>(pemData, pemData + pemLen);
}

std::vector<uint8_t> PrivateKey::PublicKeyDER() const {
    if (!pkey_) return {};

    int len = i2d_PUBKEY(pkey_, nullptr);
    if (len <= 0) return {};

    std::vector<uint8_t> der(len);
    unsigned char* p = der.data();
    if (i2d_PUBKEY(pkey_, &p) != len) {
        return {};
    }
    return der;
}

bool PrivateKey::MatchesCertificate(X509* cert) const {
    if (!pkey_ || !cert) return false;

    bool match = X509_check_private_key(cert, pkey_) == 1;
    ERR_clear_error();
    return match;
}

Result<std::shared_ptr<PrivateKey>> GeneratePrivateKey(const std::string& algorithm, int bits) {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(nullptr, EVP_PKEY_CTX_free);

    if (algorithm == RSA_KEY) {
        if (bits <= 0) {
            bits = utils::MinRSABitSize;
        }
        if (bits < utils::MinRSABitSize) {
            return Result<std::shared_ptr<PrivateKey>>(Error(ErrorCode::ValidationError,
                "RSA key size " + std::to_string(bits) + " is below the minimum of " +
                std::to_string(utils::MinRSABitSize)));
        }

        ctx.reset(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
        if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
            EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0) {
            return Result<std::shared_ptr<PrivateKey>>(Error(ErrorCode::SigningFailed,
                "failed to set up RSA key generation: " + lastOpenSSLError()));
        }
    } else if (algorithm == ECDSA_KEY) {
        int curve = curveForBits(bits);
        if (curve == NID_undef) {
            return Result<std::shared_ptr<PrivateKey>>(Error(ErrorCode::ValidationError,
                "unsupported ECDSA key size: " + std::to_string(bits)));
        }

        ctx.reset(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
        if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
            EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), curve) <= 0) {
            return Result<std::shared_ptr<PrivateKey>>(Error(ErrorCode::SigningFailed,
                "failed to set up EC key generation: " + lastOpenSSLError()));
        }
    } else {
        return Result<std::shared_ptr<PrivateKey>>(Error(ErrorCode::ValidationError,
            "unsupported key algorithm: " + algorithm));
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &pkey) <= 0 || !pkey) {
        return Result<std::shared_ptr<PrivateKey>>(Error(ErrorCode::SigningFailed,
            "failed to generate " + algorithm + " key: " + lastOpenSSLError()));
    }

    utils::GetLogger().Debug("Generated private key", utils::LogContext()
        .With("algorithm", algorithm)
        .With("bits", std::to_string(EVP_PKEY_get_bits(pkey))));

    return Result<std::shared_ptr<PrivateKey>>(std::make_shared<PrivateKey>(pkey));
}

Result<std::shared_ptr<PrivateKey>> ParsePEMPrivateKey(const std::vector<uint8_t>& pemBytes) {
    if (pemBytes.empty()) {
        return Result<std::shared_ptr<PrivateKey>>(Error(ErrorCode::InvalidSignerMaterial, "private key PEM data is empty"));
    }

    std::unique_ptr<BIO, decltype(&BIO_free)> bio(
        BIO_new_mem_buf(pemBytes.data(), static_cast<int>(pemBytes.size())), BIO_free);
    if (!bio) {
        return Result<std::shared_ptr<PrivateKey>>(Error(ErrorCode::InvalidSignerMaterial, "failed to create memory BIO"));
    }

    // 空口令回调，拒绝加密私钥而不是在终端上提示输入
    auto noPassphrase = [](char*, int, int, void*) -> int { return 0; };

    EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio.get(), nullptr, noPassphrase, nullptr);
    if (!pkey) {
        return Result<std::shared_ptr<PrivateKey>>(Error(ErrorCode::InvalidSignerMaterial,
            "failed to parse PEM private key: " + lastOpenSSLError()));
    }

    auto key = std::make_shared<PrivateKey>(pkey);
    if (key->Algorithm().empty()) {
        return Result<std::shared_ptr<PrivateKey>>(Error(ErrorCode::InvalidSignerMaterial,
            "unsupported private key type"));
    }
    return Result<std::shared_ptr<PrivateKey>>(key);
}

} // namespace crypto
} // namespace certforge
