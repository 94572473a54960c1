#include "certforge/utils/x509.hpp"
#include "certforge/utils/logger.hpp"
#include <openssl/bn.h>
#include <openssl/asn1.h>
#include <openssl/pem.h>
#include <openssl/err.h>
#include <arpa/inet.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iterator>

namespace certforge {
namespace utils {

namespace {

std::string nameToString(X509_NAME* name) {
    if (!name) return "";

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) return "";

    X509_NAME_print_ex(bio, name, 0, XN_FLAG_RFC2253);
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string result(data, data + len);
    BIO_free(bio);
    return result;
}

// 遍历subjectAltName扩展中指定类型的条目
template <typename Fn>
void forEachGeneralName(X509* cert, int type, Fn fn) {
    GENERAL_NAMES* names = static_cast<GENERAL_NAMES*>(
        X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr));
    if (!names) return;

    for (int i = 0; i < sk_GENERAL_NAME_num(names); ++i) {
        const GENERAL_NAME* name = sk_GENERAL_NAME_value(names, i);
        if (name && name->type == type) {
            fn(name);
        }
    }
    GENERAL_NAMES_free(names);
}

} // namespace

// Certificate类实现

Certificate::Certificate(X509* cert) : cert_(cert) {}

Certificate::~Certificate() {
    if (cert_) {
        X509_free(cert_);
    }
}

Certificate::Certificate(Certificate&& other) noexcept : cert_(other.cert_) {
    other.cert_ = nullptr;
}

Certificate& Certificate::operator=(Certificate&& other) noexcept {
    if (this != &other) {
        if (cert_) {
            X509_free(cert_);
        }
        cert_ = other.cert_;
        other.cert_ = nullptr;
    }
    return *this;
}

std::string Certificate::GetCommonName() const {
    if (!cert_) return "";

    X509_NAME* subject = X509_get_subject_name(cert_);
    if (!subject) return "";

    int idx = X509_NAME_get_index_by_NID(subject, NID_commonName, -1);
    if (idx < 0) return "";

    X509_NAME_ENTRY* entry = X509_NAME_get_entry(subject, idx);
    if (!entry) return "";

    ASN1_STRING* data = X509_NAME_ENTRY_get_data(entry);
    if (!data) return "";

    const unsigned char* str = ASN1_STRING_get0_data(data);
    return std::string(reinterpret_cast<const char*>(str), ASN1_STRING_length(data));
}

std::string Certificate::GetSubject() const {
    if (!cert_) return "";
    return nameToString(X509_get_subject_name(cert_));
}

std::string Certificate::GetIssuer() const {
    if (!cert_) return "";
    return nameToString(X509_get_issuer_name(cert_));
}

CertTime Certificate::GetNotBefore() const {
    if (!cert_) return CertTime{};
    return ASN1TimeToCertTime(X509_get0_notBefore(cert_));
}

CertTime Certificate::GetNotAfter() const {
    if (!cert_) return CertTime{};
    return ASN1TimeToCertTime(X509_get0_notAfter(cert_));
}

std::string Certificate::GetSerialHex() const {
    if (!cert_) return "";

    BIGNUM* bn = ASN1_INTEGER_to_BN(X509_get0_serialNumber(cert_), nullptr);
    if (!bn) return "";

    char* hex = BN_bn2hex(bn);
    std::string result = hex ? hex : "";
    OPENSSL_free(hex);
    BN_free(bn);
    return result;
}

uint64_t Certificate::GetSerialNumber() const {
    if (!cert_) {
        throw CertificateError("certificate is null");
    }

    uint64_t serial = 0;
    if (ASN1_INTEGER_get_uint64(&serial, X509_get0_serialNumber(cert_)) != 1) {
        throw CertificateError("serial number does not fit in 64 bits: " + GetSerialHex());
    }
    return serial;
}

std::vector<std::string> Certificate::DNSNames() const {
    std::vector<std::string> result;
    if (!cert_) return result;

    forEachGeneralName(cert_, GEN_DNS, [&result](const GENERAL_NAME* name) {
        const ASN1_IA5STRING* dns = name->d.dNSName;
        std::string value(reinterpret_cast<const char*>(ASN1_STRING_get0_data(dns)),
                          ASN1_STRING_length(dns));
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        result.push_back(value);
    });
    return result;
}

std::vector<std::string> Certificate::IPAddresses() const {
    std::vector<std::string> result;
    if (!cert_) return result;

    forEachGeneralName(cert_, GEN_IPADD, [&result](const GENERAL_NAME* name) {
        const ASN1_OCTET_STRING* ip = name->d.iPAddress;
        const unsigned char* bytes = ASN1_STRING_get0_data(ip);
        int len = ASN1_STRING_length(ip);

        char buf[INET6_ADDRSTRLEN] = {0};
        if (len == 4 && inet_ntop(AF_INET, bytes, buf, sizeof(buf))) {
            result.emplace_back(buf);
        } else if (len == 16 && inet_ntop(AF_INET6, bytes, buf, sizeof(buf))) {
            result.emplace_back(buf);
        } else {
            GetLogger().Warn("Skipping malformed IP address SAN entry",
                LogContext().With("length", std::to_string(len)));
        }
    });
    return result;
}

std::vector<uint8_t> Certificate::ToPEM() const {
    if (!cert_) return {};

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) return {};

    if (PEM_write_bio_X509(bio, cert_) != 1) {
        BIO_free(bio);
        return {};
    }

    char* pemData;
    long pemLen = BIO_get_mem_data(bio, &pemData);

    std::vector<uint8_t> result(pemData, pemData + pemLen);
    BIO_free(bio);

    return result;
}

std::vector<uint8_t> Certificate::ToDER() const {
    if (!cert_) return {};

    int derLen = i2d_X509(cert_, nullptr);
    if (derLen <= 0) return {};

    std::vector<uint8_t> derData(derLen);
    unsigned char* derPtr = derData.data();

    if (i2d_X509(cert_, &derPtr) != derLen) {
        return {};
    }

    return derData;
}

bool Certificate::IsValid() const {
    return cert_ != nullptr;
}

bool Certificate::IsCA() const {
    if (!cert_) return false;

    // X509_check_ca: 1表示CA，0表示不是CA，其他值表示不同类型的CA
    return X509_check_ca(cert_) == 1;
}

bool Certificate::IsSignedBy(const Certificate& issuer) const {
    if (!cert_ || !issuer.cert_) return false;

    if (X509_check_issued(issuer.cert_, cert_) != X509_V_OK) {
        return false;
    }

    EVP_PKEY* issuerKey = X509_get0_pubkey(issuer.cert_);
    if (!issuerKey) return false;

    return X509_verify(cert_, issuerKey) == 1;
}

CertTime ASN1TimeToCertTime(const ASN1_TIME* t) {
    if (!t) return CertTime{};

    struct tm tm_info = {};
    if (ASN1_TIME_to_tm(t, &tm_info) != 1) {
        return CertTime{};
    }

    // ASN1时间总是UTC，按秒返回
    return CertTime(std::chrono::seconds(static_cast<int64_t>(timegm(&tm_info))));
}

CertTime ToCertTime(std::chrono::system_clock::time_point tp) {
    return std::chrono::floor<std::chrono::seconds>(tp);
}

std::vector<uint8_t> ReadFileBytes(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw CertificateError("cannot open file: " + filename);
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw CertificateError("failed to read file: " + filename);
    }
    return data;
}

std::shared_ptr<Certificate> LoadCertificateFromPEM(const std::vector<uint8_t>& pemData) {
    if (pemData.empty()) return nullptr;

    BIO* bio = BIO_new_mem_buf(pemData.data(), static_cast<int>(pemData.size()));
    if (!bio) return nullptr;

    X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!cert) return nullptr;

    return std::make_shared<Certificate>(cert);
}

std::vector<std::shared_ptr<Certificate>> LoadCertBundleFromPEM(const std::vector<uint8_t>& pemBytes) {
    if (pemBytes.empty()) {
        throw CertificateError("PEM data is empty");
    }

    std::vector<std::shared_ptr<Certificate>> certificates;

    BIO* bio = BIO_new_mem_buf(pemBytes.data(), static_cast<int>(pemBytes.size()));
    if (!bio) {
        throw CertificateError("failed to create memory BIO for PEM data");
    }

    char* name = nullptr;
    char* header = nullptr;
    unsigned char* data = nullptr;
    long len = 0;

    auto releaseBlock = [&]() {
        OPENSSL_free(name);
        OPENSSL_free(header);
        OPENSSL_free(data);
        name = nullptr;
        header = nullptr;
        data = nullptr;
    };

    // 循环读取所有PEM块
    while (PEM_read_bio(bio, &name, &header, &data, &len) == 1) {
        if (!name || strcmp(name, "CERTIFICATE") != 0) {
            std::string blockType = name ? name : "unknown";
            releaseBlock();
            BIO_free(bio);
            throw CertificateError("invalid PEM block type: " + blockType + ", expected CERTIFICATE");
        }

        const unsigned char* p = data;
        X509* cert = d2i_X509(nullptr, &p, len);
        releaseBlock();

        if (!cert) {
            BIO_free(bio);
            throw CertificateError("failed to parse certificate from PEM data");
        }
        certificates.push_back(std::make_shared<Certificate>(cert));
    }

    BIO_free(bio);
    // 读到末尾时PEM_read_bio会留下"no start line"错误
    ERR_clear_error();

    if (certificates.empty()) {
        throw CertificateError("no valid certificates found in PEM data");
    }

    GetLogger().Debug("Loaded " + std::to_string(certificates.size()) + " certificates from PEM bundle");

    return certificates;
}

std::vector<std::shared_ptr<Certificate>> LoadCertBundleFromFile(const std::string& filename) {
    std::vector<uint8_t> data = ReadFileBytes(filename);
    if (data.empty()) {
        throw CertificateError("file is empty: " + filename);
    }
    return LoadCertBundleFromPEM(data);
}

Result<std::vector<uint8_t>> CertChainToPEM(const std::vector<std::shared_ptr<Certificate>>& certChain) {
    std::vector<uint8_t> pemChain;
    for (const auto& cert : certChain) {
        if (!cert || !cert->IsValid()) {
            return Result<std::vector<uint8_t>>(Error(ErrorCode::SigningFailed, "certificate chain contains a null certificate"));
        }
        std::vector<uint8_t> pem = cert->ToPEM();
        if (pem.empty()) {
            return Result<std::vector<uint8_t>>(Error(ErrorCode::SigningFailed, "failed to PEM encode certificate " + cert->GetSubject()));
        }
        pemChain.insert(pemChain.end(), pem.begin(), pem.end());
    }
    return Result<std::vector<uint8_t>>(std::move(pemChain));
}

Error ValidateCertificate(const Certificate& cert, bool checkExpiry) {
    X509* x509 = cert.GetX509();
    if (!x509) {
        return Error(ErrorCode::InvalidSignerMaterial, "certificate is null");
    }

    const ASN1_TIME* notBefore = X509_get0_notBefore(x509);
    const ASN1_TIME* notAfter = X509_get0_notAfter(x509);
    if (!notBefore || !notAfter) {
        return Error(ErrorCode::InvalidSignerMaterial, "certificate validity times are invalid");
    }

    if (ASN1_TIME_compare(notBefore, notAfter) >= 0) {
        return Error(ErrorCode::InvalidSignerMaterial, "certificate validity window is invalid");
    }

    // 禁止SHA1签名算法
    int signatureNid = X509_get_signature_nid(x509);
    if (signatureNid == NID_sha1WithRSAEncryption ||
        signatureNid == NID_dsaWithSHA1 ||
        signatureNid == NID_ecdsa_with_SHA1) {
        return Error(ErrorCode::InvalidSignerMaterial, "certificate uses invalid SHA1 signature algorithm");
    }

    EVP_PKEY* pkey = X509_get0_pubkey(x509);
    if (pkey && EVP_PKEY_id(pkey) == EVP_PKEY_RSA && EVP_PKEY_get_bits(pkey) < MinRSABitSize) {
        return Error(ErrorCode::InvalidSignerMaterial, "RSA bit length is too short");
    }

    if (checkExpiry) {
        if (X509_cmp_current_time(notBefore) > 0) {
            return Error(ErrorCode::InvalidSignerMaterial, "certificate is not yet valid");
        }
        if (X509_cmp_current_time(notAfter) < 0) {
            return Error(ErrorCode::InvalidSignerMaterial, "certificate has expired");
        }
    }

    return Error();
}

} // namespace utils
} // namespace certforge
