#include "certforge/crypto/certificate.hpp"
#include "certforge/utils/logger.hpp"
#include <openssl/x509v3.h>
#include <openssl/err.h>

namespace certforge {
namespace crypto {

namespace {

using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;

void setTime(X509* cert, const utils::CertTime& tp, bool notBefore) {
    if (tp > utils::MaxCertificateTime) {
        throw utils::CertificateError("validity time is beyond 9999-12-31");
    }
    std::unique_ptr<ASN1_TIME, decltype(&ASN1_TIME_free)> t(
        ASN1_TIME_set(nullptr, static_cast<time_t>(tp.time_since_epoch().count())), ASN1_TIME_free);
    if (!t) {
        throw utils::CertificateError("failed to encode validity time");
    }

    int rc = notBefore ? X509_set1_notBefore(cert, t.get()) : X509_set1_notAfter(cert, t.get());
    if (rc != 1) {
        throw utils::CertificateError("failed to set validity time");
    }
}

// 通过配置字符串添加扩展，ctx中需已设置issuer/subject
void addConfExtension(X509* cert, X509V3_CTX* ctx, int nid, const std::string& value) {
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, ctx, nid, value.c_str());
    if (!ext) {
        throw utils::CertificateError("failed to create extension " + std::string(OBJ_nid2sn(nid)) + "=" + value);
    }

    int rc = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    if (rc != 1) {
        throw utils::CertificateError("failed to add extension " + std::string(OBJ_nid2sn(nid)));
    }
}

void addSubjectAltNames(X509* cert, const CertificateTemplate& tmpl) {
    if (tmpl.dnsNames.empty() && tmpl.ipAddresses.empty()) return;

    std::unique_ptr<GENERAL_NAMES, decltype(&GENERAL_NAMES_free)> names(
        sk_GENERAL_NAME_new_null(), GENERAL_NAMES_free);
    if (!names) {
        throw utils::CertificateError("failed to allocate subjectAltName");
    }

    for (const auto& dns : tmpl.dnsNames) {
        GENERAL_NAME* gen = GENERAL_NAME_new();
        ASN1_IA5STRING* ia5 = ASN1_IA5STRING_new();
        if (!gen || !ia5 || ASN1_STRING_set(ia5, dns.data(), static_cast<int>(dns.size())) != 1) {
            GENERAL_NAME_free(gen);
            ASN1_IA5STRING_free(ia5);
            throw utils::CertificateError("failed to encode DNS name " + dns);
        }
        GENERAL_NAME_set0_value(gen, GEN_DNS, ia5);
        if (sk_GENERAL_NAME_push(names.get(), gen) <= 0) {
            GENERAL_NAME_free(gen);
            throw utils::CertificateError("failed to append DNS name " + dns);
        }
    }

    for (const auto& ip : tmpl.ipAddresses) {
        ASN1_OCTET_STRING* octets = a2i_IPADDRESS(ip.c_str());
        GENERAL_NAME* gen = GENERAL_NAME_new();
        if (!octets || !gen) {
            ASN1_OCTET_STRING_free(octets);
            GENERAL_NAME_free(gen);
            throw utils::CertificateError("failed to encode IP address " + ip);
        }
        GENERAL_NAME_set0_value(gen, GEN_IPADD, octets);
        if (sk_GENERAL_NAME_push(names.get(), gen) <= 0) {
            GENERAL_NAME_free(gen);
            throw utils::CertificateError("failed to append IP address " + ip);
        }
    }

    if (X509_add1_ext_i2d(cert, NID_subject_alt_name, names.get(), 0, X509V3_ADD_DEFAULT) != 1) {
        throw utils::CertificateError("failed to add subjectAltName extension");
    }
}

} // namespace

Result<ValidityWindow> NewValidityWindow(std::chrono::system_clock::time_point now, int expireDays) {
    if (expireDays <= 0) {
        return Result<ValidityWindow>(Error(ErrorCode::ValidationError,
            "expire days must be positive, got " + std::to_string(expireDays)));
    }

    ValidityWindow window;
    window.notBefore = utils::ToCertTime(now) - CertificateBackdate;

    // 以秒计算，int范围内的天数不会溢出
    std::chrono::seconds length = std::chrono::hours(24) * static_cast<int64_t>(expireDays);
    if (length > utils::MaxCertificateTime - window.notBefore) {
        return Result<ValidityWindow>(Error(ErrorCode::ValidationError,
            "expire days " + std::to_string(expireDays) + " would end after 9999-12-31"));
    }
    window.notAfter = window.notBefore + length;
    return Result<ValidityWindow>(window);
}

std::shared_ptr<utils::Certificate> SignCertificate(
    const CertificateTemplate& tmpl,
    const PrivateKey& subjectKey,
    const PrivateKey& issuerKey,
    const utils::Certificate* issuerCert
) {
    if (!subjectKey.GetEVPKey() || !issuerKey.GetEVPKey()) {
        throw utils::CertificateError("signing requires both a subject and an issuer key");
    }
    if (tmpl.notBefore >= tmpl.notAfter) {
        throw utils::CertificateError("certificate validity window is invalid");
    }

    X509Ptr cert(X509_new(), X509_free);
    if (!cert) {
        throw utils::CertificateError("failed to allocate certificate");
    }

    // 版本号 v3 = 2
    if (X509_set_version(cert.get(), 2) != 1) {
        throw utils::CertificateError("failed to set certificate version");
    }

    if (ASN1_INTEGER_set_uint64(X509_get_serialNumber(cert.get()), tmpl.serial) != 1) {
        throw utils::CertificateError("failed to set serial number " + std::to_string(tmpl.serial));
    }

    std::unique_ptr<X509_NAME, decltype(&X509_NAME_free)> subject(X509_NAME_new(), X509_NAME_free);
    if (!subject ||
        X509_NAME_add_entry_by_txt(subject.get(), "CN", MBSTRING_UTF8,
                                   reinterpret_cast<const unsigned char*>(tmpl.commonName.c_str()),
                                   -1, -1, 0) != 1) {
        throw utils::CertificateError("failed to set subject common name " + tmpl.commonName);
    }
    X509_set_subject_name(cert.get(), subject.get());

    // 自签名证书的issuer即subject
    X509_NAME* issuerName = issuerCert ? X509_get_subject_name(issuerCert->GetX509()) : subject.get();
    if (X509_set_issuer_name(cert.get(), issuerName) != 1) {
        throw utils::CertificateError("failed to set issuer name");
    }

    setTime(cert.get(), tmpl.notBefore, true);
    setTime(cert.get(), tmpl.notAfter, false);

    if (X509_set_pubkey(cert.get(), subjectKey.GetEVPKey()) != 1) {
        throw utils::CertificateError("failed to set public key");
    }

    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuerCert ? issuerCert->GetX509() : cert.get(), cert.get(), nullptr, nullptr, 0);

    if (tmpl.isCA) {
        addConfExtension(cert.get(), &ctx, NID_basic_constraints, "critical,CA:TRUE");
        addConfExtension(cert.get(), &ctx, NID_key_usage, "critical,digitalSignature,keyEncipherment,keyCertSign");
    } else {
        addConfExtension(cert.get(), &ctx, NID_basic_constraints, "critical,CA:FALSE");
        addConfExtension(cert.get(), &ctx, NID_key_usage, "critical,digitalSignature,keyEncipherment");
        addConfExtension(cert.get(), &ctx, NID_ext_key_usage, "serverAuth");
    }

    // subjectKeyIdentifier必须先于authorityKeyIdentifier添加，自签名时AKI引用自身的SKI
    addConfExtension(cert.get(), &ctx, NID_subject_key_identifier, "hash");
    addConfExtension(cert.get(), &ctx, NID_authority_key_identifier, "keyid:always");

    addSubjectAltNames(cert.get(), tmpl);

    if (X509_sign(cert.get(), issuerKey.GetEVPKey(), EVP_sha256()) == 0) {
        unsigned long code = ERR_get_error();
        char buf[256] = {0};
        ERR_error_string_n(code, buf, sizeof(buf));
        throw utils::CertificateError("failed to sign certificate for " + tmpl.commonName + ": " + buf);
    }

    utils::GetLogger().Debug("Signed certificate", utils::LogContext()
        .With("cn", tmpl.commonName)
        .With("serial", std::to_string(tmpl.serial))
        .With("ca", tmpl.isCA ? "true" : "false"));

    return std::make_shared<utils::Certificate>(cert.release());
}

} // namespace crypto
} // namespace certforge
