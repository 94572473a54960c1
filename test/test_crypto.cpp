#include <catch2/catch_test_macros.hpp>
#include "certforge/crypto/certificate.hpp"
#include "certforge/crypto/keys.hpp"
#include "certforge/pki/signer.hpp"
#include "certforge/storage/cert_writer.hpp"
#include "test_helpers.hpp"
#include <openssl/pem.h>

using namespace certforge;
using namespace certforge::crypto;
using namespace certforge::testing;

namespace {

std::shared_ptr<PrivateKey> rsaKey() {
    auto key = GeneratePrivateKey(RSA_KEY);
    REQUIRE(key.ok());
    return key.value();
}

std::shared_ptr<utils::Certificate> selfSigned(const PrivateKey& key,
                                               utils::CertTime notBefore,
                                               utils::CertTime notAfter) {
    CertificateTemplate tmpl;
    tmpl.commonName = "crypto-test-ca";
    tmpl.notBefore = notBefore;
    tmpl.notAfter = notAfter;
    tmpl.serial = 1;
    tmpl.isCA = true;
    return SignCertificate(tmpl, key, key, nullptr);
}

} // namespace

TEST_CASE("GeneratePrivateKey", "[keys]") {
    QuietLogs();

    SECTION("RSA default size") {
        auto key = rsaKey();
        REQUIRE(key->Algorithm() == RSA_KEY);
        REQUIRE(key->Bits() == 2048);
    }

    SECTION("ECDSA curves") {
        for (int bits : {256, 384, 521}) {
            auto key = GeneratePrivateKey(ECDSA_KEY, bits);
            REQUIRE(key.ok());
            REQUIRE(key.value()->Algorithm() == ECDSA_KEY);
            REQUIRE(key.value()->Bits() == bits);
        }
        REQUIRE(GeneratePrivateKey(ECDSA_KEY, 128).error().code() == ErrorCode::ValidationError);
    }

    SECTION("rejections") {
        REQUIRE(GeneratePrivateKey(RSA_KEY, 1024).error().code() == ErrorCode::ValidationError);
        REQUIRE(GeneratePrivateKey("ed25519").error().code() == ErrorCode::ValidationError);
    }
}

TEST_CASE("ParsePEMPrivateKey", "[keys]") {
    QuietLogs();
    auto key = rsaKey();

    SECTION("traditional PEM round trip") {
        std::vector<uint8_t> pem = key->ToPEM();
        auto parsed = ParsePEMPrivateKey(pem);
        REQUIRE(parsed.ok());
        REQUIRE(parsed.value()->PublicKeyDER() == key->PublicKeyDER());
    }

    SECTION("encrypted keys are refused") {
        std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), BIO_free);
        const char* pass = "secret";
        REQUIRE(PEM_write_bio_PrivateKey(bio.get(), key->GetEVPKey(), EVP_aes_256_cbc(),
                                         reinterpret_cast<const unsigned char*>(pass), 6,
                                         nullptr, nullptr) == 1);
        char* data = nullptr;
        long len = BIO_get_mem_data(bio.get(), &data);
        std::vector<uint8_t> pem(data, data + len);

        auto parsed = ParsePEMPrivateKey(pem);
        REQUIRE_FALSE(parsed.ok());
        REQUIRE(parsed.error().code() == ErrorCode::InvalidSignerMaterial);
    }

    SECTION("empty and garbage input") {
        REQUIRE_FALSE(ParsePEMPrivateKey({}).ok());
        REQUIRE_FALSE(ParsePEMPrivateKey(Bytes("not a key")).ok());
    }
}

TEST_CASE("Certificate bundle handling", "[x509]") {
    QuietLogs();
    auto key = rsaKey();
    auto now = utils::ToCertTime(std::chrono::system_clock::now());
    auto ca = selfSigned(*key, now - std::chrono::hours(1), now + std::chrono::hours(24));

    SECTION("chain to PEM and back") {
        auto pem = utils::CertChainToPEM({ca, ca});
        REQUIRE(pem.ok());
        auto bundle = utils::LoadCertBundleFromPEM(pem.value());
        REQUIRE(bundle.size() == 2);
        REQUIRE(bundle[0]->ToDER() == ca->ToDER());
    }

    SECTION("null certificate in a chain") {
        auto pem = utils::CertChainToPEM({ca, nullptr});
        REQUIRE_FALSE(pem.ok());
    }

    SECTION("bundle errors") {
        REQUIRE_THROWS_AS(utils::LoadCertBundleFromPEM(Bytes("no pem here")), utils::CertificateError);
        REQUIRE_THROWS_AS(utils::LoadCertBundleFromPEM(key->ToPEM()), utils::CertificateError);
        REQUIRE_THROWS_AS(utils::LoadCertBundleFromFile("/nonexistent/certforge.crt"), utils::CertificateError);
    }

    SECTION("serial and names") {
        REQUIRE(ca->GetSerialNumber() == 1);
        REQUIRE(ca->GetCommonName() == "crypto-test-ca");
        REQUIRE(ca->GetSubject() == ca->GetIssuer());
        REQUIRE(ca->DNSNames().empty());
    }
}

TEST_CASE("ValidateCertificate", "[x509]") {
    QuietLogs();
    auto key = rsaKey();
    auto now = utils::ToCertTime(std::chrono::system_clock::now());

    auto current = selfSigned(*key, now - std::chrono::hours(1), now + std::chrono::hours(24));
    REQUIRE_FALSE(utils::ValidateCertificate(*current, true).hasError());

    auto expired = selfSigned(*key, now - std::chrono::hours(48), now - std::chrono::hours(24));
    REQUIRE(utils::ValidateCertificate(*expired, true).code() == ErrorCode::InvalidSignerMaterial);
    REQUIRE_FALSE(utils::ValidateCertificate(*expired, false).hasError());

    auto future = selfSigned(*key, now + std::chrono::hours(24), now + std::chrono::hours(48));
    REQUIRE(utils::ValidateCertificate(*future, true).hasError());

    REQUIRE_THROWS_AS(selfSigned(*key, now, now - std::chrono::hours(1)), utils::CertificateError);
}

TEST_CASE("ResolveSigner refuses an expired CA", "[x509]") {
    QuietLogs();
    TempDir dir;
    auto key = rsaKey();
    auto now = utils::ToCertTime(std::chrono::system_clock::now());
    auto expired = selfSigned(*key, now - std::chrono::hours(48), now - std::chrono::hours(24));

    REQUIRE_FALSE(storage::WriteCertificatePair(expired->ToPEM(), key->ToPEM(),
                                                dir.Path("ca.crt"), dir.Path("ca.key")).hasError());

    pki::SignerCertOptions options{dir.Path("ca.crt"), dir.Path("ca.key"), ""};
    auto signer = pki::ResolveSigner(options);
    REQUIRE_FALSE(signer.ok());
    REQUIRE(signer.error().code() == ErrorCode::InvalidSignerMaterial);
}
