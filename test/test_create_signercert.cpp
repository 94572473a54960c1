#include <catch2/catch_test_macros.hpp>
#include "certforge/admin/create_signercert.hpp"
#include "test_helpers.hpp"
#include <openssl/x509v3.h>

using namespace certforge;
using namespace certforge::admin;
using namespace certforge::testing;

TEST_CASE("CreateSignerCert writes a self-signed CA", "[signercert]") {
    QuietLogs();
    TempDir dir;

    CreateSignerCertOptions options;
    options.certFile = dir.Path("ca/ca.crt");
    options.keyFile = dir.Path("ca/ca.key");
    options.serialFile = dir.Path("ca/ca.serial");

    auto now = std::chrono::system_clock::now();
    auto result = CreateSignerCert(options, now);
    REQUIRE(result.ok());
    REQUIRE(result.value().written);

    auto bundle = utils::LoadCertBundleFromFile(options.certFile);
    REQUIRE(bundle.size() == 1);
    const auto& cert = *bundle.front();

    REQUIRE(cert.GetCommonName() == DefaultSignerName(now));
    REQUIRE(cert.GetCommonName().rfind("certforge-signer@", 0) == 0);
    REQUIRE(cert.IsCA());
    REQUIRE(cert.IsSignedBy(cert));
    REQUIRE(cert.GetSerialNumber() == pki::SignerSerialNumber);
    REQUIRE(cert.GetNotAfter() - cert.GetNotBefore() ==
            std::chrono::hours(24 * DefaultCACertificateLifetimeInDays));

    uint32_t ku = X509_get_key_usage(cert.GetX509());
    REQUIRE((ku & KU_KEY_CERT_SIGN) != 0);
    REQUIRE((ku & KU_DIGITAL_SIGNATURE) != 0);

    REQUIRE(ReadText(options.serialFile) == "01\n");
    REQUIRE(FileMode(options.keyFile) == 0600);

    std::string keyPEM = ReadText(options.keyFile);
    REQUIRE(keyPEM.find("BEGIN RSA PRIVATE KEY") != std::string::npos);
}

TEST_CASE("CreateSignerCert overwrite semantics", "[signercert]") {
    QuietLogs();
    TempDir dir;
    TestCA ca = CreateTestCA(dir);
    WriteText(ca.serialFile, "2A\n");
    std::string certBefore = ReadText(ca.certFile);

    CreateSignerCertOptions options;
    options.certFile = ca.certFile;
    options.keyFile = ca.keyFile;
    options.serialFile = ca.serialFile;
    options.name = "replacement";

    SECTION("existing CA is kept without overwrite") {
        options.overwrite = false;
        auto result = CreateSignerCert(options);
        REQUIRE(result.ok());
        REQUIRE_FALSE(result.value().written);
        REQUIRE(result.value().signer->Cert().GetCommonName() == "certforge-test-ca");
        REQUIRE(ReadText(ca.certFile) == certBefore);
        REQUIRE(ReadText(ca.serialFile) == "2A\n");
    }

    SECTION("overwrite replaces the CA and resets the serial") {
        auto result = CreateSignerCert(options);
        REQUIRE(result.ok());
        REQUIRE(result.value().written);
        REQUIRE(ReadText(ca.certFile) != certBefore);
        REQUIRE(ReadText(ca.serialFile) == "01\n");
        REQUIRE(utils::LoadCertBundleFromFile(ca.certFile).front()->GetCommonName() == "replacement");
    }

    SECTION("broken CA is not replaced without overwrite") {
        WriteText(ca.keyFile, "garbage");
        options.overwrite = false;
        auto result = CreateSignerCert(options);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error().code() == ErrorCode::InvalidSignerMaterial);
        REQUIRE(ReadText(ca.certFile) == certBefore);
    }
}

TEST_CASE("CreateSignerCert without a serial file", "[signercert]") {
    QuietLogs();
    TempDir dir;

    CreateSignerCertOptions options;
    options.certFile = dir.Path("ca.crt");
    options.keyFile = dir.Path("ca.key");
    options.name = "random-serials";
    options.overwrite = false;

    auto result = CreateSignerCert(options);
    REQUIRE(result.ok());
    REQUIRE(result.value().written);
    REQUIRE(result.value().signer->Serial().Describe() == "random");
    REQUIRE_FALSE(Exists(dir.Path("ca.serial")));
}

TEST_CASE("CreateSignerCertOptions validation", "[signercert]") {
    CreateSignerCertOptions options;
    REQUIRE(options.Validate().code() == ErrorCode::ValidationError);

    options.certFile = "ca.crt";
    REQUIRE(options.Validate().code() == ErrorCode::ValidationError);

    options.keyFile = "ca.key";
    REQUIRE_FALSE(options.Validate().hasError());

    options.expireDays = 0;
    REQUIRE(options.Validate().code() == ErrorCode::ValidationError);
}
