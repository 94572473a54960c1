#include <catch2/catch_test_macros.hpp>
#include "certforge/utils/config.hpp"
#include "test_helpers.hpp"

using namespace certforge;
using namespace certforge::utils;
using namespace certforge::testing;

TEST_CASE("ParseConfig reads every key", "[config]") {
    auto config = ParseConfig(R"({
        "signer": {"cert": "/ca/ca.crt", "key": "/ca/ca.key", "serial": "/ca/ca.serial"},
        "cert": "/out/server.crt",
        "key": "/out/server.key",
        "hostnames": ["a.example.com", "10.0.0.1"],
        "expireDays": 90,
        "overwrite": false,
        "keyAlgorithm": "ecdsa",
        "keyBits": 384,
        "logging": {"level": "debug", "format": "json", "output": "file", "file": "/var/log/certforge.log"}
    })");
    REQUIRE(config.ok());

    const FileConfig& c = config.value();
    REQUIRE(*c.signerCert == "/ca/ca.crt");
    REQUIRE(*c.signerKey == "/ca/ca.key");
    REQUIRE(*c.signerSerial == "/ca/ca.serial");
    REQUIRE(*c.cert == "/out/server.crt");
    REQUIRE(*c.key == "/out/server.key");
    REQUIRE(*c.hostnames == std::vector<std::string>{"a.example.com", "10.0.0.1"});
    REQUIRE(*c.expireDays == 90);
    REQUIRE(*c.overwrite == false);
    REQUIRE(*c.keyAlgorithm == "ecdsa");
    REQUIRE(*c.keyBits == 384);

    LoggingConfig logging;
    ApplyLogging(c, logging);
    REQUIRE(logging.level == "debug");
    REQUIRE(logging.format == "json");
    REQUIRE(logging.output == "file");
    REQUIRE(logging.file == "/var/log/certforge.log");
}

TEST_CASE("ParseConfig leaves absent keys unset", "[config]") {
    auto config = ParseConfig(R"({"cert": "server.crt"})");
    REQUIRE(config.ok());
    REQUIRE(config.value().cert.has_value());
    REQUIRE_FALSE(config.value().key.has_value());
    REQUIRE_FALSE(config.value().overwrite.has_value());
    REQUIRE_FALSE(config.value().signerCert.has_value());

    LoggingConfig logging;
    ApplyLogging(config.value(), logging);
    REQUIRE(logging.level == "info");
    REQUIRE(logging.format == "text");
}

TEST_CASE("ParseConfig rejects malformed documents", "[config]") {
    for (const std::string& bad : {std::string("{"), std::string("[1, 2]"), std::string("\"text\""),
                                   std::string(R"({"expireDays": "ninety"})"),
                                   std::string(R"({"overwrite": 1})"),
                                   std::string(R"({"hostnames": "a.example.com"})"),
                                   std::string(R"({"signer": "ca.crt"})")}) {
        INFO(bad);
        auto config = ParseConfig(bad);
        REQUIRE_FALSE(config.ok());
        REQUIRE(config.error().code() == ErrorCode::ValidationError);
    }
}

TEST_CASE("LoadConfigFile", "[config]") {
    TempDir dir;

    SECTION("missing file") {
        auto config = LoadConfigFile(dir.Path("absent.json"));
        REQUIRE_FALSE(config.ok());
        REQUIRE(config.error().code() == ErrorCode::ValidationError);
    }

    SECTION("file on disk") {
        WriteText(dir.Path("certforge.json"), R"({"expireDays": 30})");
        auto config = LoadConfigFile(dir.Path("certforge.json"));
        REQUIRE(config.ok());
        REQUIRE(*config.value().expireDays == 30);
    }

    SECTION("error names the file") {
        WriteText(dir.Path("broken.json"), "{ not json");
        auto config = LoadConfigFile(dir.Path("broken.json"));
        REQUIRE_FALSE(config.ok());
        REQUIRE(config.error().what().find("broken.json") != std::string::npos);
    }
}
