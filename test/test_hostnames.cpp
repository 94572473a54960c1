#include <catch2/catch_test_macros.hpp>
#include "certforge/pki/hostnames.hpp"

using namespace certforge;
using namespace certforge::pki;

TEST_CASE("ValidateHostnames accepts DNS names and IP literals", "[hostnames]") {
    SECTION("普通域名与IP") {
        auto sans = ValidateHostnames({"api.example.com", "10.0.0.1", "::1"});
        REQUIRE(sans.ok());
        REQUIRE(sans.value().DNSNames() == std::set<std::string>{"api.example.com"});
        REQUIRE(sans.value().IPAddresses() == std::set<std::string>{"10.0.0.1", "::1"});
    }

    SECTION("leading wildcard") {
        auto sans = ValidateHostnames({"*.foo.bar"});
        REQUIRE(sans.ok());
        REQUIRE(sans.value().List() == std::vector<std::string>{"*.foo.bar"});
    }

    SECTION("single label and localhost") {
        REQUIRE(ValidateHostnames({"localhost"}).ok());
        REQUIRE(ValidateHostnames({"my-service"}).ok());
    }

    SECTION("DNS names are lower-cased and whitespace trimmed") {
        auto sans = ValidateHostnames({"  API.Example.COM "});
        REQUIRE(sans.ok());
        REQUIRE(sans.value().DNSNames() == std::set<std::string>{"api.example.com"});
    }

    SECTION("IPv6 literals are canonicalized") {
        auto sans = ValidateHostnames({"2001:DB8:0:0:0:0:0:1"});
        REQUIRE(sans.ok());
        REQUIRE(sans.value().IPAddresses() == std::set<std::string>{"2001:db8::1"});
    }

    SECTION("duplicates collapse") {
        auto sans = ValidateHostnames({"a.example.com", "A.example.com", "a.example.com"});
        REQUIRE(sans.ok());
        REQUIRE(sans.value().Size() == 1);
    }
}

TEST_CASE("ValidateHostnames rejects bad input", "[hostnames]") {
    SECTION("empty input") {
        auto sans = ValidateHostnames({});
        REQUIRE_FALSE(sans.ok());
        REQUIRE(sans.error().code() == ErrorCode::EmptyHostnameSet);
        REQUIRE(sans.error().isValidationError());
    }

    SECTION("misplaced or partial wildcards") {
        for (const std::string& bad : {"foo.*.bar", "f*.example.com", "*.com", "*", "*.*.example.com"}) {
            INFO(bad);
            auto sans = ValidateHostnames({"ok.example.com", bad});
            REQUIRE_FALSE(sans.ok());
            REQUIRE(sans.error().code() == ErrorCode::InvalidHostname);
            REQUIRE(sans.error().what().find(bad) != std::string::npos);
        }
    }

    SECTION("label syntax") {
        std::string longLabel(64, 'a');
        for (const std::string& bad : {std::string(""), std::string("   "), std::string("-foo.example.com"),
                                        std::string("foo-.example.com"), std::string("foo..example.com"),
                                        std::string("foo_bar.example.com"), std::string("exa mple.com"),
                                        longLabel + ".example.com"}) {
            INFO(bad);
            auto sans = ValidateHostnames({bad});
            REQUIRE_FALSE(sans.ok());
            REQUIRE(sans.error().code() == ErrorCode::InvalidHostname);
        }
    }

    SECTION("total length above 253") {
        std::string label(60, 'a');
        std::string name = label + "." + label + "." + label + "." + label + ".com";
        REQUIRE(name.size() > 253);
        REQUIRE_FALSE(IsValidDNSName(name));
    }
}

TEST_CASE("SubjectAltNameSet compares by membership", "[hostnames]") {
    auto a = ValidateHostnames({"b.example.com", "a.example.com", "10.0.0.1"});
    auto b = ValidateHostnames({"10.0.0.1", "a.example.com", "b.example.com"});
    auto sub = ValidateHostnames({"a.example.com"});
    REQUIRE(a.ok());
    REQUIRE(b.ok());
    REQUIRE(sub.ok());

    REQUIRE(a.value() == b.value());
    REQUIRE(sub.value().IsSubsetOf(a.value()));
    REQUIRE_FALSE(a.value().IsSubsetOf(sub.value()));
    REQUIRE(a.value().Missing(sub.value()) == std::vector<std::string>{"10.0.0.1", "b.example.com"});

    // 排序后的第一项作为CN
    REQUIRE(a.value().List().front() == "10.0.0.1");
}
