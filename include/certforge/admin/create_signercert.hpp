#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "certforge/types.hpp"
#include "certforge/pki/signer.hpp"

namespace certforge {
namespace admin {

struct CreateSignerCertOptions {
    std::string certFile;
    std::string keyFile;
    std::string serialFile;

    // 为空时使用 "certforge-signer@<unix time>"
    std::string name;
    int expireDays = DefaultCACertificateLifetimeInDays;
    bool overwrite = true;

    Error Validate() const;
};

struct SignerCertResult {
    std::shared_ptr<pki::SignerMaterial> signer;
    bool written = false;
};

// CreateSignerCert writes a new self-signed CA to certFile/keyFile and resets
// the serial file. With overwrite unset, a loadable existing CA is kept.
Result<SignerCertResult> CreateSignerCert(
    const CreateSignerCertOptions& options,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// DefaultSignerName returns "certforge-signer@<unix seconds of now>".
std::string DefaultSignerName(std::chrono::system_clock::time_point now);

} // namespace admin
} // namespace certforge
