#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "certforge/types.hpp"
#include "certforge/pki/issuer.hpp"
#include "certforge/pki/reuse.hpp"
#include "certforge/pki/signer.hpp"

namespace certforge {
namespace admin {

struct CreateServerCertOptions {
    std::shared_ptr<pki::SignerCertOptions> signerCertOptions;

    std::string certFile;
    std::string keyFile;

    std::vector<std::string> hostnames;
    int expireDays = DefaultCertificateLifetimeInDays;
    // 为false时，若现有证书满足要求则保留
    bool overwrite = true;

    std::string keyAlgorithm = RSA_KEY;
    int keyBits = 0;

    pki::ReusePolicy reusePolicy;

    // Validate checks the options without touching the filesystem. The output
    // paths must differ from each other and from every signer file.
    Error Validate() const;
};

struct ServerCertResult {
    // 新签发时非空
    std::shared_ptr<pki::IssuedCertificate> issued;
    // 写入磁盘（或保留）的证书链与私钥
    std::vector<std::shared_ptr<utils::Certificate>> certs;
    std::shared_ptr<crypto::PrivateKey> key;
    bool written = false;
};

// CreateServerCert makes sure certFile/keyFile hold a server certificate for
// the requested hostnames signed by the configured signer. With overwrite
// unset, existing material that still satisfies the request is kept and
// written is false.
Result<ServerCertResult> CreateServerCert(
    const CreateServerCertOptions& options,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// WriteServerCert issues a new certificate from an already resolved signer and
// writes it to certFile/keyFile. The signer's serial is committed only after
// both files are in place; if that commit fails the previous files are
// restored and the error is returned.
Result<ServerCertResult> WriteServerCert(
    const CreateServerCertOptions& options,
    const pki::SignerMaterial& signer,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

} // namespace admin
} // namespace certforge
