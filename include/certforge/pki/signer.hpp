#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "certforge/types.hpp"
#include "certforge/crypto/keys.hpp"
#include "certforge/pki/serial.hpp"
#include "certforge/utils/x509.hpp"

namespace certforge {
namespace pki {

// SignerCertOptions locates the CA material on disk.
struct SignerCertOptions {
    std::string certFile;
    std::string keyFile;
    // 为空时使用随机序列号
    std::string serialFile;

    // Validate checks the options without touching the filesystem.
    Error Validate() const;
};

// SignerMaterial is a loaded CA: its certificate, any further certificates
// from the CA file, its private key and its serial counter.
class SignerMaterial {
public:
    SignerMaterial(std::vector<std::shared_ptr<utils::Certificate>> certs,
                   std::shared_ptr<crypto::PrivateKey> key,
                   std::shared_ptr<SerialCounter> serial);

    const utils::Certificate& Cert() const { return *certs_.front(); }
    std::shared_ptr<utils::Certificate> GetCertificate() const { return certs_.front(); }

    // Chain returns the signer certificate followed by the rest of the CA file.
    const std::vector<std::shared_ptr<utils::Certificate>>& Chain() const { return certs_; }

    const crypto::PrivateKey& Key() const { return *key_; }
    std::shared_ptr<crypto::PrivateKey> GetKey() const { return key_; }

    SerialCounter& Serial() const { return *serial_; }

private:
    std::vector<std::shared_ptr<utils::Certificate>> certs_;
    std::shared_ptr<crypto::PrivateKey> key_;
    std::shared_ptr<SerialCounter> serial_;
};

// ResolveSigner loads the CA described by options.
//   - ValidationError when options are incomplete
//   - SignerNotFound when the certificate or key file is missing
//   - InvalidSignerMaterial when either file does not parse, the key does not
//     match the certificate, the certificate is unusable, or the serial file
//     is malformed
Result<std::shared_ptr<SignerMaterial>> ResolveSigner(const SignerCertOptions& options);

// MakeSelfSignedSigner generates an RSA key and a self-signed CA certificate
// named name, valid for expireDays from now. The result uses serial as its
// counter; the CA certificate itself always carries SignerSerialNumber.
Result<std::shared_ptr<SignerMaterial>> MakeSelfSignedSigner(
    const std::string& name,
    int expireDays,
    std::shared_ptr<SerialCounter> serial,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

} // namespace pki
} // namespace certforge
