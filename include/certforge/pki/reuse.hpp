#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "certforge/crypto/keys.hpp"
#include "certforge/pki/hostnames.hpp"
#include "certforge/utils/x509.hpp"

namespace certforge {
namespace pki {

// 两个文件都不存在
struct SnapshotAbsent {};

// 文件不完整、无法解析或密钥与证书不匹配
struct SnapshotUnreadable {
    std::string reason;
};

struct SnapshotValid {
    // 叶子证书在前，其后为证书文件中的其余证书
    std::vector<std::shared_ptr<utils::Certificate>> certs;
    std::shared_ptr<crypto::PrivateKey> key;

    const utils::Certificate& Leaf() const { return *certs.front(); }
};

using ExistingCertificateSnapshot = std::variant<SnapshotAbsent, SnapshotUnreadable, SnapshotValid>;

// ReadExistingCertificate inspects the certificate/key pair at the given
// paths. It never fails; problems are reported as SnapshotUnreadable.
ExistingCertificateSnapshot ReadExistingCertificate(const std::string& certPath,
                                                    const std::string& keyPath);

// ReusePolicy decides how much validity an existing certificate must have
// left before it is kept.
struct ReusePolicy {
    enum class Threshold {
        // not_after >= now + expireDays
        FullRequestedWindow,
        // not_after - now >= fraction * expireDays
        GraceFraction
    };

    Threshold threshold = Threshold::FullRequestedWindow;
    double fraction = 1.0;

    static ReusePolicy FullWindow() { return ReusePolicy(); }
    static ReusePolicy Grace(double fraction) {
        ReusePolicy policy;
        policy.threshold = Threshold::GraceFraction;
        policy.fraction = fraction;
        return policy;
    }

    std::string String() const;
};

struct ReuseDecision {
    bool reuse = false;
    std::string reason;
};

// EvaluateReuse explains whether snapshot can stand in for a new certificate
// covering requested for expireDays.
ReuseDecision EvaluateReuse(const ExistingCertificateSnapshot& snapshot,
                            const SubjectAltNameSet& requested,
                            int expireDays,
                            std::chrono::system_clock::time_point now,
                            const ReusePolicy& policy = ReusePolicy());

// ShouldReuse is EvaluateReuse(...).reuse.
bool ShouldReuse(const ExistingCertificateSnapshot& snapshot,
                 const SubjectAltNameSet& requested,
                 int expireDays,
                 std::chrono::system_clock::time_point now = std::chrono::system_clock::now(),
                 const ReusePolicy& policy = ReusePolicy());

// SANsOf returns the subject alternative names carried by cert.
SubjectAltNameSet SANsOf(const utils::Certificate& cert);

} // namespace pki
} // namespace certforge
