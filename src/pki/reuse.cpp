#include "certforge/pki/reuse.hpp"
#include <filesystem>
#include <sstream>
#include <system_error>

namespace certforge {
namespace pki {

namespace fs = std::filesystem;

namespace {

bool fileExists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && !ec;
}

std::string join(const std::vector<std::string>& items) {
    std::ostringstream out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out << ", ";
        out << items[i];
    }
    return out.str();
}

} // namespace

SubjectAltNameSet SANsOf(const utils::Certificate& cert) {
    std::vector<std::string> dns = cert.DNSNames();
    std::vector<std::string> ips = cert.IPAddresses();
    return SubjectAltNameSet(std::set<std::string>(dns.begin(), dns.end()),
                             std::set<std::string>(ips.begin(), ips.end()));
}

ExistingCertificateSnapshot ReadExistingCertificate(const std::string& certPath,
                                                    const std::string& keyPath) {
    bool certExists = fileExists(certPath);
    bool keyExists = fileExists(keyPath);

    if (!certExists && !keyExists) {
        return SnapshotAbsent{};
    }
    if (!certExists) {
        return SnapshotUnreadable{"key " + keyPath + " exists without certificate " + certPath};
    }
    if (!keyExists) {
        return SnapshotUnreadable{"certificate " + certPath + " exists without key " + keyPath};
    }

    SnapshotValid valid;
    std::vector<uint8_t> keyBytes;
    try {
        valid.certs = utils::LoadCertBundleFromFile(certPath);
        keyBytes = utils::ReadFileBytes(keyPath);
    } catch (const utils::CertificateError& e) {
        return SnapshotUnreadable{e.what()};
    }

    auto key = crypto::ParsePEMPrivateKey(keyBytes);
    if (!key.ok()) {
        return SnapshotUnreadable{"key " + keyPath + ": " + key.error().what()};
    }
    if (!key.value()->MatchesCertificate(valid.Leaf().GetX509())) {
        return SnapshotUnreadable{"key " + keyPath + " does not match certificate " + certPath};
    }

    valid.key = key.value();
    return valid;
}

std::string ReusePolicy::String() const {
    if (threshold == Threshold::GraceFraction) {
        std::ostringstream out;
        out << "GraceFraction(" << fraction << ")";
        return out.str();
    }
    return "FullRequestedWindow";
}

ReuseDecision EvaluateReuse(const ExistingCertificateSnapshot& snapshot,
                            const SubjectAltNameSet& requested,
                            int expireDays,
                            std::chrono::system_clock::time_point now,
                            const ReusePolicy& policy) {
    if (std::holds_alternative<SnapshotAbsent>(snapshot)) {
        return {false, "no existing certificate"};
    }
    if (const auto* unreadable = std::get_if<SnapshotUnreadable>(&snapshot)) {
        return {false, "existing certificate is unusable: " + unreadable->reason};
    }
    if (expireDays <= 0) {
        return {false, "expire days must be positive"};
    }

    const auto& valid = std::get<SnapshotValid>(snapshot);
    const utils::Certificate& leaf = valid.Leaf();

    // 已有证书的SAN必须包含全部请求的条目
    std::vector<std::string> missing = requested.Missing(SANsOf(leaf));
    if (!missing.empty()) {
        return {false, "existing certificate is missing hostnames: " + join(missing)};
    }

    using seconds = std::chrono::duration<double>;
    seconds requestedWindow = std::chrono::hours(24) * static_cast<int64_t>(expireDays);
    seconds required = requestedWindow;
    if (policy.threshold == ReusePolicy::Threshold::GraceFraction) {
        required = requestedWindow * policy.fraction;
    }

    // 以秒比较，到期时间晚于2262年的证书也不会溢出
    std::chrono::seconds remaining = leaf.GetNotAfter() - utils::ToCertTime(now);
    if (remaining < required) {
        return {false, "existing certificate does not have enough validity left under " + policy.String()};
    }

    return {true, "existing certificate covers the requested hostnames and validity"};
}

bool ShouldReuse(const ExistingCertificateSnapshot& snapshot,
                 const SubjectAltNameSet& requested,
                 int expireDays,
                 std::chrono::system_clock::time_point now,
                 const ReusePolicy& policy) {
    return EvaluateReuse(snapshot, requested, expireDays, now, policy).reuse;
}

} // namespace pki
} // namespace certforge
