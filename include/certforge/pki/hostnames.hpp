#pragma once

#include <set>
#include <string>
#include <utility>
#include <vector>
#include "certforge/types.hpp"

namespace certforge {
namespace pki {

// SubjectAltNameSet is a validated, de-duplicated set of DNS names and IP
// literals. Order never matters: two sets are equal when they hold the same
// members.
class SubjectAltNameSet {
public:
    SubjectAltNameSet() = default;
    SubjectAltNameSet(std::set<std::string> dnsNames, std::set<std::string> ipAddresses)
        : dnsNames_(std::move(dnsNames)), ipAddresses_(std::move(ipAddresses)) {}

    const std::set<std::string>& DNSNames() const { return dnsNames_; }
    const std::set<std::string>& IPAddresses() const { return ipAddresses_; }

    // 所有条目的有序列表，第一项用作证书的CN
    std::vector<std::string> List() const;

    bool Empty() const { return dnsNames_.empty() && ipAddresses_.empty(); }
    size_t Size() const { return dnsNames_.size() + ipAddresses_.size(); }

    // IsSubsetOf reports whether every entry of this set is present in other.
    bool IsSubsetOf(const SubjectAltNameSet& other) const;

    // Missing returns the entries of this set absent from other, sorted.
    std::vector<std::string> Missing(const SubjectAltNameSet& other) const;

    bool operator==(const SubjectAltNameSet& other) const {
        return dnsNames_ == other.dnsNames_ && ipAddresses_ == other.ipAddresses_;
    }
    bool operator!=(const SubjectAltNameSet& other) const { return !(*this == other); }

private:
    std::set<std::string> dnsNames_;
    std::set<std::string> ipAddresses_;
};

// ValidateHostnames normalizes rawHostnames into a SubjectAltNameSet.
// Fails with EmptyHostnameSet for an empty input and InvalidHostname for any
// entry that is neither an IP literal nor a DNS name with at most one leading
// "*" label.
Result<SubjectAltNameSet> ValidateHostnames(const std::vector<std::string>& rawHostnames);

// 单个条目的判定，供命令行补全校验等场景复用
bool IsIPAddress(const std::string& value);
bool IsValidDNSName(const std::string& value);

// 将IP字面量转换为规范形式，非IP返回空串
std::string CanonicalIPAddress(const std::string& value);

} // namespace pki
} // namespace certforge
