#include "certforge/pki/hostnames.hpp"
#include "certforge/utils/logger.hpp"
#include <arpa/inet.h>
#include <algorithm>
#include <cctype>
#include <iterator>

namespace certforge {
namespace pki {

namespace {

const size_t MaxDNSNameLength = 253;
const size_t MaxDNSLabelLength = 63;

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::vector<std::string> splitLabels(const std::string& name) {
    std::vector<std::string> labels;
    size_t start = 0;
    while (true) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos) {
            labels.push_back(name.substr(start));
            break;
        }
        labels.push_back(name.substr(start, dot - start));
        start = dot + 1;
    }
    return labels;
}

// LDH label: letters, digits, hyphen; no leading or trailing hyphen
bool isValidLabel(const std::string& label) {
    if (label.empty() || label.size() > MaxDNSLabelLength) return false;
    if (label.front() == '-' || label.back() == '-') return false;

    return std::all_of(label.begin(), label.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-';
    });
}

} // namespace

std::vector<std::string> SubjectAltNameSet::List() const {
    std::vector<std::string> all(dnsNames_.begin(), dnsNames_.end());
    all.insert(all.end(), ipAddresses_.begin(), ipAddresses_.end());
    std::sort(all.begin(), all.end());
    return all;
}

bool SubjectAltNameSet::IsSubsetOf(const SubjectAltNameSet& other) const {
    return std::includes(other.dnsNames_.begin(), other.dnsNames_.end(),
                         dnsNames_.begin(), dnsNames_.end()) &&
           std::includes(other.ipAddresses_.begin(), other.ipAddresses_.end(),
                         ipAddresses_.begin(), ipAddresses_.end());
}

std::vector<std::string> SubjectAltNameSet::Missing(const SubjectAltNameSet& other) const {
    std::vector<std::string> missing;
    std::set_difference(dnsNames_.begin(), dnsNames_.end(),
                        other.dnsNames_.begin(), other.dnsNames_.end(),
                        std::back_inserter(missing));
    std::set_difference(ipAddresses_.begin(), ipAddresses_.end(),
                        other.ipAddresses_.begin(), other.ipAddresses_.end(),
                        std::back_inserter(missing));
    std::sort(missing.begin(), missing.end());
    return missing;
}

std::string CanonicalIPAddress(const std::string& value) {
    unsigned char buf[16];
    char text[INET6_ADDRSTRLEN] = {0};

    if (inet_pton(AF_INET, value.c_str(), buf) == 1) {
        if (inet_ntop(AF_INET, buf, text, sizeof(text))) return text;
    } else if (inet_pton(AF_INET6, value.c_str(), buf) == 1) {
        if (inet_ntop(AF_INET6, buf, text, sizeof(text))) return text;
    }
    return "";
}

bool IsIPAddress(const std::string& value) {
    return !CanonicalIPAddress(value).empty();
}

bool IsValidDNSName(const std::string& value) {
    if (value.empty() || value.size() > MaxDNSNameLength) return false;

    std::vector<std::string> labels = splitLabels(value);
    for (size_t i = 0; i < labels.size(); ++i) {
        const std::string& label = labels[i];
        if (label == "*") {
            // 通配符只能是最左边的标签，且其后至少还有两个标签
            if (i != 0 || labels.size() < 3) return false;
            continue;
        }
        if (!isValidLabel(label)) return false;
    }
    return true;
}

Result<SubjectAltNameSet> ValidateHostnames(const std::vector<std::string>& rawHostnames) {
    if (rawHostnames.empty()) {
        return Result<SubjectAltNameSet>(Error(ErrorCode::EmptyHostnameSet,
            "at least one hostname must be provided"));
    }

    std::set<std::string> dnsNames;
    std::set<std::string> ipAddresses;

    for (const auto& raw : rawHostnames) {
        std::string entry = trim(raw);

        std::string ip = CanonicalIPAddress(entry);
        if (!ip.empty()) {
            ipAddresses.insert(ip);
            continue;
        }

        std::string name = toLower(entry);
        if (!IsValidDNSName(name)) {
            return Result<SubjectAltNameSet>(Error(ErrorCode::InvalidHostname,
                "invalid hostname or IP address: \"" + raw + "\""));
        }
        dnsNames.insert(name);
    }

    SubjectAltNameSet sans(std::move(dnsNames), std::move(ipAddresses));
    if (sans.Size() < rawHostnames.size()) {
        utils::GetLogger().Debug("Collapsed duplicate hostnames", utils::LogContext()
            .With("requested", std::to_string(rawHostnames.size()))
            .With("unique", std::to_string(sans.Size())));
    }
    return Result<SubjectAltNameSet>(std::move(sans));
}

} // namespace pki
} // namespace certforge
