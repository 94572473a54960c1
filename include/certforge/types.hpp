#pragma once

#include <string>
#include <utility>

namespace certforge {

// 密钥算法常量
const std::string RSA_KEY   = "rsa";
const std::string ECDSA_KEY = "ecdsa";

// 证书有效期默认值（天）
const int DefaultCertificateLifetimeInDays = 365 * 2;
const int DefaultCACertificateLifetimeInDays = 365 * 5;

// 错误码
enum class ErrorCode {
    None = 0,
    ValidationError,
    EmptyHostnameSet,
    InvalidHostname,
    SignerNotFound,
    InvalidSignerMaterial,
    SerialExhausted,
    SigningFailed,
    WriteFailed
};

inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::EmptyHostnameSet: return "EmptyHostnameSet";
        case ErrorCode::InvalidHostname: return "InvalidHostname";
        case ErrorCode::SignerNotFound: return "SignerNotFound";
        case ErrorCode::InvalidSignerMaterial: return "InvalidSignerMaterial";
        case ErrorCode::SerialExhausted: return "SerialExhausted";
        case ErrorCode::SigningFailed: return "SigningFailed";
        case ErrorCode::WriteFailed: return "WriteFailed";
        default: return "Unknown";
    }
}

// 错误类型
class Error {
public:
    Error() : code_(ErrorCode::None) {}
    Error(ErrorCode code, const std::string& message) : code_(code), message_(message) {}

    const std::string& what() const { return message_; }
    bool ok() const { return code_ == ErrorCode::None; }
    bool hasError() const { return code_ != ErrorCode::None; }
    ErrorCode code() const { return code_; }

    // EmptyHostnameSet and InvalidHostname are refinements of ValidationError.
    bool isValidationError() const {
        return code_ == ErrorCode::ValidationError ||
               code_ == ErrorCode::EmptyHostnameSet ||
               code_ == ErrorCode::InvalidHostname;
    }

    std::string String() const {
        return errorCodeToString(code_) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// 结果类型
template<typename T>
class Result {
public:
    Result() : error_(ErrorCode::ValidationError, "empty result"), hasError_(true) {}
    Result(const T& value) : value_(value), hasError_(false) {}
    Result(T&& value) : value_(std::move(value)), hasError_(false) {}
    Result(const Error& error) : error_(error), hasError_(true) {}

    bool ok() const { return !hasError_; }
    const T& value() const & { return value_; }
    T&& value() && { return std::move(value_); }
    const Error& error() const { return error_; }

private:
    T value_;
    Error error_;
    bool hasError_;
};

} // namespace certforge
