#include "certforge/pki/serial.hpp"
#include "certforge/storage/cert_writer.hpp"
#include "certforge/utils/logger.hpp"
#include "certforge/utils/x509.hpp"
#include <openssl/rand.h>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <limits>
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#include <sys/stat.h>

namespace certforge {
namespace pki {

namespace {

class FileSerialReservation : public SerialReservation {
public:
    FileSerialReservation(std::string path, uint64_t serial, std::unique_ptr<FileLock> lock)
        : path_(std::move(path)), serial_(serial), lock_(std::move(lock)) {}

    ~FileSerialReservation() override {
        if (!committed_) {
            utils::GetLogger().Debug("Releasing uncommitted serial reservation", utils::LogContext()
                .With("serialFile", path_)
                .With("serial", std::to_string(serial_)));
        }
    }

    uint64_t Serial() const override { return serial_; }
    bool Committed() const override { return committed_; }

    Error Commit() override {
        if (committed_) return Error();
        if (!lock_ || !lock_->Held()) {
            return Error(ErrorCode::WriteFailed, "serial reservation is no longer locked");
        }

        std::string content = FormatSerial(serial_);
        Error err = storage::WriteFileAtomic(path_, std::vector<uint8_t>(content.begin(), content.end()),
                                             storage::CertificateFileMode);
        if (err.hasError()) {
            return Error(ErrorCode::WriteFailed, "failed to record serial " + std::to_string(serial_) +
                         " in " + path_ + ": " + err.what());
        }

        committed_ = true;
        lock_->Unlock();
        return Error();
    }

private:
    std::string path_;
    uint64_t serial_;
    std::unique_ptr<FileLock> lock_;
    bool committed_ = false;
};

class RandomSerialReservation : public SerialReservation {
public:
    explicit RandomSerialReservation(uint64_t serial) : serial_(serial) {}

    uint64_t Serial() const override { return serial_; }
    bool Committed() const override { return committed_; }
    Error Commit() override {
        committed_ = true;
        return Error();
    }

private:
    uint64_t serial_;
    bool committed_ = false;
};

Result<uint64_t> readSerialFile(const std::string& path) {
    std::vector<uint8_t> data;
    try {
        data = utils::ReadFileBytes(path);
    } catch (const utils::CertificateError& e) {
        return Result<uint64_t>(Error(ErrorCode::InvalidSignerMaterial, e.what()));
    }

    Result<uint64_t> parsed = ParseSerial(std::string(data.begin(), data.end()));
    if (!parsed.ok()) {
        return Result<uint64_t>(Error(ErrorCode::InvalidSignerMaterial,
            "serial file " + path + ": " + parsed.error().what()));
    }
    return parsed;
}

} // namespace

FileLock::FileLock(std::string path) : path_(std::move(path)) {}

FileLock::~FileLock() {
    Unlock();
}

Result<int> FileLock::openLockFile() {
    int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Result<int>(Error(ErrorCode::WriteFailed,
            "failed to open lock file " + path_ + ": " + std::strerror(errno)));
    }
    return Result<int>(fd);
}

Error FileLock::Lock() {
    if (Held()) return Error();

    Result<int> fd = openLockFile();
    if (!fd.ok()) return fd.error();

    int rc;
    do {
        rc = flock(fd.value(), LOCK_EX);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        std::string msg = "failed to lock " + path_ + ": " + std::strerror(errno);
        close(fd.value());
        return Error(ErrorCode::WriteFailed, msg);
    }
    fd_ = fd.value();
    return Error();
}

Result<bool> FileLock::TryLock() {
    if (Held()) return Result<bool>(true);

    Result<int> fd = openLockFile();
    if (!fd.ok()) return Result<bool>(fd.error());

    if (flock(fd.value(), LOCK_EX | LOCK_NB) != 0) {
        int saved = errno;
        close(fd.value());
        if (saved == EWOULDBLOCK) {
            return Result<bool>(false);
        }
        return Result<bool>(Error(ErrorCode::WriteFailed,
            "failed to lock " + path_ + ": " + std::strerror(saved)));
    }
    fd_ = fd.value();
    return Result<bool>(true);
}

void FileLock::Unlock() {
    if (fd_ < 0) return;
    // 关闭描述符即释放flock锁
    close(fd_);
    fd_ = -1;
}

std::string FormatSerial(uint64_t value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%llX", static_cast<unsigned long long>(value));

    std::string hex(buf);
    if (hex.size() % 2 != 0) {
        hex = "0" + hex;
    }
    return hex + "\n";
}

Result<uint64_t> ParseSerial(const std::string& content) {
    size_t start = content.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return Result<uint64_t>(Error(ErrorCode::InvalidSignerMaterial, "serial is empty"));
    }
    size_t end = content.find_last_not_of(" \t\r\n");
    std::string hex = content.substr(start, end - start + 1);

    uint64_t value = 0;
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return Result<uint64_t>(Error(ErrorCode::InvalidSignerMaterial,
                "serial \"" + hex + "\" is not a hexadecimal number"));
        }
        if (value > (std::numeric_limits<uint64_t>::max() >> 4)) {
            return Result<uint64_t>(Error(ErrorCode::InvalidSignerMaterial,
                "serial \"" + hex + "\" does not fit in 64 bits"));
        }
        int digit = std::isdigit(static_cast<unsigned char>(c))
            ? c - '0'
            : std::toupper(static_cast<unsigned char>(c)) - 'A' + 10;
        value = (value << 4) | static_cast<uint64_t>(digit);
    }
    return Result<uint64_t>(value);
}

Result<std::shared_ptr<FileSerialCounter>> FileSerialCounter::Open(const std::string& path) {
    if (path.empty()) {
        return Result<std::shared_ptr<FileSerialCounter>>(Error(ErrorCode::ValidationError,
            "serial file path is empty"));
    }

    auto counter = std::make_shared<FileSerialCounter>(path);

    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (errno != ENOENT) {
            return Result<std::shared_ptr<FileSerialCounter>>(Error(ErrorCode::InvalidSignerMaterial,
                "failed to stat serial file " + path + ": " + std::strerror(errno)));
        }
        Error err = counter->Reset(SignerSerialNumber);
        if (err.hasError()) {
            return Result<std::shared_ptr<FileSerialCounter>>(err);
        }
        utils::GetLogger().Info("Initialized serial file", utils::LogContext().With("serialFile", path));
        return Result<std::shared_ptr<FileSerialCounter>>(counter);
    }

    Result<uint64_t> current = readSerialFile(path);
    if (!current.ok()) {
        return Result<std::shared_ptr<FileSerialCounter>>(current.error());
    }
    return Result<std::shared_ptr<FileSerialCounter>>(counter);
}

Result<uint64_t> FileSerialCounter::Current() const {
    return readSerialFile(path_);
}

Error FileSerialCounter::Reset(uint64_t value) {
    FileLock lock(LockPath());
    Error err = lock.Lock();
    if (err.hasError()) return err;

    std::string content = FormatSerial(value);
    return storage::WriteFileAtomic(path_, std::vector<uint8_t>(content.begin(), content.end()),
                                    storage::CertificateFileMode);
}

Result<std::shared_ptr<SerialReservation>> FileSerialCounter::Reserve() {
    auto lock = std::make_unique<FileLock>(LockPath());
    Error err = lock->Lock();
    if (err.hasError()) {
        return Result<std::shared_ptr<SerialReservation>>(err);
    }

    // 锁内读取，保证并发签发拿到不同的序列号
    struct stat st;
    if (stat(path_.c_str(), &st) != 0) {
        // 文件丢失时不能从头计数
        return Result<std::shared_ptr<SerialReservation>>(Error(ErrorCode::InvalidSignerMaterial,
            "serial file " + path_ + " is missing: " + std::strerror(errno)));
    }
    Result<uint64_t> read = readSerialFile(path_);
    if (!read.ok()) {
        return Result<std::shared_ptr<SerialReservation>>(read.error());
    }
    uint64_t current = read.value();

    if (current == std::numeric_limits<uint64_t>::max()) {
        return Result<std::shared_ptr<SerialReservation>>(Error(ErrorCode::SerialExhausted,
            "serial counter " + path_ + " has reached its maximum value"));
    }
    // 0未被使用，1保留给CA
    uint64_t next = current < SignerSerialNumber ? SignerSerialNumber + 1 : current + 1;

    return Result<std::shared_ptr<SerialReservation>>(
        std::make_shared<FileSerialReservation>(path_, next, std::move(lock)));
}

Result<std::shared_ptr<SerialReservation>> RandomSerialCounter::Reserve() {
    uint64_t value = 0;
    do {
        unsigned char buf[sizeof(uint64_t)];
        if (RAND_bytes(buf, sizeof(buf)) != 1) {
            return Result<std::shared_ptr<SerialReservation>>(Error(ErrorCode::SigningFailed,
                "failed to generate random serial number"));
        }
        value = 0;
        for (unsigned char b : buf) {
            value = (value << 8) | b;
        }
        value &= std::numeric_limits<int64_t>::max();
    } while (value <= SignerSerialNumber);

    return Result<std::shared_ptr<SerialReservation>>(std::make_shared<RandomSerialReservation>(value));
}

} // namespace pki
} // namespace certforge
