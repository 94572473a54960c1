#pragma once

#include <memory>
#include <string>
#include <cstdint>
#include <utility>
#include "certforge/types.hpp"

namespace certforge {
namespace pki {

// 序列号1保留给签名CA本身
const uint64_t SignerSerialNumber = 1;

// FileLock is an exclusive advisory lock (flock) on a side file. The lock is
// held from a successful Lock()/TryLock() until Unlock() or destruction.
class FileLock {
public:
    explicit FileLock(std::string path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // Lock blocks until the lock is acquired.
    Error Lock();
    // TryLock returns false without waiting when another holder exists.
    Result<bool> TryLock();
    void Unlock();

    bool Held() const { return fd_ >= 0; }
    const std::string& Path() const { return path_; }

private:
    Result<int> openLockFile();

    std::string path_;
    int fd_ = -1;
};

// SerialReservation is a serial number handed out by a SerialCounter but not
// yet made durable. Commit() advances the persistent counter; dropping an
// uncommitted reservation leaves the counter where it was.
class SerialReservation {
public:
    virtual ~SerialReservation() = default;

    virtual uint64_t Serial() const = 0;
    virtual Error Commit() = 0;
    virtual bool Committed() const = 0;
};

// SerialCounter produces serial numbers for certificates issued by one signer.
class SerialCounter {
public:
    virtual ~SerialCounter() = default;

    // Reserve returns the next serial. Reservations are exclusive: a second
    // Reserve() on the same counter (from any process) waits until the first
    // reservation is committed or released.
    virtual Result<std::shared_ptr<SerialReservation>> Reserve() = 0;

    virtual std::string Describe() const = 0;
};

// FileSerialCounter keeps the last issued serial in a text file as uppercase
// hex with an even number of digits and a trailing newline, e.g. "0A\n".
class FileSerialCounter : public SerialCounter {
public:
    // Open binds to path, creating it with "01\n" if it does not exist.
    // A malformed existing file fails with InvalidSignerMaterial.
    static Result<std::shared_ptr<FileSerialCounter>> Open(const std::string& path);

    Result<std::shared_ptr<SerialReservation>> Reserve() override;
    std::string Describe() const override { return path_; }

    // Current reads the last issued serial without reserving.
    Result<uint64_t> Current() const;

    // Reset overwrites the counter with value under the lock.
    Error Reset(uint64_t value);

    const std::string& Path() const { return path_; }
    std::string LockPath() const { return path_ + ".lock"; }

    explicit FileSerialCounter(std::string path) : path_(std::move(path)) {}

private:
    std::string path_;
};

// RandomSerialCounter hands out random positive 63-bit serials. Commit is a
// no-op since there is no state to persist.
class RandomSerialCounter : public SerialCounter {
public:
    Result<std::shared_ptr<SerialReservation>> Reserve() override;
    std::string Describe() const override { return "random"; }
};

// 序列号文件格式：大写十六进制，偶数位，换行结尾
std::string FormatSerial(uint64_t value);
Result<uint64_t> ParseSerial(const std::string& content);

} // namespace pki
} // namespace certforge
