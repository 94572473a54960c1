#include "certforge/storage/cert_writer.hpp"
#include "certforge/utils/logger.hpp"
#include "certforge/utils/x509.hpp"
#include <filesystem>
#include <system_error>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace certforge {
namespace storage {

namespace fs = std::filesystem;

namespace {

std::string errnoString() {
    return std::strerror(errno);
}

Error ensureParentDir(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) return Error();

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        return Error(ErrorCode::WriteFailed,
            "failed to create parent directory " + parent.string() + ": " + ec.message());
    }
    return Error();
}

// 同一目录下的rename才是原子的，因此临时文件与目标文件放在一起
Error writeTempFile(const std::string& path, const std::vector<uint8_t>& data,
                    mode_t mode, std::string& tempPath) {
    Error err = ensureParentDir(path);
    if (err.hasError()) return err;

    std::string pattern = path + ".tmp-XXXXXX";
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    int fd = mkstemp(buf.data());
    if (fd < 0) {
        return Error(ErrorCode::WriteFailed,
            "failed to create temporary file for " + path + ": " + errnoString());
    }
    tempPath = buf.data();

    auto fail = [&](const std::string& what) {
        std::string msg = what + " " + tempPath + ": " + errnoString();
        close(fd);
        unlink(tempPath.c_str());
        tempPath.clear();
        return Error(ErrorCode::WriteFailed, msg);
    };

    if (fchmod(fd, mode) != 0) return fail("failed to set mode on");

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return fail("failed to write");
        }
        written += static_cast<size_t>(n);
    }

    if (fsync(fd) != 0) return fail("failed to sync");
    if (close(fd) != 0) {
        std::string msg = "failed to close " + tempPath + ": " + errnoString();
        unlink(tempPath.c_str());
        tempPath.clear();
        return Error(ErrorCode::WriteFailed, msg);
    }
    return Error();
}

// rename后同步目录项，保证新文件名落盘
void syncParentDir(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    std::string dir = parent.empty() ? "." : parent.string();

    int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) return;
    if (fsync(fd) != 0) {
        utils::GetLogger().Debug("Failed to sync directory", utils::LogContext()
            .With("dir", dir).With("error", errnoString()));
    }
    close(fd);
}

Error renameInto(const std::string& from, const std::string& to) {
    if (rename(from.c_str(), to.c_str()) != 0) {
        return Error(ErrorCode::WriteFailed,
            "failed to move " + from + " to " + to + ": " + errnoString());
    }
    syncParentDir(to);
    return Error();
}

} // namespace

Error WriteFileAtomic(const std::string& path, const std::vector<uint8_t>& data, mode_t mode) {
    std::string tempPath;
    Error err = writeTempFile(path, data, mode, tempPath);
    if (err.hasError()) return err;

    err = renameInto(tempPath, path);
    if (err.hasError()) {
        unlink(tempPath.c_str());
    }
    return err;
}

CertificatePairWriter::CertificatePairWriter(std::string certPath, std::string keyPath)
    : certPath_(std::move(certPath)), keyPath_(std::move(keyPath)) {}

CertificatePairWriter::~CertificatePairWriter() {
    if (staged_ && !committed_) {
        removeTemps();
    }
}

void CertificatePairWriter::removeTemps() {
    if (!certTemp_.empty()) unlink(certTemp_.c_str());
    if (!keyTemp_.empty()) unlink(keyTemp_.c_str());
    certTemp_.clear();
    keyTemp_.clear();
}

Error CertificatePairWriter::Stage(const std::vector<uint8_t>& certPEM,
                                   const std::vector<uint8_t>& keyPEM) {
    if (staged_) {
        return Error(ErrorCode::WriteFailed, "certificate pair is already staged");
    }

    auto snapshot = [](const std::string& path, PreviousFile& previous) -> Error {
        struct stat st;
        if (stat(path.c_str(), &st) != 0) {
            if (errno == ENOENT) return Error();
            return Error(ErrorCode::WriteFailed, "failed to stat " + path + ": " + errnoString());
        }
        if (!S_ISREG(st.st_mode)) {
            return Error(ErrorCode::WriteFailed, path + " exists and is not a regular file");
        }
        try {
            previous.data = utils::ReadFileBytes(path);
        } catch (const utils::CertificateError& e) {
            return Error(ErrorCode::WriteFailed, e.what());
        }
        previous.existed = true;
        previous.mode = st.st_mode & 07777;
        return Error();
    };

    Error err = snapshot(certPath_, previousCert_);
    if (err.hasError()) return err;
    err = snapshot(keyPath_, previousKey_);
    if (err.hasError()) return err;

    err = writeTempFile(certPath_, certPEM, CertificateFileMode, certTemp_);
    if (err.hasError()) return err;

    err = writeTempFile(keyPath_, keyPEM, KeyFileMode, keyTemp_);
    if (err.hasError()) {
        removeTemps();
        return err;
    }

    staged_ = true;
    return Error();
}

Error CertificatePairWriter::Commit() {
    if (!staged_ || committed_) {
        return Error(ErrorCode::WriteFailed, "nothing staged to commit");
    }

    Error err = renameInto(certTemp_, certPath_);
    if (err.hasError()) {
        removeTemps();
        staged_ = false;
        return err;
    }
    certTemp_.clear();

    err = renameInto(keyTemp_, keyPath_);
    if (err.hasError()) {
        Error restoreErr = restore(certPath_, previousCert_);
        if (restoreErr.hasError()) {
            utils::GetLogger().Error("Failed to restore certificate after partial write",
                utils::LogContext().With("cert", certPath_).With("error", restoreErr.what()));
        }
        removeTemps();
        staged_ = false;
        return err;
    }
    keyTemp_.clear();

    committed_ = true;
    return Error();
}

Error CertificatePairWriter::Rollback() {
    if (!committed_) {
        return Error(ErrorCode::WriteFailed, "nothing committed to roll back");
    }

    Error certErr = restore(certPath_, previousCert_);
    Error keyErr = restore(keyPath_, previousKey_);
    committed_ = false;
    staged_ = false;

    if (certErr.hasError()) return certErr;
    return keyErr;
}

Error CertificatePairWriter::restore(const std::string& path, const PreviousFile& previous) {
    if (!previous.existed) {
        if (unlink(path.c_str()) != 0 && errno != ENOENT) {
            return Error(ErrorCode::WriteFailed, "failed to remove " + path + ": " + errnoString());
        }
        return Error();
    }
    return WriteFileAtomic(path, previous.data, previous.mode);
}

Error WriteCertificatePair(const std::vector<uint8_t>& certPEM,
                           const std::vector<uint8_t>& keyPEM,
                           const std::string& certPath,
                           const std::string& keyPath) {
    CertificatePairWriter writer(certPath, keyPath);
    Error err = writer.Stage(certPEM, keyPEM);
    if (err.hasError()) return err;
    return writer.Commit();
}

} // namespace storage
} // namespace certforge
