#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <sys/types.h>
#include "certforge/types.hpp"

namespace certforge {
namespace storage {

const mode_t CertificateFileMode = 0644;
const mode_t KeyFileMode = 0600;

// WriteFileAtomic writes data to a temporary sibling of path, fsyncs it and
// renames it over path, so readers see either the old or the new content.
// Missing parent directories are created. Fails with WriteFailed.
Error WriteFileAtomic(const std::string& path, const std::vector<uint8_t>& data, mode_t mode);

// CertificatePairWriter writes a certificate and its key as one unit.
//
//   Stage()    writes both temporary files and remembers the current
//              content of the targets; nothing visible changes yet.
//   Commit()   renames both temporaries into place. If the key rename fails
//              the certificate is put back the way it was.
//   Rollback() after a successful Commit(), restores both previous files
//              (or removes them if they did not exist).
//
// Destroying a staged but uncommitted writer removes its temporary files.
class CertificatePairWriter {
public:
    CertificatePairWriter(std::string certPath, std::string keyPath);
    ~CertificatePairWriter();

    CertificatePairWriter(const CertificatePairWriter&) = delete;
    CertificatePairWriter& operator=(const CertificatePairWriter&) = delete;

    Error Stage(const std::vector<uint8_t>& certPEM, const std::vector<uint8_t>& keyPEM);
    Error Commit();
    Error Rollback();

    const std::string& CertTempPath() const { return certTemp_; }
    const std::string& KeyTempPath() const { return keyTemp_; }

private:
    struct PreviousFile {
        bool existed = false;
        std::vector<uint8_t> data;
        mode_t mode = 0;
    };

    Error restore(const std::string& path, const PreviousFile& previous);
    void removeTemps();

    std::string certPath_;
    std::string keyPath_;
    std::string certTemp_;
    std::string keyTemp_;
    PreviousFile previousCert_;
    PreviousFile previousKey_;
    bool staged_ = false;
    bool committed_ = false;
};

// WriteCertificatePair stages and commits certPEM/keyPEM in one call.
Error WriteCertificatePair(const std::vector<uint8_t>& certPEM,
                           const std::vector<uint8_t>& keyPEM,
                           const std::string& certPath,
                           const std::string& keyPath);

} // namespace storage
} // namespace certforge
