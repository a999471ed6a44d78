#pragma once

#include "ITransferExecutor.h"

#include <filesystem>
#include <string>

namespace ParaCopy {

/**
 * @brief In-process transfer primitive
 *
 * Brings target/<relativePath> up to date with source/<relativePath>:
 * - unchanged files (size+mtime in Fast mode, size+SHA-256 in Checksum mode)
 *   are left alone
 * - changed files are written to a hidden ".<name>.<pid>.<n>" file in the
 *   same directory and renamed into place, so the target never holds a torn
 *   copy; modification time and permission bits follow the source
 * - the replaced target is kept as "<name><backupSuffix>" unless the suffix
 *   is empty
 * - symlinks are recreated as symlinks with the same link text
 * - move mode removes the source once the target is confirmed current
 *
 * A missing source whose target is present counts as already moved, which
 * keeps move mode idempotent across a crash.
 */
class LocalCopyExecutor : public ITransferExecutor {
public:
    LocalCopyExecutor(std::filesystem::path sourceRoot, std::filesystem::path targetRoot,
                      std::string backupSuffix = ".backup");

    TransferOutcome transfer(const WorkItem& item, const TransferOptions& options) override;

    std::string name() const override { return "local"; }

private:
    TransferOutcome transferFile(const std::filesystem::path& src, const std::filesystem::path& dst,
                                 const std::filesystem::path& temporary, const std::string& relativePath,
                                 const TransferOptions& options);
    TransferOutcome transferSymlink(const std::filesystem::path& src, const std::filesystem::path& dst,
                                    const std::filesystem::path& temporary, const std::string& relativePath,
                                    const TransferOptions& options);
    bool isUpToDate(const std::filesystem::path& src, const std::filesystem::path& dst, CompareMode mode) const;
    void keepBackup(const std::filesystem::path& dst) const;
    void finishMove(const std::filesystem::path& src, const TransferOptions& options) const;

    std::filesystem::path sourceRoot_;
    std::filesystem::path targetRoot_;
    std::string backupSuffix_;
};

} // namespace ParaCopy
