#include "LocalCopyExecutor.h"
#include "FileHasher.h"
#include "LoggerMacros.h"
#include "PathUtils.h"

#include <atomic>
#include <stdexcept>
#include <unistd.h>

namespace ParaCopy {

namespace fs = std::filesystem;

namespace {

const char* COMPONENT = "LocalCopy";

fs::path withSuffix(const fs::path& path, const std::string& suffix) {
    fs::path result = path;
    result += suffix;
    return result;
}

// ".<name>.<pid>.<n>" beside the target, like rsync's hidden temp files.
// Unique per process and call.
fs::path temporaryPathFor(const fs::path& dst) {
    static std::atomic<unsigned long> sequence{0};
    std::string name = "." + dst.filename().string() + "." + std::to_string(::getpid()) + "." +
                       std::to_string(sequence++);
    return dst.parent_path() / name;
}

} // namespace

LocalCopyExecutor::LocalCopyExecutor(fs::path sourceRoot, fs::path targetRoot, std::string backupSuffix)
    : sourceRoot_(std::move(sourceRoot)), targetRoot_(std::move(targetRoot)),
      backupSuffix_(std::move(backupSuffix)) {}

TransferOutcome LocalCopyExecutor::transfer(const WorkItem& item, const TransferOptions& options) {
    const fs::path src = sourceRoot_ / item.relativePath;
    const fs::path dst = targetRoot_ / item.relativePath;

    std::error_code ec;
    auto srcStatus = fs::symlink_status(src, ec);
    if (ec || !fs::exists(srcStatus)) {
        if (fs::exists(fs::symlink_status(dst, ec))) {
            LOG_DEBUG_COMP_IF("Source gone, target present (already moved): " + item.relativePath, COMPONENT);
            return TransferOutcome::succeeded(false);
        }
        return TransferOutcome::failed("source missing: " + src.string());
    }

    const fs::path temporary = temporaryPathFor(dst);
    try {
        if (fs::is_symlink(srcStatus)) {
            return transferSymlink(src, dst, temporary, item.relativePath, options);
        }
        if (fs::is_regular_file(srcStatus)) {
            return transferFile(src, dst, temporary, item.relativePath, options);
        }
        return TransferOutcome::failed("not a regular file or symlink: " + src.string());
    } catch (const fs::filesystem_error& e) {
        fs::remove(temporary, ec);
        return TransferOutcome::failed(e.what());
    } catch (const std::runtime_error& e) {
        fs::remove(temporary, ec);
        return TransferOutcome::failed(e.what());
    }
}

TransferOutcome LocalCopyExecutor::transferFile(const fs::path& src, const fs::path& dst,
                                                const fs::path& temporary, const std::string& relativePath,
                                                const TransferOptions& options) {
    if (isUpToDate(src, dst, options.compare)) {
        LOG_DEBUG_COMP_IF("Up to date: " + relativePath, COMPONENT);
        finishMove(src, options);
        return TransferOutcome::succeeded(false);
    }

    if (options.dryRun) {
        Logger::instance().info("Would copy " + relativePath + (options.move ? " (move)" : ""), COMPONENT);
        return TransferOutcome::succeeded(true);
    }

    PathUtils::ensureDirectory(dst.parent_path());

    fs::copy_file(src, temporary, fs::copy_options::overwrite_existing);
    fs::last_write_time(temporary, fs::last_write_time(src));
    fs::permissions(temporary, fs::status(src).permissions(), fs::perm_options::replace);

    keepBackup(dst);
    fs::rename(temporary, dst);

    LOG_DEBUG_COMP_IF("Copied " + src.string() + " -> " + dst.string(), COMPONENT);
    finishMove(src, options);
    return TransferOutcome::succeeded(true);
}

TransferOutcome LocalCopyExecutor::transferSymlink(const fs::path& src, const fs::path& dst,
                                                   const fs::path& temporary, const std::string& relativePath,
                                                   const TransferOptions& options) {
    const fs::path linkText = fs::read_symlink(src);

    std::error_code ec;
    if (fs::is_symlink(fs::symlink_status(dst, ec)) && fs::read_symlink(dst, ec) == linkText && !ec) {
        finishMove(src, options);
        return TransferOutcome::succeeded(false);
    }

    if (options.dryRun) {
        Logger::instance().info("Would link " + relativePath + " -> " + linkText.string(), COMPONENT);
        return TransferOutcome::succeeded(true);
    }

    PathUtils::ensureDirectory(dst.parent_path());

    fs::create_symlink(linkText, temporary);

    keepBackup(dst);
    fs::rename(temporary, dst);

    finishMove(src, options);
    return TransferOutcome::succeeded(true);
}

bool LocalCopyExecutor::isUpToDate(const fs::path& src, const fs::path& dst, CompareMode mode) const {
    std::error_code ec;
    auto dstStatus = fs::symlink_status(dst, ec);
    if (ec || !fs::is_regular_file(dstStatus)) {
        return false;
    }
    if (fs::file_size(src) != fs::file_size(dst)) {
        return false;
    }
    if (mode == CompareMode::Fast) {
        return fs::last_write_time(src) == fs::last_write_time(dst);
    }
    return FileHasher::sha256(src) == FileHasher::sha256(dst);
}

void LocalCopyExecutor::keepBackup(const fs::path& dst) const {
    std::error_code ec;
    if (backupSuffix_.empty() || !fs::exists(fs::symlink_status(dst, ec))) {
        return;
    }
    fs::rename(dst, withSuffix(dst, backupSuffix_));
}

void LocalCopyExecutor::finishMove(const fs::path& src, const TransferOptions& options) const {
    if (!options.move || options.dryRun) {
        return;
    }
    fs::remove(src);
    LOG_DEBUG_COMP_IF("Removed source " + src.string(), COMPONENT);
}

} // namespace ParaCopy
