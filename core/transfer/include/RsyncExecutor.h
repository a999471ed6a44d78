#pragma once

#include "ITransferExecutor.h"

#include <filesystem>
#include <string>
#include <vector>

namespace ParaCopy {

/**
 * @brief Runs one rsync process per work item
 *
 * The rsync child copies source/<relativePath> into the directory holding
 * target/<relativePath>. Change detection, backups and permission handling
 * are rsync's; the exit status is the only success signal.
 */
class RsyncExecutor : public ITransferExecutor {
public:
    RsyncExecutor(std::filesystem::path sourceRoot, std::filesystem::path targetRoot,
                  std::string rsyncBinary = "rsync");

    TransferOutcome transfer(const WorkItem& item, const TransferOptions& options) override;

    std::string name() const override { return "rsync"; }

    /**
     * @brief Full argv (binary first) used for an item
     */
    std::vector<std::string> buildArguments(const WorkItem& item, const TransferOptions& options) const;

    /**
     * @brief True for an --itemize-changes line describing an actual update
     */
    static bool isItemizedChange(const std::string& line);

private:
    struct ProcessResult {
        bool launched{false};
        int exitStatus{-1};
        std::string launchError;
        std::string out;
        std::string err;
    };

    ProcessResult runProcess(const std::vector<std::string>& args) const;

    std::filesystem::path sourceRoot_;
    std::filesystem::path targetRoot_;
    std::string rsyncBinary_;
};

} // namespace ParaCopy
