#pragma once

#include "WorkItem.h"

#include <string>
#include <utility>

namespace ParaCopy {

/**
 * @brief Change detection strategy delegated to the transfer primitive
 */
enum class CompareMode {
    Checksum,   // compare content
    Fast        // compare size and modification time
};

struct TransferOptions {
    bool dryRun = true;         // simulate only, mutate nothing
    bool move = false;          // remove the source after a confirmed transfer
    CompareMode compare = CompareMode::Checksum;
};

enum class TransferStatus {
    Success,
    Failure
};

struct TransferOutcome {
    TransferStatus status{TransferStatus::Success};
    bool changed{false};        // target was (or in dry-run would be) modified
    std::string cause;          // set on Failure

    static TransferOutcome succeeded(bool changed) {
        TransferOutcome outcome;
        outcome.changed = changed;
        return outcome;
    }

    static TransferOutcome failed(std::string why) {
        TransferOutcome outcome;
        outcome.status = TransferStatus::Failure;
        outcome.cause = std::move(why);
        return outcome;
    }

    bool ok() const { return status == TransferStatus::Success; }
};

/**
 * @brief Moves one work item from the source tree to the target tree
 *
 * Source and target roots are fixed at construction. transfer() must be
 * idempotent: it may be invoked again for an item that already completed
 * (a crash between the copy and the queue update), and must then leave the
 * target as it is. Implementations are called from several workers at once.
 */
class ITransferExecutor {
public:
    virtual ~ITransferExecutor() = default;

    virtual TransferOutcome transfer(const WorkItem& item, const TransferOptions& options) = 0;

    virtual std::string name() const = 0;
};

} // namespace ParaCopy
