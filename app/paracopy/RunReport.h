#pragma once

#include "Orchestrator.h"

#include <json/json.h>
#include <string>

namespace ParaCopy {

/**
 * @brief JSON rendering of a RunSummary
 *
 * {
 *   "status": "SUCCESS", "exitStatus": 0, "dryRun": false, "resumed": true,
 *   "source": ..., "target": ..., "queueFile": ..., "executor": "rsync",
 *   "started": "2024-05-01T10:00:00Z", "finished": ..., "elapsedMs": 1234,
 *   "counts": {"queued": 10, "succeeded": 9, "unchanged": 2, "failed": 1,
 *              "pending": 1, "quarantined": 0},
 *   "remaining": [{"path": "a/b", "attempts": 1, "lastError": "...",
 *                  "quarantined": false}]
 * }
 */
class RunReport {
public:
    static Json::Value toJson(const RunSummary& summary);

    /**
     * @brief Write the report to path, replacing any previous file
     * @return false if the file could not be written
     */
    static bool write(const RunSummary& summary, const std::string& path);
};

} // namespace ParaCopy
