#include "RunReport.h"
#include "Logger.h"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace ParaCopy {

namespace {

std::string isoTime(std::chrono::system_clock::time_point point) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(point);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

} // namespace

Json::Value RunReport::toJson(const RunSummary& summary) {
    Json::Value root(Json::objectValue);
    root["status"] = Core::ErrorInfo::getErrorCodeString(summary.status);
    root["exitStatus"] = Core::ErrorRegistry::exitStatus(summary.status);
    root["dryRun"] = summary.dryRun;
    root["resumed"] = summary.resumed;
    root["source"] = summary.source;
    root["target"] = summary.target;
    root["queueFile"] = summary.queueFile;
    root["executor"] = summary.executor;
    root["started"] = isoTime(summary.started);
    root["finished"] = isoTime(summary.finished);
    root["elapsedMs"] = static_cast<Json::Int64>(summary.dispatch.elapsed.count());

    Json::Value counts(Json::objectValue);
    counts["queued"] = static_cast<Json::UInt64>(summary.queued);
    counts["succeeded"] = static_cast<Json::UInt64>(summary.dispatch.succeeded);
    counts["unchanged"] = static_cast<Json::UInt64>(summary.dispatch.unchanged);
    counts["failed"] = static_cast<Json::UInt64>(summary.dispatch.failed);
    counts["pending"] = static_cast<Json::UInt64>(summary.dispatch.pending);
    counts["quarantined"] = static_cast<Json::UInt64>(summary.dispatch.quarantined);
    root["counts"] = counts;

    root["remaining"] = Json::Value(Json::arrayValue);
    for (const auto& item : summary.remaining) {
        Json::Value entry(Json::objectValue);
        entry["path"] = item.relativePath;
        entry["attempts"] = item.attempts;
        entry["lastError"] = item.lastError;
        entry["quarantined"] = item.quarantined;
        root["remaining"].append(entry);
    }
    return root;
}

bool RunReport::write(const RunSummary& summary, const std::string& path) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        Logger::instance().error("Cannot write summary to " + path, "RunReport");
        return false;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    out << Json::writeString(builder, toJson(summary)) << "\n";
    if (!out) {
        Logger::instance().error("Failed while writing summary to " + path, "RunReport");
        return false;
    }
    Logger::instance().info("Summary written to " + path, "RunReport");
    return true;
}

} // namespace ParaCopy
