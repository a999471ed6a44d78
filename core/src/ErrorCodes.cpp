#include "ErrorCodes.h"

#include <json/json.h>

namespace ParaCopy {
namespace Core {

const std::unordered_map<ErrorCode, std::string>& ErrorRegistry::messages() {
    static const std::unordered_map<ErrorCode, std::string> errorMessages = {
        {ErrorCode::INVALID_CONFIGURATION, "Invalid configuration"},
        {ErrorCode::SOURCE_PATH_DOES_NOT_EXIST, "Source path does not exist"},
        {ErrorCode::TARGET_PATH_DOES_NOT_EXIST, "Target path does not exist"},
        {ErrorCode::SOURCE_TARGET_MISMATCH, "Source and target must have the same starting point"},

        {ErrorCode::ENUMERATION_FAILED, "Failed to enumerate source tree"},

        {ErrorCode::TRANSFER_FAILED, "Transfer failed"},
        {ErrorCode::TRANSFER_LAUNCH_FAILED, "Failed to launch transfer primitive"},

        {ErrorCode::QUEUE_PERSISTENCE_FAILED, "Failed to persist queue state"},
        {ErrorCode::QUEUE_ALREADY_INITIALIZED, "Queue already holds pending work"},
        {ErrorCode::ITEMS_REMAINING, "Items remain pending after the run"},

        {ErrorCode::INTERRUPTED, "Run interrupted"},
        {ErrorCode::INTERNAL_ERROR, "Internal error"},

        {ErrorCode::SUCCESS, "Operation successful"}
    };
    return errorMessages;
}

std::string ErrorRegistry::getMessage(ErrorCode code) {
    const auto& table = messages();
    auto it = table.find(code);
    if (it != table.end()) {
        return it->second;
    }
    return "Unknown error";
}

ErrorInfo ErrorRegistry::createError(ErrorCode code, const std::string& details) {
    return ErrorInfo(code, getMessage(code), details);
}

int ErrorRegistry::exitStatus(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return 0;
        case ErrorCode::SOURCE_PATH_DOES_NOT_EXIST: return 1;
        case ErrorCode::TARGET_PATH_DOES_NOT_EXIST: return 2;
        case ErrorCode::SOURCE_TARGET_MISMATCH: return 3;
        case ErrorCode::INVALID_CONFIGURATION: return 4;
        case ErrorCode::ENUMERATION_FAILED: return 5;
        case ErrorCode::QUEUE_PERSISTENCE_FAILED:
        case ErrorCode::QUEUE_ALREADY_INITIALIZED: return 6;
        case ErrorCode::ITEMS_REMAINING:
        case ErrorCode::TRANSFER_FAILED:
        case ErrorCode::TRANSFER_LAUNCH_FAILED: return 7;
        case ErrorCode::INTERRUPTED: return 8;
        default: return 70;
    }
}

std::string ErrorInfo::toString() const {
    std::string result = getErrorCodeString(code) + ": " + message;
    if (!details.empty()) {
        result += " (" + details + ")";
    }
    return result;
}

std::string ErrorInfo::toJson() const {
    Json::Value root(Json::objectValue);
    root["code"] = static_cast<int>(code);
    root["name"] = getErrorCodeString(code);
    root["message"] = message;
    root["details"] = details;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

std::string ErrorInfo::getErrorCodeString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        case ErrorCode::SOURCE_PATH_DOES_NOT_EXIST: return "SOURCE_PATH_DOES_NOT_EXIST";
        case ErrorCode::TARGET_PATH_DOES_NOT_EXIST: return "TARGET_PATH_DOES_NOT_EXIST";
        case ErrorCode::SOURCE_TARGET_MISMATCH: return "SOURCE_TARGET_MISMATCH";

        case ErrorCode::ENUMERATION_FAILED: return "ENUMERATION_FAILED";

        case ErrorCode::TRANSFER_FAILED: return "TRANSFER_FAILED";
        case ErrorCode::TRANSFER_LAUNCH_FAILED: return "TRANSFER_LAUNCH_FAILED";

        case ErrorCode::QUEUE_PERSISTENCE_FAILED: return "QUEUE_PERSISTENCE_FAILED";
        case ErrorCode::QUEUE_ALREADY_INITIALIZED: return "QUEUE_ALREADY_INITIALIZED";
        case ErrorCode::ITEMS_REMAINING: return "ITEMS_REMAINING";

        case ErrorCode::INTERRUPTED: return "INTERRUPTED";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";

        case ErrorCode::SUCCESS: return "SUCCESS";
        default: return "UNKNOWN";
    }
}

} // namespace Core
} // namespace ParaCopy
