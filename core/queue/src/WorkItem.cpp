#include "WorkItem.h"

namespace ParaCopy {

std::string toString(WorkStatus status) {
    switch (status) {
        case WorkStatus::Pending: return "Pending";
        case WorkStatus::InProgress: return "InProgress";
        case WorkStatus::Done: return "Done";
        case WorkStatus::Failed: return "Failed";
        default: return "Unknown";
    }
}

} // namespace ParaCopy
