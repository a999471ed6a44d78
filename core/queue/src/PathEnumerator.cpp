#include "PathEnumerator.h"
#include "ErrorCodes.h"
#include "LoggerMacros.h"

#include <algorithm>
#include <fnmatch.h>

namespace ParaCopy {

namespace fs = std::filesystem;

std::vector<std::string> EnumeratorOptions::defaultExcludePatterns() {
    // Finder / Spotlight / Time Machine metadata that has no business on the target
    return {
        ".DS_Store", ".Trashes", ".Trash", "._.Trashes", ".localized",
        ".DocumentRevisions-*", ".Spotlight*", ".fseventsd", ".apdisk",
        ".com.apple.timemachine.donotpresent", ".fcplock", ".fcpuser",
        ".cache", "._.TemporaryItems", "._.apdisk", ".TemporaryItems"
    };
}

PathEnumerator::PathEnumerator(fs::path root, EnumeratorOptions options)
    : root_(std::move(root)), options_(std::move(options)) {
    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        throw Core::EnumerationError("Source root does not exist: " + root_.string());
    }
    if (!fs::is_directory(root_, ec)) {
        throw Core::EnumerationError("Source root is not a directory: " + root_.string());
    }
    pushDirectory(fs::path());
}

std::optional<std::string> PathEnumerator::next() {
    while (!stack_.empty()) {
        Frame& frame = stack_.back();
        if (frame.index >= frame.entries.size()) {
            stack_.pop_back();
            continue;
        }

        Entry entry = frame.entries[frame.index++];
        fs::path relative = frame.relativeDir / entry.name;

        switch (entry.type) {
            case fs::file_type::directory:
                pushDirectory(relative);  // invalidates frame
                break;
            case fs::file_type::regular:
            case fs::file_type::symlink:
                ++emitted_;
                LOG_DEBUG_COMP_IF("Adding leaf node: " + relative.generic_string(), "PathEnumerator");
                return relative.generic_string();
            default:
                ++skipped_;
                LOG_WARN_COMP("Skipping special file: " + relative.generic_string(), "PathEnumerator");
                break;
        }
    }
    return std::nullopt;
}

void PathEnumerator::pushDirectory(const fs::path& relativeDir) {
    fs::path absolute = relativeDir.empty() ? root_ : root_ / relativeDir;

    Frame frame;
    frame.relativeDir = relativeDir;

    std::error_code ec;
    fs::directory_iterator it(absolute, ec);
    if (ec) {
        throw Core::EnumerationError("Cannot read directory " + absolute.string() + ": " + ec.message());
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::string name = it->path().filename().string();
        if (isExcluded(name)) {
            LOG_DEBUG_COMP_IF("Excluded: " + (relativeDir / name).generic_string(), "PathEnumerator");
            continue;
        }
        std::error_code statEc;
        auto status = it->symlink_status(statEc);
        if (statEc) {
            throw Core::EnumerationError("Cannot stat " + it->path().string() + ": " + statEc.message());
        }
        frame.entries.push_back(Entry{std::move(name), status.type()});
    }
    if (ec) {
        throw Core::EnumerationError("Failed while listing " + absolute.string() + ": " + ec.message());
    }

    std::sort(frame.entries.begin(), frame.entries.end(),
              [](const Entry& a, const Entry& b) { return a.name < b.name; });
    stack_.push_back(std::move(frame));
}

bool PathEnumerator::isExcluded(const std::string& name) const {
    for (const auto& pattern : options_.excludePatterns) {
        if (::fnmatch(pattern.c_str(), name.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace ParaCopy
