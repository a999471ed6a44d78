#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ParaCopy {

struct EnumeratorOptions {
    // fnmatch(3) globs matched against each entry's file name. Matching
    // directories are pruned, matching files skipped.
    std::vector<std::string> excludePatterns;

    static std::vector<std::string> defaultExcludePatterns();
};

/**
 * @brief Lazy depth-first walk of a source tree
 *
 * Yields paths relative to the root, one per leaf. Entries of each directory
 * are visited in byte-wise name order so an unchanged tree always yields the
 * same sequence. Only the directories on the current descent path are held
 * in memory.
 *
 * Policy:
 * - directories are traversed, never emitted
 * - regular files (including empty ones) are emitted
 * - symlinks are emitted as leaves and never followed
 * - devices, FIFOs and sockets are skipped with a warning
 *
 * @throws Core::EnumerationError from the constructor or next() if the root
 *         or any directory below it cannot be read
 */
class PathEnumerator {
public:
    explicit PathEnumerator(std::filesystem::path root, EnumeratorOptions options = {});

    PathEnumerator(const PathEnumerator&) = delete;
    PathEnumerator& operator=(const PathEnumerator&) = delete;

    std::optional<std::string> next();

    const std::filesystem::path& root() const { return root_; }
    std::size_t emittedCount() const { return emitted_; }
    std::size_t skippedCount() const { return skipped_; }

private:
    struct Entry {
        std::string name;
        std::filesystem::file_type type;
    };

    struct Frame {
        std::filesystem::path relativeDir;
        std::vector<Entry> entries;
        std::size_t index{0};
    };

    void pushDirectory(const std::filesystem::path& relativeDir);
    bool isExcluded(const std::string& name) const;

    std::filesystem::path root_;
    EnumeratorOptions options_;
    std::vector<Frame> stack_;
    std::size_t emitted_{0};
    std::size_t skipped_{0};
};

} // namespace ParaCopy
