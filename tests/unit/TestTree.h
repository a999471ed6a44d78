#pragma once

/**
 * @file TestTree.h
 * @brief Scratch directories and small files for filesystem tests
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace ParaCopy {
namespace Testing {

class TestTree {
public:
    explicit TestTree(const std::string& prefix) {
        static std::atomic<int> sequence{0};
        root_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 "_" + std::to_string(sequence++));
        std::filesystem::create_directories(root_);
    }

    ~TestTree() {
        std::error_code ec;
        std::filesystem::permissions(root_, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add, ec);
        std::filesystem::remove_all(root_, ec);
    }

    TestTree(const TestTree&) = delete;
    TestTree& operator=(const TestTree&) = delete;

    const std::filesystem::path& root() const { return root_; }

    std::filesystem::path path(const std::string& relative) const { return root_ / relative; }

    std::filesystem::path mkdir(const std::string& relative) const {
        auto dir = root_ / relative;
        std::filesystem::create_directories(dir);
        return dir;
    }

    std::filesystem::path write(const std::string& relative, const std::string& content) const {
        auto file = root_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << content;
        return file;
    }

    static std::string read(const std::filesystem::path& file) {
        std::ifstream in(file, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    /**
     * @brief Every non-directory entry below dir, relative and sorted
     */
    static std::vector<std::string> listFiles(const std::filesystem::path& dir) {
        std::vector<std::string> result;
        if (!std::filesystem::exists(dir)) {
            return result;
        }
        for (auto it = std::filesystem::recursive_directory_iterator(dir);
             it != std::filesystem::recursive_directory_iterator(); ++it) {
            if (!it->is_directory() || it->is_symlink()) {
                result.push_back(std::filesystem::relative(it->path(), dir).generic_string());
            }
        }
        std::sort(result.begin(), result.end());
        return result;
    }

private:
    std::filesystem::path root_;
};

} // namespace Testing
} // namespace ParaCopy
