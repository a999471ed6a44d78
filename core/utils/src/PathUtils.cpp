#include "PathUtils.h"
#include <cstdlib>
#include <stdexcept>

namespace ParaCopy {

std::filesystem::path PathUtils::getHome() {
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home);
    }
    throw std::runtime_error("HOME environment variable is not set");
}

std::filesystem::path PathUtils::getConfigDir() {
    if (const char* config = std::getenv("XDG_CONFIG_HOME")) {
        return std::filesystem::path(config) / "paracopy";
    }
    return getHome() / ".config" / "paracopy";
}

std::filesystem::path PathUtils::getDefaultConfigPath() {
    return getConfigDir() / "paracopy.conf";
}

std::vector<std::string> PathUtils::getDefaultConfigPaths() {
    std::vector<std::string> paths{"/etc/paracopy/paracopy.conf"};
    if (std::getenv("HOME") != nullptr || std::getenv("XDG_CONFIG_HOME") != nullptr) {
        paths.push_back(getDefaultConfigPath().string());
    }
    return paths;
}

void PathUtils::ensureDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return;
    }
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create directory: " + dir.string() + " (" + ec.message() + ")");
    }
}

std::string PathUtils::leafName(const std::filesystem::path& path) {
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        resolved = path.lexically_normal();
    }
    if (!resolved.has_filename() && resolved.has_parent_path()) {
        resolved = resolved.parent_path();
    }
    return resolved.filename().string();
}

} // namespace ParaCopy
