#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ParaCopy {

class PathUtils {
public:
    static std::filesystem::path getHome();
    static std::filesystem::path getConfigDir();
    static std::filesystem::path getDefaultConfigPath();

    /**
     * @brief Config files read when none is named, lowest precedence first
     *
     * /etc/paracopy/paracopy.conf, then the per-user file when HOME or
     * XDG_CONFIG_HOME is set.
     */
    static std::vector<std::string> getDefaultConfigPaths();
    static void ensureDirectory(const std::filesystem::path& dir);

    /**
     * @brief Last path component after resolving symlinks and "..", ignoring a trailing separator
     */
    static std::string leafName(const std::filesystem::path& path);
};

} // namespace ParaCopy
