#pragma once

#include <filesystem>
#include <string>

namespace ParaCopy {

/**
 * @brief Streaming SHA-256 of file contents (OpenSSL EVP)
 */
class FileHasher {
public:
    /**
     * @return lowercase hex digest
     * @throws std::runtime_error if the file cannot be read or hashed
     */
    static std::string sha256(const std::filesystem::path& path);
};

} // namespace ParaCopy
