#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ParaCopy {

    /**
     * @brief key=value settings store
     *
     * Lines starting with '#' are comments. Later files override earlier
     * ones when loaded with overrideExisting (the default).
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;

        size_t getSize(const std::string& key, size_t defaultValue = 0) const;

        bool getBool(const std::string& key, bool defaultValue = false) const;

        /**
         * @brief Check present keys against their validators
         * @return names of keys whose value was rejected (empty when valid)
         */
        std::vector<std::string> validate(const std::unordered_map<std::string, Validator>& schema) const;

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
        bool storeKV(const std::string& key, const std::string& value, bool overrideExisting);
    };

}
