#pragma once

#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace ParaCopy {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB); // Rotate once the file grows past this
        void setComponent(const std::string& component);
        void setConsoleOutput(bool enabled);

        /**
         * @brief Parse a level name such as "debug", "INFO" or "warning"
         * @return std::nullopt for unknown names
         */
        static std::optional<LogLevel> parseLevel(const std::string& name);

        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_ <= LogLevel::INFO; }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        LogLevel currentLevel_ = LogLevel::INFO;
        std::string defaultComponent_ = "ParaCopy";
        size_t maxFileSizeMB_ = 100;
        size_t currentFileSize_ = 0;
        bool consoleOutput_ = true;

        std::string levelToString(LogLevel level);
        std::string getCurrentTime();
        void writeLine(LogLevel level, const std::string& line);
        void rotateLogFile();
        size_t getFileSize();
    };

}
