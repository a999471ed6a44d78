/**
 * @file test_config_options.cpp
 * @brief Configuration layering, command line parsing and error reporting
 */

#include <gtest/gtest.h>
#include "Config.h"
#include "ErrorCodes.h"
#include "Logger.h"
#include "PathUtils.h"
#include "RunOptions.h"
#include "TestTree.h"

#include <cstdlib>
#include <json/json.h>
#include <sstream>

using namespace ParaCopy;
using ParaCopy::Testing::TestTree;

namespace {

/**
 * Owns mutable copies of the arguments for the char* argv[] interface
 */
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "paracopy");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

} // namespace

// ============================================================================
// Config
// ============================================================================

TEST(ConfigTest, ParsesKeyValueLinesAndComments) {
    TestTree tree("paracopy_config");
    auto file = tree.write("paracopy.conf",
                           "# comment\n"
                           "threads = 8\n"
                           "  execute=yes  \n"
                           "not a setting\n"
                           "source = /data/photos\n");
    Config config;
    ASSERT_TRUE(config.loadFromFile(file.string()));
    EXPECT_EQ(config.getInt("threads"), 8);
    EXPECT_TRUE(config.getBool("execute"));
    EXPECT_EQ(config.get("source"), "/data/photos");
    EXPECT_EQ(config.get("not a setting", "absent"), "absent");
}

TEST(ConfigTest, LaterLayersOverrideEarlier) {
    TestTree tree("paracopy_config");
    auto base = tree.write("base.conf", "threads = 2\nlog_level = DEBUG\n");
    auto local = tree.write("local.conf", "threads = 6\n");

    Config config;
    EXPECT_TRUE(config.loadLayered({base.string(), tree.path("missing.conf").string(), local.string()}));
    EXPECT_EQ(config.getSize("threads"), 6u);
    EXPECT_EQ(config.get("log_level"), "DEBUG");
}

TEST(ConfigTest, DefaultFilesLayerSystemThenUser) {
    TestTree tree("paracopy_config");
    const char* previous = std::getenv("XDG_CONFIG_HOME");
    std::string saved = previous ? previous : "";
    ::setenv("XDG_CONFIG_HOME", tree.path("xdg").c_str(), 1);

    auto paths = PathUtils::getDefaultConfigPaths();
    auto user = tree.write("xdg/paracopy/paracopy.conf", "threads = 3\n");
    Config config;
    bool loaded = config.loadLayered(paths);

    if (previous) {
        ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    } else {
        ::unsetenv("XDG_CONFIG_HOME");
    }

    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0], "/etc/paracopy/paracopy.conf");
    EXPECT_EQ(paths[1], user.string());
    EXPECT_TRUE(loaded);
    EXPECT_EQ(config.getSize("threads"), 3u);
}

TEST(ConfigTest, MissingFileIsReported) {
    Config config;
    EXPECT_FALSE(config.loadFromFile("/nonexistent/paracopy.conf"));
}

TEST(ConfigTest, MalformedNumbersFallBackToDefaults) {
    Config config;
    config.set("threads", "many");
    config.set("negative", "-3");
    EXPECT_EQ(config.getInt("threads", 4), 4);
    EXPECT_EQ(config.getSize("negative", 1), 1u);
    EXPECT_TRUE(config.getBool("absent", true));
}

TEST(ConfigTest, SchemaRejectsBadValues) {
    Config config;
    config.set("threads", "0");
    config.set("execute", "maybe");
    config.set("executor", "scp");
    config.set("log_level", "warning");
    config.set("unrelated", "whatever");

    auto rejected = config.validate(RunOptions::configSchema());
    EXPECT_EQ(rejected, (std::vector<std::string>{"execute", "executor", "threads"}));
}

// ============================================================================
// RunOptions
// ============================================================================

TEST(RunOptionsTest, DefaultsAreASafeDryRun) {
    RunOptions options;
    EXPECT_FALSE(options.execute);
    EXPECT_FALSE(options.move);
    EXPECT_EQ(options.threads, 1u);
    EXPECT_EQ(options.executor, "rsync");
    EXPECT_EQ(options.retriesPerRun, 0);

    auto transfer = options.transferOptions();
    EXPECT_TRUE(transfer.dryRun);
    EXPECT_EQ(transfer.compare, CompareMode::Checksum);
}

TEST(RunOptionsTest, ParsesEveryOption) {
    Argv args{"-s", "/src/pics", "-t", "/dst/pics", "-n", "4", "-x", "--move", "--fast",
              "-l", "debug", "--log-dir", "/var/log", "--create-target", "-q", "job.queue",
              "--executor", "local", "--rsync", "/opt/bin/rsync", "--retries", "2",
              "--max-attempts", "5", "--summary", "out.json", "--release-quarantined"};
    auto result = RunOptions::parseArguments(args.argc(), args.argv());

    ASSERT_TRUE(result) << result.error().toString();
    const auto& options = result.value();
    EXPECT_EQ(options.source, "/src/pics");
    EXPECT_EQ(options.target, "/dst/pics");
    EXPECT_EQ(options.threads, 4u);
    EXPECT_TRUE(options.execute);
    EXPECT_TRUE(options.move);
    EXPECT_TRUE(options.fast);
    EXPECT_EQ(options.level(), LogLevel::DEBUG);
    EXPECT_EQ(options.logDir, "/var/log");
    EXPECT_TRUE(options.createTarget);
    EXPECT_EQ(options.queueFile, "job.queue");
    EXPECT_EQ(options.executor, "local");
    EXPECT_EQ(options.rsyncBinary, "/opt/bin/rsync");
    EXPECT_EQ(options.retriesPerRun, 2);
    EXPECT_EQ(options.maxAttempts, 5);
    EXPECT_EQ(options.summaryFile, "out.json");
    EXPECT_TRUE(options.releaseQuarantined);
    EXPECT_TRUE(options.validate());

    auto transfer = options.transferOptions();
    EXPECT_FALSE(transfer.dryRun);
    EXPECT_TRUE(transfer.move);
    EXPECT_EQ(transfer.compare, CompareMode::Fast);
}

TEST(RunOptionsTest, CommandLineOverridesConfig) {
    Config config;
    config.set("source", "/from/config");
    config.set("threads", "8");
    config.set("execute", "true");

    Argv args{"--threads", "2"};
    auto result = RunOptions::parseArguments(args.argc(), args.argv(), RunOptions::fromConfig(config));

    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().source, "/from/config");
    EXPECT_EQ(result.value().threads, 2u);
    EXPECT_TRUE(result.value().execute);
}

TEST(RunOptionsTest, ConfigPathIsFoundBeforeParsing) {
    Argv args{"-s", "a", "--config", "/etc/paracopy.conf"};
    EXPECT_EQ(RunOptions::configPathFromArguments(args.argc(), args.argv()), "/etc/paracopy.conf");

    Argv none{"-s", "a"};
    EXPECT_EQ(RunOptions::configPathFromArguments(none.argc(), none.argv()), "");
}

TEST(RunOptionsTest, BadArgumentsAreConfigurationErrors) {
    Argv unknown{"--frobnicate"};
    Argv missingValue{"--source"};
    Argv notANumber{"--threads", "lots"};
    Argv negative{"--retries", "-1"};

    for (Argv* args : {&unknown, &missingValue, &notANumber, &negative}) {
        auto result = RunOptions::parseArguments(args->argc(), args->argv());
        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().code, Core::ErrorCode::INVALID_CONFIGURATION);
    }
}

TEST(RunOptionsTest, ValidateCatchesIncompleteSettings) {
    RunOptions options;
    EXPECT_FALSE(options.validate());

    options.source = "/a/x";
    options.target = "/b/x";
    EXPECT_TRUE(options.validate());

    options.threads = 0;
    EXPECT_FALSE(options.validate());
    options.threads = 1;

    options.executor = "ftp";
    EXPECT_FALSE(options.validate());
    options.executor = "local";

    options.logLevel = "loud";
    auto result = options.validate();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Core::ErrorCode::INVALID_CONFIGURATION);
}

TEST(RunOptionsTest, HelpFlagAndUsage) {
    Argv args{"--help"};
    auto result = RunOptions::parseArguments(args.argc(), args.argv());
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().showHelp);

    auto usage = RunOptions::usage("paracopy");
    EXPECT_NE(usage.find("--source"), std::string::npos);
    EXPECT_NE(usage.find("--execute"), std::string::npos);
}

// ============================================================================
// Errors and logging
// ============================================================================

TEST(ErrorRegistryTest, ExitStatusPerTerminalCondition) {
    using Core::ErrorCode;
    using Core::ErrorRegistry;
    EXPECT_EQ(ErrorRegistry::exitStatus(ErrorCode::SUCCESS), 0);
    EXPECT_EQ(ErrorRegistry::exitStatus(ErrorCode::SOURCE_PATH_DOES_NOT_EXIST), 1);
    EXPECT_EQ(ErrorRegistry::exitStatus(ErrorCode::TARGET_PATH_DOES_NOT_EXIST), 2);
    EXPECT_EQ(ErrorRegistry::exitStatus(ErrorCode::SOURCE_TARGET_MISMATCH), 3);
    EXPECT_EQ(ErrorRegistry::exitStatus(ErrorCode::INVALID_CONFIGURATION), 4);
    EXPECT_EQ(ErrorRegistry::exitStatus(ErrorCode::ENUMERATION_FAILED), 5);
    EXPECT_EQ(ErrorRegistry::exitStatus(ErrorCode::QUEUE_PERSISTENCE_FAILED), 6);
    EXPECT_EQ(ErrorRegistry::exitStatus(ErrorCode::ITEMS_REMAINING), 7);
    EXPECT_EQ(ErrorRegistry::exitStatus(ErrorCode::INTERRUPTED), 8);
    EXPECT_EQ(ErrorRegistry::exitStatus(ErrorCode::INTERNAL_ERROR), 70);
}

TEST(ErrorRegistryTest, ErrorInfoRendersTextAndJson) {
    auto error = Core::ErrorRegistry::createError(Core::ErrorCode::SOURCE_TARGET_MISMATCH, "a vs b");
    EXPECT_EQ(error.toString(), "SOURCE_TARGET_MISMATCH: Source and target must have the same starting point (a vs b)");

    Json::Value parsed;
    Json::CharReaderBuilder reader;
    std::string errors;
    std::istringstream in(error.toJson());
    ASSERT_TRUE(Json::parseFromStream(reader, in, &parsed, &errors)) << errors;
    EXPECT_EQ(parsed["code"].asInt(), 1003);
    EXPECT_EQ(parsed["name"].asString(), "SOURCE_TARGET_MISMATCH");
    EXPECT_EQ(parsed["details"].asString(), "a vs b");
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(Logger::parseLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("fatal"), LogLevel::CRITICAL);
    EXPECT_FALSE(Logger::parseLevel("chatty").has_value());
}

TEST(LoggerTest, WritesToLogFile) {
    TestTree tree("paracopy_log");
    auto file = tree.path("paracopy.log");
    auto& logger = Logger::instance();
    logger.setConsoleOutput(false);
    logger.setLevel(LogLevel::INFO);
    logger.setLogFile(file.string());

    logger.debug("hidden", "Test");
    logger.warn("visible", "Test");
    logger.setLogFile("");
    logger.setConsoleOutput(true);

    auto content = TestTree::read(file);
    EXPECT_EQ(content.find("hidden"), std::string::npos);
    EXPECT_NE(content.find("[WARN] [Test] visible"), std::string::npos);
}
