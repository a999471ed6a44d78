#include "RsyncExecutor.h"
#include "ErrorCodes.h"
#include "LoggerMacros.h"
#include "PathEnumerator.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace ParaCopy {

namespace fs = std::filesystem;

namespace {

const char* COMPONENT = "Rsync";

// Exit status of a child whose exec failed
constexpr int EXEC_FAILED = 127;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void logLines(const std::string& text, LogLevel level) {
    auto& logger = Logger::instance();
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) {
            logger.log(level, line, COMPONENT);
        }
    }
}

} // namespace

RsyncExecutor::RsyncExecutor(fs::path sourceRoot, fs::path targetRoot, std::string rsyncBinary)
    : sourceRoot_(std::move(sourceRoot)), targetRoot_(std::move(targetRoot)),
      rsyncBinary_(std::move(rsyncBinary)) {}

std::vector<std::string> RsyncExecutor::buildArguments(const WorkItem& item, const TransferOptions& options) const {
    std::vector<std::string> args = {
        rsyncBinary_, "-v", "-v", "--perms", "--links", "--times",
        "--itemize-changes", "--stats", "--backup", "--suffix=.backup"
    };
    if (options.dryRun) {
        args.emplace_back("--dry-run");
    }
    if (options.compare == CompareMode::Checksum) {
        args.emplace_back("--checksum");
    }
    if (options.move) {
        args.emplace_back("--remove-source-files");
    }
    for (const auto& pattern : EnumeratorOptions::defaultExcludePatterns()) {
        args.push_back("--exclude=" + pattern);
    }
    args.emplace_back("--filter=dir-merge /.rsync.include");
    args.emplace_back("--filter=dir-merge /.rsync.exclude");

    args.push_back((sourceRoot_ / item.relativePath).string());
    // Trailing separator: always copy *into* the directory, even when rsync
    // has to create it
    std::string targetDir = (targetRoot_ / item.relativePath).parent_path().string();
    if (targetDir.empty() || targetDir.back() != '/') {
        targetDir += '/';
    }
    args.push_back(targetDir);
    return args;
}

bool RsyncExecutor::isItemizedChange(const std::string& line) {
    // YXcstpoguax name: Y = update type, X = file type
    if (line.size() < 12 || line[11] != ' ') {
        return false;
    }
    const char update = line[0];
    const char type = line[1];
    if (std::strchr("<>ch.*", update) == nullptr || std::strchr("fdLDS", type) == nullptr) {
        return false;
    }
    if (update != '.') {
        return true;
    }
    for (std::size_t i = 2; i < 11; ++i) {
        if (line[i] != '.' && line[i] != ' ') {
            return true;
        }
    }
    return false;
}

TransferOutcome RsyncExecutor::transfer(const WorkItem& item, const TransferOptions& options) {
    const fs::path src = sourceRoot_ / item.relativePath;
    const fs::path dst = targetRoot_ / item.relativePath;

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(src, ec))) {
        if (fs::exists(fs::symlink_status(dst, ec))) {
            LOG_DEBUG_COMP_IF("Source gone, target present (already moved): " + item.relativePath, COMPONENT);
            return TransferOutcome::succeeded(false);
        }
        return TransferOutcome::failed("source missing: " + src.string());
    }

    if (!options.dryRun) {
        const fs::path parent = dst.parent_path();
        if (!fs::is_directory(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return TransferOutcome::failed("cannot create " + parent.string() + ": " + ec.message());
            }
            fs::permissions(parent, fs::perms(0775), fs::perm_options::replace, ec);
        }
    }

    auto args = buildArguments(item, options);
    if (Logger::instance().isDebugEnabled()) {
        std::string commandLine;
        for (const auto& arg : args) {
            commandLine += (commandLine.empty() ? "" : " ") + arg;
        }
        Logger::instance().debug(commandLine, COMPONENT);
    }

    ProcessResult result = runProcess(args);
    if (!result.launched) {
        return TransferOutcome::failed(Core::ErrorRegistry::getMessage(Core::ErrorCode::TRANSFER_LAUNCH_FAILED) +
                                       ": " + result.launchError);
    }

    logLines(result.out, LogLevel::DEBUG);

    if (result.exitStatus != 0) {
        logLines(result.err, LogLevel::ERROR);
        if (result.exitStatus == EXEC_FAILED) {
            return TransferOutcome::failed(Core::ErrorRegistry::getMessage(Core::ErrorCode::TRANSFER_LAUNCH_FAILED) +
                                           ": cannot execute " + rsyncBinary_);
        }
        return TransferOutcome::failed(rsyncBinary_ + " exited with status " + std::to_string(result.exitStatus));
    }

    bool changed = false;
    std::istringstream stream(result.out);
    std::string line;
    while (!changed && std::getline(stream, line)) {
        changed = isItemizedChange(line);
    }
    return TransferOutcome::succeeded(changed);
}

RsyncExecutor::ProcessResult RsyncExecutor::runProcess(const std::vector<std::string>& args) const {
    ProcessResult result;

    // argv is built before fork; the child only calls async-signal-safe functions
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // O_CLOEXEC keeps these pipes out of children forked by other workers
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        result.launchError = std::string("pipe: ") + std::strerror(errno);
        return result;
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        result.launchError = std::string("pipe: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return result;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        result.launchError = std::string("fork: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return result;
    }

    if (pid == 0) {
        // Own process group: a terminal Ctrl-C stops dispatching but lets
        // running transfers finish
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        ::_exit(EXEC_FAILED);
    }

    result.launched = true;
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    pollfd fds[2] = {
        {outPipe[0], POLLIN, 0},
        {errPipe[0], POLLIN, 0}
    };
    std::string* sinks[2] = {&result.out, &result.err};
    char buffer[4096];
    int openStreams = 2;
    while (openStreams > 0) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --openStreams;
            }
        }
    }
    for (auto& fd : fds) {
        if (fd.fd >= 0) {
            ::close(fd.fd);
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.exitStatus = -1;
            return result;
        }
    }
    if (WIFEXITED(status)) {
        result.exitStatus = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitStatus = 128 + WTERMSIG(status);
    }
    return result;
}

} // namespace ParaCopy
