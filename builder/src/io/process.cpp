#include "io/process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace muslforge::io {
namespace {

bool validateWorkingDirectory(const std::filesystem::path &cwd, const muslforge::Context &ctx) {
    if (cwd.empty()) {
        return true;
    }

    std::error_code ec;
    if (!std::filesystem::exists(cwd, ec) || !std::filesystem::is_directory(cwd, ec)) {
        ctx.error("Working directory does not exist: ", cwd.string());
        return false;
    }
    return true;
}

std::vector<char *> makeArgv(std::vector<std::string> &storage) {
    std::vector<char *> argv;
    argv.reserve(storage.size() + 1);
    for (auto &item : storage) {
        argv.push_back(const_cast<char *>(item.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

// Built before fork so the child only has to swap the pointer.
std::vector<std::string> mergedEnvironment(const std::map<std::string, std::string> &overlay) {
    std::vector<std::string> out;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string item(*entry);
        const auto eq = item.find('=');
        const std::string key = eq == std::string::npos ? item : item.substr(0, eq);
        if (overlay.count(key) != 0U) {
            continue;
        }
        out.push_back(item);
    }
    for (const auto &kv : overlay) {
        out.push_back(kv.first + "=" + kv.second);
    }
    return out;
}

ProcessResult runCommandPosix(
    const std::string &command,
    const std::vector<std::string> &args,
    const ProcessOptions &options,
    const muslforge::Context &ctx
) {
    ProcessResult result;
    result.commandLine = displayCommand(command, args);

    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(command);
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char *> argv = makeArgv(storage);

    std::vector<std::string> envStorage;
    std::vector<char *> envp;
    if (!options.env.empty()) {
        envStorage = mergedEnvironment(options.env);
        envp = makeArgv(envStorage);
    }

    int logFd = -1;
    if (!options.logFile.empty()) {
        logFd = open(options.logFile.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (logFd < 0) {
            ctx.error("Failed to open log file ", options.logFile.string(), ": ", std::strerror(errno));
            return result;
        }
    }

    const pid_t pid = fork();
    if (pid < 0) {
        result.code = -1;
        ctx.error("Failed to fork process: ", std::strerror(errno));
        if (logFd >= 0) {
            close(logFd);
        }
        return result;
    }

    if (pid == 0) {
        if (!options.cwd.empty() && chdir(options.cwd.c_str()) != 0) {
            _exit(127);
        }
        if (logFd >= 0) {
            dup2(logFd, STDOUT_FILENO);
            dup2(logFd, STDERR_FILENO);
        }
        if (!envp.empty()) {
            environ = envp.data();
        }
        execvp(command.c_str(), argv.data());
        _exit(127);
    }

    if (logFd >= 0) {
        close(logFd);
    }

    result.processId = static_cast<long long>(pid);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) {
            continue;
        }
        result.code = -1;
        ctx.error("Failed to wait for process: ", std::strerror(errno));
        return result;
    }

    if (WIFEXITED(status)) {
        result.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.code = 128 + WTERMSIG(status);
        ctx.warn("Process terminated by signal: ", WTERMSIG(status));
    } else {
        result.code = -1;
        ctx.error("Process ended abnormally");
    }
    return result;
}

} // namespace

std::string shellQuote(const std::string &value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

std::string displayCommand(const std::string &command, const std::vector<std::string> &args) {
    std::ostringstream cmd;
    cmd << shellQuote(command);
    for (const auto &arg : args) {
        cmd << ' ' << shellQuote(arg);
    }
    return cmd.str();
}

ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const muslforge::Context &ctx,
    bool dryRun
) {
    ProcessOptions options;
    options.cwd = cwd;
    options.dryRun = dryRun;
    return runCommand(command, args, options, ctx);
}

ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const ProcessOptions &options,
    const muslforge::Context &ctx
) {
    ProcessResult result;
    result.commandLine = displayCommand(command, args);

    if (!options.cwd.empty()) {
        ctx.log("cwd: ", options.cwd.string());
    }
    ctx.log(result.commandLine);
    for (const auto &kv : options.env) {
        ctx.debug("env: ", kv.first, "=", kv.second);
    }

    if (options.dryRun) {
        result.code = 0;
        return result;
    }

    if (!validateWorkingDirectory(options.cwd, ctx)) {
        result.code = -1;
        return result;
    }

    return runCommandPosix(command, args, options, ctx);
}

std::optional<std::string> environmentValue(const std::string &name) {
    const char *value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<std::filesystem::path> currentExecutablePath() {
    std::vector<char> buffer(4096);
    const ssize_t len = readlink("/proc/self/exe", buffer.data(), buffer.size() - 1);
    if (len <= 0) {
        return std::nullopt;
    }
    buffer[static_cast<std::size_t>(len)] = '\0';
    return std::filesystem::absolute(std::filesystem::path(buffer.data()));
}

} // namespace muslforge::io
