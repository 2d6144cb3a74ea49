#include "mlst/mlst_task.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace contigsift {

namespace {

// Owns a file descriptor for the duration of one invocation.
class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) ::close(fd_);
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

// Owns posix_spawn file actions.
class SpawnActions {
public:
    SpawnActions() { ok_ = (::posix_spawn_file_actions_init(&fa_) == 0); }
    ~SpawnActions() {
        if (ok_) ::posix_spawn_file_actions_destroy(&fa_);
    }
    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;

    bool ok() const { return ok_; }
    posix_spawn_file_actions_t* get() { return &fa_; }

private:
    posix_spawn_file_actions_t fa_;
    bool ok_ = false;
};

int wait_child(pid_t pid, int& status, int options) {
    for (;;) {
        pid_t r = ::waitpid(pid, &status, options);
        if (r < 0 && errno == EINTR) continue;
        return static_cast<int>(r);
    }
}

} // namespace

const char* mlst_status_name(MlstStatus status) {
    switch (status) {
    case MlstStatus::kOk:           return "ok";
    case MlstStatus::kMissingInput: return "missing input";
    case MlstStatus::kOutputFailed: return "output failed";
    case MlstStatus::kLaunchFailed: return "launch failed";
    case MlstStatus::kNonZeroExit:  return "non-zero exit";
    case MlstStatus::kSignaled:     return "killed by signal";
    case MlstStatus::kTimedOut:     return "timed out";
    }
    return "unknown";
}

std::string mlst_output_path(const std::string& output_dir,
                             const std::string& sample) {
    return (std::filesystem::path(output_dir) / (sample + MLST_OUTPUT_SUFFIX)).string();
}

std::vector<std::string> build_mlst_argv(const MlstTask& task,
                                         const MlstOptions& opts) {
    std::vector<std::string> argv;
    argv.reserve(opts.extra_args.size() + 2);
    argv.push_back(opts.executable);
    argv.insert(argv.end(), opts.extra_args.begin(), opts.extra_args.end());
    argv.push_back(task.input_path);
    return argv;
}

std::vector<std::string> split_args(const std::string& text) {
    std::vector<std::string> args;
    std::istringstream iss(text);
    std::string tok;
    while (iss >> tok) args.push_back(tok);
    return args;
}

MlstResult run_mlst_task(const MlstTask& task, const MlstOptions& opts,
                         const Logger& logger) {
    MlstResult result;
    result.task = task;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(task.input_path, ec)) {
        result.status = MlstStatus::kMissingInput;
        result.error = "no input file " + task.input_path;
        return result;
    }

    ScopedFd out(::open(task.output_path.c_str(),
                        O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!out.valid()) {
        result.status = MlstStatus::kOutputFailed;
        result.error = "cannot create " + task.output_path + ": " + std::strerror(errno);
        return result;
    }

    SpawnActions actions;
    if (!actions.ok() ||
        ::posix_spawn_file_actions_adddup2(actions.get(), out.get(), STDOUT_FILENO) != 0) {
        result.status = MlstStatus::kLaunchFailed;
        result.error = "cannot prepare stdout redirection";
        return result;
    }

    std::vector<std::string> args = build_mlst_argv(task, opts);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);

    logger.debug("%s: running %s %s", task.sample.c_str(),
                 opts.executable.c_str(), task.input_path.c_str());

    pid_t pid = 0;
    int rc = ::posix_spawnp(&pid, opts.executable.c_str(), actions.get(),
                            nullptr, argv.data(), environ);
    if (rc != 0) {
        result.status = MlstStatus::kLaunchFailed;
        result.error = "cannot run '" + opts.executable + "': " + std::strerror(rc);
        return result;
    }

    int status = 0;
    if (opts.timeout_sec == 0) {
        if (wait_child(pid, status, 0) < 0) {
            result.status = MlstStatus::kLaunchFailed;
            result.error = std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }
    } else {
        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::seconds(opts.timeout_sec);
        for (;;) {
            int r = wait_child(pid, status, WNOHANG);
            if (r == pid) break;
            if (r < 0) {
                result.status = MlstStatus::kLaunchFailed;
                result.error = std::string("waitpid failed: ") + std::strerror(errno);
                return result;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                ::kill(pid, SIGKILL);
                wait_child(pid, status, 0);
                result.status = MlstStatus::kTimedOut;
                result.error = "no result after " + std::to_string(opts.timeout_sec) + "s";
                return result;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code == 0) {
            result.status = MlstStatus::kOk;
        } else if (result.exit_code == 127) {
            result.status = MlstStatus::kLaunchFailed;
            result.error = "'" + opts.executable + "' not found (exit 127)";
        } else {
            result.status = MlstStatus::kNonZeroExit;
            result.error = "exit status " + std::to_string(result.exit_code);
        }
    } else if (WIFSIGNALED(status)) {
        result.exit_code = WTERMSIG(status);
        result.status = MlstStatus::kSignaled;
        result.error = std::string("terminated by signal ") + std::to_string(result.exit_code);
    }
    return result;
}

} // namespace contigsift
