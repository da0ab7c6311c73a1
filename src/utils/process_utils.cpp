/**
 * @file process_utils.cpp
 * @brief Implementation of child process spawning with output capture
 *
 * **Spawn sequence**:
 * ```
 * parent                               child
 *   build envp / resolve argv[0]
 *   fork() ──────────────────────────▶ setpgid(0, 0)
 *                                      stdin  ← /dev/null
 *                                      stdout ← capture pipe
 *                                      stderr ← capture pipe (or its own)
 *                                      chdir(working_directory)
 *                                      pre_exec()
 *                                      execve()  or  entry() + _exit()
 *   read exec-status pipe (CLOEXEC)
 *   poll() capture pipes until EOF
 *   waitpid()
 * ```
 *
 * Exec failures in the child are reported back through a close-on-exec
 * status pipe so the caller gets a real error instead of exit code 127.
 *
 * @date 2025
 */

#include "warden/utils/process_utils.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace warden {
namespace utils {

namespace {

// Stages reported through the exec-status pipe
enum ChildStage : int {
    STAGE_CHDIR = 1,
    STAGE_PRE_EXEC = 2,
    STAGE_EXEC = 3
};

struct ChildFailure {
    int stage{0};
    int error_number{0};
};

/**
 * @brief Pipe pair closed on scope exit
 */
class Pipe {
public:
    Pipe() {
        if (::pipe2(fds_, O_CLOEXEC) != 0) {
            throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));
        }
    }

    ~Pipe() {
        CloseRead();
        CloseWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_fd() const { return fds_[0]; }
    int write_fd() const { return fds_[1]; }

    void CloseRead() { Close(0); }
    void CloseWrite() { Close(1); }

private:
    void Close(int index) {
        if (fds_[index] >= 0) {
            ::close(fds_[index]);
            fds_[index] = -1;
        }
    }

    int fds_[2]{-1, -1};
};

std::map<std::string, std::string> BuildEnvironmentMap(const ProcessOptions& options) {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string line(*entry);
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        env[line.substr(0, eq)] = line.substr(eq + 1);
    }

    for (const auto& name : options.unset_environment) {
        env.erase(name);
    }
    for (const auto& [name, value] : options.environment) {
        env[name] = value;
    }
    return env;
}

void ReportChildFailure(int fd, int stage, int error_number) {
    ChildFailure failure{stage, error_number};
    ssize_t ignored = ::write(fd, &failure, sizeof(failure));
    (void)ignored;
}

void WriteAll(int fd, const char* data, std::size_t size) {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
}

int WaitForChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    return status;
}

void KillChild(pid_t pid, bool process_group) {
    if (process_group) {
        ::kill(-pid, SIGKILL);
    }
    ::kill(pid, SIGKILL);
}

std::string DescribeStage(int stage) {
    switch (stage) {
        case STAGE_CHDIR:    return "change directory";
        case STAGE_PRE_EXEC: return "prepare child";
        case STAGE_EXEC:     return "execute";
        default:             return "start";
    }
}

} // anonymous namespace

// ============================================================================
// EXECUTABLE LOOKUP
// ============================================================================

std::optional<std::filesystem::path> FindExecutable(const std::string& name,
                                                    const std::optional<std::string>& search_path) {
    if (name.empty()) {
        return std::nullopt;
    }

    auto is_executable = [](const std::filesystem::path& candidate) {
        struct stat st {};
        return ::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
               ::access(candidate.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        std::filesystem::path candidate(name);
        if (is_executable(candidate)) {
            return std::filesystem::absolute(candidate);
        }
        return std::nullopt;
    }

    std::string path_value;
    if (search_path.has_value()) {
        path_value = *search_path;
    } else if (const char* env_path = std::getenv("PATH")) {
        path_value = env_path;
    } else {
        path_value = "/usr/local/bin:/usr/bin:/bin";
    }

    for (const auto& dir : StringUtils::Split(path_value, ':')) {
        std::filesystem::path candidate = std::filesystem::path(dir) / name;
        if (is_executable(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

ProcessResult RunProcess(const ProcessOptions& options) {
    if (options.argv.empty() && !options.entry) {
        throw std::invalid_argument("RunProcess requires argv or an entry function");
    }

    // Everything the child needs is prepared before fork()
    auto env_map = BuildEnvironmentMap(options);
    std::vector<std::string> env_strings;
    env_strings.reserve(env_map.size());
    for (const auto& [name, value] : env_map) {
        env_strings.push_back(name + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& entry : env_strings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::string executable;
    std::vector<std::string> argv_copy = options.argv;
    std::vector<char*> argv;
    if (!options.entry) {
        std::optional<std::string> search_path;
        auto it = env_map.find("PATH");
        if (it != env_map.end()) {
            search_path = it->second;
        }
        auto resolved = FindExecutable(options.argv.front(), search_path);
        if (!resolved) {
            throw std::runtime_error("Executable not found: " + options.argv.front());
        }
        executable = resolved->string();
        for (auto& arg : argv_copy) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
    }

    int dev_null = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (dev_null < 0) {
        throw std::runtime_error(std::string("Failed to open /dev/null: ") + std::strerror(errno));
    }

    Pipe status_pipe;
    Pipe out_pipe;
    std::optional<Pipe> err_pipe;
    if (!options.merge_stderr) {
        err_pipe.emplace();
    }

    std::fflush(nullptr);
    auto start = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        int fork_errno = errno;
        ::close(dev_null);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(fork_errno));
    }

    if (pid == 0) {
        // Child
        if (options.new_process_group) {
            ::setpgid(0, 0);
        }
        ::dup2(dev_null, STDIN_FILENO);
        ::dup2(out_pipe.write_fd(), STDOUT_FILENO);
        ::dup2(err_pipe ? err_pipe->write_fd() : out_pipe.write_fd(), STDERR_FILENO);

        if (options.working_directory &&
            ::chdir(options.working_directory->c_str()) != 0) {
            ReportChildFailure(status_pipe.write_fd(), STAGE_CHDIR, errno);
            ::_exit(127);
        }

        if (options.pre_exec) {
            try {
                options.pre_exec();
            } catch (const std::exception& e) {
                std::fprintf(stderr, "pre-exec failed: %s\n", e.what());
                ReportChildFailure(status_pipe.write_fd(), STAGE_PRE_EXEC, EPERM);
                ::_exit(126);
            }
        }

        if (options.entry) {
            ::close(status_pipe.write_fd());
            for (const auto& [name, value] : options.environment) {
                ::setenv(name.c_str(), value.c_str(), 1);
            }
            for (const auto& name : options.unset_environment) {
                ::unsetenv(name.c_str());
            }
            int code = 1;
            try {
                code = options.entry();
            } catch (const std::exception& e) {
                std::fprintf(stderr, "entry failed: %s\n", e.what());
            }
            std::fflush(nullptr);
            ::_exit(code);
        }

        ::execve(executable.c_str(), argv.data(), envp.data());
        ReportChildFailure(status_pipe.write_fd(), STAGE_EXEC, errno);
        ::_exit(127);
    }

    // Parent
    ::close(dev_null);
    if (options.new_process_group) {
        ::setpgid(pid, pid);  // mirror child's setpgid (race safety)
    }
    status_pipe.CloseWrite();
    out_pipe.CloseWrite();
    if (err_pipe) {
        err_pipe->CloseWrite();
    }

    ChildFailure failure;
    ssize_t status_bytes = 0;
    do {
        status_bytes = ::read(status_pipe.read_fd(), &failure, sizeof(failure));
    } while (status_bytes < 0 && errno == EINTR);

    if (status_bytes == static_cast<ssize_t>(sizeof(failure))) {
        WaitForChild(pid);
        std::string target = options.argv.empty() ? std::string("entry") : options.argv.front();
        if (failure.stage == STAGE_CHDIR && options.working_directory) {
            target = options.working_directory->string();
        }
        throw std::runtime_error("Failed to " + DescribeStage(failure.stage) + " " + target +
                                 ": " + std::strerror(failure.error_number));
    }

    ProcessResult result;

    struct Stream {
        int fd;
        std::string* sink;
        bool open;
    };
    std::vector<Stream> streams;
    streams.push_back({out_pipe.read_fd(), &result.output, true});
    if (err_pipe) {
        streams.push_back({err_pipe->read_fd(), &result.error_output, true});
    }

    const bool has_deadline = options.timeout.count() > 0;
    const auto deadline = start + options.timeout;
    char buffer[8192];

    auto any_open = [&streams]() {
        for (const auto& s : streams) {
            if (s.open) return true;
        }
        return false;
    };

    while (any_open()) {
        int wait_ms = -1;
        if (has_deadline && !result.timed_out) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                spdlog::warn("Process {} exceeded wall-clock timeout ({} ms), killing",
                             pid, options.timeout.count());
                KillChild(pid, options.new_process_group);
                result.timed_out = true;
            } else {
                wait_ms = static_cast<int>(remaining.count());
            }
        }

        std::vector<pollfd> poll_fds;
        std::vector<Stream*> polled;
        for (auto& s : streams) {
            if (s.open) {
                poll_fds.push_back({s.fd, POLLIN, 0});
                polled.push_back(&s);
            }
        }

        int rc = ::poll(poll_fds.data(), poll_fds.size(), wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll failed: {}", std::strerror(errno));
            break;
        }
        if (rc == 0) {
            continue;
        }

        for (std::size_t i = 0; i < poll_fds.size(); ++i) {
            if (poll_fds[i].revents == 0) {
                continue;
            }
            ssize_t n = ::read(poll_fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                auto* sink = polled[i]->sink;
                if (sink->size() < options.max_output_bytes) {
                    auto room = options.max_output_bytes - sink->size();
                    sink->append(buffer, std::min<std::size_t>(room, static_cast<std::size_t>(n)));
                    if (static_cast<std::size_t>(n) > room) {
                        sink->append("\n[output truncated]\n");
                    }
                }
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                polled[i]->open = false;
            }
        }
    }

    // The child may close its pipes and keep running, so the deadline also covers reaping
    int status = 0;
    bool reaped = false;
    while (has_deadline && !result.timed_out && !reaped) {
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            reaped = true;
        } else if (done < 0 && errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        } else if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::warn("Process {} exceeded wall-clock timeout ({} ms), killing",
                         pid, options.timeout.count());
            KillChild(pid, options.new_process_group);
            result.timed_out = true;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    if (!reaped) {
        status = WaitForChild(pid);
    }
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }

    return result;
}

// ============================================================================
// DETACHED EXECUTION
// ============================================================================

pid_t SpawnDetached(const ProcessOptions& options, const std::filesystem::path& log_file) {
    if (options.argv.empty()) {
        throw std::invalid_argument("SpawnDetached requires argv");
    }

    auto env_map = BuildEnvironmentMap(options);
    std::vector<std::string> env_strings;
    for (const auto& [name, value] : env_map) {
        env_strings.push_back(name + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& entry : env_strings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    auto path_it = env_map.find("PATH");
    auto resolved = FindExecutable(options.argv.front(),
        path_it != env_map.end() ? std::optional<std::string>(path_it->second) : std::nullopt);
    if (!resolved) {
        throw std::runtime_error("Executable not found: " + options.argv.front());
    }
    std::string executable = resolved->string();

    std::vector<std::string> argv_copy = options.argv;
    std::vector<char*> argv;
    for (auto& arg : argv_copy) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    Pipe pid_pipe;

    std::fflush(nullptr);
    pid_t first = ::fork();
    if (first < 0) {
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }

    if (first == 0) {
        ::setsid();
        pid_t second = ::fork();
        if (second < 0) {
            ::_exit(1);
        }
        if (second > 0) {
            WriteAll(pid_pipe.write_fd(), reinterpret_cast<const char*>(&second), sizeof(second));
            ::_exit(0);
        }

        // Own process group so the job can be signalled as a whole via -pid
        ::setpgid(0, 0);

        int log_fd = ::open(log_file.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        int null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
        }
        if (log_fd >= 0) {
            ::dup2(log_fd, STDOUT_FILENO);
            ::dup2(log_fd, STDERR_FILENO);
        }
        if (options.working_directory &&
            ::chdir(options.working_directory->c_str()) != 0) {
            ::_exit(127);
        }
        if (options.pre_exec) {
            try {
                options.pre_exec();
            } catch (const std::exception&) {
                ::_exit(126);
            }
        }
        ::execve(executable.c_str(), argv.data(), envp.data());
        ::_exit(127);
    }

    pid_pipe.CloseWrite();
    WaitForChild(first);

    pid_t detached = -1;
    ssize_t n = 0;
    do {
        n = ::read(pid_pipe.read_fd(), &detached, sizeof(detached));
    } while (n < 0 && errno == EINTR);

    if (n != static_cast<ssize_t>(sizeof(detached)) || detached <= 0) {
        throw std::runtime_error("Failed to start detached process: " + options.argv.front());
    }
    return detached;
}

// ============================================================================
// EXIT DESCRIPTIONS
// ============================================================================

std::string SignalName(int signal_number) {
    switch (signal_number) {
        case SIGKILL: return "SIGKILL";
        case SIGTERM: return "SIGTERM";
        case SIGXCPU: return "SIGXCPU";
        case SIGXFSZ: return "SIGXFSZ";
        case SIGSEGV: return "SIGSEGV";
        case SIGABRT: return "SIGABRT";
        case SIGBUS:  return "SIGBUS";
        case SIGINT:  return "SIGINT";
        case SIGPIPE: return "SIGPIPE";
        case SIGSYS:  return "SIGSYS";
        default:      return "signal " + std::to_string(signal_number);
    }
}

std::string DescribeExit(const ProcessResult& result) {
    if (result.timed_out) {
        return "killed after wall-clock timeout";
    }
    if (result.term_signal != 0) {
        std::string description = "terminated by signal " + SignalName(result.term_signal) +
                                  " (" + std::to_string(result.term_signal) + ")";
        if (result.term_signal == SIGXCPU || result.term_signal == SIGKILL) {
            description += ", CPU time or memory ceiling likely exceeded";
        }
        return description;
    }
    return "exit code " + std::to_string(result.exit_code);
}

} // namespace utils
} // namespace warden
