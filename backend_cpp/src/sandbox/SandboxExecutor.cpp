#include "sandbox/SandboxExecutor.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "sandbox/ScratchDirectory.hpp"
#include "sandbox/UniqueFd.hpp"

extern char** environ;

namespace data_analyst {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds kPollSlice{50};
// How long we keep reading after the leader is gone and its group was killed.
// Only matters for descendants that left the group (setsid) and kept our pipes.
constexpr std::chrono::milliseconds kDrainGrace{500};
constexpr int kMaxInheritedFd = 65536;

PipePair make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        throw std::runtime_error(std::string("pipe2: ") + std::strerror(errno));
    }
    return PipePair{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw std::runtime_error(std::string("fcntl(O_NONBLOCK): ") + std::strerror(errno));
    }
}

struct BoundedBuffer {
    std::string data;
    size_t limit;
    bool truncated = false;

    explicit BoundedBuffer(size_t max_bytes) : limit(max_bytes) {}

    void append(const char* p, size_t n) {
        size_t room = limit - data.size();
        if (n > room) {
            truncated = true;
            n = room;
        }
        data.append(p, n);
    }
};

// Reads whatever is available. Returns false once the pipe hit EOF.
bool pump(int fd, BoundedBuffer& buf) {
    char chunk[64 * 1024];
    for (;;) {
        ssize_t r = ::read(fd, chunk, sizeof(chunk));
        if (r > 0) {
            buf.append(chunk, static_cast<size_t>(r));
            continue;
        }
        if (r == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

// Peeks at the child's state without reaping it, so its pid (and with it
// the process group id) cannot be recycled before we kill the group.
bool leader_has_exited(pid_t pid) {
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
        return errno == ECHILD;
    }
    return info.si_pid == pid;
}

// Everything the child needs, materialised before fork().
struct ChildPlan {
    std::string exe;
    std::string work_dir;
    std::vector<std::string> argv_storage;
    std::vector<std::string> env_storage;
    std::vector<char*> argv;
    std::vector<char*> envp;
    long memory_limit_mb = 0;
    long cpu_limit_seconds = 0;
    int max_fd = kMaxInheritedFd;

    void seal() {
        for (auto& s : argv_storage) argv.push_back(const_cast<char*>(s.c_str()));
        argv.push_back(nullptr);
        for (auto& s : env_storage) envp.push_back(const_cast<char*>(s.c_str()));
        envp.push_back(nullptr);
    }
};

[[noreturn]] void report_and_exit(int status_fd, int err) {
    ssize_t ignored = ::write(status_fd, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
}

// Runs in the forked child: async-signal-safe calls only.
[[noreturn]] void exec_child(const ChildPlan& plan, int out_fd, int err_fd, int status_fd) {
    if (::setpgid(0, 0) < 0) report_and_exit(status_fd, errno);

    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);
    struct sigaction dfl;
    std::memset(&dfl, 0, sizeof(dfl));
    dfl.sa_handler = SIG_DFL;
    ::sigaction(SIGPIPE, &dfl, nullptr);

    if (::chdir(plan.work_dir.c_str()) < 0) report_and_exit(status_fd, errno);

    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd < 0) report_and_exit(status_fd, errno);
    if (::dup2(null_fd, STDIN_FILENO) < 0) report_and_exit(status_fd, errno);
    if (::dup2(out_fd, STDOUT_FILENO) < 0) report_and_exit(status_fd, errno);
    if (::dup2(err_fd, STDERR_FILENO) < 0) report_and_exit(status_fd, errno);

    // Server sockets and anything else without O_CLOEXEC stay with us.
    for (int fd = STDERR_FILENO + 1; fd < plan.max_fd; ++fd) {
        if (fd != status_fd) ::close(fd);
    }

    if (plan.memory_limit_mb > 0) {
        struct rlimit rl;
        rl.rlim_cur = rl.rlim_max = static_cast<rlim_t>(plan.memory_limit_mb) * 1024 * 1024;
        if (::setrlimit(RLIMIT_AS, &rl) < 0) report_and_exit(status_fd, errno);
    }
    if (plan.cpu_limit_seconds > 0) {
        struct rlimit rl;
        rl.rlim_cur = static_cast<rlim_t>(plan.cpu_limit_seconds);
        rl.rlim_max = static_cast<rlim_t>(plan.cpu_limit_seconds + 1);
        if (::setrlimit(RLIMIT_CPU, &rl) < 0) report_and_exit(status_fd, errno);
    }

    ::execve(plan.exe.c_str(), plan.argv.data(), plan.envp.data());
    report_and_exit(status_fd, errno);
}

ExecutionResult launch_failed(const std::string& reason, Clock::time_point start) {
    ExecutionResult r;
    r.exit_status = ExitStatus::LaunchFailed;
    r.stderr_data = reason;
    r.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    return r;
}

} // namespace

SandboxExecutor::SandboxExecutor(const AnalystConfig& config) : config_(config) {}

std::string SandboxExecutor::resolve_interpreter(const std::string& interpreter) {
    if (interpreter.empty()) return "";
    if (interpreter.find('/') != std::string::npos) {
        return ::access(interpreter.c_str(), X_OK) == 0 ? std::filesystem::absolute(interpreter).string() : "";
    }

    const char* path_env = std::getenv("PATH");
    std::string path = (path_env && *path_env) ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t begin = 0;
    while (begin <= path.size()) {
        size_t end = path.find(':', begin);
        std::string dir = path.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + interpreter;
        if (::access(candidate.c_str(), X_OK) == 0) return std::filesystem::absolute(candidate).string();
        if (end == std::string::npos) break;
        begin = end + 1;
    }
    return "";
}

std::vector<std::string> SandboxExecutor::child_environment() const {
    std::vector<std::string> env;
    const std::string hidden = config_.api_key_env + "=";
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        if (entry.compare(0, hidden.size(), hidden) == 0) continue;
        env.push_back(std::move(entry));
    }
    return env;
}

ExecutionResult SandboxExecutor::execute(const GeneratedProgram& program,
                                         const std::vector<AttachedFile>& files,
                                         const CancellationToken* cancel,
                                         const std::string& session_id) const {
    const auto start = Clock::now();

    std::string exe = resolve_interpreter(config_.interpreter);
    if (exe.empty()) {
        spdlog::error("[{}] ❌ Interpreter '{}' not found", session_id, config_.interpreter);
        return launch_failed("interpreter not found: " + config_.interpreter, start);
    }

    std::unique_ptr<ScratchDirectory> scratch;
    try {
        scratch = std::make_unique<ScratchDirectory>(config_.scratch_root);
        scratch->write_file(scratch->program_path(), program.source_text);
        for (const auto& file : files) {
            // An absolute or nested name would escape work/.
            fs::path name(file.name);
            if (file.name.empty() || name.filename() != name || name == "." || name == "..") {
                throw std::runtime_error("attached file name is not a plain file name: '" + file.name + "'");
            }
            scratch->write_file(scratch->work_dir() / name, file.content);
        }
    } catch (const std::exception& e) {
        spdlog::error("[{}] ❌ Scratch setup failed: {}", session_id, e.what());
        return launch_failed(std::string("scratch setup failed: ") + e.what(), start);
    }

    ChildPlan plan;
    plan.exe = exe;
    plan.work_dir = scratch->work_dir().string();
    plan.argv_storage = {exe, scratch->program_path().string()};
    plan.env_storage = child_environment();
    plan.memory_limit_mb = config_.memory_limit_mb;
    plan.cpu_limit_seconds = config_.cpu_limit_seconds;
    struct rlimit nofile;
    if (::getrlimit(RLIMIT_NOFILE, &nofile) == 0 && nofile.rlim_cur != RLIM_INFINITY) {
        plan.max_fd = static_cast<int>(std::min<rlim_t>(nofile.rlim_cur, kMaxInheritedFd));
    }
    plan.seal();

    PipePair out, err, status;
    try {
        out = make_pipe();
        err = make_pipe();
        status = make_pipe();
    } catch (const std::exception& e) {
        return launch_failed(e.what(), start);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        return launch_failed(std::string("fork: ") + std::strerror(errno), start);
    }
    if (pid == 0) {
        exec_child(plan, out.write_end.get(), err.write_end.get(), status.write_end.get());
    }

    // Mirror the child's setpgid so a kill can never target our own group.
    // EACCES means the child already exec'd, and so already did it itself.
    ::setpgid(pid, pid);
    out.write_end.reset();
    err.write_end.reset();
    status.write_end.reset();

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status.read_end.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int ignored;
        ::waitpid(pid, &ignored, 0);
        spdlog::error("[{}] ❌ Launch of {} failed: {}", session_id, exe, std::strerror(child_errno));
        return launch_failed("launch " + exe + ": " + std::strerror(child_errno), start);
    }

    spdlog::info("[{}] 🚀 Sandbox pid {} started in {}", session_id, pid, plan.work_dir);

    BoundedBuffer out_buf(config_.max_stdout_bytes);
    BoundedBuffer err_buf(config_.max_stderr_bytes);
    bool out_open = true;
    bool err_open = true;
    bool exited = false;
    bool group_killed = false;
    bool timed_out = false;
    bool cancelled = false;
    std::optional<Clock::time_point> drain_until;
    const auto deadline = start + config_.execution_timeout;

    try {
        set_nonblocking(out.read_end.get());
        set_nonblocking(err.read_end.get());
    } catch (const std::exception& e) {
        spdlog::error("[{}] ❌ {}", session_id, e.what());
        ::killpg(pid, SIGKILL);
        int ignored;
        ::waitpid(pid, &ignored, 0);
        return launch_failed(e.what(), start);
    }

    auto kill_group = [&]() {
        if (group_killed) return;
        if (::killpg(pid, SIGKILL) < 0 && errno != ESRCH) {
            spdlog::error("[{}] killpg({}): {}", session_id, pid, std::strerror(errno));
        }
        group_killed = true;
    };

    for (;;) {
        auto now = Clock::now();
        if (!exited) exited = leader_has_exited(pid);

        if (exited) {
            // Leader is a zombie: the group id is still ours to kill.
            kill_group();
            if (!out_open && !err_open) break;
            if (!drain_until) {
                drain_until = now + kDrainGrace;
            } else if (now >= *drain_until) {
                spdlog::warn("[{}] ⚠️ Output pipes still held open after exit, giving up on them", session_id);
                break;
            }
        } else if (!group_killed) {
            if (now >= deadline) {
                timed_out = true;
                spdlog::warn("[{}] ⏱️ Deadline of {}ms exceeded, killing process group {}",
                             session_id, config_.execution_timeout.count(), pid);
                kill_group();
            } else if (cancel && cancel->is_cancelled()) {
                cancelled = true;
                spdlog::warn("[{}] 🛑 Caller went away, killing process group {}", session_id, pid);
                kill_group();
            }
        }

        auto slice = kPollSlice;
        if (!group_killed) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            slice = std::max(std::chrono::milliseconds(1), std::min(slice, left));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) fds[nfds++] = pollfd{out.read_end.get(), POLLIN, 0};
        if (err_open) fds[nfds++] = pollfd{err.read_end.get(), POLLIN, 0};

        int rc = ::poll(nfds ? fds : nullptr, nfds, static_cast<int>(slice.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            spdlog::error("[{}] poll: {}", session_id, std::strerror(errno));
            kill_group();
            break;
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == out.read_end.get()) {
                out_open = pump(fds[i].fd, out_buf);
            } else {
                err_open = pump(fds[i].fd, err_buf);
            }
        }
    }

    kill_group();
    int wstatus = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &wstatus, 0);
    } while (waited < 0 && errno == EINTR);

    ExecutionResult result;
    result.stdout_data = std::move(out_buf.data);
    result.stderr_data = std::move(err_buf.data);
    result.stdout_truncated = out_buf.truncated;
    result.stderr_truncated = err_buf.truncated;
    result.cancelled = cancelled;
    result.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    if (waited == pid && WIFEXITED(wstatus)) {
        result.exit_code = WEXITSTATUS(wstatus);
    } else if (waited == pid && WIFSIGNALED(wstatus)) {
        result.term_signal = WTERMSIG(wstatus);
    }

    if (timed_out || cancelled) {
        result.exit_status = ExitStatus::TimedOut;
    } else if (result.exit_code == 0) {
        result.exit_status = ExitStatus::Success;
    } else {
        result.exit_status = ExitStatus::NonZeroExit;
    }

    spdlog::info("[{}] 🏁 Sandbox pid {} finished: {} (code {}, signal {}) in {}ms, stdout {}B, stderr {}B",
                 session_id, pid, to_string(result.exit_status), result.exit_code, result.term_signal,
                 result.wall_time.count(), result.stdout_data.size(), result.stderr_data.size());
    return result;
}

} // namespace data_analyst
