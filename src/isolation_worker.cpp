#include "isolation_worker.h"
#include "errors.h"
#include "log.h"
#include "resource_limiter.h"

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace sniprun {

std::string worker_state_to_string(WorkerState state) {
    switch (state) {
        case WorkerState::COLD: return "Cold";
        case WorkerState::WARMING: return "Warming";
        case WorkerState::READY: return "Ready";
        case WorkerState::EXECUTING: return "Executing";
        case WorkerState::DRAINING: return "Draining";
        case WorkerState::DESTROYED: return "Destroyed";
    }
    return "Unknown";
}

namespace {

// Closes the descriptor when it goes out of scope
class FdGuard {
public:
    FdGuard() = default;
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void reset(int fd = -1) {
        if (fd_ >= 0) close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct PipePair {
    FdGuard read_end;
    FdGuard write_end;

    void open() {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0) {
            throw SandboxError(std::string("pipe2: ") + std::strerror(errno));
        }
        read_end.reset(fds[0]);
        write_end.reset(fds[1]);
    }
};

// Where the child gave up, reported back over the report pipe
enum ChildStage : int {
    STAGE_SYNC = 1,
    STAGE_SETSID,
    STAGE_MOUNT_PRIVATE,
    STAGE_CHDIR,
    STAGE_TMPFS,
    STAGE_PROC,
    STAGE_STDIO,
    STAGE_RLIMIT,
    STAGE_SECCOMP,
    STAGE_EXEC
};

const char* stage_name(int stage) {
    switch (stage) {
        case STAGE_SYNC: return "sync";
        case STAGE_SETSID: return "setsid";
        case STAGE_MOUNT_PRIVATE: return "mount private";
        case STAGE_CHDIR: return "chdir";
        case STAGE_TMPFS: return "mount tmpfs";
        case STAGE_PROC: return "mount proc";
        case STAGE_STDIO: return "stdio";
        case STAGE_RLIMIT: return "rlimit";
        case STAGE_SECCOMP: return "seccomp";
        case STAGE_EXEC: return "exec";
    }
    return "unknown";
}

struct ChildReport {
    int stage;
    int error;
};

// Everything the child needs, prepared by the parent. Between clone and
// exec the child only touches this struct and makes raw syscalls.
struct ChildContext {
    const char* executable = nullptr;
    char* const* argv = nullptr;
    char* const* envp = nullptr;
    const char* work_dir = nullptr;
    const char* tmpfs_options = nullptr;
    bool use_namespaces = false;
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
    int sync_fd = -1;
    int report_fd = -1;
    RlimitPlan rlimits;
    const SeccompFilter* filter = nullptr;
};

[[noreturn]] void child_fail(const ChildContext* ctx, int stage, int error) {
    ChildReport report{stage, error};
    ssize_t ignored = write(ctx->report_fd, &report, sizeof(report));
    (void)ignored;
    _exit(127);
}

void close_other_fds(int keep) {
#ifdef SYS_close_range
    if (keep > 3) syscall(SYS_close_range, 3, keep - 1, 0);
    if (syscall(SYS_close_range, keep + 1, ~0U, 0) == 0) return;
#endif
    for (int fd = 3; fd < 1024; ++fd) {
        if (fd != keep) close(fd);
    }
}

int child_main(void* arg) {
    const ChildContext* ctx = static_cast<const ChildContext*>(arg);

    // Wait until the parent has written our id maps and joined us to the cgroup
    char go = 0;
    if (read(ctx->sync_fd, &go, 1) != 1) {
        child_fail(ctx, STAGE_SYNC, errno ? errno : EPIPE);
    }

    // New process group so the watchdog can kill everything we spawn
    if (setsid() < 0) child_fail(ctx, STAGE_SETSID, errno);

    if (ctx->use_namespaces) {
        if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
            child_fail(ctx, STAGE_MOUNT_PRIVATE, errno);
        }
    }

    // cwd keeps pointing at the worker directory even when /tmp is covered below
    if (chdir(ctx->work_dir) != 0) child_fail(ctx, STAGE_CHDIR, errno);

    if (ctx->use_namespaces) {
        if (mount("tmpfs", "/tmp", "tmpfs", MS_NOSUID | MS_NODEV, ctx->tmpfs_options) != 0) {
            child_fail(ctx, STAGE_TMPFS, errno);
        }
        // Our own process table; if the host refuses a proc mount hide /proc instead
        if (mount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr) != 0 &&
            mount("tmpfs", "/proc", "tmpfs", MS_NOSUID | MS_NODEV | MS_NOEXEC | MS_RDONLY,
                  "size=4k") != 0) {
            child_fail(ctx, STAGE_PROC, errno);
        }
        const char hostname[] = "sandbox";
        sethostname(hostname, sizeof(hostname) - 1);
    }

    if (dup2(ctx->stdin_fd, STDIN_FILENO) < 0 ||
        dup2(ctx->stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(ctx->stderr_fd, STDERR_FILENO) < 0) {
        child_fail(ctx, STAGE_STDIO, errno);
    }
    close_other_fds(ctx->report_fd);

    int err = ResourceLimiter::apply_rlimits(ctx->rlimits);
    if (err != 0) child_fail(ctx, STAGE_RLIMIT, err);

    if (ctx->filter) {
        err = ctx->filter->install();
        if (err != 0) child_fail(ctx, STAGE_SECCOMP, err);
    }

    execve(ctx->executable, ctx->argv, ctx->envp);
    child_fail(ctx, STAGE_EXEC, errno);
}

// Locate argv[0] the way execvp would, but in the parent
std::string resolve_executable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }

    const char* env_path = std::getenv("PATH");
    std::string search = env_path ? env_path : "/usr/local/bin:/usr/bin:/bin";
    std::istringstream dirs(search);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

bool write_proc_file(pid_t pid, const std::string& file, const std::string& value) {
    std::string path = "/proc/" + std::to_string(pid) + "/" + file;
    int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    ssize_t n = write(fd, value.data(), value.size());
    close(fd);
    return n == static_cast<ssize_t>(value.size());
}

std::vector<char*> to_cstrings(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& s : strings) {
        pointers.push_back(s.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

} // namespace

class IsolationWorker::Impl {
public:
    std::string worker_id_;
    const RuntimeProfile& profile_;
    IsolationConfig config_;
    std::shared_ptr<const SeccompFilter> filter_;

    std::atomic<WorkerState> state_{WorkerState::COLD};
    mutable std::mutex mutex_;                    // Guards the fields below
    std::optional<std::string> assigned_request_id_;
    FdGuard cancel_read_;
    FdGuard cancel_write_;
    std::atomic<bool> cancelled_{false};

    std::string work_dir_;
    std::string executable_;
    std::unique_ptr<ResourceLimiter> limiter_;

    Impl(std::string worker_id, const RuntimeProfile& profile, const IsolationConfig& config,
         std::shared_ptr<const SeccompFilter> filter)
        : worker_id_(std::move(worker_id)), profile_(profile), config_(config),
          filter_(std::move(filter)) {}

    ~Impl() {
        destroy();
    }

    void transition(WorkerState from, WorkerState to) {
        WorkerState expected = from;
        if (!state_.compare_exchange_strong(expected, to)) {
            throw std::logic_error("worker " + worker_id_ + ": illegal transition " +
                                   worker_state_to_string(expected) + " -> " +
                                   worker_state_to_string(to));
        }
    }

    bool warm_up() {
        transition(WorkerState::COLD, WorkerState::WARMING);

        try {
            executable_ = resolve_executable(profile_.command.front());
            if (executable_.empty()) {
                throw SandboxError("runtime executable not found for " +
                                   language_to_string(profile_.language_id));
            }

            if (!filter_) {
                filter_ = std::make_shared<SeccompFilter>(
                    SeccompFilter::compile(profile_.denied_syscalls,
                                           !profile_.allow_network && !config_.use_namespaces));
            }

            fs::create_directories(config_.work_root);
            std::string pattern = config_.work_root + "/" + worker_id_ + "-XXXXXX";
            std::vector<char> buffer(pattern.begin(), pattern.end());
            buffer.push_back('\0');
            if (!mkdtemp(buffer.data())) {
                throw SandboxError("mkdtemp " + pattern + ": " + std::strerror(errno));
            }
            work_dir_ = buffer.data();

            limiter_ = std::make_unique<ResourceLimiter>(profile_, config_.cgroup_root);
            limiter_->prepare(worker_id_);

            PipePair cancel_pipe;
            cancel_pipe.open();
            if (fcntl(cancel_pipe.write_end.get(), F_SETFL, O_NONBLOCK) != 0) {
                throw SandboxError(std::string("fcntl: ") + std::strerror(errno));
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                cancel_read_.reset(cancel_pipe.read_end.release());
                cancel_write_.reset(cancel_pipe.write_end.release());
            }

            transition(WorkerState::WARMING, WorkerState::READY);
            return true;
        } catch (const std::exception& e) {
            log::error("Worker", worker_id_ + " warm-up failed: " + e.what());
            destroy();
            return false;
        }
    }

    ExecutionResult execute(const ExecutionRequest& request, const OutputSink& sink) {
        transition(WorkerState::READY, WorkerState::EXECUTING);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            assigned_request_id_ = request.id;
        }

        ExecutionResult result;
        result.request_id = request.id;
        auto start = std::chrono::steady_clock::now();

        try {
            run(request, sink, result);
        } catch (const std::exception& e) {
            // Details stay in the operator log
            log::alert("Worker", worker_id_ + " request " + request.id + ": " + e.what());
            result.outcome = Outcome::INTERNAL_ERROR;
            result.exit_code = -1;
            result.message = "internal error";
        }

        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        drain();
        return result;
    }

    void run(const ExecutionRequest& request, const OutputSink& sink, ExecutionResult& result) {
        if (cancelled_) {
            result.outcome = Outcome::CANCELLED;
            result.exit_code = -1;
            result.message = "execution cancelled";
            return;
        }

        // Snippet goes into the worker's private directory
        std::string source_path = work_dir_ + "/" + profile_.source_file;
        {
            std::ofstream source(source_path, std::ios::binary | std::ios::trunc);
            if (!source) {
                throw SandboxError("cannot write " + source_path);
            }
            source << request.source_code;
            if (!source.good()) {
                throw SandboxError("short write to " + source_path);
            }
        }

        // Everything the child touches is built before clone()
        std::vector<std::string> args = profile_.build_argv(profile_.source_file);
        std::vector<char*> argv = to_cstrings(args);

        std::string tmp_dir = config_.use_namespaces ? "/tmp" : work_dir_;
        std::vector<std::string> env = {
            "PATH=/usr/local/bin:/usr/bin:/bin",
            "HOME=" + work_dir_,
            "TMPDIR=" + tmp_dir,
            "LANG=C.UTF-8",
            "PYTHONUNBUFFERED=1",
            "PYTHONDONTWRITEBYTECODE=1",
        };
        std::vector<char*> envp = to_cstrings(env);
        std::string tmpfs_options = "size=" + std::to_string(config_.tmpfs_size_bytes) + ",mode=1777";

        PipePair in_pipe, out_pipe, err_pipe, sync_pipe, report_pipe;
        in_pipe.open();
        out_pipe.open();
        err_pipe.open();
        sync_pipe.open();
        report_pipe.open();

        ChildContext ctx;
        ctx.executable = executable_.c_str();
        ctx.argv = argv.data();
        ctx.envp = envp.data();
        ctx.work_dir = work_dir_.c_str();
        ctx.tmpfs_options = tmpfs_options.c_str();
        ctx.use_namespaces = config_.use_namespaces;
        ctx.stdin_fd = in_pipe.read_end.get();
        ctx.stdout_fd = out_pipe.write_end.get();
        ctx.stderr_fd = err_pipe.write_end.get();
        ctx.sync_fd = sync_pipe.read_end.get();
        ctx.report_fd = report_pipe.write_end.get();
        ctx.rlimits = limiter_->rlimit_plan(config_.use_namespaces);
        ctx.filter = filter_.get();

        int flags = SIGCHLD;
        if (config_.use_namespaces) {
            flags |= CLONE_NEWUSER | CLONE_NEWPID | CLONE_NEWNS | CLONE_NEWUTS | CLONE_NEWIPC;
            if (!profile_.allow_network) {
                flags |= CLONE_NEWNET;
            }
        }

        std::vector<char> stack(CHILD_STACK_SIZE);
        pid_t pid = clone(child_main, stack.data() + stack.size(), flags, &ctx);
        if (pid < 0) {
            throw SandboxError(std::string("clone: ") + std::strerror(errno));
        }

        // Parent keeps only its own ends
        in_pipe.read_end.reset();
        out_pipe.write_end.reset();
        err_pipe.write_end.reset();
        sync_pipe.read_end.reset();
        report_pipe.write_end.reset();

        limiter_->start(pid);

        bool setup_ok = true;
        std::string setup_error;
        if (config_.use_namespaces) {
            std::string uid_map = "0 " + std::to_string(geteuid()) + " 1\n";
            std::string gid_map = "0 " + std::to_string(getegid()) + " 1\n";
            if (!write_proc_file(pid, "setgroups", "deny") ||
                !write_proc_file(pid, "uid_map", uid_map) ||
                !write_proc_file(pid, "gid_map", gid_map)) {
                setup_ok = false;
                setup_error = std::string("writing id maps: ") + std::strerror(errno);
            }
        }
        if (setup_ok && !limiter_->attach(pid)) {
            setup_ok = false;
            setup_error = "joining cgroup failed";
        }

        if (!setup_ok) {
            limiter_->terminate();
            reap(pid);
            throw SandboxError(setup_error);
        }

        char go = 1;
        if (write(sync_pipe.write_end.get(), &go, 1) != 1) {
            limiter_->terminate();
            reap(pid);
            throw SandboxError(std::string("sync write: ") + std::strerror(errno));
        }
        sync_pipe.write_end.reset();

        // EOF means execve succeeded and closed the report pipe
        ChildReport report{0, 0};
        ssize_t n;
        do {
            n = read(report_pipe.read_end.get(), &report, sizeof(report));
        } while (n < 0 && errno == EINTR);
        if (n == static_cast<ssize_t>(sizeof(report))) {
            reap(pid);
            throw SandboxError(std::string("child setup failed at ") + stage_name(report.stage) +
                               ": " + std::strerror(report.error));
        }
        report_pipe.read_end.reset();

        pump_io(request, sink, in_pipe.write_end, out_pipe.read_end, err_pipe.read_end, result);

        ExitInfo exit = wait_for_exit(pid);
        ResourceUsage usage = limiter_->usage(exit);

        result.exit_code = ResourceLimiter::exit_code(exit);
        result.cpu_seconds = usage.cpu_seconds;
        result.memory_peak_bytes = usage.memory_peak_bytes;
        result.outcome = limiter_->classify(exit, cancelled_, result.stderr_output, result.message);
    }

    // Move output from the child into the result and the sink until both
    // streams close or the watchdog gives up on them
    void pump_io(const ExecutionRequest& request, const OutputSink& sink,
                 FdGuard& stdin_fd, FdGuard& stdout_fd, FdGuard& stderr_fd,
                 ExecutionResult& result) {
        const std::string empty;
        const std::string& input = request.stdin_data ? *request.stdin_data : empty;
        size_t input_offset = 0;

        if (input.empty()) {
            stdin_fd.reset();
        } else if (fcntl(stdin_fd.get(), F_SETFL, O_NONBLOCK) != 0) {
            throw SandboxError(std::string("fcntl: ") + std::strerror(errno));
        }

        size_t captured = 0;
        bool killed = false;
        auto kill_deadline = std::chrono::steady_clock::time_point::max();
        char buffer[PIPE_BUFFER_SIZE];

        auto capture = [&](EventType type, const char* data, size_t length) {
            size_t room = captured < config_.output_limit_bytes ? config_.output_limit_bytes - captured : 0;
            size_t keep = std::min(length, room);
            if (keep < length) {
                result.truncated = true;
            }
            if (keep == 0) return;

            std::string chunk(data, keep);
            if (type == EventType::STDOUT) {
                result.stdout_output += chunk;
            } else {
                result.stderr_output += chunk;
            }
            captured += keep;
            if (sink) sink(type, chunk);
        };

        auto kill_now = [&](std::chrono::steady_clock::time_point now) {
            limiter_->terminate();
            killed = true;
            kill_deadline = now + std::chrono::milliseconds(KILL_GRACE_MS);
        };

        while (stdout_fd.valid() || stderr_fd.valid()) {
            auto now = std::chrono::steady_clock::now();
            if (!killed && limiter_->deadline_passed(now)) {
                limiter_->mark_timed_out();
                kill_now(now);
            }
            if (killed && now >= kill_deadline) {
                // A straggler still holds the pipes; stop waiting for it
                break;
            }

            std::vector<pollfd> fds;
            int cancel_fd;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                cancel_fd = cancel_read_.get();
            }
            if (cancel_fd >= 0) fds.push_back({cancel_fd, POLLIN, 0});
            if (stdout_fd.valid()) fds.push_back({stdout_fd.get(), POLLIN, 0});
            if (stderr_fd.valid()) fds.push_back({stderr_fd.get(), POLLIN, 0});
            if (stdin_fd.valid()) fds.push_back({stdin_fd.get(), POLLOUT, 0});

            auto wait_until = killed ? kill_deadline : limiter_->deadline();
            auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(wait_until - now).count() + 1;
            if (timeout < 1) timeout = 1;

            int ready = poll(fds.data(), fds.size(), static_cast<int>(timeout));
            if (ready < 0) {
                if (errno == EINTR) continue;
                throw SandboxError(std::string("poll: ") + std::strerror(errno));
            }
            if (ready == 0) continue;

            for (const auto& entry : fds) {
                if (entry.revents == 0) continue;

                if (entry.fd == cancel_fd) {
                    if (!killed) {
                        cancelled_ = true;
                        kill_now(std::chrono::steady_clock::now());
                    }
                    char drain_buf[16];
                    ssize_t ignored = read(cancel_fd, drain_buf, sizeof(drain_buf));
                    (void)ignored;
                } else if (stdin_fd.valid() && entry.fd == stdin_fd.get()) {
                    if (entry.revents & (POLLERR | POLLHUP)) {
                        stdin_fd.reset();
                        continue;
                    }
                    ssize_t written = write(stdin_fd.get(), input.data() + input_offset,
                                            input.size() - input_offset);
                    if (written > 0) {
                        input_offset += written;
                    } else if (written < 0 && errno != EAGAIN && errno != EINTR) {
                        stdin_fd.reset();  // Child closed stdin early
                        continue;
                    }
                    if (input_offset >= input.size()) {
                        stdin_fd.reset();
                    }
                } else {
                    bool is_stdout = stdout_fd.valid() && entry.fd == stdout_fd.get();
                    FdGuard& stream = is_stdout ? stdout_fd : stderr_fd;
                    ssize_t n = read(stream.get(), buffer, sizeof(buffer));
                    if (n > 0) {
                        capture(is_stdout ? EventType::STDOUT : EventType::STDERR, buffer, n);
                    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                        stream.reset();
                    }
                }
            }
        }
    }

    // Wait for the child without reaping it first, so its pid (and process
    // group id) cannot be reused while we kill leftovers
    ExitInfo wait_for_exit(pid_t pid) {
        ExitInfo exit;

        while (true) {
            siginfo_t info;
            std::memset(&info, 0, sizeof(info));
            int rc = waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT);
            if (rc == 0 && info.si_pid == pid) {
                break;
            }
            if (rc < 0 && errno != EINTR) {
                throw SandboxError(std::string("waitid: ") + std::strerror(errno));
            }

            auto now = std::chrono::steady_clock::now();
            if (cancelled_ || limiter_->deadline_passed(now)) {
                if (!cancelled_) limiter_->mark_timed_out();
                limiter_->terminate();
                break;  // The blocking wait below collects it
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        // Leftover children in the group go down with the leader
        limiter_->terminate();

        int status = 0;
        pid_t reaped;
        do {
            reaped = wait4(pid, &status, 0, &exit.usage);
        } while (reaped < 0 && errno == EINTR);
        if (reaped == pid) {
            exit.reaped = true;
            exit.wait_status = status;
        }
        limiter_->forget_process();
        return exit;
    }

    void reap(pid_t pid) {
        kill(pid, SIGKILL);
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        limiter_->forget_process();
    }

    void drain() {
        WorkerState expected = WorkerState::EXECUTING;
        state_.compare_exchange_strong(expected, WorkerState::DRAINING);
        teardown();
    }

    void teardown() {
        if (limiter_) {
            limiter_->terminate();
            limiter_->release();
        }

        if (!work_dir_.empty()) {
            std::error_code ec;
            fs::remove_all(work_dir_, ec);
            if (ec) {
                log::error("Worker", worker_id_ + " could not remove " + work_dir_ + ": " + ec.message());
            }
            work_dir_.clear();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancel_read_.reset();
            cancel_write_.reset();
        }
        state_ = WorkerState::DESTROYED;
    }

    void destroy() {
        if (state_ == WorkerState::DESTROYED) return;
        state_ = WorkerState::DRAINING;
        teardown();
    }

    void cancel() {
        cancelled_ = true;
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancel_write_.valid()) {
            char byte = 1;
            ssize_t ignored = write(cancel_write_.get(), &byte, 1);
            (void)ignored;  // A full pipe already carries a cancel
        }
    }
};

IsolationWorker::IsolationWorker(std::string worker_id,
                                 const RuntimeProfile& profile,
                                 const IsolationConfig& config,
                                 std::shared_ptr<const SeccompFilter> filter)
    : impl_(std::make_unique<Impl>(std::move(worker_id), profile, config, std::move(filter))) {
    ignore_sigpipe_once();
}

IsolationWorker::~IsolationWorker() = default;

bool IsolationWorker::probe_namespaces(const IsolationConfig& config) {
    RuntimeProfile probe = BuiltInRuntimes::shell();
    probe.denied_syscalls.clear();
    probe.warm_pool = 0;

    IsolationConfig probe_config = config;
    probe_config.use_namespaces = true;
    probe_config.cgroup_root.clear();

    IsolationWorker worker("probe-" + std::to_string(getpid()), probe, probe_config);
    if (!worker.warm_up()) {
        return false;
    }

    ExecutionRequest request;
    request.id = "namespace-probe";
    request.language = Language::SHELL;
    request.source_code = "exit 0\n";
    request.submitted_at = std::chrono::steady_clock::now();

    // Failures are logged by the worker itself
    ExecutionResult result = worker.execute(request, nullptr);
    return result.outcome == Outcome::COMPLETED;
}

const std::string& IsolationWorker::id() const {
    return impl_->worker_id_;
}

Language IsolationWorker::language() const {
    return impl_->profile_.language_id;
}

WorkerState IsolationWorker::state() const {
    return impl_->state_;
}

std::optional<std::string> IsolationWorker::assigned_request_id() const {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    return impl_->assigned_request_id_;
}

bool IsolationWorker::warm_up() {
    return impl_->warm_up();
}

ExecutionResult IsolationWorker::execute(const ExecutionRequest& request, const OutputSink& sink) {
    return impl_->execute(request, sink);
}

void IsolationWorker::cancel() {
    impl_->cancel();
}

bool IsolationWorker::cancelled() const {
    return impl_->cancelled_;
}

void IsolationWorker::destroy() {
    impl_->destroy();
}

} // namespace sniprun
