#include "resource_limiter.h"
#include "log.h"

#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>

namespace sniprun {

ResourceLimiter::ResourceLimiter(const RuntimeProfile& profile, std::string cgroup_root)
    : profile_(profile), cgroup_root_(std::move(cgroup_root)) {}

ResourceLimiter::~ResourceLimiter() {
    release();
}

bool ResourceLimiter::probe_cgroups(const std::string& root) {
    if (root.empty()) {
        return false;
    }

    if (mkdir(root.c_str(), 0755) != 0 && errno != EEXIST) {
        log::warn("Limiter", "cgroup v2 not usable at " + root + ": " + std::strerror(errno) +
                  " (falling back to rlimits)");
        return false;
    }

    std::ifstream controllers(root + "/cgroup.controllers");
    std::string available((std::istreambuf_iterator<char>(controllers)),
                          std::istreambuf_iterator<char>());
    for (const char* controller : {"memory", "cpu", "pids"}) {
        if (available.find(controller) == std::string::npos) {
            log::warn("Limiter", std::string("cgroup controller '") + controller +
                      "' not delegated to " + root + " (falling back to rlimits)");
            return false;
        }
    }

    std::ofstream subtree(root + "/cgroup.subtree_control");
    subtree << "+memory +cpu +pids" << std::endl;
    if (!subtree.good()) {
        log::warn("Limiter", "cannot enable controllers under " + root + " (falling back to rlimits)");
        return false;
    }

    log::info("Limiter", "Using cgroup v2 at " + root);
    return true;
}

bool ResourceLimiter::write_control(const std::string& file, const std::string& value) const {
    std::ofstream out(cgroup_path_ + "/" + file);
    if (!out) return false;
    out << value << std::endl;
    return out.good();
}

std::string ResourceLimiter::read_control(const std::string& file) const {
    std::ifstream in(cgroup_path_ + "/" + file);
    if (!in) return "";
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

bool ResourceLimiter::prepare(const std::string& name) {
    if (cgroup_root_.empty()) {
        return false;
    }

    cgroup_path_ = cgroup_root_ + "/" + name;
    if (mkdir(cgroup_path_.c_str(), 0755) != 0) {
        log::warn("Limiter", "mkdir " + cgroup_path_ + ": " + std::strerror(errno));
        cgroup_path_.clear();
        return false;
    }

    const long period_us = 100000;
    long quota_us = static_cast<long>(std::llround(profile_.cpu_limit * period_us));
    if (quota_us < 1000) quota_us = 1000;

    bool ok = write_control("memory.max", std::to_string(profile_.memory_limit_bytes)) &&
              write_control("cpu.max", std::to_string(quota_us) + " " + std::to_string(period_us));
    if (ok && profile_.max_processes > 0) {
        ok = write_control("pids.max", std::to_string(profile_.max_processes));
    }
    // Absent when swap accounting is off; not an error
    write_control("memory.swap.max", "0");

    if (!ok) {
        log::warn("Limiter", "failed to configure " + cgroup_path_);
        release();
        return false;
    }

    cgroup_active_ = true;
    return true;
}

bool ResourceLimiter::attach(pid_t pid) {
    if (!cgroup_active_) {
        return true;
    }
    return write_control("cgroup.procs", std::to_string(pid));
}

rlim_t ResourceLimiter::cpu_limit_seconds() const {
    // CPU seconds only back up the wall clock watchdog
    double wall_seconds = profile_.wall_clock_limit.count() / 1000.0;
    double cores = profile_.cpu_limit < 1.0 ? 1.0 : profile_.cpu_limit;
    return static_cast<rlim_t>(std::ceil(wall_seconds * cores)) + 1;
}

RlimitPlan ResourceLimiter::rlimit_plan(bool in_user_namespace) const {
    RlimitPlan plan;

    rlim_t cpu_seconds = cpu_limit_seconds();
    plan.add(RLIMIT_CPU, cpu_seconds, cpu_seconds + 1);

    if (!cgroup_active_ && profile_.limit_address_space && profile_.memory_limit_bytes > 0) {
        plan.add(RLIMIT_AS, profile_.memory_limit_bytes);
    }
    if (profile_.max_file_size_bytes > 0) {
        plan.add(RLIMIT_FSIZE, profile_.max_file_size_bytes);
    }
    if (profile_.max_open_files > 0) {
        plan.add(RLIMIT_NOFILE, profile_.max_open_files);
    }
    if (!cgroup_active_ && in_user_namespace && profile_.max_processes > 0) {
        plan.add(RLIMIT_NPROC, profile_.max_processes);
    }
    plan.add(RLIMIT_CORE, 0);

    return plan;
}

int ResourceLimiter::apply_rlimits(const RlimitPlan& plan) noexcept {
    for (int i = 0; i < plan.count; ++i) {
        struct rlimit limit;
        limit.rlim_cur = plan.entries[i].soft;
        limit.rlim_max = plan.entries[i].hard;
        if (setrlimit(plan.entries[i].resource, &limit) != 0) {
            return errno;
        }
    }
    return 0;
}

void ResourceLimiter::start(pid_t pid) {
    pid_ = pid;
    deadline_ = std::chrono::steady_clock::now() + profile_.wall_clock_limit;
}

std::chrono::milliseconds ResourceLimiter::remaining(std::chrono::steady_clock::time_point now) const {
    if (now >= deadline_) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now);
}

void ResourceLimiter::terminate() {
    if (cgroup_active_) {
        // cgroup.kill needs Linux 5.14; the process group covers older kernels
        write_control("cgroup.kill", "1");
    }
    if (pid_ > 0) {
        killpg(pid_, SIGKILL);
        kill(pid_, SIGKILL);
    }
}

bool ResourceLimiter::oom_killed() const {
    if (!cgroup_active_) {
        return false;
    }

    std::istringstream events(read_control("memory.events"));
    std::string key;
    long long value = 0;
    while (events >> key >> value) {
        if (key == "oom_kill" && value > 0) {
            return true;
        }
    }
    return false;
}

namespace {

double cpu_time(const rusage& usage) {
    return usage.ru_utime.tv_sec + usage.ru_utime.tv_usec / 1e6 +
           usage.ru_stime.tv_sec + usage.ru_stime.tv_usec / 1e6;
}

} // namespace

ResourceUsage ResourceLimiter::usage(const ExitInfo& exit) const {
    ResourceUsage usage;

    if (exit.reaped) {
        usage.cpu_seconds = cpu_time(exit.usage);
        usage.memory_peak_bytes = static_cast<size_t>(exit.usage.ru_maxrss) * 1024;
    }

    if (cgroup_active_) {
        std::istringstream stat(read_control("cpu.stat"));
        std::string key;
        long long value = 0;
        while (stat >> key >> value) {
            if (key == "usage_usec") {
                usage.cpu_seconds = value / 1e6;
                break;
            }
        }

        // memory.peak needs Linux 5.19
        std::string peak = read_control("memory.peak");
        if (!peak.empty()) {
            usage.memory_peak_bytes = std::stoull(peak);
        }
    }

    return usage;
}

Outcome ResourceLimiter::classify(const ExitInfo& exit, bool cancelled,
                                  const std::string& stderr_text, std::string& message) const {
    if (cancelled) {
        message = "execution cancelled";
        return Outcome::CANCELLED;
    }
    if (timed_out_) {
        message = "time limit exceeded (" + std::to_string(profile_.wall_clock_limit.count()) + " ms)";
        return Outcome::TIMED_OUT;
    }
    if (oom_killed()) {
        message = "memory limit exceeded";
        return Outcome::RESOURCE_EXCEEDED;
    }
    if (!exit.reaped) {
        message = "internal error";
        return Outcome::INTERNAL_ERROR;
    }

    int status = exit.wait_status;
    if (WIFEXITED(status)) {
        if (WEXITSTATUS(status) == 0) {
            return Outcome::COMPLETED;
        }
        // Without a cgroup the address space limit surfaces as an allocation failure
        if (!cgroup_active_ &&
            (stderr_text.find("MemoryError") != std::string::npos ||
             stderr_text.find("Cannot allocate memory") != std::string::npos ||
             stderr_text.find("heap out of memory") != std::string::npos)) {
            message = "memory limit exceeded";
            return Outcome::RESOURCE_EXCEEDED;
        }
        return Outcome::RUNTIME_ERROR;
    }

    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        if (sig == SIGXCPU) {
            message = "cpu time limit exceeded";
            return Outcome::RESOURCE_EXCEEDED;
        }
        if (sig == SIGXFSZ) {
            message = "file size limit exceeded";
            return Outcome::RESOURCE_EXCEEDED;
        }
        // SIGXCPU was ignored and the hard CPU limit followed. With a cgroup,
        // cpu.max keeps CPU time under the wall clock and oom_kill covers memory.
        if (sig == SIGKILL && !cgroup_active_ &&
            cpu_time(exit.usage) >= static_cast<double>(cpu_limit_seconds())) {
            message = "cpu time limit exceeded";
            return Outcome::RESOURCE_EXCEEDED;
        }
        message = std::string("terminated by signal ") + strsignal(sig);
        return Outcome::RUNTIME_ERROR;
    }

    message = "internal error";
    return Outcome::INTERNAL_ERROR;
}

int ResourceLimiter::exit_code(const ExitInfo& exit) {
    if (!exit.reaped) {
        return -1;
    }
    if (WIFEXITED(exit.wait_status)) {
        return WEXITSTATUS(exit.wait_status);
    }
    if (WIFSIGNALED(exit.wait_status)) {
        return -WTERMSIG(exit.wait_status);
    }
    return -1;
}

void ResourceLimiter::release() {
    if (cgroup_path_.empty()) {
        return;
    }

    // The directory can only go once the last process has left
    for (int attempt = 0; attempt < 50; ++attempt) {
        if (rmdir(cgroup_path_.c_str()) == 0 || errno == ENOENT) {
            cgroup_path_.clear();
            cgroup_active_ = false;
            return;
        }
        if (errno != EBUSY) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    log::warn("Limiter", "could not remove " + cgroup_path_ + ": " + std::strerror(errno));
    cgroup_path_.clear();
    cgroup_active_ = false;
}

} // namespace sniprun
