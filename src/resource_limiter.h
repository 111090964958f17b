#pragma once

#include "runtime_registry.h"
#include "types.h"

#include <sys/resource.h>
#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <string>

namespace sniprun {

// rlimits computed in the parent and applied by the child right before exec
struct RlimitPlan {
    struct Entry {
        int resource;
        rlim_t soft;
        rlim_t hard;
    };
    Entry entries[8];
    int count = 0;

    void add(int resource, rlim_t value) { add(resource, value, value); }
    void add(int resource, rlim_t soft, rlim_t hard) {
        if (count < 8) entries[count++] = {resource, soft, hard};
    }
};

struct ResourceUsage {
    double cpu_seconds = 0;
    size_t memory_peak_bytes = 0;
};

// How the child ended, as seen by wait4()
struct ExitInfo {
    int wait_status = 0;
    bool reaped = false;
    rusage usage{};
};

// Applies a RuntimeProfile's limits to one execution and watches it.
// cgroup v2 is used when the host delegates it to us; rlimits always apply.
class ResourceLimiter {
public:
    ResourceLimiter(const RuntimeProfile& profile, std::string cgroup_root);
    ~ResourceLimiter();

    ResourceLimiter(const ResourceLimiter&) = delete;
    ResourceLimiter& operator=(const ResourceLimiter&) = delete;

    // Check once whether cgroup v2 can be used below `root` and enable the
    // memory, cpu and pids controllers for our children.
    static bool probe_cgroups(const std::string& root);

    // Create the per-execution cgroup. False means rlimits only.
    bool prepare(const std::string& name);
    bool cgroup_active() const { return cgroup_active_; }

    // Parent side: move the child into the cgroup before it execs
    bool attach(pid_t pid);

    // Limits the child applies to itself. `in_user_namespace` enables
    // RLIMIT_NPROC, which would otherwise count every process of our uid.
    RlimitPlan rlimit_plan(bool in_user_namespace) const;

    // RLIMIT_CPU soft limit: SIGXCPU here, SIGKILL one second later
    rlim_t cpu_limit_seconds() const;

    // Child side, async-signal-safe. Returns 0 or errno.
    static int apply_rlimits(const RlimitPlan& plan) noexcept;

    // Watchdog
    void start(pid_t pid);
    std::chrono::steady_clock::time_point deadline() const { return deadline_; }
    bool deadline_passed(std::chrono::steady_clock::time_point now) const { return now >= deadline_; }
    std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point now) const;

    // Kill every process of the execution (cgroup.kill and the process group)
    void terminate();
    // The child has been reaped; its pid may be reused from here on
    void forget_process() { pid_ = -1; }
    void mark_timed_out() { timed_out_ = true; }
    bool timed_out() const { return timed_out_; }

    // True when the kernel OOM killer fired inside our cgroup
    bool oom_killed() const;

    ResourceUsage usage(const ExitInfo& exit) const;

    // Map the exit to an outcome; `message` gets a learner-facing note
    Outcome classify(const ExitInfo& exit, bool cancelled, const std::string& stderr_text,
                     std::string& message) const;

    static int exit_code(const ExitInfo& exit);

    // Remove the cgroup. Called from the destructor too.
    void release();

private:
    bool write_control(const std::string& file, const std::string& value) const;
    std::string read_control(const std::string& file) const;

    const RuntimeProfile& profile_;
    std::string cgroup_root_;
    std::string cgroup_path_;
    bool cgroup_active_ = false;
    pid_t pid_ = -1;
    std::chrono::steady_clock::time_point deadline_;
    std::atomic<bool> timed_out_{false};
};

} // namespace sniprun
