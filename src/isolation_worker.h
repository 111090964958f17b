#pragma once

#include "constants.h"
#include "runtime_registry.h"
#include "seccomp_filter.h"
#include "types.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace sniprun {

enum class WorkerState {
    COLD,
    WARMING,
    READY,
    EXECUTING,
    DRAINING,
    DESTROYED
};

std::string worker_state_to_string(WorkerState state);

struct IsolationConfig {
    std::string work_root = DEFAULT_WORK_ROOT;   // Parent of per-worker directories
    std::string cgroup_root;                     // Empty: rlimits only
    bool use_namespaces = true;                  // user/pid/mount/net/uts/ipc
    size_t output_limit_bytes = DEFAULT_OUTPUT_LIMIT_BYTES;
    size_t tmpfs_size_bytes = TMPFS_SIZE_LIMIT;
};

// Receives output chunks in the order they were read
using OutputSink = std::function<void(EventType type, const std::string& chunk)>;

// A single-use sandbox. It is warmed once, runs exactly one request and is
// torn down afterwards whatever happened, so nothing a snippet leaves
// behind can reach another request.
class IsolationWorker {
public:
    IsolationWorker(std::string worker_id,
                    const RuntimeProfile& profile,
                    const IsolationConfig& config,
                    std::shared_ptr<const SeccompFilter> filter = nullptr);
    ~IsolationWorker();

    IsolationWorker(const IsolationWorker&) = delete;
    IsolationWorker& operator=(const IsolationWorker&) = delete;

    // Run a trivial snippet in full isolation to see whether this host
    // lets us create the namespaces
    static bool probe_namespaces(const IsolationConfig& config);

    const std::string& id() const;
    Language language() const;
    WorkerState state() const;
    std::optional<std::string> assigned_request_id() const;

    // Cold -> Warming -> Ready. On failure the worker ends up Destroyed.
    bool warm_up();

    // Ready -> Executing -> Draining -> Destroyed. Throws std::logic_error
    // unless the worker is Ready: a worker never runs a second request.
    ExecutionResult execute(const ExecutionRequest& request, const OutputSink& sink);

    // Ask a running execution to stop early. Safe from any thread.
    void cancel();
    bool cancelled() const;

    // Tear down from any state. Idempotent.
    void destroy();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sniprun
