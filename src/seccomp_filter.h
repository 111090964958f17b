#pragma once

#include <linux/filter.h>

#include <string>
#include <vector>

namespace sniprun {

// Seccomp program compiled in the parent with libseccomp and handed to the
// child as raw BPF, so the child only needs prctl() between clone and exec.
class SeccompFilter {
public:
    SeccompFilter() = default;

    // Allow everything except `denied` (fails with EPERM). With
    // deny_inet, socket(AF_INET/AF_INET6) is refused as well.
    // Throws ConfigError for unknown syscall names, SandboxError otherwise.
    static SeccompFilter compile(const std::vector<std::string>& denied, bool deny_inet);

    bool empty() const { return instructions_.empty(); }
    size_t size() const { return instructions_.size(); }

    // Installs the filter on the calling thread. Async-signal-safe: only
    // prctl(). Returns 0 or the errno of the failing call.
    int install() const noexcept;

private:
    std::vector<sock_filter> instructions_;
};

} // namespace sniprun
