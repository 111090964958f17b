#include "seccomp_filter.h"
#include "errors.h"

#include <seccomp.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <linux/seccomp.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace sniprun {

namespace {

// Owns the libseccomp context
class FilterContext {
public:
    FilterContext() : ctx_(seccomp_init(SCMP_ACT_ALLOW)) {
        if (!ctx_) {
            throw SandboxError("seccomp_init failed");
        }
    }
    ~FilterContext() { seccomp_release(ctx_); }

    FilterContext(const FilterContext&) = delete;
    FilterContext& operator=(const FilterContext&) = delete;

    scmp_filter_ctx get() const { return ctx_; }

private:
    scmp_filter_ctx ctx_;
};

void check(int rc, const std::string& what) {
    if (rc < 0) {
        throw SandboxError(what + ": " + std::strerror(-rc));
    }
}

} // namespace

SeccompFilter SeccompFilter::compile(const std::vector<std::string>& denied, bool deny_inet) {
    FilterContext ctx;

    // no_new_privs is set by install() itself
    check(seccomp_attr_set(ctx.get(), SCMP_FLTATR_CTL_NNP, 0), "seccomp_attr_set");

    for (const auto& name : denied) {
        int nr = seccomp_syscall_resolve_name(name.c_str());
        if (nr == __NR_SCMP_ERROR) {
            throw ConfigError("unknown syscall in deny list: " + name);
        }
        check(seccomp_rule_add(ctx.get(), SCMP_ACT_ERRNO(EPERM), nr, 0),
              "seccomp_rule_add(" + name + ")");
    }

    if (deny_inet) {
        check(seccomp_rule_add(ctx.get(), SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                               SCMP_A0(SCMP_CMP_EQ, AF_INET)),
              "seccomp_rule_add(socket AF_INET)");
        check(seccomp_rule_add(ctx.get(), SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                               SCMP_A0(SCMP_CMP_EQ, AF_INET6)),
              "seccomp_rule_add(socket AF_INET6)");
    }

    // Export the BPF through an anonymous file and keep the raw program
    int fd = memfd_create("sniprun-seccomp", MFD_CLOEXEC);
    if (fd < 0) {
        throw SandboxError(std::string("memfd_create: ") + std::strerror(errno));
    }

    int rc = seccomp_export_bpf(ctx.get(), fd);
    if (rc < 0) {
        close(fd);
        check(rc, "seccomp_export_bpf");
    }

    off_t length = lseek(fd, 0, SEEK_END);
    if (length <= 0 || length % sizeof(sock_filter) != 0 || lseek(fd, 0, SEEK_SET) != 0) {
        close(fd);
        throw SandboxError("exported seccomp program has unexpected size");
    }

    SeccompFilter filter;
    filter.instructions_.resize(length / sizeof(sock_filter));
    char* out = reinterpret_cast<char*>(filter.instructions_.data());
    size_t total = 0;
    while (total < static_cast<size_t>(length)) {
        ssize_t n = read(fd, out + total, length - total);
        if (n <= 0) {
            close(fd);
            throw SandboxError("failed to read exported seccomp program");
        }
        total += n;
    }
    close(fd);

    return filter;
}

int SeccompFilter::install() const noexcept {
    if (instructions_.empty()) {
        return 0;
    }

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        return errno;
    }

    sock_fprog program;
    program.len = static_cast<unsigned short>(instructions_.size());
    program.filter = const_cast<sock_filter*>(instructions_.data());
    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &program) != 0) {
        return errno;
    }
    return 0;
}

} // namespace sniprun
