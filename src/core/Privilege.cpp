#include "Privilege.h"
#include "Logging.h"
#include <string>
#include <vector>
#include <unistd.h>
#ifdef CONN_TRACKER_HAVE_LIBCAP
#include <sys/capability.h>
#endif
#ifdef CONN_TRACKER_HAVE_SECCOMP
#include <seccomp.h>
#endif

namespace conn_tracker {

bool is_privilege_available(){
#ifdef CONN_TRACKER_HAVE_LIBCAP
    return true;
#else
    return false;
#endif
}

bool is_seccomp_available(){
#ifdef CONN_TRACKER_HAVE_SECCOMP
    return true;
#else
    return false;
#endif
}

#ifdef CONN_TRACKER_HAVE_LIBCAP
static void log_capabilities(const std::string& context) {
    cap_t caps = cap_get_proc();
    if (!caps) {
        Logger::instance().warn("Failed to get current capabilities for " + context);
        return;
    }
    char* cap_text = cap_to_text(caps, nullptr);
    if (cap_text) {
        Logger::instance().debug("Capabilities " + context + ": " + std::string(cap_text));
        cap_free(cap_text);
    }
    cap_free(caps);
}
#endif

void drop_capabilities(bool keep_cap_dac){
#ifdef CONN_TRACKER_HAVE_LIBCAP
    Logger::instance().info("Dropping capabilities (keep_cap_dac=" + std::string(keep_cap_dac ? "true" : "false") + ")");
    log_capabilities("before drop");

    cap_t caps = cap_get_proc();
    if(!caps){ Logger::instance().error("cap_get_proc failed"); return; }
    cap_clear(caps);
    if(keep_cap_dac){
        cap_value_t v = CAP_DAC_READ_SEARCH;
        cap_set_flag(caps, CAP_PERMITTED, 1, &v, CAP_SET);
        cap_set_flag(caps, CAP_EFFECTIVE, 1, &v, CAP_SET);
    }
    if(cap_set_proc(caps) != 0){
        Logger::instance().error("cap_set_proc failed");
    } else {
        log_capabilities("after drop");
    }
    cap_free(caps);
#else
    (void)keep_cap_dac;
    Logger::instance().info("Capability dropping not available (libcap not compiled in)");
#endif
}

bool apply_seccomp_profile(bool allow_network){
#ifdef CONN_TRACKER_HAVE_SECCOMP
    static bool seccomp_applied = false;
    if (seccomp_applied) return true;

    Logger::instance().info(std::string("Applying seccomp profile") + (allow_network ? " (network allowed)" : ""));
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_KILL_PROCESS);
    if(!ctx) {
        Logger::instance().error("Failed to initialize seccomp context");
        return false;
    }
    // filter every thread of the process, not only the caller
    if(seccomp_attr_set(ctx, SCMP_FLTATR_CTL_TSYNC, 1) != 0){
        Logger::instance().warn("seccomp thread sync unavailable; filter applies to the calling thread and its children");
    }
    std::vector<int> calls = {
        // table reads and atomic output replacement
        SCMP_SYS(read), SCMP_SYS(write), SCMP_SYS(writev), SCMP_SYS(openat), SCMP_SYS(close), SCMP_SYS(fstat),
        SCMP_SYS(newfstatat), SCMP_SYS(statx), SCMP_SYS(lseek), SCMP_SYS(rename), SCMP_SYS(renameat), SCMP_SYS(renameat2),
        SCMP_SYS(unlinkat), SCMP_SYS(fsync), SCMP_SYS(fdatasync),
        // memory, threads (std::async), signals, timing
        SCMP_SYS(mmap), SCMP_SYS(mprotect), SCMP_SYS(munmap), SCMP_SYS(madvise), SCMP_SYS(brk),
        SCMP_SYS(clone), SCMP_SYS(clone3), SCMP_SYS(set_robust_list), SCMP_SYS(rseq), SCMP_SYS(futex),
        SCMP_SYS(sched_yield), SCMP_SYS(rt_sigaction), SCMP_SYS(rt_sigprocmask), SCMP_SYS(rt_sigreturn),
        SCMP_SYS(clock_gettime), SCMP_SYS(clock_nanosleep), SCMP_SYS(nanosleep), SCMP_SYS(getrandom),
        SCMP_SYS(getpid), SCMP_SYS(gettid), SCMP_SYS(exit), SCMP_SYS(exit_group)
    };
    if(allow_network){
        std::vector<int> net = {
            SCMP_SYS(socket), SCMP_SYS(connect), SCMP_SYS(getsockopt), SCMP_SYS(setsockopt),
            SCMP_SYS(getsockname), SCMP_SYS(getpeername), SCMP_SYS(sendto), SCMP_SYS(recvfrom),
            SCMP_SYS(sendmsg), SCMP_SYS(recvmsg), SCMP_SYS(poll), SCMP_SYS(ppoll), SCMP_SYS(pipe2),
            SCMP_SYS(eventfd2), SCMP_SYS(fcntl), SCMP_SYS(ioctl), SCMP_SYS(shutdown), SCMP_SYS(uname),
            SCMP_SYS(prctl), SCMP_SYS(bind), SCMP_SYS(pread64), SCMP_SYS(mremap), SCMP_SYS(sysinfo),
            SCMP_SYS(prlimit64), SCMP_SYS(sched_getaffinity), SCMP_SYS(getuid)
        };
        calls.insert(calls.end(), net.begin(), net.end());
    }
    for(int c : calls){
        if(seccomp_rule_add(ctx, SCMP_ACT_ALLOW, c, 0) != 0){
            Logger::instance().error("Failed to allow syscall " + std::to_string(c) + " in seccomp");
            seccomp_release(ctx);
            return false;
        }
    }
    if(seccomp_load(ctx) != 0){
        Logger::instance().error("Failed to load seccomp profile");
        seccomp_release(ctx);
        return false;
    }
    seccomp_release(ctx);
    seccomp_applied = true;
    return true;
#else
    (void)allow_network;
    Logger::instance().info("Seccomp not available (not compiled in)");
    return true;
#endif
}

}
