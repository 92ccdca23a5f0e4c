#pragma once

#include <sys/types.h>

#include <atomic>
#include <memory>
#include <string>

#include "labshot/executor.h"

namespace labshot {

struct ProcessRuntimeOptions {
    std::string work_root;                          // Empty: system temp directory
    std::string cgroup_root = "/sys/fs/cgroup/labshot";  // Empty disables cgroup limits
    bool require_seccomp = true;                    // Refuse to run if the filter fails
    bool require_isolation = true;                  // Refuse to start without PID and mount namespaces
    uid_t sandbox_uid_base = DEFAULT_SANDBOX_UID_BASE;
    unsigned sandbox_uid_count = SANDBOX_UID_COUNT;
};

struct NamespaceSupport {
    bool namespaces = false;  // PID, mount, network, IPC and UTS
    bool proc = false;        // A private /proc can be mounted inside
};

class SandboxIdPool;

// Runs each snippet as PID 1's child in fresh PID, mount, network, IPC and
// UTS namespaces (inside a user namespace when not root). The program sees
// read-only system directories, its own work dir at /work and a private
// /tmp; killing PID 1 takes every descendant with it. On top of that:
// rlimits, a seccomp filter denying sockets, cgroup v2 limits when
// delegated, and a per-task uid when the service runs as root.
class ProcessRuntime : public ExecutionRuntime {
public:
    explicit ProcessRuntime(ProcessRuntimeOptions options = ProcessRuntimeOptions{});

    std::string name() const override { return "process"; }
    std::unique_ptr<Environment> provision(const ExecutionLimits& limits) override;

    bool namespaces_available() const { return namespaces_available_; }
    bool network_namespace_available() const { return netns_available_; }
    bool cgroups_available() const { return cgroups_available_; }

    // Clones a child into the sandbox namespaces and mounts a tmpfs and a
    // /proc under scratch_dir inside them
    static NamespaceSupport detect_namespaces(const std::string& scratch_dir, bool user_namespace);

    // Forks a child that tries unshare(CLONE_NEWNET)
    static bool detect_network_namespace();

private:
    ProcessRuntimeOptions options_;
    bool user_namespace_ = false;
    bool namespaces_available_ = false;
    bool proc_available_ = false;
    bool netns_available_ = false;
    bool cgroups_available_ = false;
    std::shared_ptr<SandboxIdPool> ids_;  // Set when running as root
    std::atomic<unsigned long> counter_{0};
};

// Absolute path of an executable found on PATH, empty if none
std::string find_executable(const std::string& name);

} // namespace labshot
