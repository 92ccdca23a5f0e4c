#include "labshot/process_runtime.h"
#include "file_utils.h"

#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <grp.h>
#include <poll.h>
#include <sched.h>
#include <seccomp.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace labshot {

namespace fs = std::filesystem;

// Hands out one host uid per live sandbox so per-uid limits stay per task
class SandboxIdPool {
public:
    SandboxIdPool(uid_t base, unsigned count) : base_(base), count_(count) {}

    uid_t acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (unsigned i = 0; i < count_; i++) {
            uid_t candidate = base_ + (next_ + i) % count_;
            if (in_use_.insert(candidate).second) {
                next_ = (next_ + i + 1) % count_;
                return candidate;
            }
        }
        throw std::runtime_error("all " + std::to_string(count_) + " sandbox uids are in use");
    }

    void release(uid_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        in_use_.erase(id);
    }

private:
    std::mutex mutex_;
    uid_t base_;
    unsigned count_;
    unsigned next_ = 0;
    std::set<uid_t> in_use_;
};

namespace {

constexpr const char* kDefaultPath = "/usr/local/bin:/usr/bin:/bin";
constexpr int kNamespaceFlags =
    CLONE_NEWPID | CLONE_NEWNS | CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS;

// Host paths visible read-only inside the sandbox
constexpr const char* kSystemPaths[] = {
    "/usr", "/bin", "/sbin", "/lib", "/lib32", "/lib64", "/libx32", "/etc"
};
constexpr const char* kDevices[] = {"/dev/null", "/dev/zero", "/dev/random", "/dev/urandom"};

enum class MountKind {
    READ_ONLY_TREE,
    READ_WRITE_DIR,
    DEVICE,
    SYMLINK   // source is the link target
};

struct MountStep {
    MountKind kind;
    std::string source;
    std::string target;
};

struct IdMaps {
    bool user_namespace = false;
    std::string uid_map;
    std::string gid_map;
};

// Everything the child needs, prepared before clone: after it only
// async-signal-safe calls are made.
struct ChildPlan {
    std::string exe;
    std::vector<std::string> args;
    std::vector<std::string> env;
    std::vector<char*> argv;
    std::vector<char*> envp;
    std::string workdir;
    int stdout_fd = -1;
    int stderr_fd = -1;
    int status_fd = -1;
    int procs_fd = -1;
    bool require_seccomp = true;
    bool limit_address_space = true;
    bool limit_processes = true;
    rlim_t memory_bytes = 0;
    rlim_t cpu_seconds = 0;
    rlim_t file_bytes = 0;
    rlim_t processes = 0;
    rlim_t open_files = 0;

    bool drop_ids = false;
    uid_t uid = 0;
    gid_t gid = 0;

    // Namespace sandbox
    bool isolate = false;
    IdMaps maps;
    std::string root_dir;
    std::string dev_dir;
    std::string proc_dir;  // Empty: no /proc inside
    std::string tmp_dir;
    std::string tmpfs_options;
    std::vector<MountStep> mounts;
};

struct DetectPlan {
    IdMaps maps;
    std::string scratch;
    std::string proc_dir;
};

struct StreamCapture {
    int fd = -1;
    std::string data;
    size_t cap = 0;
    bool truncated = false;
    bool open = true;

    void append(const char* buf, size_t n) {
        size_t room = data.size() < cap ? cap - data.size() : 0;
        data.append(buf, std::min(room, n));
        if (n > room) {
            truncated = true;
        }
    }
};

// Settings shared by every environment of one runtime
struct SandboxSettings {
    bool isolate = false;
    bool user_namespace = false;
    bool mount_proc = false;
    bool enter_netns = false;
    bool require_seccomp = true;
    std::shared_ptr<SandboxIdPool> ids;
};

[[noreturn]] void child_fail(const char* what) {
    // write(2) only: safe after fork in a threaded parent
    const char* prefix = "labshot sandbox: ";
    const char* err = std::strerror(errno);
    ssize_t ignored = write(STDERR_FILENO, prefix, std::strlen(prefix));
    ignored = write(STDERR_FILENO, what, std::strlen(what));
    ignored = write(STDERR_FILENO, ": ", 2);
    ignored = write(STDERR_FILENO, err, std::strlen(err));
    ignored = write(STDERR_FILENO, "\n", 1);
    (void)ignored;
    _exit(126);
}

pid_t clone_child(int (*entry)(void*), void* arg, int flags) {
    // Without CLONE_VM the child runs on its own copy of this stack
    std::vector<char> stack(CLONE_STACK_BYTES);
    return clone(entry, stack.data() + stack.size(), flags | SIGCHLD, arg);
}

IdMaps make_id_maps(bool user_namespace) {
    IdMaps maps;
    maps.user_namespace = user_namespace;
    if (user_namespace) {
        // An unprivileged process may only map its own ids
        std::string uid = std::to_string(geteuid());
        std::string gid = std::to_string(getegid());
        maps.uid_map = uid + " " + uid + " 1";
        maps.gid_map = gid + " " + gid + " 1";
    }
    return maps;
}

bool write_proc_file(const char* path, const std::string& value) {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    bool ok = write(fd, value.c_str(), value.size()) == static_cast<ssize_t>(value.size());
    close(fd);
    return ok;
}

bool write_id_maps(const IdMaps& maps) {
    int fd = open("/proc/self/setgroups", O_WRONLY | O_CLOEXEC);
    if (fd >= 0) {
        bool ok = write(fd, "deny", 4) == 4;
        close(fd);
        if (!ok) {
            return false;
        }
    } else if (errno != ENOENT) {
        return false;
    }
    return write_proc_file("/proc/self/uid_map", maps.uid_map) &&
           write_proc_file("/proc/self/gid_map", maps.gid_map);
}

// A bind remount must keep the flags the kernel locked on the source mount
bool remount_read_only(const char* target) {
    struct statvfs info;
    if (statvfs(target, &info) != 0) {
        return false;
    }
    unsigned long flags = MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID;
    if (info.f_flag & ST_NODEV) flags |= MS_NODEV;
    if (info.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
    return mount(nullptr, target, nullptr, flags, nullptr) == 0;
}

bool set_limit(int resource, rlim_t value) {
    struct rlimit limit;
    limit.rlim_cur = limit.rlim_max = value;
    return setrlimit(resource, &limit) == 0;
}

// Default-allow filter: no new sockets, no kernel-level escapes
bool install_seccomp_filter() {
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) {
        return false;
    }

    int rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 0);
    const int denied[] = {
        SCMP_SYS(ptrace), SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(setns),
        SCMP_SYS(unshare), SCMP_SYS(pivot_root), SCMP_SYS(chroot), SCMP_SYS(bpf),
        SCMP_SYS(perf_event_open), SCMP_SYS(keyctl), SCMP_SYS(add_key),
        SCMP_SYS(request_key), SCMP_SYS(kexec_load), SCMP_SYS(reboot), SCMP_SYS(swapon),
        SCMP_SYS(swapoff), SCMP_SYS(init_module), SCMP_SYS(finit_module),
        SCMP_SYS(delete_module)
    };
    for (int syscall : denied) {
        if (rc == 0) {
            rc = seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), syscall, 0);
        }
    }

    if (rc == 0) {
        rc = seccomp_load(ctx);
    }
    seccomp_release(ctx);
    return rc == 0;
}

void close_inherited_fds(int keep) {
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) {
        max_fd = 65536;
    }
    for (int fd = 3; fd < max_fd; fd++) {
        if (fd != keep) {
            close(fd);
        }
    }
}

// Own process group, death with the supervising thread, cgroup, stdio
void prepare_child(const ChildPlan& plan, int keep_fd) {
    if (setpgid(0, 0) != 0) child_fail("setpgid");
    if (prctl(PR_SET_PDEATHSIG, SIGKILL) != 0) child_fail("PR_SET_PDEATHSIG");

    if (plan.procs_fd >= 0 && write(plan.procs_fd, "0", 1) != 1) {
        child_fail("cgroup.procs");
    }

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0) child_fail("stdin");
    if (dup2(plan.stdout_fd, STDOUT_FILENO) < 0) child_fail("dup2 stdout");
    if (dup2(plan.stderr_fd, STDERR_FILENO) < 0) child_fail("dup2 stderr");
    close_inherited_fds(keep_fd);
}

// Private root: a small tmpfs holding read-only binds of the system
// directories, a few device nodes, /proc, a private /tmp and the task's
// own directory at /work. The host tree is detached afterwards.
void build_root(const ChildPlan& plan) {
    const char* root = plan.root_dir.c_str();
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
        child_fail("make mounts private");
    }
    if (mount("tmpfs", root, "tmpfs", MS_NOSUID | MS_NODEV, "size=1m,mode=0755") != 0) {
        child_fail("mount root tmpfs");
    }
    if (mkdir(plan.dev_dir.c_str(), 0755) != 0) child_fail("mkdir /dev");

    for (const auto& step : plan.mounts) {
        const char* target = step.target.c_str();
        switch (step.kind) {
            case MountKind::SYMLINK:
                if (symlink(step.source.c_str(), target) != 0) child_fail("symlink");
                continue;
            case MountKind::DEVICE: {
                int fd = open(target, O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
                if (fd < 0) child_fail("device mount point");
                close(fd);
                break;
            }
            case MountKind::READ_ONLY_TREE:
            case MountKind::READ_WRITE_DIR:
                if (mkdir(target, 0755) != 0) child_fail("mkdir mount point");
                break;
        }
        if (mount(step.source.c_str(), target, nullptr, MS_BIND | MS_REC, nullptr) != 0) {
            child_fail("bind mount");
        }
        if (step.kind == MountKind::READ_ONLY_TREE && !remount_read_only(target)) {
            child_fail("read-only remount");
        }
    }

    if (!plan.proc_dir.empty()) {
        if (mkdir(plan.proc_dir.c_str(), 0555) != 0) child_fail("mkdir /proc");
        if (mount("proc", plan.proc_dir.c_str(), "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC,
                  nullptr) != 0) {
            child_fail("mount /proc");
        }
    }
    if (mkdir(plan.tmp_dir.c_str(), 01777) != 0) child_fail("mkdir /tmp");
    if (mount("tmpfs", plan.tmp_dir.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
              plan.tmpfs_options.c_str()) != 0) {
        child_fail("mount /tmp");
    }
    if (!remount_read_only(root)) child_fail("read-only root");

    if (chdir(root) != 0) child_fail("chdir new root");
    if (syscall(SYS_pivot_root, ".", ".") != 0) child_fail("pivot_root");
    if (umount2(".", MNT_DETACH) != 0) child_fail("detach host root");
    if (chdir("/work") != 0) child_fail("chdir /work");
}

[[noreturn]] void exec_program(const ChildPlan& plan) {
    if (plan.drop_ids) {
        if (setgroups(0, nullptr) != 0) child_fail("setgroups");
        if (setresgid(plan.gid, plan.gid, plan.gid) != 0) child_fail("setresgid");
        if (setresuid(plan.uid, plan.uid, plan.uid) != 0) child_fail("setresuid");
    }
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) child_fail("PR_SET_NO_NEW_PRIVS");

    if (plan.limit_address_space && !set_limit(RLIMIT_AS, plan.memory_bytes)) {
        child_fail("RLIMIT_AS");
    }
    struct rlimit cpu;
    cpu.rlim_cur = plan.cpu_seconds;
    cpu.rlim_max = plan.cpu_seconds + 1;  // SIGXCPU first, SIGKILL a second later
    if (setrlimit(RLIMIT_CPU, &cpu) != 0) child_fail("RLIMIT_CPU");
    if (!set_limit(RLIMIT_FSIZE, plan.file_bytes)) child_fail("RLIMIT_FSIZE");
    // Counted per uid: only meaningful with a task-private uid or user namespace
    if (plan.limit_processes && !set_limit(RLIMIT_NPROC, plan.processes)) {
        child_fail("RLIMIT_NPROC");
    }
    if (!set_limit(RLIMIT_NOFILE, plan.open_files)) child_fail("RLIMIT_NOFILE");
    if (!set_limit(RLIMIT_CORE, 0)) child_fail("RLIMIT_CORE");

    if (!install_seccomp_filter() && plan.require_seccomp) {
        child_fail("seccomp");
    }

    execve(plan.exe.c_str(), plan.argv.data(), plan.envp.data());
    child_fail("execve");
}

// Entry without namespaces: the clone child becomes the program
int run_direct(void* arg) {
    const ChildPlan& plan = *static_cast<const ChildPlan*>(arg);
    prepare_child(plan, -1);
    if (chdir(plan.workdir.c_str()) != 0) child_fail("chdir");
    exec_program(plan);
}

// PID 1 of the sandbox. Builds the filesystem view, runs the program as its
// child, reaps orphans and reports the program's wait status on status_fd.
// When it exits the kernel kills whatever is left in the namespace.
int sandbox_init(void* arg) {
    const ChildPlan& plan = *static_cast<const ChildPlan*>(arg);
    prepare_child(plan, plan.status_fd);
    if (plan.maps.user_namespace && !write_id_maps(plan.maps)) {
        child_fail("user namespace id maps");
    }
    build_root(plan);

    pid_t program = fork();
    if (program < 0) child_fail("fork");
    if (program == 0) {
        close(plan.status_fd);
        exec_program(plan);
    }

    while (true) {
        int status;
        pid_t r = waitpid(-1, &status, 0);
        if (r == program) {
            ssize_t written = write(plan.status_fd, &status, sizeof(status));
            _exit(written == static_cast<ssize_t>(sizeof(status)) ? 0 : 126);
        }
        if (r < 0 && errno != EINTR) {
            child_fail("waitpid");
        }
    }
}

int detect_entry(void* arg) {
    const DetectPlan& plan = *static_cast<const DetectPlan*>(arg);
    if (plan.maps.user_namespace && !write_id_maps(plan.maps)) _exit(1);
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) _exit(1);
    if (mount("tmpfs", plan.scratch.c_str(), "tmpfs", MS_NOSUID | MS_NODEV, "size=1m") != 0) {
        _exit(1);
    }
    if (mkdir(plan.proc_dir.c_str(), 0555) != 0) _exit(1);
    bool proc = mount("proc", plan.proc_dir.c_str(), "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC,
                      nullptr) == 0;
    _exit(proc ? 0 : 2);
}

// Read-only system trees, devices and /work, in mount order
std::vector<MountStep> plan_mounts(const std::string& root, const fs::path& work_dir,
                                   bool with_proc) {
    std::vector<MountStep> steps;
    for (const char* path : kSystemPaths) {
        struct stat info;
        if (lstat(path, &info) != 0) {
            continue;
        }
        std::string target = root + path;
        if (S_ISLNK(info.st_mode)) {
            char link[PATH_MAX];
            ssize_t n = readlink(path, link, sizeof(link) - 1);
            if (n > 0) {
                steps.push_back({MountKind::SYMLINK, std::string(link, static_cast<size_t>(n)),
                                 target});
            }
        } else if (S_ISDIR(info.st_mode)) {
            steps.push_back({MountKind::READ_ONLY_TREE, path, target});
        }
    }
    for (const char* device : kDevices) {
        if (access(device, F_OK) == 0) {
            steps.push_back({MountKind::DEVICE, device, root + device});
        }
    }
    if (with_proc) {
        steps.push_back({MountKind::SYMLINK, "/proc/self/fd", root + "/dev/fd"});
    }
    steps.push_back({MountKind::READ_WRITE_DIR, work_dir.string(), root + "/work"});
    return steps;
}

bool write_control(const fs::path& file, const std::string& value) {
    std::ofstream out(file);
    if (!out) {
        return false;
    }
    out << value;
    out.flush();
    return static_cast<bool>(out);
}

class ProcessEnvironment : public Environment {
public:
    ProcessEnvironment(std::string id, fs::path dir, fs::path cgroup_dir, SandboxSettings settings)
        : id_(std::move(id)), dir_(std::move(dir)), work_dir_(dir_ / "work"),
          root_dir_(dir_ / "root"), cgroup_dir_(std::move(cgroup_dir)),
          settings_(std::move(settings)) {}

    ~ProcessEnvironment() override {
        if (!torn_down_) {
            try {
                teardown();
            } catch (const std::exception& e) {
                std::cerr << "[ProcessRuntime] " << id_ << " cleanup failed: "
                          << e.what() << std::endl;
            }
        }
    }

    // Creates the work dir, and hands it to a task uid when running as root
    void prepare() {
        fs::create_directory(work_dir_);
        if (settings_.isolate) {
            fs::create_directory(root_dir_);
        }
        if (settings_.ids) {
            uid_ = settings_.ids->acquire();
            holds_uid_ = true;
            if (chown(work_dir_.c_str(), uid_, static_cast<gid_t>(uid_)) != 0) {
                throw std::runtime_error("chown " + work_dir_.string() + ": " +
                                         std::strerror(errno));
            }
        }
    }

    const std::string& id() const override { return id_; }

    ExecutionResult run(const std::string& source, Language language,
                        const ExecutionLimits& limits) override {
        if (used_) {
            throw std::logic_error("Environment " + id_ + " already served a task");
        }
        used_ = true;

        ExecutionResult result;
        source_file_ = source_filename(language, source);
        FileUtils::write_file((work_dir_ / source_file_).string(), source);

        ChildPlan plan;
        if (!plan_command(language, source, limits, plan)) {
            result.status = ExecutionStatus::CRASHED;
            result.exit_code = 127;
            result.error_message = "Interpreter not found: " + plan.exe;
            return result;
        }
        plan.workdir = work_dir_.string();
        plan.require_seccomp = settings_.require_seccomp;
        plan.memory_bytes = limits.memory_bytes;
        plan.cpu_seconds = static_cast<rlim_t>(
            std::chrono::duration_cast<std::chrono::seconds>(limits.timeout).count() + 1);
        plan.file_bytes = limits.max_file_bytes;
        plan.processes = static_cast<rlim_t>(limits.max_processes);
        plan.open_files = static_cast<rlim_t>(limits.max_open_files);
        plan.drop_ids = holds_uid_;
        plan.uid = uid_;
        plan.gid = static_cast<gid_t>(uid_);
        plan.limit_processes = holds_uid_ || (settings_.isolate && settings_.user_namespace);

        std::string home = settings_.isolate ? "/work" : work_dir_.string();
        std::string tmp = settings_.isolate ? "/tmp" : work_dir_.string();
        plan.env = {
            "PATH=" + std::string(kDefaultPath),
            "HOME=" + home,
            "TMPDIR=" + tmp,
            "LANG=C.UTF-8",
            "PYTHONDONTWRITEBYTECODE=1",
        };

        if (settings_.isolate) {
            std::string root = root_dir_.string();
            plan.isolate = true;
            plan.maps = make_id_maps(settings_.user_namespace);
            plan.root_dir = root;
            plan.dev_dir = root + "/dev";
            plan.proc_dir = settings_.mount_proc ? root + "/proc" : "";
            plan.tmp_dir = root + "/tmp";
            plan.tmpfs_options = "size=" + std::to_string(SANDBOX_TMPFS_BYTES) + ",mode=1777";
            plan.mounts = plan_mounts(root, work_dir_, settings_.mount_proc);
        }

        plan.argv.push_back(const_cast<char*>(plan.exe.c_str()));
        for (const auto& arg : plan.args) {
            plan.argv.push_back(const_cast<char*>(arg.c_str()));
        }
        plan.argv.push_back(nullptr);
        for (const auto& var : plan.env) {
            plan.envp.push_back(const_cast<char*>(var.c_str()));
        }
        plan.envp.push_back(nullptr);

        int stdout_pipe[2], stderr_pipe[2], status_pipe[2] = {-1, -1};
        if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
            throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
        }
        if (pipe2(stderr_pipe, O_CLOEXEC) == -1) {
            int saved = errno;
            close(stdout_pipe[0]);
            close(stdout_pipe[1]);
            throw std::runtime_error(std::string("pipe failed: ") + std::strerror(saved));
        }
        if (plan.isolate && pipe2(status_pipe, O_CLOEXEC) == -1) {
            int saved = errno;
            for (int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1]}) {
                close(fd);
            }
            throw std::runtime_error(std::string("pipe failed: ") + std::strerror(saved));
        }
        plan.stdout_fd = stdout_pipe[1];
        plan.stderr_fd = stderr_pipe[1];
        plan.status_fd = status_pipe[1];

        if (!cgroup_dir_.empty()) {
            plan.procs_fd = open((cgroup_dir_ / "cgroup.procs").c_str(), O_WRONLY | O_CLOEXEC);
            if (plan.procs_fd < 0) {
                std::cerr << "[ProcessRuntime] " << id_ << " cannot join cgroup: "
                          << std::strerror(errno) << std::endl;
            }
        }

        int flags = 0;
        if (plan.isolate) {
            flags = kNamespaceFlags | (plan.maps.user_namespace ? CLONE_NEWUSER : 0);
        } else if (settings_.enter_netns) {
            flags = CLONE_NEWNET;
        }

        auto start = std::chrono::steady_clock::now();
        pid_t pid = clone_child(plan.isolate ? sandbox_init : run_direct, &plan, flags);

        int clone_errno = errno;
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);
        if (status_pipe[1] >= 0) {
            close(status_pipe[1]);
        }
        if (plan.procs_fd >= 0) {
            close(plan.procs_fd);
        }
        if (pid < 0) {
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            if (status_pipe[0] >= 0) {
                close(status_pipe[0]);
            }
            throw std::runtime_error(std::string("clone failed: ") + std::strerror(clone_errno));
        }

        pid_ = pid;
        // Also set from the parent so killpg works even before the child runs
        if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
            std::cerr << "[ProcessRuntime] " << id_ << " setpgid: "
                      << std::strerror(errno) << std::endl;
        }

        StreamCapture out, err;
        out.fd = stdout_pipe[0];
        err.fd = stderr_pipe[0];
        out.cap = err.cap = limits.max_capture_bytes;
        for (int fd : {out.fd, err.fd}) {
            int fl = fcntl(fd, F_GETFL);
            if (fl == -1 || fcntl(fd, F_SETFL, fl | O_NONBLOCK) == -1) {
                std::cerr << "[ProcessRuntime] " << id_ << " cannot make pipe non-blocking: "
                          << std::strerror(errno) << std::endl;
            }
        }

        int status = 0;
        bool timed_out = supervise(out, err, status, start + limits.timeout);

        close(out.fd);
        close(err.fd);
        if (status_pipe[0] >= 0) {
            // PID 1 reports the program's own status; a killed or failed
            // PID 1 leaves the pipe empty and its own status stands
            if (reaped_ && !timed_out) {
                read_program_status(status_pipe[0], status);
            }
            close(status_pipe[0]);
        }

        result.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        result.stdout_output = std::move(out.data);
        result.stderr_output = std::move(err.data);
        result.stdout_truncated = out.truncated;
        result.stderr_truncated = err.truncated;
        if (out.truncated) {
            result.stdout_output += "\n[output truncated at " + std::to_string(out.cap) + " bytes]";
        }
        if (err.truncated) {
            result.stderr_output += "\n[output truncated at " + std::to_string(err.cap) + " bytes]";
        }

        if (timed_out) {
            auto secs = std::chrono::duration_cast<std::chrono::seconds>(limits.timeout).count();
            result.status = ExecutionStatus::TIMED_OUT;
            result.exit_code = TIMEOUT_EXIT_CODE;
            result.error_message = "Execution timed out after " + std::to_string(secs) + "s";
        } else if (!reaped_) {
            result.status = ExecutionStatus::CRASHED;
            result.error_message = "Process could not be reaped";
        } else if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
            result.status = result.exit_code == 0 ? ExecutionStatus::COMPLETED
                                                  : ExecutionStatus::CRASHED;
            if (result.exit_code != 0) {
                result.error_message = "Exited with code " + std::to_string(result.exit_code);
            }
        } else if (WIFSIGNALED(status)) {
            int sig = WTERMSIG(status);
            result.status = ExecutionStatus::CRASHED;
            result.exit_code = 128 + sig;
            result.error_message = std::string("Terminated by signal ") + std::to_string(sig) +
                                   " (" + strsignal(sig) + ")";
        }

        collect_output_files(result);
        return result;
    }

    void teardown() override {
        if (torn_down_) {
            return;
        }
        torn_down_ = true;

        std::vector<std::string> problems;
        // Once reaped, the group id may belong to someone else
        if (pid_ > 0 && !reaped_) {
            if (killpg(pid_, SIGKILL) != 0 && errno != ESRCH) {
                problems.push_back(std::string("killpg: ") + std::strerror(errno));
            }
            int status;
            if (!reap(status, std::chrono::steady_clock::now() +
                                  std::chrono::milliseconds(TEARDOWN_GRACE_MS))) {
                problems.push_back("process " + std::to_string(pid_) + " not reaped");
            }
        }

        if (!cgroup_dir_.empty()) {
            std::error_code ec;
            if (fs::exists(cgroup_dir_ / "cgroup.kill", ec) &&
                !write_control(cgroup_dir_ / "cgroup.kill", "1")) {
                problems.push_back("cgroup.kill write failed");
            }
            bool removed = false;
            for (int attempt = 0; attempt < 20 && !removed; attempt++) {
                removed = rmdir(cgroup_dir_.c_str()) == 0 || errno == ENOENT;
                if (!removed) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
            }
            if (!removed) {
                problems.push_back("cgroup " + cgroup_dir_.string() + " not removed: " +
                                   std::strerror(errno));
            }
        }

        // A uid still owning live processes is never handed out again
        if (holds_uid_ && (pid_ <= 0 || reaped_)) {
            settings_.ids->release(uid_);
            holds_uid_ = false;
        }

        std::error_code ec;
        fs::remove_all(dir_, ec);
        if (ec) {
            problems.push_back("remove " + dir_.string() + ": " + ec.message());
        }

        if (!problems.empty()) {
            std::string joined;
            for (const auto& p : problems) {
                joined += (joined.empty() ? "" : "; ") + p;
            }
            throw std::runtime_error(joined);
        }
    }

private:
    bool plan_command(Language language, const std::string& source,
                      const ExecutionLimits& limits, ChildPlan& plan) const {
        std::string shell_cmd;
        switch (language) {
            case Language::PYTHON:
                plan.exe = "python3";
                plan.args = {"-I", "-u", source_file_};
                break;
            case Language::JAVASCRIPT: {
                size_t heap_mb = std::max<size_t>(limits.memory_bytes / (2 * 1024 * 1024), 32);
                plan.exe = "node";
                plan.args = {"--max-old-space-size=" + std::to_string(heap_mb), source_file_};
                // V8 reserves far more address space than it commits
                plan.limit_address_space = false;
                break;
            }
            case Language::C:
                shell_cmd = "gcc -O0 -o prog " + source_file_ + " -lm && exec ./prog";
                break;
            case Language::JAVA: {
                size_t heap_mb = std::max<size_t>(limits.memory_bytes / (2 * 1024 * 1024), 32);
                std::string cls = java_class_name(source);
                shell_cmd = "javac -J-Xmx" + std::to_string(heap_mb) + "m " + source_file_ +
                            " && exec java -Xmx" + std::to_string(heap_mb) +
                            "m -XX:+UseSerialGC " + cls;
                plan.limit_address_space = false;
                break;
            }
            case Language::HTML:
            case Language::REACT:
                plan.exe = language_name(language);
                return false;
        }

        if (!shell_cmd.empty()) {
            plan.exe = "/bin/sh";
            plan.args = {"-c", shell_cmd};
            return true;
        }
        std::string resolved = find_executable(plan.exe);
        if (resolved.empty()) {
            return false;
        }
        plan.exe = resolved;
        return true;
    }

    void read_program_status(int fd, int& status) const {
        int reported = 0;
        ssize_t n;
        do {
            n = read(fd, &reported, sizeof(reported));
        } while (n < 0 && errno == EINTR);
        if (n == static_cast<ssize_t>(sizeof(reported))) {
            status = reported;
        }
    }

    // Waits for the child with a deadline; true on success
    bool reap(int& status, std::chrono::steady_clock::time_point deadline) {
        while (true) {
            pid_t r = waitpid(pid_, &status, WNOHANG);
            if (r == pid_ || (r == -1 && errno == ECHILD)) {
                reaped_ = true;
                return true;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    // Pumps both pipes until the child exits and the pipes close, or the
    // deadline passes. Returns true on timeout.
    bool supervise(StreamCapture& out, StreamCapture& err, int& status,
                   std::chrono::steady_clock::time_point deadline) {
        char buffer[PIPE_BUFFER_SIZE];
        std::chrono::steady_clock::time_point drain_deadline{};

        while (true) {
            if (!reaped_) {
                pid_t r = waitpid(pid_, &status, WNOHANG);
                if (r == pid_) {
                    reaped_ = true;
                    // Inside namespaces nothing outlives PID 1. Without them,
                    // stray descendants must not keep the pipes open.
                    if (!settings_.isolate && killpg(pid_, SIGKILL) != 0 && errno != ESRCH) {
                        std::cerr << "[ProcessRuntime] " << id_ << " killpg: "
                                  << std::strerror(errno) << std::endl;
                    }
                    drain_deadline = std::chrono::steady_clock::now() +
                                     std::chrono::milliseconds(500);
                }
            }
            if (reaped_ && !out.open && !err.open) {
                return false;
            }

            auto now = std::chrono::steady_clock::now();
            if (reaped_ && now >= drain_deadline) {
                return false;
            }
            if (!reaped_ && now >= deadline) {
                // Killing PID 1 empties the namespace before it can be reaped
                if (killpg(pid_, SIGKILL) != 0 && errno != ESRCH) {
                    std::cerr << "[ProcessRuntime] " << id_ << " killpg on timeout: "
                              << std::strerror(errno) << std::endl;
                }
                if (!reap(status, now + std::chrono::milliseconds(TEARDOWN_GRACE_MS))) {
                    std::cerr << "[ProcessRuntime] " << id_ << " still running after kill, "
                              << "leaving it to teardown" << std::endl;
                }
                drain(out, buffer, sizeof(buffer));
                drain(err, buffer, sizeof(buffer));
                return true;
            }

            pollfd fds[2];
            StreamCapture* streams[2];
            nfds_t n = 0;
            for (StreamCapture* s : {&out, &err}) {
                if (s->open) {
                    fds[n] = {s->fd, POLLIN, 0};
                    streams[n] = s;
                    n++;
                }
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                (reaped_ ? drain_deadline : deadline) - now).count();
            int wait_ms = static_cast<int>(std::max<long long>(1, std::min<long long>(remaining, 50)));

            int ready = poll(n ? fds : nullptr, n, wait_ms);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
            }
            for (nfds_t i = 0; i < n; i++) {
                if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                    drain(*streams[i], buffer, sizeof(buffer));
                }
            }
        }
    }

    void drain(StreamCapture& stream, char* buffer, size_t size) {
        while (stream.open) {
            ssize_t n = read(stream.fd, buffer, size);
            if (n > 0) {
                stream.append(buffer, static_cast<size_t>(n));
            } else if (n == 0) {
                stream.open = false;
            } else if (errno == EINTR) {
                continue;
            } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return;
            } else {
                stream.open = false;
            }
        }
    }

    void collect_output_files(ExecutionResult& result) const {
        std::vector<fs::path> candidates;
        std::error_code ec;
        for (fs::directory_iterator it(work_dir_, ec), end; !ec && it != end; it.increment(ec)) {
            const auto& path = it->path();
            std::string name = path.filename().string();
            if (name == source_file_ || name == "prog" || path.extension() == ".class") {
                continue;
            }
            std::error_code type_ec;
            if (!it->is_regular_file(type_ec) ||
                it->file_size(type_ec) > MAX_OUTPUT_FILE_BYTES) {
                continue;
            }
            candidates.push_back(path);
        }
        if (ec) {
            std::cerr << "[ProcessRuntime] " << id_ << " cannot list outputs: "
                      << ec.message() << std::endl;
            return;
        }

        std::sort(candidates.begin(), candidates.end());
        for (const auto& path : candidates) {
            if (result.output_files.size() >= MAX_OUTPUT_FILES) {
                break;
            }
            try {
                std::string content = FileUtils::read_file(path.string());
                if (FileUtils::looks_like_text(content)) {
                    result.output_files.push_back({path.filename().string(), std::move(content)});
                }
            } catch (const std::runtime_error& e) {
                std::cerr << "[ProcessRuntime] " << id_ << " skipping output file: "
                          << e.what() << std::endl;
            }
        }
    }

    std::string id_;
    fs::path dir_;
    fs::path work_dir_;
    fs::path root_dir_;
    fs::path cgroup_dir_;
    SandboxSettings settings_;
    uid_t uid_ = 0;
    bool holds_uid_ = false;
    std::string source_file_;
    pid_t pid_ = -1;
    bool reaped_ = false;
    bool used_ = false;
    bool torn_down_ = false;
};

} // namespace

std::string find_executable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }
    const char* env_path = std::getenv("PATH");
    std::stringstream dirs(env_path ? env_path : kDefaultPath);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

NamespaceSupport ProcessRuntime::detect_namespaces(const std::string& scratch_dir,
                                                  bool user_namespace) {
    DetectPlan plan;
    plan.maps = make_id_maps(user_namespace);
    plan.scratch = scratch_dir;
    plan.proc_dir = scratch_dir + "/proc";

    int flags = kNamespaceFlags | (user_namespace ? CLONE_NEWUSER : 0);
    pid_t pid = clone_child(detect_entry, &plan, flags);
    if (pid < 0) {
        return {};
    }
    int status;
    while (waitpid(pid, &status, 0) != pid) {
        if (errno != EINTR) {
            return {};
        }
    }

    NamespaceSupport support;
    if (WIFEXITED(status)) {
        support.namespaces = WEXITSTATUS(status) == 0 || WEXITSTATUS(status) == 2;
        support.proc = WEXITSTATUS(status) == 0;
    }
    return support;
}

bool ProcessRuntime::detect_network_namespace() {
    pid_t pid = fork();
    if (pid == 0) {
        _exit(unshare(CLONE_NEWNET) == 0 ? 0 : 1);
    }
    if (pid < 0) {
        return false;
    }
    int status;
    if (waitpid(pid, &status, 0) != pid) {
        return false;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

ProcessRuntime::ProcessRuntime(ProcessRuntimeOptions options)
    : options_(std::move(options)) {
    if (options_.work_root.empty()) {
        options_.work_root = fs::temp_directory_path().string();
    }
    std::error_code ec;
    fs::create_directories(options_.work_root, ec);
    if (ec) {
        throw std::runtime_error("cannot create work root " + options_.work_root + ": " +
                                 ec.message());
    }

    bool as_root = geteuid() == 0;
    user_namespace_ = !as_root;
    NamespaceSupport support = detect_namespaces(options_.work_root, user_namespace_);
    namespaces_available_ = support.namespaces;
    proc_available_ = support.proc;

    if (namespaces_available_) {
        netns_available_ = true;
        if (!proc_available_) {
            std::cerr << "[ProcessRuntime] /proc cannot be mounted in the sandbox, "
                      << "programs run without it" << std::endl;
        }
    } else if (options_.require_isolation) {
        throw std::runtime_error(
            "PID and mount namespaces are unavailable; set require_isolation to false "
            "to run with process groups only");
    } else {
        std::cerr << "[ProcessRuntime] Namespaces unavailable, running without PID or "
                  << "mount isolation" << std::endl;
        netns_available_ = detect_network_namespace();
        if (!netns_available_) {
            std::cerr << "[ProcessRuntime] Network namespaces unavailable, relying on the "
                      << "seccomp socket filter" << std::endl;
        }
    }

    if (as_root) {
        ids_ = std::make_shared<SandboxIdPool>(options_.sandbox_uid_base,
                                               options_.sandbox_uid_count);
    }

    if (!options_.cgroup_root.empty()) {
        fs::create_directories(options_.cgroup_root, ec);
        cgroups_available_ = !ec &&
            write_control(fs::path(options_.cgroup_root) / "cgroup.subtree_control",
                          "+memory +cpu +pids");
        if (!cgroups_available_) {
            std::cerr << "[ProcessRuntime] cgroup v2 limits unavailable at "
                      << options_.cgroup_root << ", relying on rlimits" << std::endl;
        }
    }

    std::cout << "[ProcessRuntime] Work root " << options_.work_root
              << ", namespaces " << (namespaces_available_ ? "on" : "off")
              << (user_namespace_ ? " (user)" : "")
              << ", netns " << (netns_available_ ? "on" : "off")
              << ", cgroups " << (cgroups_available_ ? "on" : "off")
              << ", task uids " << (ids_ ? "on" : "off") << std::endl;
}

std::unique_ptr<Environment> ProcessRuntime::provision(const ExecutionLimits& limits) {
    std::string id = "env-" + std::to_string(getpid()) + "-" + std::to_string(++counter_);

    std::string templ = (fs::path(options_.work_root) / "labshot-XXXXXX").string();
    std::vector<char> buffer(templ.begin(), templ.end());
    buffer.push_back('\0');
    if (!mkdtemp(buffer.data())) {
        throw std::runtime_error("mkdtemp failed in " + options_.work_root + ": " +
                                 std::strerror(errno));
    }
    fs::path dir(buffer.data());

    fs::path cgroup_dir;
    if (cgroups_available_) {
        cgroup_dir = fs::path(options_.cgroup_root) / id;
        std::error_code ec;
        bool ok = fs::create_directory(cgroup_dir, ec) &&
            write_control(cgroup_dir / "memory.max", std::to_string(limits.memory_bytes)) &&
            write_control(cgroup_dir / "cpu.max", std::to_string(limits.cpu_quota_us) + " " +
                                                  std::to_string(limits.cpu_period_us)) &&
            write_control(cgroup_dir / "pids.max", std::to_string(limits.max_processes));
        if (!ok) {
            std::cerr << "[ProcessRuntime] " << id << " cgroup setup failed, continuing "
                      << "with rlimits only" << std::endl;
            fs::remove(cgroup_dir, ec);
            cgroup_dir.clear();
        }
    }

    SandboxSettings settings;
    settings.isolate = namespaces_available_;
    settings.user_namespace = user_namespace_;
    settings.mount_proc = proc_available_;
    settings.enter_netns = netns_available_;
    settings.require_seccomp = options_.require_seccomp;
    settings.ids = ids_;

    // The environment owns the directory from here; its destructor cleans up
    auto env = std::make_unique<ProcessEnvironment>(id, dir, cgroup_dir, std::move(settings));
    env->prepare();
    return env;
}

} // namespace labshot
