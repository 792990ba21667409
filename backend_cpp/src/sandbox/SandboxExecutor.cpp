#include "sandbox/SandboxExecutor.hpp"
#include "sandbox/FilesystemPolicy.hpp"
#include "sandbox/PythonHarness.hpp"
#include "sandbox/ScratchArea.hpp"
#include "sandbox/SeccompPolicy.hpp"
#include "model/Errors.hpp"
#include "utils/SubProcess.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <fcntl.h>
#include <linux/close_range.h>
#include <linux/seccomp.h>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pyguard::sandbox {

namespace {

using Clock = std::chrono::steady_clock;

const int POLL_INTERVAL_MS = 25;
const size_t CHANNEL_CAP = 1024 * 1024;
const rlim_t MAX_OPEN_FILES = 64;
const rlim_t WRITABLE_FILE_SIZE = 64ull * 1024 * 1024;

// Dynamic loader and shared libraries the interpreter maps at exec time.
const char* const LOADER_ROOTS[] = {"/lib", "/lib64", "/usr/lib", "/usr/lib64", "/etc/ld.so.cache"};

enum SetupStage {
    STAGE_PROCESS = 1,
    STAGE_DESCRIPTORS,
    STAGE_CHDIR,
    STAGE_RLIMIT,
    STAGE_NO_NEW_PRIVS,
    STAGE_LANDLOCK,
    STAGE_SECCOMP,
    STAGE_EXEC
};

const char* stage_name(int stage) {
    switch (stage) {
        case STAGE_PROCESS: return "process setup";
        case STAGE_DESCRIPTORS: return "descriptor setup";
        case STAGE_CHDIR: return "chdir to scratch area";
        case STAGE_RLIMIT: return "resource limits";
        case STAGE_NO_NEW_PRIVS: return "no_new_privs";
        case STAGE_LANDLOCK: return "landlock ruleset";
        case STAGE_SECCOMP: return "seccomp filter";
        case STAGE_EXEC: return "interpreter exec";
    }
    return "unknown stage";
}

struct SetupFailure {
    int stage;
    int error;
};

struct Pipe {
    UniqueFd read;
    UniqueFd write;
};

Pipe make_pipe() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw InfrastructureError(std::string("pipe2 failed: ") + std::strerror(errno));
    }
    return {UniqueFd(fds[0]), UniqueFd(fds[1])};
}

std::vector<char*> to_cstrings(std::vector<std::string>& values) {
    std::vector<char*> out;
    out.reserve(values.size() + 1);
    for (auto& v : values) out.push_back(v.data());
    out.push_back(nullptr);
    return out;
}

// Everything the child needs, prepared before fork. The child only makes
// async-signal-safe calls.
struct ChildPlan {
    const char* interpreter;
    char* const* argv;
    char* const* envp;
    const char* scratch;
    int stdin_fd;
    int stdout_fd;
    int stderr_fd;
    int channel_fd;
    int setup_fd;
    int landlock_fd;        // -1 when the kernel has no Landlock
    pid_t parent;
    rlimit address_space;
    rlimit cpu;
    rlimit file_size;
    rlimit open_files;
    const sock_fprog* seccomp;
};

[[noreturn]] void child_fail(int setup_fd, int stage) {
    SetupFailure failure{stage, errno};
    ssize_t ignored = write(setup_fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

[[noreturn]] void run_child(const ChildPlan& plan) {
    // Lift everything above the target slots first so dup2 cannot clobber a source.
    int setup_fd = fcntl(plan.setup_fd, F_DUPFD_CLOEXEC, 10);
    if (setup_fd < 0) _exit(127);
    int landlock_fd = -1;
    if (plan.landlock_fd >= 0) {
        landlock_fd = fcntl(plan.landlock_fd, F_DUPFD_CLOEXEC, 10);
        if (landlock_fd < 0) child_fail(setup_fd, STAGE_DESCRIPTORS);
    }

    setpgid(0, 0);
    if (prctl(PR_SET_PDEATHSIG, SIGKILL) != 0) child_fail(setup_fd, STAGE_PROCESS);
    if (getppid() != plan.parent) _exit(127);

    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
    for (int sig = 1; sig < NSIG; sig++) {
        if (sig != SIGKILL && sig != SIGSTOP) signal(sig, SIG_DFL);
    }

    int sources[4] = {plan.stdin_fd, plan.stdout_fd, plan.stderr_fd, plan.channel_fd};
    int lifted[4];
    for (int i = 0; i < 4; i++) {
        lifted[i] = fcntl(sources[i], F_DUPFD_CLOEXEC, 10);
        if (lifted[i] < 0) child_fail(setup_fd, STAGE_DESCRIPTORS);
    }
    for (int i = 0; i < 4; i++) {
        if (dup2(lifted[i], i) < 0) child_fail(setup_fd, STAGE_DESCRIPTORS);
    }

    // Nothing else from the host survives exec.
    if (close_range(HARNESS_CHANNEL_FD + 1, ~0U, CLOSE_RANGE_CLOEXEC) != 0) {
        rlimit current{};
        rlim_t upper = (getrlimit(RLIMIT_NOFILE, &current) == 0 && current.rlim_cur != RLIM_INFINITY)
                           ? std::min<rlim_t>(current.rlim_cur, 65536) : 65536;
        for (rlim_t fd = HARNESS_CHANNEL_FD + 1; fd < upper; fd++) {
            fcntl(static_cast<int>(fd), F_SETFD, FD_CLOEXEC);
        }
    }

    if (chdir(plan.scratch) != 0) child_fail(setup_fd, STAGE_CHDIR);

    rlimit no_core{0, 0};
    if (setrlimit(RLIMIT_AS, &plan.address_space) != 0 ||
        setrlimit(RLIMIT_CPU, &plan.cpu) != 0 ||
        setrlimit(RLIMIT_FSIZE, &plan.file_size) != 0 ||
        setrlimit(RLIMIT_NOFILE, &plan.open_files) != 0 ||
        setrlimit(RLIMIT_CORE, &no_core) != 0) {
        child_fail(setup_fd, STAGE_RLIMIT);
    }

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) child_fail(setup_fd, STAGE_NO_NEW_PRIVS);
    if (landlock_fd >= 0 && FilesystemPolicy::restrict_self(landlock_fd) != 0) child_fail(setup_fd, STAGE_LANDLOCK);
    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, plan.seccomp, 0, 0) != 0) child_fail(setup_fd, STAGE_SECCOMP);

    execve(plan.interpreter, plan.argv, plan.envp);
    child_fail(setup_fd, STAGE_EXEC);
}

// Kills and reaps the sandbox process group on every exit path.
class ProcessGroupGuard {
public:
    explicit ProcessGroupGuard(pid_t pid) : pid_(pid) {}
    ~ProcessGroupGuard() {
        if (reaped_) return;
        kill();
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    }

    ProcessGroupGuard(const ProcessGroupGuard&) = delete;
    ProcessGroupGuard& operator=(const ProcessGroupGuard&) = delete;

    // Valid until reaped: an unreaped leader keeps its pid and group id reserved.
    void kill() {
        ::killpg(pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
        killed_ = true;
    }

    bool killed() const { return killed_; }

    // Leader has exited but is not reaped yet.
    bool exited() const {
        siginfo_t info{};
        if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) != 0) return false;
        return info.si_pid == pid_;
    }

    // Blocks until the leader is reaped. Stragglers in the group are killed first.
    int reap(rusage& usage) {
        ::killpg(pid_, SIGKILL);
        int status = 0;
        while (wait4(pid_, &status, 0, &usage) < 0) {
            if (errno != EINTR) throw InfrastructureError(std::string("wait4 failed: ") + std::strerror(errno));
        }
        reaped_ = true;
        return status;
    }

private:
    pid_t pid_;
    bool killed_ = false;
    bool reaped_ = false;
};

// Non-blocking reader for one child stream with a byte cap.
struct StreamCapture {
    UniqueFd fd;
    size_t cap;
    std::string data;
    bool truncated = false;

    bool open() const { return fd.valid(); }

    // Returns true when the cap was crossed during this call.
    bool pump() {
        std::array<char, 65536> buffer;
        bool crossed = false;
        while (fd.valid()) {
            ssize_t n = read(fd.get(), buffer.data(), buffer.size());
            if (n > 0) {
                size_t room = cap > data.size() ? cap - data.size() : 0;
                size_t take = std::min(room, static_cast<size_t>(n));
                data.append(buffer.data(), take);
                if (take < static_cast<size_t>(n) && !truncated) {
                    truncated = true;
                    crossed = true;
                }
            } else if (n == 0) {
                fd.reset();
            } else if (errno == EINTR) {
                continue;
            } else {
                if (errno != EAGAIN && errno != EWOULDBLOCK) fd.reset();
                break;
            }
        }
        return crossed;
    }
};

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
        throw InfrastructureError(std::string("fcntl(O_NONBLOCK) failed: ") + std::strerror(errno));
    }
}

void trim(std::string& text) {
    text.erase(text.find_last_not_of(" \r\n\t") + 1);
}

// Asks the interpreter itself: pyenv/asdf shims are shell scripts that would
// need a shell and a fork inside the sandbox. The roots are everything the
// sandboxed process has to read: import path, binary, venv marker, loader.
bool probe_interpreter(const std::string& interpreter, std::string& executable,
                       std::vector<std::string>& roots, std::string& error) {
    auto probe = SubProcess::run(interpreter +
        " -I -S -c \"import sys; print(sys.executable if sys.version_info >= (3, 8) else ''); "
        "print('\\n'.join(p for p in sys.path if p))\"");
    if (!probe.success) {
        error = probe.output;
        return false;
    }

    std::istringstream lines(probe.output);
    std::getline(lines, executable);
    trim(executable);
    if (executable.empty() || executable[0] != '/') {
        error = "interpreter older than 3.8 or no sys.executable";
        executable.clear();
        return false;
    }

    std::string line;
    while (std::getline(lines, line)) {
        trim(line);
        if (!line.empty() && line[0] == '/') roots.push_back(line);
    }

    namespace fs = std::filesystem;
    fs::path exe(executable);
    roots.push_back(exe.parent_path().string());
    std::error_code ec;
    fs::path real = fs::canonical(exe, ec);
    if (!ec) roots.push_back(real.parent_path().string());
    roots.push_back((exe.parent_path() / "pyvenv.cfg").string());
    roots.push_back((exe.parent_path().parent_path() / "pyvenv.cfg").string());
    for (const char* dir : LOADER_ROOTS) roots.push_back(dir);
    return true;
}

}

SandboxExecutor::SandboxExecutor(const std::string& interpreter, bool require_filesystem_isolation)
    : require_filesystem_isolation_(require_filesystem_isolation) {
    if (!probe_interpreter(interpreter, interpreter_path_, read_roots_, resolve_error_)) {
        spdlog::error("❌ Sandbox: cannot resolve Python interpreter '{}': {}", interpreter, resolve_error_);
    } else {
        spdlog::info("🐍 Sandbox interpreter: {}", interpreter_path_);
    }

    landlock_abi_ = FilesystemPolicy::kernel_abi();
    if (landlock_abi_ > 0) {
        spdlog::info("🛡️ Sandbox: Landlock ABI {} enforces filesystem isolation", landlock_abi_);
    } else if (require_filesystem_isolation_) {
        spdlog::critical("🚨 Sandbox: Landlock unavailable and filesystem isolation is required; executions will be refused");
    } else {
        spdlog::warn("⚠️ Sandbox: Landlock unavailable, filesystem isolation relies on the interpreter audit hook alone");
    }
}

ExecutionResult SandboxExecutor::execute(const SourceFragment& source, const ResourceLimits& limits) const {
    limits.validate();
    if (interpreter_path_.empty()) {
        throw InfrastructureError("no usable Python interpreter: " + resolve_error_);
    }
    if (require_filesystem_isolation_ && landlock_abi_ == 0) {
        throw InfrastructureError("kernel filesystem isolation (Landlock) is required but unavailable");
    }

    SeccompPolicy policy = SeccompPolicy::compile(limits.network_allowed);
    ScratchArea scratch;
    scratch.write_file(FRAGMENT_FILE_NAME, source.text());
    const std::string scratch_path = scratch.path().string();
    FilesystemPolicy fs_policy = FilesystemPolicy::compile(landlock_abi_, read_roots_, scratch_path,
                                                           limits.filesystem_allowed);

    // -u: output written before a kill is already in the pipe.
    std::vector<std::string> args = {interpreter_path_, "-I", "-S", "-B", "-u", "-c", harness_source()};
    for (auto& a : harness_arguments(scratch_path, limits.network_allowed, limits.filesystem_allowed, source.entry_point())) {
        args.push_back(std::move(a));
    }
    std::vector<std::string> env = {
        "PATH=/usr/bin:/bin",
        "HOME=" + scratch_path,
        "TMPDIR=" + scratch_path,
        "LANG=C.UTF-8",
        "LC_ALL=C.UTF-8"
    };
    std::vector<char*> argv = to_cstrings(args);
    std::vector<char*> envp = to_cstrings(env);

    UniqueFd devnull(open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!devnull.valid()) throw InfrastructureError(std::string("cannot open /dev/null: ") + std::strerror(errno));
    Pipe out = make_pipe();
    Pipe err = make_pipe();
    Pipe channel = make_pipe();
    Pipe setup = make_pipe();

    // CPU backstop one second past the wall deadline (rounded up).
    rlim_t cpu_soft = static_cast<rlim_t>((limits.max_wall_time.count() + 999) / 1000 + 1);

    ChildPlan plan{};
    plan.interpreter = interpreter_path_.c_str();
    plan.argv = argv.data();
    plan.envp = envp.data();
    plan.scratch = scratch_path.c_str();
    plan.stdin_fd = devnull.get();
    plan.stdout_fd = out.write.get();
    plan.stderr_fd = err.write.get();
    plan.channel_fd = channel.write.get();
    plan.setup_fd = setup.write.get();
    plan.landlock_fd = fs_policy.ruleset_fd();
    plan.parent = getpid();
    plan.address_space = {static_cast<rlim_t>(limits.max_memory), static_cast<rlim_t>(limits.max_memory)};
    plan.cpu = {cpu_soft, cpu_soft + 1};
    rlim_t fsize = limits.filesystem_allowed ? WRITABLE_FILE_SIZE : 0;
    plan.file_size = {fsize, fsize};
    plan.open_files = {MAX_OPEN_FILES, MAX_OPEN_FILES};
    plan.seccomp = policy.program();

    const auto start = Clock::now();
    pid_t pid = fork();
    if (pid < 0) throw InfrastructureError(std::string("fork failed: ") + std::strerror(errno));
    if (pid == 0) run_child(plan);

    ProcessGroupGuard group(pid);
    setpgid(pid, pid); // Races with the child's own call; either one wins.

    out.write.reset();
    err.write.reset();
    channel.write.reset();
    setup.write.reset();
    devnull.reset();

    // EOF here means exec succeeded (the write end is close-on-exec).
    SetupFailure failure{};
    ssize_t got;
    do {
        got = read(setup.read.get(), &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(failure))) {
        throw InfrastructureError(std::string("sandbox setup failed at ") + stage_name(failure.stage) +
                                  ": " + std::strerror(failure.error));
    }

    StreamCapture stdout_cap{std::move(out.read), limits.max_output_bytes};
    StreamCapture stderr_cap{std::move(err.read), limits.max_output_bytes};
    StreamCapture channel_cap{std::move(channel.read), CHANNEL_CAP};
    for (auto* cap : {&stdout_cap, &stderr_cap, &channel_cap}) set_nonblocking(cap->fd.get());

    spdlog::debug("🐍 Sandbox: fragment v{} running as pid {} in {}", source.version(), pid, scratch_path);

    const auto deadline = start + limits.max_wall_time;
    bool timed_out = false;
    bool output_exceeded = false;

    while (!group.exited()) {
        auto now = Clock::now();
        if (!group.killed() && now >= deadline) {
            timed_out = true;
            group.kill();
        }

        int wait_ms = POLL_INTERVAL_MS;
        if (!group.killed()) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count() + 1;
            wait_ms = static_cast<int>(std::min<long long>(wait_ms, std::max<long long>(left, 1)));
        }

        std::vector<pollfd> fds;
        std::vector<StreamCapture*> owners;
        for (auto* cap : {&stdout_cap, &stderr_cap, &channel_cap}) {
            if (!cap->open()) continue;
            fds.push_back({cap->fd.get(), POLLIN, 0});
            owners.push_back(cap);
        }

        int ready = poll(fds.empty() ? nullptr : fds.data(), fds.size(), wait_ms);
        if (ready < 0 && errno != EINTR) {
            throw InfrastructureError(std::string("poll failed: ") + std::strerror(errno));
        }

        for (size_t i = 0; ready > 0 && i < fds.size(); i++) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            bool crossed = owners[i]->pump();
            if (crossed && owners[i] != &channel_cap && !group.killed()) {
                output_exceeded = true;
                group.kill();
            }
        }
    }

    rusage usage{};
    int status = group.reap(usage);
    for (auto* cap : {&stdout_cap, &stderr_cap, &channel_cap}) {
        if (cap->open() && cap->pump() && cap != &channel_cap) output_exceeded = true;
    }

    ExecutionResult result;
    result.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    result.peak_memory = static_cast<uint64_t>(usage.ru_maxrss) * 1024;
    result.stdout_data = std::move(stdout_cap.data);
    result.stderr_data = std::move(stderr_cap.data);
    result.stdout_truncated = stdout_cap.truncated;
    result.stderr_truncated = stderr_cap.truncated;
    result.fragment_version = source.version();
    result.diagnostics = {pid, scratch_path};
    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    if (WIFSIGNALED(status)) result.term_signal = WTERMSIG(status);

    HarnessReport report = parse_channel(channel_cap.data);
    result.exception_trace = report.exception;

    if (!report.ready && result.exit_code == HARNESS_BOOTSTRAP_EXIT) {
        throw InfrastructureError("sandbox harness failed to start: " + result.stderr_data);
    }

    if (output_exceeded) {
        result.status = ExecutionStatus::RESOURCE_LIMIT_EXCEEDED;
        result.limit = "output";
    } else if (timed_out) {
        result.status = ExecutionStatus::TIMEOUT;
    } else if (report.violation) {
        result.status = ExecutionStatus::SANDBOX_VIOLATION;
        result.violation = *report.violation;
    } else if (result.term_signal == SIGSYS) {
        result.status = ExecutionStatus::SANDBOX_VIOLATION;
        result.violation = "forbidden system call (killed by seccomp)";
    } else if (result.term_signal == SIGXCPU) {
        result.status = ExecutionStatus::RESOURCE_LIMIT_EXCEEDED;
        result.limit = "cpu";
    } else if (result.term_signal == SIGXFSZ) {
        result.status = ExecutionStatus::RESOURCE_LIMIT_EXCEEDED;
        result.limit = "file-size";
    } else if (report.exception && report.exception->type == "MemoryError") {
        result.status = ExecutionStatus::RESOURCE_LIMIT_EXCEEDED;
        result.limit = "memory";
    } else if (report.exception || result.term_signal || result.exit_code.value_or(1) != 0) {
        result.status = ExecutionStatus::RUNTIME_ERROR;
    } else {
        result.status = ExecutionStatus::SUCCESS;
    }

    if (result.status == ExecutionStatus::SANDBOX_VIOLATION) {
        spdlog::critical("🚨 SECURITY: sandbox violation by fragment v{} (pid {}): {}",
                         source.version(), pid, result.violation);
    } else if (result.status != ExecutionStatus::SUCCESS) {
        spdlog::warn("⚠️ Sandbox: fragment v{} finished with {} after {} ms",
                     source.version(), execution_status_to_string(result.status), result.wall_time.count());
    } else {
        spdlog::debug("✅ Sandbox: fragment v{} succeeded in {} ms", source.version(), result.wall_time.count());
    }
    return result;
}

}
