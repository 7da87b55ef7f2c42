#include "sandbox/executor.hpp"
#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/algorithm/string/replace.hpp>
#include <boost/assign.hpp>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <filesystem>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "sandbox/process.hpp"

namespace grader::sandbox {
using namespace std;
namespace fs = std::filesystem;

static const size_t BUF_SIZE = 4096;

executor::~executor() = default;

enum child_stage : int {
    STAGE_SETSID = 1,
    STAGE_NETWORK,
    STAGE_STDIN,
    STAGE_REDIRECT,
    STAGE_CHDIR,
    STAGE_RLIMIT,
    STAGE_EXEC
};

static const map<int, string> stage_names = boost::assign::map_list_of
    (STAGE_SETSID, "setsid")
    (STAGE_NETWORK, "network isolation")
    (STAGE_STDIN, "opening stdin")
    (STAGE_REDIRECT, "redirecting streams")
    (STAGE_CHDIR, "chdir")
    (STAGE_RLIMIT, "setrlimit")
    (STAGE_EXEC, "execve");

/**
 * @brief 子进程通过状态管道报告的启动失败
 * fatal 为假表示只是警告（比如无法隔离网络但配置允许继续运行）
 */
struct child_report {
    int stage;
    int error;
    int fatal;
};

/**
 * @brief fork 之前准备好的子进程启动参数
 * fork 之后子进程只能调用异步信号安全的函数，不能分配内存，因此所有字符串都要提前准备好
 */
struct child_setup {
    string executable;
    vector<string> args, env;
    vector<char *> argv, envp;
    string workdir, stdin_path;
    string uid_map, gid_map;
    int stdout_fd = -1, stderr_fd = -1, status_fd = -1;
    int max_fd = 1024;
    bool isolate_network = true;
    bool require_isolation = true;
    rlim_t cpu_limit = RLIM_INFINITY;
    rlim_t file_limit = RLIM_INFINITY;
    rlim_t proc_limit = RLIM_INFINITY;
};

static void report_stage(int fd, int stage, bool fatal) {
    child_report report{stage, errno, fatal ? 1 : 0};
    ssize_t written = write(fd, &report, sizeof(report));
    (void)written;
}

[[noreturn]] static void child_fail(int fd, int stage) {
    report_stage(fd, stage, true);
    _exit(127);
}

static bool write_proc_file(const char *path, const string &content) {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    bool ok = write(fd, content.data(), content.size()) == (ssize_t)content.size();
    close(fd);
    return ok;
}

/**
 * @brief 关闭 [first, last] 范围内的文件描述符
 */
static void close_fds(unsigned first, unsigned last, int max_fd) {
    if (first > last) return;
#ifdef SYS_close_range
    if (syscall(SYS_close_range, first, last, 0) == 0) return;
#endif
    for (unsigned fd = first; fd <= last && fd < (unsigned)max_fd; ++fd) close(fd);
}

static bool set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    return setrlimit(resource, &lim) == 0;
}

[[noreturn]] static void run_child(const child_setup &setup) {
    // run the command in a separate session, so the command and all
    // its child processes can be killed off with one signal
    if (setsid() == -1) child_fail(setup.status_fd, STAGE_SETSID);

    if (setup.isolate_network) {
        if (unshare(CLONE_NEWNET) != 0) {
            // 非特权用户需要先进入新的用户命名空间，并把自己映射为命名空间内的同一用户
            if (unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0) {
                write_proc_file("/proc/self/setgroups", "deny");
                write_proc_file("/proc/self/uid_map", setup.uid_map);
                write_proc_file("/proc/self/gid_map", setup.gid_map);
            } else if (setup.require_isolation) {
                child_fail(setup.status_fd, STAGE_NETWORK);
            } else {
                report_stage(setup.status_fd, STAGE_NETWORK, false);
            }
        }
    }

    int stdin_fd = open(setup.stdin_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (stdin_fd < 0) child_fail(setup.status_fd, STAGE_STDIN);
    if (dup2(stdin_fd, STDIN_FILENO) < 0 ||
        dup2(setup.stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(setup.stderr_fd, STDERR_FILENO) < 0)
        child_fail(setup.status_fd, STAGE_REDIRECT);

    if (chdir(setup.workdir.c_str()) != 0) child_fail(setup.status_fd, STAGE_CHDIR);

    // 评测服务打开的其他文件（比如日志）不能泄露给选手程序，状态管道在 execve 时自动关闭
    close_fds(STDERR_FILENO + 1, setup.status_fd - 1, setup.max_fd);
    close_fds(setup.status_fd + 1, ~0U, setup.max_fd);

    /* Setting the hard limit one second higher: at the soft limit the
       kernel sends SIGXCPU, at the hard limit SIGKILL. The watchdog
       normally kills the process long before either. */
    if (!set_rlimit(RLIMIT_CORE, 0, 0) ||
        (setup.cpu_limit != RLIM_INFINITY && !set_rlimit(RLIMIT_CPU, setup.cpu_limit, setup.cpu_limit + 1)) ||
        (setup.file_limit != RLIM_INFINITY && !set_rlimit(RLIMIT_FSIZE, setup.file_limit, setup.file_limit)) ||
        (setup.proc_limit != RLIM_INFINITY && !set_rlimit(RLIMIT_NPROC, setup.proc_limit, setup.proc_limit)))
        child_fail(setup.status_fd, STAGE_RLIMIT);

    // 评测服务可能忽略了 SIGPIPE，忽略的信号会被 execve 继承
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
    signal(SIGPIPE, SIG_DFL);

    execve(setup.executable.c_str(), setup.argv.data(), setup.envp.data());
    child_fail(setup.status_fd, STAGE_EXEC);
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/**
 * @brief 等待管道可读并读取一次，读到 EOF 的管道会被关闭并置为 -1
 * 两个管道都关闭后相当于休眠 timeout
 */
static void pump_pipes(pollfd fds[2], stream_capture *captures[2], int timeout_ms) {
    int r = poll(fds, 2, timeout_ms);
    if (r < 0) {
        if (errno != EINTR) LOG(ERROR) << "poll failed: " << strerror(errno);
        return;
    }
    if (r == 0) return;

    char buf[BUF_SIZE];
    for (int i = 0; i < 2; ++i) {
        if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
        ssize_t nread = read(fds[i].fd, buf, sizeof(buf));
        if (nread > 0) {
            captures[i]->feed(buf, (size_t)nread);
        } else if (nread == 0 || (errno != EINTR && errno != EAGAIN)) {
            close_fd(fds[i].fd);
        }
    }
}

process_executor::process_executor(execution_context context)
    : ctx(move(context)) {}

const execution_context &process_executor::context() const {
    return ctx;
}

raw_result process_executor::execute(const execution_request &request) {
    raw_result result;
    result.time_limit = request.time_limit;
    result.memory_limit = request.memory_limit;

    if (request.command.empty()) throw launch_error("run command is empty");
    // 没有时间限制的程序会一直占用 worker
    if (!(request.time_limit > 0))
        throw launch_error(fmt::format("time limit must be positive, got {}", request.time_limit));
    auto executable = find_executable(request.command[0], ctx.search_path);
    if (!executable)
        throw launch_error(fmt::format("interpreter {} is not found in {}", request.command[0], ctx.search_path));

    fs::path rundir = ctx.scratch_root / random_uuid();
    fs::path workdir = rundir / "work";
    error_code ec;
    fs::create_directories(workdir, ec);
    if (ec) throw launch_error(fmt::format("unable to create scratch directory {}: {}", rundir.string(), ec.message()));
    defer {
        if (ctx.keep_scratch) {
            LOG(INFO) << "Keeping scratch directory " << rundir;
            return;
        }
        error_code remove_ec;
        fs::remove_all(rundir, remove_ec);
        if (remove_ec) LOG(WARNING) << "Unable to remove scratch directory " << rundir << ": " << remove_ec.message();
    };

    try {
        write_file_content(workdir / assert_safe_path(request.source_file), request.source);
        for (auto &[name, content] : request.extra_files)
            write_file_content(workdir / assert_safe_path(name), content);
        write_file_content(rundir / "stdin", request.stdin_data);
    } catch (std::exception &ex) {
        throw launch_error(string("unable to prepare scratch directory: ") + ex.what());
    }

    child_setup setup;
    setup.executable = executable->string();
    for (auto &arg : request.command)
        setup.args.push_back(boost::replace_all_copy(arg, "{{source}}", request.source_file));

    map<string, string> environment = {
        {"PATH", ctx.search_path},
        {"HOME", workdir.string()},
        {"TMPDIR", workdir.string()},
        {"LANG", "C.UTF-8"}};
    for (auto &[key, value] : ctx.environment) environment[key] = value;
    for (auto &[key, value] : request.environment) environment[key] = value;
    for (auto &[key, value] : environment) setup.env.push_back(key + "=" + value);

    for (auto &arg : setup.args) setup.argv.push_back(arg.data());
    setup.argv.push_back(nullptr);
    for (auto &env : setup.env) setup.envp.push_back(env.data());
    setup.envp.push_back(nullptr);

    setup.workdir = workdir.string();
    setup.stdin_path = (rundir / "stdin").string();
    setup.uid_map = fmt::format("{} {} 1", getuid(), getuid());
    setup.gid_map = fmt::format("{} {} 1", getgid(), getgid());
    setup.isolate_network = ctx.isolate_network;
    setup.require_isolation = ctx.require_network_isolation;
    setup.cpu_limit = (rlim_t)ceil(request.time_limit) + 1;
    if (ctx.file_limit > 0) setup.file_limit = (rlim_t)ctx.file_limit * 1024;
    if (ctx.proc_limit > 0) setup.proc_limit = (rlim_t)ctx.proc_limit;

    // 管道都带有 O_CLOEXEC，其他线程同时 fork 出的子进程不会继承它们
    int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, status_pipe[2] = {-1, -1};
    defer {
        for (int *p : {out_pipe, err_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0)
        throw launch_error(fmt::format("unable to create pipes: {}", strerror(errno)));
    setup.stdout_fd = out_pipe[1];
    setup.stderr_fd = err_pipe[1];
    setup.status_fd = status_pipe[1];
    setup.max_fd = (int)min(sysconf(_SC_OPEN_MAX), 65536L);

    DLOG(INFO) << "Running " << setup.executable << " in " << workdir;

    elapsed_time timer;
    pid_t pid = fork();
    if (pid < 0) throw launch_error(fmt::format("unable to fork: {}", strerror(errno)));
    if (pid == 0) run_child(setup);

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    // execve 成功后状态管道因 O_CLOEXEC 被关闭，此时读到 EOF
    child_report report;
    while (true) {
        ssize_t n = read(status_pipe[0], &report, sizeof(report));
        if (n < 0 && errno == EINTR) continue;
        if (n != sizeof(report)) break;
        if (report.fatal) {
            while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
            throw launch_error(fmt::format("unable to start {}: {} failed: {}",
                                           setup.executable, stage_names.at(report.stage), strerror(report.error)));
        }
        LOG(WARNING) << "Running without " << stage_names.at(report.stage) << ": " << strerror(report.error);
    }
    close_fd(status_pipe[0]);

    stream_capture out(ctx.output_limit, request.marker_delimiter), err(ctx.output_limit);
    stream_capture *captures[2] = {&out, &err};
    pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    // 读端的所有权转交给 fds
    out_pipe[0] = err_pipe[0] = -1;
    defer {
        close_fd(fds[0].fd);
        close_fd(fds[1].fd);
    };

    int poll_ms = max(1, (int)ctx.poll_interval.count());
    auto last_sample = chrono::steady_clock::now() - ctx.memory_sample_interval;
    long long memory_limit_bytes = request.memory_limit > 0 ? (long long)request.memory_limit * 1024 * 1024 : -1;
    while (true) {
        pump_pipes(fds, captures, poll_ms);

        siginfo_t info;
        info.si_pid = 0;
        if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) == 0 && info.si_pid == pid) break;

        if (!result.timed_out && timer.seconds() >= request.time_limit) {
            result.timed_out = true;
            LOG(INFO) << "Process " << pid << " exceeded time limit " << request.time_limit << "s, killing";
            kill_process_tree(pid, pid);
            continue;
        }

        auto now = chrono::steady_clock::now();
        if (!result.killed_for_memory && now - last_sample >= ctx.memory_sample_interval) {
            last_sample = now;
            long long usage = process_tree_memory(pid, pid);
            result.memory_peak = max(result.memory_peak, usage);
            if (memory_limit_bytes > 0 && usage > memory_limit_bytes) {
                result.killed_for_memory = true;
                LOG(INFO) << "Process " << pid << " exceeded memory limit " << request.memory_limit << "MB, killing";
                kill_process_tree(pid, pid);
            }
        }
    }

    // 主进程退出后，杀死仍在运行的后台进程，然后回收主进程
    kill_process_tree(pid, pid);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    result.wall_time = timer.seconds();

    elapsed_time drain_timer;
    while ((fds[0].fd >= 0 || fds[1].fd >= 0) &&
           drain_timer.duration<chrono::milliseconds>() < ctx.drain_timeout)
        pump_pipes(fds, captures, poll_ms);
    if (fds[0].fd >= 0 || fds[1].fd >= 0)
        LOG(WARNING) << "Output pipes of process " << pid << " are still open after it exited";
    out.finish();
    err.finish();

    if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = 128 + result.signal;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }

    result.stdout_text = out.content();
    result.stderr_text = err.content();
    result.stdout_bytes = out.total_bytes();
    result.stderr_bytes = err.total_bytes();
    result.stdout_truncated = out.truncated();
    result.stderr_truncated = err.truncated();
    result.markers = out.markers();
    return result;
}

static const map<int, string> signal_names = boost::assign::map_list_of
    (SIGHUP, "SIGHUP")
    (SIGINT, "SIGINT")
    (SIGILL, "SIGILL")
    (SIGABRT, "SIGABRT")
    (SIGBUS, "SIGBUS")
    (SIGFPE, "SIGFPE")
    (SIGKILL, "SIGKILL")
    (SIGSEGV, "SIGSEGV")
    (SIGPIPE, "SIGPIPE")
    (SIGALRM, "SIGALRM")
    (SIGTERM, "SIGTERM")
    (SIGXCPU, "SIGXCPU")
    (SIGXFSZ, "SIGXFSZ");

string describe_exit(const raw_result &result) {
    if (result.signal > 0) {
        auto it = signal_names.find(result.signal);
        if (it == signal_names.end()) return fmt::format("killed by signal {}", result.signal);
        return fmt::format("killed by signal {} ({})", result.signal, it->second);
    }
    return fmt::format("exit code {}", result.exit_code);
}

}  // namespace grader::sandbox
