#include "run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>
#include <vector>
#include "common/defer.hpp"
#include "limits.hpp"

using namespace std;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

const int BUF_SIZE = 65536;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

static volatile sig_atomic_t received_SIGCHLD = 0;

template <typename... Args>
[[noreturn]] static void error(int err, const char *format, const Args &... args) {
    throw system_error(err, system_category(), fmt::format(fmt::runtime(format), args...));
}

static void child_handler(int /* signal */) {
    received_SIGCHLD = 1;
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/**
 * @brief 在监视子进程期间修改本进程的信号处理
 * SIGCHLD 平时被屏蔽，只在 ppoll 中解除屏蔽，这样子进程结束时一定能打断 ppoll；
 * SIGPIPE 被忽略，子进程提前关闭 stdin 时 write 返回 EPIPE 而不是杀死本进程。
 */
struct signal_scope {
    sigset_t oldmask, waitmask;
    struct sigaction oldchld, oldpipe;

    signal_scope() {
        sigset_t sigmask;
        if (sigemptyset(&sigmask) != 0) error(errno, "creating empty signal mask");
        if (sigaddset(&sigmask, SIGCHLD) != 0) error(errno, "setting signal mask");
        if (sigprocmask(SIG_BLOCK, &sigmask, &oldmask) != 0) error(errno, "masking SIGCHLD");

        waitmask = oldmask;
        sigdelset(&waitmask, SIGCHLD);

        struct sigaction sigact;
        memset(&sigact, 0, sizeof(sigact));
        sigemptyset(&sigact.sa_mask);
        sigact.sa_handler = child_handler;
        if (sigaction(SIGCHLD, &sigact, &oldchld) != 0) error(errno, "installing signal handler");

        sigact.sa_handler = SIG_IGN;
        if (sigaction(SIGPIPE, &sigact, &oldpipe) != 0) error(errno, "ignoring SIGPIPE");
    }

    ~signal_scope() {
        if (sigaction(SIGPIPE, &oldpipe, nullptr) != 0)
            LOG(WARNING) << "could not restore SIGPIPE handler";
        if (sigaction(SIGCHLD, &oldchld, nullptr) != 0)
            LOG(WARNING) << "could not restore SIGCHLD handler";
        if (sigprocmask(SIG_SETMASK, &oldmask, nullptr) != 0)
            LOG(WARNING) << "could not restore signal mask";
    }
};

/**
 * @brief fork 出来的子进程执行的代码，不会返回
 * 所有管道都是 close-on-exec 的，dup2 得到的 0/1/2 不是，因此 exec 之后只剩下这三个。
 * exec 失败时把 errno 写入错误管道，父进程据此判断子进程没能启动。
 */
[[noreturn]] static void run_child(const runguard_options &opt, int child_pipefd[3][2], int error_fd, const sigset_t &oldmask, char **argv) {
    int err = 0;
    try {
        signal(SIGPIPE, SIG_DFL);
        signal(SIGCHLD, SIG_DFL);
        sigprocmask(SIG_SETMASK, &oldmask, nullptr);

        if (dup2(child_pipefd[STDIN_FILENO][PIPE_OUT], STDIN_FILENO) < 0)
            error(errno, "redirecting child fd {}", STDIN_FILENO);
        if (dup2(child_pipefd[STDOUT_FILENO][PIPE_IN], STDOUT_FILENO) < 0)
            error(errno, "redirecting child fd {}", STDOUT_FILENO);
        int errfd = opt.merge_stderr ? STDOUT_FILENO : child_pipefd[STDERR_FILENO][PIPE_IN];
        if (dup2(errfd, STDERR_FILENO) < 0)
            error(errno, "redirecting child fd {}", STDERR_FILENO);

        set_restrictions(opt);

        execvp(argv[0], argv);
        err = errno;
    } catch (system_error &e) {
        err = e.code().value();
    } catch (exception &e) {
        err = ENOEXEC;
    }

    while (write(error_fd, &err, sizeof(err)) < 0 && errno == EINTR)
        ;
    _exit(127);
}

/**
 * @brief 超时后终止子进程所在的整个进程组
 * 先尝试 SIGTERM，再发送 SIGKILL。已经退出的进程不视为错误。
 */
static void terminate_group(pid_t child_pid) {
    LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command";

    if (kill(-child_pid, SIGTERM) != 0 && errno != ESRCH)
        error(errno, "sending SIGTERM to command");

    /* Prefer nanosleep over sleep because of higher resolution and
       it does not interfere with signals. */
    nanosleep(&killdelay, nullptr);

    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        error(errno, "sending SIGKILL to command");
}

static pid_t wait_child(pid_t child_pid, int &status, struct rusage &usage) {
    pid_t pid;
    do {
        pid = wait4(child_pid, &status, 0, &usage);
    } while (pid < 0 && errno == EINTR);
    if (pid < 0) error(errno, "waiting on child");
    return pid;
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1) error(errno, "fcntl, getting flags");
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) error(errno, "fcntl, setting flags");
}

/**
 * @brief 读取子进程的一个输出流
 * 超出 stream_size 的数据会被读出并丢弃，保证子进程不会因为管道写满而阻塞
 */
static void pump_output(const runguard_options &opt, int &fd, string &data, size_t &data_read, char *buf) {
    ssize_t nread = read(fd, buf, BUF_SIZE);
    if (nread < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return;
        error(errno, "reading child output");
    }
    if (nread == 0) {
        /* EOF detected: close fd and indicate this with -1 */
        close_fd(fd);
        return;
    }
    data_read += nread;
    size_t keep = nread;
    if (opt.stream_size >= 0)
        keep = min(keep, (size_t)max<int64_t>(0, opt.stream_size - (int64_t)data.size()));
    data.append(buf, keep);
}

static void pump_input(const runguard_options &opt, int &fd, size_t &written) {
    ssize_t nwritten = write(fd, opt.stdin_data.data() + written, opt.stdin_data.size() - written);
    if (nwritten < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return;
        // 子进程不再读取 stdin，剩余的输入直接丢弃
        if (errno != EPIPE) LOG(WARNING) << "writing child stdin: " << strerror(errno);
        close_fd(fd);
        return;
    }
    written += nwritten;
    if (written == opt.stdin_data.size()) close_fd(fd);
}

runguard_result runit(const runguard_options &opt) {
    if (opt.command.empty())
        throw invalid_argument("runguard: empty command");

    runguard_result result;

    vector<char *> argv;
    for (auto &arg : opt.command) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    int error_pipefd[2] = {-1, -1};
    defer {
        for (auto &p : child_pipefd) {
            close_fd(p[PIPE_IN]);
            close_fd(p[PIPE_OUT]);
        }
        close_fd(error_pipefd[PIPE_IN]);
        close_fd(error_pipefd[PIPE_OUT]);
    };

    for (int i = 0; i <= 2; ++i) {
        if (i == STDERR_FILENO && opt.merge_stderr) continue;
        if (pipe2(child_pipefd[i], O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", i);
    }
    if (pipe2(error_pipefd, O_CLOEXEC) != 0) error(errno, "creating error pipe");

    signal_scope signals;
    received_SIGCHLD = 0;

    auto starttime = chrono::steady_clock::now();

    pid_t child_pid = fork();
    switch (child_pid) {
        case -1:
            error(errno, "unable to fork");
        case 0:  // child process, run the command
            run_child(opt, child_pipefd, error_pipefd[PIPE_IN], signals.oldmask, argv.data());
        default:
            break;
    }

    /* Close unused file descriptors */
    close_fd(child_pipefd[STDIN_FILENO][PIPE_OUT]);
    close_fd(child_pipefd[STDOUT_FILENO][PIPE_IN]);
    close_fd(child_pipefd[STDERR_FILENO][PIPE_IN]);
    close_fd(error_pipefd[PIPE_IN]);

    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));

    {
        // exec 成功时错误管道因为 close-on-exec 被关闭，read 返回 0
        int exec_errno = 0;
        ssize_t n;
        do {
            n = read(error_pipefd[PIPE_OUT], &exec_errno, sizeof(exec_errno));
        } while (n < 0 && errno == EINTR);
        close_fd(error_pipefd[PIPE_OUT]);
        if (n == sizeof(exec_errno)) {
            wait_child(child_pid, status, usage);
            error(exec_errno, "unable to start command {}", opt.command[0]);
        }
    }

    int &stdin_fd = child_pipefd[STDIN_FILENO][PIPE_IN];
    int &stdout_fd = child_pipefd[STDOUT_FILENO][PIPE_OUT];
    int &stderr_fd = child_pipefd[STDERR_FILENO][PIPE_OUT];
    for (int fd : {stdin_fd, stdout_fd, stderr_fd})
        if (fd >= 0) set_nonblocking(fd);
    if (opt.stdin_data.empty()) close_fd(stdin_fd);

    auto deadline = starttime + chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(opt.wall_limit));
    vector<char> buf(BUF_SIZE);
    size_t stdin_written = 0;
    bool exited = false;

    while (true) {
        if (received_SIGCHLD && !exited) {
            received_SIGCHLD = 0;
            pid_t pid = wait4(child_pid, &status, WNOHANG, &usage);
            if (pid < 0 && errno != EINTR) error(errno, "waiting on child");
            if (pid == child_pid) exited = true;
        }

        // 子进程已经退出，没有人会再读 stdin
        if (exited) close_fd(stdin_fd);

        struct pollfd fds[3];
        int nfds = 0;
        for (int fd : {stdin_fd, stdout_fd, stderr_fd}) {
            if (fd < 0) continue;
            fds[nfds].fd = fd;
            fds[nfds].events = fd == stdin_fd ? POLLOUT : POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }

        if (exited && nfds == 0) break;

        struct timespec timeout = {0, 0};
        struct timespec *ptimeout = &timeout;
        if (!exited) {
            if (opt.use_wall_limit) {
                auto remaining = chrono::duration_cast<chrono::nanoseconds>(deadline - chrono::steady_clock::now());
                if (remaining.count() <= 0) {
                    result.timed_out = true;
                    terminate_group(child_pid);
                    wait_child(child_pid, status, usage);
                    exited = true;
                    continue;  // 读出被杀死之前已经写入管道的数据
                }
                timeout.tv_sec = remaining.count() / 1000000000;
                timeout.tv_nsec = remaining.count() % 1000000000;
            } else {
                ptimeout = nullptr;
            }
        }

        int r = ppoll(fds, nfds, ptimeout, &signals.waitmask);
        if (r < 0) {
            if (errno == EINTR) continue;
            error(errno, "waiting for child data");
        }

        // 子进程已经退出，而输出管道还被它 fork 出来的进程占用，不再等待
        if (r == 0 && exited) break;

        for (int i = 0; i < nfds; ++i) {
            if (!fds[i].revents) continue;
            if (fds[i].fd == stdin_fd)
                pump_input(opt, stdin_fd, stdin_written);
            else if (fds[i].fd == stdout_fd)
                pump_output(opt, stdout_fd, result.stdout_data, result.stdout_bytes, buf.data());
            else if (fds[i].fd == stderr_fd)
                pump_output(opt, stderr_fd, result.stderr_data, result.stderr_bytes, buf.data());
        }
    }

    auto endtime = chrono::steady_clock::now();

    // 杀死进程组内剩余的所有进程，确保选手程序 fork 出来的进程都不会留驻系统
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to kill process group " << child_pid << ": " << strerror(errno);

    result.stdin_bytes = stdin_written;
    result.wall_time = chrono::duration<double>(endtime - starttime).count();
    result.memory = (int64_t)usage.ru_maxrss * 1024;

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exitcode = result.signal + 128;
        if (!result.timed_out)
            LOG(WARNING) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    } else {
        throw runtime_error(fmt::format("unknown status: {:x}", status));
    }

    LOG(INFO) << fmt::format("run time: real {:.3f}, memory {}kB, exitcode {}", result.wall_time, result.memory / 1024, result.exitcode);

    return result;
}
