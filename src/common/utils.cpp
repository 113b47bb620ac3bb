#include "common/utils.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include "common/defer.hpp"

namespace grader {
using namespace std;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

const int BUF_SIZE = 4096;

const chrono::milliseconds POLL_INTERVAL(50);

namespace {

struct pipe_pair {
    int fd[2] = {-1, -1};

    pipe_pair() {
        // 所有管道都带 O_CLOEXEC，避免并发 fork 出来的其他子进程继承到这里的管道而导致读不到 EOF
        if (pipe2(fd, O_CLOEXEC) != 0)
            throw system_error(errno, system_category(), "pipe2");
    }

    ~pipe_pair() {
        close_end(PIPE_OUT);
        close_end(PIPE_IN);
    }

    pipe_pair(const pipe_pair &) = delete;
    pipe_pair &operator=(const pipe_pair &) = delete;

    void close_end(int end) {
        if (fd[end] >= 0) {
            close(fd[end]);
            fd[end] = -1;
        }
    }
};

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
        throw system_error(errno, system_category(), "fcntl");
}

/**
 * @brief 从管道中读出可读的数据
 * @return false 若管道已经关闭
 */
bool drain(int fd, string &buffer, size_t limit, bool &truncated) {
    char buf[BUF_SIZE];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
        size_t keep = buffer.size() < limit ? min(limit - buffer.size(), (size_t)n) : 0;
        buffer.append(buf, keep);
        if (keep < (size_t)n) truncated = true;
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    return false;
}

}  // namespace

process_result run_process(const vector<string> &argv, const string &input, const process_options &options) {
    if (argv.empty()) throw invalid_argument("run_process requires a program to run");

    // 子进程提前退出时，向 stdin 写数据会触发 SIGPIPE，我们改为处理 EPIPE
    static once_flag ignore_sigpipe;
    call_once(ignore_sigpipe, [] { signal(SIGPIPE, SIG_IGN); });

    // fork 之后只能调用 async-signal-safe 的函数，所以参数要提前准备好
    vector<char *> args;
    for (auto &arg : argv) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    pipe_pair in, out, err, exec_status;
    process_result result;
    elapsed_time timer;

    pid_t pid = fork();
    switch (pid) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "fork");
        case 0: {  // 子进程
            setpgid(0, 0);
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            signal(SIGPIPE, SIG_DFL);
            if (dup2(in.fd[PIPE_OUT], STDIN_FILENO) < 0 ||
                dup2(out.fd[PIPE_IN], STDOUT_FILENO) < 0 ||
                dup2(err.fd[PIPE_IN], STDERR_FILENO) < 0)
                _exit(127);
            execvp(args[0], args.data());
            int error = errno;
            ssize_t written = write(exec_status.fd[PIPE_IN], &error, sizeof(error));
            (void)written;
            _exit(127);
        }
        default:  // 父进程
            // 与子进程中的 setpgid 重复，确保 kill(-pid) 时进程组一定已经存在
            setpgid(pid, pid);
            break;
    }

    bool reaped = false;
    int status = 0;
    defer {
        if (!reaped) {
            kill(-pid, SIGKILL);
            waitpid(pid, nullptr, 0);
        }
    };

    in.close_end(PIPE_OUT);
    out.close_end(PIPE_IN);
    err.close_end(PIPE_IN);
    exec_status.close_end(PIPE_IN);

    // execvp 成功时管道因为 O_CLOEXEC 被关闭，这里读到 EOF
    int exec_error = 0;
    ssize_t n;
    do {
        n = read(exec_status.fd[PIPE_OUT], &exec_error, sizeof(exec_error));
    } while (n < 0 && errno == EINTR);
    if (n == sizeof(exec_error)) {
        waitpid(pid, nullptr, 0);
        reaped = true;
        result.exec_errno = exec_error;
        result.exitcode = 127;
        result.wall_time = timer.milliseconds();
        return result;
    }

    if (input.empty()) {
        in.close_end(PIPE_IN);
    } else {
        set_nonblocking(in.fd[PIPE_IN]);
    }

    auto deadline = chrono::steady_clock::now() + options.timeout;
    bool aborted = false;
    size_t written = 0;

    while (out.fd[PIPE_OUT] >= 0 || err.fd[PIPE_OUT] >= 0 || !reaped) {
        if (!aborted) {
            bool expired = options.timeout.count() > 0 && chrono::steady_clock::now() >= deadline;
            bool stopped = !expired && options.should_stop && options.should_stop();
            if (expired || stopped) {
                aborted = true;
                result.timed_out = expired;
                result.cancelled = stopped;
                if (options.on_abort) options.on_abort();
                kill(-pid, SIGKILL);
                in.close_end(PIPE_IN);
            }
        } else if (reaped) {
            // 被杀死的进程组已经回收，残留的管道写端不再等待
            break;
        }

        vector<pollfd> fds;
        if (in.fd[PIPE_IN] >= 0) fds.push_back({in.fd[PIPE_IN], POLLOUT, 0});
        if (out.fd[PIPE_OUT] >= 0) fds.push_back({out.fd[PIPE_OUT], POLLIN, 0});
        if (err.fd[PIPE_OUT] >= 0) fds.push_back({err.fd[PIPE_OUT], POLLIN, 0});

        if (fds.empty()) {
            usleep(10 * 1000);
        } else if (poll(fds.data(), fds.size(), POLL_INTERVAL.count()) < 0) {
            if (errno != EINTR) throw system_error(errno, system_category(), "poll");
            continue;
        }

        for (auto &p : fds) {
            if (!p.revents) continue;
            if (p.fd == in.fd[PIPE_IN]) {
                ssize_t m = write(p.fd, input.data() + written, input.size() - written);
                if (m > 0) written += m;
                if ((m < 0 && errno != EAGAIN && errno != EINTR) || written == input.size())
                    in.close_end(PIPE_IN);
            } else if (p.fd == out.fd[PIPE_OUT]) {
                if (!drain(p.fd, result.out, options.output_limit, result.stdout_truncated))
                    out.close_end(PIPE_OUT);
            } else if (p.fd == err.fd[PIPE_OUT]) {
                if (!drain(p.fd, result.err, options.output_limit, result.stderr_truncated))
                    err.close_end(PIPE_OUT);
            }
        }

        if (!reaped && waitpid(pid, &status, WNOHANG) == pid)
            reaped = true;
    }

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    result.wall_time = timer.milliseconds();

    if (result.stdout_truncated || result.stderr_truncated)
        LOG(WARNING) << "Output of " << argv[0] << " exceeded " << options.output_limit << " bytes and was truncated";

    return result;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::milliseconds() const {
    return duration<chrono::duration<double, milli>>().count();
}

}  // namespace grader
