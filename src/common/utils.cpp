#include "common/utils.hpp"
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

namespace runner {
using namespace std;

bool process_result::exited_normally() const {
    return !timed_out && signal == 0 && exit_code == 0;
}

static void close_fd(int &fd) {
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}

static void make_pipe(int fds[2]) {
    if (pipe2(fds, O_CLOEXEC) == -1)
        throw system_error(errno, system_category(), "unable to create pipe");
}

// 父进程向已经退出的子进程写 stdin 时会收到 SIGPIPE，这里只在当前线程屏蔽并消费掉它
static ssize_t write_without_sigpipe(int fd, const char *buf, size_t len) {
    sigset_t pipe_set, old_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

    ssize_t n = write(fd, buf, len);
    int saved_errno = errno;
    if (n == -1 && saved_errno == EPIPE) {
        struct timespec zero = {0, 0};
        sigtimedwait(&pipe_set, nullptr, &zero);
    }

    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
    errno = saved_errno;
    return n;
}

static void drain(int &fd, string &sink) {
    char buf[8192];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            sink.append(buf, n);
        } else if (n == 0) {
            close_fd(fd);
            return;
        } else if (errno == EINTR) {
            continue;
        } else {
            if (errno != EAGAIN && errno != EWOULDBLOCK) close_fd(fd);
            return;
        }
    }
}

static void kill_group(pid_t pid) {
    // 子进程可能还没来得及 setpgid，因此同时杀死进程组和进程本身
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
}

// 子进程已经结束时返回 true，WNOWAIT 使子进程保持僵尸状态，进程组 id 在回收之前不会被复用
static bool child_exited(pid_t pid) {
    while (true) {
        siginfo_t info;
        info.si_pid = 0;
        if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) == -1) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "waitid failed");
        }
        return info.si_pid == pid;
    }
}

static int wait_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), "waitpid failed");
    }
    return status;
}

process_result exec_program(const process_options &options, const char **argv) {
    // fork 之后子进程只能调用异步信号安全的函数，因此所有需要分配内存的数据都在 fork 之前准备好
    string exec_failure = fmt::format("failed to execute {}\n", argv[0]);
    string chdir_failure = fmt::format("failed to enter {}\n", options.workdir.string());

    int in_pipe[2], out_pipe[2], err_pipe[2];
    make_pipe(in_pipe);
    try {
        make_pipe(out_pipe);
    } catch (...) {
        close(in_pipe[0]), close(in_pipe[1]);
        throw;
    }
    try {
        make_pipe(err_pipe);
    } catch (...) {
        close(in_pipe[0]), close(in_pipe[1]);
        close(out_pipe[0]), close(out_pipe[1]);
        throw;
    }

    pid_t pid = fork();
    if (pid == -1) {
        int saved_errno = errno;
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]})
            close(fd);
        throw system_error(saved_errno, system_category(), "fork failed");
    }

    if (pid == 0) {  // 子进程
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        if (!options.workdir.empty() && chdir(options.workdir.c_str()) != 0) {
            ssize_t ignored = write(STDERR_FILENO, chdir_failure.data(), chdir_failure.size());
            (void)ignored;
            _exit(127);
        }

        struct rlimit core = {0, 0};
        setrlimit(RLIMIT_CORE, &core);

        execvp(argv[0], (char **)argv);
        ssize_t ignored = write(STDERR_FILENO, exec_failure.data(), exec_failure.size());
        (void)ignored;
        _exit(127);
    }

    // 父进程
    setpgid(pid, pid);
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);
    int in_fd = in_pipe[1], out_fd = out_pipe[0], err_fd = err_pipe[0];
    for (int fd : {in_fd, out_fd, err_fd})
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);

    process_result result;
    size_t written = 0;
    if (options.input.empty()) close_fd(in_fd);

    auto deadline = chrono::steady_clock::now() + options.timeout;

    while (out_fd != -1 || err_fd != -1) {
        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }
        // 后台运行的后代进程可能继承了 stdout/stderr，管道不会关闭，因此需要定期检查子进程是否已经结束
        auto remaining = min<long long>(chrono::duration_cast<chrono::milliseconds>(deadline - now).count() + 1, 50);

        pollfd fds[3];
        nfds_t nfds = 0;
        if (in_fd != -1) fds[nfds++] = {in_fd, POLLOUT, 0};
        if (out_fd != -1) fds[nfds++] = {out_fd, POLLIN, 0};
        if (err_fd != -1) fds[nfds++] = {err_fd, POLLIN, 0};

        int ready = poll(fds, nfds, (int)remaining);
        if (ready == -1) {
            if (errno == EINTR) continue;
            int saved_errno = errno;
            kill_group(pid);
            close_fd(in_fd), close_fd(out_fd), close_fd(err_fd);
            wait_child(pid);
            throw system_error(saved_errno, system_category(), "poll failed");
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!fds[i].revents) continue;
            if (fds[i].fd == in_fd) {
                if (fds[i].revents & (POLLERR | POLLHUP)) {
                    close_fd(in_fd);
                    continue;
                }
                ssize_t n = write_without_sigpipe(in_fd, options.input.data() + written, options.input.size() - written);
                if (n > 0) written += n;
                if (written >= options.input.size() || (n == -1 && errno != EAGAIN && errno != EINTR))
                    close_fd(in_fd);
            } else if (fds[i].fd == out_fd) {
                drain(out_fd, result.out);
            } else if (fds[i].fd == err_fd) {
                drain(err_fd, result.err);
            }
        }

        if (child_exited(pid)) {
            // 子进程写入的内容都已经在管道中，读完缓冲区即可
            if (out_fd != -1) drain(out_fd, result.out);
            if (err_fd != -1) drain(err_fd, result.err);
            break;
        }
    }

    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);

    int status = 0;
    if (result.timed_out) {
        kill_group(pid);
        status = wait_child(pid);
    } else {
        // 子进程可能关闭了 stdout/stderr 但仍在运行，因此继续按截止时间等待
        while (!child_exited(pid)) {
            if (chrono::steady_clock::now() >= deadline) {
                result.timed_out = true;
                break;
            }
            this_thread::sleep_for(chrono::milliseconds(10));
        }
        // 子进程已经结束或超时，它的后代可能还在同一个进程组中
        kill_group(pid);
        status = wait_child(pid);
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    return result;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace runner
