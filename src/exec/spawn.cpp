/*
 * Process spawning implementation - MCP-Toolbox
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <mcp-toolbox/exec/spawn.hpp>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace toolbox {

static bool is_executable(const std::string& p) {
    struct stat st{};
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) != 0;
}

std::optional<std::string> resolve_executable(const std::string& cmd) {
    if (cmd.empty()) return std::nullopt;
    if (cmd.find('/') != std::string::npos) {
        if (is_executable(cmd)) return cmd; else return std::nullopt;
    }
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return std::nullopt;
    std::string paths = pathEnv;
    size_t start = 0;
    while (start <= paths.size()) {
        size_t colon = paths.find(':', start);
        std::string dir = paths.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
        if (!dir.empty()) {
            std::string full = dir + '/' + cmd;
            if (is_executable(full)) return full;
        }
        if (colon == std::string::npos) break;
        start = colon + 1;
    }
    return std::nullopt;
}

void close_fd(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

static std::string errno_text(const char* what, int err) {
    return std::string(what) + ": " + std::strerror(err);
}

SpawnResult spawn_process(const std::vector<std::string>& argv, bool merge_stderr) {
    SpawnResult res;
    if (argv.empty()) { res.error = "exec: no command"; return res; }
    auto exe = resolve_executable(argv[0]);
    if (!exe) { res.error = "exec: \"" + argv[0] + "\": executable file not found in $PATH"; return res; }
    // Built before fork so the child only makes async-signal-safe calls.
    std::vector<char*> cargv; cargv.reserve(argv.size() + 1);
    for (auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1}; // child reports exec errno here; CLOEXEC closes it on success
    auto close_all = [&]() {
        for (int* p : {out_pipe, err_pipe, status_pipe}) { close_fd(p[0]); close_fd(p[1]); }
    };
    if (pipe2(out_pipe, O_CLOEXEC) != 0) { res.error = errno_text("pipe", errno); return res; }
    if (!merge_stderr && pipe2(err_pipe, O_CLOEXEC) != 0) { res.error = errno_text("pipe", errno); close_all(); return res; }
    if (pipe2(status_pipe, O_CLOEXEC) != 0) { res.error = errno_text("pipe", errno); close_all(); return res; }

    pid_t pid = fork();
    if (pid < 0) { res.error = errno_text("fork", errno); close_all(); return res; }
    if (pid == 0) {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGPIPE, SIG_DFL);
        setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) { dup2(devnull, STDIN_FILENO); ::close(devnull); }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(merge_stderr ? out_pipe[1] : err_pipe[1], STDERR_FILENO);
        execv(exe->c_str(), cargv.data());
        int e = errno;
        ssize_t w = ::write(status_pipe[1], &e, sizeof(e));
        (void)w;
        _exit(127);
    }
    setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    while ((n = ::read(status_pipe[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR) {}
    close_fd(status_pipe[0]);
    if (n > 0) {
        int st = 0; while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        close_all();
        res.error = errno_text("exec", child_errno);
        return res;
    }

    res.ok = true;
    res.proc.pid = pid;
    res.proc.stdout_fd = out_pipe[0];
    res.proc.stderr_fd = err_pipe[0];
    return res;
}

SpawnResult spawn_shell(const std::string& command, const SpawnOptions& opts) {
    return spawn_process({opts.shell, "-c", command}, opts.merge_stderr);
}

bool pump_output(int out_fd, int err_fd, const ChunkSink& on_out, const ChunkSink& on_err,
                 std::optional<std::chrono::steady_clock::time_point> deadline) {
    bool out_open = out_fd >= 0, err_open = err_fd >= 0;
    char buf[4096];
    while (out_open || err_open) {
        std::vector<pollfd> fds;
        if (out_open) fds.push_back({out_fd, POLLIN, 0});
        if (err_open) fds.push_back({err_fd, POLLIN, 0});
        int timeout_ms = -1;
        if (deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) return false;
            timeout_ms = static_cast<int>(left);
        }
        int r = ::poll(fds.data(), fds.size(), timeout_ms);
        if (r < 0) {
            if (errno == EINTR) continue;
            return true; // nothing more can be read
        }
        if (r == 0) continue; // deadline re-checked at the top
        for (auto& p : fds) {
            bool is_out = (p.fd == out_fd);
            if (p.revents & POLLNVAL) { (is_out ? out_open : err_open) = false; continue; }
            if (!(p.revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t got = ::read(p.fd, buf, sizeof(buf));
            if (got < 0 && errno == EINTR) continue;
            if (got <= 0) {
                (is_out ? out_open : err_open) = false;
                continue;
            }
            const ChunkSink& sink = is_out ? on_out : on_err;
            if (sink) sink(buf, static_cast<size_t>(got));
        }
    }
    return true;
}

const char* signal_name(int sig) {
    switch (sig) {
    case SIGHUP: return "hangup";
    case SIGINT: return "interrupt";
    case SIGQUIT: return "quit";
    case SIGILL: return "illegal instruction";
    case SIGTRAP: return "trace/breakpoint trap";
    case SIGABRT: return "aborted";
    case SIGBUS: return "bus error";
    case SIGFPE: return "floating point exception";
    case SIGKILL: return "killed";
    case SIGUSR1: return "user defined signal 1";
    case SIGSEGV: return "segmentation fault";
    case SIGUSR2: return "user defined signal 2";
    case SIGPIPE: return "broken pipe";
    case SIGALRM: return "alarm clock";
    case SIGTERM: return "terminated";
    case SIGXCPU: return "CPU time limit exceeded";
    case SIGXFSZ: return "file size limit exceeded";
    default: return nullptr;
    }
}

WaitOutcome wait_for_exit(pid_t pid) {
    WaitOutcome out;
    int st = 0;
    pid_t r;
    while ((r = waitpid(pid, &st, 0)) < 0 && errno == EINTR) {}
    if (r < 0) { out.error = errno_text("wait", errno); return out; }
    if (WIFEXITED(st)) {
        out.exit_code = WEXITSTATUS(st);
    } else if (WIFSIGNALED(st)) {
        out.exit_code = 128 + WTERMSIG(st);
        int sig = WTERMSIG(st);
        const char* name = signal_name(sig);
        out.error = name ? std::string("signal: ") + name : "signal " + std::to_string(sig);
    }
    return out;
}

int kill_group(pid_t pgid, int sig) {
    if (pgid <= 0) return ESRCH;
    if (::kill(-pgid, sig) != 0) return errno;
    return 0;
}

} // namespace toolbox
