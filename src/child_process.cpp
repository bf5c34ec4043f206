#include "testrunner/child_process.hpp"
#include <errno.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <system_error>
#include <utility>
#include "testrunner/common/exceptions.hpp"
#include "testrunner/config.hpp"

namespace testrunner {
using namespace std;

template <typename... Args>
[[noreturn]] static void error(int err, const char *format, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
}

/*
 * Signals that would kill the supervisor are passed on to the child's process
 * group while it is alive, so that killing testrunner never leaves the
 * command orphaned. Signals we inherited as ignored stay ignored, for us and
 * for the child. Only the async-signal-safe pid is shared with the handler.
 */
static const int forwarded_signals[] = {SIGHUP, SIGINT, SIGTERM};
static const size_t forwarded_count = sizeof(forwarded_signals) / sizeof(forwarded_signals[0]);
static volatile sig_atomic_t forward_pid = 0;
static struct sigaction saved_actions[forwarded_count];
static bool forwarding[forwarded_count];

/*
 * The child leads its own process group; signal the whole group so that
 * grandchildren go down with it. Falls back to the child alone when the
 * group is gone, e.g. the command moved itself into a new session.
 */
static int kill_group(pid_t pid, int sig) {
    if (kill(-pid, sig) == 0) return 0;
    return kill(pid, sig);
}

static void forward_handler(int sig) {
    int saved_errno = errno;
    if (forward_pid > 0) kill_group(forward_pid, sig);
    errno = saved_errno;
}

static void install_forwarding() {
    struct sigaction sigact;
    memset(&sigact, 0, sizeof(sigact));
    sigact.sa_handler = forward_handler;
    sigact.sa_flags = SA_RESTART;
    if (sigemptyset(&sigact.sa_mask) != 0) error(errno, "creating empty signal mask");

    for (size_t i = 0; i < forwarded_count; ++i) {
        forwarding[i] = false;
        if (sigaction(forwarded_signals[i], nullptr, &saved_actions[i]) != 0)
            error(errno, "reading handler for signal {}", forwarded_signals[i]);
        if (!(saved_actions[i].sa_flags & SA_SIGINFO) && saved_actions[i].sa_handler == SIG_IGN) {
            LOG(INFO) << "signal " << forwarded_signals[i] << " is ignored, not forwarding it";
            continue;
        }
        if (sigaction(forwarded_signals[i], &sigact, nullptr) != 0)
            error(errno, "installing handler for signal {}", forwarded_signals[i]);
        forwarding[i] = true;
    }
}

static void restore_forwarding() noexcept {
    forward_pid = 0;
    for (size_t i = 0; i < forwarded_count; ++i) {
        if (!forwarding[i]) continue;
        forwarding[i] = false;
        if (sigaction(forwarded_signals[i], &saved_actions[i], nullptr) != 0)
            LOG(WARNING) << "could not restore handler for signal " << forwarded_signals[i];
    }
}

child_process::child_process() {}

child_process::~child_process() {
    kill_and_reap();
}

void child_process::start(const vector<string> &command) {
    {
        lock_guard<mutex> lock(mtx);
        if (current != state::idle) throw internal_error("child process already started");
    }
    if (command.empty()) throw internal_error("empty command");

    // Keep our own copies so that execvp gets writable, NUL-terminated
    // strings with exactly the caller's bytes.
    vector<string> cmd = command;
    vector<char *> args;
    for (auto &arg : cmd) args.push_back(arg.data());
    args.push_back(nullptr);

    // The child writes its errno here when exec fails; a successful exec
    // closes the pipe instead.
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0) error(errno, "creating exec status pipe");

    install_forwarding();

    pid_t child_pid = fork();
    switch (child_pid) {
        case -1: {
            int err = errno;
            close(status_pipe[0]);
            close(status_pipe[1]);
            restore_forwarding();
            error(err, "unable to fork");
        }
        case 0: {  // child process, run the command
            close(status_pipe[0]);
            if (setpgid(0, 0) == 0) execvp(args[0], args.data());

            int err = errno;
            ssize_t written;
            do {
                written = write(status_pipe[1], &err, sizeof(err));
            } while (written < 0 && errno == EINTR);
            _exit(err == ENOENT ? E_COMMAND_NOT_FOUND : E_CANNOT_EXECUTE);
        }
        default:
            break;
    }

    // Also set the group from our side, so that it exists before any signal
    // is sent to it. EACCES means the child has already exec'ed.
    if (setpgid(child_pid, child_pid) != 0 && errno != EACCES)
        LOG(WARNING) << "unable to move child " << child_pid << " into its own process group: " << strerror(errno);

    {
        lock_guard<mutex> lock(mtx);
        pid = child_pid;
        current = state::running;
        forward_pid = child_pid;
    }
    close(status_pipe[1]);

    int exec_errno = 0;
    ssize_t nread;
    do {
        nread = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (nread < 0 && errno == EINTR);
    int read_errno = errno;
    close(status_pipe[0]);

    if (nread < 0) {
        kill_and_reap();
        error(read_errno, "reading exec status of {}", command[0]);
    }

    if (nread > 0) {
        // exec failed; the child has already exited on its own.
        termination_info info = wait();
        LOG(ERROR) << "unable to start command " << command[0] << ": " << strerror(exec_errno)
                   << " (child exit code " << info.exit_code << ")";
        throw spawn_error(command[0], exec_errno);
    }

    LOG(INFO) << "started command " << command[0] << " with pid " << child_pid;
}

termination_info child_process::wait() {
    {
        lock_guard<mutex> lock(mtx);
        if (current != state::running) throw internal_error("child process is not running");
    }

    // Wait for the child without reaping it, so request_termination() can
    // never signal a recycled pid.
    siginfo_t info;
    for (;;) {
        memset(&info, 0, sizeof(info));
        if (waitid(P_PID, pid, &info, WEXITED | WNOWAIT) == 0) break;
        if (errno != EINTR) error(errno, "waiting on child {}", pid);
    }

    {
        lock_guard<mutex> lock(mtx);
        current = state::exited;
        forward_pid = 0;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) error(errno, "reaping child {}", pid);
    }

    {
        lock_guard<mutex> lock(mtx);
        current = state::reaped;
    }
    restore_forwarding();

    LOG(INFO) << fmt::format("child {} reaped with status {:#x}", pid, status);
    return termination_info::from_wait_status(status);
}

bool child_process::request_termination() {
    lock_guard<mutex> lock(mtx);
    if (current != state::running || termination_requested) return false;
    termination_requested = true;

    LOG(WARNING) << "sending SIGKILL to process group " << pid;
    if (kill_group(pid, SIGKILL) != 0) {
        LOG(ERROR) << "unable to send SIGKILL to " << pid << ": " << strerror(errno);
        return false;
    }
    return true;
}

bool child_process::running() const {
    lock_guard<mutex> lock(mtx);
    return current == state::running;
}

long child_process::id() const {
    lock_guard<mutex> lock(mtx);
    return pid;
}

void child_process::kill_and_reap() noexcept {
    unique_lock<mutex> lock(mtx);
    if (current != state::running && current != state::exited) return;

    if (current == state::running) {
        LOG(WARNING) << "child " << pid << " still running, sending SIGKILL";
        if (kill_group(pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(ERROR) << "unable to send SIGKILL to " << pid << ": " << strerror(errno);
    }
    current = state::reaped;
    lock.unlock();

    int status;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    restore_forwarding();
}

}  // namespace testrunner
