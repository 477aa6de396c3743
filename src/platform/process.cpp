#include "process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <cerrno>
#include <cstring>

namespace platform {

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::string& stdin_data) {
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};

    if (pipe(in_pipe) != 0 || pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
        std::string why = std::strerror(errno);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return CommandResult{-1, "", "pipe() failed: " + why};
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::string why = std::strerror(errno);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return CommandResult{-1, "", "fork() failed: " + why};
    }

    if (pid == 0) {
        // Child process
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(in_pipe[0]); close(in_pipe[1]);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    // A child that exits without draining stdin must not kill us with SIGPIPE.
    struct sigaction ignore_pipe {}, old_pipe {};
    ignore_pipe.sa_handler = SIG_IGN;
    sigemptyset(&ignore_pipe.sa_mask);
    sigaction(SIGPIPE, &ignore_pipe, &old_pipe);

    int in_fd = in_pipe[1];
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    size_t written = 0;
    if (stdin_data.empty()) {
        close_fd(in_fd);
    } else {
        fcntl(in_fd, F_SETFL, fcntl(in_fd, F_GETFL) | O_NONBLOCK);
    }

    CommandResult result{0, "", ""};
    char buf[4096];
    while (out_fd >= 0 || err_fd >= 0) {
        struct pollfd fds[3];
        int nfds = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (out_fd >= 0) { fds[nfds] = {out_fd, POLLIN, 0}; out_idx = nfds++; }
        if (err_fd >= 0) { fds[nfds] = {err_fd, POLLIN, 0}; err_idx = nfds++; }
        if (in_fd >= 0)  { fds[nfds] = {in_fd, POLLOUT, 0}; in_idx = nfds++; }

        int rc = poll(fds, nfds, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }

        if (in_idx >= 0 && fds[in_idx].revents) {
            if (fds[in_idx].revents & POLLOUT) {
                ssize_t w = write(in_fd, stdin_data.data() + written,
                                  stdin_data.size() - written);
                if (w > 0) written += static_cast<size_t>(w);
                if (w < 0 && errno != EAGAIN && errno != EINTR) written = stdin_data.size();
            } else {
                written = stdin_data.size();  // POLLERR/POLLHUP: reader went away
            }
            if (written >= stdin_data.size()) close_fd(in_fd);
        }
        if (out_idx >= 0 && fds[out_idx].revents) {
            ssize_t n = read(out_fd, buf, sizeof(buf));
            if (n > 0) result.stdout_data.append(buf, static_cast<size_t>(n));
            else if (n == 0 || errno != EINTR) close_fd(out_fd);
        }
        if (err_idx >= 0 && fds[err_idx].revents) {
            ssize_t n = read(err_fd, buf, sizeof(buf));
            if (n > 0) result.stderr_data.append(buf, static_cast<size_t>(n));
            else if (n == 0 || errno != EINTR) close_fd(err_fd);
        }
    }
    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);
    sigaction(SIGPIPE, &old_pipe, nullptr);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.exit_code = -1;
            return result;
        }
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

} // namespace platform
