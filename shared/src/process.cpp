#include "offloader/process.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
}

}

CommandResult run_command(const std::vector<std::string> &argv) {
    if (argv.empty()) {
        throw std::runtime_error("exec_failed: Empty command");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe(out_pipe) < 0 || ::pipe(err_pipe) < 0) {
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        throw std::runtime_error("exec_failed: Failed to create pipe: " + std::string(std::strerror(errno)));
    }

    // build argv before forking
    std::vector<char *> args;
    for (const auto &arg : argv) {
        args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        throw std::runtime_error("exec_failed: Failed to fork: " + std::string(std::strerror(errno)));
    }

    // child -> redirect output and exec
    if (pid == 0) {
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        ::execvp(args[0], args.data());
        const char msg[] = "exec failed\n";
        (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    // drain both pipes until the child closes them
    CommandResult result;
    pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    int open_fds = 2;
    char temp[4096];
    while (open_fds > 0) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, temp, sizeof(temp));
            if (n > 0) {
                (i == 0 ? result.out : result.err).append(temp, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                open_fds--;
            }
        }
    }
    for (auto &f : fds) {
        if (f.fd >= 0) ::close(f.fd);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error("exec_failed: waitpid failed: " + std::string(std::strerror(errno)));
        }
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    return result;
}
