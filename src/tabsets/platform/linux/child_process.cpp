#include "platform/linux/child_process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

std::expected<std::string, std::string> run_child_process(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return std::unexpected("empty command line");
    }

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: stdout into the pipe, exec the command
        ::dup2(pipefd[1], STDOUT_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    // Parent: collect stdout until the child closes it
    ::close(pipefd[1]);
    std::string output;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            ::close(pipefd[0]);
            ::waitpid(pid, nullptr, 0);
            return std::unexpected(std::string("read() failed: ") + std::strerror(errno));
        }
        if (n == 0) break;
        output.append(buf, static_cast<size_t>(n));
    }
    ::close(pipefd[0]);

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        return std::unexpected(argv[0] + ": command not found");
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return std::unexpected(argv[0] + " exited with code " + std::to_string(code));
    }

    return output;
}
