#include "core/shell_environment_reader.hpp"
#include "core/scoped_fd.hpp"
#include "core/text_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace
{
    bool hasFlag(const std::vector<std::string> &args, const char *short_flag, const char *long_flag)
    {
        return std::find(args.begin(), args.end(), short_flag) != args.end() ||
               std::find(args.begin(), args.end(), long_flag) != args.end();
    }

    bool setFdFlag(int fd, int get_cmd, int set_cmd, int flag)
    {
        int flags = ::fcntl(fd, get_cmd);
        return flags >= 0 && ::fcntl(fd, set_cmd, flags | flag) == 0;
    }

    // Read everything currently available from a non-blocking descriptor
    void drain(int fd, std::string &out)
    {
        char buffer[4096];
        for (;;)
        {
            ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n > 0)
            {
                out.append(buffer, static_cast<size_t>(n));
            }
            else if (n < 0 && errno == EINTR)
            {
                continue;
            }
            else
            {
                // EAGAIN, EIO once the slave side is gone, or EOF
                break;
            }
        }
    }

    // Output written just before exit may still be in flight through the line discipline
    void drainUntilQuiet(int fd, std::string &out, std::chrono::milliseconds quiet)
    {
        for (;;)
        {
            drain(fd, out);
            struct pollfd pfd = {fd, POLLIN, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(quiet.count()));
            if (ready < 0 && errno == EINTR)
                continue;
            if (ready <= 0 || !(pfd.revents & POLLIN))
                break;
        }
    }

    // Runs in the forked child: only async-signal-safe calls until exec
    [[noreturn]] void execShell(int slave, int error_pipe, char *const argv[])
    {
        ::setsid();
        ::ioctl(slave, TIOCSCTTY, 0);

        const int reset_signals[] = {SIGINT, SIGTERM, SIGQUIT, SIGHUP, SIGPIPE, SIGCHLD, SIGTSTP, SIGTTIN, SIGTTOU};
        for (int sig : reset_signals)
        {
            ::signal(sig, SIG_DFL);
        }
        sigset_t mask;
        sigemptyset(&mask);
        ::sigprocmask(SIG_SETMASK, &mask, nullptr);

        for (int target = 0; target <= 2; ++target)
        {
            if (slave == target)
                ::fcntl(target, F_SETFD, 0);
            else
                ::dup2(slave, target);
        }

        ::execvp(argv[0], argv);

        int err = errno;
        ssize_t ignored = ::write(error_pipe, &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }
} // namespace

ShellEnvironmentReader::ShellEnvironmentReader(ShellEnvironmentOptions options)
    : options_(options)
{
}

const ShellEnvironment &ShellEnvironmentReader::read(const std::vector<std::string> &shell)
{
    std::call_once(once_, [this, &shell]()
                   { cache_ = readFromShell(shell); });
    return cache_;
}

std::vector<std::string> ShellEnvironmentReader::withLoginFlags(std::vector<std::string> shell)
{
    if (!hasFlag(shell, "-l", "--login"))
    {
        shell.push_back("-l");
    }
    if (!hasFlag(shell, "-i", "--interactive"))
    {
        shell.push_back("-i");
    }
    return shell;
}

ShellEnvironment ShellEnvironmentReader::parseEnvironment(const std::string &raw)
{
    ShellEnvironment env;
    for (const auto &line : TextUtils::splitLines(raw))
    {
        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == line.size())
        {
            continue;
        }
        env[line.substr(0, eq)] = line.substr(eq + 1);
    }
    return env;
}

ShellEnvironment ShellEnvironmentReader::readFromShell(const std::vector<std::string> &shell) const
{
    if (shell.empty() || shell.front().empty())
    {
        Logger::error("No shell configured to read environment from");
        return {};
    }

    std::vector<std::string> args = withLoginFlags(shell);
    args.push_back("-c");
    args.push_back("env");

    std::vector<char *> argv;
    for (auto &arg : args)
    {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int master_fd = -1;
    int slave_fd = -1;
    if (::openpty(&master_fd, &slave_fd, nullptr, nullptr, nullptr) != 0)
    {
        Logger::error("Failed to open a pseudo-terminal to read shell environment: " + std::string(std::strerror(errno)));
        return {};
    }
    ScopedFd master(master_fd);
    ScopedFd slave(slave_fd);

    if (!setFdFlag(master.get(), F_GETFD, F_SETFD, FD_CLOEXEC) ||
        !setFdFlag(slave.get(), F_GETFD, F_SETFD, FD_CLOEXEC) ||
        !setFdFlag(master.get(), F_GETFL, F_SETFL, O_NONBLOCK))
    {
        Logger::error("Failed to configure pseudo-terminal: " + std::string(std::strerror(errno)));
        return {};
    }

    // The child reports a failed exec through this pipe; a successful exec closes it
    int pipe_fds[2];
    if (::pipe2(pipe_fds, O_CLOEXEC) != 0)
    {
        Logger::error("Failed to create pipe for shell launch: " + std::string(std::strerror(errno)));
        return {};
    }
    ScopedFd error_read(pipe_fds[0]);
    ScopedFd error_write(pipe_fds[1]);

    pid_t pid = ::fork();
    if (pid < 0)
    {
        Logger::error("Failed to fork shell to read environment: " + std::string(std::strerror(errno)));
        return {};
    }
    if (pid == 0)
    {
        execShell(slave.get(), error_write.get(), argv.data());
    }

    error_write.reset();
    int exec_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(error_read.get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(exec_errno)))
    {
        int status = 0;
        ::waitpid(pid, &status, 0);
        Logger::error("Could not find shell to read environment: " + args.front() + " (" +
                      std::strerror(exec_errno) + ")");
        return {};
    }

    std::string raw;
    int status = 0;
    bool exited = false;
    bool status_known = true;
    auto deadline = std::chrono::steady_clock::now() + options_.timeout;

    while (std::chrono::steady_clock::now() < deadline)
    {
        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid)
        {
            exited = true;
        }
        else if (waited < 0 && errno != EINTR)
        {
            // Reaped elsewhere (e.g. SIGCHLD ignored); the exit status is lost
            exited = true;
            status_known = false;
        }

        drain(master.get(), raw);
        if (exited)
        {
            break;
        }
        std::this_thread::sleep_for(options_.poll_interval);
    }

    if (!exited)
    {
        Logger::error("Timed out waiting for shell to quit while reading shell environment");
        // The shell leads its own session, so take down anything it started too
        if (::kill(-pid, SIGKILL) != 0 && ::kill(pid, SIGKILL) != 0)
        {
            Logger::warn("Failed to kill shell " + std::to_string(pid) + ": " + std::strerror(errno));
        }
        ::waitpid(pid, &status, 0);
        return {};
    }

    if (!status_known || !WIFEXITED(status) || WEXITSTATUS(status) != 0)
    {
        std::string reason = !status_known          ? "exit status unavailable"
                             : WIFEXITED(status)    ? "exit status " + std::to_string(WEXITSTATUS(status))
                             : WIFSIGNALED(status) ? "killed by signal " + std::to_string(WTERMSIG(status))
                                                   : "abnormal termination";
        Logger::error("Failed to run shell to read its environment (" + reason + ")");
        return {};
    }

    drainUntilQuiet(master.get(), raw, options_.poll_interval);
    ShellEnvironment env = parseEnvironment(TextUtils::sanitizeUtf8(raw));
    Logger::debug("Read " + std::to_string(env.size()) + " variables from shell environment");
    return env;
}
