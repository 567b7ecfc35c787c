#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

volatile sig_atomic_t ShutdownManager::pipe_write_ = -1;

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    if (pipe_read_ >= 0)
        ::close(pipe_read_);
    if (pipe_write_ >= 0)
        ::close(pipe_write_);
}

bool ShutdownManager::ensurePipe()
{
    if (pipe_read_ >= 0)
    {
        return true;
    }
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0)
    {
        Logger::error("ShutdownManager: failed to create wake pipe: " + std::string(std::strerror(errno)));
        return false;
    }
    pipe_read_ = fds[0];
    pipe_write_ = fds[1];
    return true;
}

void ShutdownManager::installSignalHandlers()
{
    if (!ensurePipe())
    {
        return;
    }

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = &ShutdownManager::handleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    for (int sig : {SIGINT, SIGTERM, SIGQUIT})
    {
        if (::sigaction(sig, &sa, nullptr) != 0)
        {
            Logger::warn("ShutdownManager: failed to install handler for signal " + std::to_string(sig) + ": " +
                         std::strerror(errno));
        }
    }
    Logger::debug("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    int saved_errno = errno;
    if (pipe_write_ >= 0)
    {
        unsigned char byte = static_cast<unsigned char>(sig);
        ssize_t ignored = ::write(pipe_write_, &byte, 1);
        (void)ignored;
    }
    errno = saved_errno;
}

void ShutdownManager::wake() noexcept
{
    if (pipe_write_ >= 0)
    {
        unsigned char byte = 0;
        ssize_t ignored = ::write(pipe_write_, &byte, 1);
        (void)ignored;
    }
}

bool ShutdownManager::processPendingSignals()
{
    if (pipe_read_ < 0)
    {
        return shutdown_requested_.load();
    }

    unsigned char buffer[64];
    int last = 0;
    for (;;)
    {
        ssize_t n = ::read(pipe_read_, buffer, sizeof(buffer));
        if (n > 0)
        {
            for (ssize_t i = 0; i < n; ++i)
            {
                if (buffer[i] != 0)
                    last = buffer[i];
            }
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        break;
    }

    if (last != 0 && !shutdown_requested_.load())
    {
        requestShutdown("Signal received", last);
    }
    return shutdown_requested_.load();
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number)
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shutdown_requested_.load())
        {
            return;
        }
        last_signal_.store(signal_number);
        reason_ = reason;
        shutdown_requested_.store(true);
    }
    cv_.notify_all();
    wake();

    if (signal_number != 0)
    {
        Logger::info("ShutdownManager: received signal " + std::to_string(signal_number) + ", shutting down");
    }
    else
    {
        Logger::info("ShutdownManager: programmatic shutdown requested - " + reason);
    }
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    shutdown_requested_.store(false);
    last_signal_.store(0);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_.clear();
    }

    // Drop stale wake bytes
    if (pipe_read_ >= 0)
    {
        unsigned char buffer[64];
        while (::read(pipe_read_, buffer, sizeof(buffer)) > 0)
        {
        }
    }
}
