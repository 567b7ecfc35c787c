#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <string>

/**
 * Centralized shutdown manager.
 * - Installs async-signal-safe handlers for SIGINT/SIGTERM/SIGQUIT
 * - Signal handlers only write the signal number into a self-pipe
 * - wakeFd() becomes readable once shutdown is pending, for poll() loops
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    // Install signal handlers; creates the self-pipe on first use
    void installSignalHandlers();

    // Programmatically request shutdown (not from a signal handler)
    void requestShutdown(const std::string &reason, int signal_number = 0);

    // Consume pending signals from the self-pipe and turn them into a shutdown request
    bool processPendingSignals();

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    // Block until shutdown has been requested
    void waitForShutdown();

    // Read end of the self-pipe, -1 before installSignalHandlers()
    int wakeFd() const noexcept { return pipe_read_; }

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Reset state for testing purposes
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    static void handleSignal(int sig) noexcept;
    bool ensurePipe();
    void wake() noexcept;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    int pipe_read_ = -1;

    // Written from the signal handler
    static volatile sig_atomic_t pipe_write_;
};
