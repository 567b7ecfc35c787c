#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

using ShellEnvironment = std::map<std::string, std::string>;

struct ShellEnvironmentOptions
{
    std::chrono::milliseconds timeout{1500};
    std::chrono::milliseconds poll_interval{10};
};

/**
 * @brief Reads the environment exported by the user's interactive login shell
 *
 * The shell runs on a pseudo-terminal as `<shell> -l -i -c env`. The first
 * call to read() launches it; every later call returns the same cached map,
 * including the empty map produced when the shell could not be run, failed
 * or timed out.
 */
class ShellEnvironmentReader
{
public:
    explicit ShellEnvironmentReader(ShellEnvironmentOptions options = ShellEnvironmentOptions());

    ShellEnvironmentReader(const ShellEnvironmentReader &) = delete;
    ShellEnvironmentReader &operator=(const ShellEnvironmentReader &) = delete;

    /**
     * @brief Environment of the shell, computed at most once per reader
     * @param shell Shell argument vector, e.g. {"/bin/zsh"}
     * @return Reference to the cached mapping, empty when the shell failed
     */
    const ShellEnvironment &read(const std::vector<std::string> &shell);

    // Append -l and -i unless a short or long form is already present
    static std::vector<std::string> withLoginFlags(std::vector<std::string> shell);

    // Parse `env` output: KEY=VALUE per line, both sides non-empty
    static ShellEnvironment parseEnvironment(const std::string &raw);

    const ShellEnvironmentOptions &options() const { return options_; }

private:
    ShellEnvironment readFromShell(const std::vector<std::string> &shell) const;

    ShellEnvironmentOptions options_;
    std::once_flag once_;
    ShellEnvironment cache_;
};
