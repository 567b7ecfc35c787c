#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/shell_environment_reader.hpp"

// Lazily supplies the login shell's environment; launching the shell is expensive
using ShellEnvironmentProvider = std::function<const ShellEnvironment &()>;

/**
 * @brief Locates executables the way a terminal launcher needs to
 *
 * Search order: configured prepend entries, $PATH, ~/.local/bin, ~/bin,
 * configured "+dir" entries, the standard system directories and finally the
 * PATH exported by the user's shell. Configured "-dir" entries are skipped.
 */
class ExecutableFinder
{
public:
    explicit ExecutableFinder(std::vector<std::string> search_path = {},
                              ShellEnvironmentProvider shell_environment = nullptr);

    /**
     * @param name Executable name; names containing '/' are returned unchanged
     * @param only_system Skip the shell environment lookup
     */
    std::optional<std::string> find(const std::string &name, bool only_system = false) const;

    static std::optional<std::string> findInPath(const std::string &name, const std::vector<std::string> &directories);
    static std::vector<std::string> splitPath(const std::string &path);
    static const std::vector<std::string> &systemPaths();

private:
    std::vector<std::string> prepend_;
    std::vector<std::string> append_;
    std::vector<std::string> excluded_;
    ShellEnvironmentProvider shell_environment_;
};
