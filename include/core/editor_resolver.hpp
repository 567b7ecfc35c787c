#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/executable_finder.hpp"

/**
 * @brief Works out which editor command to launch for a file
 */
class EditorResolver
{
public:
    /**
     * @param editor_setting Configured editor command line, "." to consult VISUAL/EDITOR
     * @param finder Lookup used for bare executable names
     * @param shell_environment Provider of the login shell's environment
     */
    EditorResolver(std::string editor_setting, const ExecutableFinder &finder,
                   ShellEnvironmentProvider shell_environment = nullptr);

    /**
     * @brief Make the executable of an editor command absolute
     * @param editor Editor command line, e.g. "vim -u NONE"
     * @param env Environment the command came from
     * @param is_process_env True when env is this process's own environment
     * @return Command line with an absolute executable, nullopt when not found
     */
    std::optional<std::string> resolveEditorCommand(const std::string &editor, const ShellEnvironment &env,
                                                    bool is_process_env) const;

    // First resolvable of VISUAL, EDITOR
    std::optional<std::string> editorFromEnvironment(const ShellEnvironment &env, bool is_process_env) const;

    // VISUAL/EDITOR from this process, then from the shell, then well known editors; "vim" as last resort
    std::vector<std::string> editorFromEnvironmentVariables() const;

    // Full command line to edit a path, optionally at a line
    std::vector<std::string> getEditor(const std::string &path_to_edit = "", int line_number = 0) const;

    static ShellEnvironment processEnvironment();

private:
    std::string editor_setting_;
    const ExecutableFinder &finder_;
    ShellEnvironmentProvider shell_environment_;
};
