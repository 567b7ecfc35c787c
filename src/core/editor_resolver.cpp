#include "core/editor_resolver.hpp"
#include "core/command_line.hpp"
#include "core/path_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

extern char **environ;

EditorResolver::EditorResolver(std::string editor_setting, const ExecutableFinder &finder,
                               ShellEnvironmentProvider shell_environment)
    : editor_setting_(std::move(editor_setting)), finder_(finder), shell_environment_(std::move(shell_environment))
{
}

ShellEnvironment EditorResolver::processEnvironment()
{
    ShellEnvironment env;
    for (char **entry = environ; entry && *entry; ++entry)
    {
        std::string line(*entry);
        auto eq = line.find('=');
        if (eq != std::string::npos)
        {
            env[line.substr(0, eq)] = line.substr(eq + 1);
        }
    }
    return env;
}

std::optional<std::string> EditorResolver::resolveEditorCommand(const std::string &editor, const ShellEnvironment &env,
                                                                bool is_process_env) const
{
    std::vector<std::string> editor_cmd;
    try
    {
        editor_cmd = CommandLine::split(editor);
    }
    catch (const CommandLineError &e)
    {
        Logger::warn("Ignoring unparseable editor command: " + std::string(e.what()));
        return std::nullopt;
    }

    if (editor_cmd.empty() || editor_cmd.front().empty())
    {
        return std::nullopt;
    }
    if (editor_cmd.front()[0] == '/')
    {
        return editor;
    }

    std::optional<std::string> exe;
    if (is_process_env)
    {
        exe = finder_.find(editor_cmd.front(), true);
    }
    else
    {
        auto path = env.find("PATH");
        if (path != env.end())
        {
            exe = ExecutableFinder::findInPath(editor_cmd.front(), ExecutableFinder::splitPath(path->second));
        }
    }

    if (!exe)
    {
        return std::nullopt;
    }
    editor_cmd.front() = *exe;
    return CommandLine::join(editor_cmd);
}

std::optional<std::string> EditorResolver::editorFromEnvironment(const ShellEnvironment &env, bool is_process_env) const
{
    for (const char *var : {"VISUAL", "EDITOR"})
    {
        auto it = env.find(var);
        if (it == env.end() || it->second.empty())
        {
            continue;
        }
        if (auto editor = resolveEditorCommand(it->second, env, is_process_env))
        {
            return editor;
        }
    }
    return std::nullopt;
}

std::vector<std::string> EditorResolver::editorFromEnvironmentVariables() const
{
    std::optional<std::string> editor = editorFromEnvironment(processEnvironment(), true);
    if (!editor && shell_environment_)
    {
        editor = editorFromEnvironment(shell_environment_(), false);
    }

    std::vector<std::string> candidates;
    if (editor)
    {
        candidates.push_back(*editor);
    }
    for (const char *fallback : {"vim", "nvim", "vi", "emacs", "kak", "micro", "nano", "vis"})
    {
        candidates.push_back(fallback);
    }

    for (const auto &candidate : candidates)
    {
        auto words = CommandLine::split(candidate);
        if (!words.empty() && finder_.find(words.front(), true))
        {
            return words;
        }
    }
    return {"vim"};
}

std::vector<std::string> EditorResolver::getEditor(const std::string &path_to_edit, int line_number) const
{
    std::vector<std::string> ans;
    if (editor_setting_ != ".")
    {
        try
        {
            ans = CommandLine::split(editor_setting_);
        }
        catch (const CommandLineError &e)
        {
            Logger::error("Invalid editor setting: " + std::string(e.what()));
        }
    }
    if (ans.empty())
    {
        ans = editorFromEnvironmentVariables();
    }

    ans.front() = PathUtils::expandUser(ans.front());
    if (!path_to_edit.empty())
    {
        std::string path = path_to_edit;
        if (line_number > 0)
        {
            std::string exe = PathUtils::baseName(ans.front());
            std::transform(exe.begin(), exe.end(), exe.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            if (exe == "code" || exe == "code.exe")
            {
                path += ":" + std::to_string(line_number);
                ans.push_back("--goto");
            }
            else
            {
                ans.push_back("+" + std::to_string(line_number));
            }
        }
        ans.push_back(path);
    }
    return ans;
}
