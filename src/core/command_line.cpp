#include "core/command_line.hpp"
#include "logging/logger.hpp"
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

std::vector<std::string> CommandLine::split(const std::string &text)
{
    enum class State
    {
        NORMAL,
        SINGLE_QUOTED,
        DOUBLE_QUOTED
    };

    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    State state = State::NORMAL;

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        switch (state)
        {
        case State::NORMAL:
            if (c == ' ' || c == '\t' || c == '\n')
            {
                if (in_word)
                {
                    words.push_back(current);
                    current.clear();
                    in_word = false;
                }
            }
            else if (c == '\'')
            {
                state = State::SINGLE_QUOTED;
                in_word = true;
            }
            else if (c == '"')
            {
                state = State::DOUBLE_QUOTED;
                in_word = true;
            }
            else if (c == '\\')
            {
                if (i + 1 >= text.size())
                    throw CommandLineError("Trailing backslash in: " + text);
                ++i;
                // Escaped newline is a line continuation
                if (text[i] != '\n')
                    current += text[i];
                in_word = true;
            }
            else
            {
                current += c;
                in_word = true;
            }
            break;

        case State::SINGLE_QUOTED:
            if (c == '\'')
                state = State::NORMAL;
            else
                current += c;
            break;

        case State::DOUBLE_QUOTED:
            if (c == '"')
            {
                state = State::NORMAL;
            }
            else if (c == '\\' && i + 1 < text.size() &&
                     (text[i + 1] == '$' || text[i + 1] == '`' || text[i + 1] == '"' ||
                      text[i + 1] == '\\' || text[i + 1] == '\n'))
            {
                ++i;
                if (text[i] != '\n')
                    current += text[i];
            }
            else
            {
                current += c;
            }
            break;
        }
    }

    if (state != State::NORMAL)
    {
        throw CommandLineError("Unterminated quote in: " + text);
    }
    if (in_word)
    {
        words.push_back(current);
    }
    return words;
}

std::string CommandLine::quote(const std::string &word)
{
    if (word.empty())
    {
        return "''";
    }

    static const std::string safe =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789@%+=:,./-_";
    if (word.find_first_not_of(safe) == std::string::npos)
    {
        return word;
    }

    std::string quoted = "'";
    for (char c : word)
    {
        if (c == '\'')
            quoted += "'\"'\"'";
        else
            quoted += c;
    }
    quoted += "'";
    return quoted;
}

std::string CommandLine::join(const std::vector<std::string> &words)
{
    std::string joined;
    for (const auto &word : words)
    {
        if (!joined.empty())
            joined += ' ';
        joined += quote(word);
    }
    return joined;
}

std::vector<std::string> ShellResolver::resolve(const std::string &setting)
{
    if (setting.empty() || setting == ".")
    {
        return {loginShell()};
    }

    try
    {
        auto words = CommandLine::split(setting);
        if (!words.empty())
        {
            return words;
        }
    }
    catch (const CommandLineError &e)
    {
        Logger::error("Invalid shell setting, using the login shell instead: " + std::string(e.what()));
    }
    return {loginShell()};
}

std::string ShellResolver::loginShell()
{
    const char *shell = std::getenv("SHELL");
    if (shell && *shell)
    {
        return shell;
    }

    struct passwd *pw = ::getpwuid(::geteuid());
    if (pw && pw->pw_shell && *pw->pw_shell)
    {
        return pw->pw_shell;
    }
    return "/bin/sh";
}
