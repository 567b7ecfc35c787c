#pragma once

#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Thrown when a command line has an unterminated quote or escape
 */
class CommandLineError : public std::runtime_error
{
public:
    explicit CommandLineError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief POSIX shell word splitting and quoting for configured command lines
 */
class CommandLine
{
public:
    /**
     * @brief Split text into words the way a POSIX shell would, without expansions
     *
     * Single quotes are literal, double quotes honour backslash before
     * $ ` " \ and newline, an unquoted backslash escapes the next character.
     * @throws CommandLineError on unterminated quotes or a trailing backslash
     */
    static std::vector<std::string> split(const std::string &text);

    // Quote one word so split() returns it unchanged
    static std::string quote(const std::string &word);

    static std::string join(const std::vector<std::string> &words);
};

/**
 * @brief Turns the configured shell setting into an argument vector
 */
class ShellResolver
{
public:
    // "." selects the login shell, anything else is split as a command line
    static std::vector<std::string> resolve(const std::string &setting);

    // $SHELL, then the password database entry, then /bin/sh
    static std::string loginShell();
};
