#pragma once

#include <string>
#include <vector>

/**
 * @brief Small filesystem helpers shared by the launcher components
 */
class PathUtils
{
public:
    // $HOME, falling back to the password database entry of the effective user
    static std::string homeDirectory();

    // TMPDIR-aware temporary directory, "/tmp" when it cannot be determined
    static std::string tempDirectory();

    // Replace a leading "~" or "~/" with the home directory
    static std::string expandUser(const std::string &path);

    static std::string joinPath(const std::string &directory, const std::string &name);

    // True when the current process may read, write and search the directory
    static bool isAccessibleDirectory(const std::string &path);

    // True for regular files the current process may execute
    static bool isExecutableFile(const std::string &path);

    static std::string baseName(const std::string &path);
};
