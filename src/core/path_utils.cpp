#include "core/path_utils.hpp"
#include <cstdlib>
#include <filesystem>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

std::string PathUtils::homeDirectory()
{
    const char *home = std::getenv("HOME");
    if (home && *home)
    {
        return home;
    }

    struct passwd *pw = ::getpwuid(::geteuid());
    if (pw && pw->pw_dir)
    {
        return pw->pw_dir;
    }
    return "/";
}

std::string PathUtils::tempDirectory()
{
    std::error_code ec;
    auto path = std::filesystem::temp_directory_path(ec);
    if (ec || path.empty())
    {
        return "/tmp";
    }

    std::string result = path.string();
    while (result.size() > 1 && result.back() == '/')
    {
        result.pop_back();
    }
    return result;
}

std::string PathUtils::expandUser(const std::string &path)
{
    if (path == "~")
    {
        return homeDirectory();
    }
    if (path.rfind("~/", 0) == 0)
    {
        return joinPath(homeDirectory(), path.substr(2));
    }
    return path;
}

std::string PathUtils::joinPath(const std::string &directory, const std::string &name)
{
    if (directory.empty())
        return name;
    if (directory.back() == '/')
        return directory + name;
    return directory + "/" + name;
}

bool PathUtils::isAccessibleDirectory(const std::string &path)
{
    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode))
    {
        return false;
    }
    return ::access(path.c_str(), R_OK | W_OK | X_OK) == 0;
}

bool PathUtils::isExecutableFile(const std::string &path)
{
    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

std::string PathUtils::baseName(const std::string &path)
{
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}
