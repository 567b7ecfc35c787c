#include "core/executable_finder.hpp"
#include "core/path_utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <set>
#include <utility>

ExecutableFinder::ExecutableFinder(std::vector<std::string> search_path, ShellEnvironmentProvider shell_environment)
    : shell_environment_(std::move(shell_environment))
{
    for (const auto &raw : search_path)
    {
        auto begin = raw.find_first_not_of(" \t");
        if (begin == std::string::npos)
            continue;
        auto end = raw.find_last_not_of(" \t");
        std::string entry = raw.substr(begin, end - begin + 1);

        if (entry[0] == '-')
            excluded_.push_back(PathUtils::expandUser(entry.substr(1)));
        else if (entry[0] == '+')
            append_.push_back(PathUtils::expandUser(entry.substr(1)));
        else
            prepend_.push_back(PathUtils::expandUser(entry));
    }
}

const std::vector<std::string> &ExecutableFinder::systemPaths()
{
    static const std::vector<std::string> paths = {"/usr/local/bin", "/opt/bin", "/usr/bin", "/bin", "/usr/sbin", "/sbin"};
    return paths;
}

std::vector<std::string> ExecutableFinder::splitPath(const std::string &path)
{
    std::vector<std::string> dirs;
    size_t start = 0;
    while (start <= path.size())
    {
        auto colon = path.find(':', start);
        if (colon == std::string::npos)
            colon = path.size();
        if (colon > start)
            dirs.push_back(path.substr(start, colon - start));
        start = colon + 1;
    }
    return dirs;
}

std::optional<std::string> ExecutableFinder::findInPath(const std::string &name, const std::vector<std::string> &directories)
{
    for (const auto &dir : directories)
    {
        std::string candidate = PathUtils::joinPath(dir, name);
        if (PathUtils::isExecutableFile(candidate))
        {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ExecutableFinder::find(const std::string &name, bool only_system) const
{
    if (name.empty())
    {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos)
    {
        return name;
    }

    std::set<std::string> tried(excluded_.begin(), excluded_.end());
    auto untried = [&tried](const std::vector<std::string> &dirs)
    {
        std::vector<std::string> result;
        for (const auto &dir : dirs)
        {
            if (!tried.count(dir))
                result.push_back(dir);
        }
        return result;
    };

    std::vector<std::string> paths = prepend_;
    if (const char *env_path = std::getenv("PATH"))
    {
        auto dirs = splitPath(env_path);
        paths.insert(paths.end(), dirs.begin(), dirs.end());
    }
    paths.push_back(PathUtils::expandUser("~/.local/bin"));
    paths.push_back(PathUtils::expandUser("~/bin"));
    paths.insert(paths.end(), append_.begin(), append_.end());

    paths = untried(paths);
    if (auto found = findInPath(name, paths))
    {
        return found;
    }
    tried.insert(paths.begin(), paths.end());

    // In case PATH is broken try the standard locations
    auto system = untried(systemPaths());
    if (auto found = findInPath(name, system))
    {
        return found;
    }
    tried.insert(system.begin(), system.end());

    if (only_system || !shell_environment_)
    {
        return std::nullopt;
    }

    const ShellEnvironment &shell_env = shell_environment_();
    auto it = shell_env.find("PATH");
    if (it == shell_env.end())
    {
        return std::nullopt;
    }
    return findInPath(name, untried(splitPath(it->second)));
}
