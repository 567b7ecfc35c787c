#include "core/app_context.hpp"
#include "core/command_line.hpp"
#include "core/instance_message.hpp"
#include "core/logger_observer.hpp"
#include "core/shutdown_manager.hpp"
#include "core/single_instance_coordinator.hpp"
#include "launcher_config_manager.hpp"
#include "logging/logger.hpp"
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <string>
#include <unistd.h>
#include <vector>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "term-launcher - single instance launcher for the terminal" << std::endl;
        std::cout << "Usage: " << program << " [options] [--] [args...]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c PATH         Load configuration from a JSON file" << std::endl;
        std::cout << "  --group, -g ID            Share an instance only with the same group id" << std::endl;
        std::cout << "  --print-shell-env         Print the login shell's environment and exit" << std::endl;
        std::cout << "  --print-editor [FILE[:LINE]]  Print the editor command line and exit" << std::endl;
        std::cout << "  --help, -h                Show this help message" << std::endl;
    }

    std::string currentDirectory()
    {
        std::vector<char> buffer(4096);
        if (::getcwd(buffer.data(), buffer.size()) == nullptr)
        {
            Logger::warn("Could not determine working directory: " + std::string(std::strerror(errno)));
            return "";
        }
        return buffer.data();
    }

    // "file:42" -> ("file", 42); anything without a numeric suffix is a plain path
    std::pair<std::string, int> parseEditTarget(const std::string &target)
    {
        auto colon = target.rfind(':');
        if (colon == std::string::npos || colon + 1 == target.size())
        {
            return {target, 0};
        }
        std::string suffix = target.substr(colon + 1);
        if (suffix.size() > 9)
        {
            return {target, 0};
        }
        for (char c : suffix)
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
                return {target, 0};
        }
        return {target.substr(0, colon), std::stoi(suffix)};
    }

    void handleInstanceMessage(const InstanceMessage &message)
    {
        Logger::info("Request '" + message.cmd + "' from pid " + std::to_string(message.pid) + " in " +
                     (message.cwd.empty() ? "<unknown>" : message.cwd) + ": " + CommandLine::join(message.args));
    }

    int serve(InstanceHandle &handle)
    {
        auto &shutdown = ShutdownManager::getInstance();
        Logger::info("Waiting for other instances (PID: " + std::to_string(::getpid()) + ")");

        while (!shutdown.processPendingSignals())
        {
            struct pollfd fds[2] = {{handle.socketFd(), POLLIN, 0}, {shutdown.wakeFd(), POLLIN, 0}};
            int ready = ::poll(fds, 2, -1);
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                Logger::error("poll() failed in server loop: " + std::string(std::strerror(errno)));
                return 1;
            }
            if (fds[0].revents & POLLIN)
            {
                if (auto message = handle.acceptMessage(std::chrono::milliseconds(1000)))
                {
                    handleInstanceMessage(*message);
                }
            }
        }

        Logger::info("Shutting down: " + shutdown.getReason());
        return 0;
    }
} // namespace

int main(int argc, char *argv[])
{
    std::string config_path;
    std::string group_id;
    bool print_shell_env = false;
    bool print_editor = false;
    std::string edit_target;
    std::vector<std::string> forward_args;
    bool forwarding = false;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (forwarding)
        {
            forward_args.push_back(arg);
        }
        else if (arg == "--")
        {
            forwarding = true;
        }
        else if ((arg == "--config" || arg == "-c") && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if ((arg == "--group" || arg == "-g") && i + 1 < argc)
        {
            group_id = argv[++i];
        }
        else if (arg == "--print-shell-env")
        {
            print_shell_env = true;
        }
        else if (arg == "--print-editor")
        {
            print_editor = true;
            if (i + 1 < argc && argv[i + 1][0] != '-')
                edit_target = argv[++i];
        }
        else if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else
        {
            forward_args.push_back(arg);
        }
    }

    Logger::init();
    auto &config = LauncherConfigManager::getInstance();
    if (!config_path.empty() && !config.load(config_path))
    {
        Logger::error("Failed to load configuration from " + config_path);
        return 1;
    }
    if (!config.validateConfig())
    {
        return 1;
    }
    Logger::init(config.getLogLevel());

    LoggerObserver logger_observer;
    config.subscribe(&logger_observer);
    if (group_id.empty())
    {
        group_id = config.getGroupId();
    }

    ShutdownManager::getInstance().installSignalHandlers();
    AppContext context(config);

    InstanceRole role;
    try
    {
        role = context.singleInstance(group_id);
    }
    catch (const SingleInstanceError &e)
    {
        Logger::error("Single instance coordination failed: " + std::string(e.what()));
        config.unsubscribe(&logger_observer);
        return 1;
    }

    int exit_code = 0;
    if (role == InstanceRole::CLIENT)
    {
        InstanceMessage message;
        message.args = forward_args;
        message.cwd = currentDirectory();
        message.group_id = group_id;
        message.pid = static_cast<int>(::getpid());
        if (context.instanceHandle()->sendMessage(message))
        {
            Logger::info("Forwarded request to the running instance");
        }
        else
        {
            exit_code = 1;
        }
    }
    else if (print_shell_env || print_editor)
    {
        if (print_shell_env)
        {
            for (const auto &entry : context.shellEnvironment())
            {
                std::cout << entry.first << "=" << entry.second << std::endl;
            }
        }
        if (print_editor)
        {
            auto target = parseEditTarget(edit_target);
            std::cout << CommandLine::join(context.editorResolver().getEditor(target.first, target.second)) << std::endl;
        }
    }
    else
    {
        exit_code = serve(*context.instanceHandle());
    }

    config.unsubscribe(&logger_observer);
    return exit_code;
}
