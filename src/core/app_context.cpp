#include "core/app_context.hpp"
#include "core/command_line.hpp"
#include "launcher_config_manager.hpp"
#include "logging/logger.hpp"

namespace
{
    SingleInstanceOptions instanceOptions(const LauncherConfigManager &config)
    {
        SingleInstanceOptions options;
        options.app_name = config.getAppName();
        options.use_abstract_namespace = config.getUseAbstractNamespace();
        options.socket_directories = config.getSocketDirectories();
        return options;
    }

    ShellEnvironmentOptions shellOptions(const LauncherConfigManager &config)
    {
        ShellEnvironmentOptions options;
        options.timeout = config.getShellEnvironmentTimeout();
        options.poll_interval = config.getShellEnvironmentPollInterval();
        return options;
    }
} // namespace

AppContext::AppContext(const LauncherConfigManager &config)
    : coordinator_(instanceOptions(config)),
      shell_(ShellResolver::resolve(config.getShell())),
      shell_reader_(shellOptions(config)),
      finder_(config.getExeSearchPath(), [this]() -> const ShellEnvironment &
              { return shellEnvironment(); }),
      editor_(config.getEditor(), finder_, [this]() -> const ShellEnvironment &
              { return shellEnvironment(); })
{
}

InstanceRole AppContext::singleInstance(const std::string &group_id)
{
    std::call_once(instance_once_, [this, &group_id]()
                   {
        instance_.emplace(coordinator_.acquireOrConnect(group_id));
        Logger::info("Running as " + InstanceRoles::getRoleName(instance_->role()) + " instance of " +
                     coordinator_.canonicalName(group_id)); });
    return instance_->role();
}

InstanceHandle *AppContext::instanceHandle()
{
    return instance_ ? &*instance_ : nullptr;
}

const ShellEnvironment &AppContext::shellEnvironment()
{
    return shell_reader_.read(shell_);
}
