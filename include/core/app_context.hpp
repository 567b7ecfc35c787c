#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/editor_resolver.hpp"
#include "core/executable_finder.hpp"
#include "core/shell_environment_reader.hpp"
#include "core/single_instance_coordinator.hpp"

class LauncherConfigManager;

/**
 * @brief Owner of the once-per-process launcher state
 *
 * Holds the single-instance decision and the shell environment cache so
 * callers receive them through this object instead of globals. Both are
 * computed by the first caller; later callers get the same result. The
 * instance handle is released when the context is destroyed.
 */
class AppContext
{
public:
    explicit AppContext(const LauncherConfigManager &config);

    AppContext(const AppContext &) = delete;
    AppContext &operator=(const AppContext &) = delete;

    /**
     * @brief Decide this process's role, once
     * @param group_id Group suffix; only the first call's value is used
     * @throws SingleInstanceError when coordination fails (a later call retries)
     */
    InstanceRole singleInstance(const std::string &group_id = "");

    // Handle from singleInstance(), nullptr before the decision
    InstanceHandle *instanceHandle();

    const ShellEnvironment &shellEnvironment();

    const std::vector<std::string> &shell() const { return shell_; }
    const SingleInstanceCoordinator &coordinator() const { return coordinator_; }
    const ExecutableFinder &executableFinder() const { return finder_; }
    const EditorResolver &editorResolver() const { return editor_; }

private:
    SingleInstanceCoordinator coordinator_;
    std::once_flag instance_once_;
    std::optional<InstanceHandle> instance_;

    std::vector<std::string> shell_;
    ShellEnvironmentReader shell_reader_;
    ExecutableFinder finder_;
    EditorResolver editor_;
};
