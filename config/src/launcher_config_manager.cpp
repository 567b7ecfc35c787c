#include "launcher_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <algorithm>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

LauncherConfigManager::LauncherConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool LauncherConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse configuration " + path + ": " + e.displayText());
        return false;
    }
    return true;
}

bool LauncherConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json LauncherConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void LauncherConfigManager::update(const nlohmann::json &patch, const std::string &source)
{
    ConfigUpdateEvent event;
    event.source = source;
    event.update_id = generateUpdateId();

    std::function<void(const std::string &, const nlohmann::json &)> collect;
    collect = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                collect(prefix.empty() ? it.key() : (prefix + "." + it.key()), it.value());
            }
        }
        else if (!prefix.empty())
        {
            event.changed_keys.push_back(prefix);
        }
    };
    collect("", patch);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Arrays cannot be assigned through the flat setters, merge whole documents instead
        std::stringstream current;
        cfg_->save(current);
        auto merged = nlohmann::json::parse(current.str());
        merged.merge_patch(patch);

        std::istringstream in(merged.dump());
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
    }

    if (!event.changed_keys.empty())
    {
        publishEvent(event);
    }
}

// Basic configuration getters
std::string LauncherConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int LauncherConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

bool LauncherConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

std::vector<std::string> LauncherConfigManager::getStringList(const std::string &key) const
{
    std::vector<std::string> values;
    auto node = getNode(key);
    if (node.is_string())
    {
        // A single entry, or an array that was stored in serialized form
        auto text = node.get<std::string>();
        auto parsed = nlohmann::json::parse(text, nullptr, false);
        if (parsed.is_array())
            node = parsed;
        else
            return {text};
    }
    if (!node.is_array())
        return values;

    for (const auto &item : node)
    {
        if (item.is_string())
            values.push_back(item.get<std::string>());
    }
    return values;
}

// Application getters
std::string LauncherConfigManager::getAppName() const
{
    return getString("app_name", "term-launcher");
}

std::string LauncherConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string LauncherConfigManager::getShell() const
{
    return getString("shell", ".");
}

std::string LauncherConfigManager::getEditor() const
{
    return getString("editor", ".");
}

std::vector<std::string> LauncherConfigManager::getExeSearchPath() const
{
    return getStringList("exe_search_path");
}

// Shell environment getters
std::chrono::milliseconds LauncherConfigManager::getShellEnvironmentTimeout() const
{
    return std::chrono::milliseconds(getInt("shell_environment.timeout_ms", 1500));
}

std::chrono::milliseconds LauncherConfigManager::getShellEnvironmentPollInterval() const
{
    return std::chrono::milliseconds(getInt("shell_environment.poll_interval_ms", 10));
}

// Single instance getters
std::string LauncherConfigManager::getGroupId() const
{
    return getString("single_instance.group_id", "");
}

bool LauncherConfigManager::getUseAbstractNamespace() const
{
    return getBool("single_instance.use_abstract_namespace", true);
}

std::vector<std::string> LauncherConfigManager::getSocketDirectories() const
{
    return getStringList("single_instance.socket_directories");
}

// Configuration validation
bool LauncherConfigManager::validateConfig() const
{
    std::string app_name = getAppName();
    if (app_name.empty() || app_name.find('/') != std::string::npos)
    {
        Logger::error("Invalid app name: '" + app_name + "'");
        return false;
    }

    std::string log_level = getLogLevel();
    if (!Logger::isValidLevel(log_level))
    {
        Logger::error("Invalid log level: " + log_level);
        return false;
    }

    auto timeout = getShellEnvironmentTimeout();
    if (timeout.count() <= 0)
    {
        Logger::error("Invalid shell environment timeout: " + std::to_string(timeout.count()) + "ms");
        return false;
    }

    auto poll_interval = getShellEnvironmentPollInterval();
    if (poll_interval.count() <= 0 || poll_interval > timeout)
    {
        Logger::error("Invalid shell environment poll interval: " + std::to_string(poll_interval.count()) + "ms");
        return false;
    }

    if (getShell().empty())
    {
        Logger::error("Shell must not be empty, use '.' for the login shell");
        return false;
    }

    return true;
}

void LauncherConfigManager::subscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.push_back(observer);
    Logger::debug("Configuration observer subscribed");
}

void LauncherConfigManager::unsubscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(
        std::remove(observers_.begin(), observers_.end(), observer),
        observers_.end());
    Logger::debug("Configuration observer unsubscribed");
}

// Utility methods
void LauncherConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);

    cfg_->setString("app_name", "term-launcher");
    cfg_->setString("log_level", "INFO");
    cfg_->setString("shell", ".");
    cfg_->setString("editor", ".");

    // Shell environment defaults
    cfg_->setInt("shell_environment.timeout_ms", 1500);
    cfg_->setInt("shell_environment.poll_interval_ms", 10);

    // Single instance defaults
    cfg_->setString("single_instance.group_id", "");
    cfg_->setBool("single_instance.use_abstract_namespace", true);
}

bool LauncherConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}

nlohmann::json LauncherConfigManager::getNode(const std::string &key) const
{
    auto current = getAll();
    for (const auto &part : split(key, '.'))
    {
        if (!current.is_object() || !current.contains(part))
        {
            return nlohmann::json();
        }
        current = current[part];
    }
    return current;
}

void LauncherConfigManager::publishEvent(const ConfigUpdateEvent &event)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);

    Logger::info("Publishing config update event from " + event.source + " with " +
                 std::to_string(event.changed_keys.size()) + " changes");

    for (auto observer : observers_)
    {
        try
        {
            observer->onConfigUpdate(event);
        }
        catch (const std::exception &e)
        {
            Logger::error("Configuration observer failed on " + event.update_id + ": " + e.what());
        }
    }
}

std::string LauncherConfigManager::generateUpdateId() const
{
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return "update_" + std::to_string(millis);
}

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter))
    {
        tokens.push_back(token);
    }

    return tokens;
}
