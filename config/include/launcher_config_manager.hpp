#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config_observer.hpp"

class LauncherConfigManager
{
public:
    static LauncherConfigManager &getInstance()
    {
        static LauncherConfigManager instance;
        return instance;
    }

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch, const std::string &source = "api");
    nlohmann::json getAll() const;

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;
    std::vector<std::string> getStringList(const std::string &key) const;

    // Application getters
    std::string getAppName() const;
    std::string getLogLevel() const;
    std::string getShell() const;
    std::string getEditor() const;
    std::vector<std::string> getExeSearchPath() const;

    // Shell environment getters
    std::chrono::milliseconds getShellEnvironmentTimeout() const;
    std::chrono::milliseconds getShellEnvironmentPollInterval() const;

    // Single instance getters
    std::string getGroupId() const;
    bool getUseAbstractNamespace() const;
    std::vector<std::string> getSocketDirectories() const;

    // Configuration validation
    bool validateConfig() const;

    // Observer management
    void subscribe(ConfigObserver *observer);
    void unsubscribe(ConfigObserver *observer);

    // Utility methods
    void initializeDefaultConfig();
    bool hasKey(const std::string &key) const;

private:
    LauncherConfigManager();
    ~LauncherConfigManager() = default;
    LauncherConfigManager(const LauncherConfigManager &) = delete;
    LauncherConfigManager &operator=(const LauncherConfigManager &) = delete;

    nlohmann::json getNode(const std::string &key) const;
    void publishEvent(const ConfigUpdateEvent &event);
    std::string generateUpdateId() const;

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;

    std::mutex observers_mutex_;
    std::vector<ConfigObserver *> observers_;
};

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter);
