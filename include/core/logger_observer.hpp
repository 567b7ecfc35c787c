#pragma once

#include "config_observer.hpp"
#include <string>

/**
 * @brief Observer that applies log level configuration changes to the Logger
 */
class LoggerObserver : public ConfigObserver
{
public:
    LoggerObserver() = default;
    ~LoggerObserver() override = default;

    void onConfigUpdate(const ConfigUpdateEvent &event) override;

    // Last level applied by this observer, empty until the first change
    const std::string &appliedLevel() const { return applied_level_; }

private:
    bool hasLogLevelChange(const ConfigUpdateEvent &event) const;

    std::string applied_level_;
};
