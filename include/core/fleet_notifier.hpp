#pragma once

#include "common/tool_config.hpp"
#include <string>

// Fleet-status service: records that a host is going offline and why
class FleetNotifier {
public:
    virtual ~FleetNotifier() = default;

    virtual bool setOffline(const std::string& hostId, const std::string& reason) = 0;
    virtual std::string getLastError() const = 0;
};

// POST <notifier_url> {"host": ..., "state": "offline", "reason": ...}
class RestFleetNotifier : public FleetNotifier {
public:
    explicit RestFleetNotifier(const ToolConfig& config);

    bool setOffline(const std::string& hostId, const std::string& reason) override;
    std::string getLastError() const override { return lastError_; }

private:
    std::string url_;
    std::string token_;
    long connectTimeoutSec_;
    long requestTimeoutSec_;
    std::string lastError_;
};
