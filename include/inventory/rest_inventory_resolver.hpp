#pragma once

#include "inventory/inventory_resolver.hpp"
#include "common/tool_config.hpp"
#include <string>

// Queries the fleet inventory service over HTTP:
//   GET <inventory_url>?name=<hostname>
// Response: {"results": [{"management_address": ..., "manufacturer": ...}]}
class RestInventoryResolver : public InventoryResolver {
public:
    explicit RestInventoryResolver(const ToolConfig& config);

    bool resolve(const std::string& hostname, Target& target) override;
    std::string getLastError() const override { return lastError_; }
    ErrorKind getLastErrorKind() const override { return lastErrorKind_; }

private:
    std::string baseUrl_;
    std::string token_;
    long connectTimeoutSec_;
    long requestTimeoutSec_;
    std::string lastError_;
    ErrorKind lastErrorKind_;
};
