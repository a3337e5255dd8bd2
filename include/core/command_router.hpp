#pragma once

#include "core/execution_result.hpp"
#include "core/operation.hpp"
#include "core/safety_guard.hpp"
#include "inventory/inventory_resolver.hpp"
#include "transport/transport.hpp"
#include <memory>
#include <string>

// Maps an Operation on a hostname to a transport call. Validation, manufacturer
// gating and confirmation all happen before a transport is touched; the router
// itself never retries.
class CommandRouter {
public:
    CommandRouter(std::shared_ptr<InventoryResolver> resolver,
                  std::shared_ptr<SafetyGuard> guard,
                  TransportSet transports);

    ExecutionResult execute(const std::string& hostname, const Operation& operation);

    // Manufacturer gates per vendor-specific operation
    static bool supportsRacadm(Manufacturer manufacturer);
    static bool supportsNvmeStatus(Manufacturer manufacturer);
    static bool supportsNvmeLocate(Manufacturer manufacturer);

    static std::string racadmLocateCommand(const std::string& slot, bool blink);
    static std::string nvmeStatusResource(Manufacturer manufacturer);
    static std::string nvmeLocateResource(bool blink);

private:
    bool resolveTarget(const std::string& hostname, Target& target, ExecutionResult& failure);

    ExecutionResult runCli(const Target& target, const std::string& command);
    ExecutionResult runReadOnly(const std::string& hostname, const std::string& command);
    ExecutionResult runBootMode(const std::string& hostname, const Operation& operation);
    ExecutionResult runDestructive(const std::string& hostname, const Operation& operation);
    ExecutionResult runDriveStatus(const std::string& hostname);
    ExecutionResult runDriveLocate(const std::string& hostname, const Operation& operation);
    ExecutionResult runNvmeStatus(const std::string& hostname);
    ExecutionResult runNvmeLocate(const std::string& hostname, const Operation& operation);

    static ExecutionResult transportFailure(const Transport& transport);
    static bool parseLocateArguments(const std::string& hostname, const Operation& operation,
                                     bool& blink, ExecutionResult& failure);

    std::shared_ptr<InventoryResolver> resolver_;
    std::shared_ptr<SafetyGuard> guard_;
    TransportSet transports_;
};
