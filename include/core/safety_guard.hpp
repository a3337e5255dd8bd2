#pragma once

#include "core/fleet_notifier.hpp"
#include <cstddef>
#include <memory>
#include <string>

// Confirmation tokens for destructive operations and the follow-up
// fleet-status notification
class SafetyGuard {
public:
    static constexpr size_t kTokenLength = 10;

    explicit SafetyGuard(std::shared_ptr<FleetNotifier> notifier);

    // First kTokenLength hex digits of SHA-256(hostname). Throws std::runtime_error
    // if the digest cannot be computed.
    static std::string confirmationToken(const std::string& hostname);

    bool verifyConfirmation(const std::string& hostname, const std::string& supplied) const;

    // Best effort: failures are logged, never returned
    void notifyOffline(const std::string& hostname, const std::string& reason);

private:
    std::shared_ptr<FleetNotifier> notifier_;
};
