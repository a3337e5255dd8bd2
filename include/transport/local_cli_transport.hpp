#pragma once

#include "transport/transport.hpp"
#include "transport/process_runner.hpp"
#include "common/tool_config.hpp"
#include <memory>
#include <string>

// Runs ipmitool locally against the target's BMC
class LocalCliTransport : public Transport {
public:
    static constexpr const char* kSessionFailureMarker = "Unable to establish";
    static constexpr const char* kDiagnosticCommand = "chassis power status";

    LocalCliTransport(const ToolConfig& config, std::shared_ptr<ProcessRunner> runner);

    TransportType type() const override { return TransportType::LocalCli; }
    bool execute(const Target& target, const TransportPayload& payload,
                 TransportResponse& response) override;
    std::string getLastError() const override { return lastError_; }
    ErrorKind getLastErrorKind() const override { return lastErrorKind_; }

    std::string buildPingCommand(const std::string& address) const;
    std::string buildIpmiCommand(const std::string& address, const std::string& command,
                                 bool verbose) const;
    ProcessEnvironment ipmiEnvironment() const;

    static bool hasAuthenticationSignature(const std::string& verboseOutput);

private:
    bool isReachable(const std::string& address, std::string& detail);

    std::string ipmitoolPath_;
    std::string interface_;
    std::string username_;
    std::string password_;
    int probeTimeoutSec_;
    int softTimeoutSec_;
    int killGraceSec_;
    std::shared_ptr<ProcessRunner> runner_;
    std::string lastError_;
    ErrorKind lastErrorKind_;
};
