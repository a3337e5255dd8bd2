#pragma once

#include "transport/transport.hpp"
#include "common/tool_config.hpp"
#include <string>

// Runs one vendor shell command (racadm) on the BMC over SSH
class RemoteShellTransport : public Transport {
public:
    explicit RemoteShellTransport(const ToolConfig& config);

    TransportType type() const override { return TransportType::RemoteShell; }
    bool execute(const Target& target, const TransportPayload& payload,
                 TransportResponse& response) override;
    std::string getLastError() const override { return lastError_; }
    ErrorKind getLastErrorKind() const override { return lastErrorKind_; }

private:
    void fail(ErrorKind kind, const std::string& message);

    std::string username_;
    std::string password_;
    unsigned int port_;
    long connectTimeoutSec_;
    int readTimeoutSec_;
    std::string lastError_;
    ErrorKind lastErrorKind_;
};
