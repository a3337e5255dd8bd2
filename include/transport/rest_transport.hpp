#pragma once

#include "transport/transport.hpp"
#include "common/tool_config.hpp"
#include "common/http_client.hpp"
#include <string>

// One Redfish GET or POST per call, bracketed by session login/logout
class RestTransport : public Transport {
public:
    explicit RestTransport(const ToolConfig& config,
                           HttpClientFactory httpFactory = CurlHttpClient::factory());

    TransportType type() const override { return TransportType::Rest; }
    bool execute(const Target& target, const TransportPayload& payload,
                 TransportResponse& response) override;
    std::string getLastError() const override { return lastError_; }
    ErrorKind getLastErrorKind() const override { return lastErrorKind_; }

private:
    std::string username_;
    std::string password_;
    long connectTimeoutSec_;
    long requestTimeoutSec_;
    bool verifyTls_;
    HttpClientFactory httpFactory_;
    std::string lastError_;
    ErrorKind lastErrorKind_;
};
