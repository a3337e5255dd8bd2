#pragma once

#include <string>
#include <functional>
#include "common/logger.hpp"

// Returns nullptr when the variable is unset
using EnvLookup = std::function<const char*(const char*)>;

// Settings shared by every transport and collaborator client
struct ToolConfig {
    // Credentials
    std::string ipmiPassword;          // IPMI_PASSWORD, used by all three transports
    std::string ipmiUsername{"root"};
    std::string sshUsername{"root"};
    std::string redfishUsername{"root"};

    // Local CLI transport
    std::string ipmitoolPath{"ipmitool"};
    std::string ipmiInterface{"lanplus"};  // protocol-version flag passed with -I
    int probeTimeoutSec{1};                // per ping echo
    int cliSoftTimeoutSec{30};             // SIGTERM after this
    int cliKillGraceSec{5};                // SIGKILL this long after SIGTERM

    // Remote shell and REST transports
    int sshPort{22};
    int connectTimeoutSec{10};
    int requestTimeoutSec{60};
    bool verifyTls{false};  // BMCs ship self-signed certificates

    // Collaborators
    std::string inventoryUrl;
    std::string inventoryToken;
    std::string notifierUrl;
    std::string notifierToken;

    // Logging
    std::string logPath{"/tmp/oobctl.log"};
    LogLevel logLevel{LogLevel::INFO};
};

class ToolConfigLoader {
public:
    explicit ToolConfigLoader(EnvLookup env);

    // Defaults, then the JSON file (explicit path or OOBCTL_CONFIG), then environment
    bool load(const std::string& configPath, ToolConfig& config);

    // A missing IPMI_PASSWORD only matters once a network operation is requested
    bool requireCredentials(const ToolConfig& config);

    std::string getLastError() const { return lastError_; }

    static EnvLookup processEnvironment();

private:
    bool applyFile(const std::string& path, ToolConfig& config);
    void applyEnvironment(ToolConfig& config);

    EnvLookup env_;
    std::string lastError_;
};
