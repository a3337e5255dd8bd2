#include "common/tool_config.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

ToolConfigLoader::ToolConfigLoader(EnvLookup env)
    : env_(std::move(env)) {
}

EnvLookup ToolConfigLoader::processEnvironment() {
    return [](const char* name) -> const char* { return std::getenv(name); };
}

bool ToolConfigLoader::load(const std::string& configPath, ToolConfig& config) {
    std::string path = configPath;
    if (path.empty()) {
        const char* fromEnv = env_("OOBCTL_CONFIG");
        if (fromEnv) {
            path = fromEnv;
        }
    }

    if (!path.empty() && !applyFile(path, config)) {
        return false;
    }

    applyEnvironment(config);
    return true;
}

bool ToolConfigLoader::requireCredentials(const ToolConfig& config) {
    if (config.ipmiPassword.empty()) {
        lastError_ = "IPMI_PASSWORD is not set";
        return false;
    }
    return true;
}

bool ToolConfigLoader::applyFile(const std::string& path, ToolConfig& config) {
    std::ifstream file(path);
    if (!file) {
        lastError_ = "cannot open config file " + path;
        return false;
    }

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& e) {
        lastError_ = "invalid config file " + path + ": " + e.what();
        return false;
    }

    if (!doc.is_object()) {
        lastError_ = "config file " + path + " must contain a JSON object";
        return false;
    }

    try {
        config.inventoryUrl = doc.value("inventory_url", config.inventoryUrl);
        config.notifierUrl = doc.value("notifier_url", config.notifierUrl);
        config.ipmitoolPath = doc.value("ipmitool_path", config.ipmitoolPath);
        config.ipmiUsername = doc.value("ipmi_username", config.ipmiUsername);
        config.ipmiInterface = doc.value("ipmi_interface", config.ipmiInterface);
        config.sshUsername = doc.value("ssh_username", config.sshUsername);
        config.redfishUsername = doc.value("redfish_username", config.redfishUsername);
        config.sshPort = doc.value("ssh_port", config.sshPort);
        config.probeTimeoutSec = doc.value("probe_timeout_sec", config.probeTimeoutSec);
        config.cliSoftTimeoutSec = doc.value("cli_soft_timeout_sec", config.cliSoftTimeoutSec);
        config.cliKillGraceSec = doc.value("cli_kill_grace_sec", config.cliKillGraceSec);
        config.connectTimeoutSec = doc.value("connect_timeout_sec", config.connectTimeoutSec);
        config.requestTimeoutSec = doc.value("request_timeout_sec", config.requestTimeoutSec);
        config.verifyTls = doc.value("verify_tls", config.verifyTls);
        config.logPath = doc.value("log_path", config.logPath);

        if (doc.contains("log_level")) {
            std::string level = doc["log_level"].get<std::string>();
            if (!Logger::parseLevel(level, config.logLevel)) {
                lastError_ = "unknown log_level '" + level + "' in " + path;
                return false;
            }
        }
    } catch (const json::type_error& e) {
        lastError_ = "invalid value in config file " + path + ": " + e.what();
        return false;
    }

    return true;
}

void ToolConfigLoader::applyEnvironment(ToolConfig& config) {
    auto assign = [this](const char* name, std::string& target) {
        const char* value = env_(name);
        if (value && *value) {
            target = value;
        }
    };

    assign("IPMI_PASSWORD", config.ipmiPassword);
    assign("OOBCTL_INVENTORY_URL", config.inventoryUrl);
    assign("OOBCTL_INVENTORY_TOKEN", config.inventoryToken);
    assign("OOBCTL_NOTIFIER_URL", config.notifierUrl);
    assign("OOBCTL_NOTIFIER_TOKEN", config.notifierToken);
    assign("OOBCTL_LOG_PATH", config.logPath);
}
