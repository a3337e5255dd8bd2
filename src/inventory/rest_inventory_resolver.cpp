#include "inventory/rest_inventory_resolver.hpp"
#include "common/http_client.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <nlohmann/json.hpp>

RestInventoryResolver::RestInventoryResolver(const ToolConfig& config)
    : baseUrl_(config.inventoryUrl)
    , token_(config.inventoryToken)
    , connectTimeoutSec_(config.connectTimeoutSec)
    , requestTimeoutSec_(config.requestTimeoutSec)
    , lastErrorKind_(ErrorKind::None) {
}

bool RestInventoryResolver::resolve(const std::string& hostname, Target& target) {
    if (baseUrl_.empty()) {
        lastErrorKind_ = ErrorKind::ConfigurationError;
        lastError_ = "no inventory URL configured (set OOBCTL_INVENTORY_URL)";
        return false;
    }

    std::string url = baseUrl_ + (baseUrl_.find('?') == std::string::npos ? "?" : "&") +
                      "name=" + utils::urlEncode(hostname);

    std::vector<std::string> headers = {"Accept: application/json"};
    if (!token_.empty()) {
        headers.push_back("Authorization: Bearer " + token_);
    }

    HttpClientOptions options;
    options.connectTimeoutSec = connectTimeoutSec_;
    options.requestTimeoutSec = requestTimeoutSec_;

    HttpResponse response;
    {
        CurlHttpClient client(options);
        if (!client.request("GET", url, headers, "", response)) {
            lastErrorKind_ = client.lastErrorWasTimeout() ? ErrorKind::TimedOut : ErrorKind::Unreachable;
            lastError_ = "inventory lookup for " + hostname + " failed: " + client.getLastError();
            return false;
        }
    }

    if (response.statusCode == 404) {
        lastErrorKind_ = ErrorKind::NotFound;
        lastError_ = hostname + " was not found in inventory";
        return false;
    }
    if (response.statusCode != 200) {
        lastErrorKind_ = ErrorKind::ProtocolError;
        lastError_ = "inventory lookup for " + hostname + " returned HTTP " +
                     std::to_string(response.statusCode);
        return false;
    }

    nlohmann::json records;
    try {
        records = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        lastErrorKind_ = ErrorKind::ProtocolError;
        lastError_ = "inventory returned malformed JSON: " + std::string(e.what());
        return false;
    }

    if (!selectInventoryRecord(hostname, records, target, lastErrorKind_, lastError_)) {
        Logger::warning("Inventory resolution failed: " + lastError_);
        return false;
    }

    Logger::info("Resolved " + hostname + " to " + target.managementAddress +
                 " (" + manufacturerToString(target.manufacturer) + ")");
    return true;
}
