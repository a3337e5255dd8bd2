#include "core/fleet_notifier.hpp"
#include "common/http_client.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>

RestFleetNotifier::RestFleetNotifier(const ToolConfig& config)
    : url_(config.notifierUrl)
    , token_(config.notifierToken)
    , connectTimeoutSec_(config.connectTimeoutSec)
    , requestTimeoutSec_(config.requestTimeoutSec) {
}

bool RestFleetNotifier::setOffline(const std::string& hostId, const std::string& reason) {
    if (url_.empty()) {
        lastError_ = "no fleet-status URL configured (set OOBCTL_NOTIFIER_URL)";
        return false;
    }

    nlohmann::json body = {
        {"host", hostId},
        {"state", "offline"},
        {"reason", reason}
    };

    std::vector<std::string> headers = {
        "Content-Type: application/json",
        "Accept: application/json"
    };
    if (!token_.empty()) {
        headers.push_back("Authorization: Bearer " + token_);
    }

    HttpClientOptions options;
    options.connectTimeoutSec = connectTimeoutSec_;
    options.requestTimeoutSec = requestTimeoutSec_;

    CurlHttpClient client(options);
    HttpResponse response;
    if (!client.request("POST", url_, headers, body.dump(), response)) {
        lastError_ = "fleet-status request failed: " + client.getLastError();
        return false;
    }

    if (response.statusCode < 200 || response.statusCode >= 300) {
        lastError_ = "fleet-status service returned HTTP " + std::to_string(response.statusCode);
        return false;
    }

    Logger::info("Marked " + hostId + " offline in fleet status");
    return true;
}
