#include "transport/redfish_client.hpp"
#include "common/logger.hpp"
#include <stdexcept>

namespace {

const char* const kSessionCollection = "/redfish/v1/SessionService/Sessions";

std::string firstExtendedMessage(const nlohmann::json& node) {
    if (!node.is_object() || !node.contains("@Message.ExtendedInfo")) {
        return "";
    }
    const nlohmann::json& info = node["@Message.ExtendedInfo"];
    if (!info.is_array()) {
        return "";
    }
    for (const auto& entry : info) {
        if (entry.is_object() && entry.contains("Message") && entry["Message"].is_string()) {
            return entry["Message"].get<std::string>();
        }
    }
    return "";
}

} // namespace

RedfishClient::RedfishClient(const std::string& host, const std::string& username,
                             const std::string& password, std::unique_ptr<HttpClient> http)
    : host_(host), username_(username), password_(password), http_(std::move(http)),
      isLoggedIn_(false), lastErrorKind_(ErrorKind::None) {
    if (!http_) {
        throw std::runtime_error("RedfishClient for " + host + " has no HTTP client");
    }
    Logger::debug("Initializing RedfishClient for host: " + host);
}

RedfishClient::~RedfishClient() {
    if (isLoggedIn_) {
        Logger::debug("Logging out before cleanup");
        if (!logout()) {
            Logger::warning("Redfish session on " + host_ + " could not be deleted: " + lastError_);
        }
    }
}

bool RedfishClient::login() {
    nlohmann::json credentials = {
        {"UserName", username_},
        {"Password", password_}
    };

    http_->setBasicAuth(username_, password_);
    HttpResponse response;
    bool sent = makeRequest("POST", kSessionCollection, credentials.dump(), response);
    http_->clearBasicAuth();

    if (!sent) {
        handleTransferError("login");
        return false;
    }

    if (response.statusCode == 401 || response.statusCode == 403) {
        lastErrorKind_ = ErrorKind::AuthenticationFailed;
        lastError_ = "Redfish login to " + host_ + " rejected (HTTP " +
                     std::to_string(response.statusCode) + ")";
        Logger::error(lastError_);
        return false;
    }

    if (response.statusCode != 200 && response.statusCode != 201) {
        lastErrorKind_ = ErrorKind::ProtocolError;
        lastError_ = "Redfish login to " + host_ + " failed with HTTP " +
                     std::to_string(response.statusCode);
        std::string detail = extractExtendedError(response.body);
        if (!detail.empty()) {
            lastError_ += ": " + detail;
        }
        Logger::error(lastError_);
        return false;
    }

    auto token = response.headers.find("x-auth-token");
    if (token == response.headers.end() || token->second.empty()) {
        lastErrorKind_ = ErrorKind::ProtocolError;
        lastError_ = "Redfish login to " + host_ + " returned no X-Auth-Token";
        Logger::error(lastError_);
        return false;
    }

    authToken_ = token->second;
    auto location = response.headers.find("location");
    if (location != response.headers.end()) {
        sessionUri_ = location->second;
    }
    isLoggedIn_ = true;
    Logger::debug("Redfish login to " + host_ + " successful");
    return true;
}

bool RedfishClient::logout() {
    if (!isLoggedIn_) {
        Logger::debug("Not logged in, skipping logout");
        return true;
    }

    // The token is dropped either way; a session we cannot delete expires on the BMC
    isLoggedIn_ = false;
    if (sessionUri_.empty()) {
        authToken_.clear();
        return true;
    }

    HttpResponse response;
    bool sent = makeRequest("DELETE", sessionUri_, "", response);
    authToken_.clear();
    sessionUri_.clear();

    if (!sent) {
        handleTransferError("logout");
        return false;
    }
    if (response.statusCode >= 300) {
        lastErrorKind_ = ErrorKind::ProtocolError;
        lastError_ = "Redfish logout returned HTTP " + std::to_string(response.statusCode);
        return false;
    }

    Logger::debug("Successfully logged out from " + host_);
    return true;
}

bool RedfishClient::get(const std::string& resource, HttpResponse& response) {
    if (!makeRequest("GET", resource, "", response)) {
        handleTransferError("GET " + resource);
        return false;
    }
    return true;
}

bool RedfishClient::post(const std::string& resource, const nlohmann::json& body, HttpResponse& response) {
    Logger::debug("Request body: " + body.dump());
    if (!makeRequest("POST", resource, body.dump(), response)) {
        handleTransferError("POST " + resource);
        return false;
    }
    return true;
}

std::string RedfishClient::extractExtendedError(const std::string& body) {
    nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return "";
    }

    if (doc.contains("error") && doc["error"].is_object()) {
        const nlohmann::json& error = doc["error"];
        std::string message = firstExtendedMessage(error);
        if (!message.empty()) {
            return message;
        }
        if (error.contains("message") && error["message"].is_string()) {
            return error["message"].get<std::string>();
        }
    }
    return firstExtendedMessage(doc);
}

bool RedfishClient::makeRequest(const std::string& method, const std::string& endpoint,
                                const std::string& body, HttpResponse& response) {
    return http_->request(method, buildUrl(endpoint), commonHeaders(), body, response);
}

std::string RedfishClient::buildUrl(const std::string& endpoint) const {
    // Location headers are sometimes absolute
    if (endpoint.rfind("https://", 0) == 0 || endpoint.rfind("http://", 0) == 0) {
        return endpoint;
    }
    return "https://" + host_ + endpoint;
}

std::vector<std::string> RedfishClient::commonHeaders() const {
    std::vector<std::string> headers = {
        "Content-Type: application/json",
        "Accept: application/json"
    };
    if (!authToken_.empty()) {
        headers.push_back("X-Auth-Token: " + authToken_);
    }
    return headers;
}

void RedfishClient::handleTransferError(const std::string& operation) {
    if (http_->lastErrorWasTimeout()) {
        lastErrorKind_ = ErrorKind::TimedOut;
    } else if (http_->lastErrorWasConnect()) {
        lastErrorKind_ = ErrorKind::Unreachable;
    } else {
        lastErrorKind_ = ErrorKind::ProtocolError;
    }
    lastError_ = "Redfish " + operation + " on " + host_ + " failed: " + http_->getLastError();
    Logger::error(lastError_);
}
