#pragma once

#include "common/http_client.hpp"
#include "common/error_kind.hpp"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Session-based Redfish client for one BMC. The session is deleted on
// logout() or, at the latest, in the destructor.
class RedfishClient {
public:
    RedfishClient(const std::string& host, const std::string& username, const std::string& password,
                  std::unique_ptr<HttpClient> http);
    ~RedfishClient();

    RedfishClient(const RedfishClient&) = delete;
    RedfishClient& operator=(const RedfishClient&) = delete;

    // Authentication
    bool login();
    bool logout();
    bool isLoggedIn() const { return isLoggedIn_; }

    bool get(const std::string& resource, HttpResponse& response);
    bool post(const std::string& resource, const nlohmann::json& body, HttpResponse& response);

    std::string getLastError() const { return lastError_; }
    ErrorKind getLastErrorKind() const { return lastErrorKind_; }

    // First "@Message.ExtendedInfo" message in a Redfish error document, if any
    static std::string extractExtendedError(const std::string& body);

private:
    bool makeRequest(const std::string& method, const std::string& endpoint,
                     const std::string& body, HttpResponse& response);
    std::string buildUrl(const std::string& endpoint) const;
    std::vector<std::string> commonHeaders() const;
    void handleTransferError(const std::string& operation);

    std::string host_;
    std::string username_;
    std::string password_;
    std::string authToken_;
    std::string sessionUri_;
    std::unique_ptr<HttpClient> http_;
    bool isLoggedIn_;
    std::string lastError_;
    ErrorKind lastErrorKind_;
};
