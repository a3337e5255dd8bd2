#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <memory>
#include <curl/curl.h>

struct HttpResponse {
    long statusCode{0};
    std::string body;
    std::map<std::string, std::string> headers;  // names lowercased
};

struct HttpClientOptions {
    long connectTimeoutSec{10};
    long requestTimeoutSec{60};
    bool verifyTls{true};
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void setBasicAuth(const std::string& username, const std::string& password) = 0;
    virtual void clearBasicAuth() = 0;

    // Returns false only when no HTTP exchange happened (DNS, connect, TLS, timeout)
    virtual bool request(const std::string& method, const std::string& url,
                         const std::vector<std::string>& headers, const std::string& body,
                         HttpResponse& response) = 0;

    virtual std::string getLastError() const = 0;
    virtual bool lastErrorWasTimeout() const = 0;
    virtual bool lastErrorWasConnect() const = 0;
};

using HttpClientFactory = std::function<std::unique_ptr<HttpClient>(const HttpClientOptions&)>;

// One libcurl easy handle; not shareable between threads
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const HttpClientOptions& options);
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    void setBasicAuth(const std::string& username, const std::string& password) override;
    void clearBasicAuth() override;

    bool request(const std::string& method, const std::string& url,
                 const std::vector<std::string>& headers, const std::string& body,
                 HttpResponse& response) override;

    std::string getLastError() const override { return lastError_; }
    bool lastErrorWasTimeout() const override { return lastCode_ == CURLE_OPERATION_TIMEDOUT; }
    bool lastErrorWasConnect() const override {
        return lastCode_ == CURLE_COULDNT_CONNECT || lastCode_ == CURLE_COULDNT_RESOLVE_HOST;
    }

    static HttpClientFactory factory();

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems,
                                 std::map<std::string, std::string>* headers);

    CURL* curl_;
    HttpClientOptions options_;
    std::string lastError_;
    CURLcode lastCode_;
};
