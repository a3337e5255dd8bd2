#include "common/http_client.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <stdexcept>

CurlHttpClient::CurlHttpClient(const HttpClientOptions& options)
    : curl_(nullptr), options_(options), lastCode_(CURLE_OK) {
    curl_ = curl_easy_init();
    if (!curl_) {
        Logger::error("Failed to initialize CURL");
        throw std::runtime_error("Failed to initialize CURL");
    }

    if (!options_.verifyTls) {
        // BMC endpoints present self-signed certificates
        curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, options_.connectTimeoutSec);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, options_.requestTimeoutSec);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    Logger::debug("CURL options configured: SSL verification " +
                  std::string(options_.verifyTls ? "enabled" : "disabled") +
                  ", connection timeout: " + std::to_string(options_.connectTimeoutSec) +
                  "s, operation timeout: " + std::to_string(options_.requestTimeoutSec) + "s");
}

CurlHttpClient::~CurlHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

HttpClientFactory CurlHttpClient::factory() {
    return [](const HttpClientOptions& options) -> std::unique_ptr<HttpClient> {
        return std::make_unique<CurlHttpClient>(options);
    };
}

void CurlHttpClient::setBasicAuth(const std::string& username, const std::string& password) {
    curl_easy_setopt(curl_, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(curl_, CURLOPT_USERNAME, username.c_str());
    curl_easy_setopt(curl_, CURLOPT_PASSWORD, password.c_str());
}

void CurlHttpClient::clearBasicAuth() {
    curl_easy_setopt(curl_, CURLOPT_USERNAME, nullptr);
    curl_easy_setopt(curl_, CURLOPT_PASSWORD, nullptr);
}

bool CurlHttpClient::request(const std::string& method, const std::string& url,
                         const std::vector<std::string>& headers, const std::string& body,
                         HttpResponse& response) {
    Logger::debug("Making " + method + " request to: " + url);

    struct curl_slist* headerList = nullptr;
    for (const auto& header : headers) {
        headerList = curl_slist_append(headerList, header.c_str());
    }

    response.statusCode = 0;
    response.body.clear();
    response.headers.clear();

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headerList);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response.headers);

    // Reset method state left over from the previous request on this handle
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, nullptr);

    if (method == "POST" || method == "PATCH" || method == "PUT") {
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, method.c_str());
    } else if (method != "GET") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    lastCode_ = curl_easy_perform(curl_);
    curl_slist_free_all(headerList);

    if (lastCode_ != CURLE_OK) {
        lastError_ = curl_easy_strerror(lastCode_);
        Logger::error("Request failed: " + lastError_);
        return false;
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.statusCode);
    Logger::debug("Response code: " + std::to_string(response.statusCode));
    lastError_.clear();
    return true;
}

size_t CurlHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t realsize = size * nmemb;
    userp->append(static_cast<char*>(contents), realsize);
    return realsize;
}

size_t CurlHttpClient::headerCallback(char* buffer, size_t size, size_t nitems,
                                  std::map<std::string, std::string>* headers) {
    size_t realsize = size * nitems;
    std::string line(buffer, realsize);
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = utils::toLower(utils::trim(line.substr(0, colon)));
        (*headers)[name] = utils::trim(line.substr(colon + 1));
    }
    return realsize;
}
