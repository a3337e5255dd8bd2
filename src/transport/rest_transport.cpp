#include "transport/rest_transport.hpp"
#include "transport/redfish_client.hpp"
#include "common/logger.hpp"
#include <stdexcept>

RestTransport::RestTransport(const ToolConfig& config, HttpClientFactory httpFactory)
    : username_(config.redfishUsername)
    , password_(config.ipmiPassword)
    , connectTimeoutSec_(config.connectTimeoutSec)
    , requestTimeoutSec_(config.requestTimeoutSec)
    , verifyTls_(config.verifyTls)
    , httpFactory_(std::move(httpFactory))
    , lastErrorKind_(ErrorKind::None) {
}

bool RestTransport::execute(const Target& target, const TransportPayload& payload,
                            TransportResponse& response) {
    response = TransportResponse();

    if (payload.method != "GET" && payload.method != "POST") {
        lastErrorKind_ = ErrorKind::InvalidArgument;
        lastError_ = "unsupported Redfish method '" + payload.method + "'";
        return false;
    }

    HttpClientOptions options;
    options.connectTimeoutSec = connectTimeoutSec_;
    options.requestTimeoutSec = requestTimeoutSec_;
    options.verifyTls = verifyTls_;
    if (!verifyTls_) {
        Logger::debug("TLS verification disabled for " + target.managementAddress + " (self-signed BMC certificate)");
    }

    try {
        RedfishClient client(target.managementAddress, username_, password_, httpFactory_(options));
        if (!client.login()) {
            lastErrorKind_ = client.getLastErrorKind();
            lastError_ = client.getLastError();
            return false;
        }

        HttpResponse http;
        bool sent = payload.method == "GET"
            ? client.get(payload.resource, http)
            : client.post(payload.resource, payload.body, http);

        if (!sent) {
            lastErrorKind_ = client.getLastErrorKind();
            lastError_ = client.getLastError();
        }

        if (!client.logout()) {
            Logger::warning("Redfish logout from " + target.hostname + " failed: " + client.getLastError());
        }

        if (!sent) {
            return false;
        }

        response.httpStatus = http.statusCode;
        response.output = http.body;
    } catch (const std::runtime_error& e) {
        lastErrorKind_ = ErrorKind::ProtocolError;
        lastError_ = std::string("Redfish client setup failed: ") + e.what();
        Logger::error(lastError_);
        return false;
    }

    lastErrorKind_ = ErrorKind::None;
    lastError_.clear();
    return true;
}
