#pragma once

#include "inventory/target.hpp"
#include "common/error_kind.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

enum class TransportType {
    LocalCli,
    RemoteShell,
    Rest
};

std::string transportTypeToString(TransportType type);

// Everything a transport needs to issue one operation
struct TransportPayload {
    std::string command;     // ipmitool command or vendor shell command
    std::string method;      // REST only: "GET" or "POST"
    std::string resource;    // REST only: path under https://<address>
    nlohmann::json body;     // REST only: POST body
};

struct TransportResponse {
    std::string output;                 // captured text or response body
    int exitStatus{0};                  // CLI and shell transports
    long httpStatus{0};                 // REST transport
    bool authFailureDetected{false};    // set by the CLI diagnostic re-run
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual TransportType type() const = 0;

    // Issues exactly one logical operation against target. Returns false when
    // the operation could not be carried out at all; the reason is in
    // getLastErrorKind() / getLastError().
    virtual bool execute(const Target& target, const TransportPayload& payload,
                         TransportResponse& response) = 0;

    virtual std::string getLastError() const = 0;
    virtual ErrorKind getLastErrorKind() const = 0;
};

// One instance of each transport, handed to the router
struct TransportSet {
    std::shared_ptr<Transport> localCli;
    std::shared_ptr<Transport> remoteShell;
    std::shared_ptr<Transport> rest;
};
