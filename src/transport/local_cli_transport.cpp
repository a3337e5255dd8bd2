#include "transport/local_cli_transport.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

namespace {

// Fragments ipmitool -v prints when the BMC rejects the user or password
const char* const kAuthSignatures[] = {
    "RAKP 2 HMAC is invalid",
    "RAKP 2 message indicates an error",
    "unauthorized name",
    "invalid authentication algorithm",
};

} // namespace

LocalCliTransport::LocalCliTransport(const ToolConfig& config, std::shared_ptr<ProcessRunner> runner)
    : ipmitoolPath_(config.ipmitoolPath)
    , interface_(config.ipmiInterface)
    , username_(config.ipmiUsername)
    , password_(config.ipmiPassword)
    , probeTimeoutSec_(config.probeTimeoutSec)
    , softTimeoutSec_(config.cliSoftTimeoutSec)
    , killGraceSec_(config.cliKillGraceSec)
    , runner_(std::move(runner))
    , lastErrorKind_(ErrorKind::None) {
}

std::string LocalCliTransport::buildPingCommand(const std::string& address) const {
    return "ping -c 2 -W " + std::to_string(probeTimeoutSec_) + " " + utils::shellQuote(address);
}

std::string LocalCliTransport::buildIpmiCommand(const std::string& address, const std::string& command,
                                                bool verbose) const {
    // -E makes ipmitool read the password from IPMI_PASSWORD, see ipmiEnvironment()
    std::string line = "timeout -k " + std::to_string(killGraceSec_) + " " +
                       std::to_string(softTimeoutSec_) + " " +
                       utils::shellQuote(ipmitoolPath_) +
                       " -I " + utils::shellQuote(interface_) +
                       " -H " + utils::shellQuote(address) +
                       " -U " + utils::shellQuote(username_) +
                       " -E";
    if (verbose) {
        line += " -v";
    }
    line += " " + command;
    return line;
}

ProcessEnvironment LocalCliTransport::ipmiEnvironment() const {
    return {{"IPMI_PASSWORD", password_}};
}

bool LocalCliTransport::hasAuthenticationSignature(const std::string& verboseOutput) {
    for (const char* signature : kAuthSignatures) {
        if (verboseOutput.find(signature) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool LocalCliTransport::isReachable(const std::string& address, std::string& detail) {
    ProcessResult ping;
    if (!runner_->run(buildPingCommand(address), ProcessEnvironment(), ping)) {
        detail = "could not run ping";
        Logger::error(detail + " against " + address);
        return false;
    }
    Logger::debug("Ping output: " + ping.output);

    // ping exits 0 or 1 once it has sent echoes; any other status means ping itself failed
    if (ping.exitStatus != 0 && ping.exitStatus != 1) {
        std::vector<std::string> lines = utils::splitLines(ping.output);
        std::string firstLine = lines.empty() ? "" : utils::trim(lines.front());
        detail = "ping failed (exit status " + std::to_string(ping.exitStatus) + ")" +
                 (firstLine.empty() ? "" : ": " + firstLine);
        return false;
    }
    if (ping.output.find("100% packet loss") != std::string::npos) {
        detail = "no reply to ping";
        return false;
    }
    return true;
}

bool LocalCliTransport::execute(const Target& target, const TransportPayload& payload,
                                TransportResponse& response) {
    response = TransportResponse();

    if (target.managementAddress.empty()) {
        lastErrorKind_ = ErrorKind::InvalidAddress;
        lastError_ = target.hostname + " has no management address";
        return false;
    }

    std::string pingDetail;
    if (!isReachable(target.managementAddress, pingDetail)) {
        lastErrorKind_ = ErrorKind::Unreachable;
        lastError_ = target.hostname + ": BMC " + target.managementAddress + " is unreachable (" +
                     pingDetail + ")";
        return false;
    }

    Logger::info("Running ipmitool '" + payload.command + "' against " + target.managementAddress);

    ProcessResult primary;
    if (!runner_->run(buildIpmiCommand(target.managementAddress, payload.command, false),
                      ipmiEnvironment(), primary)) {
        lastErrorKind_ = ErrorKind::ProtocolError;
        lastError_ = "could not start " + ipmitoolPath_;
        return false;
    }

    response.output = primary.output;
    response.exitStatus = primary.exitStatus;

    if (primary.output.find(kSessionFailureMarker) != std::string::npos) {
        // Diagnostic only: the verbose output tells an auth rejection apart from
        // other session failures. A read-only command is used so that a power
        // cycle that was refused is never issued a second time.
        Logger::debug("Session setup failed, re-running verbosely to classify the failure");
        ProcessResult diagnostic;
        if (runner_->run(buildIpmiCommand(target.managementAddress, kDiagnosticCommand, true),
                         ipmiEnvironment(), diagnostic)) {
            response.authFailureDetected = hasAuthenticationSignature(diagnostic.output);
        }
    }

    lastErrorKind_ = ErrorKind::None;
    lastError_.clear();
    return true;
}
