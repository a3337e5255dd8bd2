#include "core/command_router.hpp"
#include "core/response_normalizer.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

namespace {

const char* const kPowerStatusCommand = "chassis power status";
const char* const kSensorCommand = "sensor";
const char* const kSelCommand = "sel elist";
const char* const kPowerOnCommand = "chassis power on";
const char* const kPowerCycleCommand = "chassis power cycle";
const char* const kDiagInterruptCommand = "chassis power diag";

const char* const kRacadmDriveStatusCommand = "racadm storage get pdisks -o -p State,Size,SerialNumber";
const char* const kDellEnclosure = "Enclosure.Internal.0-1";
const char* const kDellRaidController = "RAID.Integrated.1-1";

} // namespace

CommandRouter::CommandRouter(std::shared_ptr<InventoryResolver> resolver,
                             std::shared_ptr<SafetyGuard> guard,
                             TransportSet transports)
    : resolver_(std::move(resolver))
    , guard_(std::move(guard))
    , transports_(std::move(transports)) {
}

ExecutionResult CommandRouter::execute(const std::string& hostname, const Operation& operation) {
    Logger::info("Executing " + operationTypeName(operation.type) + " on " + hostname);

    switch (operation.type) {
        case OperationType::Power:
            return runReadOnly(hostname, kPowerStatusCommand);
        case OperationType::Health:
            return runReadOnly(hostname, kSensorCommand);
        case OperationType::Sel:
            return runReadOnly(hostname, kSelCommand);
        case OperationType::PowerOn:
            return runReadOnly(hostname, kPowerOnCommand);
        case OperationType::SetBootMode:
            return runBootMode(hostname, operation);
        case OperationType::Reboot:
        case OperationType::Kdump:
            return runDestructive(hostname, operation);
        case OperationType::DriveStatus:
            return runDriveStatus(hostname);
        case OperationType::DriveLocate:
            return runDriveLocate(hostname, operation);
        case OperationType::NvmeStatus:
            return runNvmeStatus(hostname);
        case OperationType::NvmeLocate:
            return runNvmeLocate(hostname, operation);
    }
    return ExecutionResult::failure(ErrorKind::InvalidArgument, "unknown operation");
}

bool CommandRouter::supportsRacadm(Manufacturer manufacturer) {
    switch (manufacturer) {
        case Manufacturer::Dell:       return true;
        case Manufacturer::Supermicro: return false;
        case Manufacturer::Unknown:    return false;
    }
    return false;
}

bool CommandRouter::supportsNvmeStatus(Manufacturer manufacturer) {
    switch (manufacturer) {
        case Manufacturer::Dell:       return true;
        case Manufacturer::Supermicro: return true;
        case Manufacturer::Unknown:    return false;
    }
    return false;
}

bool CommandRouter::supportsNvmeLocate(Manufacturer manufacturer) {
    switch (manufacturer) {
        case Manufacturer::Dell:       return true;
        case Manufacturer::Supermicro: return false;
        case Manufacturer::Unknown:    return false;
    }
    return false;
}

std::string CommandRouter::racadmLocateCommand(const std::string& slot, bool blink) {
    return std::string("racadm storage ") + (blink ? "blink" : "unblink") +
           ":Disk.Bay." + slot + ":" + kDellEnclosure + ":" + kDellRaidController;
}

std::string CommandRouter::nvmeStatusResource(Manufacturer manufacturer) {
    switch (manufacturer) {
        case Manufacturer::Dell:
            return "/redfish/v1/Systems/System.Embedded.1/Storage/CPU.1?$expand=*($levels=1)";
        case Manufacturer::Supermicro:
            return "/redfish/v1/Chassis/NVMeSSD.0.StorageBackplane.1/Drives?$expand=*($levels=1)";
        case Manufacturer::Unknown:
            return "";
    }
    return "";
}

std::string CommandRouter::nvmeLocateResource(bool blink) {
    return std::string("/redfish/v1/Dell/Systems/System.Embedded.1/DellRaidService/Actions/DellRaidService.") +
           (blink ? "BlinkTarget" : "UnBlinkTarget");
}

bool CommandRouter::resolveTarget(const std::string& hostname, Target& target, ExecutionResult& failure) {
    if (!resolver_->resolve(hostname, target)) {
        failure = ExecutionResult::failure(resolver_->getLastErrorKind(), resolver_->getLastError());
        return false;
    }
    return true;
}

ExecutionResult CommandRouter::transportFailure(const Transport& transport) {
    return ExecutionResult::failure(transport.getLastErrorKind(), transport.getLastError());
}

ExecutionResult CommandRouter::runCli(const Target& target, const std::string& command) {
    TransportPayload payload;
    payload.command = command;

    TransportResponse response;
    if (!transports_.localCli->execute(target, payload, response)) {
        return transportFailure(*transports_.localCli);
    }

    ExecutionResult result = ResponseNormalizer::fromCliOutput(response);
    if (!result.success) {
        result.errorMessage = target.hostname + ": " + result.errorMessage;
    }
    return result;
}

ExecutionResult CommandRouter::runReadOnly(const std::string& hostname, const std::string& command) {
    Target target;
    ExecutionResult failure;
    if (!resolveTarget(hostname, target, failure)) {
        return failure;
    }
    return runCli(target, command);
}

ExecutionResult CommandRouter::runBootMode(const std::string& hostname, const Operation& operation) {
    // The address is checked before the argument so a bad host is reported first
    Target target;
    ExecutionResult failure;
    if (!resolveTarget(hostname, target, failure)) {
        return failure;
    }

    const std::string& mode = operation.bootTarget;
    if (mode != "pxe" && mode != "bios") {
        return ExecutionResult::failure(ErrorKind::InvalidArgument,
                                        "usage: oobctl " + hostname + " boot <pxe|bios>");
    }

    // No compensation: if the flag fails after the device was set, both outcomes are reported
    ExecutionResult device = runCli(target, "chassis bootdev " + mode);
    ExecutionResult flag = runCli(target, "chassis bootparam set bootflag force_" + mode);

    if (device.success && flag.success) {
        std::vector<std::string> lines;
        lines.push_back(hostname + ": next boot set to " + mode);
        lines.insert(lines.end(), device.lines.begin(), device.lines.end());
        lines.insert(lines.end(), flag.lines.begin(), flag.lines.end());
        return ExecutionResult::ok(lines, device.rawOutput + flag.rawOutput);
    }

    std::string message = hostname + ": setting boot mode to " + mode + " failed (boot device: " +
                          (device.success ? "ok" : device.errorMessage) + "; boot flag: " +
                          (flag.success ? "ok" : flag.errorMessage) + ")";
    ErrorKind kind = device.success ? flag.errorKind : device.errorKind;
    return ExecutionResult::failure(kind, message, device.rawOutput + flag.rawOutput);
}

ExecutionResult CommandRouter::runDestructive(const std::string& hostname, const Operation& operation) {
    std::string name = operationTypeName(operation.type);

    if (operation.confirmation.empty()) {
        return ExecutionResult::failure(ErrorKind::BadConfirmation,
                                        hostname + ": " + name + " must be confirmed, re-run with --magic " +
                                        SafetyGuard::confirmationToken(hostname));
    }
    if (!guard_->verifyConfirmation(hostname, operation.confirmation)) {
        Logger::warning("Bad confirmation token for " + name + " on " + hostname);
        return ExecutionResult::failure(ErrorKind::BadConfirmation,
                                        hostname + ": bad confirmation token for " + name);
    }
    if (utils::trim(operation.reason).empty()) {
        return ExecutionResult::failure(ErrorKind::MissingReason,
                                        hostname + ": " + name + " requires --reason");
    }

    Target target;
    ExecutionResult failure;
    if (!resolveTarget(hostname, target, failure)) {
        return failure;
    }

    const char* command = operation.type == OperationType::Reboot ? kPowerCycleCommand : kDiagInterruptCommand;
    Logger::info(name + " requested for " + hostname + ": " + operation.reason);

    ExecutionResult result = runCli(target, command);
    if (result.success) {
        guard_->notifyOffline(hostname, name + ": " + operation.reason);
    }
    return result;
}

ExecutionResult CommandRouter::runDriveStatus(const std::string& hostname) {
    Target target;
    ExecutionResult failure;
    if (!resolveTarget(hostname, target, failure)) {
        return failure;
    }
    if (!supportsRacadm(target.manufacturer)) {
        return ExecutionResult::failure(ErrorKind::UnsupportedManufacturer,
                                        hostname + ": drive_status is only supported on Dell, not " +
                                        manufacturerToString(target.manufacturer));
    }

    TransportPayload payload;
    payload.command = kRacadmDriveStatusCommand;

    TransportResponse response;
    if (!transports_.remoteShell->execute(target, payload, response)) {
        return transportFailure(*transports_.remoteShell);
    }
    return ResponseNormalizer::fromDriveStatus(hostname, response);
}

bool CommandRouter::parseLocateArguments(const std::string& hostname, const Operation& operation,
                                         bool& blink, ExecutionResult& failure) {
    std::string usage = "usage: oobctl " + hostname + " " + operationTypeName(operation.type) + " <on|off> <slot>";

    if (operation.locateState == "on") {
        blink = true;
    } else if (operation.locateState == "off") {
        blink = false;
    } else {
        failure = ExecutionResult::failure(ErrorKind::InvalidArgument, usage);
        return false;
    }

    if (!utils::isUnsignedInteger(operation.slot)) {
        failure = ExecutionResult::failure(ErrorKind::InvalidArgument,
                                           "slot must be a non-negative number, got '" + operation.slot +
                                           "' (" + usage + ")");
        return false;
    }
    return true;
}

ExecutionResult CommandRouter::runDriveLocate(const std::string& hostname, const Operation& operation) {
    bool blink = false;
    ExecutionResult failure;
    if (!parseLocateArguments(hostname, operation, blink, failure)) {
        return failure;
    }

    Target target;
    if (!resolveTarget(hostname, target, failure)) {
        return failure;
    }
    if (!supportsRacadm(target.manufacturer)) {
        return ExecutionResult::failure(ErrorKind::UnsupportedManufacturer,
                                        hostname + ": drive_locate is only supported on Dell, not " +
                                        manufacturerToString(target.manufacturer));
    }

    TransportPayload payload;
    payload.command = racadmLocateCommand(operation.slot, blink);

    TransportResponse response;
    if (!transports_.remoteShell->execute(target, payload, response)) {
        return transportFailure(*transports_.remoteShell);
    }
    return ResponseNormalizer::fromDriveLocate(hostname, operation.slot, blink, response);
}

ExecutionResult CommandRouter::runNvmeStatus(const std::string& hostname) {
    Target target;
    ExecutionResult failure;
    if (!resolveTarget(hostname, target, failure)) {
        return failure;
    }
    if (!supportsNvmeStatus(target.manufacturer)) {
        return ExecutionResult::failure(ErrorKind::UnsupportedManufacturer,
                                        hostname + ": nvme_status is only supported on Dell and Supermicro, not " +
                                        manufacturerToString(target.manufacturer));
    }

    TransportPayload payload;
    payload.method = "GET";
    payload.resource = nvmeStatusResource(target.manufacturer);

    TransportResponse response;
    if (!transports_.rest->execute(target, payload, response)) {
        return transportFailure(*transports_.rest);
    }
    return ResponseNormalizer::fromNvmeStatus(hostname, target.manufacturer, response);
}

ExecutionResult CommandRouter::runNvmeLocate(const std::string& hostname, const Operation& operation) {
    bool blink = false;
    ExecutionResult failure;
    if (!parseLocateArguments(hostname, operation, blink, failure)) {
        return failure;
    }

    Target target;
    if (!resolveTarget(hostname, target, failure)) {
        return failure;
    }
    if (!supportsNvmeLocate(target.manufacturer)) {
        return ExecutionResult::failure(ErrorKind::UnsupportedManufacturer,
                                        hostname + ": nvme_locate is only supported on Dell, not " +
                                        manufacturerToString(target.manufacturer));
    }

    TransportPayload payload;
    payload.method = "POST";
    payload.resource = nvmeLocateResource(blink);
    payload.body = {
        {"TargetFQDD", "Disk.Bay." + operation.slot + ":" + kDellEnclosure}
    };

    TransportResponse response;
    if (!transports_.rest->execute(target, payload, response)) {
        return transportFailure(*transports_.rest);
    }
    return ResponseNormalizer::fromNvmeLocate(hostname, operation.slot, blink, response);
}
