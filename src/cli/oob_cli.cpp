#include "cli/oob_cli.hpp"
#include "common/logger.hpp"
#include "core/command_router.hpp"
#include "core/fleet_notifier.hpp"
#include "core/safety_guard.hpp"
#include "inventory/rest_inventory_resolver.hpp"
#include "transport/transport_factory.hpp"
#include <curl/curl.h>
#include <iostream>
#include <memory>
#include <stdexcept>

const char* const kOobctlVersion = "1.0.0";

namespace {

// curl_global_init is not thread-safe and must pair with one cleanup
class CurlGlobalGuard {
public:
    CurlGlobalGuard() {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }
    ~CurlGlobalGuard() { curl_global_cleanup(); }

    CurlGlobalGuard(const CurlGlobalGuard&) = delete;
    CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;
};

size_t maxArgumentsFor(OperationType type) {
    switch (type) {
        case OperationType::SetBootMode:
            return 1;
        case OperationType::DriveLocate:
        case OperationType::NvmeLocate:
            return 2;
        case OperationType::Power:
        case OperationType::Health:
        case OperationType::Sel:
        case OperationType::PowerOn:
        case OperationType::Reboot:
        case OperationType::Kdump:
        case OperationType::DriveStatus:
        case OperationType::NvmeStatus:
            return 0;
    }
    return 0;
}

void printFailure(const std::string& message, std::ostream& err) {
    err << "oobctl: " << message << std::endl;
}

} // namespace

OobCLI::OobCLI(EnvLookup env)
    : env_(std::move(env)) {
}

void OobCLI::printUsage(std::ostream& out) const {
    out << "Usage: oobctl [options] <hostname> <command> [args]\n"
        << "Commands:\n"
        << "  power                       Chassis power status\n"
        << "  health                      Sensor readings\n"
        << "  sel                         System event log\n"
        << "  poweron                     Power the chassis on\n"
        << "  boot <pxe|bios>             Force the next boot device\n"
        << "  reboot --magic <token> --reason <text>\n"
        << "                              Power cycle the host\n"
        << "  kdump --magic <token> --reason <text>\n"
        << "                              Send a diagnostic interrupt (crash dump)\n"
        << "  drive_status                Physical disk report (Dell)\n"
        << "  drive_locate <on|off> <slot>\n"
        << "                              Blink a drive bay LED (Dell)\n"
        << "  nvme_status                 NVMe drive report (Dell, Supermicro)\n"
        << "  nvme_locate <on|off> <slot> Blink an NVMe bay LED (Dell)\n"
        << "  token                       Print the confirmation token for <hostname>\n"
        << "\n"
        << "Options:\n"
        << "  --config <file>  JSON configuration file (default: $OOBCTL_CONFIG)\n"
        << "  --json           Print the result as JSON\n"
        << "  --verbose        Echo debug logging to stderr\n"
        << "  -h, --help       Show this help message\n"
        << "  --version        Show version information\n"
        << "\n"
        << "The BMC password is read from IPMI_PASSWORD.\n";
}

bool OobCLI::parseArguments(const std::vector<std::string>& args, CommandLine& commandLine,
                            std::string& error) {
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            commandLine.showHelp = true;
            return true;
        } else if (arg == "--version") {
            commandLine.showVersion = true;
            return true;
        } else if (arg == "--verbose") {
            commandLine.verbose = true;
        } else if (arg == "--json") {
            commandLine.json = true;
        } else if (arg == "--config" || arg == "--magic" || arg == "--reason") {
            if (i + 1 >= args.size()) {
                error = "option " + arg + " requires a value";
                return false;
            }
            const std::string& value = args[++i];
            if (arg == "--config") {
                commandLine.configPath = value;
            } else if (arg == "--magic") {
                commandLine.operation.confirmation = value;
            } else {
                commandLine.operation.reason = value;
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            error = "unknown option '" + arg + "'";
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        error = "missing hostname";
        return false;
    }
    commandLine.hostname = positional[0];

    if (positional.size() < 2) {
        error = "missing command for " + commandLine.hostname;
        return false;
    }
    const std::string& command = positional[1];
    std::vector<std::string> extra(positional.begin() + 2, positional.end());

    if (command == "token") {
        if (!extra.empty()) {
            error = "unexpected argument '" + extra[0] + "'";
            return false;
        }
        commandLine.tokenOnly = true;
        return true;
    }

    if (!operationTypeFromName(command, commandLine.operation.type)) {
        error = "unknown command '" + command + "'";
        return false;
    }

    size_t allowed = maxArgumentsFor(commandLine.operation.type);
    if (extra.size() > allowed) {
        error = "unexpected argument '" + extra[allowed] + "'";
        return false;
    }

    // Missing sub-arguments are left empty; the router reports them with usage text
    switch (commandLine.operation.type) {
        case OperationType::SetBootMode:
            if (!extra.empty()) commandLine.operation.bootTarget = extra[0];
            break;
        case OperationType::DriveLocate:
        case OperationType::NvmeLocate:
            if (extra.size() > 0) commandLine.operation.locateState = extra[0];
            if (extra.size() > 1) commandLine.operation.slot = extra[1];
            break;
        default:
            break;
    }
    return true;
}

void OobCLI::render(const ExecutionResult& result, bool json, std::ostream& out, std::ostream& err) {
    if (json) {
        out << result.toJson().dump(4) << std::endl;
        return;
    }

    if (!result.success) {
        printFailure(result.errorMessage, err);
        return;
    }
    for (const auto& line : result.lines) {
        out << line << "\n";
    }
    for (const auto& warning : result.warnings) {
        out << warning << "\n";
    }
    out.flush();
}

int OobCLI::run(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        args.push_back(argv[i]);
    }

    CommandLine commandLine;
    std::string error;
    if (!parseArguments(args, commandLine, error)) {
        printFailure(error, std::cerr);
        printUsage(std::cerr);
        return 1;
    }

    if (commandLine.showHelp) {
        printUsage(std::cout);
        return 0;
    }
    if (commandLine.showVersion) {
        std::cout << "oobctl version " << kOobctlVersion << "\n";
        return 0;
    }

    try {
        if (commandLine.tokenOnly) {
            std::cout << SafetyGuard::confirmationToken(commandLine.hostname) << "\n";
            return 0;
        }
        return execute(commandLine);
    } catch (const std::exception& e) {
        if (Logger::isInitialized()) {
            Logger::error("Unexpected error: " + std::string(e.what()));
        }
        printFailure(e.what(), std::cerr);
        return 1;
    }
}

int OobCLI::execute(const CommandLine& commandLine) {
    ToolConfig config;
    ToolConfigLoader loader(env_);
    if (!loader.load(commandLine.configPath, config)) {
        render(ExecutionResult::failure(ErrorKind::ConfigurationError, loader.getLastError()),
               commandLine.json, std::cout, std::cerr);
        return 1;
    }

    if (!Logger::initialize(config.logPath, commandLine.verbose ? LogLevel::DEBUG : config.logLevel)) {
        printFailure("cannot open log file " + config.logPath, std::cerr);
        return 1;
    }
    Logger::setConsoleEcho(commandLine.verbose);

    if (!loader.requireCredentials(config)) {
        Logger::error(loader.getLastError());
        render(ExecutionResult::failure(ErrorKind::ConfigurationError, loader.getLastError()),
               commandLine.json, std::cout, std::cerr);
        Logger::shutdown();
        return 1;
    }

    CurlGlobalGuard curlGuard;

    auto resolver = std::make_shared<RestInventoryResolver>(config);
    auto guard = std::make_shared<SafetyGuard>(std::make_shared<RestFleetNotifier>(config));
    CommandRouter router(resolver, guard, createTransportSet(config));

    ExecutionResult result = router.execute(commandLine.hostname, commandLine.operation);
    if (result.success) {
        Logger::info(operationTypeName(commandLine.operation.type) + " on " + commandLine.hostname + " succeeded");
    } else {
        Logger::error(operationTypeName(commandLine.operation.type) + " on " + commandLine.hostname + " failed (" +
                      errorKindToString(result.errorKind) + "): " + result.errorMessage);
    }

    render(result, commandLine.json, std::cout, std::cerr);
    Logger::shutdown();
    return result.success ? 0 : 1;
}
