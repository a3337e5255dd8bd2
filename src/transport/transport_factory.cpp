#include "transport/transport_factory.hpp"
#include "transport/local_cli_transport.hpp"
#include "transport/remote_shell_transport.hpp"
#include "transport/rest_transport.hpp"
#include "transport/process_runner.hpp"
#include "common/logger.hpp"

std::string transportTypeToString(TransportType type) {
    switch (type) {
        case TransportType::LocalCli:    return "local-cli";
        case TransportType::RemoteShell: return "remote-shell";
        case TransportType::Rest:        return "rest";
    }
    return "unknown";
}

std::shared_ptr<Transport> createTransport(TransportType type, const ToolConfig& config) {
    Logger::debug("Creating transport of type: " + transportTypeToString(type));

    switch (type) {
        case TransportType::LocalCli:
            return std::make_shared<LocalCliTransport>(config, std::make_shared<PopenProcessRunner>());
        case TransportType::RemoteShell:
            return std::make_shared<RemoteShellTransport>(config);
        case TransportType::Rest:
            return std::make_shared<RestTransport>(config);
    }
    return nullptr;
}

TransportSet createTransportSet(const ToolConfig& config) {
    TransportSet transports;
    transports.localCli = createTransport(TransportType::LocalCli, config);
    transports.remoteShell = createTransport(TransportType::RemoteShell, config);
    transports.rest = createTransport(TransportType::Rest, config);
    return transports;
}
