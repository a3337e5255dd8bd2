#pragma once

#include "transport/transport.hpp"
#include "common/tool_config.hpp"
#include <memory>

// Factory function to create the transport for one wire protocol
std::shared_ptr<Transport> createTransport(TransportType type, const ToolConfig& config);

// All three transports, configured from the same settings
TransportSet createTransportSet(const ToolConfig& config);
