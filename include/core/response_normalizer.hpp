#pragma once

#include "core/execution_result.hpp"
#include "inventory/target.hpp"
#include "transport/transport.hpp"
#include <string>
#include <vector>

// Turns raw transport output into ExecutionResult values
class ResponseNormalizer {
public:
    static constexpr const char* kRacadmBayMarker = "Disk.Bay.";
    static constexpr const char* kRacadmSuccessMarker = "STOR095";

    // ipmitool output
    static ExecutionResult fromCliOutput(const TransportResponse& response);

    // racadm storage get pdisks
    static ExecutionResult fromDriveStatus(const std::string& hostname, const TransportResponse& response);
    static std::vector<DiskEntry> parseRacadmDisks(const std::string& output);

    // racadm storage blink / unblink
    static ExecutionResult fromDriveLocate(const std::string& hostname, const std::string& slot,
                                           bool blink, const TransportResponse& response);

    // Redfish drive collection
    static ExecutionResult fromNvmeStatus(const std::string& hostname, Manufacturer manufacturer,
                                          const TransportResponse& response);

    // Redfish BlinkTarget / UnBlinkTarget action
    static ExecutionResult fromNvmeLocate(const std::string& hostname, const std::string& slot,
                                          bool blink, const TransportResponse& response);

    // Substring that identifies a drive record for this vendor
    static std::string nvmeBayMarker(Manufacturer manufacturer);

    static std::string formatCapacity(double bytes);
};
