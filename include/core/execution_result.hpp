#pragma once

#include "common/error_kind.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct DiskEntry {
    std::string bay;
    std::string status;
    std::string sizeOrCapacity;
    std::string serialOrHealth;  // serial number (RACADM) or health (Redfish)
    std::string model;           // Redfish only
};

struct ExecutionResult {
    bool success{false};
    ErrorKind errorKind{ErrorKind::None};
    std::string errorMessage;                     // one line, failures only
    std::string rawOutput;
    std::vector<std::string> lines;               // human-readable payload
    std::vector<std::string> warnings;
    std::optional<std::vector<DiskEntry>> disks;  // drive_status / nvme_status only

    static ExecutionResult ok(const std::vector<std::string>& lines, const std::string& rawOutput = "");
    static ExecutionResult failure(ErrorKind kind, const std::string& message,
                                   const std::string& rawOutput = "");

    nlohmann::json toJson() const;
};
