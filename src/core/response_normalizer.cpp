#include "core/response_normalizer.hpp"
#include "transport/local_cli_transport.hpp"
#include "transport/redfish_client.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <iomanip>
#include <sstream>

namespace {

// exit codes of timeout(1): 124 after SIGTERM, 128+9 when the kill grace ran out
const int kTimeoutExitStatus = 124;
const int kKilledExitStatus = 137;

std::string firstNonEmptyLine(const std::string& text) {
    for (const auto& line : utils::splitLines(text)) {
        std::string trimmed = utils::trim(line);
        if (!trimmed.empty()) {
            return trimmed;
        }
    }
    return "";
}

// racadm reports failures as "ERROR: <code> : <text>" and may still exit 0
std::string racadmErrorLine(const std::string& output) {
    for (const auto& line : utils::splitLines(output)) {
        std::string trimmed = utils::trim(line);
        if (trimmed.rfind("ERROR", 0) == 0) {
            return trimmed;
        }
    }
    return "";
}

std::string stringField(const nlohmann::json& node, const char* key) {
    if (node.is_object() && node.contains(key) && node[key].is_string()) {
        return node[key].get<std::string>();
    }
    return "";
}

std::string driveLocation(const nlohmann::json& record) {
    if (record.contains("PhysicalLocation")) {
        const nlohmann::json& physical = record["PhysicalLocation"];
        if (physical.is_object() && physical.contains("PartLocation")) {
            std::string label = stringField(physical["PartLocation"], "ServiceLabel");
            if (!label.empty()) {
                return label;
            }
        }
    }
    // Dell ids look like "Disk.Bay.2:Enclosure.Internal.0-1"
    std::string id = stringField(record, "Id");
    return id.substr(0, id.find(':'));
}

std::string formatDiskLine(const DiskEntry& disk) {
    std::ostringstream line;
    line << std::left << std::setw(14) << disk.bay;
    if (!disk.model.empty()) {
        line << "  " << std::setw(28) << disk.model;
    }
    line << "  " << std::setw(10) << disk.status
         << "  " << std::setw(12) << disk.sizeOrCapacity
         << "  " << disk.serialOrHealth;
    return utils::trim(line.str());
}

} // namespace

ExecutionResult ResponseNormalizer::fromCliOutput(const TransportResponse& response) {
    if (utils::trim(response.output).empty() ||
        response.exitStatus == kTimeoutExitStatus || response.exitStatus == kKilledExitStatus) {
        return ExecutionResult::failure(ErrorKind::TimedOut, "no response from BMC (timed out)",
                                        response.output);
    }

    if (response.output.find(LocalCliTransport::kSessionFailureMarker) != std::string::npos) {
        if (response.authFailureDetected) {
            return ExecutionResult::failure(ErrorKind::AuthenticationFailed,
                                            "BMC rejected the IPMI credentials", response.output);
        }
        return ExecutionResult::failure(ErrorKind::ProtocolError,
                                        firstNonEmptyLine(response.output), response.output);
    }

    std::vector<std::string> lines;
    for (const auto& line : utils::splitLines(response.output)) {
        if (!utils::trim(line).empty()) {
            lines.push_back(line);
        }
    }
    return ExecutionResult::ok(lines, response.output);
}

std::vector<DiskEntry> ResponseNormalizer::parseRacadmDisks(const std::string& output) {
    std::vector<DiskEntry> disks;
    for (const auto& rawLine : utils::splitLines(output)) {
        std::string line = utils::trim(rawLine);
        if (line.rfind(kRacadmBayMarker, 0) == 0) {
            DiskEntry disk;
            disk.bay = line.substr(0, line.find(':'));
            disks.push_back(disk);
            continue;
        }

        size_t equals = line.find('=');
        if (disks.empty() || equals == std::string::npos) {
            continue;
        }
        std::string key = utils::trim(line.substr(0, equals));
        std::string value = utils::trim(line.substr(equals + 1));
        if (key == "State") {
            disks.back().status = value;
        } else if (key == "Size") {
            disks.back().sizeOrCapacity = value;
        } else if (key == "SerialNumber") {
            disks.back().serialOrHealth = value;
        }
    }
    return disks;
}

ExecutionResult ResponseNormalizer::fromDriveStatus(const std::string& hostname,
                                                    const TransportResponse& response) {
    std::vector<DiskEntry> disks = parseRacadmDisks(response.output);
    std::string errorLine = racadmErrorLine(response.output);
    if (disks.empty() && (response.exitStatus != 0 || !errorLine.empty())) {
        std::string detail = errorLine.empty() ? firstNonEmptyLine(response.output) : errorLine;
        return ExecutionResult::failure(ErrorKind::ProtocolError,
                                        hostname + ": racadm failed" + (detail.empty() ? "" : ": " + detail),
                                        response.output);
    }

    std::vector<std::string> lines;
    lines.push_back(hostname + ": " + std::to_string(disks.size()) + " drive(s) reported");
    for (const auto& disk : disks) {
        lines.push_back(formatDiskLine(disk));
    }

    ExecutionResult result = ExecutionResult::ok(lines, response.output);
    // Drives in this hardware class are installed in pairs
    if (disks.size() % 2 != 0) {
        result.warnings.push_back("WARNING: " + hostname + " reports an odd number of drives (" +
                                  std::to_string(disks.size()) + ")");
    }
    result.disks = disks;
    return result;
}

ExecutionResult ResponseNormalizer::fromDriveLocate(const std::string& hostname, const std::string& slot,
                                                    bool blink, const TransportResponse& response) {
    if (response.output.find(kRacadmSuccessMarker) == std::string::npos) {
        std::string detail = firstNonEmptyLine(response.output);
        return ExecutionResult::failure(ErrorKind::ProtocolError,
                                        hostname + ": failed to " + (blink ? "blink" : "unblink") +
                                        " drive in Slot " + slot + (detail.empty() ? "" : ": " + detail),
                                        response.output);
    }
    return ExecutionResult::ok({hostname + ": Drive in Slot " + slot + " sucessfully set to " +
                                (blink ? "blink." : "unblink.")},
                               response.output);
}

std::string ResponseNormalizer::nvmeBayMarker(Manufacturer manufacturer) {
    switch (manufacturer) {
        case Manufacturer::Dell:       return "Disk.Bay";
        case Manufacturer::Supermicro: return "NVMe";
        case Manufacturer::Unknown:    return "";
    }
    return "";
}

std::string ResponseNormalizer::formatCapacity(double bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    size_t unit = 0;
    while (bytes >= 1000.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        bytes /= 1000.0;
        ++unit;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << bytes << " " << units[unit];
    return out.str();
}

ExecutionResult ResponseNormalizer::fromNvmeStatus(const std::string& hostname, Manufacturer manufacturer,
                                                   const TransportResponse& response) {
    if (response.httpStatus != 200) {
        std::string detail = RedfishClient::extractExtendedError(response.output);
        return ExecutionResult::failure(ErrorKind::ProtocolError,
                                        hostname + ": drive query returned HTTP " +
                                        std::to_string(response.httpStatus) +
                                        (detail.empty() ? "" : ": " + detail),
                                        response.output);
    }

    nlohmann::json doc = nlohmann::json::parse(response.output, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return ExecutionResult::failure(ErrorKind::ProtocolError,
                                        hostname + ": drive query returned malformed JSON",
                                        response.output);
    }

    const char* collectionKey = doc.contains("Drives") ? "Drives" : "Members";
    nlohmann::json records = doc.contains(collectionKey) ? doc[collectionKey] : nlohmann::json::array();
    if (!records.is_array()) {
        return ExecutionResult::failure(ErrorKind::ProtocolError,
                                        hostname + ": drive query returned no drive collection",
                                        response.output);
    }

    std::string marker = nvmeBayMarker(manufacturer);
    std::vector<DiskEntry> disks;
    for (const auto& record : records) {
        if (!record.is_object()) {
            continue;
        }
        std::string id = stringField(record, "Id");
        std::string odataId = stringField(record, "@odata.id");
        if (marker.empty() ||
            (id.find(marker) == std::string::npos && odataId.find(marker) == std::string::npos)) {
            continue;
        }

        DiskEntry disk;
        disk.bay = driveLocation(record);
        disk.model = stringField(record, "Model");
        if (record.contains("CapacityBytes") && record["CapacityBytes"].is_number()) {
            disk.sizeOrCapacity = formatCapacity(record["CapacityBytes"].get<double>());
        }
        if (record.contains("Status") && record["Status"].is_object()) {
            disk.status = stringField(record["Status"], "State");
            disk.serialOrHealth = stringField(record["Status"], "Health");
        }
        disks.push_back(disk);
    }

    if (disks.empty()) {
        ExecutionResult result = ExecutionResult::ok({hostname + ": no compatible drives found"},
                                                     response.output);
        result.disks = disks;
        return result;
    }

    std::vector<std::string> lines;
    lines.push_back(hostname + ": " + std::to_string(disks.size()) + " NVMe drive(s) reported");
    for (const auto& disk : disks) {
        lines.push_back(formatDiskLine(disk));
    }
    ExecutionResult result = ExecutionResult::ok(lines, response.output);
    result.disks = disks;
    return result;
}

ExecutionResult ResponseNormalizer::fromNvmeLocate(const std::string& hostname, const std::string& slot,
                                                   bool blink, const TransportResponse& response) {
    if (response.httpStatus == 200) {
        return ExecutionResult::ok({hostname + ": NVMe drive in Slot " + slot + " sucessfully set to " +
                                    (blink ? "blink." : "unblink.")},
                                   response.output);
    }

    std::string detail = RedfishClient::extractExtendedError(response.output);
    if (detail.empty()) {
        detail = "unexpected HTTP status " + std::to_string(response.httpStatus);
    }
    Logger::warning("NVMe locate on " + hostname + " failed: " + detail);
    return ExecutionResult::failure(ErrorKind::ProtocolError,
                                    hostname + ": failed to " + std::string(blink ? "blink" : "unblink") +
                                    " NVMe drive in Slot " + slot + ": " + detail,
                                    response.output);
}
