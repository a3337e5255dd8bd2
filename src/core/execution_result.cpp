#include "core/execution_result.hpp"

ExecutionResult ExecutionResult::ok(const std::vector<std::string>& lines, const std::string& rawOutput) {
    ExecutionResult result;
    result.success = true;
    result.lines = lines;
    result.rawOutput = rawOutput;
    return result;
}

ExecutionResult ExecutionResult::failure(ErrorKind kind, const std::string& message,
                                         const std::string& rawOutput) {
    ExecutionResult result;
    result.success = false;
    result.errorKind = kind;
    result.errorMessage = message;
    result.rawOutput = rawOutput;
    return result;
}

nlohmann::json ExecutionResult::toJson() const {
    nlohmann::json doc = {
        {"success", success},
        {"lines", lines},
        {"warnings", warnings}
    };

    if (!success) {
        doc["error"] = {
            {"kind", errorKindToString(errorKind)},
            {"message", errorMessage}
        };
    }

    if (disks) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& disk : *disks) {
            nlohmann::json entry = {
                {"bay", disk.bay},
                {"status", disk.status},
                {"size", disk.sizeOrCapacity},
                {"serial_or_health", disk.serialOrHealth}
            };
            if (!disk.model.empty()) {
                entry["model"] = disk.model;
            }
            entries.push_back(entry);
        }
        doc["disks"] = entries;
    }
    return doc;
}
