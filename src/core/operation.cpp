#include "core/operation.hpp"
#include <map>

namespace {

const std::map<std::string, OperationType>& operationNames() {
    static const std::map<std::string, OperationType> names = {
        {"power", OperationType::Power},
        {"health", OperationType::Health},
        {"sel", OperationType::Sel},
        {"boot", OperationType::SetBootMode},
        {"reboot", OperationType::Reboot},
        {"kdump", OperationType::Kdump},
        {"poweron", OperationType::PowerOn},
        {"drive_status", OperationType::DriveStatus},
        {"drive_locate", OperationType::DriveLocate},
        {"nvme_status", OperationType::NvmeStatus},
        {"nvme_locate", OperationType::NvmeLocate},
    };
    return names;
}

} // namespace

bool operationTypeFromName(const std::string& name, OperationType& type) {
    auto it = operationNames().find(name);
    if (it == operationNames().end()) {
        return false;
    }
    type = it->second;
    return true;
}

std::string operationTypeName(OperationType type) {
    for (const auto& entry : operationNames()) {
        if (entry.second == type) {
            return entry.first;
        }
    }
    return "unknown";
}
