#pragma once

#include <string>

enum class OperationType {
    Power,
    Health,
    Sel,
    SetBootMode,
    Reboot,
    Kdump,
    PowerOn,
    DriveStatus,
    DriveLocate,
    NvmeStatus,
    NvmeLocate
};

// Sub-arguments are kept as typed so the router can validate them
struct Operation {
    OperationType type{OperationType::Power};
    std::string bootTarget;     // SetBootMode: "pxe" or "bios"
    std::string locateState;    // DriveLocate, NvmeLocate: "on" or "off"
    std::string slot;           // DriveLocate, NvmeLocate: decimal bay number
    std::string confirmation;   // Reboot, Kdump: --magic
    std::string reason;         // Reboot, Kdump: --reason
};

// Command-line names: power, health, sel, boot, reboot, kdump, poweron,
// drive_status, drive_locate, nvme_status, nvme_locate
bool operationTypeFromName(const std::string& name, OperationType& type);
std::string operationTypeName(OperationType type);
