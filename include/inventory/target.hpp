#pragma once

#include <string>

enum class Manufacturer {
    Dell,
    Supermicro,
    Unknown
};

struct Target {
    std::string hostname;
    std::string managementAddress;
    Manufacturer manufacturer{Manufacturer::Unknown};
};

// Inventory spellings vary ("Dell Inc.", "DELL", "Supermicro", "Super Micro Computer")
Manufacturer manufacturerFromString(const std::string& name);
std::string manufacturerToString(Manufacturer manufacturer);
