#include "inventory/target.hpp"
#include "common/utils.hpp"

Manufacturer manufacturerFromString(const std::string& name) {
    std::string lowered = utils::toLower(name);
    if (lowered.find("dell") != std::string::npos) {
        return Manufacturer::Dell;
    }
    if (lowered.find("supermicro") != std::string::npos ||
        lowered.find("super micro") != std::string::npos) {
        return Manufacturer::Supermicro;
    }
    return Manufacturer::Unknown;
}

std::string manufacturerToString(Manufacturer manufacturer) {
    switch (manufacturer) {
        case Manufacturer::Dell:       return "Dell";
        case Manufacturer::Supermicro: return "Supermicro";
        case Manufacturer::Unknown:    return "Unknown";
    }
    return "Unknown";
}
