#pragma once

#include "inventory/target.hpp"
#include "common/error_kind.hpp"
#include <string>
#include <nlohmann/json.hpp>

class InventoryResolver {
public:
    virtual ~InventoryResolver() = default;

    // Fills target on success; on failure getLastErrorKind() is one of
    // NotFound, Ambiguous, MissingAttribute, InvalidAddress or ProtocolError
    virtual bool resolve(const std::string& hostname, Target& target) = 0;

    virtual std::string getLastError() const = 0;
    virtual ErrorKind getLastErrorKind() const = 0;
};

// Validates the records an inventory query returned for hostname.
// Accepts a bare array or an object wrapping the array under "results".
bool selectInventoryRecord(const std::string& hostname, const nlohmann::json& records,
                           Target& target, ErrorKind& errorKind, std::string& error);
