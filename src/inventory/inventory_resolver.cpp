#include "inventory/inventory_resolver.hpp"
#include "common/utils.hpp"

namespace {

bool isPlaceholderAddress(const std::string& address) {
    std::string trimmed = utils::trim(address);
    return trimmed.empty() || trimmed == "\"\"" || trimmed == "''" || trimmed == "0.0.0.0";
}

bool readStringField(const nlohmann::json& record, const char* key, std::string& value) {
    if (!record.contains(key) || record[key].is_null()) {
        return false;
    }
    if (!record[key].is_string()) {
        return false;
    }
    value = record[key].get<std::string>();
    return true;
}

} // namespace

bool selectInventoryRecord(const std::string& hostname, const nlohmann::json& records,
                           Target& target, ErrorKind& errorKind, std::string& error) {
    const nlohmann::json* list = &records;
    if (records.is_object() && records.contains("results")) {
        list = &records["results"];
    }

    if (!list->is_array()) {
        errorKind = ErrorKind::ProtocolError;
        error = "inventory returned an unexpected document for " + hostname;
        return false;
    }

    if (list->empty()) {
        errorKind = ErrorKind::NotFound;
        error = hostname + " was not found in inventory";
        return false;
    }

    if (list->size() > 1) {
        errorKind = ErrorKind::Ambiguous;
        error = hostname + " matches " + std::to_string(list->size()) +
                " inventory records, qualify the hostname (e.g. add the region suffix)";
        return false;
    }

    const nlohmann::json& record = list->front();
    if (!record.is_object()) {
        errorKind = ErrorKind::ProtocolError;
        error = "inventory record for " + hostname + " is not an object";
        return false;
    }

    std::string address;
    std::string manufacturer;
    if (!readStringField(record, "management_address", address)) {
        errorKind = ErrorKind::MissingAttribute;
        error = "inventory record for " + hostname + " has no management address";
        return false;
    }
    if (!readStringField(record, "manufacturer", manufacturer)) {
        errorKind = ErrorKind::MissingAttribute;
        error = "inventory record for " + hostname + " has no manufacturer";
        return false;
    }

    if (isPlaceholderAddress(address)) {
        errorKind = ErrorKind::InvalidAddress;
        error = hostname + " has no usable management address ('" + address + "')";
        return false;
    }

    target.hostname = hostname;
    target.managementAddress = utils::trim(address);
    target.manufacturer = manufacturerFromString(manufacturer);
    errorKind = ErrorKind::None;
    error.clear();
    return true;
}
