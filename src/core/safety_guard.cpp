#include "core/safety_guard.hpp"
#include "common/logger.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

SafetyGuard::SafetyGuard(std::shared_ptr<FleetNotifier> notifier)
    : notifier_(std::move(notifier)) {
}

std::string SafetyGuard::confirmationToken(const std::string& hostname) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;

    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (!mdctx) {
        throw std::runtime_error("Failed to create digest context");
    }

    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(mdctx, hostname.data(), hostname.size()) != 1 ||
        EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("Failed to compute confirmation digest");
    }
    EVP_MD_CTX_free(mdctx);

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str().substr(0, kTokenLength);
}

bool SafetyGuard::verifyConfirmation(const std::string& hostname, const std::string& supplied) const {
    if (supplied.empty()) {
        return false;
    }
    return supplied == confirmationToken(hostname);
}

void SafetyGuard::notifyOffline(const std::string& hostname, const std::string& reason) {
    if (!notifier_) {
        Logger::warning("No fleet-status notifier configured, " + hostname + " not marked offline");
        return;
    }

    try {
        if (!notifier_->setOffline(hostname, reason)) {
            Logger::warning("Could not mark " + hostname + " offline: " + notifier_->getLastError());
        }
    } catch (const std::exception& e) {
        Logger::warning("Could not mark " + hostname + " offline: " + std::string(e.what()));
    }
}
