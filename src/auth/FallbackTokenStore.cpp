#include "auth/FallbackTokenStore.hpp"
#include "sync/errors.hpp"
#include "logging/LogRegistry.hpp"

using namespace hs::auth;
using namespace hs::logging;
using hs::sync::CredentialError;

FallbackTokenStore::FallbackTokenStore(std::unique_ptr<TokenStore> primary, std::unique_ptr<TokenStore> secondary)
    : primary_(std::move(primary)), secondary_(std::move(secondary)) {
    if (!secondary_) throw std::invalid_argument("FallbackTokenStore requires a secondary store");
    if (!primary_) mode_ = Mode::PrimaryUnavailable;
}

void FallbackTokenStore::markPrimaryUnavailable(const std::string& why) {
    if (mode_ == Mode::PrimaryUnavailable) return;
    mode_ = Mode::PrimaryUnavailable;
    LogRegistry::auth()->info("[FallbackTokenStore] {} unavailable ({}), using {} from now on",
                              primary_->name(), why, secondary_->name());
}

Token FallbackTokenStore::load() {
    if (mode_ == Mode::PrimaryAvailable) {
        try {
            return primary_->load();
        } catch (const StoreUnavailable& e) {
            markPrimaryUnavailable(e.what());
        } catch (const CredentialError& e) {
            LogRegistry::auth()->debug("[FallbackTokenStore] {} has no usable token: {}", primary_->name(), e.what());
        }
    }

    return secondary_->load();
}

void FallbackTokenStore::clear() {
    std::string errors;

    if (mode_ == Mode::PrimaryAvailable) {
        try {
            primary_->clear();
        } catch (const StoreUnavailable& e) {
            markPrimaryUnavailable(e.what());
        } catch (const std::exception& e) {
            errors += "clearing " + primary_->name() + ": " + e.what() + "; ";
        }
    }

    try {
        secondary_->clear();
    } catch (const std::exception& e) {
        errors += "clearing " + secondary_->name() + ": " + e.what();
    }

    if (!errors.empty()) throw std::runtime_error("errors clearing tokens: " + errors);
}

std::string FallbackTokenStore::name() const {
    if (mode_ == Mode::PrimaryAvailable) return primary_->name() + " (fallback " + secondary_->name() + ")";
    return secondary_->name();
}
