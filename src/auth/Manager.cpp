#include "auth/Manager.hpp"
#include "sync/errors.hpp"
#include "logging/LogRegistry.hpp"

using namespace hs::auth;
using namespace hs::logging;
using hs::sync::CredentialError;

Manager::Manager(std::shared_ptr<TokenStore> store) : store_(std::move(store)) {
    if (!store_) throw std::invalid_argument("auth::Manager requires a token store");
}

std::string Manager::validToken() const {
    Token token;
    try {
        token = store_->load();
    } catch (const StoreUnavailable& e) {
        throw CredentialError(std::string("token store unavailable: ") + e.what());
    }

    if (token.access_token.empty()) throw CredentialError("no access token stored in " + store_->name());
    if (token.isExpired()) throw CredentialError("access token from " + store_->name() + " has expired, log in again");

    return token.access_token;
}

bool Manager::isAuthenticated() const {
    try {
        return !validToken().empty();
    } catch (const CredentialError& e) {
        LogRegistry::auth()->debug("[auth::Manager] Not authenticated: {}", e.what());
        return false;
    }
}

void Manager::logout() const { store_->clear(); }
