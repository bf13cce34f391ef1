#include "auth/EnvTokenStore.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>

using namespace hs::auth;
using namespace std::chrono;

EnvTokenStore::EnvTokenStore(std::optional<std::string> token, const std::optional<std::time_t> expiresAt)
    : token_(std::move(token)), expiresAt_(expiresAt) {}

EnvTokenStore EnvTokenStore::fromProcessEnvironment() {
    std::optional<std::string> token;
    std::optional<std::time_t> expires;

    if (const char* t = std::getenv(TOKEN_VAR); t && *t) token = t;
    if (const char* e = std::getenv(EXPIRES_VAR); e && *e) {
        std::time_t v{};
        const auto end = e + std::strlen(e);
        if (const auto [ptr, ec] = std::from_chars(e, end, v); ec == std::errc{} && ptr == end) expires = v;
    }

    return {std::move(token), expires};
}

Token EnvTokenStore::load() {
    if (!token_) throw StoreUnavailable(std::string(TOKEN_VAR) + " is not set");

    Token t;
    t.access_token = *token_;
    // without an explicit expiry the token is trusted for the life of the process
    t.expires_at = expiresAt_ ? system_clock::from_time_t(*expiresAt_) : system_clock::time_point::max();
    return t;
}

void EnvTokenStore::clear() { token_.reset(); }
