#pragma once

#include "auth/Token.hpp"

#include <stdexcept>
#include <string>

namespace hs::auth {

// The store's backend can't be reached at all (as opposed to holding no token).
struct StoreUnavailable : std::runtime_error {
    using std::runtime_error::runtime_error;
};

class TokenStore {
public:
    virtual ~TokenStore() = default;

    // Throws StoreUnavailable, or CredentialError when nothing usable is stored.
    [[nodiscard]] virtual Token load() = 0;

    virtual void clear() = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

}
