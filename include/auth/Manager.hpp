#pragma once

#include "auth/TokenStore.hpp"

#include <memory>
#include <string>

namespace hs::auth {

class Manager {
public:
    explicit Manager(std::shared_ptr<TokenStore> store);

    // A non-expired access token, or CredentialError. Never refreshes.
    [[nodiscard]] std::string validToken() const;

    [[nodiscard]] bool isAuthenticated() const;

    void logout() const;

    [[nodiscard]] const std::shared_ptr<TokenStore>& store() const { return store_; }

private:
    std::shared_ptr<TokenStore> store_;
};

}
