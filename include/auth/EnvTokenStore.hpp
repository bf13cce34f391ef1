#pragma once

#include "auth/TokenStore.hpp"

#include <ctime>
#include <optional>

namespace hs::auth {

// A token handed to the process from outside (HISTSYNC_ACCESS_TOKEN),
// captured once at startup. Unavailable when none was given.
class EnvTokenStore : public TokenStore {
public:
    static constexpr auto TOKEN_VAR = "HISTSYNC_ACCESS_TOKEN";
    static constexpr auto EXPIRES_VAR = "HISTSYNC_TOKEN_EXPIRES_AT";

    EnvTokenStore(std::optional<std::string> token, std::optional<std::time_t> expiresAt);

    static EnvTokenStore fromProcessEnvironment();

    [[nodiscard]] Token load() override;
    void clear() override;

    [[nodiscard]] std::string name() const override { return "environment"; }

private:
    std::optional<std::string> token_;
    std::optional<std::time_t> expiresAt_;
};

}
