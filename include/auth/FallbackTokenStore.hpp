#pragma once

#include "auth/TokenStore.hpp"

#include <memory>

namespace hs::auth {

/**
 * Reads from the primary store while it is reachable and from the secondary
 * otherwise. The first StoreUnavailable from the primary moves the store to
 * PrimaryUnavailable for good; from then on only the secondary is consulted.
 */
class FallbackTokenStore : public TokenStore {
public:
    enum class Mode { PrimaryAvailable, PrimaryUnavailable };

    FallbackTokenStore(std::unique_ptr<TokenStore> primary, std::unique_ptr<TokenStore> secondary);

    [[nodiscard]] Token load() override;
    void clear() override;

    [[nodiscard]] std::string name() const override;
    [[nodiscard]] Mode mode() const { return mode_; }

private:
    std::unique_ptr<TokenStore> primary_, secondary_;
    Mode mode_{Mode::PrimaryAvailable};

    void markPrimaryUnavailable(const std::string& why);
};

}
