#pragma once

#include "auth/TokenStore.hpp"

#include <filesystem>

namespace hs::auth {

// {"access_token": ..., "refresh_token": ..., "expires_at": <unix seconds>}, mode 0600
class FileTokenStore : public TokenStore {
public:
    explicit FileTokenStore(std::filesystem::path path);

    [[nodiscard]] Token load() override;
    void save(const Token& token) const;
    void clear() override;

    [[nodiscard]] std::string name() const override { return "file:" + path_.string(); }

private:
    std::filesystem::path path_;
};

}
