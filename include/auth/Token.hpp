#pragma once

#include <chrono>
#include <string>

namespace hs::auth {

struct Token {
    static constexpr std::chrono::seconds EXPIRY_SKEW{60};

    std::string access_token, refresh_token;
    std::chrono::system_clock::time_point expires_at{};

    // Treated as expired a minute early so it can't lapse mid-request.
    [[nodiscard]] bool isExpired() const { return std::chrono::system_clock::now() >= expires_at - EXPIRY_SKEW; }
    [[nodiscard]] bool isValid() const { return !access_token.empty() && !isExpired(); }
};

}
