#pragma once

#include "sync/model/Message.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace hs::sync {

struct Normalizer {
    /**
     * Classifies one log line. The structured shape (uuid/timestamp/type plus a
     * nested `message` object) is tried first, then the legacy flat shape.
     * Returns std::nullopt for blank lines, invalid JSON, and records that end
     * up without a uuid or role. Never throws for content problems.
     */
    static std::optional<model::Message> normalizeLine(std::string_view line);

    // Every valid message in file order. Throws HashError if the file can't be read.
    static std::vector<model::Message> readFile(const std::filesystem::path& path);

    static std::optional<model::Message> fromStructured(const nlohmann::json& record);
    static std::optional<model::Message> fromLegacy(const nlohmann::json& record);
};

}
