#pragma once

#include "sync/model/SyncState.hpp"

#include <filesystem>

namespace hs::sync {

class StateStore {
public:
    explicit StateStore(std::filesystem::path path);

    // Missing file => fresh state. Anything else that goes wrong => StateError.
    [[nodiscard]] model::SyncState load() const;

    // Stamps state.last_sync_at, then writes <path>.tmp (0600) and renames it
    // over <path>. Throws PersistError; the temp file never outlives a failure.
    void save(model::SyncState& state) const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;

    void writeFileSynced(const std::filesystem::path& target, const std::string& data) const;
};

}
