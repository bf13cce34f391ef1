#pragma once

#include <map>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace hs::sync::model {

struct SessionState {
    std::string last_synced_uuid{}, last_sync_at{};
    int message_count{};

    bool operator==(const SessionState&) const = default;
};

struct SyncState {
    std::map<std::string, SessionState> sessions{};
    std::string last_sync_at{};

    // Empty string when the session has never been synced.
    [[nodiscard]] std::string lastSyncedUUID(const std::string& sessionId) const;

    void updateSession(const std::string& sessionId, const std::string& lastUUID, int messageCount);
};

void to_json(nlohmann::json& j, const SessionState& s);
void from_json(const nlohmann::json& j, SessionState& s);
void to_json(nlohmann::json& j, const SyncState& s);
void from_json(const nlohmann::json& j, SyncState& s);

}
