#include "sync/model/SyncState.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace hs::sync::model;

std::string SyncState::lastSyncedUUID(const std::string& sessionId) const {
    if (const auto it = sessions.find(sessionId); it != sessions.end()) return it->second.last_synced_uuid;
    return {};
}

void SyncState::updateSession(const std::string& sessionId, const std::string& lastUUID, const int messageCount) {
    sessions[sessionId] = {
        .last_synced_uuid = lastUUID,
        .last_sync_at = util::nowRfc3339(),
        .message_count = messageCount
    };
}

void hs::sync::model::to_json(nlohmann::json& j, const SessionState& s) {
    j = {
        {"last_synced_uuid", s.last_synced_uuid},
        {"last_sync_at", s.last_sync_at},
        {"message_count", s.message_count}
    };
}

void hs::sync::model::from_json(const nlohmann::json& j, SessionState& s) {
    s.last_synced_uuid = j.value("last_synced_uuid", std::string{});
    s.last_sync_at = j.value("last_sync_at", std::string{});
    s.message_count = j.value("message_count", 0);
}

void hs::sync::model::to_json(nlohmann::json& j, const SyncState& s) {
    j = {
        {"sessions", s.sessions},
        {"last_sync_at", s.last_sync_at}
    };
}

void hs::sync::model::from_json(const nlohmann::json& j, SyncState& s) {
    s.sessions.clear();
    if (const auto it = j.find("sessions"); it != j.end() && !it->is_null())
        it->get_to(s.sessions);
    s.last_sync_at = j.value("last_sync_at", std::string{});
}
