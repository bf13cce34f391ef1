#include "api/model.hpp"

#include <nlohmann/json.hpp>

using namespace hs::api;

namespace {

std::string stringOrEmpty(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    return it->get<std::string>();
}

}

void hs::api::to_json(nlohmann::ordered_json& j, const SyncRequest& r) {
    auto messages = nlohmann::ordered_json::array();
    for (const auto& m : r.messages) messages.push_back(sync::model::toCanonicalJson(m));

    j = nlohmann::ordered_json::object();
    j["machineId"] = r.machine_id;
    j["sessionId"] = r.session_id;
    j["projectPath"] = r.project_path;
    j["messages"] = std::move(messages);
    j["timestamp"] = r.timestamp;
}

void hs::api::from_json(const nlohmann::json& j, SyncResponse& r) {
    r.success = j.value("success", false);
    r.processed = j.value("processed", 0);
    r.session_id = stringOrEmpty(j, "sessionId");
}

void hs::api::from_json(const nlohmann::json& j, Conversation& c) {
    c.session_id = stringOrEmpty(j, "sessionId");
    c.hash = stringOrEmpty(j, "hash");
    c.date = stringOrEmpty(j, "date");
}

void hs::api::from_json(const nlohmann::json& j, ConversationsListResponse& r) {
    r.conversations.clear();
    if (const auto it = j.find("conversations"); it != j.end() && !it->is_null())
        it->get_to(r.conversations);
    r.total = j.value("total", 0);
}
