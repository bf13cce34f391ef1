#pragma once

#include "sync/model/Message.hpp"

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace hs::api {

struct SyncRequest {
    std::string machine_id, session_id, project_path;
    std::vector<sync::model::Message> messages;
    std::string timestamp;
};

struct SyncResponse {
    bool success{};
    int processed{};
    std::string session_id;
};

struct Conversation {
    std::string session_id, hash, date;
};

struct ConversationsListResponse {
    std::vector<Conversation> conversations;
    int total{};
};

void to_json(nlohmann::ordered_json& j, const SyncRequest& r);
void from_json(const nlohmann::json& j, SyncResponse& r);
void from_json(const nlohmann::json& j, Conversation& c);
void from_json(const nlohmann::json& j, ConversationsListResponse& r);

}
