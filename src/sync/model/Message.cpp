#include "sync/model/Message.hpp"

using namespace hs::sync::model;

nlohmann::ordered_json hs::sync::model::toCanonicalJson(const Message& m) {
    nlohmann::ordered_json j;
    j["uuid"] = m.uuid;
    j["timestamp"] = m.timestamp;
    j["role"] = m.role;
    j["content"] = m.content;
    if (!m.model.empty()) j["model"] = m.model;
    if (m.tokens != 0) j["tokens"] = m.tokens;
    return j;
}
