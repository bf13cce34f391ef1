#include "sync/Hasher.hpp"
#include "sync/errors.hpp"
#include "util/hash.hpp"

#include <algorithm>
#include <numeric>

using namespace hs::sync;
using namespace hs::sync::model;
using ordered_json = nlohmann::ordered_json;

std::vector<std::string> Hasher::distinctModels(const std::span<const Message> messages) {
    std::vector<std::string> models;
    for (const auto& m : messages)
        if (!m.model.empty() && std::ranges::find(models, m.model) == models.end())
            models.push_back(m.model);

    if (models.empty()) models.emplace_back("unknown");
    return models;
}

int64_t Hasher::totalTokens(const std::span<const Message> messages) {
    return std::accumulate(messages.begin(), messages.end(), int64_t{0},
                           [](const int64_t acc, const Message& m) { return acc + m.tokens; });
}

std::string Hasher::canonicalContent(const std::string& sessionId,
                                     const std::string& projectPath,
                                     const std::span<const Message> messages) {
    if (messages.empty()) throw HashError("no valid messages in session " + sessionId);

    ordered_json metadata;
    metadata["sessionId"] = sessionId;
    metadata["userId"] = "";
    metadata["projectPath"] = projectPath;
    metadata["timestamp"] = messages.front().timestamp;
    metadata["startTime"] = messages.front().timestamp;
    metadata["endTime"] = messages.back().timestamp;
    metadata["messageCount"] = messages.size();
    metadata["models"] = distinctModels(messages);
    metadata["totalTokens"] = totalTokens(messages);

    try {
        std::string out = metadata.dump();
        for (const auto& m : messages) {
            out += '\n';
            out += toCanonicalJson(m).dump();
        }
        return out;
    } catch (const nlohmann::json::type_error& e) {
        throw HashError("serializing session " + sessionId + ": " + e.what());
    }
}

std::string Hasher::hashSession(const std::string& sessionId,
                                const std::string& projectPath,
                                const std::span<const Message> messages) {
    return util::sha256Hex(canonicalContent(sessionId, projectPath, messages));
}
