#include "sync/DeltaExtractor.hpp"

#include <algorithm>

using namespace hs::sync;
using namespace hs::sync::model;

std::vector<Message> DeltaExtractor::newMessages(const std::span<const Message> messages,
                                                 const std::string& lastSyncedUUID) {
    if (lastSyncedUUID.empty()) return {messages.begin(), messages.end()};

    const auto mark = std::ranges::find(messages, lastSyncedUUID, &Message::uuid);

    // TODO: surface a watermark that vanished as a conflict instead of resending the whole file
    if (mark == messages.end()) return {messages.begin(), messages.end()};

    return {std::next(mark), messages.end()};
}

std::optional<Delta> DeltaExtractor::extract(const LogFile& file,
                                             const std::span<const Message> messages,
                                             const std::string& lastSyncedUUID) {
    auto fresh = newMessages(messages, lastSyncedUUID);
    if (fresh.empty()) return std::nullopt;

    Delta delta{
        .session_id = file.session_id,
        .project_path = file.project_path,
        .messages = std::move(fresh),
        .new_last_uuid = {}
    };
    delta.new_last_uuid = delta.messages.back().uuid;
    return delta;
}
