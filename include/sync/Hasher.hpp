#pragma once

#include "sync/model/Message.hpp"

#include <span>
#include <string>
#include <vector>

namespace hs::sync {

/**
 * Content digest of a session, compared against the digest the server
 * computes over the same data. The canonical form is:
 *
 *   <metadata line>\n<message line>\n...<message line>
 *
 * with every line a compact JSON object whose key order is fixed. The
 * metadata keys are sessionId, userId (always ""), projectPath, timestamp,
 * startTime, endTime, messageCount, models, totalTokens. Any change to that
 * layout desynchronises change detection with the server.
 */
struct Hasher {
    // Throws HashError when messages is empty.
    static std::string hashSession(const std::string& sessionId,
                                   const std::string& projectPath,
                                   std::span<const model::Message> messages);

    // The exact bytes that get hashed.
    static std::string canonicalContent(const std::string& sessionId,
                                        const std::string& projectPath,
                                        std::span<const model::Message> messages);

    // Distinct non-empty models in order of first appearance, or {"unknown"}.
    static std::vector<std::string> distinctModels(std::span<const model::Message> messages);

    static int64_t totalTokens(std::span<const model::Message> messages);

    // A missing remote hash always means the session needs syncing.
    [[nodiscard]] static bool needsSync(const std::string& localHash, const std::string& remoteHash) {
        return remoteHash.empty() || localHash != remoteHash;
    }
};

}
