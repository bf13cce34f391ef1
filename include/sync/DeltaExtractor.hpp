#pragma once

#include "sync/model/Delta.hpp"
#include "sync/model/LogFile.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace hs::sync {

struct DeltaExtractor {
    /**
     * Messages strictly after the watermark, in file order.
     *  - empty watermark: everything is new
     *  - watermark is the last message: nothing is new
     *  - watermark not present: the file was rewritten, everything is new again
     */
    static std::vector<model::Message> newMessages(std::span<const model::Message> messages,
                                                   const std::string& lastSyncedUUID);

    // std::nullopt when there is nothing new.
    static std::optional<model::Delta> extract(const model::LogFile& file,
                                               std::span<const model::Message> messages,
                                               const std::string& lastSyncedUUID);
};

}
