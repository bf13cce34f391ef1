#pragma once

#include "sync/model/Delta.hpp"

#include <string>
#include <unordered_map>

namespace hs::sync {

// sessionId -> content hash of everything the server has already ingested
using RemoteHashes = std::unordered_map<std::string, std::string>;

struct UploadReceipt {
    bool success{};
    int processed{};
    std::string session_id{};
};

class RemoteHashSource {
public:
    virtual ~RemoteHashSource() = default;

    // Throws DeliveryError or CancelledError.
    virtual RemoteHashes fetchRemoteHashes() = 0;
};

class Transmitter {
public:
    virtual ~Transmitter() = default;

    // Owns its own retry policy. Throws DeliveryError or CancelledError.
    virtual UploadReceipt transmit(const model::Delta& delta) = 0;
};

}
