#pragma once

#include "api/model.hpp"
#include "config/Config.hpp"
#include "sync/Remote.hpp"
#include "util/curlWrappers.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace hs::concurrency {
class CancelToken;
}

namespace hs::api {

// Produces a currently valid bearer token or throws CredentialError.
using TokenProvider = std::function<std::string()>;

class Client : public sync::RemoteHashSource, public sync::Transmitter {
public:
    Client(std::string endpoint, std::string machineId, config::HttpConfig http,
           TokenProvider tokens, const concurrency::CancelToken& cancel);

    ~Client() override = default;

    // GET /conversations
    [[nodiscard]] ConversationsListResponse listConversations();

    // POST /sync
    [[nodiscard]] SyncResponse sync(const SyncRequest& req);

    sync::RemoteHashes fetchRemoteHashes() override;
    sync::UploadReceipt transmit(const sync::model::Delta& delta) override;

    [[nodiscard]] const std::string& endpoint() const { return endpoint_; }

    static constexpr std::chrono::milliseconds MAX_BACKOFF{std::chrono::minutes(5)};

    // backoff_base_ms * 2^(retry-1), capped at MAX_BACKOFF.
    [[nodiscard]] static std::chrono::milliseconds backoffFor(const config::HttpConfig& http, unsigned int retry);

protected:
    // One HTTP exchange, no retries. Overridden in tests.
    virtual util::HttpResponse send(const std::string& method, const std::string& path,
                                    const std::string& body, const std::string& bearer);

private:
    std::string endpoint_, machineId_;
    config::HttpConfig http_;
    TokenProvider tokens_;
    const concurrency::CancelToken& cancel_;

    // Returns the body of the first 2xx response. 429 and 5xx are retried
    // with exponential backoff; everything else fails at once.
    std::string doWithRetry(const std::string& method, const std::string& path, const std::string& body);

    [[nodiscard]] static bool isRetryable(long status) { return status == 429 || status >= 500; }
};

}
