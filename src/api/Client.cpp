#include "api/Client.hpp"
#include "concurrency/CancelToken.hpp"
#include "sync/errors.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>

using namespace hs::api;
using namespace hs::sync;
using namespace hs::util;
using namespace hs::logging;
using namespace std::chrono;

namespace {

int abortOnCancel(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return static_cast<const hs::concurrency::CancelToken*>(userdata)->isCancelled() ? 1 : 0;
}

std::string clip(const std::string& body, const size_t max = 512) {
    if (body.size() <= max) return body;
    return body.substr(0, max) + "...";
}

}

Client::Client(std::string endpoint, std::string machineId, config::HttpConfig http,
               TokenProvider tokens, const concurrency::CancelToken& cancel)
    : endpoint_(std::move(endpoint)), machineId_(std::move(machineId)), http_(http),
      tokens_(std::move(tokens)), cancel_(cancel) {
    if (!tokens_) throw std::invalid_argument("Client requires a token provider");
    while (!endpoint_.empty() && endpoint_.back() == '/') endpoint_.pop_back();
}

HttpResponse Client::send(const std::string& method, const std::string& path,
                          const std::string& body, const std::string& bearer) {
    const auto url = endpoint_ + path;

    SList hdrs;
    hdrs.add("Content-Type: application/json");
    hdrs.add("Authorization: Bearer " + bearer);
    hdrs.add("X-Machine-ID: " + machineId_);

    return performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(http_.timeout_seconds));
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, abortOnCancel);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &cancel_);

        if (method == "POST") {
            curl_easy_setopt(h, CURLOPT_POST, 1L);
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        } else if (method == "GET") {
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        } else {
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
        }
    });
}

milliseconds Client::backoffFor(const config::HttpConfig& http, const unsigned int retry) {
    if (retry == 0) return milliseconds{0};
    // base fits in 32 bits, so a shift of at most 31 can't overflow 64
    const auto ms = static_cast<uint64_t>(http.backoff_base_ms) << std::min(retry - 1, 31u);
    const auto cap = static_cast<uint64_t>(MAX_BACKOFF.count());
    return milliseconds{static_cast<milliseconds::rep>(std::min(ms, cap))};
}

std::string Client::doWithRetry(const std::string& method, const std::string& path, const std::string& body) {
    std::string lastErr;
    long lastStatus = 0;

    for (unsigned int attempt = 0; attempt <= http_.max_retries; ++attempt) {
        if (attempt > 0) {
            const auto backoff = backoffFor(http_, attempt);
            LogRegistry::http()->warn("[Client] {} {} failed ({}), retry {}/{} in {}ms",
                                      method, path, lastErr, attempt, http_.max_retries, backoff.count());
            if (!cancel_.waitFor(backoff)) throw CancelledError();
        }

        cancel_.throwIfCancelled();

        std::string bearer;
        try {
            bearer = tokens_();
        } catch (const CredentialError& e) {
            throw DeliveryError(std::string("getting auth token: ") + e.what());
        }

        const auto resp = send(method, path, body, bearer);

        if (resp.curl == CURLE_ABORTED_BY_CALLBACK && cancel_.isCancelled()) throw CancelledError();
        if (resp.curl != CURLE_OK)
            throw DeliveryError(std::string("executing request: ") + curl_easy_strerror(resp.curl));

        if (resp.http >= 200 && resp.http < 300) return resp.body;

        lastStatus = resp.http;
        lastErr = "HTTP " + std::to_string(resp.http) + ": " + clip(resp.body);

        if (!isRetryable(resp.http)) throw DeliveryError(lastErr, resp.http);
    }

    throw DeliveryError("max retries exceeded: " + lastErr, lastStatus);
}

ConversationsListResponse Client::listConversations() {
    const auto body = doWithRetry("GET", "/conversations", "");
    try {
        return nlohmann::json::parse(body).get<ConversationsListResponse>();
    } catch (const nlohmann::json::exception& e) {
        throw DeliveryError(std::string("parsing response: ") + e.what());
    }
}

SyncResponse Client::sync(const SyncRequest& req) {
    const auto payload = nlohmann::ordered_json(req).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    const auto body = doWithRetry("POST", "/sync", payload);
    try {
        return nlohmann::json::parse(body).get<SyncResponse>();
    } catch (const nlohmann::json::exception& e) {
        throw DeliveryError(std::string("parsing response: ") + e.what());
    }
}

RemoteHashes Client::fetchRemoteHashes() {
    const auto list = listConversations();

    RemoteHashes hashes;
    hashes.reserve(list.conversations.size());
    for (const auto& c : list.conversations) hashes[c.session_id] = c.hash;

    LogRegistry::http()->debug("[Client] Server reports {} conversations ({} hashes)", list.total, hashes.size());
    return hashes;
}

UploadReceipt Client::transmit(const model::Delta& delta) {
    const auto resp = sync({
        .machine_id = machineId_,
        .session_id = delta.session_id,
        .project_path = delta.project_path,
        .messages = delta.messages,
        .timestamp = nowRfc3339()
    });

    return {.success = resp.success, .processed = resp.processed, .session_id = resp.session_id};
}
