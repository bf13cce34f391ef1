#include "sync/Orchestrator.hpp"
#include "sync/DeltaExtractor.hpp"
#include "sync/Hasher.hpp"
#include "sync/Normalizer.hpp"
#include "sync/errors.hpp"
#include "sync/model/SyncState.hpp"
#include "concurrency/CancelToken.hpp"
#include "logging/LogRegistry.hpp"

using namespace hs::sync;
using namespace hs::sync::model;
using namespace hs::logging;

Orchestrator::Orchestrator(const config::Config& cfg,
                           RemoteHashSource& remote,
                           Transmitter& transmitter,
                           CredentialCheck credentials,
                           const concurrency::CancelToken& cancel)
    : cfg_(cfg),
      scanner_(cfg.exclude_patterns),
      store_(cfg.state_path),
      remote_(remote),
      transmitter_(transmitter),
      credentials_(std::move(credentials)),
      cancel_(cancel) {
    if (!credentials_) throw std::invalid_argument("Orchestrator requires a credential check");
}

SyncReport Orchestrator::run() {
    credentials_();

    auto state = store_.load();
    LogRegistry::state()->debug("[Orchestrator] Loaded state for {} sessions from {}",
                                state.sessions.size(), store_.path().string());

    LogRegistry::histsync()->info("[*] Scanning {} for conversations...", cfg_.claude_data_dir.string());
    const auto files = scanner_.scan(cfg_.claude_data_dir);
    LogRegistry::histsync()->info("[*] Found {} conversation files", files.size());

    SyncReport report;

    try {
        const auto remote = fetchRemoteHashes();

        for (const auto& file : files) {
            cancel_.throwIfCancelled();

            switch (syncFile(file, remote, state)) {
                case Outcome::Synced: ++report.synced; break;
                case Outcome::Skipped: ++report.skipped; break;
                case Outcome::Failed: ++report.errored; break;
                case Outcome::Unchanged: break;
            }
        }
    } catch (const CancelledError&) {
        LogRegistry::histsync()->warn("[Orchestrator] Sync cancelled after {} synced sessions", report.synced);
        saveBestEffort(state, "cancellation");
        throw;
    } catch (const std::exception& e) {
        LogRegistry::histsync()->error("[Orchestrator] Sync aborted after {} synced sessions: {}", report.synced, e.what());
        saveBestEffort(state, "aborted run");
        throw;
    }

    store_.save(state);

    LogRegistry::histsync()->info("[✓] Sync complete: {} sessions synced, {} skipped (unchanged), {} errors",
                                  report.synced, report.skipped, report.errored);
    return report;
}

Orchestrator::Outcome Orchestrator::syncFile(const LogFile& file, const RemoteHashes& remote, SyncState& state) {
    const auto log = LogRegistry::sync();

    try {
        const auto messages = Normalizer::readFile(file.path);
        const auto localHash = Hasher::hashSession(file.session_id, file.project_path, messages);

        const auto it = remote.find(file.session_id);
        const std::string remoteHash = it == remote.end() ? std::string{} : it->second;
        if (!Hasher::needsSync(localHash, remoteHash)) {
            log->debug("[Orchestrator] {} unchanged on server, skipping", file.session_id);
            return Outcome::Skipped;
        }

        const auto delta = DeltaExtractor::extract(file, messages, state.lastSyncedUUID(file.session_id));
        if (!delta) {
            log->debug("[Orchestrator] {} has no messages past its watermark", file.session_id);
            return Outcome::Unchanged;
        }

        const auto receipt = transmitter_.transmit(*delta);
        if (!receipt.success) {
            log->warn("[Orchestrator] Sync failed for {}: server reported failure", file.session_id);
            return Outcome::Failed;
        }

        state.updateSession(file.session_id, delta->new_last_uuid, receipt.processed);
        log->info("  Synced {} messages from {}", receipt.processed, file.session_id);
        return Outcome::Synced;
    } catch (const HashError& e) {
        log->warn("[Orchestrator] Error reading {}: {}", file.path.string(), e.what());
    } catch (const DeliveryError& e) {
        log->warn("[Orchestrator] Sync failed for {}: {}", file.session_id, e.what());
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        log->warn("[Orchestrator] Unexpected error syncing {}: {}", file.session_id, e.what());
    }

    return Outcome::Failed;
}

RemoteHashes Orchestrator::fetchRemoteHashes() const {
    LogRegistry::histsync()->info("[*] Fetching conversation list from server...");
    try {
        auto hashes = remote_.fetchRemoteHashes();
        LogRegistry::histsync()->info("[*] Server has {} conversations", hashes.size());
        return hashes;
    } catch (const DeliveryError& e) {
        LogRegistry::histsync()->warn("[Orchestrator] Failed to fetch conversations list: {}", e.what());
        LogRegistry::histsync()->warn("[Orchestrator] Continuing with UUID-based sync (may re-process unchanged conversations)");
        return {};
    }
}

void Orchestrator::saveBestEffort(SyncState& state, const char* after) const {
    try {
        store_.save(state);
    } catch (const PersistError& e) {
        LogRegistry::state()->error("[Orchestrator] Could not save state after {}: {}", after, e.what());
    }
}
