#pragma once

#include "config/Config.hpp"
#include "sync/Remote.hpp"
#include "sync/Scanner.hpp"
#include "sync/StateStore.hpp"

#include <functional>

namespace hs::concurrency {
class CancelToken;
}

namespace hs::sync {

struct SyncReport {
    unsigned int synced{}, skipped{}, errored{};
};

// Throws CredentialError when no usable bearer token can be produced.
using CredentialCheck = std::function<void()>;

class Orchestrator {
public:
    enum class Outcome { Synced, Skipped, Unchanged, Failed };

    Orchestrator(const config::Config& cfg,
                 RemoteHashSource& remote,
                 Transmitter& transmitter,
                 CredentialCheck credentials,
                 const concurrency::CancelToken& cancel);

    /**
     * Init -> LoadState -> Scan -> per file (Hash -> CompareRemote ->
     * Skip | ExtractDelta -> Transmit -> UpdateState) -> PersistState.
     *
     * Per-file failures are counted in the report and never abort the run.
     * CredentialError, ScanError, StateError and PersistError propagate.
     * When the run is cancelled or aborted, the sessions already committed to
     * memory are saved (best effort) before the exception propagates.
     */
    SyncReport run();

    // One session against the remote hash map, mutating state on success.
    Outcome syncFile(const model::LogFile& file, const RemoteHashes& remote, model::SyncState& state);

private:
    const config::Config& cfg_;
    Scanner scanner_;
    StateStore store_;
    RemoteHashSource& remote_;
    Transmitter& transmitter_;
    CredentialCheck credentials_;
    const concurrency::CancelToken& cancel_;

    RemoteHashes fetchRemoteHashes() const;
    // Used on the way out of a failed run; PersistError is logged, not thrown.
    void saveBestEffort(model::SyncState& state, const char* after) const;
};

}
