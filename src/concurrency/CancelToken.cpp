#include "concurrency/CancelToken.hpp"
#include "sync/errors.hpp"

#include <algorithm>
#include <thread>

using namespace hs::concurrency;
using namespace std::chrono;

bool CancelToken::waitFor(const milliseconds d) const {
    const auto deadline = steady_clock::now() + d;
    while (!isCancelled()) {
        const auto now = steady_clock::now();
        if (now >= deadline) return true;
        std::this_thread::sleep_for(std::min<steady_clock::duration>(POLL_INTERVAL, deadline - now));
    }
    return false;
}

void CancelToken::throwIfCancelled() const {
    if (isCancelled()) throw sync::CancelledError();
}
