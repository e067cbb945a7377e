#pragma once

#include <chrono>
#include <thread>
#include <utility>

#include <glog/logging.h>

#include "common/config.h"
#include "common/errors.h"

namespace Chronicle {

struct RetryPolicy {
    int max_attempts = kDefaultRetryMaxAttempts;
    std::chrono::milliseconds wait{kDefaultRetryWaitMs};
};

/**
 * Runs fn until it returns without ConcurrencyError, at most
 * policy.max_attempts times. The last ConcurrencyError is rethrown when the
 * attempts run out; any other exception propagates on first sight.
 * fn must re-derive its target position on every call.
 */
template<typename Fn>
auto RetryOnConcurrencyError(const RetryPolicy& policy, Fn&& fn) -> decltype(fn()) {
    const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const ConcurrencyError& e) {
            if (attempt >= attempts) {
                LOG(WARNING) << "Giving up after " << attempt << " attempts: " << e.what();
                throw;
            }
            VLOG(2) << "Concurrency conflict on attempt " << attempt << ": " << e.what();
        }
        if (policy.wait.count() > 0) {
            std::this_thread::sleep_for(policy.wait);
        }
    }
}

} // namespace Chronicle
