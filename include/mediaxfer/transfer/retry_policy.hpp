#pragma once

#include "mediaxfer/core/constants.hpp"
#include "mediaxfer/core/errors.hpp"
#include "mediaxfer/core/log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace mediaxfer {

struct RetryOptions {
    uint32_t max_attempts = constants::DEFAULT_RETRY_ATTEMPTS;  // total, including the first
    std::chrono::milliseconds base_delay{constants::DEFAULT_RETRY_BASE_DELAY_MS};
};

enum class RetryDecision {
    Retry,
    Abort
};

using RetryClassifier = std::function<RetryDecision(const TransferError&)>;

/// Abort on the fatal deny-list (is_fatal), retry everything else.
RetryDecision classify_default(const TransferError& error);

/// Passed to the attempt hook before each backoff sleep.
struct AttemptInfo {
    uint32_t attempt = 0;             // the attempt that just failed (1-based)
    uint32_t attempts_remaining = 0;
    std::chrono::milliseconds delay{0};
    const TransferError* error = nullptr;
};

using AttemptHook = std::function<void(const AttemptInfo&)>;
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// base * 2^(attempt - 1)
std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base, uint32_t attempt);

/// Bounded-attempt exponential backoff around an operation that returns a
/// result struct with `bool success` and `TransferError error`.
///
/// Attempts run strictly one after another. A failure classified Abort is
/// returned immediately; otherwise the operation is re-run until it
/// succeeds or max_attempts is reached. The returned error carries the
/// number of attempts made.
class RetryPolicy {
public:
    explicit RetryPolicy(RetryOptions options = {}, Sleeper sleeper = {});

    const RetryOptions& options() const { return options_; }

    template <typename Op>
    std::invoke_result_t<Op&> execute(Op&& op,
                                      const RetryClassifier& classify = classify_default,
                                      const AttemptHook& on_attempt = {},
                                      uint32_t* attempts_made = nullptr) const {
        const uint32_t max_attempts = std::max<uint32_t>(1, options_.max_attempts);

        for (uint32_t attempt = 1;; ++attempt) {
            auto result = op();
            if (attempts_made) *attempts_made = attempt;
            if (result.success) {
                return result;
            }

            result.error.attempts = attempt;
            if (attempt >= max_attempts) {
                return result;
            }
            RetryDecision decision = classify ? classify(result.error) : classify_default(result.error);
            if (decision == RetryDecision::Abort) {
                return result;
            }

            AttemptInfo info;
            info.attempt = attempt;
            info.attempts_remaining = max_attempts - attempt;
            info.delay = backoff_delay(options_.base_delay, attempt);
            info.error = &result.error;
            notify(on_attempt, info);
            sleeper_(info.delay);
        }
    }

private:
    static void notify(const AttemptHook& hook, const AttemptInfo& info) {
        if (!hook) return;
        try {
            hook(info);
        } catch (const std::exception& e) {
            log_warn("retry hook failed: %s", e.what());
        }
    }

    RetryOptions options_;
    Sleeper sleeper_;
};

} // namespace mediaxfer
