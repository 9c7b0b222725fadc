#include "mediaxfer/transfer/retry_policy.hpp"

#include <thread>

namespace mediaxfer {

RetryDecision classify_default(const TransferError& error) {
    return error.fatal() ? RetryDecision::Abort : RetryDecision::Retry;
}

std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base, uint32_t attempt) {
    if (attempt == 0) attempt = 1;
    // Cap the shift
    uint32_t shift = std::min<uint32_t>(attempt - 1, 30);
    return base * (int64_t{1} << shift);
}

RetryPolicy::RetryPolicy(RetryOptions options, Sleeper sleeper)
    : options_(options)
    , sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

} // namespace mediaxfer
