#include "backoff_policy.h"

#include <algorithm>

namespace mcphub {

int BackoffPolicy::delayForFailure(int consecutiveFailures) const {
    if (consecutiveFailures <= 0 || baseMs <= 0) {
        return std::max(0, baseMs);
    }
    const qint64 cap = std::max(capMs, baseMs);
    qint64 delay = baseMs;
    for (int i = 1; i < consecutiveFailures && delay < cap; ++i) {
        delay *= 2;
    }
    return static_cast<int>(std::min(delay, cap));
}

bool BackoffPolicy::allowsRetry(int consecutiveFailures) const {
    return maxRetries < 0 || consecutiveFailures <= maxRetries;
}

QJsonObject BackoffPolicy::toJson() const {
    return QJsonObject{
        {"baseMs", baseMs},
        {"capMs", capMs},
        {"maxRetries", maxRetries},
        {"stableResetMs", stableResetMs},
    };
}

} // namespace mcphub
