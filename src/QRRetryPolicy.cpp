// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRRetryPolicy.h"
#include <cmath>
#include <algorithm>

QT_BEGIN_NAMESPACE

namespace QRelay {

QRRetryPolicy::QRRetryPolicy() = default;

QRRetryPolicy::QRRetryPolicy(int retries, int initialDelayMs, double backoff)
    : maxRetries(retries)
    , initialDelay(initialDelayMs)
    , backoffMultiplier(backoff)
{
}

bool QRRetryPolicy::shouldRetry(RelayError error, int attemptCount) const
{
    if (maxRetries <= 0 || attemptCount >= maxRetries) {
        return false;
    }
    return retryableErrors.contains(error);
}

std::chrono::milliseconds QRRetryPolicy::delayForAttempt(int attemptCount) const
{
    if (attemptCount < 0) {
        return initialDelay;
    }

    // double 避免整数溢出
    double delayMs = initialDelay.count() * std::pow(backoffMultiplier, attemptCount);
    delayMs = std::min(delayMs, static_cast<double>(maxDelay.count()));

    return std::chrono::milliseconds(static_cast<long long>(delayMs));
}

std::chrono::milliseconds QRRetryPolicy::delayFor(RelayError error, int attemptCount,
                                                  std::chrono::milliseconds mandatedWait) const
{
    if (error == RelayError::RateLimited) {
        const auto wait = std::max(mandatedWait, std::chrono::milliseconds(0)) + rateLimitPadding;
        return std::min(wait, maxMandatedWait);
    }
    return delayForAttempt(attemptCount);
}

QRRetryPolicy QRRetryPolicy::noRetry()
{
    return QRRetryPolicy();
}

QRRetryPolicy QRRetryPolicy::standardRetry()
{
    QRRetryPolicy policy;
    policy.maxRetries = 2;
    policy.initialDelay = std::chrono::milliseconds(1000);
    policy.backoffMultiplier = 2.0;
    policy.maxDelay = std::chrono::milliseconds(30000);
    return policy;
}

QRRetryPolicy QRRetryPolicy::aggressiveRetry()
{
    QRRetryPolicy policy;
    policy.maxRetries = 5;
    policy.initialDelay = std::chrono::milliseconds(500);
    policy.backoffMultiplier = 1.5;
    policy.maxDelay = std::chrono::milliseconds(20000);
    return policy;
}

} // namespace QRelay
QT_END_NAMESPACE
