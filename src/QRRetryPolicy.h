// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRRETRYPOLICY_H
#define QRRETRYPOLICY_H

#include <chrono>
#include <QSet>
#include "QRError.h"

QT_BEGIN_NAMESPACE

namespace QRelay {

/**
 * @brief 单条目重试策略
 *
 * 作为显式的值传给 QRBatchWorker，可脱离工作循环单独测试。
 *
 * @par 延迟计算
 * - RateLimited：源平台给出的等待时间 + rateLimitPadding，不超过 maxMandatedWait
 * - 其他可重试错误：指数退避
 * \code
 * delay = min(initialDelay * (backoffMultiplier ^ attempt), maxDelay)
 * \endcode
 *
 * @par 使用示例
 * \code
 * QRRetryPolicy policy = QRRetryPolicy::standardRetry();
 * if (policy.shouldRetry(RelayError::RateLimited, task->retryCount())) {
 *     auto wait = policy.delayFor(RelayError::RateLimited, task->retryCount(),
 *                                 std::chrono::seconds(30));   // 35 秒
 * }
 * \endcode
 */
class QRELAY_EXPORT QRRetryPolicy
{
public:
    /**
     * @brief 默认构造函数，创建禁用重试的策略（maxRetries = 0）
     */
    QRRetryPolicy();

    /**
     * @brief 创建启用重试的策略
     *
     * @param retries 最大重试次数
     * @param initialDelayMs 初始延迟毫秒数
     * @param backoff 指数退避倍数
     */
    QRRetryPolicy(int retries, int initialDelayMs = 1000, double backoff = 2.0);

    /**
     * @brief 最大重试次数
     *
     * @note 同一条目的总尝试次数 = 1 + maxRetries
     */
    int maxRetries = 0;

    /// 第一次退避重试前的等待时间
    std::chrono::milliseconds initialDelay{1000};

    /// 指数退避倍数（1.0 = 固定延迟）
    double backoffMultiplier = 2.0;

    /// 退避延迟上限
    std::chrono::milliseconds maxDelay{30000};

    /// 限流等待的附加余量
    std::chrono::milliseconds rateLimitPadding{5000};

    /// 限流等待（含余量）的上限
    std::chrono::milliseconds maxMandatedWait{std::chrono::minutes(10)};

    /// 可重试的错误集合
    QSet<RelayError> retryableErrors = {
        RelayError::RateLimited,
        RelayError::ExpiredReference
    };

    /**
     * @brief 判断是否应该重试
     *
     * @param error 本次尝试的错误码
     * @param attemptCount 已经进行过的重试次数（从 0 开始）
     */
    [[nodiscard]] bool shouldRetry(RelayError error, int attemptCount) const;

    /**
     * @brief 指数退避延迟
     *
     * @par 示例（initialDelay=1000ms, backoffMultiplier=2.0, maxDelay=30000ms）
     * - attemptCount=0: 1000ms
     * - attemptCount=1: 2000ms
     * - attemptCount=5: 30000ms (达到上限)
     */
    [[nodiscard]] std::chrono::milliseconds delayForAttempt(int attemptCount) const;

    /**
     * @brief 计算下一次重试前的等待时间
     *
     * @param error 本次尝试的错误码
     * @param attemptCount 已经进行过的重试次数
     * @param mandatedWait 源平台要求的等待时间（仅 RateLimited 使用）
     */
    [[nodiscard]] std::chrono::milliseconds delayFor(RelayError error, int attemptCount,
                                                     std::chrono::milliseconds mandatedWait
                                                     = std::chrono::milliseconds(0)) const;

    [[nodiscard]] bool isEnabled() const noexcept { return maxRetries > 0; }

    /**
     * @brief 禁用重试的策略
     */
    [[nodiscard]] static QRRetryPolicy noRetry();

    /**
     * @brief 标准策略：最多重试 2 次（共 3 次尝试），初始 1 秒，倍数 2.0
     */
    [[nodiscard]] static QRRetryPolicy standardRetry();

    /**
     * @brief 激进策略：最多重试 5 次，初始 500 毫秒，倍数 1.5，上限 20 秒
     */
    [[nodiscard]] static QRRetryPolicy aggressiveRetry();
};

} // namespace QRelay
QT_END_NAMESPACE

#endif // QRRETRYPOLICY_H
