// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRERROR_H
#define QRERROR_H

#include <QString>
#include "QRGlobal.h"

QT_BEGIN_NAMESPACE

namespace QRelay {

/**
 * @brief 转发任务错误码枚举
 *
 * 按传播范围分为四类：
 *
 * @par 错误分类
 * - 0: 无错误
 * - 1-99: 暂时性错误（可在同一任务上重试）
 * - 100-199: 单条目错误（记为失败，批次继续）
 * - 200-299: 系统级错误（中止批次，保留检查点）
 * - 300-399: 准入错误（批次未被接受）
 *
 */
enum class RelayError {
    NoError = 0,

    // 暂时性错误
    RateLimited = 1,              ///< 源平台要求等待（FloodWait）
    ExpiredReference = 2,         ///< 文件引用过期，需重新获取

    // 取消
    UserCancelled = 50,           ///< 用户取消批次

    // 单条目错误
    ItemFatal = 100,              ///< 条目传输失败（不可恢复）
    ItemFiltered = 101,           ///< 被文件类型策略过滤
    ItemTooLarge = 102,           ///< 文件超过大小限制
    ItemNotFound = 103,           ///< 源消息不存在或为空

    // 系统级错误
    SessionUnavailable = 200,     ///< 无法获取可用会话
    StoreUnavailable = 201,       ///< 持久化存储不可用

    // 准入错误
    BatchTooLarge = 300,          ///< 批次范围超过上限
    InvalidRange = 301,           ///< 批次范围为空或颠倒
    BatchInProgress = 302,        ///< 该用户已有批次在执行

    Unknown = 999                 ///< 未知错误
};

/**
 * @brief 获取错误描述字符串
 *
 * @param error 错误码
 * @return QString 错误描述
 */
[[nodiscard]] QRELAY_EXPORT QString errorString(RelayError error);

/**
 * @brief 是否为可重试的暂时性错误
 */
[[nodiscard]] QRELAY_EXPORT bool isTransient(RelayError error) noexcept;

/**
 * @brief 是否为单条目错误（记为失败，批次继续）
 */
[[nodiscard]] QRELAY_EXPORT bool isItemFatal(RelayError error) noexcept;

/**
 * @brief 是否为系统级错误（中止批次，保留检查点）
 */
[[nodiscard]] QRELAY_EXPORT bool isSystemFatal(RelayError error) noexcept;

} // namespace QRelay
QT_END_NAMESPACE

#endif // QRERROR_H
