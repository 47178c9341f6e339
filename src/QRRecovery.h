// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRRECOVERY_H
#define QRRECOVERY_H

#include <QList>
#include "QRGlobal.h"

namespace QRelay {

class QRCheckpointStore;
class QRLogger;
class QRQueueManager;

/**
 * @brief 启动时的批次恢复
 *
 * 读取所有未完成的检查点（按更新时间从旧到新），逐个重建队列：
 * - 剩余数不为正、缺少目标会话或缺少区间起点的检查点被删除
 * - 用户已有未完成的队列时跳过
 * - 其余交给 QRQueueManager::restoreQueue()
 *
 * 恢复是至少一次语义：最后一个合并窗口内完成的条目会再执行一次。
 */
class QRELAY_EXPORT QRRecovery
{
public:
    /**
     * @brief 一次恢复的结果
     */
    struct Report {
        QList<qint64> restored;     ///< 已重建的用户
        QList<qint64> discarded;    ///< 检查点被删除的用户
        QList<qint64> skipped;      ///< 已有活跃队列而跳过的用户
    };

    QRRecovery(QRCheckpointStore *store, QRQueueManager *manager);

    void setLogger(QRLogger *logger) { m_logger = logger; }

    /**
     * @brief 执行恢复
     * @return 已重建队列的用户，顺序与检查点一致
     */
    QList<qint64> restore();

    [[nodiscard]] Report lastReport() const { return m_report; }

private:
    QRCheckpointStore *m_store;
    QRQueueManager *m_manager;
    QRLogger *m_logger = nullptr;
    Report m_report;
};

} // namespace QRelay

#endif // QRRECOVERY_H
