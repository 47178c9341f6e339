// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#ifndef QRQUEUEREGISTRY_H
#define QRQUEUEREGISTRY_H

#include <QHash>
#include <QList>
#include <QSharedPointer>
#include "QRGlobal.h"
#include "QRQueue.h"

namespace QRelay {

/**
 * @brief 按用户索引的队列注册表
 *
 * 由 QRRelayService 持有，以引用传给 QRQueueManager。
 * 队列首次访问时创建，之后在进程生命周期内保留。
 */
class QRELAY_EXPORT QRQueueRegistry
{
public:
    QRQueueRegistry() = default;
    QRQueueRegistry(const QRQueueRegistry &) = delete;
    QRQueueRegistry &operator=(const QRQueueRegistry &) = delete;

    /**
     * @brief 获取用户队列，不存在时创建
     */
    QRQueue &queueFor(qint64 userId);

    /**
     * @brief 查找用户队列
     * @return 不存在时返回 nullptr
     */
    [[nodiscard]] QRQueue *find(qint64 userId);
    [[nodiscard]] const QRQueue *find(qint64 userId) const;

    [[nodiscard]] bool contains(qint64 userId) const { return m_queues.contains(userId); }
    [[nodiscard]] QList<qint64> users() const { return m_queues.keys(); }
    [[nodiscard]] int size() const { return static_cast<int>(m_queues.size()); }

private:
    QHash<qint64, QSharedPointer<QRQueue>> m_queues;
};

} // namespace QRelay

#endif // QRQUEUEREGISTRY_H
