// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRQueueRegistry.h"

namespace QRelay {

QRQueue &QRQueueRegistry::queueFor(qint64 userId)
{
    auto it = m_queues.find(userId);
    if (it == m_queues.end()) {
        it = m_queues.insert(userId, QSharedPointer<QRQueue>::create(userId));
    }
    return *it.value();
}

QRQueue *QRQueueRegistry::find(qint64 userId)
{
    auto it = m_queues.find(userId);
    return it == m_queues.end() ? nullptr : it.value().data();
}

const QRQueue *QRQueueRegistry::find(qint64 userId) const
{
    auto it = m_queues.constFind(userId);
    return it == m_queues.constEnd() ? nullptr : it.value().data();
}

} // namespace QRelay
