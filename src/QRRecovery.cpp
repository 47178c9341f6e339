// SPDX-License-Identifier: MIT
// Copyright (c) 2025 QRelay Project

#include "QRRecovery.h"
#include "QRCheckpointStore.h"
#include "QRLogger.h"
#include "QRQueueManager.h"

namespace QRelay {

QRRecovery::QRRecovery(QRCheckpointStore *store, QRQueueManager *manager)
    : m_store(store)
    , m_manager(manager)
{
}

QList<qint64> QRRecovery::restore()
{
    m_report = Report();
    if (!m_store || !m_manager) {
        return {};
    }

    const QList<QRCheckpoint> checkpoints = m_store->listIncompleteCheckpoints();
    if (checkpoints.isEmpty()) {
        relayLog(m_logger, RelayLogLevel::Info, LogCategory::Recovery, QStringLiteral("no pending batches to resume"));
        return {};
    }

    relayLog(m_logger, RelayLogLevel::Info, LogCategory::Recovery,
             QStringLiteral("found %1 pending batches").arg(checkpoints.size()));

    for (const QRCheckpoint &checkpoint : checkpoints) {
        const qint64 userId = checkpoint.userId;

        if (m_manager->isActive(userId)) {
            m_report.skipped.append(userId);
            continue;
        }

        QString discardReason;
        if (checkpoint.remaining() <= 0) {
            discardReason = QStringLiteral("nothing remaining");
        } else if (checkpoint.metadata.destinationChatId == 0) {
            discardReason = QStringLiteral("destination missing");
        } else if (checkpoint.metadata.fromId <= 0) {
            discardReason = QStringLiteral("range start missing");
        }

        if (!discardReason.isEmpty()) {
            relayLog(m_logger, RelayLogLevel::Info, LogCategory::Recovery,
                     QStringLiteral("user %1: discarding checkpoint, %2").arg(userId).arg(discardReason));
            if (!m_store->deleteCheckpoint(userId)) {
                relayLog(m_logger, RelayLogLevel::Warning, LogCategory::Recovery,
                         QStringLiteral("user %1: cannot delete checkpoint: %2").arg(userId).arg(m_store->lastError()));
            }
            m_report.discarded.append(userId);
            continue;
        }

        if (m_manager->restoreQueue(checkpoint)) {
            m_report.restored.append(userId);
            relayLog(m_logger, RelayLogLevel::Info, LogCategory::Recovery,
                     QStringLiteral("user %1: %2 tasks remaining").arg(userId).arg(checkpoint.remaining()));
        } else {
            m_report.skipped.append(userId);
        }
    }

    relayLog(m_logger, RelayLogLevel::Info, LogCategory::Recovery,
             QStringLiteral("resumed %1 queues").arg(m_report.restored.size()));
    return m_report.restored;
}

} // namespace QRelay
